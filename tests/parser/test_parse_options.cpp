/// @file tests/parser/test_parse_options.cpp
/// @brief ParseOptions defaults and how each switch changes a parse.

#include <gtest/gtest.h>
#include "moneyparse/amount_parser.hpp"

#include <string>
#include <utility>
#include <vector>

using namespace moneyparse;
using namespace moneyparse::parser;

TEST(ParseOptions, Defaults) {
    const ParseOptions o;
    EXPECT_FALSE(o.allow_currency_symbol);
    EXPECT_FALSE(o.strict_grouping);
    EXPECT_TRUE(o.accept_signs);
}

TEST(ParseOptions, ParserKeepsOptions) {
    const AmountParser p(ParseOptions{.allow_currency_symbol = true,
                                      .strict_grouping = true,
                                      .accept_signs = false});
    EXPECT_TRUE(p.options().allow_currency_symbol);
    EXPECT_TRUE(p.options().strict_grouping);
    EXPECT_FALSE(p.options().accept_signs);
}

TEST(ParseOptions, DefaultParserUsesDefaultTokens) {
    const AmountParser p;
    EXPECT_EQ(p.detector().tokens().size(), SymbolDetector::default_tokens().size());
}

TEST(ParseOptions, CustomDetectorIsUsed) {
    SymbolDetector d(std::vector<std::string>{});
    d.add_token("pts");
    const AmountParser p(ParseOptions{}, std::move(d));

    auto r = p.parse("100 pts", "USD");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::CurrencySymbolNotAllowed);

    // "kr" is no longer a token for this parser; it fails later as BadChar.
    auto kr = p.parse("100 kr", "SEK");
    ASSERT_FALSE(kr);
    EXPECT_EQ(kr.error().kind, ErrorKind::BadChar);
}

// ─── Toggling each switch on the same input ───────────────────────────────────

TEST(ParseOptions, AllowSymbolToggle) {
    EXPECT_EQ(parse_amount("$539", "USD").error().kind, ErrorKind::CurrencySymbolNotAllowed);
    EXPECT_EQ(parse_amount("$539", "USD", {.allow_currency_symbol = true}).value(), 53900);
}

TEST(ParseOptions, StrictGroupingToggle) {
    EXPECT_EQ(parse_amount("10 000,000.00", "USD").value(), 1'000'000'000);
    EXPECT_EQ(parse_amount("10 000,000.00", "USD", {.strict_grouping = true}).error().kind,
              ErrorKind::MixedGrouping);
}

TEST(ParseOptions, AcceptSignsToggle) {
    EXPECT_EQ(parse_amount("-539", "USD").value(), -53900);
    EXPECT_EQ(parse_amount("-539", "USD", {.accept_signs = false}).error().kind,
              ErrorKind::SignsNotAllowed);
}
