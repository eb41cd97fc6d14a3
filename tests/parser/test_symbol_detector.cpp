/// @file tests/parser/test_symbol_detector.cpp
/// @brief Unit tests for SymbolDetector (Sc category and token list).

#include <gtest/gtest.h>
#include "moneyparse/symbol_detector.hpp"

#include <algorithm>

using namespace moneyparse::parser;

// ─── Sc category ──────────────────────────────────────────────────────────────

TEST(SymbolCategory, DetectsCurrencySigns) {
    EXPECT_TRUE(SymbolDetector::contains_symbol_category("$539"));
    EXPECT_TRUE(SymbolDetector::contains_symbol_category("1,455.00 €"));
    EXPECT_TRUE(SymbolDetector::contains_symbol_category("100¤"));
    EXPECT_TRUE(SymbolDetector::contains_symbol_category("₹ 10"));
}

TEST(SymbolCategory, PlainNumbersAreClean) {
    EXPECT_FALSE(SymbolDetector::contains_symbol_category("1,455.00"));
    EXPECT_FALSE(SymbolDetector::contains_symbol_category("−12"));
    EXPECT_FALSE(SymbolDetector::contains_symbol_category(""));
}

// ─── Default tokens ───────────────────────────────────────────────────────────

TEST(DefaultTokens, AreLowerCaseAndNonEmpty) {
    const auto& tokens = SymbolDetector::default_tokens();
    ASSERT_FALSE(tokens.empty());
    EXPECT_NE(std::find(tokens.begin(), tokens.end(), "kr"), tokens.end());
    EXPECT_NE(std::find(tokens.begin(), tokens.end(), "лв"), tokens.end());
    for (const auto& t : tokens) {
        EXPECT_FALSE(t.empty());
    }
}

TEST(DefaultDetector, LetterTokensCaseInsensitive) {
    const auto d = SymbolDetector::with_default_tokens();
    EXPECT_TRUE(d.contains_currency_symbol("100 kr"));
    EXPECT_TRUE(d.contains_currency_symbol("100 KR"));
    EXPECT_TRUE(d.contains_currency_symbol("ЛВ1,234.55"));
    EXPECT_TRUE(d.contains_currency_symbol("2,28 UF"));
    EXPECT_TRUE(d.contains_currency_symbol("元100"));
}

TEST(DefaultDetector, SingleLetterTokenMatchesAnywhere) {
    // "d" is a token, so any stray d counts as a symbol.
    const auto d = SymbolDetector::with_default_tokens();
    EXPECT_TRUE(d.contains_currency_symbol("12d"));
}

TEST(DefaultDetector, PlainNumbersAreClean) {
    const auto d = SymbolDetector::with_default_tokens();
    EXPECT_FALSE(d.contains_currency_symbol("1,455.00"));
    EXPECT_FALSE(d.contains_currency_symbol("-1 000 000,5"));
    EXPECT_FALSE(d.contains_currency_symbol("+539"));
}

// ─── Custom tokens ────────────────────────────────────────────────────────────

TEST(CustomDetector, EmptyTokenListUsesCategoryOnly) {
    const SymbolDetector d(std::vector<std::string>{});
    EXPECT_TRUE(d.tokens().empty());
    EXPECT_FALSE(d.contains_currency_symbol("100 kr"));
    EXPECT_TRUE(d.contains_currency_symbol("$100"));
}

TEST(CustomDetector, AddTokenIsLowerCased) {
    SymbolDetector d(std::vector<std::string>{});
    d.add_token("XBT");
    ASSERT_EQ(d.tokens().size(), 1u);
    EXPECT_EQ(d.tokens()[0], "xbt");
    EXPECT_TRUE(d.contains_token("0.5 xbt"));
    EXPECT_TRUE(d.contains_token("0.5 XbT"));
}

TEST(CustomDetector, EmptyTokenIgnored) {
    SymbolDetector d = SymbolDetector::with_default_tokens();
    const auto before = d.tokens().size();
    d.add_token("");
    EXPECT_EQ(d.tokens().size(), before);
    EXPECT_FALSE(d.contains_token("100"));
}
