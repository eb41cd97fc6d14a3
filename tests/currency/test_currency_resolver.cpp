/// @file tests/currency/test_currency_resolver.cpp
/// @brief Unit tests for query classification and CurrencyResolver.
///
/// Categories:
///  1. classify_query shapes
///  2. Alpha-3 and numeric resolution
///  3. Error kinds and their context
///  4. Resolvers over caller-supplied tables

#include <gtest/gtest.h>
#include "moneyparse/currency.hpp"

using namespace moneyparse;
using namespace moneyparse::currency;

// ─── Test 1: classify_query ───────────────────────────────────────────────────

TEST(ClassifyQuery, Shapes) {
    EXPECT_EQ(classify_query("EUR"),  QueryShape::Alpha3);
    EXPECT_EQ(classify_query("eur"),  QueryShape::Alpha3);
    EXPECT_EQ(classify_query("978"),  QueryShape::Numeric);
    EXPECT_EQ(classify_query("8"),    QueryShape::Numeric);
    EXPECT_EQ(classify_query("0978"), QueryShape::Numeric);
    EXPECT_EQ(classify_query(""),     QueryShape::Invalid);
    EXPECT_EQ(classify_query("EU"),   QueryShape::Invalid);
    EXPECT_EQ(classify_query("EURO"), QueryShape::Invalid);
    EXPECT_EQ(classify_query("E1R"),  QueryShape::Invalid);
    EXPECT_EQ(classify_query("€"),    QueryShape::Invalid);
    EXPECT_EQ(classify_query("97a"),  QueryShape::Invalid);
}

// ─── Test 2: Resolution ───────────────────────────────────────────────────────

TEST(CurrencyResolver, Alpha3) {
    const CurrencyResolver r;
    auto m = r.resolve("EUR");
    ASSERT_TRUE(m) << m.error().message();
    EXPECT_EQ(m->code(), "EUR");
    EXPECT_EQ(m->fraction_digits(), 2);
}

TEST(CurrencyResolver, Alpha3_LowerCaseAndPadded) {
    const CurrencyResolver r;
    auto m = r.resolve("  usd\t");
    ASSERT_TRUE(m);
    EXPECT_EQ(m->code(), "USD");
}

TEST(CurrencyResolver, Numeric) {
    const CurrencyResolver r;
    auto m = r.resolve("975");
    ASSERT_TRUE(m);
    EXPECT_EQ(m->code(), "BGN");
    EXPECT_EQ(m->symbol_grapheme(), "лв");
}

TEST(CurrencyResolver, NumericAndAlphaAgree) {
    const CurrencyResolver r;
    EXPECT_EQ(r.resolve("978").value(), r.resolve("EUR").value());
}

TEST(CurrencyResolver, ResolveRecordReturnsTableRow) {
    const CurrencyResolver r;
    auto rec = r.resolve_record("GBP");
    ASSERT_TRUE(rec);
    EXPECT_EQ(*rec, CurrencyTable::iso4217().find_by_code("GBP"));
    EXPECT_EQ((*rec)->numeric_code, "826");
}

TEST(ResolveCurrency, FreeFunctionUsesBuiltInTable) {
    auto m = resolve_currency("392");
    ASSERT_TRUE(m);
    EXPECT_EQ(m->code(), "JPY");
}

// ─── Test 3: Errors ───────────────────────────────────────────────────────────

TEST(CurrencyResolver, EmptyQuery_InvalidCurrencyIdentifier) {
    const CurrencyResolver r;
    auto m = r.resolve("");
    ASSERT_FALSE(m);
    EXPECT_EQ(m.error().kind, ErrorKind::InvalidCurrencyIdentifier);
}

TEST(CurrencyResolver, WhitespaceQuery_InvalidCurrencyIdentifier) {
    const CurrencyResolver r;
    auto m = r.resolve("   ");
    ASSERT_FALSE(m);
    EXPECT_EQ(m.error().kind, ErrorKind::InvalidCurrencyIdentifier);
}

TEST(CurrencyResolver, UnknownAlpha3_InvalidISOCode) {
    const CurrencyResolver r;
    auto m = r.resolve(" ZZZ ");
    ASSERT_FALSE(m);
    EXPECT_EQ(m.error().kind, ErrorKind::InvalidISOCode);
    EXPECT_EQ(m.error().context, "ZZZ");
}

TEST(CurrencyResolver, UnknownNumeric_InvalidNumericCode) {
    const CurrencyResolver r;
    auto m = r.resolve("999");
    ASSERT_FALSE(m);
    EXPECT_EQ(m.error().kind, ErrorKind::InvalidNumericCode);
    EXPECT_EQ(m.error().context, "999");
}

TEST(CurrencyResolver, UnpaddedNumeric_InvalidNumericCode) {
    const CurrencyResolver r;
    auto m = r.resolve("8");
    ASSERT_FALSE(m);
    EXPECT_EQ(m.error().kind, ErrorKind::InvalidNumericCode);
}

TEST(CurrencyResolver, Malformed_InvalidCurrencyQuery) {
    const CurrencyResolver r;
    for (const char* q : {"EU", "EURO", "E1R", "€", "97a", "US D"}) {
        auto m = r.resolve(q);
        ASSERT_FALSE(m) << q;
        EXPECT_EQ(m.error().kind, ErrorKind::InvalidCurrencyQuery) << q;
    }
}

// ─── Test 4: Custom tables ────────────────────────────────────────────────────

TEST(CurrencyResolver, CustomTable) {
    const CurrencyTable table({CurrencyRecord{
        "XBT", "", *CurrencyMeta::make("₿", ".", 8, "XBT"), ",", "$1"}});
    const CurrencyResolver r(table);

    EXPECT_EQ(&r.table(), &table);

    auto m = r.resolve("xbt");
    ASSERT_TRUE(m);
    EXPECT_EQ(m->fraction_digits(), 8);

    auto missing = r.resolve("EUR");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().kind, ErrorKind::InvalidISOCode);
}
