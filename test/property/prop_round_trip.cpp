/**
 * @file  prop_round_trip.cpp
 * @brief Property: ∀ currency, ∀ v ∈ (INT64_MIN, INT64_MAX]:
 *        parse(to_plain_string(v)) == v
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_round_trip
 *
 * INT64_MIN itself is excluded: its magnitude is not representable, so the
 * parser reports AmountOverflow before applying the sign.
 */

#include <rapidcheck.h>

#include "moneyparse/amount_parser.hpp"
#include "moneyparse/currency.hpp"
#include "moneyparse/formatter.hpp"

#include <limits>
#include <string>

using namespace moneyparse;
using namespace moneyparse::currency;
using namespace moneyparse::format;
using namespace moneyparse::parser;

int main() {
    const auto& records = CurrencyTable::iso4217().records();
    bool ok = true;

    ok = rc::check(
        "round_trip: plain rendering parses back to the same minor units",
        [&records](MinorUnits v) {
            RC_PRE(v != std::numeric_limits<MinorUnits>::min());
            const auto& rec = records[*rc::gen::inRange<std::size_t>(0, records.size())];

            const std::string s = AmountFormatter::to_plain_string(v, rec.meta);
            const auto r = AmountParser().parse(s, rec.meta);
            RC_ASSERT(r.has_value());
            RC_ASSERT(*r == v);
        }
    ) && ok;

    ok = rc::check(
        "round_trip: display rendering parses back with symbols allowed",
        [&records]() {
            const auto& rec = records[*rc::gen::inRange<std::size_t>(0, records.size())];
            const auto v = *rc::gen::inRange<MinorUnits>(-1'000'000'000'000, 1'000'000'000'000);

            const std::string s = AmountFormatter::to_display_string(v, rec);
            const auto r = AmountParser(ParseOptions{.allow_currency_symbol = true})
                               .parse(s, rec.meta);
            RC_ASSERT(r.has_value());
            RC_ASSERT(*r == v);
        }
    ) && ok;

    return ok ? 0 : 1;
}
