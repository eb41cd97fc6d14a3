/**
 * @file  prop_strict_grouping.cpp
 * @brief Property: ∀ integer part grouped with two different separators:
 *        strict parse fails with MixedGrouping, relaxed parse ignores them.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_strict_grouping
 *
 * Separators are drawn from {space, comma, period} minus the currency's
 * decimal point (zero-fraction currencies may use all three).
 */

#include <rapidcheck.h>

#include "moneyparse/amount_parser.hpp"
#include "moneyparse/currency.hpp"

#include <string>
#include <vector>

using namespace moneyparse;
using namespace moneyparse::currency;
using namespace moneyparse::parser;

namespace {

std::vector<char> grouping_candidates(const CurrencyMeta& meta) {
    std::vector<char> out;
    for (char c : {' ', ',', '.'}) {
        if (meta.fraction_digits() == 0 || static_cast<char32_t>(c) != meta.decimal_separator()) {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace

int main() {
    const auto& records = CurrencyTable::iso4217().records();
    bool ok = true;

    ok = rc::check(
        "strict_grouping: two different grouping characters are rejected only when strict",
        [&records]() {
            const auto& rec = records[*rc::gen::inRange<std::size_t>(0, records.size())];
            const auto candidates = grouping_candidates(rec.meta);
            RC_PRE(candidates.size() >= 2);

            const auto i = *rc::gen::inRange<std::size_t>(0, candidates.size());
            const auto j = *rc::gen::inRange<std::size_t>(0, candidates.size());
            RC_PRE(i != j);

            // lead group, then two 3-digit groups: lead <sep_i> ddd <sep_j> ddd
            const auto lead = *rc::gen::inRange(1, 1000);
            const auto g1   = *rc::gen::inRange(0, 1000);
            const auto g2   = *rc::gen::inRange(0, 1000);
            const auto pad3 = [](int v) {
                std::string s = std::to_string(v);
                return std::string(3 - s.size(), '0') + s;
            };
            const std::string input =
                std::to_string(lead) + candidates[i] + pad3(g1) + candidates[j] + pad3(g2);
            const std::int64_t integer =
                static_cast<std::int64_t>(lead) * 1'000'000 + g1 * 1000 + g2;

            const auto strict = AmountParser(ParseOptions{.strict_grouping = true})
                                    .parse(input, rec.meta);
            RC_ASSERT(!strict.has_value());
            RC_ASSERT(strict.error().kind == ErrorKind::MixedGrouping);

            const auto relaxed = AmountParser().parse(input, rec.meta);
            RC_ASSERT(relaxed.has_value());
            RC_ASSERT(*relaxed == integer * rec.meta.scale());
        }
    ) && ok;

    ok = rc::check(
        "strict_grouping: a single repeated grouping character is accepted",
        [&records]() {
            const auto& rec = records[*rc::gen::inRange<std::size_t>(0, records.size())];
            const auto candidates = grouping_candidates(rec.meta);
            const char sep = candidates[*rc::gen::inRange<std::size_t>(0, candidates.size())];

            const auto groups = *rc::gen::inRange(1, 4);
            std::string input = "1";
            std::int64_t integer = 1;
            for (int g = 0; g < groups; ++g) {
                input += sep;
                input += "000";
                integer *= 1000;
            }

            const auto r = AmountParser(ParseOptions{.strict_grouping = true})
                               .parse(input, rec.meta);
            RC_ASSERT(r.has_value());
            RC_ASSERT(*r == integer * rec.meta.scale());
        }
    ) && ok;

    return ok ? 0 : 1;
}
