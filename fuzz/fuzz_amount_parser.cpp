/**
 * @file  fuzz_amount_parser.cpp
 * @brief libFuzzer target for AmountParser::parse and parse_amount
 *
 * Build:
 *   cmake -DMONEYPARSE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_amount_parser
 *
 * Run for 60 seconds:
 *   ./fuzz_amount_parser -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort, including on invalid UTF-8.
 *   2. Every failure carries a printable error message.
 *   3. A successful parse re-renders through to_plain_string and parses back
 *      to the same minor units.
 *   4. Prefixing "-" to the plain rendering of a positive result negates it.
 *
 * Fuzzer strategy:
 *   byte 0       option bits (symbol, strict grouping, no signs)
 *   byte 1       index into the built-in currency table
 *   bytes 2..    the amount text, passed through unchanged
 *   The amount bytes are also fed to parse_amount as their own currency
 *   query, which drives the resolver error paths.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "moneyparse/amount_parser.hpp"
#include "moneyparse/currency.hpp"
#include "moneyparse/formatter.hpp"

using namespace moneyparse;
using namespace moneyparse::currency;
using namespace moneyparse::format;
using namespace moneyparse::parser;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 2) {
        return 0;
    }

    ParseOptions options;
    options.allow_currency_symbol = (data[0] & 0x1) != 0;
    options.strict_grouping       = (data[0] & 0x2) != 0;
    options.accept_signs          = (data[0] & 0x4) == 0;

    const auto& records = CurrencyTable::iso4217().records();
    const CurrencyRecord& rec = records[data[1] % records.size()];

    const std::string_view amount(reinterpret_cast<const char*>(data + 2), size - 2);

    const AmountParser parser(options);
    const auto result = parser.parse(amount, rec.meta);

    if (!result) {
        const std::string msg = result.error().message();
        assert(!msg.empty());
    } else {
        const MinorUnits v = *result;

        // ── Invariant 3: plain rendering round-trips ──────────────────────────
        const std::string plain = AmountFormatter::to_plain_string(v, rec.meta);
        const auto back = AmountParser().parse(plain, rec.meta);
        assert(back.has_value());
        assert(*back == v);

        // ── Invariant 4: negation ─────────────────────────────────────────────
        if (v > 0 && options.accept_signs && !options.allow_currency_symbol) {
            const auto neg = parser.parse("-" + plain, rec.meta);
            assert(neg.has_value());
            assert(*neg == -v);
        }
    }

    // ── Resolver path ─────────────────────────────────────────────────────────
    const auto via_query = parse_amount(amount, amount, options);
    if (!via_query) {
        const std::string msg = via_query.error().message();
        assert(!msg.empty());
    }

    return 0;
}
