/**
 * @file  fuzz_currency_resolver.cpp
 * @brief libFuzzer target for CurrencyResolver::resolve
 *
 * Build:
 *   cmake -DMONEYPARSE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_currency_resolver
 *
 * Run for 60 seconds:
 *   ./fuzz_currency_resolver -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort.
 *   2. A successful resolution returns a row of the built-in table, and
 *      resolving that row's alpha-3 and numeric codes yields the same row.
 *   3. A failure is one of the four resolver error kinds, and agrees with
 *      classify_query on the trimmed query it reports.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "moneyparse/currency.hpp"

using namespace moneyparse;
using namespace moneyparse::currency;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view query(reinterpret_cast<const char*>(data), size);

    const CurrencyResolver resolver;
    const auto rec = resolver.resolve_record(query);

    if (rec) {
        const CurrencyRecord* row = *rec;
        assert(row != nullptr);
        assert(CurrencyTable::iso4217().find_by_code(row->code) == row);

        const auto by_code = resolver.resolve_record(row->code);
        assert(by_code.has_value() && *by_code == row);
        if (!row->numeric_code.empty()) {
            const auto by_numeric = resolver.resolve_record(row->numeric_code);
            assert(by_numeric.has_value() && *by_numeric == row);
        }

        const auto meta = resolver.resolve(query);
        assert(meta.has_value() && *meta == row->meta);
        return 0;
    }

    const Error& err = rec.error();
    switch (err.kind) {
        case ErrorKind::InvalidCurrencyIdentifier:
            assert(err.context.empty());
            break;
        case ErrorKind::InvalidISOCode:
            assert(classify_query(err.context) == QueryShape::Alpha3);
            break;
        case ErrorKind::InvalidNumericCode:
            assert(classify_query(err.context) == QueryShape::Numeric);
            break;
        case ErrorKind::InvalidCurrencyQuery:
            assert(classify_query(err.context) == QueryShape::Invalid);
            break;
        default:
            assert(false && "unexpected resolver error kind");
            break;
    }

    return 0;
}
