/// @file src/currency/currency_resolver.cpp
/// @brief Currency query classification and resolution.

#include "moneyparse/currency.hpp"

#include "../text/text_utils.hpp"

#include <string>

namespace moneyparse::currency {

// ─── classify_query ───────────────────────────────────────────────────────────

QueryShape classify_query(std::string_view query) noexcept {
    if (query.size() == constants::ALPHA3_LENGTH &&
        text::is_ascii_letter(query[0]) &&
        text::is_ascii_letter(query[1]) &&
        text::is_ascii_letter(query[2])) {
        return QueryShape::Alpha3;
    }

    if (query.empty()) {
        return QueryShape::Invalid;
    }
    for (char c : query) {
        if (c < '0' || c > '9') {
            return QueryShape::Invalid;
        }
    }
    return QueryShape::Numeric;
}

// ─── CurrencyResolver ─────────────────────────────────────────────────────────

CurrencyResolver::CurrencyResolver() noexcept
    : table_(&CurrencyTable::iso4217()) {}

CurrencyResolver::CurrencyResolver(const CurrencyTable& table) noexcept
    : table_(&table) {}

Result<const CurrencyRecord*>
CurrencyResolver::resolve_record(std::string_view query) const {
    const std::string q = text::trim_utf8(query);
    if (q.empty()) {
        return fail(ErrorKind::InvalidCurrencyIdentifier);
    }

    switch (classify_query(q)) {
        case QueryShape::Alpha3: {
            const CurrencyRecord* rec = table_->find_by_code(q);
            if (rec == nullptr) {
                return fail(ErrorKind::InvalidISOCode, q);
            }
            return rec;
        }
        case QueryShape::Numeric: {
            const CurrencyRecord* rec = table_->find_by_numeric(q);
            if (rec == nullptr) {
                return fail(ErrorKind::InvalidNumericCode, q);
            }
            return rec;
        }
        case QueryShape::Invalid:
            break;
    }
    return fail(ErrorKind::InvalidCurrencyQuery, q);
}

Result<CurrencyMeta> CurrencyResolver::resolve(std::string_view query) const {
    auto rec = resolve_record(query);
    if (!rec) {
        return rec.error();
    }
    return (*rec)->meta;
}

Result<CurrencyMeta> resolve_currency(std::string_view query) {
    // Bound to the built-in table; initialised on first call.
    static const CurrencyResolver resolver;
    return resolver.resolve(query);
}

} // namespace moneyparse::currency
