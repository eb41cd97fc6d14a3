#pragma once

/// @file include/moneyparse/currency.hpp
/// @brief Currency reference table and the query resolver built on it.
///
/// # Module: Currency Resolver
///
/// ## Responsibility
/// Turn a caller-supplied currency query into `CurrencyMeta`:
///   - "EUR", "eur", " Eur "  → alpha-3 lookup (case-insensitive)
///   - "978", "008"           → numeric-code lookup (exact string)
///   - anything else          → InvalidCurrencyQuery
///
/// ## Reference Data
/// `CurrencyTable::iso4217()` is the built-in ISO 4217 table. It is built on
/// first use and never mutated afterwards, so any number of threads may
/// resolve against it concurrently. Callers with their own currency data
/// construct a `CurrencyTable` from records and hand it to a resolver.
///
/// ## NOT Responsible For
/// - Anything about the amount text (see amount_parser.hpp)

#include "moneyparse/error.hpp"
#include "moneyparse/types.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace moneyparse::currency {

// ─── CurrencyRecord ───────────────────────────────────────────────────────────

/// One row of the reference table.
struct CurrencyRecord {
    std::string  code;               ///< Alpha-3, upper case ("EUR")
    std::string  numeric_code;       ///< ISO numeric, zero padded ("978")
    CurrencyMeta meta;
    std::string  thousand_separator; ///< Display grouping character
    std::string  display_template;   ///< "$1", "1 $"… 1 = amount, $ = grapheme
};

// ─── CurrencyTable ────────────────────────────────────────────────────────────

/// Immutable currency reference table indexed by alpha-3 and numeric code.
class CurrencyTable {
public:
    /// Build a table and its indexes.
    ///
    /// Throws `std::invalid_argument` if a code is not three ASCII letters,
    /// or if an alpha-3 or non-empty numeric code appears twice.
    explicit CurrencyTable(std::vector<CurrencyRecord> records);

    /// The built-in ISO 4217 table.
    [[nodiscard]] static const CurrencyTable& iso4217();

    /// Case-insensitive alpha-3 lookup. nullptr if absent.
    [[nodiscard]] const CurrencyRecord* find_by_code(std::string_view code) const;

    /// Exact numeric-code lookup. nullptr if absent.
    [[nodiscard]] const CurrencyRecord* find_by_numeric(std::string_view numeric) const;

    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }
    [[nodiscard]] const std::vector<CurrencyRecord>& records() const noexcept { return records_; }

private:
    std::vector<CurrencyRecord>                  records_;
    std::unordered_map<std::string, std::size_t> by_code_;
    std::unordered_map<std::string, std::size_t> by_numeric_;
};

// ─── Query Classification ─────────────────────────────────────────────────────

enum class QueryShape {
    Alpha3,   ///< Exactly three ASCII letters
    Numeric,  ///< One or more ASCII digits
    Invalid,  ///< Anything else
};

/// Classify an already-trimmed query.
[[nodiscard]] QueryShape classify_query(std::string_view query) noexcept;

// ─── CurrencyResolver ─────────────────────────────────────────────────────────

/// Resolves currency queries against one table.
///
/// Holds a reference; the table must outlive the resolver.
class CurrencyResolver {
public:
    /// Resolve against the built-in ISO 4217 table.
    CurrencyResolver() noexcept;

    explicit CurrencyResolver(const CurrencyTable& table) noexcept;

    /// Resolve `query` to currency metadata.
    ///
    /// # Errors
    /// - InvalidCurrencyIdentifier — query empty after trimming
    /// - InvalidCurrencyQuery      — not alpha-3 or numeric shaped
    /// - InvalidISOCode            — alpha-3 not in the table
    /// - InvalidNumericCode        — numeric code not in the table
    ///
    /// The error context is the trimmed query.
    [[nodiscard]] Result<CurrencyMeta> resolve(std::string_view query) const;

    /// Like `resolve`, but returns the full table row.
    [[nodiscard]] Result<const CurrencyRecord*> resolve_record(std::string_view query) const;

    [[nodiscard]] const CurrencyTable& table() const noexcept { return *table_; }

private:
    const CurrencyTable* table_;
};

/// Resolve against the built-in table.
[[nodiscard]] Result<CurrencyMeta> resolve_currency(std::string_view query);

} // namespace moneyparse::currency
