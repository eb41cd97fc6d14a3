#pragma once

/// @file include/moneyparse/amount_parser.hpp
/// @brief Amount Parser — text to exact minor units.
///
/// # Module: Amount Parser
///
/// ## Responsibility
/// Convert a locale-formatted monetary string into a signed 64-bit count of
/// the currency's minor units. No floating-point value is ever formed.
///
/// ## Pipeline (strict order)
///   1. Trim Unicode whitespace, NBSP → space
///   2. Empty                                  → EmptyInput
///   3. Symbol-like text while disallowed      → CurrencySymbolNotAllowed
///   4. Leading sign while disallowed          → SignsNotAllowed
///   5. Remove the currency grapheme once      → InvalidCurrencySymbol if absent
///   6. Consume "+", "-" or "−", re-trim
///   7. Nothing left                           → NoDigits
///   8. Scan: digits, decimal point, grouping  → BadChar / MixedGrouping
///   9. No digits on either side               → NoDigits
///  10. Pad fraction with zeros                → TooManyDecimals if too long
///  11. minor = int · 10^n + frac, signed      → AmountOverflow if > int64
///
/// ## Decimal vs. Grouping
/// The currency's decimal separator is honoured once, and only for
/// currencies with fraction digits. A second occurrence, or any occurrence
/// for a zero-fraction currency, is read as a grouping separator when it is
/// a space, comma or period: "1.000.000" is one million JPY.
///
/// ## Guarantees
/// - Exactly one of {value, Error} per call; no partial results
/// - Linear in input length, O(1) work per code point
/// - Thread-safe: const methods touch only call-local state

#include "moneyparse/currency.hpp"
#include "moneyparse/error.hpp"
#include "moneyparse/symbol_detector.hpp"
#include "moneyparse/types.hpp"

#include <memory>
#include <string_view>

namespace moneyparse::parser {

/// Parses amount strings with a fixed set of options.
///
/// Cheap to copy: parsers built with the default token list share one
/// detector. Build one per option set and reuse it.
class AmountParser {
public:
    /// Default options, default symbol tokens.
    AmountParser();

    explicit AmountParser(ParseOptions options);

    AmountParser(ParseOptions options, SymbolDetector detector);

    /// Parse `raw` for an already-resolved currency.
    [[nodiscard]] Result<MinorUnits>
    parse(std::string_view raw, const CurrencyMeta& meta) const;

    /// Resolve `currency_query` with `resolver`, then parse.
    ///
    /// An empty amount is reported as EmptyInput before the currency query
    /// is looked at.
    [[nodiscard]] Result<MinorUnits>
    parse(std::string_view input,
          std::string_view currency_query,
          const currency::CurrencyResolver& resolver) const;

    /// Resolve against the built-in ISO 4217 table, then parse.
    [[nodiscard]] Result<MinorUnits>
    parse(std::string_view input, std::string_view currency_query) const;

    [[nodiscard]] const ParseOptions& options() const noexcept { return options_; }
    [[nodiscard]] const SymbolDetector& detector() const noexcept { return *detector_; }

private:
    ParseOptions                          options_;
    std::shared_ptr<const SymbolDetector> detector_;  ///< Never null
};

/// Primary entry point: resolve `currency_query` against the built-in table
/// and parse `input` with `options`.
///
/// # Example
/// ```
/// parse_amount("1,455.00", "EUR")            // 145500
/// parse_amount("-1,455.00", "EUR")           // -145500
/// parse_amount("€1,455.00", "EUR",
///              {.allow_currency_symbol = true}) // 145500
/// ```
[[nodiscard]] Result<MinorUnits>
parse_amount(std::string_view input,
             std::string_view currency_query,
             const ParseOptions& options = {});

} // namespace moneyparse::parser
