#pragma once

/// @file include/moneyparse/formatter.hpp
/// @brief Minor units back to text.
///
/// Two renderings:
///   - plain:   "-1234.50"   no grouping, currency decimal separator; this is
///              what AmountParser reads back to the same value
///   - display: "-€1,234.50" grouped, grapheme placed by the currency's
///              display template

#include "moneyparse/currency.hpp"
#include "moneyparse/types.hpp"

#include <string>

namespace moneyparse::format {

class AmountFormatter {
public:
    AmountFormatter() = delete; // pure static — not instantiable

    /// Sign, ungrouped integer part, decimal separator and exactly
    /// fraction_digits() digits (no separator for zero-fraction currencies).
    [[nodiscard]] static std::string
    to_plain_string(MinorUnits amount, const CurrencyMeta& meta);

    /// Grouped rendering substituted into `record.display_template`
    /// ("1" → number, "$" → grapheme), with "-" prefixed when negative.
    [[nodiscard]] static std::string
    to_display_string(MinorUnits amount, const currency::CurrencyRecord& record);

    /// Insert `separator` between every group of three integer digits.
    [[nodiscard]] static std::string
    group_thousands(const std::string& digits, const std::string& separator);
};

} // namespace moneyparse::format
