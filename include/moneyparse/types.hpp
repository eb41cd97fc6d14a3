#pragma once

/// @file include/moneyparse/types.hpp
/// @brief Shared value types: minor units, currency metadata, parse options.
///
/// All modules include this file. Everything here is an immutable value type;
/// none of it refers back into the currency table it may have come from.

#include "moneyparse/constants.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace moneyparse {

/// An exact amount in a currency's smallest denomination (cents for USD).
using MinorUnits = std::int64_t;

// ─── CurrencyMeta ─────────────────────────────────────────────────────────────

/// What the parser needs to know about one currency.
///
/// Only obtainable through `make`, which enforces
/// 0 <= fraction_digits <= MAX_FRACTION_DIGITS. Code that holds a
/// CurrencyMeta may therefore index `constants::POW10` with its
/// fraction_digits() without a range check.
class CurrencyMeta {
public:
    /// Validate and build currency metadata.
    ///
    /// # Arguments
    /// * `symbol_grapheme`   — Display symbol, UTF-8. May be empty.
    /// * `decimal_separator` — UTF-8 text; its first code point is the
    ///                         decimal point. Empty means ".".
    /// * `fraction_digits`   — Minor-unit digits, 0 to 9.
    /// * `code`              — Alpha-3 code, informational only.
    ///
    /// # Returns
    /// `nullopt` if fraction_digits is out of range or decimal_separator is
    /// not valid UTF-8.
    [[nodiscard]] static std::optional<CurrencyMeta>
    make(std::string symbol_grapheme,
         std::string_view decimal_separator,
         int fraction_digits,
         std::string code = {});

    [[nodiscard]] const std::string& symbol_grapheme() const noexcept { return grapheme_; }
    [[nodiscard]] char32_t decimal_separator() const noexcept { return decimal_; }
    [[nodiscard]] std::string decimal_separator_utf8() const;
    [[nodiscard]] int fraction_digits() const noexcept { return fraction_digits_; }
    [[nodiscard]] const std::string& code() const noexcept { return code_; }

    /// 10^fraction_digits, the number of minor units per major unit.
    [[nodiscard]] std::int64_t scale() const noexcept {
        return constants::POW10[static_cast<std::size_t>(fraction_digits_)];
    }

    bool operator==(const CurrencyMeta&) const = default;

private:
    CurrencyMeta(std::string grapheme, char32_t decimal, int fraction_digits,
                 std::string code) noexcept;

    std::string grapheme_;
    char32_t    decimal_;
    int         fraction_digits_;
    std::string code_;
};

// ─── ParseOptions ─────────────────────────────────────────────────────────────

/// Behavioural switches for one parse call.
struct ParseOptions {
    /// Input may carry the currency's symbol; when true the resolved
    /// currency's grapheme becomes mandatory (if it has one).
    bool allow_currency_symbol = false;

    /// Every grouping separator before the decimal point must be the same
    /// character.
    bool strict_grouping = false;

    /// A leading "+", "-" or "−" is accepted.
    bool accept_signs = true;
};

} // namespace moneyparse
