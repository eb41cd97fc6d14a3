/// @file src/core/currency_meta.cpp
/// @brief CurrencyMeta construction and validation.

#include "moneyparse/types.hpp"

#include "../text/text_utils.hpp"

#include <utility>

namespace moneyparse {

CurrencyMeta::CurrencyMeta(std::string grapheme, char32_t decimal,
                           int fraction_digits, std::string code) noexcept
    : grapheme_(std::move(grapheme)),
      decimal_(decimal),
      fraction_digits_(fraction_digits),
      code_(std::move(code)) {}

std::optional<CurrencyMeta>
CurrencyMeta::make(std::string symbol_grapheme,
                   std::string_view decimal_separator,
                   int fraction_digits,
                   std::string code) {
    if (fraction_digits < 0 || fraction_digits > constants::MAX_FRACTION_DIGITS) {
        return std::nullopt;
    }
    if (!text::is_valid_utf8(decimal_separator) || !text::is_valid_utf8(symbol_grapheme)) {
        return std::nullopt;
    }

    // Only the first code point of a multi-character separator is used.
    char32_t decimal = constants::DEFAULT_DECIMAL_SEPARATOR;
    if (!decimal_separator.empty()) {
        decimal = text::decode_utf8(decimal_separator).front();
    }

    return CurrencyMeta(std::move(symbol_grapheme), decimal, fraction_digits,
                        std::move(code));
}

std::string CurrencyMeta::decimal_separator_utf8() const {
    return text::encode_utf8(decimal_);
}

} // namespace moneyparse
