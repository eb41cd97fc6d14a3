#pragma once

/// @file src/text/text_utils.hpp
/// @brief Internal UTF-8 / Unicode helpers shared by the parser, the symbol
///        detector and the resolver. Backed by ICU (icu-uc).
///
/// Not part of the public API: lives under src/ and is only on the include
/// path of the library and its tests.

#include <string>
#include <string_view>

namespace moneyparse::text {

/// Replacement for byte sequences that are not valid UTF-8.
static constexpr char32_t REPLACEMENT_CHARACTER = U'\uFFFD';

/// Decode UTF-8 into code points. Ill-formed sequences become U+FFFD.
[[nodiscard]] std::u32string decode_utf8(std::string_view utf8);

/// Encode code points as UTF-8.
[[nodiscard]] std::string encode_utf8(std::u32string_view code_points);

/// Encode one code point as UTF-8.
[[nodiscard]] std::string encode_utf8(char32_t code_point);

/// True if every byte sequence in `utf8` is well-formed.
[[nodiscard]] bool is_valid_utf8(std::string_view utf8) noexcept;

/// Unicode White_Space property (space, tab, NBSP, U+2000–U+200A, …).
[[nodiscard]] bool is_whitespace(char32_t cp) noexcept;

/// Unicode general category Sc.
[[nodiscard]] bool is_currency_symbol(char32_t cp) noexcept;

[[nodiscard]] inline bool is_ascii_digit(char32_t cp) noexcept {
    return cp >= U'0' && cp <= U'9';
}

[[nodiscard]] inline bool is_ascii_letter(char cp) noexcept {
    return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z');
}

/// Strip leading and trailing Unicode white space.
[[nodiscard]] std::u32string_view trim(std::u32string_view s) noexcept;

/// Strip leading and trailing Unicode white space from UTF-8 text.
[[nodiscard]] std::string trim_utf8(std::string_view utf8);

/// Replace every occurrence of `from` with `to`, in place.
void replace_all(std::u32string& s, char32_t from, char32_t to) noexcept;

/// Root-locale Unicode lower-casing ("ЛВ" → "лв", "KR" → "kr").
[[nodiscard]] std::string to_lower(std::string_view utf8);

/// ASCII upper-casing; other bytes unchanged.
[[nodiscard]] std::string ascii_upper(std::string_view s);

} // namespace moneyparse::text
