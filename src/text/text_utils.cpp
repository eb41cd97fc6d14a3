/// @file src/text/text_utils.cpp
/// @brief ICU-backed UTF-8 / Unicode helpers.

#include "text_utils.hpp"

#include <unicode/locid.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

#include <cstdint>

namespace moneyparse::text {

// ─── UTF-8 ────────────────────────────────────────────────────────────────────

std::u32string decode_utf8(std::string_view utf8) {
    std::u32string out;
    out.reserve(utf8.size());

    const auto* s = reinterpret_cast<const std::uint8_t*>(utf8.data());
    const auto length = static_cast<std::int64_t>(utf8.size());
    std::int64_t i = 0;
    while (i < length) {
        UChar32 c = 0;
        U8_NEXT(s, i, length, c);
        out.push_back(c < 0 ? REPLACEMENT_CHARACTER : static_cast<char32_t>(c));
    }
    return out;
}

std::string encode_utf8(char32_t code_point) {
    std::uint8_t buf[U8_MAX_LENGTH];
    std::int32_t n = 0;
    U8_APPEND_UNSAFE(buf, n, static_cast<UChar32>(code_point));
    return std::string(reinterpret_cast<const char*>(buf), static_cast<std::size_t>(n));
}

std::string encode_utf8(std::u32string_view code_points) {
    std::string out;
    out.reserve(code_points.size());
    for (char32_t cp : code_points) {
        out += encode_utf8(cp);
    }
    return out;
}

bool is_valid_utf8(std::string_view utf8) noexcept {
    const auto* s = reinterpret_cast<const std::uint8_t*>(utf8.data());
    const auto length = static_cast<std::int64_t>(utf8.size());
    std::int64_t i = 0;
    while (i < length) {
        UChar32 c = 0;
        U8_NEXT(s, i, length, c);
        if (c < 0) {
            return false;
        }
    }
    return true;
}

// ─── Classification ───────────────────────────────────────────────────────────

bool is_whitespace(char32_t cp) noexcept {
    return u_isUWhiteSpace(static_cast<UChar32>(cp)) != 0;
}

bool is_currency_symbol(char32_t cp) noexcept {
    return u_charType(static_cast<UChar32>(cp)) == U_CURRENCY_SYMBOL;
}

// ─── Transforms ───────────────────────────────────────────────────────────────

std::u32string_view trim(std::u32string_view s) noexcept {
    std::size_t first = 0;
    while (first < s.size() && is_whitespace(s[first])) {
        ++first;
    }
    std::size_t last = s.size();
    while (last > first && is_whitespace(s[last - 1])) {
        --last;
    }
    return s.substr(first, last - first);
}

std::string trim_utf8(std::string_view utf8) {
    const std::u32string decoded = decode_utf8(utf8);
    return encode_utf8(trim(decoded));
}

void replace_all(std::u32string& s, char32_t from, char32_t to) noexcept {
    for (char32_t& cp : s) {
        if (cp == from) {
            cp = to;
        }
    }
}

std::string to_lower(std::string_view utf8) {
    icu::UnicodeString u = icu::UnicodeString::fromUTF8(
        icu::StringPiece(utf8.data(), static_cast<std::int32_t>(utf8.size())));
    u.toLower(icu::Locale::getRoot());

    std::string out;
    u.toUTF8String(out);
    return out;
}

std::string ascii_upper(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        if (c >= 'a' && c <= 'z') {
            c = static_cast<char>(c - 'a' + 'A');
        }
    }
    return out;
}

} // namespace moneyparse::text
