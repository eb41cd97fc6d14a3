#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

/// @file include/moneyparse/constants.hpp
/// @brief Numeric bounds and fixed code points for the moneyparse library.

namespace moneyparse::constants {

// ─── Fraction Digits ──────────────────────────────────────────────────────────

/// Largest number of minor-unit digits a currency may declare.
/// 10^9 still leaves nine decimal orders of magnitude for the integer part.
static constexpr int MAX_FRACTION_DIGITS = 9;

/// Powers of ten for every legal fraction-digit count, POW10[n] = 10^n.
static constexpr std::array<std::int64_t, MAX_FRACTION_DIGITS + 1> POW10 = {
    1LL,
    10LL,
    100LL,
    1'000LL,
    10'000LL,
    100'000LL,
    1'000'000LL,
    10'000'000LL,
    100'000'000LL,
    1'000'000'000LL,
};

static constexpr int DECIMAL_BASE = 10;

// ─── Code Points ──────────────────────────────────────────────────────────────

/// Decimal separator used when the currency data leaves it unspecified.
static constexpr char32_t DEFAULT_DECIMAL_SEPARATOR = U'.';

static constexpr char32_t NO_BREAK_SPACE = U'\u00A0';
static constexpr char32_t SPACE          = U' ';

static constexpr char32_t PLUS_SIGN   = U'+';
static constexpr char32_t HYPHEN_SIGN = U'-';
static constexpr char32_t MINUS_SIGN  = U'\u2212';  ///< Unicode minus

static constexpr char32_t GROUP_COMMA  = U',';
static constexpr char32_t GROUP_PERIOD = U'.';

/// Length of an ISO 4217 alphabetic code.
static constexpr std::size_t ALPHA3_LENGTH = 3;

/// Digits per thousands group when formatting for display.
static constexpr std::size_t DISPLAY_GROUP_SIZE = 3;

} // namespace moneyparse::constants
