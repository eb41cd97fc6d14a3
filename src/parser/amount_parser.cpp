/// @file src/parser/amount_parser.cpp
/// @brief Amount Parser — whitespace normalisation, symbol/sign gates,
///        single-pass character scan and exact minor-unit assembly.

#include "moneyparse/amount_parser.hpp"

#include "../text/text_utils.hpp"

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace moneyparse::parser {

namespace {

constexpr MinorUnits MINOR_UNITS_MAX = std::numeric_limits<MinorUnits>::max();

bool is_sign(char32_t cp) noexcept {
    return cp == constants::PLUS_SIGN ||
           cp == constants::HYPHEN_SIGN ||
           cp == constants::MINUS_SIGN;
}

bool is_grouping_separator(char32_t cp) noexcept {
    return cp == constants::SPACE ||
           cp == constants::GROUP_COMMA ||
           cp == constants::GROUP_PERIOD;
}

/// Base-10 value of an ASCII digit sequence. Empty → 0.
/// nullopt if the value does not fit in MinorUnits.
std::optional<MinorUnits> accumulate_digits(const std::u32string& digits) noexcept {
    MinorUnits value = 0;
    for (char32_t cp : digits) {
        const auto d = static_cast<MinorUnits>(cp - U'0');
        if (value > (MINOR_UNITS_MAX - d) / constants::DECIMAL_BASE) {
            return std::nullopt;
        }
        value = value * constants::DECIMAL_BASE + d;
    }
    return value;
}

/// Shared by every parser built with the default token list.
const std::shared_ptr<const SymbolDetector>& default_detector() {
    static const auto detector =
        std::make_shared<const SymbolDetector>(SymbolDetector::with_default_tokens());
    return detector;
}

} // anonymous namespace

// ─── Construction ─────────────────────────────────────────────────────────────

AmountParser::AmountParser()
    : AmountParser(ParseOptions{}) {}

AmountParser::AmountParser(ParseOptions options)
    : options_(options), detector_(default_detector()) {}

AmountParser::AmountParser(ParseOptions options, SymbolDetector detector)
    : options_(options),
      detector_(std::make_shared<const SymbolDetector>(std::move(detector))) {}

// ─── AmountParser::parse ──────────────────────────────────────────────────────

Result<MinorUnits>
AmountParser::parse(std::string_view raw, const CurrencyMeta& meta) const {
    // 1. Trim. NBSP counts as white space for trimming.
    const std::u32string decoded = text::decode_utf8(raw);
    const std::u32string_view trimmed = text::trim(decoded);

    // 2.
    if (trimmed.empty()) {
        return fail(ErrorKind::EmptyInput);
    }
    const std::string input = text::encode_utf8(trimmed);

    // 3. Symbol gate, on the text before anything is stripped.
    if (!options_.allow_currency_symbol && detector_->contains_currency_symbol(input)) {
        return fail(ErrorKind::CurrencySymbolNotAllowed, input);
    }

    // 4. Sign gate.
    if (!options_.accept_signs && is_sign(trimmed.front())) {
        return fail(ErrorKind::SignsNotAllowed, input);
    }

    std::u32string s(trimmed);
    text::replace_all(s, constants::NO_BREAK_SPACE, constants::SPACE);

    // 5. Symbol extraction. An empty grapheme never matches and never fails.
    if (options_.allow_currency_symbol && !meta.symbol_grapheme().empty()) {
        const std::u32string grapheme = text::decode_utf8(meta.symbol_grapheme());
        const auto pos = s.find(grapheme);
        if (pos == std::u32string::npos) {
            return fail(ErrorKind::InvalidCurrencySymbol, input);
        }
        s.erase(pos, grapheme.size());
        s = std::u32string(text::trim(s));
    }

    // 6. Sign extraction.
    MinorUnits sign = 1;
    if (options_.accept_signs && !s.empty()) {
        const char32_t first = s.front();
        if (first == constants::HYPHEN_SIGN || first == constants::MINUS_SIGN) {
            sign = -1;
            s = std::u32string(text::trim(std::u32string_view(s).substr(1)));
        } else if (first == constants::PLUS_SIGN) {
            s = std::u32string(text::trim(std::u32string_view(s).substr(1)));
        }
    }

    // 7.
    if (s.empty()) {
        return fail(ErrorKind::NoDigits, input);
    }

    // 8. Scan.
    const char32_t decimal        = meta.decimal_separator();
    const int      fraction_digits = meta.fraction_digits();

    std::u32string int_digits;
    std::u32string frac_digits;
    bool has_decimal = false;
    std::optional<char32_t> last_group;

    for (char32_t cp : s) {
        if (text::is_ascii_digit(cp)) {
            (has_decimal ? frac_digits : int_digits).push_back(cp);
            continue;
        }

        if (cp == decimal && !has_decimal && fraction_digits > 0) {
            has_decimal = true;
            continue;
        }

        // A repeated decimal separator lands here too and is read as grouping.
        if (is_grouping_separator(cp)) {
            if (options_.strict_grouping) {
                const std::optional<char32_t> previous = last_group;
                last_group = cp;
                if (!has_decimal && previous && *previous != cp) {
                    return fail(ErrorKind::MixedGrouping, text::encode_utf8(cp));
                }
            }
            continue;
        }

        return fail(ErrorKind::BadChar, text::encode_utf8(cp));
    }

    // 9.
    if (int_digits.empty() && frac_digits.empty()) {
        return fail(ErrorKind::NoDigits, input);
    }

    // 10. Fraction length.
    const auto wanted = static_cast<std::size_t>(fraction_digits);
    if (frac_digits.size() > wanted) {
        return fail(ErrorKind::TooManyDecimals, input);
    }
    frac_digits.resize(wanted, U'0');

    // 11. minor = int · 10^n + frac
    const auto int_value  = accumulate_digits(int_digits);
    const auto frac_value = accumulate_digits(frac_digits);
    if (!int_value || !frac_value) {
        return fail(ErrorKind::AmountOverflow, input);
    }

    const MinorUnits scale = meta.scale();
    if (*int_value > (MINOR_UNITS_MAX - *frac_value) / scale) {
        return fail(ErrorKind::AmountOverflow, input);
    }
    const MinorUnits minor = *int_value * scale + *frac_value;

    return sign * minor;
}

Result<MinorUnits>
AmountParser::parse(std::string_view input,
                    std::string_view currency_query,
                    const currency::CurrencyResolver& resolver) const {
    if (text::trim(text::decode_utf8(input)).empty()) {
        return fail(ErrorKind::EmptyInput);
    }

    auto meta = resolver.resolve(currency_query);
    if (!meta) {
        return meta.error();
    }
    return parse(input, *meta);
}

Result<MinorUnits>
AmountParser::parse(std::string_view input, std::string_view currency_query) const {
    const currency::CurrencyResolver resolver;
    return parse(input, currency_query, resolver);
}

// ─── parse_amount ─────────────────────────────────────────────────────────────

Result<MinorUnits>
parse_amount(std::string_view input,
             std::string_view currency_query,
             const ParseOptions& options) {
    return AmountParser(options).parse(input, currency_query);
}

} // namespace moneyparse::parser
