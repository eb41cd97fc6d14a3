#pragma once

/// @file include/moneyparse/symbol_detector.hpp
/// @brief Detects currency-symbol-like text in an amount string.
///
/// # Module: Symbol Detector
///
/// ## Responsibility
/// Answer one question before any structural parsing happens: does this
/// text contain something that looks like a currency symbol?
///
/// Two tests, either one is enough:
///   1. Any code point in Unicode general category Sc ("$", "€", "₹", "¤")
///   2. The lower-cased text contains one of a list of plain-letter tokens
///      ("kr", "fr", "bs.", "лв", "元"…) that the category test cannot see
///
/// ## Edge Cases
/// - Token matching is substring containment, so single-letter tokens such
///   as "d" or "k" match any text containing that letter
/// - Invalid UTF-8 bytes never match the category test
///
/// ## Guarantees
/// - Detectors are immutable values once built; concurrent reads are safe

#include <string>
#include <string_view>
#include <vector>

namespace moneyparse::parser {

class SymbolDetector {
public:
    /// Detector with the built-in token list.
    [[nodiscard]] static SymbolDetector with_default_tokens();

    /// Detector with exactly `tokens` (lower-cased on insertion).
    explicit SymbolDetector(const std::vector<std::string>& tokens);

    /// The built-in plain-letter token list, lower case, UTF-8.
    [[nodiscard]] static const std::vector<std::string>& default_tokens();

    /// Append a token. Empty tokens are ignored.
    void add_token(std::string_view token);

    /// True if `input` contains a currency symbol or a listed token.
    [[nodiscard]] bool contains_currency_symbol(std::string_view input) const;

    /// True if `input` contains a Unicode Sc code point.
    [[nodiscard]] static bool contains_symbol_category(std::string_view input);

    /// True if the lower-cased `input` contains a listed token.
    [[nodiscard]] bool contains_token(std::string_view input) const;

    [[nodiscard]] const std::vector<std::string>& tokens() const noexcept { return tokens_; }

private:
    std::vector<std::string> tokens_;
};

} // namespace moneyparse::parser
