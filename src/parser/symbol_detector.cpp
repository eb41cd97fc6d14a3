/// @file src/parser/symbol_detector.cpp
/// @brief Currency-symbol detection: Unicode Sc category plus token list.

#include "moneyparse/symbol_detector.hpp"

#include "../text/text_utils.hpp"

#include <algorithm>

namespace moneyparse::parser {

// ─── Default Tokens ───────────────────────────────────────────────────────────

const std::vector<std::string>& SymbolDetector::default_tokens() {
    // Symbols made of ordinary letters or punctuation, which the Sc category
    // test does not catch. Lower case.
    static const std::vector<std::string> tokens = {
        ".د.إ", ".د.ب", ".د.ت", ".د.ج", ".د.ع", ".د.ك", ".د.ل", ".د.م",
        "a$", "ar", "b/.", "br", "bs", "bs.", "bs.s", "bz$", "c$", "cf",
        "cfa", "cg", "chf", "d", "db", "fc", "fdj", "fg", "fr", "frw",
        "ft", "g", "gs", "hk$", "j$", "k", "km", "kn", "kr", "ksh", "kz",
        "kč", "l", "le", "lei", "ls", "lt", "mk", "mt", "mvr", "nfk", "nt$",
        "nu.", "oz t", "p", "p.", "q", "r", "r$", "rd$", "rm", "rp", "s$",
        "s/", "sdr", "sh", "sk", "sm", "so’m", "t", "t$", "tsh", "tt$", "uf",
        "um", "ush", "vt", "z$", "zk", "zł", "ƒ", "ден", "дин.", "лв", "сом",
        "դր.", "ლ", "元",
    };
    return tokens;
}

// ─── Construction ─────────────────────────────────────────────────────────────

SymbolDetector SymbolDetector::with_default_tokens() {
    return SymbolDetector(default_tokens());
}

SymbolDetector::SymbolDetector(const std::vector<std::string>& tokens) {
    tokens_.reserve(tokens.size());
    for (const std::string& t : tokens) {
        add_token(t);
    }
}

void SymbolDetector::add_token(std::string_view token) {
    if (token.empty()) {
        return;
    }
    tokens_.push_back(text::to_lower(token));
}

// ─── Detection ────────────────────────────────────────────────────────────────

bool SymbolDetector::contains_symbol_category(std::string_view input) {
    const std::u32string cps = text::decode_utf8(input);
    return std::any_of(cps.begin(), cps.end(), [](char32_t cp) {
        return text::is_currency_symbol(cp);
    });
}

bool SymbolDetector::contains_token(std::string_view input) const {
    const std::string lowered = text::to_lower(input);
    return std::any_of(tokens_.begin(), tokens_.end(), [&](const std::string& t) {
        return lowered.find(t) != std::string::npos;
    });
}

bool SymbolDetector::contains_currency_symbol(std::string_view input) const {
    return contains_symbol_category(input) || contains_token(input);
}

} // namespace moneyparse::parser
