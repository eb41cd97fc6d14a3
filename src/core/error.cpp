/// @file src/core/error.cpp
/// @brief ErrorKind names and Error::message.

#include "moneyparse/error.hpp"

#include <fmt/core.h>

namespace moneyparse {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::EmptyInput:                return "EmptyInput";
        case ErrorKind::InvalidCurrencyIdentifier: return "InvalidCurrencyIdentifier";
        case ErrorKind::InvalidCurrencyQuery:      return "InvalidCurrencyQuery";
        case ErrorKind::InvalidISOCode:            return "InvalidISOCode";
        case ErrorKind::InvalidNumericCode:        return "InvalidNumericCode";
        case ErrorKind::SignsNotAllowed:           return "SignsNotAllowed";
        case ErrorKind::CurrencySymbolNotAllowed:  return "CurrencySymbolNotAllowed";
        case ErrorKind::InvalidCurrencySymbol:     return "InvalidCurrencySymbol";
        case ErrorKind::MixedGrouping:             return "MixedGrouping";
        case ErrorKind::TooManyDecimals:           return "TooManyDecimals";
        case ErrorKind::NoDigits:                  return "NoDigits";
        case ErrorKind::BadChar:                   return "BadChar";
        case ErrorKind::AmountOverflow:            return "AmountOverflow";
    }
    return "Unknown";
}

std::string Error::message() const {
    if (context.empty()) {
        return to_string(kind);
    }
    return fmt::format("{}: {}", to_string(kind), context);
}

} // namespace moneyparse
