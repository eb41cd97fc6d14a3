#pragma once

/// @file include/moneyparse/error.hpp
/// @brief Error taxonomy and the Result<T> value-or-error return type.
///
/// # Module: Errors
///
/// ## Responsibility
/// Every fallible moneyparse operation returns a `Result<T>`: either the
/// computed value or exactly one `Error`. Errors are plain values; nothing in
/// the library throws for bad input and nothing is logged.
///
/// ## Guarantees
/// - Each `ErrorKind` is distinct and stable; `to_string` never returns null
/// - `Error::context` holds the offending character, query text or input
///   so callers can build their own user-facing message

#include <optional>
#include <string>
#include <utility>

namespace moneyparse {

// ─── ErrorKind ────────────────────────────────────────────────────────────────

enum class ErrorKind {
    EmptyInput,                ///< Amount empty after trimming
    InvalidCurrencyIdentifier, ///< Currency query empty after trimming
    InvalidCurrencyQuery,      ///< Query neither alpha-3 nor numeric shaped
    InvalidISOCode,            ///< Alpha-3 query not in the currency table
    InvalidNumericCode,        ///< Numeric query not in the currency table
    SignsNotAllowed,           ///< Leading sign while signs are disabled
    CurrencySymbolNotAllowed,  ///< Symbol-like token while symbols are disabled
    InvalidCurrencySymbol,     ///< Symbols enabled, resolved grapheme missing
    MixedGrouping,             ///< Two grouping characters before the decimal
    TooManyDecimals,           ///< More fraction digits than the currency has
    NoDigits,                  ///< Nothing numeric left after extraction
    BadChar,                   ///< Character outside every accepted class
    AmountOverflow,            ///< Minor-unit value does not fit in int64
};

/// Stable name of an error kind, e.g. "MixedGrouping".
[[nodiscard]] const char* to_string(ErrorKind kind) noexcept;

// ─── Error ────────────────────────────────────────────────────────────────────

/// A single rejected input.
struct Error {
    ErrorKind   kind;
    std::string context;  ///< Offending character, query or input (UTF-8)

    /// "<kind>: <context>", or just "<kind>" when there is no context.
    [[nodiscard]] std::string message() const;

    [[nodiscard]] bool is(ErrorKind k) const noexcept { return kind == k; }
};

// ─── Result ───────────────────────────────────────────────────────────────────

/// Holds either a value of type T or an Error, never both.
///
/// Mirrors the `std::optional` surface (`has_value`, `operator bool`,
/// `operator*`, `value`) so call sites read like the optional-returning APIs
/// elsewhere in the codebase, with `error()` for the failure case.
template <typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}         // NOLINT(google-explicit-constructor)
    Result(Error error) : error_(std::move(error)) {}     // NOLINT(google-explicit-constructor)

    [[nodiscard]] bool has_value() const noexcept { return value_.has_value(); }
    explicit operator bool() const noexcept { return has_value(); }

    /// Throws std::bad_optional_access when the result holds an error.
    [[nodiscard]] const T& value() const& { return value_.value(); }
    [[nodiscard]] T&& value() && { return std::move(value_).value(); }

    [[nodiscard]] const T& operator*() const& noexcept { return *value_; }
    [[nodiscard]] const T* operator->() const noexcept { return &*value_; }

    /// Precondition: !has_value().
    [[nodiscard]] const Error& error() const& noexcept { return *error_; }

    /// The value, or `fallback` on error.
    [[nodiscard]] T value_or(T fallback) const& {
        return value_ ? *value_ : std::move(fallback);
    }

private:
    std::optional<T>     value_;
    std::optional<Error> error_;
};

/// Shorthand used by the parsing code: `return fail(ErrorKind::NoDigits);`
[[nodiscard]] inline Error fail(ErrorKind kind, std::string context = {}) {
    return Error{kind, std::move(context)};
}

} // namespace moneyparse
