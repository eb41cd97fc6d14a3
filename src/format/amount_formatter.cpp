/// @file src/format/amount_formatter.cpp
/// @brief Plain and display renderings of minor-unit amounts.

#include "moneyparse/formatter.hpp"

#include <fmt/core.h>

#include <cstdint>

namespace moneyparse::format {

namespace {

/// |amount| split into integer and zero-padded fraction digit strings.
/// Works in unsigned space so INT64_MIN has a magnitude.
struct Magnitude {
    std::string integer;
    std::string fraction;
};

Magnitude split_magnitude(MinorUnits amount, const CurrencyMeta& meta) {
    const std::uint64_t abs = amount < 0
        ? static_cast<std::uint64_t>(-(amount + 1)) + 1u
        : static_cast<std::uint64_t>(amount);
    const auto scale = static_cast<std::uint64_t>(meta.scale());

    Magnitude m;
    m.integer = fmt::format("{}", abs / scale);
    if (meta.fraction_digits() > 0) {
        m.fraction = fmt::format("{:0{}}", abs % scale, meta.fraction_digits());
    }
    return m;
}

/// Replace the first occurrence of `what` in `s` with `with`.
void replace_first(std::string& s, std::string_view what, std::string_view with) {
    const auto pos = s.find(what);
    if (pos != std::string::npos) {
        s.replace(pos, what.size(), with);
    }
}

} // anonymous namespace

std::string AmountFormatter::to_plain_string(MinorUnits amount, const CurrencyMeta& meta) {
    const Magnitude m = split_magnitude(amount, meta);

    std::string out = amount < 0 ? "-" : "";
    out += m.integer;
    if (!m.fraction.empty()) {
        out += meta.decimal_separator_utf8();
        out += m.fraction;
    }
    return out;
}

std::string AmountFormatter::to_display_string(MinorUnits amount,
                                               const currency::CurrencyRecord& record) {
    const Magnitude m = split_magnitude(amount, record.meta);

    std::string number = group_thousands(m.integer, record.thousand_separator);
    if (!m.fraction.empty()) {
        number += record.meta.decimal_separator_utf8();
        number += m.fraction;
    }

    // Amount first, so a "1" inside the grapheme is never substituted.
    std::string out = record.display_template.empty() ? "1" : record.display_template;
    replace_first(out, "1", number);
    replace_first(out, "$", record.meta.symbol_grapheme());

    if (amount < 0) {
        out.insert(0, "-");
    }
    return out;
}

std::string AmountFormatter::group_thousands(const std::string& digits,
                                             const std::string& separator) {
    if (separator.empty() || digits.size() <= constants::DISPLAY_GROUP_SIZE) {
        return digits;
    }

    std::string out;
    out.reserve(digits.size() + separator.size() * (digits.size() / constants::DISPLAY_GROUP_SIZE));

    const std::size_t lead = digits.size() % constants::DISPLAY_GROUP_SIZE;
    std::size_t i = 0;
    if (lead > 0) {
        out.append(digits, 0, lead);
        i = lead;
    }
    for (; i < digits.size(); i += constants::DISPLAY_GROUP_SIZE) {
        if (!out.empty()) {
            out += separator;
        }
        out.append(digits, i, constants::DISPLAY_GROUP_SIZE);
    }
    return out;
}

} // namespace moneyparse::format
