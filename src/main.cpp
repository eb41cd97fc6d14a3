/// @file src/main.cpp
/// @brief moneyparse CLI entry point.
///
/// Usage:
///   moneyparse parse  --currency <code> [flags] <amount>...
///   moneyparse stream --currency <code> [flags]      One amount per stdin line
///   moneyparse format --currency <code> <minor>...
///   moneyparse lookup <query>...
///   moneyparse --help

#include "moneyparse/amount_parser.hpp"
#include "moneyparse/currency.hpp"
#include "moneyparse/formatter.hpp"

#include <fmt/core.h>

#include <charconv>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

using moneyparse::MinorUnits;
using moneyparse::ParseOptions;
using moneyparse::currency::CurrencyResolver;
using moneyparse::format::AmountFormatter;
using moneyparse::parser::AmountParser;
using moneyparse::parser::SymbolDetector;

constexpr int EXIT_OK    = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_USAGE = 2;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  moneyparse parse  --currency <code> [flags] <amount>...\n"
        "  moneyparse stream --currency <code> [flags]   (one amount per stdin line)\n"
        "  moneyparse format --currency <code> <minor>...\n"
        "  moneyparse lookup <query>...\n"
        "  moneyparse --help\n"
        "\n"
        "Parse flags:\n"
        "  --allow-symbol      Accept (and require) the currency's symbol\n"
        "  --strict-grouping   Reject mixed grouping separators\n"
        "  --no-signs          Reject leading + / - / −\n"
        "  --token <tok>       Extra plain-letter symbol token (repeatable)\n"
        "\n"
        "<code> is an ISO 4217 alpha-3 code (EUR) or numeric code (978).\n"
    );
}

/// Command line after the sub-command word.
struct CliArgs {
    std::optional<std::string> currency;
    ParseOptions               options;
    std::vector<std::string>   extra_tokens;
    std::vector<std::string>   positional;
};

/// Returns nullopt (after printing why) on malformed flags.
std::optional<CliArgs> parse_args(int argc, char* argv[], int first) {
    CliArgs args;
    for (int i = first; i < argc; ++i) {
        const std::string arg(argv[i]);

        if (arg == "--currency" || arg == "--token") {
            if (i + 1 >= argc) {
                fmt::print(stderr, "error: {} requires a value\n", arg);
                return std::nullopt;
            }
            if (arg == "--currency") {
                args.currency = argv[++i];
            } else {
                args.extra_tokens.emplace_back(argv[++i]);
            }
        } else if (arg == "--allow-symbol") {
            args.options.allow_currency_symbol = true;
        } else if (arg == "--strict-grouping") {
            args.options.strict_grouping = true;
        } else if (arg == "--no-signs") {
            args.options.accept_signs = false;
        } else if (arg == "--") {
            for (++i; i < argc; ++i) {
                args.positional.emplace_back(argv[i]);
            }
        } else if (arg.size() > 2 && arg.rfind("--", 0) == 0) {
            fmt::print(stderr, "error: unknown option: {}\n", arg);
            return std::nullopt;
        } else {
            args.positional.push_back(arg);
        }
    }
    return args;
}

AmountParser make_parser(const CliArgs& args) {
    if (args.extra_tokens.empty()) {
        return AmountParser(args.options);
    }
    SymbolDetector detector = SymbolDetector::with_default_tokens();
    for (const std::string& tok : args.extra_tokens) {
        detector.add_token(tok);
    }
    return AmountParser(args.options, std::move(detector));
}

/// Parse one amount and report it. Returns true on success.
bool report_parse(const AmountParser& parser,
                  const CurrencyResolver& resolver,
                  const std::string& amount,
                  const std::string& currency) {
    const auto result = parser.parse(amount, currency, resolver);
    if (!result) {
        fmt::print(stderr, "error: {}: \"{}\"\n", result.error().message(), amount);
        return false;
    }

    const auto record = resolver.resolve_record(currency);
    fmt::print("{} -> {} {}\n", amount, *result, (*record)->code);
    return true;
}

int run_parse(const CliArgs& args) {
    if (args.positional.empty()) {
        fmt::print(stderr, "error: parse requires at least one amount\n");
        return EXIT_USAGE;
    }

    const CurrencyResolver resolver;
    const AmountParser parser = make_parser(args);

    int status = EXIT_OK;
    for (const std::string& amount : args.positional) {
        if (!report_parse(parser, resolver, amount, *args.currency)) {
            status = EXIT_ERROR;
        }
    }
    return status;
}

int run_stream(const CliArgs& args) {
    const CurrencyResolver resolver;
    const AmountParser parser = make_parser(args);

    std::size_t parsed = 0;
    std::size_t rejected = 0;
    std::string line;
    while (std::getline(std::cin, line)) {
        // Trim carriage return for Windows-style line endings.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (report_parse(parser, resolver, line, *args.currency)) {
            ++parsed;
        } else {
            ++rejected;
        }
    }

    fmt::print(stderr, "Parsed {} amounts, rejected {}.\n", parsed, rejected);
    return rejected == 0 ? EXIT_OK : EXIT_ERROR;
}

int run_format(const CliArgs& args) {
    if (args.positional.empty()) {
        fmt::print(stderr, "error: format requires at least one minor-unit amount\n");
        return EXIT_USAGE;
    }

    const CurrencyResolver resolver;
    const auto record = resolver.resolve_record(*args.currency);
    if (!record) {
        fmt::print(stderr, "error: {}\n", record.error().message());
        return EXIT_ERROR;
    }

    int status = EXIT_OK;
    for (const std::string& text : args.positional) {
        MinorUnits minor = 0;
        const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), minor);
        if (ec != std::errc() || end != text.data() + text.size()) {
            fmt::print(stderr, "error: not an integer minor-unit amount: \"{}\"\n", text);
            status = EXIT_ERROR;
            continue;
        }
        fmt::print("{} -> {}  ({})\n",
                   minor,
                   AmountFormatter::to_display_string(minor, **record),
                   AmountFormatter::to_plain_string(minor, (*record)->meta));
    }
    return status;
}

int run_lookup(const CliArgs& args) {
    if (args.positional.empty()) {
        fmt::print(stderr, "error: lookup requires at least one currency query\n");
        return EXIT_USAGE;
    }

    const CurrencyResolver resolver;
    int status = EXIT_OK;
    for (const std::string& query : args.positional) {
        const auto record = resolver.resolve_record(query);
        if (!record) {
            fmt::print(stderr, "error: {}\n", record.error().message());
            status = EXIT_ERROR;
            continue;
        }
        const auto& rec = **record;
        fmt::print("{} {}  symbol={}  decimal=\"{}\"  thousand=\"{}\"  fraction_digits={}\n",
                   rec.code, rec.numeric_code,
                   rec.meta.symbol_grapheme(),
                   rec.meta.decimal_separator_utf8(),
                   rec.thousand_separator,
                   rec.meta.fraction_digits());
    }
    return status;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return EXIT_USAGE;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return EXIT_OK;
    }

    try {
        const auto args = parse_args(argc, argv, 2);
        if (!args) {
            print_usage();
            return EXIT_USAGE;
        }

        if (mode == "lookup") {
            return run_lookup(*args);
        }

        if (mode != "parse" && mode != "stream" && mode != "format") {
            fmt::print(stderr, "Unknown command: {}\n", mode);
            print_usage();
            return EXIT_USAGE;
        }

        if (!args->currency) {
            fmt::print(stderr, "error: {} requires --currency <code>\n", mode);
            return EXIT_USAGE;
        }

        if (mode == "parse") {
            return run_parse(*args);
        }
        if (mode == "stream") {
            return run_stream(*args);
        }
        return run_format(*args);
    } catch (const std::exception& ex) {
        fmt::print(stderr, "[FATAL] {}\n", ex.what());
        return EXIT_ERROR;
    }
}
