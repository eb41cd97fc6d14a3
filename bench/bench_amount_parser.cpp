/**
 * @file  bench/bench_amount_parser.cpp
 * @brief Google Benchmark suite for monetary amount parsing.
 *
 * Benchmarks
 * ----------
 *   BM_Parse_Plain / Grouped / WithSymbol / Strict   — parse against a resolved meta
 *   BM_ParseAmount_Alpha3 / Numeric                  — end to end incl. resolution
 *   BM_Resolve_Alpha3                                — resolver only
 *   BM_SymbolDetector                                — symbol gate only
 *   BM_Format_Display                                — display rendering
 *   BM_Parse_Batch                                   — N mixed inputs per iteration
 *
 * Build (CMake):
 *   cmake --build build --target bench_amount_parser
 *   ./build/bench_amount_parser --benchmark_format=json
 *
 * Throughput units: items/second (amounts parsed).
 */

#include "benchmark/benchmark.h"

#include "moneyparse/amount_parser.hpp"
#include "moneyparse/currency.hpp"
#include "moneyparse/formatter.hpp"

#include <cstddef>
#include <string>
#include <vector>

using namespace moneyparse;
using namespace moneyparse::currency;
using namespace moneyparse::format;
using namespace moneyparse::parser;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static const CurrencyRecord& usd() {
    return *CurrencyTable::iso4217().find_by_code("USD");
}

/// N inputs cycling through common shapes.
static std::vector<std::string> make_inputs(std::size_t n) {
    static const char* shapes[] = {
        "1,455.00", "-1,455.00", "100 000.00", "0.5", "92233720368547.75", "1.234",
    };
    std::vector<std::string> v;
    v.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        v.emplace_back(shapes[i % (sizeof(shapes) / sizeof(shapes[0]))]);
    }
    return v;
}

// ── Parse against a resolved currency ─────────────────────────────────────────

static void BM_Parse_Plain(benchmark::State& state) {
    const AmountParser parser;
    const CurrencyMeta& meta = usd().meta;
    for (auto _ : state) {
        auto r = parser.parse("1455.00", meta);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_Parse_Plain);

static void BM_Parse_Grouped(benchmark::State& state) {
    const AmountParser parser;
    const CurrencyMeta& meta = usd().meta;
    for (auto _ : state) {
        auto r = parser.parse("1,234,567,890.12", meta);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_Parse_Grouped);

static void BM_Parse_WithSymbol(benchmark::State& state) {
    const AmountParser parser(ParseOptions{.allow_currency_symbol = true});
    const CurrencyMeta& meta = usd().meta;
    for (auto _ : state) {
        auto r = parser.parse("-$1,234,567.89", meta);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_Parse_WithSymbol);

static void BM_Parse_Strict(benchmark::State& state) {
    const AmountParser parser(ParseOptions{.strict_grouping = true});
    const CurrencyMeta& meta = usd().meta;
    for (auto _ : state) {
        auto r = parser.parse("1 234 567 890.12", meta);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_Parse_Strict);

// ── End to end ────────────────────────────────────────────────────────────────

static void BM_ParseAmount_Alpha3(benchmark::State& state) {
    for (auto _ : state) {
        auto r = parse_amount("1,455.00", "EUR");
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_ParseAmount_Alpha3);

static void BM_ParseAmount_Numeric(benchmark::State& state) {
    for (auto _ : state) {
        auto r = parse_amount("1,455.00", "978");
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_ParseAmount_Numeric);

// ── Components ────────────────────────────────────────────────────────────────

static void BM_Resolve_Alpha3(benchmark::State& state) {
    const CurrencyResolver resolver;
    for (auto _ : state) {
        auto r = resolver.resolve(" eur ");
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_Resolve_Alpha3);

static void BM_SymbolDetector(benchmark::State& state) {
    const SymbolDetector detector = SymbolDetector::with_default_tokens();
    for (auto _ : state) {
        bool hit = detector.contains_currency_symbol("1,234,567.89");
        benchmark::DoNotOptimize(hit);
    }
}
BENCHMARK(BM_SymbolDetector);

static void BM_Format_Display(benchmark::State& state) {
    const CurrencyRecord& rec = usd();
    for (auto _ : state) {
        auto s = AmountFormatter::to_display_string(-123456789, rec);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_Format_Display);

// ── Batch ─────────────────────────────────────────────────────────────────────

static void BM_Parse_Batch(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto inputs = make_inputs(n);
    const AmountParser parser;
    const CurrencyMeta& meta = usd().meta;
    for (auto _ : state) {
        for (const auto& in : inputs) {
            auto r = parser.parse(in, meta);
            benchmark::DoNotOptimize(r);
        }
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Parse_Batch)->RangeMultiplier(4)->Range(64, 4096)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
