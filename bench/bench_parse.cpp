/**
 * @file  bench/bench_parse.cpp
 * @brief Google Benchmark suite for price parsing and batch normalization.
 *
 * Benchmarks
 * ----------
 *   BM_ParseNumber_US: one grammar attempt
 *   BM_MultiLocale_Plain: all conventions, single candidate
 *   BM_MultiLocale_Ambiguous: all conventions, two candidates
 *   BM_ParseMoney: full single-item pipeline
 *   BM_NormalizeAndSort: batch of N mixed inputs
 *
 * Build (CMake):
 *   cmake -DPRICENORM_BENCH=ON ..
 *   cmake --build build --target bench_parse
 *   ./build/bench_parse --benchmark_format=json
 *
 * Throughput units: items/second (price strings processed).
 */

#include "benchmark/benchmark.h"

#include "pricenorm/money_parser.hpp"
#include "pricenorm/normalizer.hpp"
#include "pricenorm/number_parser.hpp"

#include <string>
#include <vector>

using namespace pricenorm;

static void BM_ParseNumber_US(benchmark::State& state) {
    const auto grammar =
        parse::NumberGrammar::from_convention(*locale::LocaleTable::defaults().find("USD"));
    for (auto _ : state) {
        benchmark::DoNotOptimize(parse::parse_number("1,234,567.89", grammar));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ParseNumber_US);

static void BM_MultiLocale_Plain(benchmark::State& state) {
    const parse::MultiLocaleParser parser(locale::LocaleTable::defaults());
    for (auto _ : state) {
        benchmark::DoNotOptimize(parser.parse("1234.56"));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_MultiLocale_Plain);

static void BM_MultiLocale_Ambiguous(benchmark::State& state) {
    const parse::MultiLocaleParser parser(locale::LocaleTable::defaults());
    for (auto _ : state) {
        benchmark::DoNotOptimize(parser.parse("1.234"));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_MultiLocale_Ambiguous);

static void BM_ParseMoney(benchmark::State& state) {
    const parse::MoneyParser parser;
    for (auto _ : state) {
        benchmark::DoNotOptimize(parser.parse("EUR 1.234,56"));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ParseMoney);

static void BM_NormalizeAndSort(benchmark::State& state) {
    const std::vector<std::string> pool{
        "$1,299.99", "EUR 1.099,00", "\xC2\xA3" "849", "1.234", "JPY 120000",
        "USD 15", "12,50 \xE2\x82\xAC", "garbage", "(5.00)", "AUD 0.99",
    };
    std::vector<std::string> inputs;
    const auto n = static_cast<std::size_t>(state.range(0));
    inputs.reserve(n);
    for (std::size_t i = 0; i < n; ++i) inputs.push_back(pool[i % pool.size()]);

    const BatchNormalizer normalizer;
    for (auto _ : state) {
        benchmark::DoNotOptimize(normalizer.normalize_and_sort(inputs));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_NormalizeAndSort)->Arg(10)->Arg(100)->Arg(1000);

BENCHMARK_MAIN();
