// longcursor-cpp benchmarks -- measures per-element traversal cost.
//
// Every benchmark walks N values. The plain vector loop is the baseline;
// the cursor variants add one virtual call per has_more()/next().

#include <longcursor-cpp/longcursor.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <numeric>
#include <vector>

using namespace longcursor_cpp;

static auto make_values(std::size_t n) -> std::vector<std::int64_t> {
    auto values = std::vector<std::int64_t>(n);
    std::iota(values.begin(), values.end(), std::int64_t{0});
    return values;
}

// =============================================================================
// Read-only traversal
// =============================================================================

static void bm_vector_loop(benchmark::State& state) {
    const auto values = make_values(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto sum = std::int64_t{0};
        for (auto v : values) sum += v;
        benchmark::DoNotOptimize(sum);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_vector_loop)->Range(64, 65536);

static void bm_span_cursor(benchmark::State& state) {
    const auto values = make_values(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto cur = span_cursor(values);
        auto sum = std::int64_t{0};
        while (cur->has_more()) sum += cur->next();
        benchmark::DoNotOptimize(sum);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_span_cursor)->Range(64, 65536);

static void bm_checked_span_cursor(benchmark::State& state) {
    const auto values = make_values(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto cur = CheckedCursor{span_cursor(values)};
        auto sum = std::int64_t{0};
        while (cur.has_more()) sum += cur.next();
        benchmark::DoNotOptimize(sum);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_checked_span_cursor)->Range(64, 65536);

static void bm_xor_hash(benchmark::State& state) {
    const auto values = make_values(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(xor_hash(*span_cursor(values)));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_xor_hash)->Range(64, 65536);

// =============================================================================
// Removal during traversal
// =============================================================================

static void bm_vector_cursor_remove_odd(benchmark::State& state) {
    const auto source = make_values(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        state.PauseTiming();
        auto values = source;
        state.ResumeTiming();

        auto removed = remove_if(*vector_cursor(values),
                                 [](std::int64_t v) { return v % 2 != 0; });
        benchmark::DoNotOptimize(removed);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_vector_cursor_remove_odd)->Range(64, 4096);

BENCHMARK_MAIN();
