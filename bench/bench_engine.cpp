/**
 * @file  bench/bench_engine.cpp
 * @brief Google Benchmark suite for the drawstat analysis hot paths.
 *
 * Benchmarks
 * ----------
 *   BM_PositionAnalyze            per-position gap statistics
 *   BM_TransitionBuild            first-order transition table
 *   BM_CorrelationMatrix          pairwise Pearson over all positions
 *   BM_ScoringContextBuild        everything the scorer reads, computed once
 *   BM_TopCombinations            beam search over a prebuilt context
 *   BM_EngineCachedQuery          cache hit path through the Engine
 *   BM_CacheSetGet                ResultCache insert + lookup
 *   BM_CrossValidate              5-fold validation of the due-score predictor
 *
 * Build (CMake):
 *   cmake -DDRAWSTAT_BENCH=ON ..
 *   cmake --build build --target bench_engine
 *   ./build/bench_engine --benchmark_format=json
 *
 * Range argument: number of draws in the synthetic history.
 */

#include "benchmark/benchmark.h"

#include "drawstat/cache.hpp"
#include "drawstat/correlation.hpp"
#include "drawstat/engine.hpp"
#include "drawstat/position_analyzer.hpp"
#include "drawstat/scoring.hpp"
#include "drawstat/transition.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using namespace drawstat;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// N draws of `positions` digits from a fixed linear congruential sequence.
static std::vector<Draw> make_draws(std::size_t n, std::size_t positions = 3) {
    std::vector<Draw> draws;
    draws.reserve(n);
    std::uint32_t x = 2463534242u;
    for (std::size_t i = 0; i < n; ++i) {
        Draw d{fmt::format("{:04}-{:02}-{:02}", 1990 + i / 336, 1 + (i / 28) % 12, 1 + i % 28), {}};
        for (std::size_t p = 0; p < positions; ++p) {
            x = x * 1664525u + 1013904223u;
            d.values.push_back(static_cast<Value>((x >> 24) % 10));
        }
        draws.push_back(std::move(d));
    }
    return draws;
}

static Snapshot make_snapshot(std::size_t n, std::size_t positions = 3) {
    return Snapshot(DrawLayout::uniform(positions, 0, 9), make_draws(n, positions));
}

// ── Analysis ───────────────────────────────────────────────────────────────────

static void BM_PositionAnalyze(benchmark::State& state) {
    const auto snap = make_snapshot(static_cast<std::size_t>(state.range(0)));
    const analysis::PositionAnalyzer analyzer;
    for (auto _ : state) {
        auto stats = analyzer.analyze(snap, 0);
        benchmark::DoNotOptimize(stats);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_PositionAnalyze)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_TransitionBuild(benchmark::State& state) {
    const auto snap = make_snapshot(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto table = transition::TransitionModel::build(snap, 0);
        benchmark::DoNotOptimize(table);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_TransitionBuild)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_CorrelationMatrix(benchmark::State& state) {
    const auto snap = make_snapshot(static_cast<std::size_t>(state.range(0)), 6);
    for (auto _ : state) {
        auto m = analysis::CrossPositionCorrelator::correlation_matrix(snap);
        benchmark::DoNotOptimize(m.data());
    }
}
BENCHMARK(BM_CorrelationMatrix)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMicrosecond);

// ── Scoring ────────────────────────────────────────────────────────────────────

static void BM_ScoringContextBuild(benchmark::State& state) {
    const auto snap = make_snapshot(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto ctx = scoring::ScoringContext::build(snap);
        benchmark::DoNotOptimize(ctx);
    }
}
BENCHMARK(BM_ScoringContextBuild)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMicrosecond);

static void BM_TopCombinations(benchmark::State& state) {
    const auto snap = make_snapshot(1000);
    const auto ctx  = scoring::ScoringContext::build(snap);
    scoring::ScoringConfig cfg;
    cfg.beam_width = static_cast<std::size_t>(state.range(0));
    const scoring::CombinationScorer scorer(cfg);
    for (auto _ : state) {
        auto top = scorer.top_combinations(ctx, 10);
        benchmark::DoNotOptimize(top);
    }
}
BENCHMARK(BM_TopCombinations)->DenseRange(2, 10, 2)->Unit(benchmark::kMicrosecond);

// ── Engine and cache ───────────────────────────────────────────────────────────

static void BM_EngineCachedQuery(benchmark::State& state) {
    const InMemorySequenceStore store(DrawLayout::uniform(3, 0, 9),
                                      make_draws(static_cast<std::size_t>(state.range(0))));
    const core::Engine engine(store);
    (void)engine.position_stats(0);
    for (auto _ : state) {
        auto stats = engine.position_stats(0);
        benchmark::DoNotOptimize(stats);
    }
}
BENCHMARK(BM_EngineCachedQuery)->RangeMultiplier(8)->Range(64, 4096);

static void BM_CacheSetGet(benchmark::State& state) {
    cache::ResultCache c;
    scoring::CandidateScore value;
    value.combination = {1, 2, 3};
    std::size_t i = 0;
    for (auto _ : state) {
        const cache::CacheKey key{"bench", std::to_string(i++ % 256)};
        c.set(key, value);
        benchmark::DoNotOptimize(c.get(key));
    }
}
BENCHMARK(BM_CacheSetGet);

// ── Validation ─────────────────────────────────────────────────────────────────

static void BM_CrossValidate(benchmark::State& state) {
    const InMemorySequenceStore store(DrawLayout::uniform(3, 0, 9),
                                      make_draws(static_cast<std::size_t>(state.range(0))));
    const core::Engine engine(store);
    const auto predict = core::Engine::due_score_predictor();
    for (auto _ : state) {
        auto report = engine.cross_validate(predict, 5);
        benchmark::DoNotOptimize(report);
    }
}
BENCHMARK(BM_CrossValidate)->RangeMultiplier(4)->Range(100, 1600)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
