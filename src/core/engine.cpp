/// @file src/core/engine.cpp
/// @brief Engine: snapshot lifecycle and cached query dispatch.

#include "drawstat/engine.hpp"
#include "drawstat/log.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <utility>

namespace drawstat::core {

using analysis::CrossPositionCorrelator;
using scoring::CandidateScore;
using scoring::CombinationScorer;
using scoring::ScoringContext;
using transition::TransitionModel;

// ─── Construction and snapshot lifecycle ──────────────────────────────────────

Engine::Engine(const SequenceStore& store, EngineConfig config)
    : store_(store)
    , config_(std::move(config))
    , analyzer_(config_.analyzer)
    , scorer_(config_.scoring)
    , cache_(config_.cache)
{
    refresh();
}

void Engine::refresh() {
    auto fresh = store_.snapshot(config_.filter);
    log::info("engine", "snapshot {:016x}: {} draws, {} positions",
              fresh->fingerprint(), fresh->size(), fresh->positions());

    std::lock_guard lock(mutex_);
    state_ = State{.snapshot = std::move(fresh), .context = nullptr};
}

Engine::State Engine::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

SnapshotPtr Engine::snapshot() const {
    return state().snapshot;
}

std::shared_ptr<const ScoringContext> Engine::context(const SnapshotPtr& snap) const {
    std::lock_guard lock(mutex_);
    if (state_.snapshot != snap) {
        // Refreshed since the caller took its snapshot.
        return std::make_shared<const ScoringContext>(ScoringContext::build(*snap, analyzer_));
    }
    if (!state_.context) {
        state_.context = std::make_shared<const ScoringContext>(
            ScoringContext::build(*snap, analyzer_));
    }
    return state_.context;
}

cache::CacheKey Engine::key(const Snapshot& snapshot, std::string kind,
                            const std::string& params) {
    return cache::CacheKey{
        .kind   = std::move(kind),
        .params = fmt::format("{:016x}/{}", snapshot.fingerprint(), params),
    };
}

// ─── Position analysis ────────────────────────────────────────────────────────

analysis::PositionStatMap Engine::position_stats(std::size_t position) const {
    const auto snap = snapshot();
    return cache_.get_or_compute<analysis::PositionStatMap>(
        key(*snap, "position-stats", fmt::format("{}", position)),
        [&] { return analyzer_.analyze(*snap, position); });
}

std::optional<analysis::PositionSummary> Engine::position_summary(std::size_t position) const {
    const auto snap = snapshot();
    const auto k = key(*snap, "position-summary", fmt::format("{}", position));
    if (auto hit = cache_.get_as<analysis::PositionSummary>(k)) return hit;

    auto summary = analyzer_.summarize(*snap, position);
    if (summary) cache_.set(k, *summary);
    return summary;
}

std::vector<analysis::PatternStat> Engine::pattern_stats(std::size_t position) const {
    const auto snap = snapshot();
    return cache_.get_or_compute<std::vector<analysis::PatternStat>>(
        key(*snap, "pattern-stats", fmt::format("{}", position)),
        [&] { return analyzer_.analyze_patterns(*snap, position); });
}

// ─── Transitions and correlations ─────────────────────────────────────────────

transition::TransitionTable Engine::transition_table(std::size_t position) const {
    const auto snap = snapshot();
    return cache_.get_or_compute<transition::TransitionTable>(
        key(*snap, "transition-table", fmt::format("{}", position)),
        [&] { return TransitionModel::build(*snap, position); });
}

std::vector<transition::RankedTransition>
Engine::transitions(std::size_t position, Value value, std::size_t top_k) const {
    const auto snap = snapshot();
    return cache_.get_or_compute<std::vector<transition::RankedTransition>>(
        key(*snap, "transitions", fmt::format("{}/{}/{}", position, value, top_k)),
        [&] { return TransitionModel::predict_next(*snap, position, value, top_k); });
}

std::vector<analysis::Correlation>
Engine::correlations(const CancellationToken* token) const {
    const auto snap = snapshot();
    return cache_.get_or_compute<std::vector<analysis::Correlation>>(
        key(*snap, "correlations", "all"),
        [&] { return CrossPositionCorrelator::correlate_all(*snap, token); });
}

Eigen::MatrixXd Engine::correlation_matrix() const {
    const auto snap = snapshot();
    return cache_.get_or_compute<Eigen::MatrixXd>(
        key(*snap, "correlation-matrix", "all"),
        [&] { return CrossPositionCorrelator::correlation_matrix(*snap); });
}

// ─── Scoring ──────────────────────────────────────────────────────────────────

CandidateScore Engine::score_combination(const Combination& combination) const {
    const auto snap = snapshot();
    CombinationScorer::validate(snap->layout(), combination);
    return cache_.get_or_compute<CandidateScore>(
        key(*snap, "score", fmt::format("{}", fmt::join(combination, ","))),
        [&] { return scorer_.score(*context(snap), combination); });
}

CandidateScore Engine::score_value(std::size_t position, Value value) const {
    const auto snap = snapshot();
    return cache_.get_or_compute<CandidateScore>(
        key(*snap, "score-value", fmt::format("{}/{}", position, value)),
        [&] { return scorer_.score_value(*context(snap), position, value); });
}

std::vector<CandidateScore> Engine::top_combinations(std::size_t limit) const {
    const auto snap = snapshot();
    return cache_.get_or_compute<std::vector<CandidateScore>>(
        key(*snap, "top-combinations", fmt::format("{}", limit)),
        [&] { return scorer_.top_combinations(*context(snap), limit); });
}

std::vector<CandidateScore> Engine::due_combinations(std::size_t limit) const {
    const auto snap = snapshot();
    return cache_.get_or_compute<std::vector<CandidateScore>>(
        key(*snap, "due-combinations", fmt::format("{}", limit)),
        [&] { return scorer_.due_combinations(*context(snap), limit); });
}

scoring::BoxStraightHits Engine::box_straight_hits(const Combination& combination,
                                                   std::size_t window) const {
    return CombinationScorer::box_straight_hits(*snapshot(), combination, window);
}

// ─── Validation ───────────────────────────────────────────────────────────────

validation::CrossValidationReport
Engine::cross_validate(const validation::PredictFn& predict, std::size_t k,
                       const CancellationToken* token, const ProgressFn& progress) const {
    const validation::PredictionValidator validator(snapshot(), config_.validation);
    return validator.cross_validate(predict, k, token, progress);
}

validation::ABTestResult Engine::ab_test(const validation::PredictFn& a,
                                         const validation::PredictFn& b,
                                         std::span<const Draw> test_draws) const {
    const validation::PredictionValidator validator(snapshot(), config_.validation);
    return validator.ab_test(a, b, test_draws);
}

validation::SignificanceReport
Engine::significance_tests(const validation::CrossValidationReport& report) const {
    const validation::PredictionValidator validator(snapshot(), config_.validation);
    return validator.significance_tests(report);
}

validation::PredictFn Engine::due_score_predictor(scoring::ScoringConfig scoring,
                                                  analysis::AnalyzerConfig analyzer) {
    return [scoring, analyzer](const Snapshot& train, std::size_t) {
        std::vector<validation::Prediction> out;
        if (train.empty() || train.positions() == 0) return out;

        const auto ctx = ScoringContext::build(train, analysis::PositionAnalyzer{analyzer});
        const CombinationScorer scorer(scoring);

        const auto best = scorer.top_combinations(ctx, 1);
        if (!best.empty()) {
            out.push_back({.combination = best.front().combination,
                           .confidence  = best.front().confidence});
            return out;
        }

        // Short history: best single value per position.
        Combination combination;
        double confidence = 0.0;
        for (std::size_t p = 0; p < ctx.layout.positions(); ++p) {
            const auto& range = ctx.layout.ranges[p];
            std::optional<CandidateScore> top;
            for (Value v = range.min; v <= range.max; ++v) {
                auto s = scorer.score_value(ctx, p, v);
                if (!top || s.total > top->total) top = std::move(s);
            }
            combination.push_back(top->combination.front());
            confidence += top->confidence;
        }
        out.push_back({.combination = std::move(combination),
                       .confidence  = confidence / static_cast<double>(ctx.layout.positions())});
        return out;
    };
}

// ─── Cache management ─────────────────────────────────────────────────────────

cache::CacheStats Engine::cache_stats() const { return cache_.stats(); }

void Engine::clear_cache() { cache_.clear(); }

cache::OptimizeResult Engine::optimize_cache() {
    const auto result = cache_.optimize();
    log::debug("engine", "cache optimize: removed {}, kept {}, freed {} bytes",
               result.removed, result.kept, result.memory_freed);
    return result;
}

}  // namespace drawstat::core
