/// @file src/validation/prediction_validator.cpp
/// @brief k-fold cross-validation, prediction scoring and A/B testing.

#include "drawstat/validation.hpp"
#include "drawstat/errors.hpp"
#include "drawstat/log.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <map>
#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

namespace drawstat::validation {

namespace {

/// Run `predict` and validate its output, isolating prediction failures.
ValidationResult guarded_validate(const PredictionValidator& v, const PredictFn& predict,
                                  const Snapshot& train, std::span<const Draw> test,
                                  std::string& error) {
    try {
        const auto predictions = predict(train, test.size());
        return v.validate(predictions, test);
    } catch (const std::exception& e) {
        error = e.what();
    } catch (...) {
        error = "unknown error";
    }
    return {};
}

}  // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

PredictionValidator::PredictionValidator(SnapshotPtr snapshot, ValidationConfig config)
    : snapshot_(std::move(snapshot))
    , config_(config)
{
    if (!snapshot_) throw std::invalid_argument("PredictionValidator requires a snapshot");
}

ValidationResult PredictionValidator::failed(std::string error) const {
    ValidationResult r;
    r.error = std::move(error);
    r.hit_rates.assign(snapshot_->positions(), 0.0);
    return r;
}

// ─── Matching ─────────────────────────────────────────────────────────────────

std::size_t PredictionValidator::count_matches(std::span<const Value> predicted,
                                               std::span<const Value> actual,
                                               MatchMode mode) {
    if (mode == MatchMode::Straight) {
        const std::size_t n = std::min(predicted.size(), actual.size());
        std::size_t hits = 0;
        for (std::size_t i = 0; i < n; ++i) hits += predicted[i] == actual[i];
        return hits;
    }

    // Box: multiset intersection size.
    std::map<Value, std::size_t> pool;
    for (Value v : actual) ++pool[v];
    std::size_t hits = 0;
    for (Value v : predicted) {
        auto it = pool.find(v);
        if (it != pool.end() && it->second > 0) {
            --it->second;
            ++hits;
        }
    }
    return hits;
}

std::vector<double>
PredictionValidator::random_baseline_tail(std::span<const Value> combination) const {
    const auto& ranges = snapshot_->layout().ranges;
    const std::size_t n = ranges.size();
    std::vector<double> tail(n + 1, 0.0);

    if (config_.match_mode == MatchMode::Straight || combination.empty()) {
        std::vector<double> ps;
        ps.reserve(n);
        for (const auto& r : ranges) {
            ps.push_back(r.size() > 0 ? 1.0 / static_cast<double>(r.size()) : 0.0);
        }
        for (std::size_t k = 0; k <= n; ++k) tail[k] = stats::probability_at_least(ps, k);
        return tail;
    }

    // Box: the intersection size is Σ min(predicted count, drawn count) per
    // distinct value. Track drawn counts capped at the predicted counts,
    // position by position; the capped total is the match count.
    std::map<Value, std::size_t> wanted;
    for (Value v : combination) ++wanted[v];
    const std::vector<std::pair<Value, std::size_t>> values(wanted.begin(), wanted.end());

    std::map<std::vector<std::size_t>, double> states;
    states[std::vector<std::size_t>(values.size(), 0)] = 1.0;
    for (const auto& r : ranges) {
        if (r.size() == 0) continue;
        const double p = 1.0 / static_cast<double>(r.size());

        std::map<std::vector<std::size_t>, double> next;
        for (const auto& [counts, prob] : states) {
            double other = 1.0;
            for (std::size_t j = 0; j < values.size(); ++j) {
                if (!r.contains(values[j].first)) continue;
                other -= p;
                auto bumped = counts;
                bumped[j] = std::min(bumped[j] + 1, values[j].second);
                next[bumped] += prob * p;
            }
            if (other > 0.0) next[counts] += prob * other;
        }
        states = std::move(next);
    }

    for (const auto& [counts, prob] : states) {
        std::size_t hits = 0;
        for (auto c : counts) hits += c;
        for (std::size_t k = 0; k <= std::min(hits, n); ++k) tail[k] += prob;
    }
    for (auto& t : tail) t = std::clamp(t, 0.0, 1.0);
    tail[0] = 1.0;
    return tail;
}

double PredictionValidator::random_baseline(std::size_t k,
                                            std::span<const Value> combination) const {
    const auto tail = random_baseline_tail(combination);
    return k < tail.size() ? tail[k] : 0.0;
}

// ─── validate ─────────────────────────────────────────────────────────────────

ValidationResult PredictionValidator::validate(std::span<const Prediction> predictions,
                                               std::span<const Draw> actual) const {
    if (predictions.empty()) return failed("no predictions provided");

    const std::size_t n = snapshot_->positions();
    std::vector<std::size_t> bucket_hits(n, 0);

    ValidationResult r;
    r.is_valid = true;

    double baseline_sum = 0.0;
    std::vector<double> expected_sum(n, 0.0);
    for (const auto& pred : predictions) {
        const std::size_t needed = std::max<std::size_t>(1, pred.expected_hits);
        const auto tail = random_baseline_tail(pred.combination);
        baseline_sum += needed < tail.size() ? tail[needed] : 0.0;
        for (std::size_t k = 1; k <= n; ++k) expected_sum[k - 1] += tail[k];

        for (const auto& draw : actual) {
            ++r.total_comparisons;
            const std::size_t m = count_matches(pred.combination, draw.values, config_.match_mode);
            for (std::size_t k = 1; k <= std::min(m, n); ++k) ++bucket_hits[k - 1];
            if (m >= needed) ++r.correct_comparisons;
        }
    }
    const auto count = static_cast<double>(predictions.size());
    r.baseline = baseline_sum / count;
    r.expected_hit_rates.reserve(n);
    for (double e : expected_sum) r.expected_hit_rates.push_back(e / count);

    const double total = static_cast<double>(r.total_comparisons);
    r.hit_rates.reserve(n);
    for (auto h : bucket_hits) {
        r.hit_rates.push_back(r.total_comparisons > 0 ? static_cast<double>(h) / total : 0.0);
    }
    if (r.total_comparisons == 0) return r;

    r.accuracy = static_cast<double>(r.correct_comparisons) / total;
    r.confidence_interval =
        stats::wilson_interval(r.correct_comparisons, r.total_comparisons, config_.confidence_level);

    const auto z = stats::binomial_z_test(r.correct_comparisons, r.total_comparisons, r.baseline);
    r.p_value        = z.p_value;
    r.is_significant = z.p_value < config_.alpha;

    const double factors[] = {
        r.accuracy,
        std::min(total / constants::CONFIDENCE_SATURATION, 1.0),
        r.is_significant ? 1.0 : 0.5,
        std::clamp(total / 100.0, 0.1, 1.0),
    };
    double conf = 1.0;
    for (double f : factors) conf *= f;
    r.confidence = std::clamp(conf, 0.0, 1.0);
    return r;
}

// ─── cross_validate ───────────────────────────────────────────────────────────

FoldResult PredictionValidator::run_fold(const PredictFn& predict, std::size_t index,
                                         std::size_t begin, std::size_t end) const {
    const auto all = snapshot_->draws();

    std::vector<Draw> train;
    train.reserve(all.size() - (end - begin));
    train.insert(train.end(), all.begin(), all.begin() + static_cast<std::ptrdiff_t>(begin));
    train.insert(train.end(), all.begin() + static_cast<std::ptrdiff_t>(end), all.end());
    const Snapshot train_snapshot(snapshot_->layout(), std::move(train));

    FoldResult fold{
        .index      = index,
        .test_begin = begin,
        .test_end   = end,
        .train_size = train_snapshot.size(),
    };

    std::string error;
    fold.result = guarded_validate(*this, predict, train_snapshot,
                                   all.subspan(begin, end - begin), error);
    if (!error.empty()) {
        log::warn("validation", "fold {} failed: {}", index + 1, error);
        fold.result = failed(std::move(error));
    }
    return fold;
}

CrossValidationReport
PredictionValidator::cross_validate(const PredictFn& predict, std::size_t k,
                                    const CancellationToken* token,
                                    const ProgressFn& progress) const {
    if (k == 0) throw std::invalid_argument("cross-validation needs at least one fold");

    const std::size_t n = snapshot_->size();
    if (n < 2 * k) throw InsufficientDataError(n, 2 * k);

    const std::size_t fold_size = n / k;
    const auto bounds = [&](std::size_t i) {
        const std::size_t begin = i * fold_size;
        const std::size_t end   = (i + 1 == k) ? n : begin + fold_size;
        return std::pair{begin, end};
    };

    CrossValidationReport report;
    report.folds.reserve(k);

    if (config_.parallel_folds) {
        // Sliding window: a new fold is launched only after the oldest one is
        // collected, so a cancel stops every fold not yet in flight.
        const std::size_t width =
            std::clamp<std::size_t>(config_.max_parallel_folds, 1, k);
        std::vector<std::future<FoldResult>> pending(k);
        std::size_t launched = 0;
        const auto launch = [&] {
            if (token) token->throw_if_cancelled();
            const auto slice = bounds(launched);
            pending[launched] = std::async(
                std::launch::async, [this, &predict, i = launched, slice] {
                    return run_fold(predict, i, slice.first, slice.second);
                });
            ++launched;
        };

        while (launched < width) launch();
        for (std::size_t i = 0; i < k; ++i) {
            report.folds.push_back(pending[i].get());
            if (progress) progress(i + 1, k);
            if (launched < k) launch();
        }
    } else {
        for (std::size_t i = 0; i < k; ++i) {
            if (token) token->throw_if_cancelled();
            const auto [begin, end] = bounds(i);
            report.folds.push_back(run_fold(predict, i, begin, end));
            if (progress) progress(i + 1, k);
        }
    }

    // ── Aggregate ─────────────────────────────────────────────────────────────
    std::vector<double> accuracies;
    accuracies.reserve(k);
    double conf_sum = 0.0;
    std::size_t valid = 0;
    for (const auto& f : report.folds) {
        accuracies.push_back(f.result.accuracy);
        if (!f.result.is_valid) continue;
        ++valid;
        conf_sum += f.result.confidence;

        const double acc = f.result.accuracy;
        if (!report.best_fold || acc > report.folds[*report.best_fold].result.accuracy) {
            report.best_fold = f.index;
        }
        if (!report.worst_fold || acc < report.folds[*report.worst_fold].result.accuracy) {
            report.worst_fold = f.index;
        }
    }

    report.mean_accuracy      = stats::mean(accuracies);
    report.std_dev_accuracy   = std::sqrt(stats::population_variance(accuracies));
    report.overall_confidence = valid > 0 ? conf_sum / static_cast<double>(valid) : 0.0;

    if (accuracies.size() >= constants::MIN_STABILITY_SAMPLES) {
        report.stability = TemporalStability{
            .autocorrelation = stats::lag1_autocorrelation(accuracies),
            .trend_p_value   = stats::mann_kendall_p(accuracies),
            .volatility      = stats::volatility(accuracies),
        };
    }
    return report;
}

// ─── ab_test ──────────────────────────────────────────────────────────────────

ABTestResult PredictionValidator::ab_test(const PredictFn& a, const PredictFn& b,
                                          std::span<const Draw> test_draws) const {
    std::set<std::string> held_out;
    for (const auto& d : test_draws) held_out.insert(d.date);

    std::vector<Draw> train;
    for (const auto& d : snapshot_->draws()) {
        if (!held_out.contains(d.date)) train.push_back(d);
    }
    const Snapshot train_snapshot(snapshot_->layout(), std::move(train));

    ABTestResult out;
    std::string error;
    out.a = guarded_validate(*this, a, train_snapshot, test_draws, error);
    if (!error.empty()) {
        log::warn("validation", "A/B predictor A failed: {}", error);
        out.a = failed(std::exchange(error, {}));
    }
    out.b = guarded_validate(*this, b, train_snapshot, test_draws, error);
    if (!error.empty()) {
        log::warn("validation", "A/B predictor B failed: {}", error);
        out.b = failed(std::move(error));
    }

    const auto z = stats::two_proportion_z_test(out.a.accuracy, out.a.total_comparisons,
                                                out.b.accuracy, out.b.total_comparisons);
    out.z              = z.z;
    out.p_value        = z.p_value;
    out.is_significant = z.p_value < config_.alpha;
    if (out.is_significant && out.a.accuracy != out.b.accuracy) {
        out.winner     = out.a.accuracy > out.b.accuracy ? ABWinner::A : ABWinner::B;
        out.confidence = 1.0 - out.p_value;
    }
    return out;
}

}  // namespace drawstat::validation
