/// @file src/validation/report.cpp
/// @brief Plain-text rendering of validation results.

#include "drawstat/validation.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cmath>
#include <iterator>

namespace drawstat::validation {

std::vector<std::string> recommendations(const SignificanceReport& s) {
    std::vector<std::string> out;

    if (!s.accuracy_significant) {
        out.emplace_back("Accuracy is not significantly different from chance; "
                         "refine the prediction method.");
    } else if (s.accuracy_test.cohens_d < constants::SMALL_EFFECT_SIZE) {
        out.emplace_back("Accuracy is significant but the effect size is small.");
    } else {
        out.emplace_back("Accuracy is significant with a meaningful effect size.");
    }

    if (std::abs(s.stability.autocorrelation) > constants::HIGH_AUTOCORRELATION) {
        out.emplace_back("Fold accuracies are autocorrelated; results depend on the period tested.");
    }
    if (s.stability.volatility > constants::HIGH_VOLATILITY) {
        out.emplace_back("Fold accuracies are volatile; the method is unstable across periods.");
    }

    std::vector<std::string> significant;
    for (const auto& b : s.buckets) {
        if (b.is_significant) significant.push_back(fmt::format("{}+", b.min_matches));
    }
    if (!significant.empty()) {
        out.push_back(fmt::format("Significant hit rates for: {}", fmt::join(significant, ", ")));
    }
    return out;
}

std::string render_report(const CrossValidationReport& report,
                          const SignificanceReport& s) {
    std::string out;
    auto it = std::back_inserter(out);

    fmt::format_to(it, "Cross-validation: {} folds\n", report.folds.size());
    fmt::format_to(it, "  mean accuracy   {:.4f} ± {:.4f}\n",
                   report.mean_accuracy, report.std_dev_accuracy);
    fmt::format_to(it, "  confidence      {:.4f}\n", report.overall_confidence);
    if (report.best_fold) fmt::format_to(it, "  best fold       {}\n", *report.best_fold + 1);
    if (report.worst_fold) fmt::format_to(it, "  worst fold      {}\n", *report.worst_fold + 1);

    fmt::format_to(it, "\nFolds:\n");
    for (const auto& f : report.folds) {
        const auto& r = f.result;
        if (!r.is_valid) {
            fmt::format_to(it, "  #{:<3} [{:>5}, {:>5})  invalid: {}\n",
                           f.index + 1, f.test_begin, f.test_end, r.error);
            continue;
        }
        fmt::format_to(it, "  #{:<3} [{:>5}, {:>5})  acc {:.4f}  CI [{:.4f}, {:.4f}]  p {:.4g}{}\n",
                       f.index + 1, f.test_begin, f.test_end, r.accuracy,
                       r.confidence_interval.lower, r.confidence_interval.upper,
                       r.p_value, r.is_significant ? " *" : "");
    }

    fmt::format_to(it, "\nSignificance:\n");
    fmt::format_to(it, "  baseline        {:.6f}\n", s.baseline);
    fmt::format_to(it, "  t               {:.4f} (dof {:.0f}, p {:.4g}, d {:.3f})\n",
                   s.accuracy_test.t, s.accuracy_test.dof, s.accuracy_test.p_value,
                   s.accuracy_test.cohens_d);
    fmt::format_to(it, "  mean CI         [{:.4f}, {:.4f}]\n",
                   s.accuracy_interval.lower, s.accuracy_interval.upper);
    for (const auto& b : s.buckets) {
        fmt::format_to(it, "  {}+ matches      observed {:.4f}  expected {:.4f}  p {:.4g}{}\n",
                       b.min_matches, b.observed_rate, b.expected_rate, b.p_value,
                       b.is_significant ? " *" : "");
    }
    fmt::format_to(it, "  stability       autocorr {:.3f}  trend p {:.4g}  volatility {:.4f}\n",
                   s.stability.autocorrelation, s.stability.trend_p_value, s.stability.volatility);

    fmt::format_to(it, "\nRecommendations:\n");
    for (const auto& line : recommendations(s)) fmt::format_to(it, "  - {}\n", line);
    return out;
}

}  // namespace drawstat::validation
