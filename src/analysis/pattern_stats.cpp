/// @file src/analysis/pattern_stats.cpp
/// @brief Gap statistics for categorical value classes.

#include "drawstat/position_analyzer.hpp"

#include "gap_series.hpp"

#include <array>
#include <cstdlib>
#include <fmt/format.h>

namespace drawstat::analysis {

namespace {

constexpr std::array<PatternCategory, PATTERN_CATEGORY_COUNT> ALL_CATEGORIES{
    PatternCategory::Even,       PatternCategory::Odd,
    PatternCategory::High,       PatternCategory::Low,
    PatternCategory::Prime,      PatternCategory::NonPrime,
    PatternCategory::LastDigit0, PatternCategory::LastDigit1,
    PatternCategory::LastDigit2, PatternCategory::LastDigit3,
    PatternCategory::LastDigit4, PatternCategory::LastDigit5,
    PatternCategory::LastDigit6, PatternCategory::LastDigit7,
    PatternCategory::LastDigit8, PatternCategory::LastDigit9,
};

constexpr int last_digit_of(PatternCategory c) noexcept {
    return static_cast<int>(c) - static_cast<int>(PatternCategory::LastDigit0);
}

}  // namespace

// ─── Category predicates ──────────────────────────────────────────────────────

bool is_prime(Value v) noexcept {
    if (v <= 1) return false;
    if (v <= 3) return true;
    if (v % 2 == 0 || v % 3 == 0) return false;
    for (Value i = 5; i <= v / i; i += 6) {
        if (v % i == 0 || v % (i + 2) == 0) return false;
    }
    return true;
}

bool matches(PatternCategory category, Value value, const ValueRange& range) noexcept {
    // Midpoint in doubled units to avoid rounding: 2v > min + max.
    const bool high = 2LL * value > static_cast<long long>(range.min) + range.max;

    switch (category) {
        case PatternCategory::Even:     return value % 2 == 0;
        case PatternCategory::Odd:      return value % 2 != 0;
        case PatternCategory::High:     return high;
        case PatternCategory::Low:      return !high;
        case PatternCategory::Prime:    return is_prime(value);
        case PatternCategory::NonPrime: return !is_prime(value);
        default:
            return std::abs(value % 10) == last_digit_of(category);
    }
}

std::string to_string(PatternCategory c) {
    switch (c) {
        case PatternCategory::Even:     return "even";
        case PatternCategory::Odd:      return "odd";
        case PatternCategory::High:     return "high";
        case PatternCategory::Low:      return "low";
        case PatternCategory::Prime:    return "prime";
        case PatternCategory::NonPrime: return "non-prime";
        default:
            return fmt::format("last-digit-{}", last_digit_of(c));
    }
}

// ─── PositionAnalyzer::analyze_patterns ───────────────────────────────────────

std::vector<PatternStat>
PositionAnalyzer::analyze_patterns(const Snapshot& snapshot, std::size_t position) const {
    std::vector<PatternStat> out;
    if (position >= snapshot.positions()) return out;

    const ValueRange range = snapshot.layout().ranges[position];
    out.reserve(ALL_CATEGORIES.size());

    std::vector<std::size_t> idx;
    for (const auto category : ALL_CATEGORIES) {
        idx.clear();
        for (std::size_t i = 0; i < snapshot.size(); ++i) {
            if (matches(category, snapshot.value_at(i, position), range)) idx.push_back(i);
        }
        auto g = detail::compute_gaps(idx, snapshot.size(), config_);

        PatternStat s;
        s.position          = position;
        s.category          = category;
        s.total_appearances = g.occurrences;
        s.current_gap       = g.current_gap;
        s.average_gap       = g.average_gap;
        s.max_gap           = g.max_gap;
        s.min_gap           = g.min_gap;
        s.skip_history      = std::move(g.gaps);
        s.is_hot            = g.is_hot;
        s.is_cold           = g.is_cold;
        s.trend             = g.trend;
        out.push_back(std::move(s));
    }
    return out;
}

}  // namespace drawstat::analysis
