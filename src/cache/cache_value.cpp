/// @file src/cache/cache_value.cpp
/// @brief Compact JSON rendering of cached values.
///
/// The text is only used to estimate entry sizes, so it need not round-trip;
/// it mirrors the field layout of each result type.

#include "drawstat/cache.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <iterator>

namespace drawstat::cache {

namespace {

using Out = std::back_insert_iterator<std::string>;

template <class... Fs>
struct overloaded : Fs... { using Fs::operator()...; };
template <class... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

void write_escaped(Out out, std::string_view s) {
    *out++ = '"';
    for (char c : s) {
        if (c == '"' || c == '\\') *out++ = '\\';
        *out++ = c;
    }
    *out++ = '"';
}

template <typename T, typename F>
void write_array(Out out, const std::vector<T>& items, F&& write_one) {
    *out++ = '[';
    bool first = true;
    for (const auto& item : items) {
        if (!first) *out++ = ',';
        first = false;
        write_one(out, item);
    }
    *out++ = ']';
}

void write(Out out, const analysis::PositionStat& s) {
    fmt::format_to(out,
        R"({{"position":{},"value":{},"totalAppearances":{},"currentGap":{},)"
        R"("averageGap":{},"maxGap":{},"minGap":{},"lastSeenIndex":{},)"
        R"("skipHistory":[{}],"isHot":{},"isCold":{},"trend":"{}"}})",
        s.position, s.value, s.total_appearances, s.current_gap,
        s.average_gap, s.max_gap, s.min_gap,
        s.last_seen_index ? fmt::format("{}", *s.last_seen_index) : std::string{"null"},
        fmt::join(s.skip_history, ","), s.is_hot, s.is_cold, to_string(s.trend));
}

void write(Out out, const analysis::PositionStatMap& m) {
    *out++ = '{';
    bool first = true;
    for (const auto& [value, stat] : m) {
        if (!first) *out++ = ',';
        first = false;
        fmt::format_to(out, R"("{}":)", value);
        write(out, stat);
    }
    *out++ = '}';
}

void write(Out out, const analysis::PositionSummary& s) {
    fmt::format_to(out,
        R"({{"position":{},"totalDraws":{},"uniqueValues":{},"mostFrequentValue":{},)"
        R"("leastFrequentValue":{},"meanSkip":{},"medianSkip":{},"modeSkip":{},)"
        R"("variance":{},"stdDev":{},"minSkip":{},"maxSkip":{},"range":{}}})",
        s.position, s.total_draws, s.unique_values, s.most_frequent_value,
        s.least_frequent_value, s.mean_skip, s.median_skip, s.mode_skip,
        s.variance, s.std_dev, s.min_skip, s.max_skip, s.range);
}

void write(Out out, const analysis::PatternStat& s) {
    fmt::format_to(out,
        R"({{"position":{},"category":"{}","totalAppearances":{},"currentGap":{},)"
        R"("averageGap":{},"maxGap":{},"minGap":{},"skipHistory":[{}],)"
        R"("isHot":{},"isCold":{},"trend":"{}"}})",
        s.position, analysis::to_string(s.category), s.total_appearances, s.current_gap,
        s.average_gap, s.max_gap, s.min_gap, fmt::join(s.skip_history, ","),
        s.is_hot, s.is_cold, to_string(s.trend));
}

void write(Out out, const analysis::Correlation& c) {
    fmt::format_to(out,
        R"({{"positionA":{},"positionB":{},"coefficient":{},"strength":"{}",)"
        R"("significance":{},"sampleSize":{}}})",
        c.position_a, c.position_b, c.coefficient, to_string(c.strength),
        c.significance, c.sample_size);
}

void write(Out out, const Eigen::MatrixXd& m) {
    *out++ = '[';
    for (Eigen::Index r = 0; r < m.rows(); ++r) {
        if (r > 0) *out++ = ',';
        *out++ = '[';
        for (Eigen::Index c = 0; c < m.cols(); ++c) {
            if (c > 0) *out++ = ',';
            fmt::format_to(out, "{}", m(r, c));
        }
        *out++ = ']';
    }
    *out++ = ']';
}

void write(Out out, const transition::Transition& t) {
    fmt::format_to(out, R"({{"toValue":{},"count":{},"probability":{},"lastSeenIndex":{}}})",
                   t.to_value, t.count, t.probability, t.last_seen_index);
}

void write(Out out, const transition::TransitionTable& table) {
    *out++ = '{';
    bool first = true;
    for (const auto& [from, row] : table) {
        if (!first) *out++ = ',';
        first = false;
        fmt::format_to(out, R"("{}":)", from);
        write_array(out, row, [](Out o, const auto& t) { write(o, t); });
    }
    *out++ = '}';
}

void write(Out out, const transition::RankedTransition& t) {
    fmt::format_to(out,
        R"({{"toValue":{},"count":{},"probability":{},"adjustedProbability":{},)"
        R"("lastSeenIndex":{},"skipCount":{}}})",
        t.to_value, t.count, t.probability, t.adjusted_probability,
        t.last_seen_index, t.skip_count);
}

void write(Out out, const scoring::CandidateScore& s) {
    fmt::format_to(out,
        R"({{"combination":[{}],"due":{},"parity":{},"hotCold":{},"transition":{},)"
        R"("correlation":{},"total":{},"confidence":{}}})",
        fmt::join(s.combination, ","), s.due, s.parity, s.hot_cold, s.transition,
        s.correlation, s.total, s.confidence);
}

void write(Out out, const validation::ValidationResult& r) {
    fmt::format_to(out, R"({{"isValid":{},"error":)", r.is_valid);
    write_escaped(out, r.error);
    fmt::format_to(out,
        R"(,"accuracy":{},"confidence":{},"totalComparisons":{},"correctComparisons":{},)"
        R"("hitRates":[{}],"expectedHitRates":[{}],"confidenceInterval":[{},{}],)"
        R"("pValue":{},"isSignificant":{},"baseline":{}}})",
        r.accuracy, r.confidence, r.total_comparisons, r.correct_comparisons,
        fmt::join(r.hit_rates, ","), fmt::join(r.expected_hit_rates, ","),
        r.confidence_interval.lower,
        r.confidence_interval.upper, r.p_value, r.is_significant, r.baseline);
}

}  // namespace

std::string serialize(const CacheValue& value) {
    std::string text;
    Out out = std::back_inserter(text);
    std::visit(overloaded{
        [&](const std::vector<analysis::PatternStat>& v) {
            write_array(out, v, [](Out o, const auto& s) { write(o, s); });
        },
        [&](const std::vector<analysis::Correlation>& v) {
            write_array(out, v, [](Out o, const auto& c) { write(o, c); });
        },
        [&](const std::vector<transition::RankedTransition>& v) {
            write_array(out, v, [](Out o, const auto& t) { write(o, t); });
        },
        [&](const std::vector<scoring::CandidateScore>& v) {
            write_array(out, v, [](Out o, const auto& s) { write(o, s); });
        },
        [&](const auto& single) { write(out, single); },
    }, value);
    return text;
}

}  // namespace drawstat::cache
