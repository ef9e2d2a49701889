/// @file src/transition/transition_model.cpp
/// @brief TransitionModel implementation.

#include "drawstat/transition.hpp"
#include "drawstat/constants.hpp"

#include <algorithm>

namespace drawstat::transition {

// ─── build ────────────────────────────────────────────────────────────────────

TransitionTable TransitionModel::build(const Snapshot& snapshot, std::size_t position) {
    TransitionTable table;
    if (position >= snapshot.positions() || snapshot.size() < 2) return table;

    // Count with a nested map so buckets come out ordered by to_value.
    std::map<Value, std::map<Value, Transition>> counts;
    for (std::size_t i = 1; i < snapshot.size(); ++i) {
        const Value from = snapshot.value_at(i - 1, position);
        const Value to   = snapshot.value_at(i, position);
        auto& t = counts[from][to];
        t.to_value = to;
        ++t.count;
        t.last_seen_index = i;
    }

    for (auto& [from, bucket] : counts) {
        std::size_t total = 0;
        for (const auto& [to, t] : bucket) total += t.count;

        auto& row = table[from];
        row.reserve(bucket.size());
        for (auto& [to, t] : bucket) {
            t.probability = static_cast<double>(t.count) / static_cast<double>(total);
            row.push_back(t);
        }
    }
    return table;
}

// ─── skip adjustment ──────────────────────────────────────────────────────────

std::size_t TransitionModel::skip_count(const Snapshot& snapshot,
                                        std::size_t position) noexcept {
    const std::size_t n = snapshot.size();
    if (position >= snapshot.positions() || n < 2) return 0;

    const Value last = snapshot.value_at(n - 1, position);
    std::size_t skips = 0;
    for (std::size_t i = n - 1; i-- > 0;) {
        if (snapshot.value_at(i, position) != last) break;
        ++skips;
    }
    return skips;
}

double TransitionModel::skip_factor(std::size_t skip_count) noexcept {
    return std::max(constants::SKIP_FACTOR_FLOOR,
                    1.0 - static_cast<double>(skip_count) * constants::SKIP_PENALTY);
}

double TransitionModel::probability(const TransitionTable& table,
                                    Value from, Value to) noexcept {
    const auto it = table.find(from);
    if (it == table.end()) return 0.0;
    for (const auto& t : it->second) {
        if (t.to_value == to) return t.probability;
    }
    return 0.0;
}

// ─── predict_next ─────────────────────────────────────────────────────────────

std::vector<RankedTransition>
TransitionModel::predict_next(const TransitionTable& table, Value current,
                              std::size_t top_k, std::size_t skip_count) {
    std::vector<RankedTransition> out;
    const auto it = table.find(current);
    if (it == table.end() || top_k == 0) return out;

    const double factor = skip_factor(skip_count);
    out.reserve(it->second.size());
    for (const auto& t : it->second) {
        out.push_back(RankedTransition{
            .to_value             = t.to_value,
            .count                = t.count,
            .probability          = t.probability,
            .adjusted_probability = t.probability * factor,
            .last_seen_index      = t.last_seen_index,
            .skip_count           = skip_count,
        });
    }

    std::sort(out.begin(), out.end(), [](const RankedTransition& a, const RankedTransition& b) {
        if (a.adjusted_probability != b.adjusted_probability) {
            return a.adjusted_probability > b.adjusted_probability;
        }
        if (a.last_seen_index != b.last_seen_index) {
            return a.last_seen_index > b.last_seen_index;
        }
        return a.to_value < b.to_value;
    });

    if (out.size() > top_k) out.resize(top_k);
    return out;
}

std::vector<RankedTransition>
TransitionModel::predict_next(const Snapshot& snapshot, std::size_t position,
                              Value current, std::size_t top_k) {
    if (position >= snapshot.positions() || snapshot.empty()) return {};

    const auto table = build(snapshot, position);
    const bool persisting = snapshot.value_at(snapshot.size() - 1, position) == current;
    return predict_next(table, current, top_k,
                        persisting ? skip_count(snapshot, position) : 0);
}

}  // namespace drawstat::transition
