#pragma once

/// @file include/drawstat/transition.hpp
/// @brief First-order value→value transition model per position.
///
/// # Module: Transition Model
///
/// ## Responsibility
/// Count how often value `to` follows value `from` at the same position in
/// consecutive draws, normalise counts to probabilities per `from` bucket,
/// and rank next-value candidates for a current value.
///
/// ## Guarantees
/// - Probabilities in a non-empty bucket sum to 1 within 1e-9
/// - Buckets are ordered by `to_value`; rankings are deterministic
/// - A value with no recorded transitions ranks to an empty list
///
/// ## Skip adjustment
/// When the ranked value is the position's latest value, each extra draw it
/// has persisted (counting back from the second-to-last draw) reduces the
/// probability by 10%, floored at `max(0.1, 1 − skip·0.1)`.

#include "drawstat/snapshot.hpp"
#include "drawstat/types.hpp"

#include <cstddef>
#include <map>
#include <vector>

namespace drawstat::transition {

struct Transition {
    Value       to_value        = 0;
    std::size_t count           = 0;
    double      probability     = 0.0;
    std::size_t last_seen_index = 0;  ///< Index of the most recent "to" draw

    bool operator==(const Transition&) const = default;
};

/// from_value → transitions sorted by to_value.
using TransitionTable = std::map<Value, std::vector<Transition>>;

struct RankedTransition {
    Value       to_value             = 0;
    std::size_t count                = 0;
    double      probability          = 0.0;
    double      adjusted_probability = 0.0;  ///< probability · skip factor
    std::size_t last_seen_index      = 0;
    std::size_t skip_count           = 0;
};

class TransitionModel {
public:
    /// Transition table for one position. Empty when the position is outside
    /// the layout or the snapshot has fewer than two draws.
    [[nodiscard]] static TransitionTable build(const Snapshot& snapshot,
                                               std::size_t position);

    /// Up to `top_k` transitions out of `current`, ranked by adjusted
    /// probability desc, then last_seen_index desc, then to_value asc.
    /// `skip_count` is applied as given.
    [[nodiscard]] static std::vector<RankedTransition>
    predict_next(const TransitionTable& table, Value current, std::size_t top_k,
                 std::size_t skip_count = 0);

    /// As above, building the table from `snapshot`. The skip adjustment
    /// applies when `current` is the position's latest value.
    [[nodiscard]] static std::vector<RankedTransition>
    predict_next(const Snapshot& snapshot, std::size_t position, Value current,
                 std::size_t top_k);

    /// Consecutive draws before the latest one that repeat the latest value
    /// at `position`. 0 for fewer than two draws.
    [[nodiscard]] static std::size_t skip_count(const Snapshot& snapshot,
                                                std::size_t position) noexcept;

    [[nodiscard]] static double skip_factor(std::size_t skip_count) noexcept;

    /// P(to | from) from the table; 0 when unrecorded.
    [[nodiscard]] static double probability(const TransitionTable& table,
                                            Value from, Value to) noexcept;
};

}  // namespace drawstat::transition
