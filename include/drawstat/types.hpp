#pragma once

/// @file include/drawstat/types.hpp
/// @brief Shared primitive types for the drawstat engine.
///
/// All modules include this file. It defines the draw model (a fixed-size
/// tuple of bounded categorical values per draw), the layout describing each
/// position's value range, and the small enums shared across analysis,
/// scoring and validation.

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace drawstat {

/// A categorical value drawn at one position.
using Value = int;

/// An ordered candidate tuple, one value per position.
using Combination = std::vector<Value>;

// ─── Layout ───────────────────────────────────────────────────────────────────

/// Closed integer range [min, max] a position's value is drawn from.
struct ValueRange {
    Value min;
    Value max;

    /// Number of distinct values in the range (0 for an inverted range).
    [[nodiscard]] constexpr std::size_t size() const noexcept {
        return max < min ? 0 : static_cast<std::size_t>(max - min) + 1;
    }

    [[nodiscard]] constexpr bool contains(Value v) const noexcept {
        return v >= min && v <= max;
    }
};

/// Shape of a draw: the number of positions and each position's range.
/// Ranges may differ per position (e.g. five white balls plus a bonus ball).
struct DrawLayout {
    std::vector<ValueRange> ranges;

    /// Layout with `positions` slots all sharing [min, max].
    [[nodiscard]] static DrawLayout uniform(std::size_t positions,
                                            Value min, Value max);

    [[nodiscard]] std::size_t positions() const noexcept { return ranges.size(); }

    /// True when `values` has the layout's arity and every value is in range.
    [[nodiscard]] bool accepts(std::span<const Value> values) const noexcept;

    bool operator==(const DrawLayout& other) const noexcept;
};

// ─── Draw ─────────────────────────────────────────────────────────────────────

/// One recorded draw. Immutable once recorded.
struct Draw {
    std::string        date;    ///< ISO-8601 date (YYYY-MM-DD); orders draws
    std::vector<Value> values;  ///< One value per position
};

// ─── Shared enums ─────────────────────────────────────────────────────────────

/// Direction of a value's recent gap lengths.
enum class Trend {
    Stable,
    Increasing,  ///< Recent gaps are longer: appearing less often
    Decreasing,  ///< Recent gaps are shorter: appearing more often
};

enum class CorrelationStrength {
    Weak,
    Moderate,
    Strong,
};

/// How a predicted combination is matched against an actual draw.
enum class MatchMode {
    Straight,  ///< Same value at the same position
    Box,       ///< Same values in any order (multiset intersection)
};

[[nodiscard]] constexpr const char* to_string(Trend t) noexcept {
    switch (t) {
        case Trend::Increasing: return "increasing";
        case Trend::Decreasing: return "decreasing";
        case Trend::Stable:     break;
    }
    return "stable";
}

[[nodiscard]] constexpr const char* to_string(CorrelationStrength s) noexcept {
    switch (s) {
        case CorrelationStrength::Moderate: return "moderate";
        case CorrelationStrength::Strong:   return "strong";
        case CorrelationStrength::Weak:     break;
    }
    return "weak";
}

[[nodiscard]] constexpr const char* to_string(MatchMode m) noexcept {
    return m == MatchMode::Box ? "box" : "straight";
}

}  // namespace drawstat
