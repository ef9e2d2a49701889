#pragma once

/// @file include/drawstat/snapshot.hpp
/// @brief Immutable draw history and the Sequence Store interface.
///
/// # Module: Snapshot
///
/// ## Responsibility
/// Hold one ordered, validated sequence of draws together with its layout.
/// Every analysis, scoring and validation call reads a Snapshot; none of
/// them mutate it, so a `SnapshotPtr` may be shared freely across threads.
///
/// ## Guarantees
/// - Every draw matches the layout (arity and per-position range)
/// - `fingerprint()` is stable for equal layout + values and is used as the
///   snapshot-identity component of cache keys
///
/// ## NOT Responsible For
/// - Sorting draws (the SequenceStore hands them over in date order)
/// - Persistence

#include "drawstat/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace drawstat {

// ─── Snapshot ─────────────────────────────────────────────────────────────────

class Snapshot {
public:
    /// Throws InvalidDrawError if any draw does not fit `layout`.
    Snapshot(DrawLayout layout, std::vector<Draw> draws);

    [[nodiscard]] const DrawLayout& layout() const noexcept { return layout_; }
    [[nodiscard]] std::span<const Draw> draws() const noexcept { return draws_; }
    [[nodiscard]] std::size_t size() const noexcept { return draws_.size(); }
    [[nodiscard]] bool empty() const noexcept { return draws_.empty(); }
    [[nodiscard]] std::size_t positions() const noexcept { return layout_.positions(); }

    /// FNV-1a over the layout ranges and every draw's values.
    [[nodiscard]] std::uint64_t fingerprint() const noexcept { return fingerprint_; }

    /// Value at draw `index`, position `position`. Unchecked.
    [[nodiscard]] Value value_at(std::size_t index, std::size_t position) const noexcept {
        return draws_[index].values[position];
    }

    /// The chronological sequence of values at one position.
    /// Empty when `position` is outside the layout.
    [[nodiscard]] std::vector<Value> position_series(std::size_t position) const;

private:
    DrawLayout        layout_;
    std::vector<Draw> draws_;
    std::uint64_t     fingerprint_ = 0;
};

using SnapshotPtr = std::shared_ptr<const Snapshot>;

// ─── Sequence Store ───────────────────────────────────────────────────────────

/// Restricts the draws returned by a SequenceStore. Dates compare as ISO
/// strings; bounds are inclusive. `last_n` applies after the date bounds.
struct DrawFilter {
    std::optional<std::string> from_date;
    std::optional<std::string> to_date;
    std::optional<std::size_t> last_n;
};

/// Source of draw history. Implementations return draws in chronological
/// order (ascending date, stable for equal dates).
class SequenceStore {
public:
    virtual ~SequenceStore() = default;

    [[nodiscard]] virtual const DrawLayout& layout() const noexcept = 0;

    [[nodiscard]] virtual std::vector<Draw> draws(const DrawFilter& filter) const = 0;

    /// Build an immutable snapshot of the filtered history.
    [[nodiscard]] SnapshotPtr snapshot(const DrawFilter& filter = {}) const;
};

/// SequenceStore backed by a vector. `append` may be called concurrently
/// with `draws`.
class InMemorySequenceStore final : public SequenceStore {
public:
    /// Draws are stable-sorted by date. Throws InvalidDrawError on a draw
    /// that does not fit `layout`.
    explicit InMemorySequenceStore(DrawLayout layout, std::vector<Draw> draws = {});

    [[nodiscard]] const DrawLayout& layout() const noexcept override { return layout_; }

    [[nodiscard]] std::vector<Draw> draws(const DrawFilter& filter) const override;

    /// Insert a draw at its chronological position (after equal dates).
    void append(Draw draw);

    [[nodiscard]] std::size_t size() const;

private:
    DrawLayout         layout_;
    std::vector<Draw>  draws_;
    mutable std::mutex mutex_;
};

}  // namespace drawstat
