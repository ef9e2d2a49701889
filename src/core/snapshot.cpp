/// @file src/core/snapshot.cpp
/// @brief Snapshot, DrawLayout and InMemorySequenceStore.

#include "drawstat/snapshot.hpp"
#include "drawstat/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace drawstat {

namespace {

constexpr std::uint64_t FNV_OFFSET = 0xcbf29ce484222325ULL;
constexpr std::uint64_t FNV_PRIME  = 0x100000001b3ULL;

void fnv_mix(std::uint64_t& h, std::int64_t word) noexcept {
    auto u = static_cast<std::uint64_t>(word);
    for (int i = 0; i < 8; ++i) {
        h ^= (u & 0xffU);
        h *= FNV_PRIME;
        u >>= 8;
    }
}

void require_fits(const DrawLayout& layout, const Draw& draw) {
    if (!layout.accepts(draw.values)) {
        throw InvalidDrawError(fmt::format(
            "draw '{}' has {} values that do not fit a {}-position layout",
            draw.date, draw.values.size(), layout.positions()));
    }
}

bool date_before(const Draw& a, const Draw& b) noexcept { return a.date < b.date; }

}  // namespace

// ─── DrawLayout ───────────────────────────────────────────────────────────────

DrawLayout DrawLayout::uniform(std::size_t positions, Value min, Value max) {
    return DrawLayout{std::vector<ValueRange>(positions, ValueRange{min, max})};
}

bool DrawLayout::accepts(std::span<const Value> values) const noexcept {
    if (values.size() != ranges.size()) return false;
    for (std::size_t p = 0; p < values.size(); ++p) {
        if (!ranges[p].contains(values[p])) return false;
    }
    return true;
}

bool DrawLayout::operator==(const DrawLayout& other) const noexcept {
    if (ranges.size() != other.ranges.size()) return false;
    for (std::size_t p = 0; p < ranges.size(); ++p) {
        if (ranges[p].min != other.ranges[p].min ||
            ranges[p].max != other.ranges[p].max) {
            return false;
        }
    }
    return true;
}

// ─── Snapshot ─────────────────────────────────────────────────────────────────

Snapshot::Snapshot(DrawLayout layout, std::vector<Draw> draws)
    : layout_(std::move(layout))
    , draws_(std::move(draws))
{
    std::uint64_t h = FNV_OFFSET;
    fnv_mix(h, static_cast<std::int64_t>(layout_.positions()));
    for (const auto& r : layout_.ranges) {
        fnv_mix(h, r.min);
        fnv_mix(h, r.max);
    }
    for (const auto& d : draws_) {
        require_fits(layout_, d);
        for (Value v : d.values) fnv_mix(h, v);
    }
    fnv_mix(h, static_cast<std::int64_t>(draws_.size()));
    fingerprint_ = h;
}

std::vector<Value> Snapshot::position_series(std::size_t position) const {
    std::vector<Value> out;
    if (position >= layout_.positions()) return out;
    out.reserve(draws_.size());
    for (const auto& d : draws_) out.push_back(d.values[position]);
    return out;
}

// ─── SequenceStore ────────────────────────────────────────────────────────────

SnapshotPtr SequenceStore::snapshot(const DrawFilter& filter) const {
    return std::make_shared<const Snapshot>(layout(), draws(filter));
}

// ─── InMemorySequenceStore ────────────────────────────────────────────────────

InMemorySequenceStore::InMemorySequenceStore(DrawLayout layout, std::vector<Draw> draws)
    : layout_(std::move(layout))
    , draws_(std::move(draws))
{
    for (const auto& d : draws_) require_fits(layout_, d);
    std::stable_sort(draws_.begin(), draws_.end(), date_before);
}

std::vector<Draw> InMemorySequenceStore::draws(const DrawFilter& filter) const {
    std::lock_guard lock(mutex_);

    std::vector<Draw> out;
    out.reserve(draws_.size());
    std::copy_if(draws_.begin(), draws_.end(), std::back_inserter(out),
                 [&filter](const Draw& d) {
                     if (filter.from_date && d.date < *filter.from_date) return false;
                     if (filter.to_date && d.date > *filter.to_date) return false;
                     return true;
                 });

    if (filter.last_n && out.size() > *filter.last_n) {
        out.erase(out.begin(),
                  out.begin() + static_cast<std::ptrdiff_t>(out.size() - *filter.last_n));
    }
    return out;
}

void InMemorySequenceStore::append(Draw draw) {
    require_fits(layout_, draw);
    std::lock_guard lock(mutex_);
    const auto at = std::upper_bound(draws_.begin(), draws_.end(), draw, date_before);
    draws_.insert(at, std::move(draw));
}

std::size_t InMemorySequenceStore::size() const {
    std::lock_guard lock(mutex_);
    return draws_.size();
}

}  // namespace drawstat
