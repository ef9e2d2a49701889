#pragma once

/// @file include/drawstat/cache.hpp
/// @brief Memoising result store bounded by entry count, memory and TTL.
///
/// # Module: Bounded Result Cache
///
/// ## Responsibility
/// Hold derived results keyed by `"<kind>:<params>"` so repeated queries on
/// the same snapshot skip recomputation.
///
/// ## Eviction
/// Each entry's size is estimated as two bytes per character of its key plus
/// its serialized value. Before an insert:
///   1. a replaced key releases its old size
///   2. least-recently-accessed entries are evicted until the new entry fits
///      the memory budget
///   3. if the cache is at `max_entries`, exactly one LRU entry is evicted
/// An entry larger than the whole memory budget is rejected and counted.
/// Expiry is lazy: `get`/`has` drop entries older than `ttl`.
///
/// ## Guarantees
/// - `size() ≤ max_entries` and `memory_usage() ≤ max_memory_bytes` always
/// - O(1) LRU eviction (recency list + iterator index)
/// - Every operation is serialised by one mutex; none throws except on
///   allocation failure

#include "drawstat/constants.hpp"
#include "drawstat/correlation.hpp"
#include "drawstat/position_analyzer.hpp"
#include "drawstat/scoring.hpp"
#include "drawstat/transition.hpp"
#include "drawstat/validation.hpp"

#include <Eigen/Dense>

#include <chrono>
#include <cstddef>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace drawstat::cache {

// ─── Values and keys ──────────────────────────────────────────────────────────

/// Every cacheable computation result.
using CacheValue = std::variant<
    analysis::PositionStatMap,
    analysis::PositionSummary,
    std::vector<analysis::PatternStat>,
    std::vector<analysis::Correlation>,
    Eigen::MatrixXd,
    transition::TransitionTable,
    std::vector<transition::RankedTransition>,
    scoring::CandidateScore,
    std::vector<scoring::CandidateScore>,
    validation::ValidationResult>;

/// Compact JSON rendering of a value; drives the size estimate.
[[nodiscard]] std::string serialize(const CacheValue& value);

struct CacheKey {
    std::string kind;    ///< Computation kind, e.g. "position-stats"
    std::string params;  ///< Serialized parameters incl. snapshot identity

    [[nodiscard]] std::string str() const { return kind + ":" + params; }
};

// ─── Configuration and statistics ─────────────────────────────────────────────

struct CacheConfig {
    std::size_t               max_entries       = constants::DEFAULT_CACHE_ENTRIES;
    std::size_t               max_memory_bytes  = constants::DEFAULT_CACHE_BYTES;
    std::chrono::milliseconds ttl               = constants::DEFAULT_CACHE_TTL;
    std::chrono::milliseconds stale_after       = constants::DEFAULT_STALE_AFTER;
    std::size_t               large_entry_bytes = constants::LARGE_ENTRY_BYTES;
    std::chrono::milliseconds large_stale_after = constants::DEFAULT_LARGE_STALE_AFTER;
};

struct CacheStats {
    std::size_t size                 = 0;
    std::size_t max_size             = 0;
    std::size_t memory_usage         = 0;
    std::size_t max_memory           = 0;
    double      memory_usage_percent = 0.0;
    double      hit_rate             = 0.0;  ///< hits / (hits + misses)
    std::size_t hits                 = 0;
    std::size_t misses               = 0;
    std::size_t evictions            = 0;    ///< Memory and LRU evictions
    std::size_t expirations          = 0;    ///< TTL removals
    std::size_t rejected             = 0;    ///< Entries larger than the budget
    double      average_age_ms       = 0.0;
    std::map<std::string, std::size_t> kind_distribution;
};

struct OptimizeResult {
    std::size_t removed      = 0;
    std::size_t kept         = 0;
    std::size_t memory_freed = 0;
};

struct CacheEntryInfo {
    std::string               key;
    std::size_t               size_bytes   = 0;
    std::size_t               access_count = 0;
    std::chrono::milliseconds age{0};   ///< Since insertion
    std::chrono::milliseconds idle{0};  ///< Since last access
};

// ─── ResultCache ──────────────────────────────────────────────────────────────

class ResultCache {
public:
    using Clock     = std::chrono::steady_clock;
    using ClockFn   = std::function<Clock::time_point()>;
    using ValuePtr  = std::shared_ptr<const CacheValue>;

    /// `clock` defaults to steady_clock::now; tests inject a manual clock.
    explicit ResultCache(CacheConfig config = CacheConfig{}, ClockFn clock = {});

    ResultCache(const ResultCache&)            = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    /// Insert or replace. Returns false when the entry alone exceeds the
    /// memory budget (or max_entries is 0) and was rejected.
    bool set(const CacheKey& key, CacheValue value);

    /// Lazy-expiring lookup; bumps recency and access count on a hit.
    [[nodiscard]] ValuePtr get(const CacheKey& key);

    /// Typed lookup; a hit holding another alternative counts as a miss.
    template <typename T>
    [[nodiscard]] std::optional<T> get_as(const CacheKey& key) {
        const auto v = get(key);
        if (!v) return std::nullopt;
        if (const auto* p = std::get_if<T>(v.get())) return *p;
        return std::nullopt;
    }

    /// Return the cached T for `key`, or compute, store and return it.
    /// `compute` runs without the cache lock held.
    template <typename T, typename F>
    [[nodiscard]] T get_or_compute(const CacheKey& key, F&& compute) {
        if (auto hit = get_as<T>(key)) return std::move(*hit);
        T value = std::forward<F>(compute)();
        set(key, CacheValue{value});
        return value;
    }

    /// Presence check with lazy expiry; does not touch recency.
    [[nodiscard]] bool has(const CacheKey& key);

    void clear();

    /// Remove every expired entry. Returns the number removed.
    std::size_t clear_expired();

    /// Drop long-idle entries: those idle beyond `stale_after` with at most
    /// one access, and those above `large_entry_bytes` idle beyond
    /// `large_stale_after`.
    OptimizeResult optimize();

    [[nodiscard]] CacheStats stats() const;

    /// Entries from least to most recently accessed.
    [[nodiscard]] std::vector<CacheEntryInfo> debug_entries() const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t memory_usage() const;
    [[nodiscard]] const CacheConfig& config() const noexcept { return config_; }

    /// Estimated bytes for an entry: 2 × (key length + serialized length).
    [[nodiscard]] static std::size_t estimate_size(const std::string& key,
                                                   const CacheValue& value);

private:
    struct Entry {
        ValuePtr                         value;
        Clock::time_point                inserted_at;
        Clock::time_point                last_accessed;
        std::size_t                      access_count = 0;
        std::size_t                      size_bytes   = 0;
        std::list<std::string>::iterator recency;
    };

    using EntryMap = std::unordered_map<std::string, Entry>;

    [[nodiscard]] Clock::time_point now() const { return clock_(); }
    [[nodiscard]] bool expired(const Entry& e, Clock::time_point t) const noexcept;

    /// Erase under lock; returns the freed size.
    std::size_t erase(EntryMap::iterator it);

    void evict_lru();

    CacheConfig            config_;
    ClockFn                clock_;
    EntryMap               entries_;
    std::list<std::string> recency_;  ///< Front = least recently accessed
    std::size_t            memory_      = 0;
    std::size_t            hits_        = 0;
    std::size_t            misses_      = 0;
    std::size_t            evictions_   = 0;
    std::size_t            expirations_ = 0;
    std::size_t            rejected_    = 0;
    mutable std::mutex     mutex_;
};

}  // namespace drawstat::cache
