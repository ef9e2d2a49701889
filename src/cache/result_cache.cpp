/// @file src/cache/result_cache.cpp
/// @brief ResultCache: TTL + LRU + memory-budget eviction.

#include "drawstat/cache.hpp"
#include "drawstat/log.hpp"

#include <algorithm>

namespace drawstat::cache {

namespace {

using std::chrono::duration_cast;
using std::chrono::milliseconds;

std::string kind_of(const std::string& key) {
    return key.substr(0, key.find(':'));
}

}  // namespace

ResultCache::ResultCache(CacheConfig config, ClockFn clock)
    : config_(config)
    , clock_(clock ? std::move(clock) : ClockFn{[] { return Clock::now(); }})
{}

std::size_t ResultCache::estimate_size(const std::string& key, const CacheValue& value) {
    return constants::BYTES_PER_CHAR * (key.size() + serialize(value).size());
}

bool ResultCache::expired(const Entry& e, Clock::time_point t) const noexcept {
    return t - e.inserted_at > config_.ttl;
}

// ─── Internal removal ─────────────────────────────────────────────────────────

std::size_t ResultCache::erase(EntryMap::iterator it) {
    const std::size_t freed = it->second.size_bytes;
    memory_ -= freed;
    recency_.erase(it->second.recency);
    entries_.erase(it);
    return freed;
}

void ResultCache::evict_lru() {
    if (recency_.empty()) return;
    erase(entries_.find(recency_.front()));
    ++evictions_;
}

// ─── set ──────────────────────────────────────────────────────────────────────

bool ResultCache::set(const CacheKey& key, CacheValue value) {
    std::string k = key.str();
    const std::size_t size = estimate_size(k, value);
    auto shared = std::make_shared<const CacheValue>(std::move(value));

    std::lock_guard lock(mutex_);

    if (size > config_.max_memory_bytes || config_.max_entries == 0) {
        ++rejected_;
        log::warn("cache", "rejected '{}' ({} bytes, budget {})",
                  k, size, config_.max_memory_bytes);
        return false;
    }

    if (auto it = entries_.find(k); it != entries_.end()) erase(it);

    while (memory_ + size > config_.max_memory_bytes && !recency_.empty()) evict_lru();
    if (entries_.size() >= config_.max_entries) evict_lru();

    const auto t = now();
    recency_.push_back(k);
    Entry e{
        .value         = std::move(shared),
        .inserted_at   = t,
        .last_accessed = t,
        .access_count  = 0,
        .size_bytes    = size,
        .recency       = std::prev(recency_.end()),
    };
    entries_.emplace(std::move(k), std::move(e));
    memory_ += size;
    return true;
}

// ─── get / has ────────────────────────────────────────────────────────────────

ResultCache::ValuePtr ResultCache::get(const CacheKey& key) {
    const std::string k = key.str();
    std::lock_guard lock(mutex_);

    auto it = entries_.find(k);
    if (it == entries_.end()) {
        ++misses_;
        return nullptr;
    }

    const auto t = now();
    if (expired(it->second, t)) {
        erase(it);
        ++expirations_;
        ++misses_;
        return nullptr;
    }

    auto& e = it->second;
    e.last_accessed = t;
    ++e.access_count;
    recency_.splice(recency_.end(), recency_, e.recency);
    ++hits_;
    return e.value;
}

bool ResultCache::has(const CacheKey& key) {
    const std::string k = key.str();
    std::lock_guard lock(mutex_);

    auto it = entries_.find(k);
    if (it == entries_.end()) return false;
    if (expired(it->second, now())) {
        erase(it);
        ++expirations_;
        return false;
    }
    return true;
}

// ─── Maintenance ──────────────────────────────────────────────────────────────

void ResultCache::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
    recency_.clear();
    memory_ = 0;
}

std::size_t ResultCache::clear_expired() {
    std::lock_guard lock(mutex_);
    const auto t = now();
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        auto next = std::next(it);
        if (expired(it->second, t)) {
            erase(it);
            ++removed;
        }
        it = next;
    }
    expirations_ += removed;
    return removed;
}

OptimizeResult ResultCache::optimize() {
    std::lock_guard lock(mutex_);
    const auto t = now();
    OptimizeResult out;
    for (auto it = entries_.begin(); it != entries_.end();) {
        auto next = std::next(it);
        const auto& e = it->second;
        const auto idle = t - e.last_accessed;
        const bool stale = idle > config_.stale_after && e.access_count <= 1;
        const bool large_idle = idle > config_.large_stale_after &&
                                e.size_bytes > config_.large_entry_bytes;
        if (stale || large_idle) {
            out.memory_freed += erase(it);
            ++out.removed;
        }
        it = next;
    }
    out.kept = entries_.size();
    return out;
}

// ─── Introspection ────────────────────────────────────────────────────────────

CacheStats ResultCache::stats() const {
    std::lock_guard lock(mutex_);
    const auto t = now();

    CacheStats s;
    s.size        = entries_.size();
    s.max_size    = config_.max_entries;
    s.memory_usage = memory_;
    s.max_memory  = config_.max_memory_bytes;
    s.memory_usage_percent = config_.max_memory_bytes > 0
        ? 100.0 * static_cast<double>(memory_) / static_cast<double>(config_.max_memory_bytes)
        : 0.0;
    s.hits        = hits_;
    s.misses      = misses_;
    s.hit_rate    = hits_ + misses_ > 0
        ? static_cast<double>(hits_) / static_cast<double>(hits_ + misses_)
        : 0.0;
    s.evictions   = evictions_;
    s.expirations = expirations_;
    s.rejected    = rejected_;

    double total_age = 0.0;
    for (const auto& [k, e] : entries_) {
        total_age += static_cast<double>(duration_cast<milliseconds>(t - e.inserted_at).count());
        ++s.kind_distribution[kind_of(k)];
    }
    s.average_age_ms = s.size > 0 ? total_age / static_cast<double>(s.size) : 0.0;
    return s;
}

std::vector<CacheEntryInfo> ResultCache::debug_entries() const {
    std::lock_guard lock(mutex_);
    const auto t = now();
    std::vector<CacheEntryInfo> out;
    out.reserve(entries_.size());
    for (const auto& k : recency_) {
        const auto& e = entries_.at(k);
        out.push_back(CacheEntryInfo{
            .key          = k,
            .size_bytes   = e.size_bytes,
            .access_count = e.access_count,
            .age          = duration_cast<milliseconds>(t - e.inserted_at),
            .idle         = duration_cast<milliseconds>(t - e.last_accessed),
        });
    }
    return out;
}

std::size_t ResultCache::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

std::size_t ResultCache::memory_usage() const {
    std::lock_guard lock(mutex_);
    return memory_;
}

}  // namespace drawstat::cache
