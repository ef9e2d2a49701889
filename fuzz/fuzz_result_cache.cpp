/**
 * @file  fuzz_result_cache.cpp
 * @brief libFuzzer target for the bounded ResultCache
 *
 * Build:
 *   cmake -DDRAWSTAT_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_result_cache
 *
 * Run for 60 seconds:
 *   ./fuzz_result_cache -max_total_time=60
 *
 * Safety invariants verified after every operation:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. size() ≤ max_entries and memory_usage() ≤ max_memory_bytes.
 *   3. memory_usage() equals the sum of the entry sizes.
 *   4. A successful set() is immediately visible to has().
 *
 * Fuzzer strategy:
 *   Bytes 0-1 configure the cache (max_entries 1..16, memory budget
 *   256..16 KiB). Each following byte pair is one operation: the high two
 *   bits of the first byte pick set / get / has / tick-and-optimize, the low
 *   bits pick one of 64 keys, and the second byte sizes the stored value.
 */

#include <cassert>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <numeric>
#include <string>

#include "drawstat/cache.hpp"
#include "drawstat/log.hpp"

using namespace drawstat;
using namespace drawstat::cache;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 2) return 0;
    log::set_level(log::Level::Quiet);

    CacheConfig cfg;
    cfg.max_entries       = 1 + data[0] % 16;
    cfg.max_memory_bytes  = 256 + static_cast<std::size_t>(data[1]) * 64;
    cfg.ttl               = std::chrono::milliseconds(500);
    cfg.stale_after       = std::chrono::milliseconds(200);
    cfg.large_stale_after = std::chrono::milliseconds(100);
    cfg.large_entry_bytes = 512;

    auto now = std::make_shared<ResultCache::Clock::time_point>();
    ResultCache cache(cfg, [now] { return *now; });

    for (std::size_t i = 2; i + 1 < size; i += 2) {
        const uint8_t op = data[i] >> 6;
        const CacheKey key{"fuzz", std::to_string(data[i] & 0x3f)};

        switch (op) {
            case 0: {
                validation::ValidationResult v;
                v.hit_rates.assign(data[i + 1] % 64, 0.5);
                v.error.assign(data[i + 1] % 7, '"');
                if (cache.set(key, v)) assert(cache.has(key));  // Invariant 4
                break;
            }
            case 1:
                (void)cache.get(key);
                break;
            case 2:
                (void)cache.has(key);
                break;
            default:
                *now += std::chrono::milliseconds(data[i + 1]);
                (void)cache.optimize();
                (void)cache.clear_expired();
                break;
        }

        // Invariants 2 and 3
        assert(cache.size() <= cfg.max_entries);
        assert(cache.memory_usage() <= cfg.max_memory_bytes);
        const auto entries = cache.debug_entries();
        const auto accounted = std::accumulate(
            entries.begin(), entries.end(), std::size_t{0},
            [](std::size_t acc, const CacheEntryInfo& e) { return acc + e.size_bytes; });
        assert(cache.memory_usage() == accounted);
    }

    return 0;
}
