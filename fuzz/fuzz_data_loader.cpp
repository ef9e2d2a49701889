/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for the CSV DataLoader and the analysis it feeds
 *
 * Build:
 *   cmake -DDRAWSTAT_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every accepted draw:
 *      a. has an ISO-8601 date
 *      b. has exactly layout.positions() values
 *      c. has every value inside the requested range
 *   3. A snapshot built from the accepted draws never throws, and position
 *      stats over it account for every draw.
 *   4. Transition rows over the snapshot sum to 1.
 *
 * Fuzzer strategy:
 *   The first byte selects the value range [0, 1 + b % 60]; the rest is CSV
 *   text. The parser must handle:
 *     • Binary garbage (null bytes, high bytes)
 *     • Missing or extra columns, empty cells, stray whitespace
 *     • Signs, exponents and overflow in numeric cells ("-1", "1e3", "99999999999")
 *     • CR / CRLF line endings and "#" comment lines
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "drawstat/data_loader.hpp"
#include "drawstat/log.hpp"
#include "drawstat/position_analyzer.hpp"
#include "drawstat/transition.hpp"

using namespace drawstat;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size == 0) return 0;
    log::set_level(log::Level::Quiet);

    const ValueRange range{0, 1 + static_cast<Value>(data[0] % 60)};
    const std::string_view csv{reinterpret_cast<const char*>(data + 1), size - 1};

    const auto table = core::DataLoader::parse_csv_string(csv, range);

    // Invariant 2
    for (const auto& d : table.draws) {
        assert(core::DataLoader::is_iso_date(d.date));
        assert(d.values.size() == table.layout.positions());
        for (Value v : d.values) assert(range.contains(v));
    }
    if (table.layout.positions() == 0) return 0;

    // Invariant 3
    const InMemorySequenceStore store(table.layout, table.draws);
    const auto snap = store.snapshot();
    assert(snap->size() == table.draws.size());

    const auto stats = analysis::PositionAnalyzer{}.analyze(*snap, 0);
    std::size_t total = 0;
    for (const auto& [value, s] : stats) {
        total += s.total_appearances;
        assert(s.current_gap <= snap->size());
        assert(!(s.is_hot && s.is_cold));
    }
    assert(total == snap->size());

    // Invariant 4
    for (const auto& [from, row] : transition::TransitionModel::build(*snap, 0)) {
        double sum = 0.0;
        for (const auto& t : row) sum += t.probability;
        assert(std::abs(sum - 1.0) < 1e-9);
    }

    return 0;
}
