#pragma once

/// @file include/drawstat/data_loader.hpp
/// @brief CSV loader for draw history.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV files of draws into a layout plus a vector of `Draw`.
/// Malformed or out-of-range rows are skipped with a warning; the loader
/// never crashes on bad input.
///
/// ## Expected CSV Format
/// ```
/// date,p1,p2,p3
/// 2024-01-01,3,7,1
/// 2024-01-02,0,9,4
/// ```
/// The first non-comment line is the header. The number of positions is the
/// header's column count minus one; every position shares one value range
/// supplied by the caller.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` when the file cannot be opened
/// - Skips individual bad rows rather than failing the entire load
/// - Rows keep file order; the SequenceStore sorts by date

#include "drawstat/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace drawstat::core {

/// Result of parsing one CSV document.
struct DrawTable {
    DrawLayout        layout;
    std::vector<Draw> draws;
    std::size_t       skipped_rows = 0;  ///< Data rows rejected as malformed
};

class DataLoader {
public:
    /// Load draws from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - A table with an empty layout if the file has no header
    [[nodiscard]] static std::optional<DrawTable>
    load_csv(const std::string& filepath, ValueRange range) noexcept;

    /// Parse draws from CSV text. Same format as `load_csv`.
    [[nodiscard]] static DrawTable
    parse_csv_string(std::string_view csv_content, ValueRange range) noexcept;

    /// Parse one data row against `layout`.
    /// Returns `nullopt` on a bad date, a non-integer token, wrong arity or
    /// an out-of-range value.
    [[nodiscard]] static std::optional<Draw>
    parse_row(std::string_view line, const DrawLayout& layout) noexcept;

    /// True for a `YYYY-MM-DD` string with month 01–12 and day 01–31.
    [[nodiscard]] static bool is_iso_date(std::string_view s) noexcept;
};

}  // namespace drawstat::core
