/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for draw history.

#include "drawstat/data_loader.hpp"
#include "drawstat/log.hpp"

#include <charconv>
#include <fstream>
#include <new>
#include <sstream>

namespace drawstat::core {

namespace {

std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

/// Split on commas; tokens are trimmed.
std::vector<std::string_view> split_row(std::string_view line) {
    std::vector<std::string_view> out;
    std::size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        if (comma == std::string_view::npos) {
            out.push_back(trim(line.substr(start)));
            break;
        }
        out.push_back(trim(line.substr(start, comma - start)));
        start = comma + 1;
    }
    return out;
}

bool is_digits(std::string_view s) noexcept {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

bool is_skippable(std::string_view line) noexcept {
    return line.empty() || line.front() == '#';
}

}  // namespace

// ─── DataLoader::is_iso_date ──────────────────────────────────────────────────

bool DataLoader::is_iso_date(std::string_view s) noexcept {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return false;
    if (!is_digits(s.substr(0, 4)) || !is_digits(s.substr(5, 2)) ||
        !is_digits(s.substr(8, 2))) {
        return false;
    }
    const int month = (s[5] - '0') * 10 + (s[6] - '0');
    const int day   = (s[8] - '0') * 10 + (s[9] - '0');
    return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<Draw>
DataLoader::parse_row(std::string_view line, const DrawLayout& layout) noexcept {
    line = trim(line);
    if (is_skippable(line)) return std::nullopt;

    try {
        const auto fields = split_row(line);
        if (fields.size() != layout.positions() + 1) return std::nullopt;
        if (!is_iso_date(fields[0])) return std::nullopt;

        Draw draw;
        draw.date.assign(fields[0]);
        draw.values.reserve(layout.positions());

        for (std::size_t i = 1; i < fields.size(); ++i) {
            const auto tok = fields[i];
            Value v = 0;
            const auto [ptr, ec] = std::from_chars(tok.data(), tok.data() + tok.size(), v);
            if (ec != std::errc{} || ptr != tok.data() + tok.size()) {
                return std::nullopt;  // non-integer or trailing garbage
            }
            draw.values.push_back(v);
        }

        if (!layout.accepts(draw.values)) return std::nullopt;
        return draw;
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

// ─── DataLoader::parse_csv_string ─────────────────────────────────────────────

DrawTable
DataLoader::parse_csv_string(std::string_view csv_content, ValueRange range) noexcept {
    DrawTable table;
    try {
        bool header_seen = false;
        std::size_t line_no = 0;
        std::size_t start = 0;

        while (start <= csv_content.size()) {
            auto end = csv_content.find('\n', start);
            if (end == std::string_view::npos) end = csv_content.size();
            const auto line = trim(csv_content.substr(start, end - start));
            start = end + 1;
            ++line_no;

            if (is_skippable(line)) {
                if (end == csv_content.size()) break;
                continue;
            }

            if (!header_seen) {
                // date column plus one column per position
                const auto columns = split_row(line).size();
                table.layout = DrawLayout::uniform(columns > 0 ? columns - 1 : 0,
                                                   range.min, range.max);
                header_seen = true;
            } else if (auto draw = parse_row(line, table.layout)) {
                table.draws.push_back(std::move(*draw));
            } else {
                ++table.skipped_rows;
                log::warn("loader", "skipping malformed row {}", line_no);
            }

            if (end == csv_content.size()) break;
        }
    } catch (const std::exception& e) {
        log::warn("loader", "parse aborted: {}", e.what());
    }
    return table;
}

// ─── DataLoader::load_csv ─────────────────────────────────────────────────────

std::optional<DrawTable>
DataLoader::load_csv(const std::string& filepath, ValueRange range) noexcept {
    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            log::warn("loader", "cannot open '{}'", filepath);
            return std::nullopt;
        }
        std::ostringstream contents;
        contents << file.rdbuf();
        return parse_csv_string(contents.str(), range);
    } catch (const std::exception& e) {
        log::warn("loader", "failed reading '{}': {}", filepath, e.what());
        return std::nullopt;
    }
}

}  // namespace drawstat::core
