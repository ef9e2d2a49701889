#pragma once

/// @file include/drawstat/log.hpp
/// @brief Minimal leveled logging to stderr over {fmt}.
///
/// Lines are written as `[drawstat:<module>] <level>: <message>`. The core
/// logs only exceptional conditions (skipped CSV rows, failed folds, rejected
/// cache entries); hot paths do not log.

#include <fmt/format.h>

#include <string_view>
#include <utility>

namespace drawstat::log {

enum class Level : int {
    Quiet = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
};

/// Set the process-wide verbosity. Default is Level::Warn.
void set_level(Level level) noexcept;

[[nodiscard]] Level level() noexcept;

[[nodiscard]] inline bool enabled(Level at) noexcept {
    return static_cast<int>(level()) >= static_cast<int>(at);
}

/// Write one pre-formatted line. Never throws.
void emit(Level at, std::string_view module, std::string_view message) noexcept;

template <typename... Args>
void warn(std::string_view module, fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Warn)) {
        emit(Level::Warn, module, fmt::format(f, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void info(std::string_view module, fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Info)) {
        emit(Level::Info, module, fmt::format(f, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void debug(std::string_view module, fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Debug)) {
        emit(Level::Debug, module, fmt::format(f, std::forward<Args>(args)...));
    }
}

}  // namespace drawstat::log
