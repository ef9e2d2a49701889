/// @file src/core/log.cpp
/// @brief stderr sink for drawstat::log.

#include "drawstat/log.hpp"

#include <atomic>
#include <cstdio>
#include <exception>

namespace drawstat::log {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::Warn)};

constexpr const char* level_name(Level at) noexcept {
    switch (at) {
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Quiet: break;
    }
    return "";
}

}  // namespace

void set_level(Level at) noexcept {
    g_level.store(static_cast<int>(at), std::memory_order_relaxed);
}

Level level() noexcept {
    return static_cast<Level>(g_level.load(std::memory_order_relaxed));
}

void emit(Level at, std::string_view module, std::string_view message) noexcept {
    try {
        fmt::print(stderr, "[drawstat:{}] {}: {}\n", module, level_name(at), message);
    } catch (const std::exception& e) {
        // fmt reports stream failures as fmt::system_error; fall back to stdio.
        std::fputs("[drawstat] log write failed: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputc('\n', stderr);
    }
}

}  // namespace drawstat::log
