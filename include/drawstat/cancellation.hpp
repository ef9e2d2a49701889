#pragma once

/// @file include/drawstat/cancellation.hpp
/// @brief Cooperative cancellation flag shared between a caller and
///        long-running work (cross-validation folds, correlation sweeps).

#include "drawstat/errors.hpp"

#include <atomic>
#include <cstddef>
#include <functional>

namespace drawstat {

/// Set once by the caller; polled by the worker between units of work.
/// Cancellation is never observed mid-computation.
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] bool cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    /// Throws CancelledError if cancel() has been called.
    void throw_if_cancelled() const {
        if (cancelled()) throw CancelledError{};
    }

private:
    std::atomic<bool> cancelled_{false};
};

/// Progress callback: (completed units, total units).
using ProgressFn = std::function<void(std::size_t, std::size_t)>;

}  // namespace drawstat
