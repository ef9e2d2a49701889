#pragma once

#include <chrono>
#include <cstddef>

/// @file include/drawstat/constants.hpp
/// @brief Thresholds and defaults shared by the drawstat modules.

namespace drawstat::constants {

// ─── Position Analyzer ────────────────────────────────────────────────────────

/// Hot if currentGap ≤ max(HOT_GAP_MIN, ⌊HOT_GAP_FRACTION · totalDraws⌋).
static constexpr std::size_t HOT_GAP_MIN      = 3;
static constexpr double      HOT_GAP_FRACTION = 0.10;

/// Cold if currentGap ≥ max(COLD_GAP_MIN, ⌊COLD_GAP_FRACTION · totalDraws⌋).
static constexpr std::size_t COLD_GAP_MIN      = 5;
static constexpr double      COLD_GAP_FRACTION = 0.20;

/// Trend compares the mean of the last TREND_WINDOW gaps with the
/// TREND_WINDOW before them; a relative change ≥ TREND_THRESHOLD is a trend.
static constexpr std::size_t TREND_WINDOW    = 3;
static constexpr double      TREND_THRESHOLD = 0.20;

// ─── Transition Model ─────────────────────────────────────────────────────────

/// Each draw a position has stayed on its value costs SKIP_PENALTY of the
/// transition probability, floored at SKIP_FACTOR_FLOOR.
static constexpr double SKIP_PENALTY      = 0.1;
static constexpr double SKIP_FACTOR_FLOOR = 0.1;

/// Tolerance for "probabilities sum to one".
static constexpr double PROBABILITY_TOLERANCE = 1e-9;

// ─── Correlator ───────────────────────────────────────────────────────────────

static constexpr double CORRELATION_MODERATE = 0.3;
static constexpr double CORRELATION_STRONG   = 0.7;

/// Minimum paired observations for a defined correlation (n − 2 ≥ 1 dof).
static constexpr std::size_t MIN_CORRELATION_SAMPLES = 3;

// ─── Scoring ──────────────────────────────────────────────────────────────────

/// Minimum snapshot size for combination search.
static constexpr std::size_t MIN_COMBINATION_DRAWS = 20;

/// hot/cold component for a value that is cold but overdue.
static constexpr double COLD_DUE_BONUS = 0.3;

/// A per-position signal counts towards confidence above this level.
static constexpr double SIGNAL_THRESHOLD = 0.5;

/// Values kept per position during combination search.
static constexpr std::size_t DEFAULT_BEAM_WIDTH = 4;

/// Draws inspected for box/straight hit counts.
static constexpr std::size_t BOX_STRAIGHT_WINDOW = 50;

// ─── Result Cache ─────────────────────────────────────────────────────────────

static constexpr std::size_t DEFAULT_CACHE_ENTRIES = 500;
static constexpr std::size_t DEFAULT_CACHE_BYTES   = 50 * 1024 * 1024;
static constexpr std::chrono::milliseconds DEFAULT_CACHE_TTL{60 * 60 * 1000};

/// optimize(): entries unaccessed this long with ≤ 1 access are dropped.
static constexpr std::chrono::milliseconds DEFAULT_STALE_AFTER{24 * 60 * 60 * 1000};

/// optimize(): entries above LARGE_ENTRY_BYTES unaccessed this long are dropped.
static constexpr std::chrono::milliseconds DEFAULT_LARGE_STALE_AFTER{60 * 60 * 1000};
static constexpr std::size_t LARGE_ENTRY_BYTES = 10'000;

/// Estimated bytes per serialized character.
static constexpr std::size_t BYTES_PER_CHAR = 2;

// ─── Validation ───────────────────────────────────────────────────────────────

static constexpr double DEFAULT_CONFIDENCE_LEVEL = 0.95;
static constexpr double SIGNIFICANCE_ALPHA       = 0.05;

/// Comparisons at which sample-size confidence saturates.
static constexpr double CONFIDENCE_SATURATION = 1000.0;

/// Folds in flight at once when folds run concurrently.
static constexpr std::size_t MAX_PARALLEL_FOLDS = 4;

/// Minimum sequence length for temporal-stability diagnostics.
static constexpr std::size_t MIN_STABILITY_SAMPLES = 5;

/// Report thresholds.
static constexpr double HIGH_AUTOCORRELATION = 0.3;
static constexpr double HIGH_VOLATILITY      = 0.1;
static constexpr double SMALL_EFFECT_SIZE    = 0.5;

}  // namespace drawstat::constants
