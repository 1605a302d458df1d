#pragma once

/**
 * Windowed statistics over price vectors.
 *
 * Undefined points (before a window fills) are NaN so every derived
 * vector stays index-aligned with its input series.
 */

#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

namespace quantcode {
namespace indicators {

constexpr double UNDEFINED = std::numeric_limits<double>::quiet_NaN();

inline bool is_defined(double v) { return !std::isnan(v); }

/**
 * Simple mean of values[end - period, end).
 * Caller guarantees period > 0 and end >= period.
 */
double sma(const std::vector<double>& values, size_t end, size_t period);

/**
 * Sample standard deviation (ddof = 1) of values[end - period, end).
 * Caller guarantees period >= 2 and end >= period.
 */
double sample_stddev(const std::vector<double>& values, size_t end, size_t period);

/**
 * EMA over values[start..], SMA-seeded.
 *
 * out[start + period - 1] = SMA of the first `period` values from `start`,
 * then out[t] = values[t] * a + out[t-1] * (1 - a), a = 2 / (period + 1).
 * Points before the seed are UNDEFINED. Returns all-UNDEFINED when the
 * window does not fit.
 */
std::vector<double> ema_series(const std::vector<double>& values, size_t period, size_t start = 0);

/**
 * Wilder smoothing step: (prev * (period - 1) + x) / period.
 */
inline double wilder_step(double prev, double x, size_t period) {
    return (prev * static_cast<double>(period - 1) + x) / static_cast<double>(period);
}

} // namespace indicators
} // namespace quantcode
