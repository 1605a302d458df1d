#pragma once

#include "indicator_result.hpp"
#include "../config/defaults.hpp"
#include "moving_average.hpp"

#include <vector>

namespace quantcode {
namespace indicators {

/**
 * MACD lines, index-aligned with the input series.
 *
 * macd is defined from index slow-1, signal_line and histogram from
 * index slow+signal-2. Earlier points are UNDEFINED.
 */
struct MacdSeries {
    std::vector<double> macd;
    std::vector<double> signal_line;
    std::vector<double> histogram;
};

struct MacdConfig {
    size_t fast = config::macd::FAST;
    size_t slow = config::macd::SLOW;
    size_t signal = config::macd::SIGNAL;
};

/**
 * MACD crossover
 *
 * Both EMAs are SMA-seeded. Only a crossover between the last two
 * points produces a vote:
 * - MACD moves from at/below to above the signal line -> BUY
 * - MACD moves from at/above to below the signal line -> SELL
 * - no crossover on the latest bar -> HOLD, whatever the gap
 */
class Macd {
public:
    using Config = MacdConfig;
    static constexpr const char* NAME = "macd";

    explicit Macd(const Config& config = Config());

    // Two signal-line points are needed to detect a crossover
    size_t min_bars() const { return config_.slow + config_.signal; }

    MacdSeries compute(const market::Series& series) const;

    IndicatorResult analyze(const market::Series& series) const;

    const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace indicators
} // namespace quantcode
