#pragma once

#include "indicator_result.hpp"
#include "../config/defaults.hpp"

#include <vector>

namespace quantcode {
namespace indicators {

/**
 * Heiken-Ashi smoothed candle
 *
 * ha_close[i] = (open + high + low + close) / 4
 * ha_open[0]  = (open[0] + close[0]) / 2
 * ha_open[i]  = (ha_open[i-1] + ha_close[i-1]) / 2
 * ha_high[i]  = max(high, ha_open, ha_close)
 * ha_low[i]   = min(low, ha_open, ha_close)
 */
struct HeikenAshiBar {
    Price open = 0;
    Price high = 0;
    Price low = 0;
    Price close = 0;

    bool is_bullish() const { return close > open; }
    bool is_bearish() const { return close < open; }
};

struct HeikenAshiConfig {
    // |ha_open - ha_low| (or ha_high) at or below this counts as "no wick"
    double wick_epsilon = config::heiken_ashi::WICK_EPSILON;
};

/**
 * Heiken-Ashi decisive candle
 *
 * Latest candle:
 * - bullish with no lower wick -> BUY
 * - bearish with no upper wick -> SELL
 * - anything else (wicked candle, doji) -> HOLD
 */
class HeikenAshi {
public:
    using Config = HeikenAshiConfig;
    static constexpr const char* NAME = "heiken_ashi";

    explicit HeikenAshi(const Config& config = Config());

    size_t min_bars() const { return 1; }

    // One smoothed candle per input bar, oldest first
    std::vector<HeikenAshiBar> compute(const market::Series& series) const;

    IndicatorResult analyze(const market::Series& series) const;

    const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace indicators
} // namespace quantcode
