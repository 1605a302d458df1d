#pragma once

#include "indicator_result.hpp"
#include "../config/defaults.hpp"
#include "moving_average.hpp"

#include <vector>

namespace quantcode {
namespace indicators {

struct BollingerPoint {
    double upper = UNDEFINED;
    double middle = UNDEFINED;
    double lower = UNDEFINED;

    bool defined() const { return is_defined(middle); }
    double width() const { return upper - lower; }
};

/**
 * Bollinger Bands Configuration (John Bollinger, 1980s)
 */
struct BollingerConfig {
    size_t window = config::bollinger::WINDOW;         // SMA / stddev window, >= 2
    double multiplier = config::bollinger::MULTIPLIER; // k, >= 0
};

/**
 * Bollinger Bands mean-reversion reading
 *
 * middle = SMA(close, W), sd = sample stddev (ddof = 1) over W,
 * upper/lower = middle +- k * sd.
 *
 * Latest close above upper -> SELL (overbought), below lower -> BUY
 * (oversold), otherwise HOLD with the position inside the band.
 */
class Bollinger {
public:
    using Config = BollingerConfig;
    static constexpr const char* NAME = "bollinger_bands";

    explicit Bollinger(const Config& config = Config());

    size_t min_bars() const { return config_.window; }

    // Index-aligned with the series; first window-1 points undefined
    std::vector<BollingerPoint> compute(const market::Series& series) const;

    IndicatorResult analyze(const market::Series& series) const;

    /**
     * (price - lower) / (upper - lower) * 100. A zero-width band
     * (all closes equal) reads 50.
     */
    static double position_pct(double price, const BollingerPoint& band);

    const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace indicators
} // namespace quantcode
