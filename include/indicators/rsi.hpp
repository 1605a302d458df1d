#pragma once

#include "indicator_result.hpp"
#include "../config/defaults.hpp"
#include "moving_average.hpp"

#include <vector>

namespace quantcode {
namespace indicators {

/**
 * RSI lines, index-aligned with the input series.
 * Defined from index `period` (the first `period` price changes seed
 * the averages).
 */
struct RsiSeries {
    std::vector<double> rsi;
    std::vector<double> avg_gain;
    std::vector<double> avg_loss;
};

struct RsiConfig {
    size_t period = config::rsi::PERIOD;
    double oversold = config::rsi::OVERSOLD;
    double overbought = config::rsi::OVERBOUGHT;
};

/**
 * Relative Strength Index (Wilder, 1978)
 *
 * RSI = 100 - 100 / (1 + avg_gain / avg_loss), 100 when avg_loss is 0.
 * Below oversold -> BUY, above overbought -> SELL, otherwise HOLD.
 */
class Rsi {
public:
    using Config = RsiConfig;
    static constexpr const char* NAME = "rsi";

    explicit Rsi(const Config& config = Config());

    size_t min_bars() const { return config_.period + 1; }

    RsiSeries compute(const market::Series& series) const;

    IndicatorResult analyze(const market::Series& series) const;

    static double from_averages(double avg_gain, double avg_loss);

    const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace indicators
} // namespace quantcode
