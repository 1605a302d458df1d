#include "../../include/indicators/heiken_ashi.hpp"

#include <algorithm>
#include <cmath>

namespace quantcode {
namespace indicators {

HeikenAshi::HeikenAshi(const Config& config) : config_(config) {
    if (!(config_.wick_epsilon >= 0)) {
        throw ValidationError("Heiken-Ashi wick epsilon must be >= 0", "wick_epsilon");
    }
}

std::vector<HeikenAshiBar> HeikenAshi::compute(const market::Series& series) const {
    std::vector<HeikenAshiBar> out;
    out.reserve(series.size());

    for (size_t i = 0; i < series.size(); ++i) {
        const auto& bar = series[i];
        HeikenAshiBar ha;
        ha.close = (bar.open + bar.high + bar.low + bar.close) / 4.0;
        if (i == 0) {
            ha.open = (bar.open + bar.close) / 2.0;
        } else {
            ha.open = (out[i - 1].open + out[i - 1].close) / 2.0;
        }
        ha.high = std::max({bar.high, ha.open, ha.close});
        ha.low = std::min({bar.low, ha.open, ha.close});
        out.push_back(ha);
    }

    return out;
}

IndicatorResult HeikenAshi::analyze(const market::Series& series) const {
    require_bars(NAME, series, min_bars());

    const HeikenAshiBar latest = compute(series).back();
    const double eps = config_.wick_epsilon;

    IndicatorResult result;
    if (latest.is_bullish()) {
        if (std::abs(latest.open - latest.low) <= eps) {
            result = make_result(NAME, Signal::Buy, "Decisive bullish candle (no lower wick) - strong upward momentum",
                                 "Bullish");
        } else {
            result = make_result(NAME, Signal::Hold, "Bullish candle with lower wick (ha_open above ha_low) - mixed signals",
                                 "Bullish");
        }
    } else if (latest.is_bearish()) {
        if (std::abs(latest.open - latest.high) <= eps) {
            result = make_result(NAME, Signal::Sell,
                                 "Decisive bearish candle (no upper wick) - strong downward momentum", "Bearish");
        } else {
            result = make_result(NAME, Signal::Hold,
                                 "Bearish candle with upper wick (ha_open below ha_high) - mixed signals", "Bearish");
        }
    } else {
        result = make_result(NAME, Signal::Hold, "Doji candle (ha_open equals ha_close) - market indecision", "Doji");
    }

    result.raw_values = {
        {"ha_open", latest.open},
        {"ha_high", latest.high},
        {"ha_low", latest.low},
        {"ha_close", latest.close},
    };
    return result;
}

} // namespace indicators
} // namespace quantcode
