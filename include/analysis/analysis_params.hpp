#pragma once

#include "../config/defaults.hpp"
#include "../indicators/bollinger.hpp"
#include "../indicators/heiken_ashi.hpp"
#include "../indicators/macd.hpp"
#include "../indicators/rsi.hpp"
#include "../risk/position_sizer.hpp"

#include <algorithm>

namespace quantcode {
namespace analysis {

/**
 * Everything one analysis run depends on besides the bars.
 * Value type: copied into each batch task.
 */
struct AnalysisParams {
    indicators::HeikenAshiConfig heiken_ashi;
    indicators::BollingerConfig bollinger;
    indicators::MacdConfig macd;
    indicators::RsiConfig rsi;
    size_t swing_window = config::trend::SWING_WINDOW;

    risk::RiskConfig risk;
    bool include_trade_setup = true;

    // Calendar days requested from a price-history provider
    int lookback_days = config::data::LOOKBACK_DAYS;

    // Evaluate batch tickers concurrently (one std::async task per ticker)
    bool parallel_batch = false;

    // Bars needed for every voting indicator to produce a value
    size_t min_bars() const {
        return std::max({size_t(1), bollinger.window, macd.slow + macd.signal, rsi.period + 1});
    }
};

} // namespace analysis
} // namespace quantcode
