#include "../../include/indicators/macd.hpp"

namespace quantcode {
namespace indicators {

Macd::Macd(const Config& config) : config_(config) {
    if (config_.fast == 0 || config_.signal == 0) {
        throw ValidationError("MACD periods must be positive", config_.fast == 0 ? "fast" : "signal");
    }
    if (config_.fast >= config_.slow) {
        throw ValidationError("MACD fast period must be shorter than slow period", "fast");
    }
}

MacdSeries Macd::compute(const market::Series& series) const {
    const std::vector<double> closes = series.closes();
    const size_t n = closes.size();

    MacdSeries out;
    out.macd.assign(n, UNDEFINED);
    out.histogram.assign(n, UNDEFINED);

    const std::vector<double> ema_fast = ema_series(closes, config_.fast);
    const std::vector<double> ema_slow = ema_series(closes, config_.slow);

    // fast < slow, so the fast EMA is already seeded wherever the slow one is
    const size_t macd_start = config_.slow - 1;
    for (size_t t = macd_start; t < n; ++t) {
        out.macd[t] = ema_fast[t] - ema_slow[t];
    }

    out.signal_line = ema_series(out.macd, config_.signal, macd_start);
    for (size_t t = 0; t < n; ++t) {
        if (is_defined(out.signal_line[t])) {
            out.histogram[t] = out.macd[t] - out.signal_line[t];
        }
    }

    return out;
}

IndicatorResult Macd::analyze(const market::Series& series) const {
    require_bars(NAME, series, min_bars());

    const MacdSeries lines = compute(series);
    const size_t last = series.size() - 1;

    const double macd = lines.macd[last];
    const double signal = lines.signal_line[last];
    const double prev_macd = lines.macd[last - 1];
    const double prev_signal = lines.signal_line[last - 1];
    const double hist = lines.histogram[last];

    const char* trend = hist > 0 ? "Bullish" : (hist < 0 ? "Bearish" : "Neutral");

    IndicatorResult result;
    if (prev_macd <= prev_signal && macd > signal) {
        result = make_result(NAME, Signal::Buy, "MACD crossed above signal line - bullish crossover", trend);
    } else if (prev_macd >= prev_signal && macd < signal) {
        result = make_result(NAME, Signal::Sell, "MACD crossed below signal line - bearish crossover", trend);
    } else if (hist > 0) {
        result = make_result(NAME, Signal::Hold, "MACD above signal line - bullish momentum", trend);
    } else if (hist < 0) {
        result = make_result(NAME, Signal::Hold, "MACD below signal line - bearish momentum", trend);
    } else {
        result = make_result(NAME, Signal::Hold, "MACD on signal line - no momentum bias", trend);
    }

    result.raw_values = {
        {"macd", macd},
        {"signal_line", signal},
        {"histogram", hist},
        {"prev_histogram", lines.histogram[last - 1]},
    };
    return result;
}

} // namespace indicators
} // namespace quantcode
