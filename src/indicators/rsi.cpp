#include "../../include/indicators/rsi.hpp"

#include <cstdio>

namespace quantcode {
namespace indicators {

Rsi::Rsi(const Config& config) : config_(config) {
    if (config_.period == 0) {
        throw ValidationError("RSI period must be positive", "period");
    }
    if (!(config_.oversold >= 0 && config_.oversold < config_.overbought && config_.overbought <= 100)) {
        throw ValidationError("RSI thresholds must satisfy 0 <= oversold < overbought <= 100", "oversold");
    }
}

double Rsi::from_averages(double avg_gain, double avg_loss) {
    if (avg_loss == 0)
        return 100.0;
    double rs = avg_gain / avg_loss;
    return 100.0 - 100.0 / (1.0 + rs);
}

RsiSeries Rsi::compute(const market::Series& series) const {
    const std::vector<double> closes = series.closes();
    const size_t n = closes.size();
    const size_t period = config_.period;

    RsiSeries out;
    out.rsi.assign(n, UNDEFINED);
    out.avg_gain.assign(n, UNDEFINED);
    out.avg_loss.assign(n, UNDEFINED);
    if (n < period + 1)
        return out;

    // Seed: simple average of changes 1..period
    double gain = 0;
    double loss = 0;
    for (size_t i = 1; i <= period; ++i) {
        double change = closes[i] - closes[i - 1];
        if (change > 0)
            gain += change;
        else
            loss -= change;
    }
    gain /= static_cast<double>(period);
    loss /= static_cast<double>(period);

    out.avg_gain[period] = gain;
    out.avg_loss[period] = loss;
    out.rsi[period] = from_averages(gain, loss);

    for (size_t i = period + 1; i < n; ++i) {
        double change = closes[i] - closes[i - 1];
        gain = wilder_step(gain, change > 0 ? change : 0.0, period);
        loss = wilder_step(loss, change < 0 ? -change : 0.0, period);
        out.avg_gain[i] = gain;
        out.avg_loss[i] = loss;
        out.rsi[i] = from_averages(gain, loss);
    }

    return out;
}

IndicatorResult Rsi::analyze(const market::Series& series) const {
    require_bars(NAME, series, min_bars());

    const RsiSeries lines = compute(series);
    const size_t last = series.size() - 1;
    const double rsi = lines.rsi[last];

    char buf[128];
    IndicatorResult result;
    if (rsi < config_.oversold) {
        std::snprintf(buf, sizeof(buf), "RSI at %.2f (Oversold, below %.0f) - potential bounce", rsi, config_.oversold);
        result = make_result(NAME, Signal::Buy, buf, "Oversold");
    } else if (rsi > config_.overbought) {
        std::snprintf(buf, sizeof(buf), "RSI at %.2f (Overbought, above %.0f) - potential pullback", rsi,
                      config_.overbought);
        result = make_result(NAME, Signal::Sell, buf, "Overbought");
    } else {
        std::snprintf(buf, sizeof(buf), "RSI at %.2f (Neutral) - no extreme reading", rsi);
        result = make_result(NAME, Signal::Hold, buf, "Neutral");
    }

    result.raw_values = {
        {"rsi", rsi},
        {"avg_gain", lines.avg_gain[last]},
        {"avg_loss", lines.avg_loss[last]},
    };
    return result;
}

} // namespace indicators
} // namespace quantcode
