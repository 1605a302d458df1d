#include "../../include/indicators/bollinger.hpp"

#include <cmath>
#include <cstdio>

namespace quantcode {
namespace indicators {

Bollinger::Bollinger(const Config& config) : config_(config) {
    if (config_.window < 2) {
        throw ValidationError("Bollinger window must be at least 2", "window");
    }
    if (!(config_.multiplier >= 0) || !std::isfinite(config_.multiplier)) {
        throw ValidationError("Bollinger multiplier must be a finite value >= 0", "multiplier");
    }
}

std::vector<BollingerPoint> Bollinger::compute(const market::Series& series) const {
    const std::vector<double> closes = series.closes();
    std::vector<BollingerPoint> out(closes.size());

    for (size_t end = config_.window; end <= closes.size(); ++end) {
        BollingerPoint& p = out[end - 1];
        p.middle = sma(closes, end, config_.window);
        double sd = sample_stddev(closes, end, config_.window);
        p.upper = p.middle + config_.multiplier * sd;
        p.lower = p.middle - config_.multiplier * sd;
    }

    return out;
}

double Bollinger::position_pct(double price, const BollingerPoint& band) {
    double width = band.width();
    if (width <= 0)
        return 50.0;
    return (price - band.lower) / width * 100.0;
}

IndicatorResult Bollinger::analyze(const market::Series& series) const {
    require_bars(NAME, series, min_bars());

    const BollingerPoint band = compute(series).back();
    const double price = series.latest_close();
    const double pct = position_pct(price, band);

    char buf[160];
    IndicatorResult result;
    if (price > band.upper) {
        std::snprintf(buf, sizeof(buf), "Close above upper band (%.1f%% of band) - overbought", pct);
        result = make_result(NAME, Signal::Sell, buf, "Above upper band");
    } else if (price < band.lower) {
        std::snprintf(buf, sizeof(buf), "Close below lower band (%.1f%% of band) - oversold", pct);
        result = make_result(NAME, Signal::Buy, buf, "Below lower band");
    } else {
        std::snprintf(buf, sizeof(buf), "Within bands at %.1f%% of band, %s middle band - mean reversion likely", pct,
                      price >= band.middle ? "above" : "below");
        result = make_result(NAME, Signal::Hold, buf, "Within bands");
    }

    result.raw_values = {
        {"upper", band.upper},
        {"middle", band.middle},
        {"lower", band.lower},
        {"position_pct", pct},
        {"bandwidth", band.width()},
    };
    return result;
}

} // namespace indicators
} // namespace quantcode
