#include "../../include/indicators/primary_trend.hpp"

#include <cstddef>

namespace quantcode {
namespace indicators {

namespace {

template <typename Key, typename Better>
std::vector<SwingPoint> find_swings(const market::Series& series, size_t window, Key key, Better better) {
    std::vector<SwingPoint> out;
    if (window == 0 || series.size() < 2 * window + 1)
        return out;

    for (size_t i = window; i + window < series.size(); ++i) {
        const Price candidate = key(series[i]);
        bool extreme = true;
        for (size_t j = i - window; j <= i + window && extreme; ++j) {
            if (j != i && !better(candidate, key(series[j])))
                extreme = false;
        }
        if (extreme)
            out.push_back(SwingPoint{i, series[i].timestamp, candidate});
    }
    return out;
}

std::vector<SwingPoint> last_n(const std::vector<SwingPoint>& v, size_t n) {
    if (v.size() <= n)
        return v;
    return std::vector<SwingPoint>(v.end() - static_cast<std::ptrdiff_t>(n), v.end());
}

} // namespace

std::vector<SwingPoint> PrimaryTrend::swing_highs(const market::Series& series) const {
    return find_swings(
        series, window_, [](const market::Bar& b) { return b.high; }, [](Price a, Price b) { return a > b; });
}

std::vector<SwingPoint> PrimaryTrend::swing_lows(const market::Series& series) const {
    return find_swings(
        series, window_, [](const market::Bar& b) { return b.low; }, [](Price a, Price b) { return a < b; });
}

TrendReading PrimaryTrend::analyze(const market::Series& series) const {
    const auto highs = swing_highs(series);
    const auto lows = swing_lows(series);

    TrendReading reading;
    reading.highs = last_n(highs, 3);
    reading.lows = last_n(lows, 3);

    if (highs.size() < 2 || lows.size() < 2) {
        reading.trend = Trend::Sideways;
        reading.reason = "Insufficient swing points";
        return reading;
    }

    const Price last_high = highs[highs.size() - 1].price;
    const Price prev_high = highs[highs.size() - 2].price;
    const Price last_low = lows[lows.size() - 1].price;
    const Price prev_low = lows[lows.size() - 2].price;

    if (last_high > prev_high && last_low > prev_low) {
        reading.trend = Trend::Uptrend;
        reading.reason = "Higher highs and higher lows";
    } else if (last_high < prev_high && last_low < prev_low) {
        reading.trend = Trend::Downtrend;
        reading.reason = "Lower highs and lower lows";
    } else {
        reading.trend = Trend::Sideways;
        reading.reason = "Mixed swing structure";
    }
    return reading;
}

} // namespace indicators
} // namespace quantcode
