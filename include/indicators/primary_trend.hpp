#pragma once

#include "../market/series.hpp"
#include "../config/defaults.hpp"

#include <string>
#include <vector>

namespace quantcode {
namespace indicators {

enum class Trend { Uptrend, Downtrend, Sideways };

inline const char* trend_to_string(Trend t) {
    switch (t) {
    case Trend::Uptrend:
        return "Uptrend";
    case Trend::Downtrend:
        return "Downtrend";
    default:
        return "Sideways";
    }
}

struct SwingPoint {
    size_t index = 0;
    Timestamp timestamp = 0;
    Price price = 0;
};

struct TrendReading {
    Trend trend = Trend::Sideways;
    std::string reason;
    std::vector<SwingPoint> highs; // last three, oldest first
    std::vector<SwingPoint> lows;
};

/**
 * Primary trend from swing structure (Dow theory)
 *
 * A swing high is a bar whose high is strictly greater than every other
 * high within +-window bars; swing lows mirror that on lows. Bars closer
 * than `window` to either end are never swings.
 *
 * Last two highs and last two lows:
 * - higher high + higher low -> Uptrend
 * - lower high + lower low   -> Downtrend
 * - anything else            -> Sideways
 *
 * Informational only: does not vote in the consensus.
 */
class PrimaryTrend {
public:
    static constexpr size_t DEFAULT_WINDOW = config::trend::SWING_WINDOW;

    explicit PrimaryTrend(size_t window = DEFAULT_WINDOW) : window_(window) {}

    std::vector<SwingPoint> swing_highs(const market::Series& series) const;
    std::vector<SwingPoint> swing_lows(const market::Series& series) const;

    TrendReading analyze(const market::Series& series) const;

    size_t window() const { return window_; }

private:
    size_t window_;
};

} // namespace indicators
} // namespace quantcode
