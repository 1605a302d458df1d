#pragma once

/**
 * IndicatorResult + Indicator concept
 *
 * Every voting indicator maps a Series to one IndicatorResult:
 * - signal:     BUY / SELL / HOLD for the latest bar
 * - score:      +1 / -1 / 0 (confluence contribution, always signal_score(signal))
 * - details:    human-readable explanation
 * - label:      categorical reading (candle type, RSI condition, ...)
 * - raw_values: the numbers the decision was based on
 *
 * Indicators are stateless: analyze() is const, allocates its own
 * buffers, and can run concurrently with any other indicator.
 */

#include "../errors.hpp"
#include "../market/series.hpp"
#include "../strategy/signal.hpp"

#include <concepts>
#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>

namespace quantcode {
namespace indicators {

using strategy::Signal;

struct IndicatorResult {
    std::string name;
    Signal signal = Signal::Hold;
    int score = 0;
    std::string details;
    std::string label;
    std::map<std::string, double> raw_values;

    double value(const std::string& key) const {
        auto it = raw_values.find(key);
        if (it == raw_values.end()) {
            throw std::out_of_range(name + ": no raw value '" + key + "'");
        }
        return it->second;
    }
};

inline IndicatorResult make_result(const char* name, Signal signal, std::string details, std::string label) {
    IndicatorResult r;
    r.name = name;
    r.signal = signal;
    r.score = strategy::signal_score(signal);
    r.details = std::move(details);
    r.label = std::move(label);
    return r;
}

/**
 * Indicator concept - all voting indicators must satisfy this.
 */
template <typename T>
concept Indicator = requires(const T& ind, const market::Series& series) {
    { T::NAME } -> std::convertible_to<const char*>;
    { ind.min_bars() } -> std::convertible_to<size_t>;
    { ind.analyze(series) } -> std::same_as<IndicatorResult>;
};

/**
 * Throw InsufficientDataError when an indicator's window does not fit.
 */
inline void require_bars(const char* indicator, const market::Series& series, size_t needed) {
    if (series.size() < needed) {
        throw InsufficientDataError(std::string(indicator) + " needs " + std::to_string(needed) + " bars, got " +
                                        std::to_string(series.size()),
                                    needed, series.size(), series.ticker());
    }
}

} // namespace indicators
} // namespace quantcode
