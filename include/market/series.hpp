#pragma once

#include "../exchange/market_data.hpp"
#include "../types.hpp"

#include <string>
#include <vector>

namespace quantcode {
namespace market {

using exchange::Bar;

/**
 * Series - validated, chronologically ordered daily bars of one ticker
 *
 * Only preprocess() builds a Series, so holding one means:
 * - every price is positive and finite
 * - low <= min(open, close), high >= max(open, close)
 * - timestamps strictly increase (no duplicates)
 *
 * Immutable after construction. Derived transforms (Heiken-Ashi, EMAs)
 * produce new sequences instead of touching the bars.
 */
class Series {
public:
    const std::string& ticker() const { return ticker_; }
    const std::vector<Bar>& bars() const { return bars_; }

    size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }

    const Bar& operator[](size_t i) const { return bars_[i]; }
    const Bar& at(size_t i) const { return bars_.at(i); }
    const Bar& front() const { return bars_.front(); }
    const Bar& back() const { return bars_.back(); }

    auto begin() const { return bars_.begin(); }
    auto end() const { return bars_.end(); }

    // Close prices, oldest first
    std::vector<Price> closes() const;

    Price latest_close() const { return bars_.back().close; }

private:
    Series(std::string ticker, std::vector<Bar> bars);

    friend Series preprocess(const std::string& ticker, std::vector<Bar> bars, size_t min_bars);

    std::string ticker_;
    std::vector<Bar> bars_;
};

/**
 * Validate a raw bar list and wrap it into a Series.
 *
 * @param ticker   Ticker the bars belong to (error context)
 * @param bars     Raw bars, expected oldest first
 * @param min_bars Minimum length required by the caller
 * @throws InsufficientDataError if bars.size() < min_bars
 * @throws InvalidBarError on a malformed bar or non-increasing timestamps
 */
Series preprocess(const std::string& ticker, std::vector<Bar> bars, size_t min_bars);

/**
 * Check one bar in isolation. Throws InvalidBarError naming the index.
 */
void validate_bar(const Bar& bar, size_t index, const std::string& ticker = "");

} // namespace market
} // namespace quantcode
