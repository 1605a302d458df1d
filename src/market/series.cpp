#include "../../include/market/series.hpp"
#include "../../include/errors.hpp"
#include "../../include/util/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace quantcode {
namespace market {

namespace {

bool valid_price(Price p) {
    return std::isfinite(p) && p > 0;
}

std::string bar_context(const Bar& bar, size_t index) {
    std::ostringstream oss;
    oss << "bar " << index << " (" << util::format_date(bar.timestamp) << ")";
    return oss.str();
}

} // namespace

Series::Series(std::string ticker, std::vector<Bar> bars) : ticker_(std::move(ticker)), bars_(std::move(bars)) {}

std::vector<Price> Series::closes() const {
    std::vector<Price> out;
    out.reserve(bars_.size());
    for (const auto& b : bars_) {
        out.push_back(b.close);
    }
    return out;
}

void validate_bar(const Bar& bar, size_t index, const std::string& ticker) {
    if (!valid_price(bar.open) || !valid_price(bar.high) || !valid_price(bar.low) || !valid_price(bar.close)) {
        throw InvalidBarError(bar_context(bar, index) + ": prices must be positive", index, ticker);
    }
    if (bar.high < bar.low) {
        throw InvalidBarError(bar_context(bar, index) + ": high below low", index, ticker);
    }
    if (bar.high < std::max(bar.open, bar.close)) {
        throw InvalidBarError(bar_context(bar, index) + ": high below open/close", index, ticker);
    }
    if (bar.low > std::min(bar.open, bar.close)) {
        throw InvalidBarError(bar_context(bar, index) + ": low above open/close", index, ticker);
    }
}

Series preprocess(const std::string& ticker, std::vector<Bar> bars, size_t min_bars) {
    if (bars.size() < min_bars) {
        std::ostringstream oss;
        oss << "Insufficient data for '" << ticker << "': need " << min_bars << " bars, got " << bars.size();
        throw InsufficientDataError(oss.str(), min_bars, bars.size(), ticker);
    }

    for (size_t i = 0; i < bars.size(); ++i) {
        validate_bar(bars[i], i, ticker);
        if (i > 0 && bars[i].timestamp <= bars[i - 1].timestamp) {
            const char* what = bars[i].timestamp == bars[i - 1].timestamp ? "duplicate timestamp" : "timestamp out of order";
            throw InvalidBarError(bar_context(bars[i], i) + ": " + what, i, ticker);
        }
    }

    return Series(ticker, std::move(bars));
}

} // namespace market
} // namespace quantcode
