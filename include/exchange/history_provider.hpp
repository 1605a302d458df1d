#pragma once

#include "../errors.hpp"
#include "../util/string_utils.hpp"
#include "market_data.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace quantcode {
namespace exchange {

/**
 * Price history source for the analyzer.
 *
 * fetch() returns daily bars, oldest first, covering at most
 * `lookback_days` calendar days ending at the newest available bar.
 * Any failure surfaces as UpstreamDataError.
 */
class IPriceHistoryProvider {
public:
    virtual ~IPriceHistoryProvider() = default;

    virtual std::vector<Bar> fetch(const std::string& ticker, int lookback_days) = 0;
};

/**
 * Drop bars older than lookback_days before the newest bar.
 * lookback_days <= 0 keeps everything. Input must be oldest first.
 */
inline std::vector<Bar> trim_to_lookback(std::vector<Bar> bars, int lookback_days) {
    if (lookback_days <= 0 || bars.empty())
        return bars;

    const Timestamp span = static_cast<Timestamp>(lookback_days) * MS_PER_DAY;
    const Timestamp newest = bars.back().timestamp;
    const Timestamp cutoff = newest > span ? newest - span : 0;

    auto first = std::find_if(bars.begin(), bars.end(), [cutoff](const Bar& b) { return b.timestamp > cutoff; });
    bars.erase(bars.begin(), first);
    return bars;
}

/**
 * Reads <directory>/<TICKER>.csv in the load_bars_csv format
 * (what fetch_history writes).
 */
class CsvHistoryProvider : public IPriceHistoryProvider {
public:
    explicit CsvHistoryProvider(std::string directory) : directory_(std::move(directory)) {}

    std::vector<Bar> fetch(const std::string& ticker, int lookback_days) override {
        const std::string symbol = util::normalize_ticker(ticker);
        if (symbol.empty()) {
            throw ValidationError("ticker is required", "ticker");
        }

        std::vector<Bar> bars;
        try {
            bars = load_bars_csv(path_for(symbol));
        } catch (const std::exception& e) {
            throw UpstreamDataError(e.what(), symbol);
        }
        if (bars.empty()) {
            throw UpstreamDataError("No price history for " + symbol, symbol);
        }
        return trim_to_lookback(std::move(bars), lookback_days);
    }

    std::string path_for(const std::string& symbol) const {
        if (directory_.empty())
            return symbol + ".csv";
        if (directory_.back() == '/')
            return directory_ + symbol + ".csv";
        return directory_ + "/" + symbol + ".csv";
    }

    const std::string& directory() const { return directory_; }

private:
    std::string directory_;
};

} // namespace exchange
} // namespace quantcode
