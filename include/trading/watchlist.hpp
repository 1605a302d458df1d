#pragma once

#include "../util/string_utils.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace quantcode {
namespace trading {

/**
 * Watchlist storage interface
 */
class IWatchlistStore {
public:
    virtual ~IWatchlistStore() = default;

    virtual std::vector<std::string> get() const = 0;
    virtual void set(const std::vector<std::string>& tickers) = 0;
};

// Tickers are trimmed, upper-cased, de-duplicated; empties dropped
class InMemoryWatchlist : public IWatchlistStore {
public:
    InMemoryWatchlist() = default;
    explicit InMemoryWatchlist(const std::vector<std::string>& tickers) { set(tickers); }

    std::vector<std::string> get() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return tickers_;
    }

    void set(const std::vector<std::string>& tickers) override {
        std::vector<std::string> normalized;
        for (const auto& t : tickers) {
            std::string n = util::normalize_ticker(t);
            if (n.empty())
                continue;
            bool seen = false;
            for (const auto& existing : normalized) {
                if (existing == n) {
                    seen = true;
                    break;
                }
            }
            if (!seen)
                normalized.push_back(std::move(n));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        tickers_ = std::move(normalized);
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> tickers_;
};

} // namespace trading
} // namespace quantcode
