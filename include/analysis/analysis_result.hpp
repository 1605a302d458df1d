#pragma once

#include "../errors.hpp"
#include "../indicators/indicator_result.hpp"
#include "../indicators/primary_trend.hpp"
#include "../risk/position_sizer.hpp"
#include "../strategy/consensus.hpp"

#include <optional>
#include <string>
#include <vector>

namespace quantcode {
namespace analysis {

/**
 * Outcome of analyze() for one ticker.
 *
 * analyses is always in canonical order:
 *   heiken_ashi, bollinger_bands, macd, rsi
 */
struct ConsensusResult {
    std::string ticker;
    strategy::Signal final_signal = strategy::Signal::Hold;
    std::string confidence;
    int total_score = 0;
    Price latest_close = 0;
    Timestamp latest_timestamp = 0;
    strategy::VoteCounts votes;
    std::vector<indicators::IndicatorResult> analyses;
    indicators::TrendReading primary_trend;
    std::optional<risk::TradeSetup> trade_setup;

    // nullptr when no indicator by that name
    const indicators::IndicatorResult* indicator(const std::string& name) const {
        for (const auto& r : analyses) {
            if (r.name == name)
                return &r;
        }
        return nullptr;
    }
};

// Serializable snapshot of an AnalysisError
struct ErrorInfo {
    ErrorKind kind = ErrorKind::Validation;
    std::string message;
    std::string ticker;
    std::string parameter;

    static ErrorInfo from(const AnalysisError& e) {
        return ErrorInfo{e.kind(), e.what(), e.ticker(), e.parameter()};
    }
};

struct BatchEntry {
    std::string ticker;
    std::optional<ConsensusResult> result;
    std::optional<ErrorInfo> error;

    bool ok() const { return result.has_value(); }
};

/**
 * One entry per requested ticker, request order. Exactly one of
 * result / error is set in each entry.
 */
struct BatchResult {
    std::vector<BatchEntry> entries;

    const BatchEntry* find(const std::string& ticker) const {
        for (const auto& e : entries) {
            if (e.ticker == ticker)
                return &e;
        }
        return nullptr;
    }

    size_t successful() const {
        size_t n = 0;
        for (const auto& e : entries)
            n += e.ok() ? 1 : 0;
        return n;
    }

    size_t failed() const { return entries.size() - successful(); }
};

} // namespace analysis
} // namespace quantcode
