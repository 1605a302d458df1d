#pragma once

#include "../exchange/history_provider.hpp"
#include "../indicators/bollinger.hpp"
#include "../indicators/heiken_ashi.hpp"
#include "../indicators/macd.hpp"
#include "../indicators/primary_trend.hpp"
#include "../indicators/rsi.hpp"
#include "../logging/async_logger.hpp"
#include "../market/series.hpp"
#include "../risk/position_sizer.hpp"
#include "../trading/watchlist.hpp"
#include "analysis_params.hpp"
#include "analysis_result.hpp"

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace quantcode {
namespace analysis {

/**
 * Analyzer - ticker in, consensus recommendation out
 *
 * Pipeline per ticker:
 *   raw bars -> preprocess -> 4 voting indicators -> consensus
 *            -> primary trend + trade setup
 *
 * Stateless after construction; analyze() is const and safe to call
 * from several threads. Writes to the optional logger are serialized
 * here, so it stays single-producer as long as nothing else logs to it
 * concurrently. Batch workers never log; their outcomes are logged by
 * the calling thread.
 */
class Analyzer {
public:
    // Supplies raw bars for one ticker; must be thread-safe when
    // params.parallel_batch is set
    using SeriesFn = std::function<std::vector<exchange::Bar>(const std::string& ticker)>;

    /**
     * @throws ValidationError for inconsistent indicator or risk parameters
     */
    explicit Analyzer(const AnalysisParams& params = AnalysisParams(), logging::AsyncLogger* logger = nullptr);

    size_t min_bars() const { return params_.min_bars(); }

    /**
     * Analyze raw bars (oldest first).
     * @throws ValidationError for an empty ticker
     * @throws InsufficientDataError / InvalidBarError from preprocessing
     */
    ConsensusResult analyze(const std::string& ticker, std::vector<exchange::Bar> bars) const;

    // Analyze an already validated series
    ConsensusResult analyze(const market::Series& series) const;

    /**
     * Fetch params.lookback_days of history, then analyze.
     * @throws UpstreamDataError when the provider fails
     */
    ConsensusResult analyze(const std::string& ticker, exchange::IPriceHistoryProvider& provider) const;

    /**
     * Analyze many tickers with per-ticker error isolation.
     * Tickers are normalized and de-duplicated; never throws for a
     * failing ticker.
     */
    BatchResult batch_analyze(const std::vector<std::string>& tickers, const SeriesFn& series_fn) const;

    BatchResult batch_analyze(const std::vector<std::string>& tickers,
                              exchange::IPriceHistoryProvider& provider) const;

    // Batch over the tickers currently in the watchlist
    BatchResult batch_analyze(const trading::IWatchlistStore& watchlist,
                              exchange::IPriceHistoryProvider& provider) const;

    const AnalysisParams& params() const { return params_; }

private:
    AnalysisParams params_;
    indicators::HeikenAshi heiken_ashi_;
    indicators::Bollinger bollinger_;
    indicators::Macd macd_;
    indicators::Rsi rsi_;
    indicators::PrimaryTrend trend_;
    risk::PositionSizer sizer_;
    logging::AsyncLogger* logger_;
    mutable std::mutex log_mutex_; // AsyncLogger accepts one producer at a time

    // Pure pipeline steps: no logging, callable from worker threads
    ConsensusResult evaluate(const market::Series& series) const;
    ConsensusResult evaluate_bars(const std::string& ticker, std::vector<exchange::Bar> bars) const;
    BatchEntry run_one(const std::string& ticker, const SeriesFn& series_fn) const;

    void log_result(const ConsensusResult& result) const;
    void log_error(const ErrorInfo& error) const;
};

} // namespace analysis
} // namespace quantcode
