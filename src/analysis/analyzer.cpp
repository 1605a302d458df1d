#include "../../include/analysis/analyzer.hpp"

#include "../../include/util/string_utils.hpp"

#include <algorithm>
#include <future>
#include <mutex>

namespace quantcode {
namespace analysis {

static_assert(indicators::Indicator<indicators::HeikenAshi>, "HeikenAshi must satisfy Indicator");
static_assert(indicators::Indicator<indicators::Bollinger>, "Bollinger must satisfy Indicator");
static_assert(indicators::Indicator<indicators::Macd>, "Macd must satisfy Indicator");
static_assert(indicators::Indicator<indicators::Rsi>, "Rsi must satisfy Indicator");

namespace {

template <indicators::Indicator I>
indicators::IndicatorResult run_indicator(const I& indicator, const market::Series& series) {
    try {
        return indicator.analyze(series);
    } catch (AnalysisError& e) {
        e.set_ticker(series.ticker());
        throw;
    }
}

std::string require_ticker(const std::string& raw) {
    std::string ticker = util::normalize_ticker(raw);
    if (ticker.empty()) {
        throw ValidationError("ticker is required", "ticker");
    }
    return ticker;
}

ErrorInfo error_for(const AnalysisError& e, const std::string& ticker) {
    ErrorInfo info = ErrorInfo::from(e);
    if (info.ticker.empty())
        info.ticker = ticker;
    return info;
}

} // namespace

Analyzer::Analyzer(const AnalysisParams& params, logging::AsyncLogger* logger)
    : params_(params)
    , heiken_ashi_(params.heiken_ashi)
    , bollinger_(params.bollinger)
    , macd_(params.macd)
    , rsi_(params.rsi)
    , trend_(params.swing_window)
    , sizer_(params.risk)
    , logger_(logger) {
    if (params_.swing_window == 0) {
        throw ValidationError("swing_window must be positive", "swing_window");
    }
}

// ============================================================================
// Pipeline
// ============================================================================

ConsensusResult Analyzer::evaluate(const market::Series& series) const {
    if (series.empty()) {
        throw InsufficientDataError("no bars to analyze", min_bars(), 0, series.ticker());
    }

    ConsensusResult result;
    result.ticker = series.ticker();
    result.latest_close = series.latest_close();
    result.latest_timestamp = series.back().timestamp;

    // Canonical order
    result.analyses.reserve(VOTING_INDICATORS);
    result.analyses.push_back(run_indicator(heiken_ashi_, series));
    result.analyses.push_back(run_indicator(bollinger_, series));
    result.analyses.push_back(run_indicator(macd_, series));
    result.analyses.push_back(run_indicator(rsi_, series));

    const strategy::ConsensusDecision decision = strategy::decide(result.analyses);
    result.final_signal = decision.signal;
    result.confidence = decision.confidence;
    result.total_score = decision.total_score;
    result.votes = decision.votes;

    result.primary_trend = trend_.analyze(series);
    if (params_.include_trade_setup) {
        result.trade_setup = sizer_.trade_setup(result.final_signal, series.back());
    }
    return result;
}

ConsensusResult Analyzer::evaluate_bars(const std::string& ticker, std::vector<exchange::Bar> bars) const {
    market::Series series = market::preprocess(ticker, std::move(bars), min_bars());
    return evaluate(series);
}

BatchEntry Analyzer::run_one(const std::string& ticker, const SeriesFn& series_fn) const {
    BatchEntry entry;
    entry.ticker = ticker;

    std::vector<exchange::Bar> bars;
    try {
        bars = series_fn(ticker);
    } catch (const AnalysisError& e) {
        entry.error = error_for(e, ticker);
        return entry;
    } catch (const std::exception& e) {
        // Provider failure of any kind is upstream from the analysis' point of view
        entry.error = error_for(UpstreamDataError(e.what(), ticker), ticker);
        return entry;
    }

    try {
        entry.result = evaluate_bars(ticker, std::move(bars));
    } catch (const AnalysisError& e) {
        entry.error = error_for(e, ticker);
    }
    return entry;
}

// ============================================================================
// Public API
// ============================================================================

ConsensusResult Analyzer::analyze(const std::string& ticker, std::vector<exchange::Bar> bars) const {
    const std::string symbol = require_ticker(ticker);
    try {
        ConsensusResult result = evaluate_bars(symbol, std::move(bars));
        log_result(result);
        return result;
    } catch (AnalysisError& e) {
        e.set_ticker(symbol);
        log_error(ErrorInfo::from(e));
        throw;
    }
}

ConsensusResult Analyzer::analyze(const market::Series& series) const {
    try {
        ConsensusResult result = evaluate(series);
        log_result(result);
        return result;
    } catch (AnalysisError& e) {
        e.set_ticker(series.ticker());
        log_error(ErrorInfo::from(e));
        throw;
    }
}

ConsensusResult Analyzer::analyze(const std::string& ticker, exchange::IPriceHistoryProvider& provider) const {
    const std::string symbol = require_ticker(ticker);

    std::vector<exchange::Bar> bars;
    try {
        bars = provider.fetch(symbol, params_.lookback_days);
    } catch (AnalysisError& e) {
        e.set_ticker(symbol);
        log_error(ErrorInfo::from(e));
        throw;
    } catch (const std::exception& e) {
        UpstreamDataError upstream(e.what(), symbol);
        log_error(ErrorInfo::from(upstream));
        throw upstream;
    }

    if (logger_) {
        std::lock_guard<std::mutex> lock(log_mutex_);
        LOGF_DEBUG(*logger_, Data, "%s: fetched %zu bars", symbol.c_str(), bars.size());
    }
    return analyze(symbol, std::move(bars));
}

BatchResult Analyzer::batch_analyze(const std::vector<std::string>& tickers, const SeriesFn& series_fn) const {
    std::vector<std::string> symbols;
    for (const auto& raw : tickers) {
        std::string t = util::normalize_ticker(raw);
        if (t.empty())
            continue;
        if (std::find(symbols.begin(), symbols.end(), t) == symbols.end())
            symbols.push_back(std::move(t));
    }

    BatchResult batch;
    batch.entries.reserve(symbols.size());

    if (params_.parallel_batch && symbols.size() > 1) {
        std::vector<std::future<BatchEntry>> futures;
        futures.reserve(symbols.size());
        for (const auto& t : symbols) {
            futures.push_back(std::async(std::launch::async, [this, &series_fn, t]() { return run_one(t, series_fn); }));
        }
        for (auto& f : futures) {
            batch.entries.push_back(f.get());
        }
    } else {
        for (const auto& t : symbols) {
            batch.entries.push_back(run_one(t, series_fn));
        }
    }

    // Logged here, on the caller's thread, once all workers are done
    for (const auto& entry : batch.entries) {
        if (entry.ok())
            log_result(*entry.result);
        else
            log_error(*entry.error);
    }
    if (logger_) {
        std::lock_guard<std::mutex> lock(log_mutex_);
        LOGF_INFO(*logger_, System, "batch: %zu requested, %zu ok, %zu failed", batch.entries.size(),
                  batch.successful(), batch.failed());
    }
    return batch;
}

BatchResult Analyzer::batch_analyze(const std::vector<std::string>& tickers,
                                    exchange::IPriceHistoryProvider& provider) const {
    // Providers are not required to be thread-safe
    std::mutex provider_mutex;
    const int lookback = params_.lookback_days;
    SeriesFn fetch = [&provider, &provider_mutex, lookback](const std::string& ticker) {
        std::lock_guard<std::mutex> lock(provider_mutex);
        return provider.fetch(ticker, lookback);
    };
    return batch_analyze(tickers, fetch);
}

BatchResult Analyzer::batch_analyze(const trading::IWatchlistStore& watchlist,
                                    exchange::IPriceHistoryProvider& provider) const {
    return batch_analyze(watchlist.get(), provider);
}

// ============================================================================
// Logging
// ============================================================================

void Analyzer::log_result(const ConsensusResult& result) const {
    if (!logger_)
        return;
    std::lock_guard<std::mutex> lock(log_mutex_);

    for (const auto& r : result.analyses) {
        LOGF_DEBUG(*logger_, Indicator, "%s %s: %s (%s)", result.ticker.c_str(), r.name.c_str(),
                   strategy::signal_to_string(r.signal), r.label.c_str());
    }
    LOGF_INFO(*logger_, Consensus, "%s: %s, %s, score %+d (buy %d / sell %d / hold %d), close %.2f",
              result.ticker.c_str(), strategy::signal_to_string(result.final_signal), result.confidence.c_str(),
              result.total_score, result.votes.buy, result.votes.sell, result.votes.hold, result.latest_close);
    if (result.trade_setup) {
        const auto& s = *result.trade_setup;
        LOGF_DEBUG(*logger_, Risk, "%s: entry %.2f stop %.2f target %.2f size %lld", result.ticker.c_str(),
                   s.entry_price, s.stop_loss_price, s.target_price, static_cast<long long>(s.position.max_shares));
    }
}

void Analyzer::log_error(const ErrorInfo& error) const {
    if (!logger_)
        return;
    std::lock_guard<std::mutex> lock(log_mutex_);

    const auto category =
        error.kind == ErrorKind::UpstreamData ? logging::LogCategory::Data : logging::LogCategory::System;
    logger_->logf(logging::LogLevel::Warn, category, "%s: %s (%s)", error.ticker.c_str(), error.message.c_str(),
                  error_kind_to_string(error.kind));
}

} // namespace analysis
} // namespace quantcode
