#pragma once

/**
 * JSON rendering of analysis outputs (nlohmann/json).
 *
 * Shapes:
 *   result:        {ticker, final_signal, confidence, latest_close_price,
 *                   latest_date, total_score, primary_trend, analyses,
 *                   signal_summary, trade_setup, suggested_stop_loss}
 *   batch:         {batch_results, errors, summary}
 *   position size: {calculation, recommendation}
 *   error:         {error, type, ticker?, parameter?}
 *
 * Missing optional values are null, never omitted.
 */

#include "../errors.hpp"
#include "../trading/trade_journal.hpp"
#include "analysis_result.hpp"

#include <nlohmann/json.hpp>

namespace quantcode {
namespace analysis {

using json = nlohmann::json;

// Key holding an indicator's categorical reading ("candle_type", "condition", ...)
const char* label_key(const std::string& indicator_name);

json to_json(const indicators::IndicatorResult& result);
json to_json(const indicators::TrendReading& trend);
json to_json(const risk::TradeSetup& setup);
json to_json(const ConsensusResult& result);
json to_json(const ErrorInfo& error);
json to_json(const BatchResult& batch);
json to_json(const trading::TradeRecord& record);
json to_json(const trading::JournalSummary& summary);

json position_size_json(const risk::PositionSizePlan& plan);

inline json error_json(const AnalysisError& e) { return to_json(ErrorInfo::from(e)); }

} // namespace analysis
} // namespace quantcode
