#include "../../include/analysis/result_json.hpp"

#include "../../include/indicators/bollinger.hpp"
#include "../../include/indicators/heiken_ashi.hpp"
#include "../../include/indicators/macd.hpp"
#include "../../include/indicators/rsi.hpp"
#include "../../include/util/time_utils.hpp"

namespace quantcode {
namespace analysis {

namespace {

json swings_json(const std::vector<indicators::SwingPoint>& points) {
    json arr = json::array();
    for (const auto& p : points) {
        arr.push_back({{"date", util::format_date(p.timestamp)}, {"index", p.index}, {"price", p.price}});
    }
    return arr;
}

} // namespace

const char* label_key(const std::string& indicator_name) {
    if (indicator_name == indicators::HeikenAshi::NAME)
        return "candle_type";
    if (indicator_name == indicators::Bollinger::NAME)
        return "zone";
    if (indicator_name == indicators::Macd::NAME)
        return "trend";
    if (indicator_name == indicators::Rsi::NAME)
        return "condition";
    return "label";
}

json to_json(const indicators::IndicatorResult& result) {
    json values = json::object();
    for (const auto& [key, value] : result.raw_values) {
        values[key] = value;
    }

    json j = {
        {"signal", strategy::signal_to_string(result.signal)},
        {"score", result.score},
        {"details", result.details},
        {"values", values},
    };
    j[label_key(result.name)] = result.label;
    return j;
}

json to_json(const indicators::TrendReading& trend) {
    return {
        {"trend", indicators::trend_to_string(trend.trend)},
        {"reason", trend.reason},
        {"swings", {{"highs", swings_json(trend.highs)}, {"lows", swings_json(trend.lows)}}},
    };
}

json to_json(const risk::TradeSetup& setup) {
    return {
        {"entry_price", setup.entry_price},
        {"stop_loss_price", setup.stop_loss_price},
        {"risk_per_share", setup.risk_per_share},
        {"target_price", setup.target_price},
        {"position_size", setup.position.max_shares},
        {"total_investment", setup.position.total_investment},
        {"capital", setup.capital},
        {"risk_percent", setup.risk_percent},
        {"rr_ratio", setup.rr_ratio},
    };
}

json to_json(const ConsensusResult& result) {
    json analyses = json::object();
    for (const auto& r : result.analyses) {
        analyses[r.name] = to_json(r);
    }

    json j = {
        {"ticker", result.ticker},
        {"final_signal", strategy::signal_to_string(result.final_signal)},
        {"confidence", result.confidence},
        {"latest_close_price", result.latest_close},
        {"latest_date", util::format_date(result.latest_timestamp)},
        {"total_score", result.total_score},
        {"primary_trend", to_json(result.primary_trend)},
        {"analyses", analyses},
        {"signal_summary",
         {{"buy_votes", result.votes.buy}, {"sell_votes", result.votes.sell}, {"hold_votes", result.votes.hold}}},
    };

    if (result.trade_setup) {
        j["trade_setup"] = to_json(*result.trade_setup);
        j["suggested_stop_loss"] = result.trade_setup->stop_loss_price;
    } else {
        j["trade_setup"] = nullptr;
        j["suggested_stop_loss"] = nullptr;
    }
    return j;
}

json to_json(const ErrorInfo& error) {
    json j = {
        {"error", error.message},
        {"type", error_kind_to_string(error.kind)},
    };
    if (!error.ticker.empty())
        j["ticker"] = error.ticker;
    if (!error.parameter.empty())
        j["parameter"] = error.parameter;
    return j;
}

json to_json(const BatchResult& batch) {
    json results = json::array();
    json errors = json::array();
    for (const auto& entry : batch.entries) {
        if (entry.ok()) {
            results.push_back(to_json(*entry.result));
        } else {
            json e = to_json(*entry.error);
            e["ticker"] = entry.ticker;
            errors.push_back(e);
        }
    }

    return {
        {"batch_results", results},
        {"errors", errors},
        {"summary",
         {{"total_requested", batch.entries.size()},
          {"successful", batch.successful()},
          {"failed", batch.failed()}}},
    };
}

json to_json(const trading::TradeRecord& record) {
    json j = {
        {"id", record.id},
        {"ticker", record.ticker},
        {"trade_type", trading::trade_type_to_string(record.type)},
        {"status", trading::trade_status_to_string(record.status)},
        {"entry_price", record.entry_price},
        {"stop_loss_price", record.stop_loss_price},
        {"entry_date", util::format_date(record.entry_timestamp)},
    };
    j["exit_price"] = record.exit_price ? json(*record.exit_price) : json(nullptr);

    auto pnl = trading::compute_pnl(record);
    auto pct = trading::pnl_percent(record);
    j["pnl"] = pnl ? json(*pnl) : json(nullptr);
    j["pnl_percent"] = pct ? json(*pct) : json(nullptr);
    return j;
}

json to_json(const trading::JournalSummary& summary) {
    return {
        {"open", summary.open},
        {"closed", summary.closed},
        {"winners", summary.winners},
        {"losers", summary.losers},
        {"realized_pnl", summary.realized_pnl},
        {"win_rate_pct", summary.win_rate_pct()},
    };
}

json position_size_json(const risk::PositionSizePlan& plan) {
    return {
        {"calculation",
         {
             {"account_size", plan.account_size},
             {"risk_percent", plan.risk_percent},
             {"entry_price", plan.entry_price},
             {"stop_loss_price", plan.stop_loss_price},
             {"risk_amount", plan.risk_amount},
             {"risk_per_share", plan.risk_per_share},
             {"max_shares", plan.max_shares},
             {"total_investment", plan.total_investment},
         }},
        {"recommendation",
         {
             {"max_shares", plan.max_shares},
             {"total_investment", plan.total_investment},
             {"max_loss_if_sl_hit", plan.risk_amount},
         }},
    };
}

} // namespace analysis
} // namespace quantcode
