#include "../../include/analysis/signal_alerts.hpp"

#include "../../include/errors.hpp"
#include "../../include/util/time_utils.hpp"

#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <utility>

namespace quantcode {
namespace analysis {

using json = nlohmann::json;
using strategy::Signal;

namespace {

// "2025-10-05T09:34:00Z"
std::string iso_utc(Timestamp ts) {
    const Timestamp secs_of_day = (ts % MS_PER_DAY) / 1000;
    char buf[16];
    std::snprintf(buf, sizeof(buf), "T%02u:%02u:%02uZ", static_cast<unsigned>(secs_of_day / 3600),
                  static_cast<unsigned>(secs_of_day / 60 % 60), static_cast<unsigned>(secs_of_day % 60));
    return util::format_date(ts) + buf;
}

bool is_actionable(Signal signal) {
    return signal == Signal::Buy || signal == Signal::Sell;
}

} // namespace

SignalAlert make_signal_alert(const ConsensusResult& result, Timestamp now) {
    SignalAlert alert;
    alert.ticker = result.ticker;
    alert.signal = result.final_signal;
    alert.timestamp = now;

    const char* signal = strategy::signal_to_string(result.final_signal);
    alert.subject = std::string("QuantCode Signal Alert: ") + signal + " signal for " + result.ticker;

    std::ostringstream body;
    char close[32];
    std::snprintf(close, sizeof(close), "%.2f", result.latest_close);
    body << "Time: " << iso_utc(now) << "\n"
         << "Ticker: " << result.ticker << "\n"
         << "Final Signal: " << signal << " (" << result.confidence << ")\n"
         << "Confluence Score: " << result.total_score << "\n"
         << "Primary Trend: " << indicators::trend_to_string(result.primary_trend.trend) << "\n"
         << "Latest Close: " << close << "\n";
    if (!result.analyses.empty()) {
        body << "\nBreakdown:\n";
        for (const auto& a : result.analyses) {
            body << "  - " << a.name << ": " << strategy::signal_to_string(a.signal) << " (score " << a.score
                 << ")\n";
        }
    }
    alert.body = body.str();
    return alert;
}

std::string SignalAlertTracker::key(const std::string& ticker, Signal signal) {
    return ticker + "|" + strategy::signal_to_string(signal);
}

bool SignalAlertTracker::already_sent(const std::string& ticker, Signal signal, Timestamp now) const {
    auto day = sent_.find(util::format_date(now));
    if (day == sent_.end())
        return false;
    return day->second.count(key(ticker, signal)) > 0;
}

size_t SignalAlertTracker::sent_today(Timestamp now) const {
    auto day = sent_.find(util::format_date(now));
    return day == sent_.end() ? 0 : day->second.size();
}

bool SignalAlertTracker::check_and_notify(const ConsensusResult& result, Timestamp now) {
    if (!is_actionable(result.final_signal))
        return false;
    if (already_sent(result.ticker, result.final_signal, now))
        return false;

    if (!notifier_.notify(make_signal_alert(result, now)))
        return false;

    sent_[util::format_date(now)][key(result.ticker, result.final_signal)] = iso_utc(now);
    return true;
}

size_t SignalAlertTracker::process(const BatchResult& batch, Timestamp now) {
    size_t delivered = 0;
    for (const auto& entry : batch.entries) {
        if (entry.ok() && check_and_notify(*entry.result, now))
            ++delivered;
    }
    return delivered;
}

void SignalAlertTracker::prune(Timestamp now) {
    // ISO dates sort chronologically
    sent_.erase(sent_.begin(), sent_.lower_bound(util::format_date(now)));
}

std::string SignalAlertTracker::dump_state() const {
    json root = json::object();
    for (const auto& [day, keys] : sent_) {
        root[day] = keys;
    }
    return root.dump(2);
}

void SignalAlertTracker::parse_state(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ValidationError(std::string("alert state: invalid JSON: ") + e.what(), "alert_state");
    }
    if (!root.is_object()) {
        throw ValidationError("alert state: top level must be an object", "alert_state");
    }

    std::map<std::string, std::map<std::string, std::string>> sent;
    for (auto day = root.begin(); day != root.end(); ++day) {
        if (!util::parse_date(day.key()) || !day->is_object()) {
            throw ValidationError("alert state: bad entry for '" + day.key() + "'", "alert_state");
        }
        for (auto it = day->begin(); it != day->end(); ++it) {
            if (!it->is_string()) {
                throw ValidationError("alert state: '" + day.key() + "." + it.key() + "' must be a string",
                                      "alert_state");
            }
            sent[day.key()][it.key()] = it->get<std::string>();
        }
    }
    sent_ = std::move(sent);
}

void SignalAlertTracker::load_state(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        // First run: nothing sent yet
        sent_.clear();
        return;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    parse_state(buffer.str());
}

void SignalAlertTracker::save_state(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw ValidationError("Cannot create alert state file: " + filename, "alert_state");
    }
    file << dump_state() << "\n";
}

} // namespace analysis
} // namespace quantcode
