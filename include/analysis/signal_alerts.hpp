#pragma once

#include "analysis_result.hpp"

#include <map>
#include <string>

namespace quantcode {
namespace analysis {

/**
 * One actionable signal, ready for delivery
 */
struct SignalAlert {
    std::string ticker;
    strategy::Signal signal = strategy::Signal::Hold;
    std::string subject;
    std::string body;
    Timestamp timestamp = 0; // When the alert was raised (ms)
};

/**
 * Alert delivery channel (mail, chat, log...)
 *
 * Returns false when the alert could not be delivered; the tracker
 * then leaves it unrecorded so a later run can retry.
 */
class ISignalNotifier {
public:
    virtual ~ISignalNotifier() = default;
    virtual bool notify(const SignalAlert& alert) = 0;
};

/**
 * Subject line and multi-line body for a consensus result
 */
SignalAlert make_signal_alert(const ConsensusResult& result, Timestamp now);

/**
 * Signal Alert Tracker
 *
 * Forwards BUY and SELL consensus results to a notifier, at most once
 * per ticker and signal per UTC day. HOLD never alerts. A flip from
 * BUY to SELL on the same day is a new alert.
 *
 * State can be persisted between runs as JSON:
 *   { "2025-10-05": { "AAPL|BUY": "2025-10-05T09:34:00Z" } }
 *
 * Not thread-safe; feed it from the thread that collected the batch.
 */
class SignalAlertTracker {
public:
    explicit SignalAlertTracker(ISignalNotifier& notifier) : notifier_(notifier) {}

    // true when an alert was delivered
    bool check_and_notify(const ConsensusResult& result, Timestamp now);

    // Failed entries are skipped. Returns the number of alerts delivered.
    size_t process(const BatchResult& batch, Timestamp now);

    bool already_sent(const std::string& ticker, strategy::Signal signal, Timestamp now) const;
    size_t sent_today(Timestamp now) const;

    // Drops days before the one containing `now`
    void prune(Timestamp now);

    void load_state(const std::string& filename);
    void save_state(const std::string& filename) const;
    std::string dump_state() const;
    void parse_state(const std::string& json_text);

private:
    ISignalNotifier& notifier_;
    // "YYYY-MM-DD" -> "TICKER|SIGNAL" -> ISO time sent
    std::map<std::string, std::map<std::string, std::string>> sent_;

    static std::string key(const std::string& ticker, strategy::Signal signal);
};

} // namespace analysis
} // namespace quantcode
