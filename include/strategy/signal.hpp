#pragma once

#include <optional>
#include <string>

namespace quantcode {
namespace strategy {

/**
 * Trading Signal
 *
 * Recommendation emitted by each indicator and by the consensus engine.
 */
enum class Signal {
    Hold, // No clear edge
    Buy,  // Open long / add to long
    Sell  // Reduce / open short
};

inline const char* signal_to_string(Signal sig) {
    switch (sig) {
    case Signal::Buy:
        return "BUY";
    case Signal::Sell:
        return "SELL";
    default:
        return "HOLD";
    }
}

inline std::optional<Signal> signal_from_string(const std::string& s) {
    if (s == "BUY")
        return Signal::Buy;
    if (s == "SELL")
        return Signal::Sell;
    if (s == "HOLD")
        return Signal::Hold;
    return std::nullopt;
}

// Confluence contribution: BUY +1, SELL -1, HOLD 0
inline int signal_score(Signal sig) {
    switch (sig) {
    case Signal::Buy:
        return 1;
    case Signal::Sell:
        return -1;
    default:
        return 0;
    }
}

} // namespace strategy
} // namespace quantcode
