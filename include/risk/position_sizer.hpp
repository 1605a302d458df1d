#pragma once

#include "../exchange/market_data.hpp"
#include "../config/defaults.hpp"
#include "../strategy/signal.hpp"
#include "../types.hpp"

#include <optional>

namespace quantcode {
namespace risk {

using exchange::Bar;
using strategy::Signal;

struct RiskConfig {
    double capital = config::risk::CAPITAL;        // Account size used for suggested setups
    double risk_percent = config::risk::RISK_PCT;  // % of capital at risk per trade
    double rr_ratio = config::risk::RR_RATIO;      // Reward : risk for the suggested target
};

/**
 * Fixed-fractional position size
 *
 * risk_amount      = account_size * risk_percent / 100
 * risk_per_share   = |entry - stop_loss|
 * max_shares       = floor(risk_amount / risk_per_share)
 * total_investment = max_shares * entry
 */
struct PositionSizePlan {
    // Inputs, echoed back
    double account_size = 0;
    double risk_percent = 0;
    Price entry_price = 0;
    Price stop_loss_price = 0;

    double risk_amount = 0;
    double risk_per_share = 0;
    Shares max_shares = 0;
    double total_investment = 0;
};

/**
 * @throws ValidationError for any non-positive or non-finite input, or
 *         risk_percent above 100 (names the parameter)
 * @throws InvalidRiskParametersError when entry equals stop_loss
 */
PositionSizePlan calculate_position_size(double account_size, double risk_percent, Price entry_price,
                                         Price stop_loss_price);

struct TradeSetup {
    Price entry_price = 0;
    Price stop_loss_price = 0;
    double risk_per_share = 0;
    Price target_price = 0;
    PositionSizePlan position;
    double capital = 0;
    double risk_percent = 0;
    double rr_ratio = 0;
};

/**
 * PositionSizer - suggested setup for a consensus signal
 *
 * Entry is the latest close. BUY stops below the latest bar's low,
 * SELL above its high; target sits rr_ratio risk-multiples away.
 * HOLD, or a stop equal to the entry, yields no setup.
 */
class PositionSizer {
public:
    explicit PositionSizer(const RiskConfig& config = RiskConfig());

    std::optional<TradeSetup> trade_setup(Signal signal, const Bar& latest) const;

    const RiskConfig& config() const { return config_; }

private:
    RiskConfig config_;
};

} // namespace risk
} // namespace quantcode
