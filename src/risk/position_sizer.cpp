#include "../../include/risk/position_sizer.hpp"

#include "../../include/config/defaults.hpp"
#include "../../include/errors.hpp"

#include <cmath>
#include <limits>

namespace quantcode {
namespace risk {

namespace {

void require_positive(double value, const char* parameter) {
    if (!std::isfinite(value) || value <= 0) {
        throw ValidationError(std::string(parameter) + " must be a positive number", parameter);
    }
}

void require_risk_percent(double risk_percent) {
    require_positive(risk_percent, "risk_percent");
    if (risk_percent > config::risk::MAX_RISK_PCT) {
        throw ValidationError("risk_percent must not exceed 100", "risk_percent");
    }
}

} // namespace

PositionSizePlan calculate_position_size(double account_size, double risk_percent, Price entry_price,
                                         Price stop_loss_price) {
    require_positive(account_size, "account_size");
    require_risk_percent(risk_percent);
    require_positive(entry_price, "entry_price");
    require_positive(stop_loss_price, "stop_loss_price");
    if (entry_price == stop_loss_price) {
        throw InvalidRiskParametersError("Entry price and stop loss price cannot be the same");
    }

    PositionSizePlan plan;
    plan.account_size = account_size;
    plan.risk_percent = risk_percent;
    plan.entry_price = entry_price;
    plan.stop_loss_price = stop_loss_price;

    plan.risk_amount = account_size * (risk_percent / 100.0);
    plan.risk_per_share = std::abs(entry_price - stop_loss_price);

    const double shares = std::floor(plan.risk_amount / plan.risk_per_share);
    // 2^63 as a double; anything at or above it does not fit in Shares
    if (shares >= static_cast<double>(std::numeric_limits<Shares>::max())) {
        throw ValidationError("account_size too large: share count exceeds the representable range", "account_size");
    }
    plan.max_shares = static_cast<Shares>(shares);
    plan.total_investment = static_cast<double>(plan.max_shares) * entry_price;
    return plan;
}

PositionSizer::PositionSizer(const RiskConfig& config) : config_(config) {
    require_positive(config_.capital, "capital");
    require_risk_percent(config_.risk_percent);
    require_positive(config_.rr_ratio, "rr_ratio");
}

std::optional<TradeSetup> PositionSizer::trade_setup(Signal signal, const Bar& latest) const {
    if (signal == Signal::Hold)
        return std::nullopt;

    const Price entry = latest.close;
    const Price stop = signal == Signal::Buy ? latest.low : latest.high;
    if (entry == stop)
        return std::nullopt;

    TradeSetup setup;
    setup.entry_price = entry;
    setup.stop_loss_price = stop;
    setup.risk_per_share = std::abs(entry - stop);
    setup.target_price = signal == Signal::Buy ? entry + setup.risk_per_share * config_.rr_ratio
                                               : entry - setup.risk_per_share * config_.rr_ratio;
    setup.position = calculate_position_size(config_.capital, config_.risk_percent, entry, stop);
    setup.capital = config_.capital;
    setup.risk_percent = config_.risk_percent;
    setup.rr_ratio = config_.rr_ratio;
    return setup;
}

} // namespace risk
} // namespace quantcode
