#include "../../include/trading/trade_journal.hpp"

#include "../../include/errors.hpp"
#include "../../include/util/string_utils.hpp"

#include <cmath>

namespace quantcode {
namespace trading {

TradeType trade_type_from_string(const std::string& s) {
    const std::string upper = util::to_upper(util::trim(s));
    if (upper == "LONG")
        return TradeType::Long;
    if (upper == "SHORT")
        return TradeType::Short;
    throw ValidationError("trade_type must be LONG or SHORT, got '" + s + "'", "trade_type");
}

std::optional<PnL> compute_pnl(const TradeRecord& record) {
    if (record.status != TradeStatus::Closed || !record.exit_price)
        return std::nullopt;

    const Price exit = *record.exit_price;
    if (record.type == TradeType::Long)
        return exit - record.entry_price;
    return record.entry_price - exit;
}

std::optional<double> pnl_percent(const TradeRecord& record) {
    auto pnl = compute_pnl(record);
    if (!pnl || record.entry_price <= 0)
        return std::nullopt;
    return *pnl / record.entry_price * 100.0;
}

JournalSummary summarize(const std::vector<TradeRecord>& records) {
    JournalSummary s;
    for (const auto& r : records) {
        if (r.status == TradeStatus::Open) {
            ++s.open;
            continue;
        }
        ++s.closed;
        auto pnl = compute_pnl(r);
        if (!pnl)
            continue;
        s.realized_pnl += *pnl;
        if (*pnl > 0)
            ++s.winners;
        else if (*pnl < 0)
            ++s.losers;
    }
    return s;
}

// ============================================================================
// InMemoryTradeJournal
// ============================================================================

std::vector<TradeRecord> InMemoryTradeJournal::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

TradeRecord InMemoryTradeJournal::add(TradeRecord record) {
    record.ticker = util::normalize_ticker(record.ticker);
    if (record.ticker.empty()) {
        throw ValidationError("ticker is required", "ticker");
    }
    if (!std::isfinite(record.entry_price) || record.entry_price <= 0) {
        throw ValidationError("entry_price must be a positive number", "entry_price");
    }
    if (!std::isfinite(record.stop_loss_price) || record.stop_loss_price <= 0) {
        throw ValidationError("stop_loss_price must be a positive number", "stop_loss_price");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    record.id = next_id_++;
    record.status = TradeStatus::Open;
    record.exit_price.reset();
    records_.push_back(record);
    return record;
}

TradeRecord InMemoryTradeJournal::update(uint64_t id, Price exit_price) {
    if (!std::isfinite(exit_price) || exit_price <= 0) {
        throw ValidationError("exit_price must be a positive number", "exit_price");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& r : records_) {
        if (r.id != id)
            continue;
        if (r.status != TradeStatus::Open) {
            throw ValidationError("Trade " + std::to_string(id) + " is already closed", "id");
        }
        r.exit_price = exit_price;
        r.status = TradeStatus::Closed;
        return r;
    }
    throw NotFoundError("Trade " + std::to_string(id) + " not found");
}

} // namespace trading
} // namespace quantcode
