#pragma once

/**
 * Trade journal - P&L accounting for manually logged trades
 *
 * A TradeRecord is OPEN until an exit price is recorded. P&L exists only
 * for CLOSED records with an exit price:
 *   LONG:  exit - entry
 *   SHORT: entry - exit
 * Per unit, no commissions, no rounding.
 *
 * Storage is an external collaborator behind ITradeJournalStore; the
 * in-memory store here backs tests and the CLI.
 */

#include "../types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace quantcode {
namespace trading {

enum class TradeType { Long, Short };
enum class TradeStatus { Open, Closed };

inline const char* trade_type_to_string(TradeType t) { return t == TradeType::Long ? "LONG" : "SHORT"; }
inline const char* trade_status_to_string(TradeStatus s) { return s == TradeStatus::Open ? "OPEN" : "CLOSED"; }

// Throws ValidationError on anything but LONG / SHORT (case-insensitive)
TradeType trade_type_from_string(const std::string& s);

struct TradeRecord {
    uint64_t id = 0;
    std::string ticker;
    TradeType type = TradeType::Long;
    TradeStatus status = TradeStatus::Open;
    Price entry_price = 0;
    Price stop_loss_price = 0;
    std::optional<Price> exit_price;
    Timestamp entry_timestamp = 0;
};

std::optional<PnL> compute_pnl(const TradeRecord& record);

// P&L as a percentage of the entry price; same applicability as compute_pnl
std::optional<double> pnl_percent(const TradeRecord& record);

struct JournalSummary {
    size_t open = 0;
    size_t closed = 0;
    size_t winners = 0;
    size_t losers = 0;
    PnL realized_pnl = 0;

    double win_rate_pct() const {
        size_t decided = winners + losers;
        return decided == 0 ? 0.0 : static_cast<double>(winners) / static_cast<double>(decided) * 100.0;
    }
};

JournalSummary summarize(const std::vector<TradeRecord>& records);

/**
 * Trade journal storage interface
 */
class ITradeJournalStore {
public:
    virtual ~ITradeJournalStore() = default;

    virtual std::vector<TradeRecord> list() const = 0;

    // Stores an OPEN record and returns it with its assigned id
    virtual TradeRecord add(TradeRecord record) = 0;

    /**
     * Close a trade at exit_price.
     * @throws NotFoundError for an unknown id
     * @throws ValidationError if the trade is already closed or exit_price <= 0
     */
    virtual TradeRecord update(uint64_t id, Price exit_price) = 0;
};

class InMemoryTradeJournal : public ITradeJournalStore {
public:
    std::vector<TradeRecord> list() const override;
    TradeRecord add(TradeRecord record) override;
    TradeRecord update(uint64_t id, Price exit_price) override;

private:
    mutable std::mutex mutex_;
    std::vector<TradeRecord> records_;
    uint64_t next_id_ = 1;
};

} // namespace trading
} // namespace quantcode
