#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/contracts/ILedgerStore.h"
#include "core/model/Signal.h"
#include "engine/EngineConfig.h"
#include "execution/ExecutionGateway.h"
#include "risk/RiskGovernor.h"

namespace tradeguard {
namespace ledger {

enum class LedgerAction { OPENED, CLOSED, SKIPPED, REJECTED };

const char* toString(LedgerAction action);

struct LedgerOutcome {
    LedgerAction action = LedgerAction::SKIPPED;
    std::optional<Position> position;
    std::optional<Trade> trade;
    double pnl = 0.0;

    // Submission outcome unknown; the trade waits for reconcilePending()
    bool pending = false;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string reason;
};

struct PortfolioSummary {
    int open_positions = 0;
    int closing_positions = 0;
    int closed_positions = 0;
    double open_notional = 0.0;
    double realized_pnl = 0.0;
    double unrealized_pnl = 0.0;
    double total_pnl = 0.0;
    double win_rate = 0.0;
    int winning_trades = 0;
    int losing_trades = 0;
};

// Sizes a new entry. Invoked under the symbol lock, only when a signal would
// open a position.
using PositionSizer = std::function<risk::RiskDecision(const core::Signal&)>;

// Authoritative record of exposure. At most one OPEN or CLOSING position per
// symbol. Every open/close for a symbol runs under that symbol's lock, held
// across the check, the venue submission and the recording of the result.
class PositionLedger {
public:
    PositionLedger(
        std::shared_ptr<execution::ExecutionGateway> gateway,
        std::shared_ptr<core::ILedgerStore> store = nullptr
    );

    void setExitRules(const std::vector<engine::ExitRuleConfig>& rules);

    LedgerOutcome processSignal(const core::Signal& signal, const PositionSizer& sizer);

    // Exit order for the active position of a symbol. Without a reference
    // price the exit goes out as a MARKET order.
    LedgerOutcome closePosition(
        const std::string& symbol,
        const std::string& reason,
        std::optional<double> reference_price = std::nullopt
    );

    // One close attempt per OPEN position. Failures are logged and returned.
    std::vector<LedgerOutcome> closeAllOpen(const std::string& reason);

    // Queries the venue for every PENDING trade and applies confirmed results.
    // Returns the number of trades resolved.
    int reconcilePending();

    // Resubmits exits whose last attempt was confirmed not filled.
    std::vector<LedgerOutcome> retryFailedCloses();

    void markToMarket(const std::string& symbol, double price);

    // Stop-loss / take-profit check on the last marked prices
    std::vector<LedgerOutcome> evaluateExitRules();

    // Rebuilds in-memory state from the store. Returns positions loaded.
    size_t restore();

    std::vector<Position> positions() const;
    std::vector<Position> activePositions() const;
    std::optional<Position> activePosition(const std::string& symbol) const;
    std::vector<Trade> trades() const;
    std::vector<Trade> tradesForPosition(const std::string& position_id) const;
    bool hasPendingEntry(const std::string& symbol) const;
    int pendingTradeCount() const;

    // Active positions plus entries awaiting reconciliation
    int openPositionCount() const;
    double openNotional() const;

    // Closed positions, oldest first
    std::vector<TradeOutcome> closedOutcomes() const;
    PortfolioSummary portfolioSummary() const;

private:
    std::shared_ptr<std::mutex> symbolLock(const std::string& symbol);

    LedgerOutcome openLocked(const core::Signal& signal, const PositionSizer& sizer);
    LedgerOutcome closeLocked(
        const std::string& position_id,
        const std::string& reason,
        std::optional<double> reference_price
    );

    // Apply a confirmed venue result; callers hold the symbol lock.
    Position applyEntryFill(Trade& trade, const execution::TradeResult& result, const std::string& strategy_name);
    LedgerOutcome applyExitResult(Trade trade, const execution::TradeResult& result);
    void applyExitRule(Position& position) const;

    void recordTrade(const Trade& trade);
    void recordPosition(const Position& position);
    std::string nextId(const char* prefix);

    std::shared_ptr<execution::ExecutionGateway> gateway_;
    std::shared_ptr<core::ILedgerStore> store_;
    std::vector<engine::ExitRuleConfig> exit_rules_;

    mutable std::mutex state_mutex_;
    std::map<std::string, Position> positions_;            // id -> position
    std::map<std::string, Trade> trades_;                  // id -> trade
    std::map<std::string, std::string> active_by_symbol_;  // symbol -> OPEN/CLOSING position id
    std::map<std::string, std::string> pending_entries_;   // symbol -> PENDING entry trade id
    std::map<std::string, std::string> pending_exits_;     // position id -> PENDING exit trade id
    std::vector<std::string> closed_ids_;

    std::mutex locks_mutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> symbol_locks_;

    std::atomic<long long> sequence_{0};
};

} // namespace ledger
} // namespace tradeguard
