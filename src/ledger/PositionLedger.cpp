#include "ledger/PositionLedger.h"

#include <algorithm>
#include <cmath>

#include "common/Logger.h"

namespace tradeguard {
namespace ledger {

namespace {
constexpr double kQuantityEpsilon = 1e-12;

PositionSide positionSideFor(core::SignalAction action) {
    return (action == core::SignalAction::SELL) ? PositionSide::SHORT : PositionSide::LONG;
}

LedgerOutcome skipped(const std::string& reason) {
    LedgerOutcome outcome;
    outcome.action = LedgerAction::SKIPPED;
    outcome.reason = reason;
    return outcome;
}
} // namespace

const char* toString(LedgerAction action) {
    switch (action) {
        case LedgerAction::OPENED: return "OPENED";
        case LedgerAction::CLOSED: return "CLOSED";
        case LedgerAction::SKIPPED: return "SKIPPED";
        case LedgerAction::REJECTED: return "REJECTED";
    }
    return "SKIPPED";
}

PositionLedger::PositionLedger(
    std::shared_ptr<execution::ExecutionGateway> gateway,
    std::shared_ptr<core::ILedgerStore> store
)
    : gateway_(std::move(gateway))
    , store_(std::move(store)) {}

void PositionLedger::setExitRules(const std::vector<engine::ExitRuleConfig>& rules) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    exit_rules_ = rules;
}

std::shared_ptr<std::mutex> PositionLedger::symbolLock(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& entry = symbol_locks_[symbol];
    if (!entry) {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}

std::string PositionLedger::nextId(const char* prefix) {
    return std::string(prefix) + "-" + std::to_string(nowEpochMs()) + "-" + std::to_string(++sequence_);
}

void PositionLedger::recordTrade(const Trade& trade) {
    if (store_ && !store_->saveTrade(trade)) {
        LOG_WARN("Failed to persist trade {} ({})", trade.id, trade.symbol);
    }
}

void PositionLedger::recordPosition(const Position& position) {
    if (store_ && !store_->savePosition(position)) {
        LOG_WARN("Failed to persist position {} ({})", position.id, position.symbol);
    }
}

// ===== Signal handling =====

LedgerOutcome PositionLedger::processSignal(const core::Signal& signal, const PositionSizer& sizer) {
    auto symbol_mutex = symbolLock(signal.symbol);
    std::lock_guard<std::mutex> guard(*symbol_mutex);

    std::string active_id;
    PositionStatus active_status = PositionStatus::OPEN;
    PositionSide active_side = PositionSide::LONG;
    bool entry_pending = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        entry_pending = pending_entries_.count(signal.symbol) > 0;
        auto it = active_by_symbol_.find(signal.symbol);
        if (it != active_by_symbol_.end()) {
            const auto& position = positions_.at(it->second);
            active_id = position.id;
            active_status = position.status;
            active_side = position.side;
        }
    }

    if (entry_pending) {
        LOG_DEBUG("{} {} skipped: entry awaiting reconciliation", toString(signal.action), signal.symbol);
        return skipped("entry outcome pending reconciliation");
    }

    if (signal.action == core::SignalAction::CLOSE) {
        if (active_id.empty()) {
            LOG_DEBUG("CLOSE {} skipped: no open position", signal.symbol);
            return skipped("no position to close");
        }
        return closeLocked(active_id, "close_signal", signal.price);
    }

    if (!active_id.empty()) {
        if (active_status == PositionStatus::CLOSING) {
            LOG_DEBUG("{} {} skipped: close in progress", toString(signal.action), signal.symbol);
            return skipped("close in progress");
        }
        if (positionSideFor(signal.action) == active_side) {
            LOG_DEBUG("{} {} skipped: already {}", toString(signal.action), signal.symbol, toString(active_side));
            return skipped("position already open on the same side");
        }
        return closeLocked(active_id, "opposite_signal", signal.price);
    }

    return openLocked(signal, sizer);
}

LedgerOutcome PositionLedger::openLocked(const core::Signal& signal, const PositionSizer& sizer) {
    LedgerOutcome outcome;
    outcome.action = LedgerAction::REJECTED;

    if (!sizer) {
        outcome.error_kind = ErrorKind::VALIDATION;
        outcome.reason = "no position sizer";
        return outcome;
    }

    const auto decision = sizer(signal);
    if (!decision.approved) {
        LOG_INFO("{} {} rejected by risk: {} ({})", toString(signal.action), signal.symbol,
                 decision.reason, risk::toString(decision.reject_reason));
        outcome.error_kind = decision.error_kind;
        outcome.reason = decision.reason;
        return outcome;
    }

    Trade trade;
    trade.id = nextId("TRD");
    trade.client_order_id = nextId("tg");
    trade.symbol = signal.symbol;
    trade.side = entrySideFor(positionSideFor(signal.action));
    trade.quantity = decision.quantity;
    trade.price = signal.price;
    trade.timestamp = nowEpochMs();
    trade.is_entry = true;
    trade.status = TradeStatus::PENDING;
    trade.strategy_name = signal.strategy_name;

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        trades_[trade.id] = trade;
    }
    recordTrade(trade);

    core::OrderRequest request;
    request.symbol = signal.symbol;
    request.side = trade.side;
    request.quantity = trade.quantity;
    request.order_type = OrderType::LIMIT;
    request.limit_price = signal.price;
    request.client_order_id = trade.client_order_id;

    const auto result = gateway_->submit(request);

    if (result.isFilled()) {
        const auto position = applyEntryFill(trade, result, signal.strategy_name);
        outcome.action = LedgerAction::OPENED;
        outcome.position = position;
        outcome.trade = trade;
        return outcome;
    }

    if (result.indeterminate) {
        trade.venue_order_id = result.venue_order_id;
        trade.error = result.error;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            trades_[trade.id] = trade;
            pending_entries_[trade.symbol] = trade.id;
        }
        recordTrade(trade);
        LOG_WARN("{} entry outcome unknown (client_order_id={}): {}",
                 trade.symbol, trade.client_order_id, result.error);
        outcome.action = LedgerAction::SKIPPED;
        outcome.pending = true;
        outcome.trade = trade;
        outcome.error_kind = result.error_kind;
        outcome.reason = "entry outcome pending reconciliation";
        return outcome;
    }

    trade.status = result.status;
    trade.venue_order_id = result.venue_order_id;
    trade.error = result.error;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        trades_[trade.id] = trade;
    }
    recordTrade(trade);
    LOG_WARN("{} entry {} by venue: {}", trade.symbol, toString(trade.status), result.error);
    outcome.trade = trade;
    outcome.error_kind = result.error_kind;
    outcome.reason = "venue did not fill entry: " + result.error;
    return outcome;
}

Position PositionLedger::applyEntryFill(Trade& trade, const execution::TradeResult& result, const std::string& strategy_name) {
    trade.status = TradeStatus::FILLED;
    trade.quantity = result.filled_quantity;
    trade.price = result.filled_avg_price;
    trade.fees = result.fees;
    trade.venue_order_id = result.venue_order_id;
    trade.timestamp = nowEpochMs();

    Position position;
    position.id = nextId("POS");
    position.symbol = trade.symbol;
    position.side = (trade.side == OrderSide::BUY) ? PositionSide::LONG : PositionSide::SHORT;
    position.quantity = trade.quantity;
    position.original_quantity = trade.quantity;
    position.entry_price = trade.price;
    position.current_price = trade.price;
    position.entry_time = trade.timestamp;
    position.status = PositionStatus::OPEN;
    position.strategy_name = strategy_name;
    position.external_order_id = result.venue_order_id;
    position.entry_trade_id = trade.id;
    trade.position_id = position.id;

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        applyExitRule(position);
        trades_[trade.id] = trade;
        positions_[position.id] = position;
        active_by_symbol_[position.symbol] = position.id;
        auto pending = pending_entries_.find(position.symbol);
        if (pending != pending_entries_.end() && pending->second == trade.id) {
            pending_entries_.erase(pending);
        }
    }
    recordTrade(trade);
    recordPosition(position);

    if (result.filled_quantity + kQuantityEpsilon < result.requested_quantity) {
        LOG_WARN("{} entry partially filled: {:.8f} of {:.8f}", position.symbol,
                 result.filled_quantity, result.requested_quantity);
    }
    LOG_INFO("Position opened: {} {} {} {:.8f} @ {:.8f}", position.id, toString(position.side),
             position.symbol, position.quantity, position.entry_price);
    Logger::getInstance().logTrade(position.id, position.symbol, toString(trade.side), trade.price,
                                   trade.quantity, trade.fees, 0.0, "");
    return position;
}

// Caller holds state_mutex_
void PositionLedger::applyExitRule(Position& position) const {
    const engine::ExitRuleConfig* match = nullptr;
    for (const auto& rule : exit_rules_) {
        if (rule.strategy == position.strategy_name) {
            match = &rule;
            break;
        }
        if (rule.strategy == "*" && !match) {
            match = &rule;
        }
    }
    if (!match) {
        return;
    }

    const double sign = sideSign(position.side);
    if (match->stop_loss_pct > 0.0) {
        position.stop_loss = position.entry_price * (1.0 - sign * match->stop_loss_pct);
    }
    if (match->take_profit_pct > 0.0) {
        position.take_profit = position.entry_price * (1.0 + sign * match->take_profit_pct);
    }
}

// ===== Closing =====

LedgerOutcome PositionLedger::closePosition(
    const std::string& symbol,
    const std::string& reason,
    std::optional<double> reference_price
) {
    auto symbol_mutex = symbolLock(symbol);
    std::lock_guard<std::mutex> guard(*symbol_mutex);

    std::string active_id;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = active_by_symbol_.find(symbol);
        if (it != active_by_symbol_.end()) {
            active_id = it->second;
        }
    }
    if (active_id.empty()) {
        return skipped("no position to close");
    }
    return closeLocked(active_id, reason, reference_price);
}

LedgerOutcome PositionLedger::closeLocked(
    const std::string& position_id,
    const std::string& reason,
    std::optional<double> reference_price
) {
    Trade trade;
    Position position;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = positions_.find(position_id);
        if (it == positions_.end() || it->second.status == PositionStatus::CLOSED) {
            return skipped("no position to close");
        }
        if (pending_exits_.count(position_id) > 0) {
            return skipped("exit outcome pending reconciliation");
        }

        it->second.close_reason = reason;
        position = it->second;

        trade.id = nextId("TRD");
        trade.client_order_id = nextId("tg");
        trade.symbol = position.symbol;
        trade.side = exitSideFor(position.side);
        trade.quantity = position.quantity;
        trade.price = reference_price.value_or(position.current_price);
        trade.timestamp = nowEpochMs();
        trade.position_id = position.id;
        trade.is_entry = false;
        trade.status = TradeStatus::PENDING;
        trade.strategy_name = position.strategy_name;
        trades_[trade.id] = trade;
    }
    recordTrade(trade);

    core::OrderRequest request;
    request.symbol = trade.symbol;
    request.side = trade.side;
    request.quantity = trade.quantity;
    request.client_order_id = trade.client_order_id;
    if (reference_price) {
        request.order_type = OrderType::LIMIT;
        request.limit_price = reference_price;
    } else {
        request.order_type = OrderType::MARKET;
    }

    LOG_INFO("Closing {} {} {:.8f} ({})", position.id, position.symbol, position.quantity, reason);
    return applyExitResult(trade, gateway_->submit(request));
}

LedgerOutcome PositionLedger::applyExitResult(Trade trade, const execution::TradeResult& result) {
    LedgerOutcome outcome;
    Position position;
    std::optional<Trade> exit_trade;  // the position's bound exit trade, when this fill was folded into it
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = positions_.find(trade.position_id);
        if (it == positions_.end()) {
            return skipped("exit trade has no position");
        }
        Position& stored = it->second;
        if (stored.status == PositionStatus::CLOSED) {
            return skipped("position already closed");
        }

        trade.venue_order_id = result.venue_order_id;
        trade.error = result.error;

        if (result.isFilled()) {
            const double filled = std::min(result.filled_quantity, stored.quantity);
            const double pnl = (result.filled_avg_price - stored.entry_price) * filled * sideSign(stored.side);
            stored.realized_pnl += pnl;
            stored.current_price = result.filled_avg_price;
            pending_exits_.erase(stored.id);

            auto bound = stored.exit_trade_id.empty() ? trades_.end() : trades_.find(stored.exit_trade_id);
            if (bound != trades_.end() && bound->first != trade.id) {
                // Earlier partial fill: one exit trade per position, volume-weighted price
                Trade& exit = bound->second;
                const double total = exit.quantity + filled;
                exit.price = (exit.price * exit.quantity + result.filled_avg_price * filled) / total;
                exit.quantity = total;
                exit.fees += result.fees;
                exit.timestamp = nowEpochMs();
                exit.venue_order_id = result.venue_order_id;
                exit_trade = exit;

                trade.status = TradeStatus::CANCELLED;
                trade.quantity = filled;
                trade.price = result.filled_avg_price;
                trade.error = "fill merged into " + exit.id;
            } else {
                trade.status = TradeStatus::FILLED;
                trade.quantity = filled;
                trade.price = result.filled_avg_price;
                trade.fees = result.fees;
                trade.timestamp = nowEpochMs();
                stored.exit_trade_id = trade.id;
            }

            if (filled + kQuantityEpsilon < stored.quantity) {
                // Remainder stays exposed and is retried next tick
                stored.quantity -= filled;
                stored.unrealized_pnl = 0.0;
                stored.exit_retry_pending = true;
                outcome.action = LedgerAction::REJECTED;
                outcome.error_kind = ErrorKind::PARTIAL_EXECUTION;
                outcome.reason = "exit partially filled";
            } else {
                const Trade& exit = exit_trade ? *exit_trade : trade;
                stored.status = PositionStatus::CLOSED;
                stored.quantity = (stored.original_quantity > 0.0) ? stored.original_quantity : stored.quantity;
                stored.exit_price = exit.price;
                stored.exit_time = exit.timestamp;
                stored.unrealized_pnl = 0.0;
                stored.exit_retry_pending = false;
                active_by_symbol_.erase(stored.symbol);
                closed_ids_.push_back(stored.id);
                outcome.action = LedgerAction::CLOSED;
                outcome.pnl = stored.realized_pnl;
            }
        } else if (result.indeterminate) {
            trade.status = TradeStatus::PENDING;
            stored.status = PositionStatus::CLOSING;
            stored.exit_retry_pending = false;
            pending_exits_[stored.id] = trade.id;
            outcome.action = LedgerAction::SKIPPED;
            outcome.pending = true;
            outcome.error_kind = result.error_kind;
            outcome.reason = "exit outcome pending reconciliation";
        } else {
            trade.status = result.status;
            stored.exit_retry_pending = true;
            pending_exits_.erase(stored.id);
            outcome.action = LedgerAction::REJECTED;
            outcome.error_kind = ErrorKind::PARTIAL_EXECUTION;
            outcome.reason = "exit not filled: " + result.error;
        }

        trades_[trade.id] = trade;
        if (exit_trade) {
            trades_[exit_trade->id] = *exit_trade;
        }
        position = stored;
    }

    recordTrade(trade);
    if (exit_trade) {
        recordTrade(*exit_trade);
    }
    recordPosition(position);
    outcome.position = position;
    outcome.trade = exit_trade ? *exit_trade : trade;

    switch (outcome.action) {
        case LedgerAction::CLOSED:
            LOG_INFO("Position closed: {} {} exit {:.8f}, realized P&L {:.8f}",
                     position.id, position.symbol, position.exit_price, position.realized_pnl);
            Logger::getInstance().logTrade(position.id, position.symbol, toString(outcome.trade->side),
                                           outcome.trade->price, outcome.trade->quantity, outcome.trade->fees,
                                           position.realized_pnl, position.close_reason);
            break;
        case LedgerAction::SKIPPED:
            LOG_WARN("{} exit outcome unknown (client_order_id={}), position {} is CLOSING",
                     position.symbol, trade.client_order_id, position.id);
            break;
        default:
            LOG_WARN("{} close failed for {} ({}), position stays {}; retry next tick",
                     position.symbol, position.id, outcome.reason, toString(position.status));
            break;
    }
    return outcome;
}

std::vector<LedgerOutcome> PositionLedger::closeAllOpen(const std::string& reason) {
    std::vector<std::pair<std::string, std::string>> targets;  // symbol, position id
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (const auto& [symbol, id] : active_by_symbol_) {
            const auto& position = positions_.at(id);
            if (position.status == PositionStatus::OPEN ||
                (position.exit_retry_pending && pending_exits_.count(id) == 0)) {
                targets.emplace_back(symbol, id);
            }
        }
    }

    std::vector<LedgerOutcome> outcomes;
    for (const auto& [symbol, id] : targets) {
        auto symbol_mutex = symbolLock(symbol);
        std::lock_guard<std::mutex> guard(*symbol_mutex);
        auto outcome = closeLocked(id, reason, std::nullopt);
        if (outcome.action != LedgerAction::CLOSED) {
            LOG_ERROR("Close attempt for {} ({}) did not complete: {}", id, symbol, outcome.reason);
        }
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

std::vector<LedgerOutcome> PositionLedger::retryFailedCloses() {
    std::vector<std::pair<std::string, std::string>> targets;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (const auto& [symbol, id] : active_by_symbol_) {
            const auto& position = positions_.at(id);
            if (position.exit_retry_pending && pending_exits_.count(id) == 0) {
                targets.emplace_back(symbol, id);
            }
        }
    }

    std::vector<LedgerOutcome> outcomes;
    for (const auto& [symbol, id] : targets) {
        auto symbol_mutex = symbolLock(symbol);
        std::lock_guard<std::mutex> guard(*symbol_mutex);

        std::string reason;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            auto it = positions_.find(id);
            if (it == positions_.end() || !it->second.exit_retry_pending) {
                continue;
            }
            reason = it->second.close_reason.empty() ? "retry" : it->second.close_reason;
        }
        outcomes.push_back(closeLocked(id, reason, std::nullopt));
    }
    return outcomes;
}

// ===== Reconciliation =====

int PositionLedger::reconcilePending() {
    struct PendingRef {
        std::string symbol;
        std::string trade_id;
    };

    std::vector<PendingRef> pending;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (const auto& [symbol, trade_id] : pending_entries_) {
            pending.push_back({symbol, trade_id});
        }
        for (const auto& [position_id, trade_id] : pending_exits_) {
            pending.push_back({trades_.at(trade_id).symbol, trade_id});
        }
    }

    int resolved = 0;
    for (const auto& ref : pending) {
        auto symbol_mutex = symbolLock(ref.symbol);
        std::lock_guard<std::mutex> guard(*symbol_mutex);

        Trade trade;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            auto it = trades_.find(ref.trade_id);
            if (it == trades_.end() || it->second.status != TradeStatus::PENDING) {
                continue;
            }
            trade = it->second;
        }

        const auto result = gateway_->queryStatus(trade.client_order_id, trade.quantity);
        if (result.indeterminate) {
            LOG_DEBUG("{} still unresolved (client_order_id={})", trade.id, trade.client_order_id);
            continue;
        }

        ++resolved;
        if (!trade.is_entry) {
            applyExitResult(trade, result);
            continue;
        }

        if (result.isFilled()) {
            applyEntryFill(trade, result, trade.strategy_name);
            continue;
        }

        trade.status = result.status;
        trade.venue_order_id = result.venue_order_id;
        trade.error = result.error;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            trades_[trade.id] = trade;
            pending_entries_.erase(trade.symbol);
        }
        recordTrade(trade);
        LOG_WARN("{} pending entry resolved as {}: {}", trade.symbol, toString(trade.status), trade.error);
    }

    if (resolved > 0) {
        LOG_INFO("Reconciled {} of {} pending trades", resolved, pending.size());
    }
    return resolved;
}

// ===== Marking and exit rules =====

void PositionLedger::markToMarket(const std::string& symbol, double price) {
    if (price <= 0.0) {
        return;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = active_by_symbol_.find(symbol);
    if (it == active_by_symbol_.end()) {
        return;
    }
    auto& position = positions_.at(it->second);
    position.current_price = price;
    position.unrealized_pnl = (price - position.entry_price) * position.quantity * sideSign(position.side);
}

std::vector<LedgerOutcome> PositionLedger::evaluateExitRules() {
    struct ExitRequest {
        std::string symbol;
        std::string reason;
        double price;
    };

    std::vector<ExitRequest> requests;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (const auto& [symbol, id] : active_by_symbol_) {
            const auto& position = positions_.at(id);
            if (position.status != PositionStatus::OPEN || position.current_price <= 0.0) {
                continue;
            }
            const bool is_long = position.side == PositionSide::LONG;
            const double price = position.current_price;
            if (position.stop_loss &&
                (is_long ? price <= *position.stop_loss : price >= *position.stop_loss)) {
                requests.push_back({symbol, "stop_loss", price});
            } else if (position.take_profit &&
                       (is_long ? price >= *position.take_profit : price <= *position.take_profit)) {
                requests.push_back({symbol, "take_profit", price});
            }
        }
    }

    std::vector<LedgerOutcome> outcomes;
    for (const auto& request : requests) {
        LOG_INFO("{} {} triggered at {:.8f}", request.symbol, request.reason, request.price);
        outcomes.push_back(closePosition(request.symbol, request.reason, request.price));
    }
    return outcomes;
}

// ===== Restore and queries =====

size_t PositionLedger::restore() {
    if (!store_) {
        return 0;
    }

    auto loaded_positions = store_->loadPositions();
    auto loaded_trades = store_->loadTrades();

    std::lock_guard<std::mutex> lock(state_mutex_);
    positions_.clear();
    trades_.clear();
    active_by_symbol_.clear();
    pending_entries_.clear();
    pending_exits_.clear();
    closed_ids_.clear();

    for (const auto& trade : loaded_trades) {
        trades_[trade.id] = trade;
        if (trade.status != TradeStatus::PENDING) {
            continue;
        }
        if (trade.is_entry) {
            pending_entries_[trade.symbol] = trade.id;
        } else {
            pending_exits_[trade.position_id] = trade.id;
        }
    }

    std::vector<const Position*> closed;
    for (const auto& position : loaded_positions) {
        positions_[position.id] = position;
    }
    for (const auto& [id, position] : positions_) {
        if (position.status == PositionStatus::CLOSED) {
            closed.push_back(&position);
        } else {
            active_by_symbol_[position.symbol] = id;
        }
    }
    std::sort(closed.begin(), closed.end(), [](const Position* a, const Position* b) {
        return a->exit_time < b->exit_time;
    });
    for (const auto* position : closed) {
        closed_ids_.push_back(position->id);
    }

    LOG_INFO("Ledger restored: {} positions ({} active), {} trades, {} pending",
             positions_.size(), active_by_symbol_.size(), trades_.size(),
             pending_entries_.size() + pending_exits_.size());
    return positions_.size();
}

std::vector<Position> PositionLedger::positions() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::vector<Position> result;
    result.reserve(positions_.size());
    for (const auto& [id, position] : positions_) {
        result.push_back(position);
    }
    return result;
}

std::vector<Position> PositionLedger::activePositions() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::vector<Position> result;
    for (const auto& [symbol, id] : active_by_symbol_) {
        result.push_back(positions_.at(id));
    }
    return result;
}

std::optional<Position> PositionLedger::activePosition(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = active_by_symbol_.find(symbol);
    if (it == active_by_symbol_.end()) {
        return std::nullopt;
    }
    return positions_.at(it->second);
}

std::vector<Trade> PositionLedger::trades() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::vector<Trade> result;
    result.reserve(trades_.size());
    for (const auto& [id, trade] : trades_) {
        result.push_back(trade);
    }
    return result;
}

std::vector<Trade> PositionLedger::tradesForPosition(const std::string& position_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::vector<Trade> result;
    for (const auto& [id, trade] : trades_) {
        if (trade.position_id == position_id) {
            result.push_back(trade);
        }
    }
    return result;
}

bool PositionLedger::hasPendingEntry(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return pending_entries_.count(symbol) > 0;
}

int PositionLedger::pendingTradeCount() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return static_cast<int>(pending_entries_.size() + pending_exits_.size());
}

int PositionLedger::openPositionCount() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return static_cast<int>(active_by_symbol_.size() + pending_entries_.size());
}

double PositionLedger::openNotional() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    double total = 0.0;
    for (const auto& [symbol, id] : active_by_symbol_) {
        const auto& position = positions_.at(id);
        total += position.entry_price * position.quantity;
    }
    for (const auto& [symbol, trade_id] : pending_entries_) {
        const auto& trade = trades_.at(trade_id);
        total += trade.price * trade.quantity;
    }
    return total;
}

std::vector<TradeOutcome> PositionLedger::closedOutcomes() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::vector<TradeOutcome> outcomes;
    outcomes.reserve(closed_ids_.size());
    for (const auto& id : closed_ids_) {
        const auto& position = positions_.at(id);
        TradeOutcome outcome;
        outcome.position_id = position.id;
        outcome.symbol = position.symbol;
        outcome.strategy_name = position.strategy_name;
        outcome.side = position.side;
        outcome.entry_price = position.entry_price;
        outcome.exit_price = position.exit_price;
        outcome.quantity = position.quantity;
        outcome.pnl = position.realized_pnl;
        outcome.entry_time = position.entry_time;
        outcome.exit_time = position.exit_time;
        outcomes.push_back(outcome);
    }
    return outcomes;
}

PortfolioSummary PositionLedger::portfolioSummary() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    PortfolioSummary summary;
    for (const auto& [id, position] : positions_) {
        switch (position.status) {
            case PositionStatus::OPEN:
                ++summary.open_positions;
                break;
            case PositionStatus::CLOSING:
                ++summary.closing_positions;
                break;
            case PositionStatus::CLOSED:
                ++summary.closed_positions;
                break;
        }

        summary.realized_pnl += position.realized_pnl;
        if (position.status != PositionStatus::CLOSED) {
            summary.unrealized_pnl += position.unrealized_pnl;
            summary.open_notional += position.entry_price * position.quantity;
        } else if (position.realized_pnl > 0.0) {
            ++summary.winning_trades;
        } else {
            ++summary.losing_trades;
        }
    }

    summary.total_pnl = summary.realized_pnl + summary.unrealized_pnl;
    if (summary.closed_positions > 0) {
        summary.win_rate = static_cast<double>(summary.winning_trades) / summary.closed_positions;
    }
    return summary;
}

} // namespace ledger
} // namespace tradeguard
