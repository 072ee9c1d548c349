#pragma once

#include <string>
#include <chrono>
#include <optional>

namespace tradeguard {

using Price = double;
using Volume = double;
using Amount = double;

enum class OrderSide { BUY, SELL };
enum class OrderType { LIMIT, MARKET };
enum class TradeStatus { PENDING, FILLED, REJECTED, CANCELLED };

enum class PositionSide { LONG, SHORT };
// Forward only: OPEN -> CLOSING -> CLOSED
enum class PositionStatus { OPEN, CLOSING, CLOSED };

enum class EngineState { STOPPED, RUNNING, EMERGENCY_STOPPED };
enum class HealthStatus { HEALTHY, DEGRADED };

enum class ErrorKind {
    NONE,
    VALIDATION,
    CONNECTIVITY,
    RISK_LIMIT,
    EMERGENCY,
    PARTIAL_EXECUTION
};

struct Position {
    std::string id;
    std::string symbol;
    PositionSide side = PositionSide::LONG;
    Volume quantity = 0.0;                 // still exposed; full size once CLOSED
    Volume original_quantity = 0.0;        // filled entry size
    Price entry_price = 0.0;
    Price current_price = 0.0;
    std::optional<Price> stop_loss;
    std::optional<Price> take_profit;
    long long entry_time = 0;
    PositionStatus status = PositionStatus::OPEN;
    std::string strategy_name;
    std::string external_order_id;

    std::string entry_trade_id;
    std::string exit_trade_id;
    Price exit_price = 0.0;
    long long exit_time = 0;
    Amount realized_pnl = 0.0;
    Amount unrealized_pnl = 0.0;

    // Last exit order was confirmed unfilled; resubmit on the next tick.
    bool exit_retry_pending = false;
    std::string close_reason;
};

struct Trade {
    std::string id;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    Volume quantity = 0.0;
    Price price = 0.0;
    Amount fees = 0.0;
    long long timestamp = 0;
    std::string position_id;   // empty only for an entry before its position exists
    bool is_entry = true;
    TradeStatus status = TradeStatus::PENDING;
    std::string strategy_name;

    std::string client_order_id;
    std::string venue_order_id;
    std::string error;
};

// Outcome of a closed position, consumed by performance evaluation.
struct TradeOutcome {
    std::string position_id;
    std::string symbol;
    std::string strategy_name;
    PositionSide side = PositionSide::LONG;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double quantity = 0.0;
    double pnl = 0.0;
    long long entry_time = 0;
    long long exit_time = 0;
};

inline long long nowEpochMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

inline const char* toString(OrderSide side) {
    return (side == OrderSide::BUY) ? "BUY" : "SELL";
}

inline const char* toString(PositionSide side) {
    return (side == PositionSide::LONG) ? "LONG" : "SHORT";
}

inline const char* toString(TradeStatus status) {
    switch (status) {
        case TradeStatus::PENDING: return "PENDING";
        case TradeStatus::FILLED: return "FILLED";
        case TradeStatus::REJECTED: return "REJECTED";
        case TradeStatus::CANCELLED: return "CANCELLED";
    }
    return "PENDING";
}

inline const char* toString(PositionStatus status) {
    switch (status) {
        case PositionStatus::OPEN: return "OPEN";
        case PositionStatus::CLOSING: return "CLOSING";
        case PositionStatus::CLOSED: return "CLOSED";
    }
    return "OPEN";
}

inline const char* toString(EngineState state) {
    switch (state) {
        case EngineState::STOPPED: return "STOPPED";
        case EngineState::RUNNING: return "RUNNING";
        case EngineState::EMERGENCY_STOPPED: return "EMERGENCY_STOPPED";
    }
    return "STOPPED";
}

inline const char* toString(HealthStatus health) {
    return (health == HealthStatus::HEALTHY) ? "HEALTHY" : "DEGRADED";
}

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "NONE";
        case ErrorKind::VALIDATION: return "VALIDATION";
        case ErrorKind::CONNECTIVITY: return "CONNECTIVITY";
        case ErrorKind::RISK_LIMIT: return "RISK_LIMIT";
        case ErrorKind::EMERGENCY: return "EMERGENCY";
        case ErrorKind::PARTIAL_EXECUTION: return "PARTIAL_EXECUTION";
    }
    return "NONE";
}

inline OrderSide entrySideFor(PositionSide side) {
    return (side == PositionSide::LONG) ? OrderSide::BUY : OrderSide::SELL;
}

inline OrderSide exitSideFor(PositionSide side) {
    return (side == PositionSide::LONG) ? OrderSide::SELL : OrderSide::BUY;
}

inline double sideSign(PositionSide side) {
    return (side == PositionSide::LONG) ? 1.0 : -1.0;
}

} // namespace tradeguard
