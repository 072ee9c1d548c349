#pragma once

namespace tradeguard {
namespace risk {

// Operator-tunable limits. Immutable for the duration of one evaluation.
struct RiskProfile {
    double risk_per_trade_pct = 0.02;      // fraction of equity per trade
    double max_daily_loss = 500.0;         // absolute, account currency
    double max_account_risk_pct = 0.50;    // open notional / equity ceiling
    double emergency_stop_loss = 0.20;     // drawdown from peak equity
    int max_positions = 5;
    double min_trade_amount = 10.0;        // notional
    double max_trade_amount = 1000.0;      // notional
    double min_available_balance = 50.0;   // pre-flight floor
};

} // namespace risk
} // namespace tradeguard
