#pragma once

namespace tradeguard {
namespace core {

// Aggregates over the rolling window of closed-trade outcomes, except
// total_trades which counts every completed trade.
struct PhaseMetrics {
    int total_trades = 0;
    int window_trades = 0;
    double win_rate = 0.0;
    double recent_win_rate = 0.0;
    double avg_pnl = 0.0;
    double avg_return = 0.0;          // mean pnl / entry notional
    double profit_factor = 0.0;
    double sharpe_ratio = 0.0;
    double max_drawdown = 0.0;
    double consistency = 0.0;
};

struct ReadinessBreakdown {
    double data_volume = 0.0;
    double stability = 0.0;
    double trajectory = 0.5;
    double risk_quality = 0.0;
    double diversity = 0.0;
};

struct PhaseState {
    int phase = 0;
    double readiness = 0.0;
    PhaseMetrics metrics;
    ReadinessBreakdown breakdown;
    long long updated_at_ms = 0;
};

} // namespace core
} // namespace tradeguard
