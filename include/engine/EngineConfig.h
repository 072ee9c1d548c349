#pragma once

#include <string>
#include <vector>

#include "risk/RiskProfile.h"

namespace tradeguard {
namespace engine {

// Venue submission settings
struct ExecutionConfig {
    int submit_timeout_ms = 15000;
    int max_connectivity_retries = 3;      // account snapshot and status query attempts
    int retry_backoff_ms = 200;            // doubled after each failed attempt
    int max_outstanding_calls = 8;         // timed-out venue calls still running
    double fee_rate = 0.0026;
};

struct HeartbeatConfig {
    int heartbeat_period_ms = 10000;
    double stall_multiplier = 3.0;         // stalled when last tick older than multiplier x loop period
    int max_restart_attempts = 3;
};

struct PhaseConfig {
    int evaluation_period_ms = 5 * 60 * 1000;
    // Minimum completed trades to enter each phase; index = phase
    std::vector<int> phase_min_trades = {0, 50, 200, 500, 1000, 2000};
    int metrics_window = 1000;             // most recent outcomes considered
    int trajectory_lookback_hours = 7 * 24;
    int trajectory_min_trades = 10;
    int recent_window = 20;

    double weight_data_volume = 0.25;
    double weight_stability = 0.30;
    double weight_trajectory = 0.20;
    double weight_risk_quality = 0.15;
    double weight_diversity = 0.10;

    double advance_threshold = 0.75;
    double soft_advance_threshold = 0.60;
    double soft_advance_min_win_rate = 0.45;
    double soft_advance_sample_fraction = 0.8;
    double revert_threshold = 0.35;
    double force_revert_avg_return = -0.02;   // mean pnl / entry notional
    int force_revert_min_trades = 20;
};

// Exit rule applied to new positions of a strategy ("*" matches all)
struct ExitRuleConfig {
    std::string strategy = "*";
    double stop_loss_pct = 0.0;            // 0 disables
    double take_profit_pct = 0.0;
};

struct EngineConfig {
    int control_loop_period_ms = 1000;
    double initial_capital = 10000.0;
    bool paper_mode = true;
    int event_channel_capacity = 1024;
    bool event_channel_block = false;      // false: drop oldest when full

    std::string state_dir = "state";
    std::string log_dir = "logs";
    std::string log_level = "info";

    risk::RiskProfile risk;
    ExecutionConfig execution;
    HeartbeatConfig heartbeat;
    PhaseConfig phase;
    std::vector<ExitRuleConfig> exit_rules;
};

} // namespace engine
} // namespace tradeguard
