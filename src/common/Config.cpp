#include "common/Config.h"
#include "common/PathUtils.h"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace tradeguard {

bool Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else if (std::filesystem::exists(path)) {
        config_path = std::filesystem::absolute(path);
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    std::cout << "Config path: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "Warning: config file not found, using defaults" << std::endl;
        return false;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cout << "Warning: cannot open config file, using defaults" << std::endl;
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;
        apply(j);
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
        engine_config_ = engine::EngineConfig{};
        return false;
    }

    std::cout << "Config loaded: loop=" << engine_config_.control_loop_period_ms
              << "ms, max_positions=" << engine_config_.risk.max_positions
              << ", emergency_stop_loss=" << engine_config_.risk.emergency_stop_loss << std::endl;
    return true;
}

void Config::apply(const nlohmann::json& j) {
    auto& e = engine_config_;

    if (j.contains("engine")) {
        const auto& s = j["engine"];
        e.control_loop_period_ms = s.value("control_loop_period_ms", e.control_loop_period_ms);
        e.initial_capital = s.value("initial_capital", e.initial_capital);
        e.paper_mode = s.value("paper_mode", e.paper_mode);
        e.event_channel_capacity = s.value("event_channel_capacity", e.event_channel_capacity);
        e.event_channel_block = (s.value("event_channel_policy", std::string("drop_oldest")) == "block");
        e.state_dir = s.value("state_dir", e.state_dir);
    }

    if (j.contains("logging")) {
        const auto& s = j["logging"];
        e.log_dir = s.value("dir", e.log_dir);
        e.log_level = s.value("level", e.log_level);
    }

    if (j.contains("risk")) {
        const auto& s = j["risk"];
        auto& r = e.risk;
        r.risk_per_trade_pct = s.value("risk_per_trade_pct", r.risk_per_trade_pct);
        r.max_daily_loss = s.value("max_daily_loss", r.max_daily_loss);
        r.max_account_risk_pct = s.value("max_account_risk_pct", r.max_account_risk_pct);
        r.emergency_stop_loss = s.value("emergency_stop_loss", r.emergency_stop_loss);
        r.max_positions = s.value("max_positions", r.max_positions);
        r.min_trade_amount = s.value("min_trade_amount", r.min_trade_amount);
        r.max_trade_amount = s.value("max_trade_amount", r.max_trade_amount);
        r.min_available_balance = s.value("min_available_balance", r.min_available_balance);
    }

    if (j.contains("execution")) {
        const auto& s = j["execution"];
        auto& x = e.execution;
        x.submit_timeout_ms = s.value("submit_timeout_ms", x.submit_timeout_ms);
        x.max_connectivity_retries = s.value("max_connectivity_retries", x.max_connectivity_retries);
        x.retry_backoff_ms = s.value("retry_backoff_ms", x.retry_backoff_ms);
        x.max_outstanding_calls = s.value("max_outstanding_calls", x.max_outstanding_calls);
        x.fee_rate = s.value("fee_rate", x.fee_rate);
    }

    if (j.contains("heartbeat")) {
        const auto& s = j["heartbeat"];
        auto& h = e.heartbeat;
        h.heartbeat_period_ms = s.value("period_ms", h.heartbeat_period_ms);
        h.stall_multiplier = s.value("stall_multiplier", h.stall_multiplier);
        h.max_restart_attempts = s.value("max_restart_attempts", h.max_restart_attempts);
    }

    if (j.contains("phase")) {
        const auto& s = j["phase"];
        auto& p = e.phase;
        p.evaluation_period_ms = s.value("evaluation_period_ms", p.evaluation_period_ms);
        if (s.contains("phase_min_trades")) {
            p.phase_min_trades = s["phase_min_trades"].get<std::vector<int>>();
        }
        p.metrics_window = s.value("metrics_window", p.metrics_window);
        p.trajectory_lookback_hours = s.value("trajectory_lookback_hours", p.trajectory_lookback_hours);
        p.trajectory_min_trades = s.value("trajectory_min_trades", p.trajectory_min_trades);
        p.recent_window = s.value("recent_window", p.recent_window);

        if (s.contains("weights")) {
            const auto& w = s["weights"];
            p.weight_data_volume = w.value("data_volume", p.weight_data_volume);
            p.weight_stability = w.value("stability", p.weight_stability);
            p.weight_trajectory = w.value("trajectory", p.weight_trajectory);
            p.weight_risk_quality = w.value("risk_quality", p.weight_risk_quality);
            p.weight_diversity = w.value("diversity", p.weight_diversity);
        }

        p.advance_threshold = s.value("advance_threshold", p.advance_threshold);
        p.soft_advance_threshold = s.value("soft_advance_threshold", p.soft_advance_threshold);
        p.soft_advance_min_win_rate = s.value("soft_advance_min_win_rate", p.soft_advance_min_win_rate);
        p.soft_advance_sample_fraction = s.value("soft_advance_sample_fraction", p.soft_advance_sample_fraction);
        p.revert_threshold = s.value("revert_threshold", p.revert_threshold);
        p.force_revert_avg_return = s.value("force_revert_avg_return", p.force_revert_avg_return);
        p.force_revert_min_trades = s.value("force_revert_min_trades", p.force_revert_min_trades);
    }

    if (j.contains("exit_rules")) {
        e.exit_rules.clear();
        for (const auto& item : j["exit_rules"]) {
            engine::ExitRuleConfig rule;
            rule.strategy = item.value("strategy", std::string("*"));
            rule.stop_loss_pct = item.value("stop_loss_pct", 0.0);
            rule.take_profit_pct = item.value("take_profit_pct", 0.0);
            e.exit_rules.push_back(rule);
        }
    }
}

} // namespace tradeguard
