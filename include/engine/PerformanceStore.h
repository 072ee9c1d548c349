#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "common/Types.h"
#include "core/model/PhaseState.h"

namespace tradeguard {
namespace engine {

struct StrategyPerformanceStats {
    int trades = 0;
    int wins = 0;
    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    double net_profit = 0.0;

    double winRate() const {
        return (trades > 0) ? (static_cast<double>(wins) / static_cast<double>(trades)) : 0.0;
    }
    // 999 when there are profits and no losses
    double profitFactor() const {
        if (gross_loss_abs > 1e-12) {
            return gross_profit / gross_loss_abs;
        }
        return (gross_profit > 0.0) ? 999.0 : 0.0;
    }
};

struct DiversityStats {
    int strategies = 0;
    int symbols = 0;
    int entry_hours = 0;      // distinct UTC hours of entry
    double buy_ratio = 0.0;   // LONG share of outcomes
};

// Aggregates closed-trade outcomes into phase metrics and per-strategy stats.
class PerformanceStore {
public:
    // completed_trades: all trades ever closed, when outcomes is a window of them
    void rebuild(const std::vector<TradeOutcome>& outcomes, int recent_window = 20, int completed_trades = 0);

    const core::PhaseMetrics& metrics() const { return metrics_; }
    const DiversityStats& diversity() const { return diversity_; }
    const StrategyPerformanceStats& overall() const { return overall_; }
    const std::unordered_map<std::string, StrategyPerformanceStats>& byStrategy() const {
        return by_strategy_;
    }

private:
    core::PhaseMetrics metrics_;
    DiversityStats diversity_;
    StrategyPerformanceStats overall_;
    std::unordered_map<std::string, StrategyPerformanceStats> by_strategy_;
};

} // namespace engine
} // namespace tradeguard
