#include "engine/PerformanceStore.h"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <set>

namespace tradeguard {
namespace engine {
namespace {
void accumulateStats(StrategyPerformanceStats& s, const TradeOutcome& trade) {
    s.trades++;
    s.net_profit += trade.pnl;
    if (trade.pnl > 0.0) {
        s.wins++;
        s.gross_profit += trade.pnl;
    } else if (trade.pnl < 0.0) {
        s.gross_loss_abs += std::abs(trade.pnl);
    }
}

double tradeReturn(const TradeOutcome& trade) {
    const double notional = trade.entry_price * trade.quantity;
    return (notional > 0.0) ? trade.pnl / notional : 0.0;
}

int utcHour(long long epoch_ms) {
    std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm tm_buf{};
    gmtime_r(&seconds, &tm_buf);
    return tm_buf.tm_hour;
}
}

void PerformanceStore::rebuild(const std::vector<TradeOutcome>& outcomes, int recent_window, int completed_trades) {
    metrics_ = core::PhaseMetrics{};
    diversity_ = DiversityStats{};
    overall_ = StrategyPerformanceStats{};
    by_strategy_.clear();
    metrics_.total_trades = std::max(completed_trades, static_cast<int>(outcomes.size()));

    if (outcomes.empty()) {
        return;
    }

    std::set<std::string> strategies;
    std::set<std::string> symbols;
    std::set<int> hours;
    int buys = 0;
    std::vector<double> returns;
    returns.reserve(outcomes.size());

    for (const auto& trade : outcomes) {
        const std::string strategy_name = trade.strategy_name.empty() ? "unknown" : trade.strategy_name;
        accumulateStats(by_strategy_[strategy_name], trade);
        accumulateStats(overall_, trade);

        strategies.insert(strategy_name);
        symbols.insert(trade.symbol);
        hours.insert(utcHour(trade.entry_time));
        if (trade.side == PositionSide::LONG) {
            buys++;
        }
        returns.push_back(tradeReturn(trade));
    }

    const double total = static_cast<double>(outcomes.size());
    metrics_.window_trades = overall_.trades;
    metrics_.win_rate = overall_.winRate();
    metrics_.avg_pnl = overall_.net_profit / total;
    metrics_.profit_factor = overall_.profitFactor();

    double mean_return = 0.0;
    for (double r : returns) {
        mean_return += r;
    }
    mean_return /= total;
    double variance = 0.0;
    for (double r : returns) {
        variance += (r - mean_return) * (r - mean_return);
    }
    variance /= total;
    const double std_dev = std::sqrt(variance);
    metrics_.avg_return = mean_return;
    metrics_.sharpe_ratio = (std_dev > 0.0) ? (mean_return / std_dev) * std::sqrt(252.0) : 0.0;

    // Drawdown of the cumulative P&L curve
    double peak = 0.0;
    double running = 0.0;
    for (const auto& trade : outcomes) {
        running += trade.pnl;
        peak = std::max(peak, running);
        const double drawdown = (peak > 0.0) ? (peak - running) / peak : 0.0;
        metrics_.max_drawdown = std::max(metrics_.max_drawdown, drawdown);
    }

    const size_t window = static_cast<size_t>(std::max(1, recent_window));
    const size_t start = (outcomes.size() > window) ? outcomes.size() - window : 0;
    int recent_wins = 0;
    for (size_t i = start; i < outcomes.size(); ++i) {
        if (outcomes[i].pnl > 0.0) {
            recent_wins++;
        }
    }
    metrics_.recent_win_rate = static_cast<double>(recent_wins) / static_cast<double>(outcomes.size() - start);
    metrics_.consistency = 1.0 - std::abs(metrics_.win_rate - metrics_.recent_win_rate);

    diversity_.strategies = static_cast<int>(strategies.size());
    diversity_.symbols = static_cast<int>(symbols.size());
    diversity_.entry_hours = static_cast<int>(hours.size());
    diversity_.buy_ratio = static_cast<double>(buys) / total;
}

} // namespace engine
} // namespace tradeguard
