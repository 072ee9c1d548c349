#include "engine/PhaseController.h"

#include <algorithm>
#include <cmath>

#include "common/Logger.h"

namespace tradeguard {
namespace engine {

const char* toString(PhaseDecisionKind kind) {
    switch (kind) {
        case PhaseDecisionKind::MAINTAIN: return "MAINTAIN";
        case PhaseDecisionKind::ADVANCE: return "ADVANCE";
        case PhaseDecisionKind::SOFT_ADVANCE: return "SOFT_ADVANCE";
        case PhaseDecisionKind::REVERT: return "REVERT";
        case PhaseDecisionKind::FORCE_REVERT: return "FORCE_REVERT";
    }
    return "MAINTAIN";
}

PhaseController::PhaseController(
    const PhaseConfig& config,
    OutcomeSource outcomes,
    std::shared_ptr<core::IPhaseStateStore> store,
    std::shared_ptr<core::EventChannel> events
)
    : config_(config)
    , outcomes_(std::move(outcomes))
    , store_(std::move(store))
    , events_(std::move(events))
{
    if (config_.phase_min_trades.empty()) {
        config_.phase_min_trades = {0};
    }
}

PhaseController::~PhaseController() {
    stop();
}

bool PhaseController::restore() {
    if (!store_) {
        return false;
    }
    auto loaded = store_->load();
    if (!loaded) {
        return false;
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = *loaded;
    state_.phase = std::clamp(state_.phase, 0, lastPhase());
    LOG_INFO("Phase restored: phase {} (readiness {:.3f})", state_.phase, state_.readiness);
    return true;
}

void PhaseController::start() {
    if (running_) {
        return;
    }
    running_ = true;
    worker_thread_ = std::make_unique<std::thread>(&PhaseController::run, this);
    LOG_INFO("PhaseController started - every {} ms", config_.evaluation_period_ms);
}

void PhaseController::stop() {
    if (!running_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        running_ = false;
    }
    wake_.notify_all();
    if (worker_thread_ && worker_thread_->joinable()) {
        worker_thread_->join();
    }
    worker_thread_.reset();
    LOG_INFO("PhaseController stopped");
}

void PhaseController::run() {
    const auto period = std::chrono::milliseconds(std::max(1, config_.evaluation_period_ms));
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_.wait_for(lock, period, [this] { return !running_; });
        }
        if (!running_) {
            break;
        }
        try {
            evaluate();
        } catch (const std::exception& e) {
            LOG_ERROR("Phase evaluation failed: {}", e.what());
        }
    }
}

int PhaseController::currentPhase() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.phase;
}

core::PhaseState PhaseController::snapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

int PhaseController::lastPhase() const {
    return static_cast<int>(config_.phase_min_trades.size()) - 1;
}

int PhaseController::minTradesForPhase(int phase) const {
    const int index = std::clamp(phase, 0, lastPhase());
    return config_.phase_min_trades[static_cast<size_t>(index)];
}

core::PhaseState PhaseController::evaluate(long long now_ms) {
    std::vector<TradeOutcome> outcomes = outcomes_ ? outcomes_() : std::vector<TradeOutcome>{};
    const int completed = static_cast<int>(outcomes.size());
    if (config_.metrics_window > 0 && outcomes.size() > static_cast<size_t>(config_.metrics_window)) {
        outcomes.erase(outcomes.begin(), outcomes.end() - config_.metrics_window);
    }

    PerformanceStore performance;
    performance.rebuild(outcomes, config_.recent_window, completed);
    for (const auto& [strategy, stats] : performance.byStrategy()) {
        LOG_DEBUG("Strategy {}: {} trades, win rate {:.1f}%, PF {:.2f}, net {:.2f}",
                  strategy, stats.trades, stats.winRate() * 100.0, stats.profitFactor(), stats.net_profit);
    }
    LOG_DEBUG("Overall: {} trades, net {:.2f}", performance.overall().trades, performance.overall().net_profit);

    const int current = currentPhase();
    const auto breakdown = score(current, outcomes, performance, now_ms);
    const double ready = readiness(breakdown);
    const auto decision = decide(current, ready, performance.metrics());

    core::PhaseState next;
    next.phase = decision.next_phase;
    next.readiness = ready;
    next.metrics = performance.metrics();
    next.breakdown = breakdown;
    next.updated_at_ms = now_ms;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = next;
    }

    if (store_ && !store_->save(next)) {
        LOG_WARN("Failed to persist phase state (phase {})", next.phase);
    }

    LOG_INFO("Phase evaluation: readiness {:.3f} [volume {:.2f}, stability {:.2f}, trajectory {:.2f}, risk {:.2f}, diversity {:.2f}] trades {} -> {} ({})",
             ready, breakdown.data_volume, breakdown.stability, breakdown.trajectory,
             breakdown.risk_quality, breakdown.diversity, next.metrics.total_trades,
             toString(decision.kind), decision.reason);

    if (decision.changed(current)) {
        LOG_WARN("Phase changed {} -> {} ({})", current, decision.next_phase, toString(decision.kind));
        if (events_) {
            core::EngineEvent event;
            event.type = core::EngineEventType::PHASE_CHANGED;
            event.timestamp_ms = now_ms;
            event.previous_phase = current;
            event.phase = decision.next_phase;
            event.value = ready;
            event.message = decision.reason;
            events_->publish(std::move(event));
        }
    }
    return next;
}

// ===== Scoring =====

core::ReadinessBreakdown PhaseController::score(
    int current_phase,
    const std::vector<TradeOutcome>& outcomes,
    const PerformanceStore& performance,
    long long now_ms
) const {
    core::ReadinessBreakdown breakdown;
    const auto& metrics = performance.metrics();

    const int next_min = minTradesForPhase(current_phase + 1);
    breakdown.data_volume = (next_min > 0)
        ? std::min(1.0, static_cast<double>(metrics.total_trades) / next_min)
        : 1.0;

    if (metrics.total_trades == 0) {
        breakdown.stability = 0.0;
        breakdown.risk_quality = 0.0;
        breakdown.diversity = 0.0;
        breakdown.trajectory = 0.5;
        return breakdown;
    }

    breakdown.stability = scoreStability(metrics);
    breakdown.trajectory = scoreTrajectory(outcomes, now_ms);
    breakdown.risk_quality = scoreRiskQuality(metrics);
    breakdown.diversity = scoreDiversity(performance.diversity());
    return breakdown;
}

double PhaseController::scoreStability(const core::PhaseMetrics& metrics) const {
    double value = 0.0;
    if (metrics.win_rate >= 0.35 && metrics.win_rate <= 0.65) {
        value += 0.4;
    } else if (metrics.win_rate >= 0.30 && metrics.win_rate <= 0.70) {
        value += 0.2;
    }

    value += metrics.consistency * 0.3;

    if (metrics.max_drawdown < 0.20) {
        value += 0.3;
    } else if (metrics.max_drawdown < 0.30) {
        value += 0.15;
    }
    return std::min(1.0, value);
}

double PhaseController::scoreTrajectory(const std::vector<TradeOutcome>& outcomes, long long now_ms) const {
    const long long lookback_ms = static_cast<long long>(config_.trajectory_lookback_hours) * 60LL * 60LL * 1000LL;

    std::vector<const TradeOutcome*> recent;
    for (const auto& trade : outcomes) {
        if (trade.exit_time >= now_ms - lookback_ms) {
            recent.push_back(&trade);
        }
    }
    if (static_cast<int>(recent.size()) < config_.trajectory_min_trades || recent.size() < 2) {
        return 0.5;
    }

    std::sort(recent.begin(), recent.end(), [](const TradeOutcome* a, const TradeOutcome* b) {
        return a->exit_time < b->exit_time;
    });

    const size_t mid = recent.size() / 2;
    auto winRate = [&recent](size_t from, size_t to) {
        int wins = 0;
        for (size_t i = from; i < to; ++i) {
            if (recent[i]->pnl > 0.0) {
                wins++;
            }
        }
        return static_cast<double>(wins) / static_cast<double>(to - from);
    };

    const double improvement = winRate(mid, recent.size()) - winRate(0, mid);
    return std::clamp(0.5 + improvement, 0.0, 1.0);
}

double PhaseController::scoreRiskQuality(const core::PhaseMetrics& metrics) const {
    double value = 0.0;
    if (metrics.profit_factor > 1.5) {
        value += 0.4;
    } else if (metrics.profit_factor > 1.2) {
        value += 0.3;
    } else if (metrics.profit_factor > 1.0) {
        value += 0.2;
    }

    if (metrics.sharpe_ratio > 1.0) {
        value += 0.3;
    } else if (metrics.sharpe_ratio > 0.5) {
        value += 0.2;
    } else if (metrics.sharpe_ratio > 0.0) {
        value += 0.1;
    }

    if (metrics.avg_pnl > 0.0) {
        value += 0.3;
    }
    return std::min(1.0, value);
}

double PhaseController::scoreDiversity(const DiversityStats& diversity) const {
    double value = 0.0;
    value += std::min(0.25, diversity.strategies / 4.0 * 0.25);
    value += std::min(0.25, diversity.entry_hours / 12.0 * 0.25);
    value += (1.0 - std::abs(0.5 - diversity.buy_ratio) * 2.0) * 0.25;
    value += std::min(0.25, diversity.symbols / 3.0 * 0.25);
    return std::clamp(value, 0.0, 1.0);
}

double PhaseController::readiness(const core::ReadinessBreakdown& breakdown) const {
    const double value =
        breakdown.data_volume * config_.weight_data_volume +
        breakdown.stability * config_.weight_stability +
        breakdown.trajectory * config_.weight_trajectory +
        breakdown.risk_quality * config_.weight_risk_quality +
        breakdown.diversity * config_.weight_diversity;
    return std::clamp(value, 0.0, 1.0);
}

// ===== Decision =====

PhaseDecision PhaseController::decide(int current_phase, double readiness, const core::PhaseMetrics& metrics) const {
    PhaseDecision decision;
    decision.next_phase = current_phase;

    // 1) losing money overrides everything
    if (current_phase > 0 &&
        metrics.total_trades >= config_.force_revert_min_trades &&
        metrics.avg_return < config_.force_revert_avg_return) {
        decision.kind = PhaseDecisionKind::FORCE_REVERT;
        decision.next_phase = 0;
        decision.reason = "average return below force-revert threshold";
        return decision;
    }

    const bool has_next = current_phase < lastPhase();
    const int next_min = minTradesForPhase(current_phase + 1);

    // 2) strong readiness with a full sample
    if (has_next && readiness >= config_.advance_threshold && metrics.total_trades >= next_min) {
        decision.kind = PhaseDecisionKind::ADVANCE;
        decision.next_phase = current_phase + 1;
        decision.reason = "readiness above advance threshold";
        return decision;
    }

    // 3) moderate readiness backed by recent win rate
    if (has_next &&
        readiness >= config_.soft_advance_threshold &&
        metrics.recent_win_rate >= config_.soft_advance_min_win_rate &&
        metrics.total_trades >= config_.soft_advance_sample_fraction * next_min) {
        decision.kind = PhaseDecisionKind::SOFT_ADVANCE;
        decision.next_phase = current_phase + 1;
        decision.reason = "moderate readiness with healthy recent win rate";
        return decision;
    }

    // 4) weak readiness
    if (current_phase > 0 && readiness < config_.revert_threshold) {
        decision.kind = PhaseDecisionKind::REVERT;
        decision.next_phase = current_phase - 1;
        decision.reason = "readiness below revert threshold";
        return decision;
    }

    decision.reason = has_next ? "criteria not met" : "already at last phase";
    return decision;
}

} // namespace engine
} // namespace tradeguard
