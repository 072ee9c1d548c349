#include "core/state/PhaseStateStoreJson.h"
#include "engine/PhaseController.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <memory>
#include <vector>

using namespace tradeguard;
using tradeguard::engine::PerformanceStore;
using tradeguard::engine::PhaseConfig;
using tradeguard::engine::PhaseController;
using tradeguard::engine::PhaseDecisionKind;

namespace {
constexpr long long kNowMs = 1700000000000LL;

core::PhaseMetrics sample(int trades, double recent_win_rate = 0.5, double avg_return = 0.01) {
    core::PhaseMetrics metrics;
    metrics.total_trades = trades;
    metrics.win_rate = 0.5;
    metrics.recent_win_rate = recent_win_rate;
    metrics.avg_return = avg_return;
    return metrics;
}

// Alternating +10 / -1 outcomes spread over symbols, strategies, sides and hours
std::vector<TradeOutcome> healthyOutcomes(int count) {
    std::vector<TradeOutcome> outcomes;
    for (int i = 0; i < count; ++i) {
        TradeOutcome outcome;
        outcome.position_id = "POS-" + std::to_string(i);
        outcome.symbol = (i % 3 == 0) ? "BTC/USD" : (i % 3 == 1) ? "ETH/USD" : "SOL/USD";
        outcome.strategy_name = (i % 2 == 0) ? "momentum" : "breakout";
        outcome.side = ((i / 2) % 2 == 0) ? PositionSide::LONG : PositionSide::SHORT;
        outcome.entry_price = 100.0;
        outcome.quantity = 1.0;
        outcome.pnl = (i % 2 == 0) ? 10.0 : -1.0;
        outcome.entry_time = kNowMs - static_cast<long long>(count - i) * 3600LL * 1000LL;
        outcome.exit_time = kNowMs - static_cast<long long>(count - i) * 60LL * 1000LL;
        outcomes.push_back(outcome);
    }
    return outcomes;
}
} // namespace

int main() {
    PhaseConfig config;   // phases {0, 50, 200, 500, 1000, 2000}

    // ===== Decision rules =====
    {
        PhaseController controller(config, nullptr);
        assert(controller.lastPhase() == 5);
        assert(controller.minTradesForPhase(1) == 50);
        assert(controller.minTradesForPhase(99) == 2000);

        // readiness 0.80 with 120% of the next phase minimum: exactly one step
        auto d = controller.decide(0, 0.80, sample(60));
        assert(d.kind == PhaseDecisionKind::ADVANCE);
        assert(d.next_phase == 1);

        d = controller.decide(2, 0.80, sample(600));
        assert(d.kind == PhaseDecisionKind::ADVANCE);
        assert(d.next_phase == 3);

        // Even a sample large enough for several phases moves only one
        d = controller.decide(1, 0.99, sample(5000));
        assert(d.next_phase == 2);

        // Not enough trades for a full advance
        d = controller.decide(0, 0.80, sample(45));
        assert(d.kind == PhaseDecisionKind::SOFT_ADVANCE);
        assert(d.next_phase == 1);

        d = controller.decide(0, 0.80, sample(30));
        assert(d.kind == PhaseDecisionKind::MAINTAIN);
        assert(d.next_phase == 0);

        d = controller.decide(0, 0.65, sample(40, 0.40));
        assert(d.kind == PhaseDecisionKind::MAINTAIN);

        d = controller.decide(3, 0.30, sample(600));
        assert(d.kind == PhaseDecisionKind::REVERT);
        assert(d.next_phase == 2);

        d = controller.decide(0, 0.10, sample(10));
        assert(d.kind == PhaseDecisionKind::MAINTAIN);
        assert(d.next_phase == 0);

        // Losing money drops straight to phase 0
        d = controller.decide(4, 0.90, sample(1500, 0.5, -0.05));
        assert(d.kind == PhaseDecisionKind::FORCE_REVERT);
        assert(d.next_phase == 0);

        d = controller.decide(4, 0.90, sample(10, 0.5, -0.05));
        assert(d.kind != PhaseDecisionKind::FORCE_REVERT);

        // Last phase is a ceiling
        d = controller.decide(5, 0.99, sample(10000));
        assert(d.kind == PhaseDecisionKind::MAINTAIN);
        assert(d.next_phase == 5);
    }

    // ===== Scoring =====
    {
        PhaseController controller(config, nullptr);
        PerformanceStore empty;
        empty.rebuild({});
        auto breakdown = controller.score(0, {}, empty, kNowMs);
        assert(breakdown.data_volume == 0.0);
        assert(breakdown.stability == 0.0);
        assert(breakdown.trajectory == 0.5);
        assert(std::abs(controller.readiness(breakdown) - 0.1) < 1e-9);

        const auto outcomes = healthyOutcomes(60);
        PerformanceStore performance;
        performance.rebuild(outcomes, config.recent_window);
        assert(performance.metrics().total_trades == 60);
        assert(std::abs(performance.metrics().win_rate - 0.5) < 1e-9);
        assert(performance.metrics().max_drawdown < 0.2);
        assert(performance.diversity().symbols == 3);
        assert(performance.byStrategy().size() == 2);

        breakdown = controller.score(0, outcomes, performance, kNowMs);
        assert(breakdown.data_volume == 1.0);
        assert(std::abs(breakdown.stability - 1.0) < 1e-9);
        assert(std::abs(breakdown.trajectory - 0.5) < 1e-9);
        assert(std::abs(breakdown.risk_quality - 1.0) < 1e-9);
        assert(breakdown.diversity > 0.8 && breakdown.diversity <= 1.0);
        assert(controller.readiness(breakdown) >= 0.75);
    }

    // ===== Evaluation cycle: persist, publish, resume =====
    {
        const auto dir = std::filesystem::temp_directory_path() /
                         ("tradeguard_phase_" + std::to_string(nowEpochMs()));
        const auto path = dir / "phase_state.json";
        auto store = std::make_shared<core::PhaseStateStoreJson>(path);
        auto events = std::make_shared<core::EventChannel>(8);
        const auto outcomes = healthyOutcomes(60);

        PhaseController controller(config, [&outcomes]() { return outcomes; }, store, events);
        assert(!controller.restore());
        assert(controller.currentPhase() == 0);

        auto state = controller.evaluate(kNowMs);
        assert(state.phase == 1);
        assert(controller.currentPhase() == 1);
        assert(controller.snapshot().metrics.total_trades == 60);

        auto event = events->tryPop();
        assert(event);
        assert(event->type == core::EngineEventType::PHASE_CHANGED);
        assert(event->previous_phase == 0);
        assert(event->phase == 1);

        // Same data does not carry phase 1 toward phase 2
        state = controller.evaluate(kNowMs);
        assert(state.phase == 1);
        assert(!events->tryPop());

        PhaseController resumed(config, nullptr, store);
        assert(resumed.restore());
        assert(resumed.currentPhase() == 1);

        core::PhaseState beyond;
        beyond.phase = 9;
        assert(store->save(beyond));
        PhaseController clamped(config, nullptr, store);
        assert(clamped.restore());
        assert(clamped.currentPhase() == clamped.lastPhase());

        std::filesystem::remove_all(dir);
    }

    // ===== Sample gate counts every completed trade, not only the window =====
    {
        const auto dir = std::filesystem::temp_directory_path() /
                         ("tradeguard_phase_top_" + std::to_string(nowEpochMs()));
        auto store = std::make_shared<core::PhaseStateStoreJson>(dir / "phase_state.json");
        core::PhaseState saved;
        saved.phase = 4;
        assert(store->save(saved));

        const auto outcomes = healthyOutcomes(3000);
        PhaseController controller(config, [&outcomes]() { return outcomes; }, store);
        assert(controller.restore());
        assert(controller.currentPhase() == 4);

        auto state = controller.evaluate(kNowMs);
        assert(state.metrics.total_trades == 3000);
        assert(state.metrics.window_trades == config.metrics_window);
        assert(state.breakdown.data_volume == 1.0);
        assert(state.phase == 5);
        assert(controller.currentPhase() == controller.lastPhase());

        std::filesystem::remove_all(dir);
    }

    std::cout << "[TEST] PhaseController PASSED\n";
    return 0;
}
