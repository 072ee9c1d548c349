#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "common/Types.h"
#include "core/contracts/IPhaseProvider.h"
#include "core/contracts/IPhaseStateStore.h"
#include "core/events/EventChannel.h"
#include "engine/EngineConfig.h"
#include "engine/PerformanceStore.h"

namespace tradeguard {
namespace engine {

enum class PhaseDecisionKind { MAINTAIN, ADVANCE, SOFT_ADVANCE, REVERT, FORCE_REVERT };

const char* toString(PhaseDecisionKind kind);

struct PhaseDecision {
    PhaseDecisionKind kind = PhaseDecisionKind::MAINTAIN;
    int next_phase = 0;
    std::string reason;

    bool changed(int current_phase) const { return next_phase != current_phase; }
};

// Periodically scores rolling performance and moves the aggressiveness phase
// by at most one step. Sole writer of PhaseState.
class PhaseController : public core::IPhaseProvider {
public:
    using OutcomeSource = std::function<std::vector<TradeOutcome>()>;

    PhaseController(
        const PhaseConfig& config,
        OutcomeSource outcomes,
        std::shared_ptr<core::IPhaseStateStore> store = nullptr,
        std::shared_ptr<core::EventChannel> events = nullptr
    );
    ~PhaseController() override;

    // Resumes from the store; false when nothing was persisted
    bool restore();

    void start();
    void stop();
    bool isRunning() const { return running_; }

    // One evaluation cycle: score, decide, persist, publish
    core::PhaseState evaluate(long long now_ms = nowEpochMs());

    int currentPhase() const override;
    core::PhaseState snapshot() const override;

    int lastPhase() const;
    int minTradesForPhase(int phase) const;

    // Scoring and decision, free of side effects
    core::ReadinessBreakdown score(
        int current_phase,
        const std::vector<TradeOutcome>& outcomes,
        const PerformanceStore& performance,
        long long now_ms
    ) const;
    double readiness(const core::ReadinessBreakdown& breakdown) const;
    PhaseDecision decide(int current_phase, double readiness, const core::PhaseMetrics& metrics) const;

private:
    void run();

    double scoreStability(const core::PhaseMetrics& metrics) const;
    double scoreTrajectory(const std::vector<TradeOutcome>& outcomes, long long now_ms) const;
    double scoreRiskQuality(const core::PhaseMetrics& metrics) const;
    double scoreDiversity(const DiversityStats& diversity) const;

    PhaseConfig config_;
    OutcomeSource outcomes_;
    std::shared_ptr<core::IPhaseStateStore> store_;
    std::shared_ptr<core::EventChannel> events_;

    mutable std::mutex state_mutex_;
    core::PhaseState state_;

    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_;
    std::unique_ptr<std::thread> worker_thread_;
};

} // namespace engine
} // namespace tradeguard
