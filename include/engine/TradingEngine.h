#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.h"
#include "core/contracts/IAccountProvider.h"
#include "core/contracts/IBrokerClient.h"
#include "core/contracts/ILedgerStore.h"
#include "core/contracts/IPhaseProvider.h"
#include "core/contracts/IPhaseStateStore.h"
#include "core/events/EventChannel.h"
#include "core/model/Signal.h"
#include "engine/EngineConfig.h"
#include "engine/HeartbeatSupervisor.h"
#include "engine/PhaseController.h"
#include "execution/ExecutionGateway.h"
#include "ledger/PositionLedger.h"
#include "risk/RiskGovernor.h"

namespace tradeguard {
namespace engine {

struct SignalIntake {
    bool accepted = false;
    ErrorKind error = ErrorKind::NONE;
    std::string reason;
};

struct TickReport {
    bool skipped = false;          // previous tick still in flight
    bool account_available = false;
    int signals_processed = 0;
    int opened = 0;
    int closed = 0;
    int rejected = 0;
    int reconciled = 0;
    bool emergency = false;
};

// Composition root. Owns the control loop, the signal intake queue, the
// engine state, the event channel and the heartbeat and phase timers.
// Explicitly constructed; several engines may coexist in one process.
class TradingEngine {
public:
    TradingEngine(
        const EngineConfig& config,
        std::shared_ptr<core::IBrokerClient> broker,
        std::shared_ptr<core::IAccountProvider> account,
        std::shared_ptr<core::ILedgerStore> ledger_store = nullptr,
        std::shared_ptr<core::IPhaseStateStore> phase_store = nullptr
    );

    ~TradingEngine();

    // ===== Engine control =====

    // Restores state, runs pre-flight and starts the loop and timers.
    // Refused while EMERGENCY_STOPPED.
    bool start();
    void stop();
    // EMERGENCY_STOPPED -> STOPPED. The only way out of an emergency.
    bool rearm();

    // Stop intake, one close attempt per OPEN position, EMERGENCY_STOPPED.
    // Runs once per emergency.
    void emergencyShutdown(const std::string& reason);

    // ===== Signal intake =====

    SignalIntake submitSignal(const nlohmann::json& payload);
    SignalIntake submitSignal(const core::Signal& signal);

    // ===== Control cycle =====

    // One control-loop cycle. Ticks never overlap: a tick requested while
    // another is in flight returns immediately with skipped = true.
    TickReport tick();

    // New control-loop thread; the stalled one exits once it returns.
    bool restartControlLoop(int attempt);

    // ===== State =====

    EngineState state() const { return state_; }
    HealthStatus health() const { return health_; }
    std::string healthReason() const;
    std::string stopReason() const;
    bool isAcceptingSignals() const { return accepting_; }

    long long completedTicks() const { return completed_ticks_; }
    long long skippedTicks() const { return skipped_ticks_; }
    size_t queuedSignals() const;

    void updateRiskProfile(const risk::RiskProfile& profile);

    ledger::PositionLedger& ledger() { return *ledger_; }
    const ledger::PositionLedger& ledger() const { return *ledger_; }
    std::shared_ptr<const ledger::PositionLedger> sharedLedger() const { return ledger_; }
    risk::RiskGovernor& riskGovernor() { return *risk_; }
    PhaseController& phaseController() { return *phase_; }
    HeartbeatSupervisor& heartbeat() { return *heartbeat_; }
    std::shared_ptr<const core::IPhaseProvider> phaseProvider() const { return phase_; }
    std::shared_ptr<core::EventChannel> events() const { return events_; }

private:
    void runControlLoop(uint64_t generation);
    void joinLoopThreads();

    std::optional<core::AccountSnapshot> fetchAccountWithRetry();
    void setState(EngineState state, const std::string& reason);
    void setHealth(HealthStatus health, const std::string& reason);
    void publish(core::EngineEventType type, const std::string& symbol, const std::string& message, double value = 0.0);
    void publishOutcome(const core::Signal& signal, const ledger::LedgerOutcome& outcome, TickReport& report);

    EngineConfig config_;
    std::shared_ptr<core::IAccountProvider> account_;
    std::shared_ptr<core::EventChannel> events_;
    std::shared_ptr<execution::ExecutionGateway> gateway_;
    std::shared_ptr<ledger::PositionLedger> ledger_;
    std::unique_ptr<risk::RiskGovernor> risk_;
    std::shared_ptr<PhaseController> phase_;
    std::unique_ptr<HeartbeatSupervisor> heartbeat_;

    std::atomic<EngineState> state_{EngineState::STOPPED};
    std::atomic<HealthStatus> health_{HealthStatus::HEALTHY};
    std::atomic<bool> accepting_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> emergency_latched_{false};
    bool restored_ = false;
    mutable std::mutex status_mutex_;
    std::string health_reason_;
    std::string stop_reason_;

    mutable std::mutex intake_mutex_;
    std::deque<core::Signal> intake_;

    std::atomic<bool> tick_in_flight_{false};
    std::atomic<long long> completed_ticks_{0};
    std::atomic<long long> skipped_ticks_{0};

    std::atomic<uint64_t> loop_generation_{0};
    std::mutex loop_mutex_;
    std::condition_variable loop_wake_;
    std::mutex threads_mutex_;
    std::vector<std::thread> loop_threads_;
};

} // namespace engine
} // namespace tradeguard
