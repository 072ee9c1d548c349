#include "engine/TradingEngine.h"

#include <algorithm>
#include <chrono>

#include "common/Logger.h"

namespace tradeguard {
namespace engine {

TradingEngine::TradingEngine(
    const EngineConfig& config,
    std::shared_ptr<core::IBrokerClient> broker,
    std::shared_ptr<core::IAccountProvider> account,
    std::shared_ptr<core::ILedgerStore> ledger_store,
    std::shared_ptr<core::IPhaseStateStore> phase_store
)
    : config_(config)
    , account_(std::move(account))
{
    const auto policy = config_.event_channel_block
        ? core::OverflowPolicy::BLOCK
        : core::OverflowPolicy::DROP_OLDEST;
    events_ = std::make_shared<core::EventChannel>(
        static_cast<size_t>(std::max(1, config_.event_channel_capacity)), policy);

    execution::GatewayOptions gateway_options;
    gateway_options.submit_timeout = std::chrono::milliseconds(config_.execution.submit_timeout_ms);
    gateway_options.max_query_attempts = config_.execution.max_connectivity_retries;
    gateway_options.retry_backoff = std::chrono::milliseconds(std::max(0, config_.execution.retry_backoff_ms));
    gateway_options.max_outstanding_calls = std::max(1, config_.execution.max_outstanding_calls);
    gateway_ = std::make_shared<execution::ExecutionGateway>(std::move(broker), gateway_options);

    ledger_ = std::make_shared<ledger::PositionLedger>(gateway_, std::move(ledger_store));
    ledger_->setExitRules(config_.exit_rules);

    risk_ = std::make_unique<risk::RiskGovernor>(config_.risk);

    // Full history: the controller windows it and counts every completed trade
    auto ledger = ledger_;
    phase_ = std::make_shared<PhaseController>(
        config_.phase,
        [ledger]() { return ledger->closedOutcomes(); },
        std::move(phase_store),
        events_
    );

    heartbeat_ = std::make_unique<HeartbeatSupervisor>(
        config_.heartbeat,
        std::chrono::milliseconds(config_.control_loop_period_ms),
        [this](int attempt) { return restartControlLoop(attempt); },
        [this](const std::string& reason) { emergencyShutdown(reason); }
    );

    LOG_INFO("TradingEngine created - loop {} ms, {} mode, event channel {} ({})",
             config_.control_loop_period_ms, config_.paper_mode ? "paper" : "live",
             config_.event_channel_capacity, config_.event_channel_block ? "block" : "drop_oldest");
}

TradingEngine::~TradingEngine() {
    stop();
    events_->close();
}

// ===== Engine control =====

bool TradingEngine::start() {
    if (state_ == EngineState::EMERGENCY_STOPPED) {
        LOG_ERROR("Engine is EMERGENCY_STOPPED ({}); rearm() required", stopReason());
        return false;
    }
    if (running_) {
        LOG_WARN("Engine already running");
        return false;
    }

    LOG_INFO("========================================");
    LOG_INFO("TradingEngine start");
    LOG_INFO("========================================");

    joinLoopThreads();

    if (!restored_) {
        ledger_->restore();
        phase_->restore();
        restored_ = true;
    }

    // Pre-flight gates signal intake
    const auto snapshot = fetchAccountWithRetry();
    const auto preflight = risk_->preflight(snapshot);
    if (!preflight.approved) {
        LOG_ERROR("Pre-flight failed ({}): {}", risk::toString(preflight.reject_reason), preflight.reason);
        return false;
    }
    risk_->resetPeak(std::max(risk_->peakEquity(), snapshot->equity));

    running_ = true;
    accepting_ = true;
    setHealth(HealthStatus::HEALTHY, "");
    setState(EngineState::RUNNING, "started");

    const uint64_t generation = ++loop_generation_;
    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        loop_threads_.emplace_back(&TradingEngine::runControlLoop, this, generation);
    }
    heartbeat_->start();
    phase_->start();

    LOG_INFO("Engine RUNNING - equity {:.2f}, available {:.2f}, phase {}",
             snapshot->equity, snapshot->available_balance, phase_->currentPhase());
    return true;
}

void TradingEngine::stop() {
    accepting_ = false;
    bool was_running = false;
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        was_running = running_.exchange(false);
    }
    loop_wake_.notify_all();

    heartbeat_->stop();
    phase_->stop();
    // In-flight venue calls finish and are recorded before the join returns
    joinLoopThreads();

    if (state_ == EngineState::RUNNING) {
        setState(EngineState::STOPPED, "stopped by operator");
    }

    if (was_running) {
        const auto summary = ledger_->portfolioSummary();
        LOG_INFO("========================================");
        LOG_INFO("TradingEngine stopped - {} open, {} closing, {} closed, realized {:.2f}, unrealized {:.2f}",
                 summary.open_positions, summary.closing_positions, summary.closed_positions,
                 summary.realized_pnl, summary.unrealized_pnl);
        LOG_INFO("Ticks: {} completed, {} skipped; events dropped: {}",
                 completed_ticks_.load(), skipped_ticks_.load(), events_->droppedCount());
        LOG_INFO("========================================");
    }
}

bool TradingEngine::rearm() {
    if (state_ != EngineState::EMERGENCY_STOPPED) {
        LOG_WARN("rearm() ignored: engine is {}", toString(state_.load()));
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        running_ = false;
    }
    loop_wake_.notify_all();
    heartbeat_->stop();
    phase_->stop();
    joinLoopThreads();

    emergency_latched_ = false;
    setState(EngineState::STOPPED, "manual re-arm");
    LOG_WARN("Engine re-armed by operator; start() required to resume");
    return true;
}

void TradingEngine::emergencyShutdown(const std::string& reason) {
    if (emergency_latched_.exchange(true)) {
        LOG_WARN("Emergency shutdown already executed ({})", reason);
        return;
    }

    LOG_ERROR("========================================");
    LOG_ERROR("EMERGENCY SHUTDOWN: {}", reason);
    LOG_ERROR("========================================");

    // 1) stop intake
    accepting_ = false;
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(intake_mutex_);
        dropped = intake_.size();
        intake_.clear();
    }
    if (dropped > 0) {
        LOG_ERROR("{} queued signals discarded", dropped);
    }

    // 2) one close attempt per OPEN position
    const auto outcomes = ledger_->closeAllOpen("emergency_stop");
    int failed = 0;
    for (const auto& outcome : outcomes) {
        if (outcome.action != ledger::LedgerAction::CLOSED) {
            failed++;
        }
    }

    // 3) terminal state; loop and timers wind down
    setState(EngineState::EMERGENCY_STOPPED, reason);
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        running_ = false;
        ++loop_generation_;
    }
    loop_wake_.notify_all();
    heartbeat_->stop();
    phase_->stop();

    publish(core::EngineEventType::EMERGENCY_STOP, "", reason, static_cast<double>(failed));
    LOG_ERROR("Emergency shutdown complete: {} close attempts, {} not closed", outcomes.size(), failed);
}

// ===== Signal intake =====

SignalIntake TradingEngine::submitSignal(const nlohmann::json& payload) {
    const auto validation = core::validateSignal(payload);
    if (!validation.valid) {
        LOG_WARN("Signal rejected at ingestion: {}", validation.reason);
        publish(core::EngineEventType::SIGNAL_REJECTED, "", validation.reason);
        SignalIntake intake;
        intake.error = ErrorKind::VALIDATION;
        intake.reason = validation.reason;
        return intake;
    }
    return submitSignal(validation.signal);
}

SignalIntake TradingEngine::submitSignal(const core::Signal& signal) {
    SignalIntake intake;

    const auto validation = core::validateSignal(signal);
    if (!validation.valid) {
        LOG_WARN("Signal rejected at ingestion: {}", validation.reason);
        intake.error = ErrorKind::VALIDATION;
        intake.reason = validation.reason;
        return intake;
    }

    if (!accepting_) {
        const bool emergency = state_ == EngineState::EMERGENCY_STOPPED;
        intake.error = emergency ? ErrorKind::EMERGENCY : ErrorKind::NONE;
        intake.reason = emergency ? "engine emergency stopped" : "engine not accepting signals";
        LOG_DEBUG("{} {} refused: {}", core::toString(signal.action), signal.symbol, intake.reason);
        return intake;
    }

    {
        std::lock_guard<std::mutex> lock(intake_mutex_);
        intake_.push_back(validation.signal);
    }
    intake.accepted = true;
    return intake;
}

size_t TradingEngine::queuedSignals() const {
    std::lock_guard<std::mutex> lock(intake_mutex_);
    return intake_.size();
}

// ===== Control loop =====

void TradingEngine::runControlLoop(uint64_t generation) {
    LOG_INFO("Control loop started (generation {})", generation);
    const auto period = std::chrono::milliseconds(std::max(1, config_.control_loop_period_ms));

    auto isCurrent = [this, generation]() {
        return running_ && loop_generation_ == generation && state_ == EngineState::RUNNING;
    };

    while (isCurrent()) {
        auto tick_start = std::chrono::steady_clock::now();
        {
            std::unique_lock<std::mutex> lock(loop_mutex_);
            loop_wake_.wait_until(lock, tick_start + period, [&isCurrent]() { return !isCurrent(); });
        }
        if (!isCurrent()) {
            break;
        }

        try {
            tick();
        } catch (const std::exception& e) {
            LOG_ERROR("Control loop tick failed: {}", e.what());
        }
    }

    LOG_INFO("Control loop exited (generation {})", generation);
}

bool TradingEngine::restartControlLoop(int attempt) {
    if (!running_ || state_ != EngineState::RUNNING) {
        return false;
    }

    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        generation = ++loop_generation_;
    }
    loop_wake_.notify_all();
    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        loop_threads_.emplace_back(&TradingEngine::runControlLoop, this, generation);
    }

    LOG_WARN("Control loop restarted (attempt {}, generation {})", attempt, generation);
    publish(core::EngineEventType::RESTART_ATTEMPT, "", "control loop restarted", static_cast<double>(attempt));
    return true;
}

void TradingEngine::joinLoopThreads() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        threads.swap(loop_threads_);
    }
    for (auto& thread : threads) {
        if (!thread.joinable()) {
            continue;
        }
        if (thread.get_id() == std::this_thread::get_id()) {
            thread.detach();
            continue;
        }
        thread.join();
    }
}

TickReport TradingEngine::tick() {
    TickReport report;
    if (tick_in_flight_.exchange(true)) {
        ++skipped_ticks_;
        report.skipped = true;
        LOG_DEBUG("Tick skipped: previous tick still in flight");
        return report;
    }
    struct InFlightGuard {
        std::atomic<bool>& flag;
        ~InFlightGuard() { flag = false; }
    } in_flight{tick_in_flight_};

    if (state_ != EngineState::RUNNING) {
        return report;
    }

    // 1) account snapshot and runtime risk
    const auto snapshot = fetchAccountWithRetry();
    report.account_available = snapshot.has_value();
    if (!snapshot) {
        setHealth(HealthStatus::DEGRADED, "account snapshot unavailable");
    } else {
        const auto runtime = risk_->runtimeCheck(*snapshot);
        if (runtime.emergency_requested) {
            report.emergency = true;
            emergencyShutdown(runtime.reason);
            return report;
        }
    }

    // 2) indeterminate orders, then exits that did not fill
    report.reconciled = ledger_->reconcilePending();
    for (const auto& outcome : ledger_->retryFailedCloses()) {
        if (outcome.action == ledger::LedgerAction::CLOSED) {
            report.closed++;
            publish(core::EngineEventType::POSITION_CLOSED, outcome.position->symbol, "close retried", outcome.pnl);
        }
    }

    // 3) queued signals, arrival order
    std::deque<core::Signal> batch;
    {
        std::lock_guard<std::mutex> lock(intake_mutex_);
        batch.swap(intake_);
    }

    // Entries need both the account and the venue; exits always go out
    auto sizer = [this, &snapshot](const core::Signal& signal) {
        if (!snapshot) {
            risk::RiskDecision decision;
            decision.reject_reason = risk::RejectReason::ACCOUNT_UNREACHABLE;
            decision.error_kind = ErrorKind::CONNECTIVITY;
            decision.reason = "account snapshot unavailable";
            return decision;
        }
        if (!gateway_->isVenueReachable()) {
            risk::RiskDecision decision;
            decision.reject_reason = risk::RejectReason::VENUE_UNREACHABLE;
            decision.error_kind = ErrorKind::CONNECTIVITY;
            decision.reason = "venue unreachable: " + gateway_->lastConnectivityError();
            return decision;
        }
        return risk_->evaluate(signal, *snapshot, ledger_->openPositionCount(), ledger_->openNotional());
    };

    for (const auto& signal : batch) {
        if (state_ != EngineState::RUNNING) {
            LOG_WARN("Engine left RUNNING mid-tick; remaining signals discarded");
            break;
        }
        ledger_->markToMarket(signal.symbol, signal.price);
        const auto outcome = ledger_->processSignal(signal, sizer);
        report.signals_processed++;
        publishOutcome(signal, outcome, report);
    }

    // 4) stop-loss / take-profit
    if (state_ == EngineState::RUNNING) {
        for (const auto& outcome : ledger_->evaluateExitRules()) {
            if (outcome.action == ledger::LedgerAction::CLOSED) {
                report.closed++;
                publish(core::EngineEventType::POSITION_CLOSED, outcome.position->symbol,
                        outcome.position->close_reason, outcome.pnl);
            } else if (outcome.action == ledger::LedgerAction::REJECTED) {
                publish(core::EngineEventType::CLOSE_FAILED, outcome.position ? outcome.position->symbol : "",
                        outcome.reason);
            }
        }
    }

    // 5) health from this tick's connectivity
    if (!snapshot) {
        setHealth(HealthStatus::DEGRADED, "account snapshot unavailable");
    } else if (!gateway_->isVenueReachable()) {
        setHealth(HealthStatus::DEGRADED, "venue unreachable: " + gateway_->lastConnectivityError());
    } else if (health_ == HealthStatus::DEGRADED) {
        setHealth(HealthStatus::HEALTHY, "");
    }

    ++completed_ticks_;
    heartbeat_->recordTick();
    return report;
}

// ===== Helpers =====

std::optional<core::AccountSnapshot> TradingEngine::fetchAccountWithRetry() {
    if (!account_) {
        return std::nullopt;
    }

    const int attempts = std::max(1, config_.execution.max_connectivity_retries);
    int backoff_ms = std::max(0, config_.execution.retry_backoff_ms);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            auto snapshot = account_->fetchSnapshot();
            if (snapshot) {
                return snapshot;
            }
        } catch (const std::exception& e) {
            LOG_WARN("Account snapshot attempt {}/{} failed: {}", attempt, attempts, e.what());
        }

        if (attempt < attempts) {
            LOG_WARN("Account unreachable (attempt {}/{}), retry in {} ms", attempt, attempts, backoff_ms);
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
            backoff_ms *= 2;
        }
    }

    LOG_WARN("Account unreachable after {} attempts", attempts);
    return std::nullopt;
}

void TradingEngine::setState(EngineState state, const std::string& reason) {
    const EngineState previous = state_.exchange(state);
    if (previous == state) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        if (state != EngineState::RUNNING) {
            stop_reason_ = reason;
        }
    }
    LOG_INFO("Engine state {} -> {} ({})", toString(previous), toString(state), reason);
    publish(core::EngineEventType::STATE_CHANGED, "", std::string(toString(state)) + ": " + reason);
}

void TradingEngine::setHealth(HealthStatus health, const std::string& reason) {
    const HealthStatus previous = health_.exchange(health);
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        health_reason_ = reason;
    }
    if (previous == health) {
        return;
    }
    if (health == HealthStatus::DEGRADED) {
        LOG_WARN("Engine DEGRADED: {} (new positions suspended)", reason);
    } else {
        LOG_INFO("Engine HEALTHY again");
    }
    publish(core::EngineEventType::HEALTH_CHANGED, "", std::string(toString(health)) + (reason.empty() ? "" : ": " + reason));
}

std::string TradingEngine::healthReason() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return health_reason_;
}

std::string TradingEngine::stopReason() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return stop_reason_;
}

void TradingEngine::updateRiskProfile(const risk::RiskProfile& profile) {
    risk_->updateProfile(profile);
}

void TradingEngine::publish(
    core::EngineEventType type,
    const std::string& symbol,
    const std::string& message,
    double value
) {
    core::EngineEvent event;
    event.type = type;
    event.timestamp_ms = nowEpochMs();
    event.symbol = symbol;
    event.message = message;
    event.value = value;
    event.phase = phase_ ? phase_->currentPhase() : 0;
    event.previous_phase = event.phase;
    events_->publish(std::move(event));
}

void TradingEngine::publishOutcome(const core::Signal& signal, const ledger::LedgerOutcome& outcome, TickReport& report) {
    switch (outcome.action) {
        case ledger::LedgerAction::OPENED:
            report.opened++;
            publish(core::EngineEventType::POSITION_OPENED, signal.symbol,
                    toString(outcome.position->side), outcome.position->entry_price);
            break;
        case ledger::LedgerAction::CLOSED:
            report.closed++;
            publish(core::EngineEventType::POSITION_CLOSED, signal.symbol,
                    outcome.position->close_reason, outcome.pnl);
            break;
        case ledger::LedgerAction::REJECTED: {
            report.rejected++;
            const bool exit_failed = outcome.trade && !outcome.trade->is_entry;
            publish(exit_failed ? core::EngineEventType::CLOSE_FAILED : core::EngineEventType::SIGNAL_REJECTED,
                    signal.symbol, outcome.reason);
            break;
        }
        case ledger::LedgerAction::SKIPPED:
            break;
    }
}

} // namespace engine
} // namespace tradeguard
