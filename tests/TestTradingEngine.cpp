#include "engine/TradingEngine.h"
#include "execution/PaperAccountProvider.h"
#include "execution/PaperBrokerClient.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace tradeguard;
using tradeguard::engine::EngineConfig;
using tradeguard::engine::TradingEngine;
using tradeguard::execution::PaperAccountProvider;
using tradeguard::execution::PaperBrokerClient;

namespace {
class FakeAccount : public core::IAccountProvider {
public:
    std::optional<core::AccountSnapshot> fetchSnapshot() override {
        if (!reachable_) {
            return std::nullopt;
        }
        core::AccountSnapshot snapshot;
        snapshot.equity = equity_;
        snapshot.available_balance = equity_;
        snapshot.taken_at_ms = nowEpochMs();
        return snapshot;
    }

    void setEquity(double equity) { equity_ = equity; }
    void setReachable(bool reachable) { reachable_ = reachable; }

private:
    std::atomic<double> equity_{10000.0};
    std::atomic<bool> reachable_{true};
};

// Timers far apart so every tick in these tests is driven by hand
EngineConfig manualConfig() {
    EngineConfig config;
    config.control_loop_period_ms = 60000;
    config.heartbeat.heartbeat_period_ms = 60000;
    config.phase.evaluation_period_ms = 600000;
    config.execution.max_connectivity_retries = 1;
    config.execution.retry_backoff_ms = 0;
    config.execution.submit_timeout_ms = 2000;
    config.event_channel_capacity = 256;
    return config;
}

nlohmann::json signal(const std::string& action, const std::string& symbol, double price, double quantity) {
    return {{"action", action}, {"symbol", symbol}, {"price", price}, {"quantity", quantity}, {"strategy", "test"}};
}

std::vector<core::EngineEvent> eventsOf(TradingEngine& engine, core::EngineEventType type) {
    std::vector<core::EngineEvent> matched;
    for (auto& event : engine.events()->drain()) {
        if (event.type == type) {
            matched.push_back(event);
        }
    }
    return matched;
}
} // namespace

int main() {
    // ===== Intake and ordered processing =====
    {
        auto broker = std::make_shared<PaperBrokerClient>();
        auto account = std::make_shared<FakeAccount>();
        TradingEngine engine(manualConfig(), broker, account);

        auto early = engine.submitSignal(signal("BUY", "BTC/USD", 65000.0, 0.001));
        assert(!early.accepted);

        assert(engine.start());
        assert(engine.state() == EngineState::RUNNING);
        assert(!engine.start());

        auto invalid = engine.submitSignal(nlohmann::json{{"action", "HOLD"}, {"symbol", "BTC/USD"}, {"price", 1.0}});
        assert(!invalid.accepted);
        assert(invalid.error == ErrorKind::VALIDATION);
        assert(engine.queuedSignals() == 0);

        assert(engine.submitSignal(signal("BUY", "BTC/USD", 65000.0, 0.001)).accepted);
        assert(engine.submitSignal(signal("SELL", "BTC/USD", 65500.0, 0.001)).accepted);
        assert(engine.queuedSignals() == 2);

        auto report = engine.tick();
        assert(!report.skipped);
        assert(report.account_available);
        assert(report.signals_processed == 2);
        assert(report.opened == 1);
        assert(report.closed == 1);
        assert(engine.completedTicks() == 1);

        auto outcomes = engine.ledger().closedOutcomes();
        assert(outcomes.size() == 1);
        assert(std::abs(outcomes.front().pnl - 0.5) < 1e-6);
        assert(eventsOf(engine, core::EngineEventType::POSITION_CLOSED).size() == 1);

        engine.stop();
        assert(engine.state() == EngineState::STOPPED);
        assert(!engine.isAcceptingSignals());
    }

    // ===== Account unreachable: DEGRADED, no new positions =====
    {
        auto broker = std::make_shared<PaperBrokerClient>();
        auto account = std::make_shared<FakeAccount>();
        TradingEngine engine(manualConfig(), broker, account);
        assert(engine.start());

        account->setReachable(false);
        engine.submitSignal(signal("BUY", "ETH/USD", 3000.0, 0.01));
        auto report = engine.tick();
        assert(!report.account_available);
        assert(report.rejected == 1);
        assert(engine.health() == HealthStatus::DEGRADED);
        assert(engine.state() == EngineState::RUNNING);
        assert(broker->placeCount() == 0);

        account->setReachable(true);
        engine.submitSignal(signal("BUY", "ETH/USD", 3000.0, 0.01));
        report = engine.tick();
        assert(report.opened == 1);
        assert(engine.health() == HealthStatus::HEALTHY);
        engine.stop();
    }

    // ===== Venue unreachable: DEGRADED, entries refused, nothing resent =====
    {
        auto broker = std::make_shared<PaperBrokerClient>();
        auto account = std::make_shared<FakeAccount>();
        auto config = manualConfig();
        config.execution.max_connectivity_retries = 2;
        TradingEngine engine(config, broker, account);
        assert(engine.start());

        broker->setDefaultBehavior(PaperBrokerClient::Behavior::THROW);
        broker->setQueryUnavailable(true);
        const std::vector<std::string> symbols = {"BTC/USD", "ETH/USD", "SOL/USD", "ADA/USD"};
        for (size_t i = 0; i < symbols.size(); ++i) {
            engine.submitSignal(signal("BUY", symbols[i], 1000.0, 0.05));
            auto report = engine.tick();
            assert(report.account_available);
            assert(engine.health() == HealthStatus::DEGRADED);
            assert(engine.state() == EngineState::RUNNING);
            if (i > 0) {
                assert(report.rejected == 1);
            }
        }
        // Only the first entry reached the venue; later ticks only query it
        assert(broker->placeCount() == 1);
        assert(broker->queryCount() == 6);
        assert(engine.ledger().pendingTradeCount() == 1);
        assert(engine.healthReason().find("venue unreachable") != std::string::npos);

        // Venue back: the unknown entry resolves and entries resume
        broker->setQueryUnavailable(false);
        broker->setDefaultBehavior(PaperBrokerClient::Behavior::FILL);
        auto recovered = engine.tick();
        assert(recovered.reconciled == 1);
        assert(engine.health() == HealthStatus::HEALTHY);
        assert(engine.ledger().pendingTradeCount() == 0);

        engine.submitSignal(signal("BUY", "ETH/USD", 1000.0, 0.05));
        assert(engine.tick().opened == 1);
        assert(broker->placeCount() == 2);
        engine.stop();
    }

    // ===== A tick due while another is in flight is skipped =====
    {
        auto broker = std::make_shared<PaperBrokerClient>();
        auto account = std::make_shared<FakeAccount>();
        TradingEngine engine(manualConfig(), broker, account);
        assert(engine.start());

        broker->setResponseDelayMs(400);
        broker->enqueueBehavior(PaperBrokerClient::Behavior::DELAY_FILL);
        engine.submitSignal(signal("BUY", "BTC/USD", 65000.0, 0.001));

        engine::TickReport first;
        std::thread slow([&engine, &first]() { first = engine.tick(); });
        while (broker->placeCount() == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        auto second = engine.tick();
        assert(second.skipped);
        assert(second.signals_processed == 0);
        assert(engine.skippedTicks() == 1);

        slow.join();
        assert(!first.skipped);
        assert(first.opened == 1);
        assert(engine.completedTicks() == 1);
        assert(broker->placeCount() == 1);
        engine.stop();
    }

    // ===== Pre-flight blocks start =====
    {
        auto account = std::make_shared<FakeAccount>();
        account->setReachable(false);
        TradingEngine engine(manualConfig(), std::make_shared<PaperBrokerClient>(), account);
        assert(!engine.start());
        assert(engine.state() == EngineState::STOPPED);
        assert(!engine.isAcceptingSignals());
    }

    // ===== Drawdown breach: one close attempt per open position =====
    {
        auto broker = std::make_shared<PaperBrokerClient>();
        auto account = std::make_shared<FakeAccount>();
        TradingEngine engine(manualConfig(), broker, account);
        assert(engine.start());

        engine.submitSignal(signal("BUY", "BTC/USD", 65000.0, 0.001));
        engine.submitSignal(signal("BUY", "ETH/USD", 3000.0, 0.01));
        engine.submitSignal(signal("BUY", "SOL/USD", 150.0, 0.5));
        assert(engine.tick().opened == 3);
        assert(broker->placeCount() == 3);
        engine.events()->drain();

        // 21% below the 10000 peak; the first close is refused by the venue
        account->setEquity(7900.0);
        broker->enqueueBehavior(PaperBrokerClient::Behavior::REJECT);
        engine.submitSignal(signal("BUY", "ADA/USD", 0.5, 100.0));

        auto report = engine.tick();
        assert(report.emergency);
        assert(report.signals_processed == 0);
        assert(engine.state() == EngineState::EMERGENCY_STOPPED);
        assert(!engine.isAcceptingSignals());
        assert(engine.queuedSignals() == 0);
        assert(broker->placeCount() == 6);

        auto positions = engine.ledger().positions();
        int closed = 0;
        int open = 0;
        for (const auto& position : positions) {
            if (position.status == PositionStatus::CLOSED) {
                closed++;
            } else if (position.status == PositionStatus::OPEN) {
                open++;
            }
        }
        assert(closed == 2);
        assert(open == 1);

        auto emergency = eventsOf(engine, core::EngineEventType::EMERGENCY_STOP);
        assert(emergency.size() == 1);
        assert(emergency.front().value == 1.0);

        // Latched: no further attempts from ticks or repeated shutdowns
        engine.tick();
        engine.emergencyShutdown("again");
        assert(broker->placeCount() == 6);

        auto refused = engine.submitSignal(signal("BUY", "BTC/USD", 65000.0, 0.001));
        assert(!refused.accepted);
        assert(refused.error == ErrorKind::EMERGENCY);
        assert(!engine.start());

        // Operator re-arm
        assert(engine.rearm());
        assert(engine.state() == EngineState::STOPPED);
        account->setEquity(10000.0);
        assert(engine.start());
        assert(engine.state() == EngineState::RUNNING);

        // The surviving position's close is retried on the next tick
        auto resumed = engine.tick();
        assert(resumed.closed == 1);
        assert(engine.ledger().activePositions().empty());
        engine.stop();
    }

    // ===== Heartbeat exhausts restarts and stops the engine =====
    {
        auto broker = std::make_shared<PaperBrokerClient>();
        auto account = std::make_shared<FakeAccount>();
        TradingEngine engine(manualConfig(), broker, account);
        assert(engine.start());
        engine.submitSignal(signal("BUY", "BTC/USD", 65000.0, 0.001));
        engine.tick();
        engine.events()->drain();

        auto& heartbeat = engine.heartbeat();
        const auto stalled = engine::HeartbeatSupervisor::Clock::now() + std::chrono::minutes(10);
        for (int i = 0; i < 3; ++i) {
            assert(heartbeat.check(stalled) == engine::HeartbeatVerdict::RESTART_ATTEMPTED);
        }
        assert(engine.state() == EngineState::RUNNING);
        assert(eventsOf(engine, core::EngineEventType::RESTART_ATTEMPT).size() == 3);

        assert(heartbeat.check(stalled) == engine::HeartbeatVerdict::EMERGENCY);
        assert(engine.state() == EngineState::EMERGENCY_STOPPED);
        assert(engine.ledger().activePositions().empty());
        assert(engine.stopReason().find("restart attempts exhausted") != std::string::npos);
    }

    // ===== Independent engines in one process =====
    {
        auto broker_a = std::make_shared<PaperBrokerClient>();
        auto broker_b = std::make_shared<PaperBrokerClient>();
        TradingEngine a(manualConfig(), broker_a, std::make_shared<FakeAccount>());
        TradingEngine b(manualConfig(), broker_b, std::make_shared<FakeAccount>());
        assert(a.start());
        assert(b.start());
        a.submitSignal(signal("BUY", "BTC/USD", 65000.0, 0.001));
        a.tick();
        b.tick();
        assert(a.ledger().activePositions().size() == 1);
        assert(b.ledger().activePositions().empty());
        a.emergencyShutdown("test");
        assert(a.state() == EngineState::EMERGENCY_STOPPED);
        assert(b.state() == EngineState::RUNNING);
    }

    // ===== Paper account follows the ledger =====
    {
        auto broker = std::make_shared<PaperBrokerClient>();
        auto account = std::make_shared<PaperAccountProvider>(10000.0);
        TradingEngine engine(manualConfig(), broker, account);
        account->attachLedger(engine.sharedLedger());
        assert(engine.start());

        engine.submitSignal(signal("BUY", "BTC/USD", 65000.0, 0.001));
        engine.tick();
        auto snapshot = account->fetchSnapshot();
        assert(snapshot);
        assert(std::abs(snapshot->equity - 10000.0) < 1e-6);
        assert(std::abs(snapshot->available_balance - (10000.0 - 65.0)) < 1e-6);

        engine.submitSignal(signal("CLOSE", "BTC/USD", 66000.0, 0.001));
        engine.tick();
        snapshot = account->fetchSnapshot();
        assert(std::abs(snapshot->realized_pnl_to_date - 1.0) < 1e-6);
        assert(std::abs(snapshot->equity - 10001.0) < 1e-6);

        account->setReachable(false);
        assert(!account->fetchSnapshot());
        engine.stop();
    }

    std::cout << "[TEST] TradingEngine PASSED\n";
    return 0;
}
