#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "core/state/LedgerStoreJson.h"
#include "core/state/PhaseStateStoreJson.h"
#include "engine/TradingEngine.h"
#include "execution/PaperAccountProvider.h"
#include "execution/PaperBrokerClient.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace tradeguard;

namespace {

std::atomic<bool> g_stop_requested{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_stop_requested = true;
    }
}

std::filesystem::path resolveDir(const std::string& dir) {
    std::filesystem::path path(dir);
    if (path.is_absolute()) {
        return path;
    }
    return utils::PathUtils::resolveRelativePath(dir);
}

// Reads one JSON signal per line from stdin until EOF.
void readSignals(std::shared_ptr<engine::TradingEngine> engine, std::shared_ptr<execution::PaperBrokerClient> paper) {
    std::string line;
    while (!g_stop_requested && std::getline(std::cin, line)) {
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }

        nlohmann::json payload;
        try {
            payload = nlohmann::json::parse(line);
        } catch (const nlohmann::json::parse_error& e) {
            LOG_WARN("Ignoring malformed signal line: {}", e.what());
            continue;
        }

        if (paper && payload.is_object() && payload.contains("symbol") && payload.contains("price") &&
            payload["symbol"].is_string() && payload["price"].is_number()) {
            paper->setMarkPrice(payload["symbol"].get<std::string>(), payload["price"].get<double>());
        }

        const auto intake = engine->submitSignal(payload);
        if (!intake.accepted) {
            LOG_WARN("Signal not accepted ({}): {}", toString(intake.error), intake.reason);
        }
    }
    LOG_INFO("Signal input closed");
}

void logEvent(const core::EngineEvent& event) {
    if (event.type == core::EngineEventType::PHASE_CHANGED) {
        LOG_INFO("[event] {} {} -> {} (readiness {:.3f}) {}", core::toString(event.type),
                 event.previous_phase, event.phase, event.value, event.message);
        return;
    }
    LOG_INFO("[event] {} {} {} {:.4f}", core::toString(event.type), event.symbol, event.message, event.value);
}

} // namespace

int main(int argc, char* argv[]) {
    const std::string config_path = (argc > 1) ? argv[1] : "config/tradeguard.json";

    Config config;
    config.load(config_path);
    const auto& engine_config = config.getEngineConfig();

    try {
        Logger::getInstance().initialize(engine_config.log_dir, engine_config.log_level);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    LOG_INFO("========================================");
    LOG_INFO("TradeGuard position lifecycle & risk control");
    LOG_INFO("========================================");

    if (!engine_config.paper_mode) {
        LOG_ERROR("Live mode needs a venue adapter implementing IBrokerClient; only paper mode is built in");
        return 1;
    }

    const auto state_dir = resolveDir(engine_config.state_dir);
    auto ledger_store = std::make_shared<core::LedgerStoreJson>(state_dir / "ledger.json");
    auto phase_store = std::make_shared<core::PhaseStateStoreJson>(state_dir / "phase_state.json");
    if (!ledger_store->isWritable()) {
        LOG_ERROR("Ledger store {} cannot be used; refusing to start", ledger_store->path().string());
        return 1;
    }

    auto broker = std::make_shared<execution::PaperBrokerClient>(engine_config.execution.fee_rate);
    auto account = std::make_shared<execution::PaperAccountProvider>(engine_config.initial_capital);

    auto engine = std::make_shared<engine::TradingEngine>(engine_config, broker, account, ledger_store, phase_store);
    account->attachLedger(engine->sharedLedger());

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    if (!engine->start()) {
        LOG_ERROR("Engine failed to start");
        return 1;
    }

    // Blocks on stdin; detached (with its own engine reference) so Ctrl+C
    // does not wait for input
    std::thread reader(readSignals, engine, broker);
    reader.detach();

    auto events = engine->events();
    while (!g_stop_requested && engine->state() == EngineState::RUNNING) {
        auto event = events->popFor(std::chrono::milliseconds(200));
        if (event) {
            logEvent(*event);
        }
    }

    if (g_stop_requested) {
        LOG_INFO("Shutdown signal received (Ctrl+C)");
    }
    g_stop_requested = true;
    engine->stop();
    for (const auto& event : events->drain()) {
        logEvent(event);
    }

    const auto summary = engine->ledger().portfolioSummary();
    LOG_INFO("Final: phase {}, closed {}, win rate {:.1f}%, realized P&L {:.2f}, state {}",
             engine->phaseProvider()->currentPhase(), summary.closed_positions, summary.win_rate * 100.0,
             summary.realized_pnl, toString(engine->state()));
    Logger::getInstance().flush();
    return engine->state() == EngineState::EMERGENCY_STOPPED ? 2 : 0;
}
