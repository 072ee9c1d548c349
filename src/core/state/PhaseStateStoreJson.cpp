#include "core/state/PhaseStateStoreJson.h"

#include "common/Logger.h"
#include "common/Types.h"
#include "core/state/JsonFile.h"

namespace tradeguard {
namespace core {

PhaseStateStoreJson::PhaseStateStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

std::optional<PhaseState> PhaseStateStoreJson::load() {
    std::string error;
    auto raw = readJsonFile(file_path_, &error);
    if (!raw) {
        if (!error.empty()) {
            LOG_WARN("Phase state {} unreadable: {}", file_path_.string(), error);
        }
        return std::nullopt;
    }
    if (!raw->is_object()) {
        LOG_WARN("Phase state {} is not a JSON object", file_path_.string());
        return std::nullopt;
    }

    const int version = raw->value("schema_version", 1);
    if (version > kStateSchemaVersion) {
        LOG_ERROR("Phase state {} has schema_version {} (supported {})",
                  file_path_.string(), version, kStateSchemaVersion);
        return std::nullopt;
    }

    try {
        PhaseState state;
        state.phase = raw->value("phase", 0);
        state.readiness = raw->value("readiness", 0.0);
        state.updated_at_ms = raw->value("updated_at_ms", 0LL);

        const auto metrics = raw->value("metrics", nlohmann::json::object());
        state.metrics.total_trades = metrics.value("total_trades", 0);
        state.metrics.window_trades = metrics.value("window_trades", state.metrics.total_trades);
        state.metrics.win_rate = metrics.value("win_rate", 0.0);
        state.metrics.recent_win_rate = metrics.value("recent_win_rate", 0.0);
        state.metrics.avg_pnl = metrics.value("avg_pnl", 0.0);
        state.metrics.avg_return = metrics.value("avg_return", 0.0);
        state.metrics.profit_factor = metrics.value("profit_factor", 0.0);
        state.metrics.sharpe_ratio = metrics.value("sharpe_ratio", 0.0);
        state.metrics.max_drawdown = metrics.value("max_drawdown", 0.0);
        state.metrics.consistency = metrics.value("consistency", 0.0);

        const auto breakdown = raw->value("breakdown", nlohmann::json::object());
        state.breakdown.data_volume = breakdown.value("data_volume", 0.0);
        state.breakdown.stability = breakdown.value("stability", 0.0);
        state.breakdown.trajectory = breakdown.value("trajectory", 0.5);
        state.breakdown.risk_quality = breakdown.value("risk_quality", 0.0);
        state.breakdown.diversity = breakdown.value("diversity", 0.0);

        if (state.phase < 0) {
            state.phase = 0;
        }
        return state;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Phase state {} malformed: {}", file_path_.string(), e.what());
        return std::nullopt;
    }
}

bool PhaseStateStoreJson::save(const PhaseState& state) {
    nlohmann::json raw;
    raw["schema_version"] = kStateSchemaVersion;
    raw["saved_at_ms"] = nowEpochMs();
    raw["phase"] = state.phase;
    raw["readiness"] = state.readiness;
    raw["updated_at_ms"] = state.updated_at_ms;
    raw["metrics"] = {
        {"total_trades", state.metrics.total_trades},
        {"window_trades", state.metrics.window_trades},
        {"win_rate", state.metrics.win_rate},
        {"recent_win_rate", state.metrics.recent_win_rate},
        {"avg_pnl", state.metrics.avg_pnl},
        {"avg_return", state.metrics.avg_return},
        {"profit_factor", state.metrics.profit_factor},
        {"sharpe_ratio", state.metrics.sharpe_ratio},
        {"max_drawdown", state.metrics.max_drawdown},
        {"consistency", state.metrics.consistency}
    };
    raw["breakdown"] = {
        {"data_volume", state.breakdown.data_volume},
        {"stability", state.breakdown.stability},
        {"trajectory", state.breakdown.trajectory},
        {"risk_quality", state.breakdown.risk_quality},
        {"diversity", state.breakdown.diversity}
    };
    return writeJsonAtomic(file_path_, raw);
}

} // namespace core
} // namespace tradeguard
