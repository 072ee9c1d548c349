#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace tradeguard {

// Loads engine settings from a JSON file. Every key is optional; absent keys
// keep the defaults declared in EngineConfig.h.
class Config {
public:
    Config() = default;

    // Returns false when the file is missing or malformed (defaults are kept).
    bool load(const std::string& config_path);
    void apply(const nlohmann::json& j);

    const engine::EngineConfig& getEngineConfig() const { return engine_config_; }
    const risk::RiskProfile& getRiskProfile() const { return engine_config_.risk; }
    const std::string& getLogLevel() const { return engine_config_.log_level; }
    const std::string& getLogDir() const { return engine_config_.log_dir; }

private:
    engine::EngineConfig engine_config_;
};

} // namespace tradeguard
