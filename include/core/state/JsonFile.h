#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace tradeguard {
namespace core {

// Version written by the JSON stores. Files with a newer version are refused.
constexpr int kStateSchemaVersion = 1;

// Write to <path>.tmp then rename over <path>; copy fallback when rename fails.
bool writeJsonAtomic(const std::filesystem::path& path, const nlohmann::json& raw);

// std::nullopt when the file is missing; error set when it exists but cannot be parsed.
std::optional<nlohmann::json> readJsonFile(const std::filesystem::path& path, std::string* error = nullptr);

} // namespace core
} // namespace tradeguard
