#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/contracts/ILedgerStore.h"

namespace tradeguard {
namespace core {

// Single JSON document holding every Position and Trade, rewritten
// atomically on each upsert.
class LedgerStoreJson : public ILedgerStore {
public:
    explicit LedgerStoreJson(std::filesystem::path file_path);

    bool savePosition(const Position& position) override;
    bool saveTrade(const Trade& trade) override;
    std::vector<Position> loadPositions() override;
    std::vector<Trade> loadTrades() override;

    // False after the file was found unreadable or written by a newer schema;
    // writes are then refused so the file is left untouched.
    bool isWritable();
    const std::filesystem::path& path() const { return file_path_; }

    static nlohmann::json toJson(const Position& position);
    static nlohmann::json toJson(const Trade& trade);
    static Position positionFromJson(const nlohmann::json& raw);
    static Trade tradeFromJson(const nlohmann::json& raw);

private:
    void ensureLoaded();
    bool flush();

    std::filesystem::path file_path_;
    std::mutex mutex_;
    bool loaded_ = false;
    bool writable_ = true;
    std::map<std::string, Position> positions_;
    std::map<std::string, Trade> trades_;
};

} // namespace core
} // namespace tradeguard
