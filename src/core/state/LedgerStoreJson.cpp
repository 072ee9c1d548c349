#include "core/state/LedgerStoreJson.h"

#include "common/Logger.h"
#include "core/state/JsonFile.h"

namespace tradeguard {
namespace core {

namespace {
OrderSide parseOrderSide(const std::string& value) {
    return (value == "SELL") ? OrderSide::SELL : OrderSide::BUY;
}

PositionSide parsePositionSide(const std::string& value) {
    return (value == "SHORT") ? PositionSide::SHORT : PositionSide::LONG;
}

PositionStatus parsePositionStatus(const std::string& value) {
    if (value == "CLOSED") return PositionStatus::CLOSED;
    if (value == "CLOSING") return PositionStatus::CLOSING;
    return PositionStatus::OPEN;
}

TradeStatus parseTradeStatus(const std::string& value) {
    if (value == "FILLED") return TradeStatus::FILLED;
    if (value == "REJECTED") return TradeStatus::REJECTED;
    if (value == "CANCELLED") return TradeStatus::CANCELLED;
    return TradeStatus::PENDING;
}
} // namespace

LedgerStoreJson::LedgerStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

nlohmann::json LedgerStoreJson::toJson(const Position& position) {
    nlohmann::json raw;
    raw["id"] = position.id;
    raw["symbol"] = position.symbol;
    raw["side"] = toString(position.side);
    raw["quantity"] = position.quantity;
    raw["original_quantity"] = position.original_quantity;
    raw["entry_price"] = position.entry_price;
    raw["current_price"] = position.current_price;
    raw["stop_loss"] = position.stop_loss ? nlohmann::json(*position.stop_loss) : nlohmann::json(nullptr);
    raw["take_profit"] = position.take_profit ? nlohmann::json(*position.take_profit) : nlohmann::json(nullptr);
    raw["entry_time"] = position.entry_time;
    raw["status"] = toString(position.status);
    raw["strategy"] = position.strategy_name;
    raw["external_order_id"] = position.external_order_id;
    raw["entry_trade_id"] = position.entry_trade_id;
    raw["exit_trade_id"] = position.exit_trade_id;
    raw["exit_price"] = position.exit_price;
    raw["exit_time"] = position.exit_time;
    raw["realized_pnl"] = position.realized_pnl;
    raw["unrealized_pnl"] = position.unrealized_pnl;
    raw["exit_retry_pending"] = position.exit_retry_pending;
    raw["close_reason"] = position.close_reason;
    return raw;
}

nlohmann::json LedgerStoreJson::toJson(const Trade& trade) {
    nlohmann::json raw;
    raw["id"] = trade.id;
    raw["symbol"] = trade.symbol;
    raw["side"] = toString(trade.side);
    raw["quantity"] = trade.quantity;
    raw["price"] = trade.price;
    raw["fees"] = trade.fees;
    raw["timestamp"] = trade.timestamp;
    raw["position_id"] = trade.position_id;
    raw["is_entry"] = trade.is_entry;
    raw["status"] = toString(trade.status);
    raw["strategy"] = trade.strategy_name;
    raw["client_order_id"] = trade.client_order_id;
    raw["venue_order_id"] = trade.venue_order_id;
    raw["error"] = trade.error;
    return raw;
}

Position LedgerStoreJson::positionFromJson(const nlohmann::json& raw) {
    Position position;
    position.id = raw.value("id", std::string());
    position.symbol = raw.value("symbol", std::string());
    position.side = parsePositionSide(raw.value("side", std::string("LONG")));
    position.quantity = raw.value("quantity", 0.0);
    position.original_quantity = raw.value("original_quantity", position.quantity);
    position.entry_price = raw.value("entry_price", 0.0);
    position.current_price = raw.value("current_price", 0.0);
    if (raw.contains("stop_loss") && raw["stop_loss"].is_number()) {
        position.stop_loss = raw["stop_loss"].get<double>();
    }
    if (raw.contains("take_profit") && raw["take_profit"].is_number()) {
        position.take_profit = raw["take_profit"].get<double>();
    }
    position.entry_time = raw.value("entry_time", 0LL);
    position.status = parsePositionStatus(raw.value("status", std::string("OPEN")));
    position.strategy_name = raw.value("strategy", std::string());
    position.external_order_id = raw.value("external_order_id", std::string());
    position.entry_trade_id = raw.value("entry_trade_id", std::string());
    position.exit_trade_id = raw.value("exit_trade_id", std::string());
    position.exit_price = raw.value("exit_price", 0.0);
    position.exit_time = raw.value("exit_time", 0LL);
    position.realized_pnl = raw.value("realized_pnl", 0.0);
    position.unrealized_pnl = raw.value("unrealized_pnl", 0.0);
    position.exit_retry_pending = raw.value("exit_retry_pending", false);
    position.close_reason = raw.value("close_reason", std::string());
    return position;
}

Trade LedgerStoreJson::tradeFromJson(const nlohmann::json& raw) {
    Trade trade;
    trade.id = raw.value("id", std::string());
    trade.symbol = raw.value("symbol", std::string());
    trade.side = parseOrderSide(raw.value("side", std::string("BUY")));
    trade.quantity = raw.value("quantity", 0.0);
    trade.price = raw.value("price", 0.0);
    trade.fees = raw.value("fees", 0.0);
    trade.timestamp = raw.value("timestamp", 0LL);
    trade.position_id = raw.value("position_id", std::string());
    trade.is_entry = raw.value("is_entry", true);
    trade.status = parseTradeStatus(raw.value("status", std::string("PENDING")));
    trade.strategy_name = raw.value("strategy", std::string());
    trade.client_order_id = raw.value("client_order_id", std::string());
    trade.venue_order_id = raw.value("venue_order_id", std::string());
    trade.error = raw.value("error", std::string());
    return trade;
}

// Caller holds mutex_
void LedgerStoreJson::ensureLoaded() {
    if (loaded_) {
        return;
    }
    loaded_ = true;

    std::string error;
    auto raw = readJsonFile(file_path_, &error);
    if (!raw) {
        if (!error.empty()) {
            LOG_ERROR("Ledger store {} unreadable ({}); writes disabled", file_path_.string(), error);
            writable_ = false;
        }
        return;
    }
    if (!raw->is_object()) {
        LOG_ERROR("Ledger store {} is not a JSON object; writes disabled", file_path_.string());
        writable_ = false;
        return;
    }

    const int version = raw->value("schema_version", 1);
    if (version > kStateSchemaVersion) {
        LOG_ERROR("Ledger store {} has schema_version {} (supported {}); writes disabled",
                  file_path_.string(), version, kStateSchemaVersion);
        writable_ = false;
        return;
    }

    try {
        for (const auto& item : raw->value("positions", nlohmann::json::array())) {
            auto position = positionFromJson(item);
            positions_[position.id] = position;
        }
        for (const auto& item : raw->value("trades", nlohmann::json::array())) {
            auto trade = tradeFromJson(item);
            trades_[trade.id] = trade;
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Ledger store {} malformed ({}); writes disabled", file_path_.string(), e.what());
        positions_.clear();
        trades_.clear();
        writable_ = false;
    }
}

// Caller holds mutex_
bool LedgerStoreJson::flush() {
    nlohmann::json raw;
    raw["schema_version"] = kStateSchemaVersion;
    raw["saved_at_ms"] = nowEpochMs();
    raw["positions"] = nlohmann::json::array();
    raw["trades"] = nlohmann::json::array();
    for (const auto& [id, position] : positions_) {
        raw["positions"].push_back(toJson(position));
    }
    for (const auto& [id, trade] : trades_) {
        raw["trades"].push_back(toJson(trade));
    }
    return writeJsonAtomic(file_path_, raw);
}

bool LedgerStoreJson::isWritable() {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureLoaded();
    return writable_;
}

bool LedgerStoreJson::savePosition(const Position& position) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureLoaded();
    if (!writable_) {
        return false;
    }
    positions_[position.id] = position;
    return flush();
}

bool LedgerStoreJson::saveTrade(const Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureLoaded();
    if (!writable_) {
        return false;
    }
    trades_[trade.id] = trade;
    return flush();
}

std::vector<Position> LedgerStoreJson::loadPositions() {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureLoaded();
    std::vector<Position> result;
    result.reserve(positions_.size());
    for (const auto& [id, position] : positions_) {
        result.push_back(position);
    }
    return result;
}

std::vector<Trade> LedgerStoreJson::loadTrades() {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureLoaded();
    std::vector<Trade> result;
    result.reserve(trades_.size());
    for (const auto& [id, trade] : trades_) {
        result.push_back(trade);
    }
    return result;
}

} // namespace core
} // namespace tradeguard
