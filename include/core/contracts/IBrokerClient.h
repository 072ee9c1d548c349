#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace tradeguard {
namespace core {

struct OrderRequest {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;
    OrderType order_type = OrderType::MARKET;
    std::optional<double> limit_price;
    std::string client_order_id;     // idempotency key, reused for status queries
};

// Venue adapter. Responses are returned raw; their shape differs per venue
// and is normalized by the ExecutionGateway. Implementations may throw on
// transport failure.
class IBrokerClient {
public:
    virtual ~IBrokerClient() = default;

    virtual nlohmann::json placeOrder(const OrderRequest& request) = 0;
    virtual nlohmann::json queryOrder(const std::string& client_order_id) = 0;
};

} // namespace core
} // namespace tradeguard
