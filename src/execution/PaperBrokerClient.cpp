#include "execution/PaperBrokerClient.h"

#include <chrono>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <thread>

namespace tradeguard {
namespace execution {

namespace {
std::string formatQuantity(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(8) << value;
    return oss.str();
}
} // namespace

PaperBrokerClient::PaperBrokerClient(double fee_rate)
    : fee_rate_(fee_rate) {}

void PaperBrokerClient::setMarkPrice(const std::string& symbol, double price) {
    std::lock_guard<std::mutex> lock(mutex_);
    mark_prices_[symbol] = price;
}

void PaperBrokerClient::setDefaultBehavior(Behavior behavior) {
    std::lock_guard<std::mutex> lock(mutex_);
    default_behavior_ = behavior;
}

void PaperBrokerClient::enqueueBehavior(Behavior behavior) {
    std::lock_guard<std::mutex> lock(mutex_);
    scripted_.push_back(behavior);
}

void PaperBrokerClient::setResponseDelayMs(int delay_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    response_delay_ms_ = delay_ms;
}

void PaperBrokerClient::setQueryUnavailable(bool unavailable) {
    std::lock_guard<std::mutex> lock(mutex_);
    query_unavailable_ = unavailable;
}

int PaperBrokerClient::placeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return place_count_;
}

int PaperBrokerClient::queryCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_count_;
}

void PaperBrokerClient::fill(PaperOrder& order) {
    double price = 0.0;
    if (order.request.order_type == OrderType::LIMIT && order.request.limit_price) {
        price = *order.request.limit_price;
    } else {
        auto it = mark_prices_.find(order.request.symbol);
        if (it != mark_prices_.end()) {
            price = it->second;
        }
    }

    if (price <= 0.0) {
        order.status = "rejected";
        return;
    }

    order.status = "filled";
    order.filled_quantity = order.request.quantity;
    order.filled_avg_price = price;
    order.fee = price * order.request.quantity * fee_rate_;
    mark_prices_[order.request.symbol] = price;
}

nlohmann::json PaperBrokerClient::toResponse(const std::string& client_order_id, const PaperOrder& order) const {
    nlohmann::json response;
    response["id"] = order.venue_order_id;
    response["client_order_id"] = client_order_id;
    response["symbol"] = order.request.symbol;
    response["side"] = (order.request.side == OrderSide::BUY) ? "buy" : "sell";
    response["qty"] = formatQuantity(order.request.quantity);
    response["status"] = order.status;
    response["filled_qty"] = formatQuantity(order.filled_quantity);
    if (order.filled_avg_price > 0.0) {
        response["filled_avg_price"] = formatQuantity(order.filled_avg_price);
    } else {
        response["filled_avg_price"] = nullptr;
    }
    response["commission"] = order.fee;
    if (order.status == "rejected") {
        response["reject_reason"] = "paper venue rejected the order";
    }
    return response;
}

nlohmann::json PaperBrokerClient::placeOrder(const core::OrderRequest& request) {
    Behavior behavior;
    int delay_ms = 0;
    nlohmann::json response;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++place_count_;
        if (!scripted_.empty()) {
            behavior = scripted_.front();
            scripted_.pop_front();
        } else {
            behavior = default_behavior_;
        }

        if (behavior == Behavior::THROW) {
            throw std::runtime_error("paper venue unreachable");
        }

        auto existing = orders_.find(request.client_order_id);
        if (existing != orders_.end()) {
            // Duplicate client order id: the venue answers with the first order.
            return toResponse(request.client_order_id, existing->second);
        }

        PaperOrder order;
        order.venue_order_id = "paper-" + std::to_string(next_order_seq_++);
        order.request = request;
        order.status = "new";

        switch (behavior) {
            case Behavior::FILL:
            case Behavior::DELAY_FILL:
                fill(order);
                break;
            case Behavior::REJECT:
                order.status = "rejected";
                break;
            case Behavior::ACCEPT:
            case Behavior::THROW:
                break;
        }

        orders_[request.client_order_id] = order;
        response = toResponse(request.client_order_id, order);
        delay_ms = (behavior == Behavior::DELAY_FILL) ? response_delay_ms_ : 0;
    }

    if (delay_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }
    return response;
}

nlohmann::json PaperBrokerClient::queryOrder(const std::string& client_order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++query_count_;
    if (query_unavailable_) {
        throw std::runtime_error("paper venue status endpoint unavailable");
    }

    auto it = orders_.find(client_order_id);
    if (it == orders_.end()) {
        nlohmann::json response;
        response["client_order_id"] = client_order_id;
        response["status"] = "rejected";
        response["reject_reason"] = "order not found";
        return response;
    }
    return toResponse(client_order_id, it->second);
}

bool PaperBrokerClient::settle(const std::string& client_order_id, bool filled) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(client_order_id);
    if (it == orders_.end() || it->second.status != "new") {
        return false;
    }
    if (filled) {
        fill(it->second);
    } else {
        it->second.status = "canceled";
    }
    return true;
}

} // namespace execution
} // namespace tradeguard
