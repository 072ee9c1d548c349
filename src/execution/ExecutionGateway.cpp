#include "execution/ExecutionGateway.h"
#include "execution/OrderStateMapper.h"

#include "common/Logger.h"

#include <algorithm>
#include <functional>
#include <future>
#include <initializer_list>
#include <thread>

namespace tradeguard {
namespace execution {

namespace {
// Venues disagree on numeric encoding; accept numbers and numeric strings.
double parseJsonNumber(const nlohmann::json& node, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (!node.contains(key)) {
            continue;
        }
        const auto& value = node[key];
        if (value.is_number()) {
            return value.get<double>();
        }
        if (value.is_string()) {
            try {
                return std::stod(value.get<std::string>());
            } catch (const std::exception&) {
                continue;
            }
        }
    }
    return 0.0;
}

std::string parseJsonString(const nlohmann::json& node, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (!node.contains(key)) {
            continue;
        }
        const auto& value = node[key];
        if (value.is_string()) {
            return value.get<std::string>();
        }
        if (value.is_number_integer()) {
            return std::to_string(value.get<long long>());
        }
        if (value.is_array() && !value.empty() && value.front().is_string()) {
            return value.front().get<std::string>();
        }
    }
    return "";
}

std::string parseError(const nlohmann::json& node) {
    for (const char* key : {"error", "errors", "reject_reason", "message"}) {
        if (!node.contains(key)) {
            continue;
        }
        const auto& value = node[key];
        if (value.is_string() && !value.get<std::string>().empty()) {
            return value.get<std::string>();
        }
        if (value.is_array() && !value.empty()) {
            return value.front().is_string() ? value.front().get<std::string>() : value.front().dump();
        }
        if (value.is_object()) {
            const std::string message = parseJsonString(value, {"message", "name", "code"});
            if (!message.empty()) {
                return message;
            }
        }
    }
    return "";
}
} // namespace

ExecutionGateway::ExecutionGateway(
    std::shared_ptr<core::IBrokerClient> broker,
    std::chrono::milliseconds submit_timeout
)
    : broker_(std::move(broker))
{
    options_.submit_timeout = submit_timeout;
}

ExecutionGateway::ExecutionGateway(std::shared_ptr<core::IBrokerClient> broker, const GatewayOptions& options)
    : broker_(std::move(broker))
    , options_(options) {}

std::string ExecutionGateway::lastConnectivityError() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_connectivity_error_;
}

void ExecutionGateway::recordVenueAnswer() {
    if (connectivity_failures_.exchange(0) > 0) {
        LOG_INFO("Venue reachable again");
    }
}

void ExecutionGateway::recordConnectivityFailure(const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        last_connectivity_error_ = error;
    }
    ++connectivity_failures_;
}

TradeResult ExecutionGateway::normalize(
    const nlohmann::json& response,
    const std::string& client_order_id,
    double requested_quantity,
    double fallback_price
) {
    TradeResult result;
    result.client_order_id = client_order_id;
    result.requested_quantity = requested_quantity;

    if (!response.is_object()) {
        result.indeterminate = true;
        result.error_kind = ErrorKind::PARTIAL_EXECUTION;
        result.error = "unreadable venue response";
        return result;
    }

    // Some venues wrap the payload: {"error": [...], "result": {...}}
    const std::string top_error = parseError(response);
    const nlohmann::json& body = (response.contains("result") && response["result"].is_object())
        ? response["result"]
        : response;

    result.venue_order_id = parseJsonString(body, {"order_id", "orderId", "id", "uuid", "txid"});

    const std::string state = parseJsonString(body, {"status", "state", "ord_status", "order_status"});
    const double executed = parseJsonNumber(body, {
        "filled_quantity", "filled_qty", "filledQty", "executed_volume", "executedQty", "vol_exec"
    });
    const double remaining = parseJsonNumber(body, {"remaining_quantity", "remaining_volume", "leavesQty"});
    result.filled_avg_price = parseJsonNumber(body, {
        "filled_avg_price", "avg_price", "average_price", "avgPrice", "price"
    });
    result.fees = parseJsonNumber(body, {"fees", "fee", "commission"});

    const std::string error = top_error.empty() ? parseError(body) : top_error;

    if (state.empty() && !error.empty()) {
        result.status = TradeStatus::REJECTED;
        result.error_kind = ErrorKind::PARTIAL_EXECUTION;
        result.error = error;
        return result;
    }

    const auto mapped = OrderStateMapper::map(state, requested_quantity, executed, remaining);
    result.status = mapped.status;
    result.filled_quantity = mapped.filled_quantity;
    result.error = error;

    if (result.status == TradeStatus::FILLED && result.filled_avg_price <= 0.0) {
        result.filled_avg_price = fallback_price;
    }
    if (result.status == TradeStatus::FILLED && result.filled_avg_price <= 0.0) {
        // A fill without a price cannot be booked.
        result.status = TradeStatus::PENDING;
        result.indeterminate = true;
        result.error_kind = ErrorKind::PARTIAL_EXECUTION;
        result.error = "fill reported without price";
        return result;
    }
    if (result.status == TradeStatus::PENDING) {
        result.indeterminate = true;
        if (!mapped.recognized) {
            result.error_kind = ErrorKind::PARTIAL_EXECUTION;
            if (result.error.empty()) {
                result.error = "unknown venue state: " + state;
            }
        }
    }
    if (result.isDefinitiveFailure()) {
        result.error_kind = ErrorKind::PARTIAL_EXECUTION;
    }
    return result;
}

TradeResult ExecutionGateway::callWithTimeout(
    VenueCall kind,
    const std::string& client_order_id,
    double requested_quantity,
    double fallback_price,
    std::function<nlohmann::json()> call
) {
    const char* operation = (kind == VenueCall::SUBMIT) ? "submit" : "status query";
    TradeResult result;
    result.client_order_id = client_order_id;
    result.requested_quantity = requested_quantity;
    result.error_kind = ErrorKind::CONNECTIVITY;

    // Refused before anything reaches the venue: a submission is definitively
    // not placed, a status query simply stays unresolved.
    auto refuse = [&](const std::string& error) {
        result.error = error;
        if (kind == VenueCall::SUBMIT) {
            result.status = TradeStatus::REJECTED;
        } else {
            result.indeterminate = true;
        }
        recordConnectivityFailure(error);
        return result;
    };

    if (!broker_) {
        return refuse("no venue configured");
    }

    const int outstanding = *outstanding_;
    if (outstanding >= options_.max_outstanding_calls) {
        LOG_WARN("Venue {} refused: {} earlier calls still outstanding (client_order_id={})",
                 operation, outstanding, client_order_id);
        return refuse(std::string(operation) + " refused: " + std::to_string(outstanding) +
                      " venue calls still outstanding");
    }

    // The worker owns the task; a call that outlives the timeout finishes in
    // the background and its answer is picked up by a later status query.
    auto task = std::make_shared<std::packaged_task<nlohmann::json()>>(std::move(call));
    auto future = task->get_future();
    auto counter = outstanding_;
    ++*counter;
    std::thread([task, counter]() {
        (*task)();
        --*counter;
    }).detach();

    if (future.wait_for(options_.submit_timeout) != std::future_status::ready) {
        LOG_WARN("Venue {} timed out after {} ms (client_order_id={})",
                 operation, options_.submit_timeout.count(), client_order_id);
        result.indeterminate = true;
        result.error = std::string(operation) + " timed out";
        recordConnectivityFailure(result.error);
        return result;
    }

    nlohmann::json response;
    try {
        response = future.get();
    } catch (const std::exception& e) {
        LOG_WARN("Venue {} failed (client_order_id={}): {}", operation, client_order_id, e.what());
        result.error = e.what();
        // A submit that failed in transport may still have reached the venue.
        result.indeterminate = true;
        recordConnectivityFailure(result.error);
        return result;
    }

    recordVenueAnswer();
    return normalize(response, client_order_id, requested_quantity, fallback_price);
}

TradeResult ExecutionGateway::submit(const core::OrderRequest& request) {
    const double fallback_price = request.limit_price.value_or(0.0);
    LOG_INFO("Submitting {} {} {:.8f} (client_order_id={})",
             toString(request.side), request.symbol, request.quantity, request.client_order_id);

    auto broker = broker_;
    auto result = callWithTimeout(
        VenueCall::SUBMIT, request.client_order_id, request.quantity, fallback_price,
        [broker, request]() { return broker->placeOrder(request); }
    );

    LOG_INFO("Venue result: client_order_id={}, status={}, filled={:.8f} @ {:.8f}, indeterminate={}{}{}",
             result.client_order_id, toString(result.status), result.filled_quantity,
             result.filled_avg_price, result.indeterminate ? "true" : "false",
             result.error.empty() ? "" : ", error=", result.error);
    return result;
}

TradeResult ExecutionGateway::queryStatus(const std::string& client_order_id, double requested_quantity) {
    auto broker = broker_;
    const int attempts = std::max(1, options_.max_query_attempts);
    auto backoff = options_.retry_backoff;

    TradeResult result;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        result = callWithTimeout(
            VenueCall::QUERY, client_order_id, requested_quantity, 0.0,
            [broker, client_order_id]() { return broker->queryOrder(client_order_id); }
        );
        if (result.error_kind != ErrorKind::CONNECTIVITY) {
            return result;
        }
        if (attempt < attempts) {
            LOG_WARN("Status query for {} failed (attempt {}/{}), retry in {} ms",
                     client_order_id, attempt, attempts, backoff.count());
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }
    return result;
}

} // namespace execution
} // namespace tradeguard
