#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.h"
#include "core/contracts/IBrokerClient.h"

namespace tradeguard {
namespace execution {

// Normalized, Trade-shaped outcome of a venue interaction.
struct TradeResult {
    std::string client_order_id;
    std::string venue_order_id;
    TradeStatus status = TradeStatus::PENDING;
    double requested_quantity = 0.0;
    double filled_quantity = 0.0;
    double filled_avg_price = 0.0;
    double fees = 0.0;

    // Outcome unknown (timeout, unreadable response). Reconcile by status
    // query; never resubmit.
    bool indeterminate = false;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string error;

    bool isFilled() const { return status == TradeStatus::FILLED && filled_quantity > 0.0; }
    bool isDefinitiveFailure() const {
        return !indeterminate && (status == TradeStatus::REJECTED || status == TradeStatus::CANCELLED);
    }
};

struct GatewayOptions {
    std::chrono::milliseconds submit_timeout{15000};
    // Status queries only; a submission always goes out at most once
    int max_query_attempts = 1;
    std::chrono::milliseconds retry_backoff{0};   // doubled after each failed attempt
    // Venue calls still running after their timeout; beyond this new calls are refused
    int max_outstanding_calls = 8;
};

class ExecutionGateway {
public:
    ExecutionGateway(
        std::shared_ptr<core::IBrokerClient> broker,
        std::chrono::milliseconds submit_timeout = std::chrono::milliseconds(15000)
    );
    ExecutionGateway(std::shared_ptr<core::IBrokerClient> broker, const GatewayOptions& options);

    // At most one venue submission. Never throws; never retries.
    TradeResult submit(const core::OrderRequest& request);

    // Status lookup for an earlier submission, by client order id. Connectivity
    // failures are retried with backoff up to max_query_attempts.
    TradeResult queryStatus(const std::string& client_order_id, double requested_quantity);

    std::chrono::milliseconds submitTimeout() const { return options_.submit_timeout; }

    // False from the first connectivity failure until the venue answers again
    bool isVenueReachable() const { return connectivity_failures_ == 0; }
    int connectivityFailures() const { return connectivity_failures_; }
    std::string lastConnectivityError() const;
    int outstandingCalls() const { return *outstanding_; }

    // Folds the shapes of the supported venues into one TradeResult.
    static TradeResult normalize(
        const nlohmann::json& response,
        const std::string& client_order_id,
        double requested_quantity,
        double fallback_price = 0.0
    );

private:
    enum class VenueCall { SUBMIT, QUERY };

    TradeResult callWithTimeout(
        VenueCall kind,
        const std::string& client_order_id,
        double requested_quantity,
        double fallback_price,
        std::function<nlohmann::json()> call
    );

    void recordVenueAnswer();
    void recordConnectivityFailure(const std::string& error);

    std::shared_ptr<core::IBrokerClient> broker_;
    GatewayOptions options_;

    std::atomic<int> connectivity_failures_{0};
    // Shared with worker threads that may outlive the gateway
    std::shared_ptr<std::atomic<int>> outstanding_{std::make_shared<std::atomic<int>>(0)};
    mutable std::mutex error_mutex_;
    std::string last_connectivity_error_;
};

} // namespace execution
} // namespace tradeguard
