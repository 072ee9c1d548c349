#include "execution/ExecutionGateway.h"
#include "execution/PaperBrokerClient.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <thread>

using namespace tradeguard;
using tradeguard::execution::ExecutionGateway;
using tradeguard::execution::PaperBrokerClient;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

core::OrderRequest limitBuy(const std::string& cid, double qty, double price) {
    core::OrderRequest request;
    request.symbol = "BTC/USD";
    request.side = OrderSide::BUY;
    request.quantity = qty;
    request.order_type = OrderType::LIMIT;
    request.limit_price = price;
    request.client_order_id = cid;
    return request;
}
} // namespace

int main() {
    // ===== Response shapes =====
    {
        // Alpaca: string quantities
        nlohmann::json response = {
            {"id", "a-1"}, {"client_order_id", "c1"}, {"status", "filled"},
            {"filled_qty", "0.50000000"}, {"filled_avg_price", "100.5"}, {"commission", 0.13}
        };
        auto r = ExecutionGateway::normalize(response, "c1", 0.5);
        assert(r.status == TradeStatus::FILLED);
        assert(r.isFilled());
        assert(!r.indeterminate);
        assert(r.venue_order_id == "a-1");
        assert(near(r.filled_quantity, 0.5));
        assert(near(r.filled_avg_price, 100.5));
        assert(near(r.fees, 0.13));
    }

    {
        // Kraken: wrapped result, txid array
        nlohmann::json response = {
            {"error", nlohmann::json::array()},
            {"result", {{"txid", {"OQCLML-BW3P3-BUCMWZ"}}, {"status", "closed"},
                        {"vol_exec", "2.0"}, {"price", "30.0"}, {"fee", "0.05"}}}
        };
        auto r = ExecutionGateway::normalize(response, "c2", 2.0);
        assert(r.status == TradeStatus::FILLED);
        assert(r.venue_order_id == "OQCLML-BW3P3-BUCMWZ");
        assert(near(r.filled_quantity, 2.0));
        assert(near(r.filled_avg_price, 30.0));
    }

    {
        // Binance: numeric order id, partial fill still open
        nlohmann::json response = {
            {"orderId", 28}, {"status", "PARTIALLY_FILLED"}, {"executedQty", "0.3"}, {"price", "10.0"}
        };
        auto r = ExecutionGateway::normalize(response, "c3", 1.0);
        assert(r.status == TradeStatus::PENDING);
        assert(r.indeterminate);
        assert(r.venue_order_id == "28");
        assert(near(r.filled_quantity, 0.3));
    }

    {
        // Error-only payload is a definitive rejection
        nlohmann::json response = {{"error", {"EOrder:Insufficient funds"}}};
        auto r = ExecutionGateway::normalize(response, "c4", 1.0);
        assert(r.status == TradeStatus::REJECTED);
        assert(r.isDefinitiveFailure());
        assert(r.error == "EOrder:Insufficient funds");
        assert(r.error_kind == ErrorKind::PARTIAL_EXECUTION);
    }

    {
        nlohmann::json response = {{"status", "mystery"}};
        auto r = ExecutionGateway::normalize(response, "c5", 1.0);
        assert(r.indeterminate);
        assert(r.status == TradeStatus::PENDING);
        assert(!r.isDefinitiveFailure());
    }

    {
        auto r = ExecutionGateway::normalize(nlohmann::json("garbage"), "c6", 1.0);
        assert(r.indeterminate);
    }

    {
        // Fill without a price falls back to the limit price
        nlohmann::json response = {{"status", "filled"}, {"filled_qty", "1"}};
        auto r = ExecutionGateway::normalize(response, "c7", 1.0, 42.0);
        assert(r.isFilled());
        assert(near(r.filled_avg_price, 42.0));
    }

    // ===== Submission =====
    {
        auto broker = std::make_shared<PaperBrokerClient>(0.001);
        ExecutionGateway gateway(broker, std::chrono::milliseconds(1000));

        auto filled = gateway.submit(limitBuy("g-1", 0.01, 50000.0));
        assert(filled.isFilled());
        assert(near(filled.filled_avg_price, 50000.0));
        assert(near(filled.fees, 50000.0 * 0.01 * 0.001));

        broker->enqueueBehavior(PaperBrokerClient::Behavior::REJECT);
        auto rejected = gateway.submit(limitBuy("g-2", 0.01, 50000.0));
        assert(rejected.isDefinitiveFailure());
        assert(!rejected.error.empty());

        broker->enqueueBehavior(PaperBrokerClient::Behavior::THROW);
        auto thrown = gateway.submit(limitBuy("g-3", 0.01, 50000.0));
        assert(thrown.indeterminate);
        assert(thrown.error_kind == ErrorKind::CONNECTIVITY);
        assert(broker->placeCount() == 3);
        assert(!gateway.isVenueReachable());
        assert(gateway.connectivityFailures() == 1);
        assert(gateway.lastConnectivityError() == "paper venue unreachable");

        // Any venue answer, even a rejection, clears the failure streak
        broker->enqueueBehavior(PaperBrokerClient::Behavior::REJECT);
        gateway.submit(limitBuy("g-4", 0.01, 50000.0));
        assert(gateway.isVenueReachable());
    }

    {
        // Status queries are retried with backoff; submissions are not
        auto broker = std::make_shared<PaperBrokerClient>();
        execution::GatewayOptions options;
        options.submit_timeout = std::chrono::milliseconds(1000);
        options.max_query_attempts = 3;
        options.retry_backoff = std::chrono::milliseconds(1);
        ExecutionGateway gateway(broker, options);

        broker->enqueueBehavior(PaperBrokerClient::Behavior::THROW);
        auto thrown = gateway.submit(limitBuy("g-once", 0.01, 100.0));
        assert(thrown.indeterminate);
        assert(broker->placeCount() == 1);

        broker->setQueryUnavailable(true);
        auto status = gateway.queryStatus("g-once", 0.01);
        assert(status.indeterminate);
        assert(status.error_kind == ErrorKind::CONNECTIVITY);
        assert(broker->queryCount() == 3);
        assert(gateway.connectivityFailures() == 4);

        broker->setQueryUnavailable(false);
        auto resolved = gateway.queryStatus("g-once", 0.01);
        assert(!resolved.indeterminate);
        assert(resolved.status == TradeStatus::REJECTED);
        assert(broker->queryCount() == 4);
        assert(gateway.isVenueReachable());
    }

    {
        // Calls still hanging after their timeout cap further venue calls
        auto broker = std::make_shared<PaperBrokerClient>();
        broker->setResponseDelayMs(300);
        broker->enqueueBehavior(PaperBrokerClient::Behavior::DELAY_FILL);
        execution::GatewayOptions options;
        options.submit_timeout = std::chrono::milliseconds(30);
        options.max_outstanding_calls = 1;
        ExecutionGateway gateway(broker, options);

        auto slow = gateway.submit(limitBuy("g-hang", 0.02, 100.0));
        assert(slow.indeterminate);
        assert(gateway.outstandingCalls() == 1);

        // Not sent at all: definitively not placed
        auto refused = gateway.submit(limitBuy("g-next", 0.02, 100.0));
        assert(!refused.indeterminate);
        assert(refused.status == TradeStatus::REJECTED);
        assert(refused.error_kind == ErrorKind::CONNECTIVITY);
        assert(broker->placeCount() == 1);

        auto unresolved = gateway.queryStatus("g-hang", 0.02);
        assert(unresolved.indeterminate);
        assert(broker->queryCount() == 0);
        assert(!gateway.isVenueReachable());

        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        assert(gateway.outstandingCalls() == 0);
        auto status = gateway.queryStatus("g-hang", 0.02);
        assert(status.isFilled());
        assert(gateway.isVenueReachable());
    }

    {
        // Timeout: unknown outcome, resolved later by status query only
        auto broker = std::make_shared<PaperBrokerClient>();
        broker->setResponseDelayMs(300);
        broker->enqueueBehavior(PaperBrokerClient::Behavior::DELAY_FILL);
        ExecutionGateway gateway(broker, std::chrono::milliseconds(50));

        auto r = gateway.submit(limitBuy("g-slow", 0.02, 100.0));
        assert(r.indeterminate);
        assert(r.error_kind == ErrorKind::CONNECTIVITY);
        assert(r.status == TradeStatus::PENDING);

        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        auto status = gateway.queryStatus("g-slow", 0.02);
        assert(status.isFilled());
        assert(near(status.filled_quantity, 0.02));
        assert(broker->placeCount() == 1);
        assert(broker->queryCount() == 1);
    }

    {
        auto broker = std::make_shared<PaperBrokerClient>();
        broker->setDefaultBehavior(PaperBrokerClient::Behavior::ACCEPT);
        ExecutionGateway gateway(broker, std::chrono::milliseconds(1000));

        auto accepted = gateway.submit(limitBuy("g-acc", 1.0, 10.0));
        assert(accepted.indeterminate);

        assert(broker->settle("g-acc", false));
        auto status = gateway.queryStatus("g-acc", 1.0);
        assert(status.status == TradeStatus::CANCELLED);
        assert(status.isDefinitiveFailure());

        broker->setQueryUnavailable(true);
        auto unavailable = gateway.queryStatus("g-acc", 1.0);
        assert(unavailable.indeterminate);
    }

    std::cout << "[TEST] ExecutionGateway PASSED\n";
    return 0;
}
