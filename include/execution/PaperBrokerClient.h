#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <string>

#include "core/contracts/IBrokerClient.h"

namespace tradeguard {
namespace execution {

// In-process venue for paper trading and tests. LIMIT orders fill at their
// limit price, MARKET orders at the last known price of the symbol.
// Responses use an Alpaca-like shape (string quantities).
class PaperBrokerClient : public core::IBrokerClient {
public:
    enum class Behavior {
        FILL,        // fill immediately
        REJECT,      // reject immediately
        ACCEPT,      // accept without fill; resolve later via settle()
        DELAY_FILL,  // fill, but answer after the configured delay
        THROW        // transport failure before the venue sees the order
    };

    explicit PaperBrokerClient(double fee_rate = 0.0);

    nlohmann::json placeOrder(const core::OrderRequest& request) override;
    nlohmann::json queryOrder(const std::string& client_order_id) override;

    void setMarkPrice(const std::string& symbol, double price);
    void setDefaultBehavior(Behavior behavior);
    // Behaviors consumed in order by the next placeOrder calls
    void enqueueBehavior(Behavior behavior);
    void setResponseDelayMs(int delay_ms);
    // Venue-side resolution of an ACCEPTed order
    bool settle(const std::string& client_order_id, bool filled);
    void setQueryUnavailable(bool unavailable);

    int placeCount() const;
    int queryCount() const;

private:
    struct PaperOrder {
        std::string venue_order_id;
        core::OrderRequest request;
        std::string status;
        double filled_quantity = 0.0;
        double filled_avg_price = 0.0;
        double fee = 0.0;
    };

    nlohmann::json toResponse(const std::string& client_order_id, const PaperOrder& order) const;
    void fill(PaperOrder& order);

    double fee_rate_;
    mutable std::mutex mutex_;
    std::map<std::string, double> mark_prices_;
    std::map<std::string, PaperOrder> orders_;  // key: client_order_id
    std::deque<Behavior> scripted_;
    Behavior default_behavior_ = Behavior::FILL;
    int response_delay_ms_ = 0;
    bool query_unavailable_ = false;
    int place_count_ = 0;
    int query_count_ = 0;
    long long next_order_seq_ = 1;
};

} // namespace execution
} // namespace tradeguard
