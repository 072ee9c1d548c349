#include "core/model/Signal.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace tradeguard;
using tradeguard::core::SignalAction;
using tradeguard::core::validateSignal;

int main() {
    {
        nlohmann::json payload = {
            {"action", "buy"}, {"symbol", "BTC/USD"}, {"price", 65000.0},
            {"quantity", 0.001}, {"confidence", 0.8}, {"strategy", "momentum"},
            {"timestamp_ms", 1700000000000LL}
        };
        auto v = validateSignal(payload);
        assert(v.valid);
        assert(v.error == ErrorKind::NONE);
        assert(v.signal.action == SignalAction::BUY);
        assert(v.signal.symbol == "BTC/USD");
        assert(v.signal.quantity && std::abs(*v.signal.quantity - 0.001) < 1e-12);
        assert(v.signal.size_hint == 1.0);
        assert(v.signal.strategy_name == "momentum");
        assert(v.signal.timestamp_ms == 1700000000000LL);
    }

    {
        nlohmann::json payload = {{"action", "CLOSE"}, {"symbol", "ETH/USD"}, {"price", 3000}};
        auto v = validateSignal(payload);
        assert(v.valid);
        assert(v.signal.action == SignalAction::CLOSE);
        assert(!v.signal.quantity);
        assert(v.signal.timestamp_ms > 0);
    }

    {
        nlohmann::json payload = {{"action", "hold"}, {"symbol", "BTC/USD"}, {"price", 1.0}};
        auto v = validateSignal(payload);
        assert(!v.valid);
        assert(v.error == ErrorKind::VALIDATION);
    }

    {
        nlohmann::json payload = {{"action", "BUY"}, {"symbol", "BTC/USD"}, {"price", "65000"}};
        auto v = validateSignal(payload);
        assert(!v.valid);
        assert(v.error == ErrorKind::VALIDATION);
    }

    {
        nlohmann::json payload = {{"action", "BUY"}, {"symbol", "BTC/USD"}, {"price", 10.0}, {"leverage", 5}};
        auto v = validateSignal(payload);
        assert(!v.valid);
        assert(v.reason.find("leverage") != std::string::npos);
    }

    {
        nlohmann::json payload = {{"action", "SELL"}, {"symbol", "BTC/USD"}, {"price", -1.0}};
        assert(!validateSignal(payload).valid);

        payload["price"] = 10.0;
        payload["size_hint"] = 1.5;
        assert(!validateSignal(payload).valid);

        payload["size_hint"] = 0.5;
        payload["confidence"] = 2.0;
        assert(!validateSignal(payload).valid);

        payload["confidence"] = 0.5;
        payload["quantity"] = 0.0;
        assert(!validateSignal(payload).valid);
    }

    {
        assert(!validateSignal(nlohmann::json::array({1, 2})).valid);
        assert(!validateSignal(nlohmann::json{{"symbol", "BTC/USD"}, {"price", 1.0}}).valid);
    }

    {
        core::Signal signal;
        signal.symbol = "BTC/USD";
        signal.price = std::numeric_limits<double>::quiet_NaN();
        auto v = validateSignal(signal);
        assert(!v.valid);
        assert(v.error == ErrorKind::VALIDATION);

        signal.price = 100.0;
        assert(validateSignal(signal).valid);

        signal.symbol.clear();
        assert(!validateSignal(signal).valid);
    }

    std::cout << "[TEST] SignalValidator PASSED\n";
    return 0;
}
