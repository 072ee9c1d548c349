#include "core/model/Signal.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace tradeguard {
namespace core {

namespace {
SignalValidation fail(const std::string& reason) {
    SignalValidation out;
    out.valid = false;
    out.error = ErrorKind::VALIDATION;
    out.reason = reason;
    return out;
}

std::string upperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

bool parseAction(const std::string& raw, SignalAction& out) {
    const std::string action = upperCopy(raw);
    if (action == "BUY") { out = SignalAction::BUY; return true; }
    if (action == "SELL") { out = SignalAction::SELL; return true; }
    if (action == "CLOSE") { out = SignalAction::CLOSE; return true; }
    return false;
}

bool isFinitePositive(double v) {
    return std::isfinite(v) && v > 0.0;
}
} // namespace

const char* toString(SignalAction action) {
    switch (action) {
        case SignalAction::BUY: return "BUY";
        case SignalAction::SELL: return "SELL";
        case SignalAction::CLOSE: return "CLOSE";
    }
    return "BUY";
}

SignalValidation validateSignal(const Signal& signal) {
    if (signal.symbol.empty()) {
        return fail("symbol is empty");
    }
    if (!isFinitePositive(signal.price)) {
        return fail("price must be a positive number");
    }
    if (!std::isfinite(signal.size_hint) || signal.size_hint <= 0.0 || signal.size_hint > 1.0) {
        return fail("size_hint must be in (0, 1]");
    }
    if (signal.quantity && !isFinitePositive(*signal.quantity)) {
        return fail("quantity must be a positive number");
    }
    if (!std::isfinite(signal.confidence) || signal.confidence < 0.0 || signal.confidence > 1.0) {
        return fail("confidence must be in [0, 1]");
    }
    if (signal.timestamp_ms < 0) {
        return fail("timestamp_ms must not be negative");
    }

    SignalValidation out;
    out.valid = true;
    out.signal = signal;
    return out;
}

SignalValidation validateSignal(const nlohmann::json& payload) {
    if (!payload.is_object()) {
        return fail("payload is not an object");
    }

    static const char* const kKnownKeys[] = {
        "action", "symbol", "price", "size_hint", "quantity",
        "confidence", "strategy", "timestamp_ms"
    };
    for (auto it = payload.begin(); it != payload.end(); ++it) {
        const bool known = std::any_of(std::begin(kKnownKeys), std::end(kKnownKeys),
                                       [&](const char* k) { return it.key() == k; });
        if (!known) {
            return fail("unknown field: " + it.key());
        }
    }

    Signal signal;

    if (!payload.contains("action") || !payload["action"].is_string()) {
        return fail("action must be a string");
    }
    if (!parseAction(payload["action"].get<std::string>(), signal.action)) {
        return fail("unknown action: " + payload["action"].get<std::string>());
    }

    if (!payload.contains("symbol") || !payload["symbol"].is_string()) {
        return fail("symbol must be a string");
    }
    signal.symbol = payload["symbol"].get<std::string>();

    if (!payload.contains("price") || !payload["price"].is_number()) {
        return fail("price must be a number");
    }
    signal.price = payload["price"].get<double>();

    if (payload.contains("size_hint")) {
        if (!payload["size_hint"].is_number()) {
            return fail("size_hint must be a number");
        }
        signal.size_hint = payload["size_hint"].get<double>();
    }

    if (payload.contains("quantity") && !payload["quantity"].is_null()) {
        if (!payload["quantity"].is_number()) {
            return fail("quantity must be a number");
        }
        signal.quantity = payload["quantity"].get<double>();
    }

    if (payload.contains("confidence")) {
        if (!payload["confidence"].is_number()) {
            return fail("confidence must be a number");
        }
        signal.confidence = payload["confidence"].get<double>();
    }

    if (payload.contains("strategy")) {
        if (!payload["strategy"].is_string()) {
            return fail("strategy must be a string");
        }
        signal.strategy_name = payload["strategy"].get<std::string>();
    }

    if (payload.contains("timestamp_ms")) {
        if (!payload["timestamp_ms"].is_number_integer()) {
            return fail("timestamp_ms must be an integer");
        }
        signal.timestamp_ms = payload["timestamp_ms"].get<long long>();
    } else {
        signal.timestamp_ms = nowEpochMs();
    }

    return validateSignal(signal);
}

} // namespace core
} // namespace tradeguard
