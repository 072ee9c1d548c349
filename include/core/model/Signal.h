#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace tradeguard {
namespace core {

enum class SignalAction { BUY, SELL, CLOSE };

// Already-scored directional input. Only produced by validateSignal(), so a
// Signal in hand always satisfies the ranges below.
struct Signal {
    SignalAction action = SignalAction::BUY;
    std::string symbol;
    double price = 0.0;                  // reference price, > 0
    double size_hint = 1.0;              // fraction of available balance, (0, 1]
    std::optional<double> quantity;      // explicit quantity, > 0
    double confidence = 0.0;             // [0, 1]
    std::string strategy_name;
    long long timestamp_ms = 0;
};

struct SignalValidation {
    bool valid = false;
    Signal signal;
    ErrorKind error = ErrorKind::NONE;
    std::string reason;
};

// Strict parser for the ingestion boundary: unknown actions, missing or
// mistyped fields and out-of-range values fail as ErrorKind::VALIDATION.
SignalValidation validateSignal(const nlohmann::json& payload);

// Re-checks a programmatically built signal against the same rules.
SignalValidation validateSignal(const Signal& signal);

const char* toString(SignalAction action);

} // namespace core
} // namespace tradeguard
