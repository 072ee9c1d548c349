#pragma once

#include <string>

namespace tradeguard {
namespace core {

enum class EngineEventType {
    STATE_CHANGED,
    HEALTH_CHANGED,
    POSITION_OPENED,
    POSITION_CLOSED,
    CLOSE_FAILED,
    SIGNAL_REJECTED,
    RESTART_ATTEMPT,
    EMERGENCY_STOP,
    PHASE_CHANGED
};

inline const char* toString(EngineEventType type) {
    switch (type) {
        case EngineEventType::STATE_CHANGED: return "STATE_CHANGED";
        case EngineEventType::HEALTH_CHANGED: return "HEALTH_CHANGED";
        case EngineEventType::POSITION_OPENED: return "POSITION_OPENED";
        case EngineEventType::POSITION_CLOSED: return "POSITION_CLOSED";
        case EngineEventType::CLOSE_FAILED: return "CLOSE_FAILED";
        case EngineEventType::SIGNAL_REJECTED: return "SIGNAL_REJECTED";
        case EngineEventType::RESTART_ATTEMPT: return "RESTART_ATTEMPT";
        case EngineEventType::EMERGENCY_STOP: return "EMERGENCY_STOP";
        case EngineEventType::PHASE_CHANGED: return "PHASE_CHANGED";
    }
    return "STATE_CHANGED";
}

struct EngineEvent {
    EngineEventType type = EngineEventType::STATE_CHANGED;
    long long timestamp_ms = 0;
    std::string symbol;
    std::string message;

    // PHASE_CHANGED
    int previous_phase = 0;
    int phase = 0;

    double value = 0.0;   // pnl, drawdown or readiness depending on type
};

} // namespace core
} // namespace tradeguard
