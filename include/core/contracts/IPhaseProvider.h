#pragma once

#include "core/model/PhaseState.h"

namespace tradeguard {
namespace core {

// Read-only view of the aggressiveness phase for signal-scoring collaborators.
class IPhaseProvider {
public:
    virtual ~IPhaseProvider() = default;

    virtual int currentPhase() const = 0;
    virtual PhaseState snapshot() const = 0;
};

} // namespace core
} // namespace tradeguard
