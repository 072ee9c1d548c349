#pragma once

#include <optional>

#include "core/model/PhaseState.h"

namespace tradeguard {
namespace core {

class IPhaseStateStore {
public:
    virtual ~IPhaseStateStore() = default;

    virtual std::optional<PhaseState> load() = 0;
    virtual bool save(const PhaseState& state) = 0;
};

} // namespace core
} // namespace tradeguard
