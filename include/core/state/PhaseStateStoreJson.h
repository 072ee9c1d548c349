#pragma once

#include <filesystem>
#include <optional>

#include "core/contracts/IPhaseStateStore.h"

namespace tradeguard {
namespace core {

class PhaseStateStoreJson : public IPhaseStateStore {
public:
    explicit PhaseStateStoreJson(std::filesystem::path file_path);

    std::optional<PhaseState> load() override;
    bool save(const PhaseState& state) override;

private:
    std::filesystem::path file_path_;
};

} // namespace core
} // namespace tradeguard
