#pragma once

#include <atomic>
#include <memory>
#include <optional>

#include "core/contracts/IAccountProvider.h"
#include "ledger/PositionLedger.h"

namespace tradeguard {
namespace execution {

// Simulated account backed by the ledger: equity is starting capital plus
// realized and unrealized P&L, available balance is equity less open notional.
class PaperAccountProvider : public core::IAccountProvider {
public:
    explicit PaperAccountProvider(double initial_capital);

    // Bound after construction; the ledger is created by the engine.
    void attachLedger(std::shared_ptr<const ledger::PositionLedger> ledger);

    std::optional<core::AccountSnapshot> fetchSnapshot() override;

    void setReachable(bool reachable) { reachable_ = reachable; }

private:
    double initial_capital_;
    std::shared_ptr<const ledger::PositionLedger> ledger_;
    std::atomic<bool> reachable_{true};
};

} // namespace execution
} // namespace tradeguard
