#include "execution/PaperAccountProvider.h"

#include <algorithm>

namespace tradeguard {
namespace execution {

PaperAccountProvider::PaperAccountProvider(double initial_capital)
    : initial_capital_(initial_capital) {}

void PaperAccountProvider::attachLedger(std::shared_ptr<const ledger::PositionLedger> ledger) {
    ledger_ = std::move(ledger);
}

std::optional<core::AccountSnapshot> PaperAccountProvider::fetchSnapshot() {
    if (!reachable_) {
        return std::nullopt;
    }

    core::AccountSnapshot snapshot;
    snapshot.taken_at_ms = nowEpochMs();
    snapshot.equity = initial_capital_;
    snapshot.available_balance = initial_capital_;

    if (ledger_) {
        const auto summary = ledger_->portfolioSummary();
        snapshot.realized_pnl_to_date = summary.realized_pnl;
        snapshot.equity = initial_capital_ + summary.realized_pnl + summary.unrealized_pnl;
        snapshot.available_balance = std::max(0.0, initial_capital_ + summary.realized_pnl - summary.open_notional);
    }
    return snapshot;
}

} // namespace execution
} // namespace tradeguard
