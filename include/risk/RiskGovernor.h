#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "common/Types.h"
#include "core/contracts/IAccountProvider.h"
#include "core/model/Signal.h"
#include "risk/RiskProfile.h"

namespace tradeguard {
namespace risk {

enum class RejectReason {
    NONE,
    ACCOUNT_UNREACHABLE,
    VENUE_UNREACHABLE,
    INSUFFICIENT_BALANCE,
    DAILY_LOSS,
    DRAWDOWN_EMERGENCY,
    MAX_POSITIONS,
    ACCOUNT_RISK,
    TOO_SMALL
};

const char* toString(RejectReason reason);

// Result of a pre-flight, runtime or sizing check
struct RiskDecision {
    bool approved = false;
    RejectReason reject_reason = RejectReason::NONE;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string reason;

    double notional = 0.0;
    double quantity = 0.0;

    // Drawdown breach: the caller must run the emergency shutdown
    bool emergency_requested = false;
    double drawdown = 0.0;
};

// Gates and sizes every order. Holds no Position/Trade state; the only state
// is the peak equity used for drawdown.
class RiskGovernor {
public:
    explicit RiskGovernor(const RiskProfile& profile, double initial_peak_equity = 0.0);

    // Once before signals are accepted
    RiskDecision preflight(const std::optional<core::AccountSnapshot>& snapshot) const;

    // Every tick. Tracks peak equity and requests emergency on breach.
    RiskDecision runtimeCheck(const core::AccountSnapshot& snapshot);

    // Sizing for a new position, using the current profile
    RiskDecision evaluate(
        const core::Signal& signal,
        const core::AccountSnapshot& snapshot,
        int open_positions,
        double open_notional
    ) const;

    RiskDecision evaluate(
        const core::Signal& signal,
        const core::AccountSnapshot& snapshot,
        const RiskProfile& profile,
        int open_positions,
        double open_notional
    ) const;

    std::shared_ptr<const RiskProfile> profile() const;
    // Replaces the profile; evaluations already running keep the old one.
    void updateProfile(const RiskProfile& profile);

    double peakEquity() const;
    void resetPeak(double equity);

private:
    static RiskDecision reject(RejectReason reason, ErrorKind kind, std::string message);

    mutable std::mutex mutex_;
    std::shared_ptr<const RiskProfile> profile_;
    double peak_equity_;
};

} // namespace risk
} // namespace tradeguard
