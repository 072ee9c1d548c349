#include "risk/RiskGovernor.h"

#include <algorithm>

#include "common/Logger.h"

namespace tradeguard {
namespace risk {

const char* toString(RejectReason reason) {
    switch (reason) {
        case RejectReason::NONE: return "NONE";
        case RejectReason::ACCOUNT_UNREACHABLE: return "ACCOUNT_UNREACHABLE";
        case RejectReason::VENUE_UNREACHABLE: return "VENUE_UNREACHABLE";
        case RejectReason::INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case RejectReason::DAILY_LOSS: return "DAILY_LOSS";
        case RejectReason::DRAWDOWN_EMERGENCY: return "DRAWDOWN_EMERGENCY";
        case RejectReason::MAX_POSITIONS: return "MAX_POSITIONS";
        case RejectReason::ACCOUNT_RISK: return "ACCOUNT_RISK";
        case RejectReason::TOO_SMALL: return "TOO_SMALL";
    }
    return "NONE";
}

RiskGovernor::RiskGovernor(const RiskProfile& profile, double initial_peak_equity)
    : profile_(std::make_shared<const RiskProfile>(profile))
    , peak_equity_(initial_peak_equity)
{
    LOG_INFO("RiskGovernor initialized - risk/trade {:.2f}%, max positions {}, emergency drawdown {:.1f}%",
             profile.risk_per_trade_pct * 100.0, profile.max_positions,
             profile.emergency_stop_loss * 100.0);
}

RiskDecision RiskGovernor::reject(RejectReason reason, ErrorKind kind, std::string message) {
    RiskDecision decision;
    decision.approved = false;
    decision.reject_reason = reason;
    decision.error_kind = kind;
    decision.reason = std::move(message);
    return decision;
}

std::shared_ptr<const RiskProfile> RiskGovernor::profile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return profile_;
}

void RiskGovernor::updateProfile(const RiskProfile& profile) {
    auto next = std::make_shared<const RiskProfile>(profile);
    std::lock_guard<std::mutex> lock(mutex_);
    profile_ = std::move(next);
    LOG_INFO("Risk profile replaced - max positions {}, trade {:.2f}~{:.2f}",
             profile.max_positions, profile.min_trade_amount, profile.max_trade_amount);
}

double RiskGovernor::peakEquity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_equity_;
}

void RiskGovernor::resetPeak(double equity) {
    std::lock_guard<std::mutex> lock(mutex_);
    peak_equity_ = equity;
}

RiskDecision RiskGovernor::preflight(const std::optional<core::AccountSnapshot>& snapshot) const {
    auto current = profile();

    // 1) account reachable
    if (!snapshot) {
        LOG_WARN("Pre-flight failed: account unreachable");
        return reject(RejectReason::ACCOUNT_UNREACHABLE, ErrorKind::CONNECTIVITY,
                      "account snapshot unavailable");
    }

    // 2) balance floor
    if (snapshot->available_balance < current->min_available_balance) {
        LOG_WARN("Pre-flight failed: available {:.2f} < floor {:.2f}",
                 snapshot->available_balance, current->min_available_balance);
        return reject(RejectReason::INSUFFICIENT_BALANCE, ErrorKind::RISK_LIMIT,
                      "available balance below floor");
    }

    // 3) realized loss to date
    if (-snapshot->realized_pnl_to_date > current->max_daily_loss) {
        LOG_WARN("Pre-flight failed: realized loss {:.2f} exceeds daily limit {:.2f}",
                 -snapshot->realized_pnl_to_date, current->max_daily_loss);
        return reject(RejectReason::DAILY_LOSS, ErrorKind::RISK_LIMIT,
                      "daily loss limit reached");
    }

    RiskDecision decision;
    decision.approved = true;
    LOG_INFO("Pre-flight passed - equity {:.2f}, available {:.2f}",
             snapshot->equity, snapshot->available_balance);
    return decision;
}

RiskDecision RiskGovernor::runtimeCheck(const core::AccountSnapshot& snapshot) {
    auto current = profile();

    double peak = 0.0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        peak_equity_ = std::max(peak_equity_, snapshot.equity);
        peak = peak_equity_;
    }

    double drawdown = (peak > 0.0) ? (peak - snapshot.equity) / peak : 0.0;
    if (drawdown >= current->emergency_stop_loss) {
        LOG_ERROR("Drawdown {:.2f}% breached emergency threshold {:.2f}% (peak {:.2f}, equity {:.2f})",
                  drawdown * 100.0, current->emergency_stop_loss * 100.0, peak, snapshot.equity);
        auto decision = reject(RejectReason::DRAWDOWN_EMERGENCY, ErrorKind::EMERGENCY,
                               "emergency drawdown threshold breached");
        decision.emergency_requested = true;
        decision.drawdown = drawdown;
        return decision;
    }

    RiskDecision decision;
    decision.approved = true;
    decision.drawdown = drawdown;
    return decision;
}

RiskDecision RiskGovernor::evaluate(
    const core::Signal& signal,
    const core::AccountSnapshot& snapshot,
    int open_positions,
    double open_notional
) const {
    auto current = profile();
    return evaluate(signal, snapshot, *current, open_positions, open_notional);
}

RiskDecision RiskGovernor::evaluate(
    const core::Signal& signal,
    const core::AccountSnapshot& snapshot,
    const RiskProfile& profile,
    int open_positions,
    double open_notional
) const {
    // 1) concurrent positions
    if (open_positions >= profile.max_positions) {
        LOG_INFO("{} rejected: max positions reached ({}/{})",
                 signal.symbol, open_positions, profile.max_positions);
        return reject(RejectReason::MAX_POSITIONS, ErrorKind::RISK_LIMIT,
                      "max concurrent positions reached");
    }

    // 2) realized loss today
    if (-snapshot.realized_pnl_to_date > profile.max_daily_loss) {
        LOG_INFO("{} rejected: daily loss {:.2f} over limit {:.2f}",
                 signal.symbol, -snapshot.realized_pnl_to_date, profile.max_daily_loss);
        return reject(RejectReason::DAILY_LOSS, ErrorKind::RISK_LIMIT, "daily loss limit reached");
    }

    // 3) sizing
    double notional = std::min({
        snapshot.equity * profile.risk_per_trade_pct,
        snapshot.available_balance * signal.size_hint,
        profile.max_trade_amount
    });
    if (signal.quantity) {
        notional = std::min(notional, *signal.quantity * signal.price);
    }

    if (notional < profile.min_trade_amount) {
        LOG_INFO("{} rejected: notional {:.4f} below minimum {:.2f}",
                 signal.symbol, notional, profile.min_trade_amount);
        auto decision = reject(RejectReason::TOO_SMALL, ErrorKind::RISK_LIMIT,
                               "order notional below minimum trade amount");
        decision.notional = notional;
        return decision;
    }

    // 4) aggregate exposure
    double exposure_cap = profile.max_account_risk_pct * snapshot.equity;
    if (open_notional + notional > exposure_cap) {
        LOG_INFO("{} rejected: exposure {:.2f} + {:.2f} > cap {:.2f}",
                 signal.symbol, open_notional, notional, exposure_cap);
        auto decision = reject(RejectReason::ACCOUNT_RISK, ErrorKind::RISK_LIMIT,
                               "aggregate account risk exceeded");
        decision.notional = notional;
        return decision;
    }

    RiskDecision decision;
    decision.approved = true;
    decision.notional = notional;
    decision.quantity = notional / signal.price;
    LOG_DEBUG("{} sized: notional {:.4f}, quantity {:.8f}", signal.symbol, notional, decision.quantity);
    return decision;
}

} // namespace risk
} // namespace tradeguard
