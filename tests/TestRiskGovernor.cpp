#include "risk/RiskGovernor.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace tradeguard;
using tradeguard::risk::RejectReason;
using tradeguard::risk::RiskGovernor;
using tradeguard::risk::RiskProfile;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

core::AccountSnapshot account(double equity, double available, double realized = 0.0) {
    core::AccountSnapshot snapshot;
    snapshot.equity = equity;
    snapshot.available_balance = available;
    snapshot.realized_pnl_to_date = realized;
    return snapshot;
}

core::Signal buy(double price, double size_hint = 1.0) {
    core::Signal signal;
    signal.action = core::SignalAction::BUY;
    signal.symbol = "BTC/USD";
    signal.price = price;
    signal.size_hint = size_hint;
    return signal;
}
} // namespace

int main() {
    RiskProfile profile;
    profile.risk_per_trade_pct = 0.02;
    profile.max_daily_loss = 500.0;
    profile.max_account_risk_pct = 0.5;
    profile.emergency_stop_loss = 0.20;
    profile.max_positions = 2;
    profile.min_trade_amount = 10.0;
    profile.max_trade_amount = 150.0;
    profile.min_available_balance = 50.0;

    // ===== Pre-flight =====
    {
        RiskGovernor governor(profile);
        auto unreachable = governor.preflight(std::nullopt);
        assert(!unreachable.approved);
        assert(unreachable.reject_reason == RejectReason::ACCOUNT_UNREACHABLE);
        assert(unreachable.error_kind == ErrorKind::CONNECTIVITY);

        auto poor = governor.preflight(account(1000.0, 20.0));
        assert(!poor.approved);
        assert(poor.reject_reason == RejectReason::INSUFFICIENT_BALANCE);
        assert(poor.error_kind == ErrorKind::RISK_LIMIT);

        auto losing = governor.preflight(account(1000.0, 1000.0, -600.0));
        assert(!losing.approved);
        assert(losing.reject_reason == RejectReason::DAILY_LOSS);

        assert(governor.preflight(account(1000.0, 1000.0)).approved);
    }

    // ===== Sizing =====
    {
        RiskGovernor governor(profile);

        // equity 5000 x 2% = 100 is the binding bound
        auto d = governor.evaluate(buy(50.0), account(5000.0, 5000.0), 0, 0.0);
        assert(d.approved);
        assert(near(d.notional, 100.0));
        assert(near(d.quantity, 2.0));

        // available x size_hint binds
        d = governor.evaluate(buy(50.0, 0.01), account(5000.0, 2000.0), 0, 0.0);
        assert(d.approved);
        assert(near(d.notional, 20.0));

        // max_trade_amount binds
        d = governor.evaluate(buy(50.0), account(100000.0, 100000.0), 0, 0.0);
        assert(d.approved);
        assert(near(d.notional, 150.0));

        // explicit quantity caps the notional
        auto capped = buy(65000.0);
        capped.quantity = 0.001;
        d = governor.evaluate(capped, account(10000.0, 10000.0), 0, 0.0);
        assert(d.approved);
        assert(near(d.notional, 65.0));
        assert(near(d.quantity, 0.001));

        // below the minimum trade amount
        d = governor.evaluate(buy(50.0), account(400.0, 400.0), 0, 0.0);
        assert(!d.approved);
        assert(d.reject_reason == RejectReason::TOO_SMALL);
        assert(d.error_kind == ErrorKind::RISK_LIMIT);
    }

    // ===== Limits =====
    {
        RiskGovernor governor(profile);

        auto full = governor.evaluate(buy(50.0), account(5000.0, 5000.0), 2, 0.0);
        assert(!full.approved);
        assert(full.reject_reason == RejectReason::MAX_POSITIONS);

        auto loss = governor.evaluate(buy(50.0), account(5000.0, 5000.0, -501.0), 0, 0.0);
        assert(!loss.approved);
        assert(loss.reject_reason == RejectReason::DAILY_LOSS);

        // 2450 open + 100 new > 50% of 5000
        auto exposed = governor.evaluate(buy(50.0), account(5000.0, 5000.0), 1, 2450.0);
        assert(!exposed.approved);
        assert(exposed.reject_reason == RejectReason::ACCOUNT_RISK);
    }

    // ===== Drawdown =====
    {
        RiskGovernor governor(profile, 10000.0);
        auto ok = governor.runtimeCheck(account(12000.0, 12000.0));
        assert(ok.approved);
        assert(near(governor.peakEquity(), 12000.0));

        auto dip = governor.runtimeCheck(account(10000.0, 10000.0));
        assert(dip.approved);
        assert(!dip.emergency_requested);

        // 21% below the 12000 peak
        auto breach = governor.runtimeCheck(account(9480.0, 9480.0));
        assert(!breach.approved);
        assert(breach.emergency_requested);
        assert(breach.reject_reason == RejectReason::DRAWDOWN_EMERGENCY);
        assert(breach.error_kind == ErrorKind::EMERGENCY);
        assert(near(breach.drawdown, 0.21, 1e-6));
    }

    // ===== Profile replacement =====
    {
        RiskGovernor governor(profile);
        auto before = governor.profile();

        RiskProfile stricter = profile;
        stricter.max_positions = 0;
        governor.updateProfile(stricter);

        assert(before->max_positions == 2);
        assert(governor.profile()->max_positions == 0);
        assert(!governor.evaluate(buy(50.0), account(5000.0, 5000.0), 0, 0.0).approved);
        assert(governor.evaluate(buy(50.0), account(5000.0, 5000.0), *before, 0, 0.0).approved);
    }

    std::cout << "[TEST] RiskGovernor PASSED\n";
    return 0;
}
