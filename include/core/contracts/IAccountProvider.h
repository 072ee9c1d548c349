#pragma once

#include <optional>

namespace tradeguard {
namespace core {

struct AccountSnapshot {
    double equity = 0.0;
    double available_balance = 0.0;
    double realized_pnl_to_date = 0.0;
    long long taken_at_ms = 0;
};

class IAccountProvider {
public:
    virtual ~IAccountProvider() = default;

    // std::nullopt when the account is unreachable
    virtual std::optional<AccountSnapshot> fetchSnapshot() = 0;
};

} // namespace core
} // namespace tradeguard
