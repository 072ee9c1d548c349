#pragma once

#include <vector>

#include "common/Types.h"

namespace tradeguard {
namespace core {

// Durable home for ledger records. Upserts are keyed by record id.
class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    virtual bool savePosition(const Position& position) = 0;
    virtual bool saveTrade(const Trade& trade) = 0;
    virtual std::vector<Position> loadPositions() = 0;
    virtual std::vector<Trade> loadTrades() = 0;
};

} // namespace core
} // namespace tradeguard
