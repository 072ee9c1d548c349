#pragma once

#include "common/Types.h"
#include <string>

namespace tradeguard {
namespace execution {

struct VenueOrderStateResult {
    TradeStatus status = TradeStatus::PENDING;
    double filled_quantity = 0.0;
    bool terminal = false;
    bool recognized = true;   // false when the venue state word is unknown
};

// Maps a venue's order-state vocabulary onto TradeStatus.
class OrderStateMapper {
public:
    static VenueOrderStateResult map(
        const std::string& venue_state,
        double order_quantity,
        double executed_quantity,
        double remaining_quantity = 0.0
    );
};

} // namespace execution
} // namespace tradeguard
