#include "execution/OrderStateMapper.h"

#include <algorithm>
#include <cctype>

namespace tradeguard {
namespace execution {

namespace {
std::string normalizeState(std::string state) {
    std::transform(state.begin(), state.end(), state.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return state;
}

constexpr double kQuantityEpsilon = 1e-8;
} // namespace

VenueOrderStateResult OrderStateMapper::map(
    const std::string& venue_state,
    double order_quantity,
    double executed_quantity,
    double remaining_quantity
) {
    VenueOrderStateResult result;
    result.filled_quantity = std::max(0.0, executed_quantity);
    if (remaining_quantity > 0.0 && order_quantity > remaining_quantity) {
        result.filled_quantity = std::max(result.filled_quantity, order_quantity - remaining_quantity);
    }

    const std::string state = normalizeState(venue_state);
    const bool fully_filled = order_quantity > 0.0 &&
        result.filled_quantity >= order_quantity - kQuantityEpsilon;

    if (state == "filled" || state == "done" || state == "closed" || state == "executed") {
        result.status = TradeStatus::FILLED;
        result.filled_quantity = (result.filled_quantity > 0.0) ? result.filled_quantity : order_quantity;
        result.terminal = true;
        return result;
    }

    // A cancelled order that already traded keeps its exposure: report the
    // executed part as filled.
    if (state == "cancel" || state == "cancelled" || state == "canceled" || state == "expired") {
        result.status = (result.filled_quantity > kQuantityEpsilon) ? TradeStatus::FILLED : TradeStatus::CANCELLED;
        result.terminal = true;
        return result;
    }

    if (state == "rejected" || state == "reject" || state == "prevented" || state == "failed") {
        result.status = TradeStatus::REJECTED;
        result.terminal = true;
        return result;
    }

    if (state == "partially_filled" || state == "partial_fill" || state == "trade" ||
        state == "new" || state == "accepted" || state == "submitted" || state == "pending" ||
        state == "open" || state == "wait" || state == "pending_new") {
        if (fully_filled) {
            result.status = TradeStatus::FILLED;
            result.terminal = true;
        } else {
            result.status = TradeStatus::PENDING;
        }
        return result;
    }

    result.recognized = false;
    if (fully_filled) {
        result.status = TradeStatus::FILLED;
        result.terminal = true;
    } else {
        result.status = TradeStatus::PENDING;
    }
    return result;
}

} // namespace execution
} // namespace tradeguard
