#ifndef PERPCORE_EVENTS_HPP
#define PERPCORE_EVENTS_HPP

#include "perpcore/types.hpp"

#include <cstdint>
#include <functional>
#include <variant>

namespace perpcore {

// =============================================================================
// Market Events
// =============================================================================

struct BuildEvent {
    Address sender;
    uint64_t position_id;
    I128 oi;            // X18
    I128 debt;          // X18
    bool is_long;
    I128 price;         // Entry price, X18
};

struct UnwindEvent {
    Address sender;
    uint64_t position_id;
    I128 fraction;      // X18
    I128 price;         // Exit price, X18
    I128 mint;          // Signed, X18
};

struct LiquidateEvent {
    Address sender;     // Liquidator
    Address owner;
    uint64_t position_id;
    I128 price;         // Exit price, X18
    I128 mint;          // Signed, X18
};

struct FundingPaidEvent {
    I128 oi_long;       // After funding, X18
    I128 oi_short;      // After funding, X18
    I128 funding_paid;  // Positive: longs paid shorts; negative: shorts paid longs
};

using MarketEvent = std::variant<BuildEvent, UnwindEvent, LiquidateEvent, FundingPaidEvent>;

using EventCallback = std::function<void(const MarketEvent&)>;

} // namespace perpcore

#endif // PERPCORE_EVENTS_HPP
