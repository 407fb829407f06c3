#ifndef PERPCORE_FUNDING_HPP
#define PERPCORE_FUNDING_HPP

#include "perpcore/position.hpp"
#include "perpcore/risk_params.hpp"
#include "perpcore/types.hpp"

#include <cstdint>

namespace perpcore {

// =============================================================================
// Funding
//
// The side with more OI pays the side with less. Over dt seconds the OI
// imbalance decays by e^(-2 k dt) and the total OI is conserved. When the
// lighter side holds no shares, the heavier side decays by the same factor
// and the paid OI leaves the market.
// =============================================================================

struct FundingResult {
    I128 oi_long = 0;
    I128 oi_short = 0;
    I128 paid = 0;          // OI moved off the overweight side
    bool longs_paid = false;
};

namespace funding {

// e^(-2 k dt); zero once the exponent passes MAX_NATURAL_EXPONENT
I128 decay_factor(I128 k, uint64_t dt);

// Shares are unchanged by funding; only the side OI values move.
// k == 0 or dt == 0 returns the inputs exactly.
FundingResult oi_after_funding(const RiskParams& params, const OiAggregate& longs,
                               const OiAggregate& shorts, uint64_t dt);

} // namespace funding

} // namespace perpcore

#endif // PERPCORE_FUNDING_HPP
