// =============================================================================
// funding.cpp - OI Imbalance Decay
// =============================================================================

#include "perpcore/funding.hpp"
#include "perpcore/fixed_point.hpp"

namespace perpcore {
namespace funding {

I128 decay_factor(I128 k, uint64_t dt) {
    if (k == 0 || dt == 0) return X18_ONE;

    // k is per second, so 2 * k * dt is already X18
    I128 pow = x18::mul_div(2 * k, static_cast<I128>(dt), 1);
    if (pow > x18::MAX_NATURAL_EXPONENT) return 0;
    return x18::exp(-pow);
}

FundingResult oi_after_funding(const RiskParams& params, const OiAggregate& longs,
                               const OiAggregate& shorts, uint64_t dt) {
    FundingResult result;
    result.oi_long = longs.oi;
    result.oi_short = shorts.oi;

    if (params.k() == 0 || dt == 0 || longs.oi == shorts.oi) {
        return result;
    }

    bool longs_over = longs.oi > shorts.oi;
    const OiAggregate& over = longs_over ? longs : shorts;
    const OiAggregate& under = longs_over ? shorts : longs;

    I128 factor = decay_factor(params.k(), dt);

    I128 over_after;
    I128 under_after;
    if (under.shares == 0) {
        over_after = x18::mul_down(over.oi, factor);
        under_after = under.oi;
    } else {
        I128 total = x18::add(over.oi, under.oi);
        I128 imbalance = x18::mul_down(over.oi - under.oi, factor);
        over_after = (total + imbalance) / 2;
        under_after = total - over_after;
    }

    result.paid = over.oi - over_after;
    result.longs_paid = longs_over;
    result.oi_long = longs_over ? over_after : under_after;
    result.oi_short = longs_over ? under_after : over_after;
    return result;
}

} // namespace funding
} // namespace perpcore
