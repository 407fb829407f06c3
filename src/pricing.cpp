// =============================================================================
// pricing.cpp - Bid/Ask, Notional Caps, Feed Validity
// =============================================================================

#include "perpcore/pricing.hpp"
#include "perpcore/errors.hpp"
#include "perpcore/fixed_point.hpp"

namespace perpcore {
namespace pricing {

I128 mid_from_feed(const FeedData& data) {
    return x18::add(data.price_over_micro_window, data.price_over_macro_window) / 2;
}

// =============================================================================
// Bid / Ask
// =============================================================================

I128 impact_exponent(const RiskParams& params, I128 volume) {
    I128 delta = params.delta();
    I128 lmbda = params.lmbda();
    if (lmbda == 0) return delta;

    // Largest volume whose impact still fits under the exponent cap
    I128 max_volume = x18::div_down(x18::MAX_NATURAL_EXPONENT - delta, lmbda);
    if (volume > max_volume) {
        throw MarketError(Reason::SLIPPAGE);
    }
    return delta + x18::mul_down(lmbda, volume);
}

I128 bid(const RiskParams& params, const FeedData& data, I128 volume) {
    I128 pow = impact_exponent(params, volume);
    return x18::mul_down(mid_from_feed(data), x18::exp(-pow));
}

I128 ask(const RiskParams& params, const FeedData& data, I128 volume) {
    I128 pow = impact_exponent(params, volume);
    return x18::mul_up(mid_from_feed(data), x18::exp(pow));
}

// =============================================================================
// Notional Caps
// =============================================================================

I128 front_run_bound(const RiskParams& params, const FeedData& data) {
    if (!data.has_reserve) return I128_MAX;
    return x18::mul_down(params.lmbda(), data.reserve_over_micro_window);
}

I128 back_run_bound(const RiskParams& params, const FeedData& data) {
    if (!data.has_reserve) return I128_MAX;

    // Number of blocks in one macro window, X18
    I128 blocks = x18::mul_div(static_cast<I128>(data.macro_window), X18_ONE,
                               static_cast<I128>(params.average_block_time()));
    I128 per_block = x18::mul_down(2 * params.delta(), data.reserve_over_micro_window);
    return x18::mul_down(per_block, blocks);
}

I128 cap_notional_adjusted_for_bounds(const RiskParams& params, const FeedData& data, I128 cap) {
    if (!data.has_reserve) return cap;
    cap = x18::min(cap, front_run_bound(params, data));
    cap = x18::min(cap, back_run_bound(params, data));
    return cap;
}

I128 circuit_breaker(const RiskParams& params, const Snapshot& minted, I128 cap) {
    I128 target = params.circuit_breaker_mint_target();
    I128 amount = minted.cumulative();

    if (amount <= target / 2) return cap;
    if (amount >= 2 * target) return 0;

    // target > 0 here; scale falls linearly from 1 at target to 0 at 2*target
    I128 scale = X18_TWO - x18::div_down(amount, target);
    return x18::mul_down(cap, scale);
}

I128 cap_notional_adjusted_for_circuit_breaker(const RiskParams& params,
                                               const Snapshot& minted, I128 cap) {
    return x18::min(cap, circuit_breaker(params, minted, cap));
}

// =============================================================================
// OI Conversions
// =============================================================================

I128 oi_from_notional(I128 notional, I128 price) {
    return x18::div_down(notional, price);
}

I128 notional_from_oi(I128 oi, I128 price) {
    return x18::mul_down(oi, price);
}

I128 volume_from_oi(I128 oi, I128 cap_oi) {
    if (oi == 0) return 0;
    if (cap_oi <= 0) {
        throw MarketError(Reason::SLIPPAGE);
    }
    return x18::div_up(oi, cap_oi);
}

// =============================================================================
// Feed Validity
// =============================================================================

bool data_is_valid(const RiskParams& params, const FeedData& data) {
    I128 price_now = data.price_over_macro_window;
    I128 price_ago = data.price_one_macro_window_ago;
    if (price_now == 0 || price_ago == 0) return false;

    I128 pow = params.price_drift_upper_limit() * static_cast<I128>(DRIFT_REFERENCE_SECONDS);
    I128 upper = x18::mul_up(price_ago, x18::exp(pow));
    I128 lower = x18::mul_down(price_ago, x18::exp(-pow));
    return price_now >= lower && price_now <= upper;
}

} // namespace pricing
} // namespace perpcore
