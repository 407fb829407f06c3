#ifndef PERPCORE_PRICING_HPP
#define PERPCORE_PRICING_HPP

#include "perpcore/feed.hpp"
#include "perpcore/risk_params.hpp"
#include "perpcore/roller.hpp"
#include "perpcore/types.hpp"

#include <cstdint>

namespace perpcore {

// =============================================================================
// Pricing & Impact
//
// Volumes are X18 fractions of the OI cap. Bid/ask move the mid price by
// e^(delta + lmbda * volume); notional caps are bounded by the reserve the
// feed reports and by the circuit breaker on net minted value.
// =============================================================================

namespace pricing {

// Reference period for the drift bound in data_is_valid(), independent of the
// feed's macro window
constexpr uint64_t DRIFT_REFERENCE_SECONDS = 3000;

// Average of the micro and macro window prices
I128 mid_from_feed(const FeedData& data);

// delta + lmbda * volume. Throws MarketError(SLIPPAGE) above MAX_NATURAL_EXPONENT.
I128 impact_exponent(const RiskParams& params, I128 volume);

// mid * e^-(delta + lmbda * volume), rounded down
I128 bid(const RiskParams& params, const FeedData& data, I128 volume);

// mid * e^(delta + lmbda * volume), rounded up
I128 ask(const RiskParams& params, const FeedData& data, I128 volume);

// lmbda * reserve; unbounded (I128_MAX) without a reserve
I128 front_run_bound(const RiskParams& params, const FeedData& data);

// 2 * delta * reserve * (macro_window / average_block_time); unbounded without a reserve
I128 back_run_bound(const RiskParams& params, const FeedData& data);

I128 cap_notional_adjusted_for_bounds(const RiskParams& params, const FeedData& data, I128 cap);

// minted <= target/2: cap; minted >= 2*target: 0; linear in between
I128 circuit_breaker(const RiskParams& params, const Snapshot& minted, I128 cap);

I128 cap_notional_adjusted_for_circuit_breaker(const RiskParams& params,
                                               const Snapshot& minted, I128 cap);

// notional / price, rounded down
I128 oi_from_notional(I128 notional, I128 price);

I128 notional_from_oi(I128 oi, I128 price);

// oi / cap_oi rounded up. Throws MarketError(SLIPPAGE) when there is no capacity.
I128 volume_from_oi(I128 oi, I128 cap_oi);

// False when either macro price is zero or the macro price moved more than
// e^(drift * DRIFT_REFERENCE_SECONDS) over one macro window
bool data_is_valid(const RiskParams& params, const FeedData& data);

} // namespace pricing

} // namespace perpcore

#endif // PERPCORE_PRICING_HPP
