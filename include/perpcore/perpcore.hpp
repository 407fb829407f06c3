#ifndef PERPCORE_PERPCORE_HPP
#define PERPCORE_PERPCORE_HPP

// =============================================================================
// perpcore - Perpetual Market Accounting Core
//
//   fixed_point  X18 arithmetic, exp/ln
//   roller       Decaying volume / mint accumulators
//   position     Position records, valuation, arena ledger
//   risk_params  Bounded parameters, versioned store
//   pricing      Bid/ask impact, notional caps, circuit breaker
//   funding      OI imbalance decay
//   ledger       Token ledger, atomic settlement
//   market       build / unwind / liquidate / update
//
// =============================================================================

#include "perpcore/types.hpp"
#include "perpcore/errors.hpp"
#include "perpcore/fixed_point.hpp"
#include "perpcore/roller.hpp"
#include "perpcore/position.hpp"
#include "perpcore/risk_params.hpp"
#include "perpcore/feed.hpp"
#include "perpcore/pricing.hpp"
#include "perpcore/funding.hpp"
#include "perpcore/ledger.hpp"
#include "perpcore/events.hpp"
#include "perpcore/market.hpp"
#include "perpcore/config.hpp"
#include "perpcore/logging.hpp"

#endif // PERPCORE_PERPCORE_HPP
