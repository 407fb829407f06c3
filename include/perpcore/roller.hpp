#ifndef PERPCORE_ROLLER_HPP
#define PERPCORE_ROLLER_HPP

#include "perpcore/types.hpp"

#include <cstdint>

namespace perpcore {

// =============================================================================
// Decay Snapshot
//
// A rolling aggregate whose contribution decays linearly to zero over its
// window. Used for ask/bid volume (fractions of the OI cap) and for the
// signed amount minted (circuit breaker).
// =============================================================================

struct Snapshot {
    uint64_t timestamp = 0;   // Last roll time (seconds)
    uint64_t window = 0;      // Value-weighted decay window (seconds)
    I128 accumulator = 0;     // X18, signed

    I128 cumulative() const { return accumulator; }

    bool operator==(const Snapshot& other) const {
        return timestamp == other.timestamp && window == other.window &&
               accumulator == other.accumulator;
    }
    bool operator!=(const Snapshot& other) const { return !(*this == other); }
};

namespace roller {

// Roll `last` forward to `timestamp` and add `value` under `window`.
// Throws ArithmeticError if `timestamp` precedes last.timestamp.
Snapshot transform(const Snapshot& last, uint64_t timestamp, uint64_t window, I128 value);

// Prior accumulator decayed to `timestamp`, without adding anything
I128 decayed(const Snapshot& last, uint64_t timestamp);

} // namespace roller

} // namespace perpcore

#endif // PERPCORE_ROLLER_HPP
