// =============================================================================
// roller.cpp - Decay Accumulator
// =============================================================================

#include "perpcore/roller.hpp"
#include "perpcore/errors.hpp"
#include "perpcore/fixed_point.hpp"

#include <string>

namespace perpcore {
namespace roller {

namespace {

uint64_t elapsed(const Snapshot& last, uint64_t timestamp) {
    if (timestamp < last.timestamp) {
        throw ArithmeticError("roller timestamp " + std::to_string(timestamp) +
                              " precedes last " + std::to_string(last.timestamp));
    }
    return timestamp - last.timestamp;
}

// Remaining life of the prior window; zero once a full window has elapsed
uint64_t remaining_window(const Snapshot& last, uint64_t dt) {
    if (last.window == 0 || dt >= last.window) return 0;
    return last.window - dt;
}

} // anonymous namespace

I128 decayed(const Snapshot& last, uint64_t timestamp) {
    uint64_t remaining = remaining_window(last, elapsed(last, timestamp));
    if (remaining == 0) return 0;
    return x18::mul_div(last.accumulator, static_cast<I128>(remaining),
                        static_cast<I128>(last.window));
}

Snapshot transform(const Snapshot& last, uint64_t timestamp, uint64_t window, I128 value) {
    uint64_t remaining = remaining_window(last, elapsed(last, timestamp));

    I128 prior = remaining == 0
        ? 0
        : x18::mul_div(last.accumulator, static_cast<I128>(remaining),
                       static_cast<I128>(last.window));

    Snapshot next;
    next.timestamp = timestamp;
    next.accumulator = x18::add(prior, value);

    // Window blend is weighted by magnitude; the sign stays in the accumulator
    I128 w_prior = abs128(prior);
    I128 w_value = abs128(value);
    I128 denom = x18::add(w_prior, w_value);
    if (denom == 0) {
        next.window = window;
    } else {
        I128 blended = x18::mul_div(static_cast<I128>(remaining), w_prior, denom) +
                       x18::mul_div(static_cast<I128>(window), w_value, denom);
        next.window = static_cast<uint64_t>(blended);
    }
    return next;
}

} // namespace roller
} // namespace perpcore
