#ifndef PERPCORE_FEED_HPP
#define PERPCORE_FEED_HPP

#include "perpcore/types.hpp"

#include <cstdint>
#include <shared_mutex>

namespace perpcore {

// =============================================================================
// Feed Data (one aggregated quote)
// =============================================================================

struct FeedData {
    uint64_t timestamp = 0;                 // Market clock (seconds)
    uint64_t micro_window = 0;              // Seconds
    uint64_t macro_window = 0;              // Seconds
    I128 price_over_micro_window = 0;       // X18
    I128 price_over_macro_window = 0;       // X18
    I128 price_one_macro_window_ago = 0;    // X18
    I128 reserve_over_micro_window = 0;     // X18 base units
    bool has_reserve = false;
};

// =============================================================================
// Feed Interface
// =============================================================================

class Feed {
public:
    virtual ~Feed() = default;

    // Latest aggregated quote. The timestamp must never move backwards.
    virtual FeedData latest() const = 0;
};

// =============================================================================
// MockFeed - settable feed for tests and simulation
// =============================================================================

class MockFeed : public Feed {
public:
    MockFeed(I128 price_x18, I128 reserve_x18,
             uint64_t micro_window = 600, uint64_t macro_window = 3600,
             uint64_t timestamp = 1700000000);

    // Non-copyable
    MockFeed(const MockFeed&) = delete;
    MockFeed& operator=(const MockFeed&) = delete;

    FeedData latest() const override;

    // Sets micro, macro and one-window-ago prices together
    void set_price(I128 price_x18);
    void set_prices(I128 micro_x18, I128 macro_x18, I128 ago_x18);

    void set_reserve(I128 reserve_x18);
    void set_has_reserve(bool has_reserve);
    void set_windows(uint64_t micro_window, uint64_t macro_window);

    void set_timestamp(uint64_t timestamp);
    void advance(uint64_t seconds);

private:
    mutable std::shared_mutex mutex_;
    FeedData data_;
};

} // namespace perpcore

#endif // PERPCORE_FEED_HPP
