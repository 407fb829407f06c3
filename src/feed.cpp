// =============================================================================
// feed.cpp - Mock Feed
// =============================================================================

#include "perpcore/feed.hpp"

#include <mutex>
#include <stdexcept>

namespace perpcore {

MockFeed::MockFeed(I128 price_x18, I128 reserve_x18,
                   uint64_t micro_window, uint64_t macro_window,
                   uint64_t timestamp) {
    data_.timestamp = timestamp;
    data_.micro_window = micro_window;
    data_.macro_window = macro_window;
    data_.price_over_micro_window = price_x18;
    data_.price_over_macro_window = price_x18;
    data_.price_one_macro_window_ago = price_x18;
    data_.reserve_over_micro_window = reserve_x18;
    data_.has_reserve = true;
}

FeedData MockFeed::latest() const {
    std::shared_lock lock(mutex_);
    return data_;
}

void MockFeed::set_price(I128 price_x18) {
    set_prices(price_x18, price_x18, price_x18);
}

void MockFeed::set_prices(I128 micro_x18, I128 macro_x18, I128 ago_x18) {
    std::unique_lock lock(mutex_);
    data_.price_over_micro_window = micro_x18;
    data_.price_over_macro_window = macro_x18;
    data_.price_one_macro_window_ago = ago_x18;
}

void MockFeed::set_reserve(I128 reserve_x18) {
    std::unique_lock lock(mutex_);
    data_.reserve_over_micro_window = reserve_x18;
}

void MockFeed::set_has_reserve(bool has_reserve) {
    std::unique_lock lock(mutex_);
    data_.has_reserve = has_reserve;
}

void MockFeed::set_windows(uint64_t micro_window, uint64_t macro_window) {
    std::unique_lock lock(mutex_);
    data_.micro_window = micro_window;
    data_.macro_window = macro_window;
}

void MockFeed::set_timestamp(uint64_t timestamp) {
    std::unique_lock lock(mutex_);
    if (timestamp < data_.timestamp) {
        throw std::invalid_argument("feed timestamp cannot move backwards");
    }
    data_.timestamp = timestamp;
}

void MockFeed::advance(uint64_t seconds) {
    std::unique_lock lock(mutex_);
    data_.timestamp += seconds;
}

} // namespace perpcore
