#ifndef PERPCORE_MARKET_HPP
#define PERPCORE_MARKET_HPP

#include "perpcore/events.hpp"
#include "perpcore/feed.hpp"
#include "perpcore/ledger.hpp"
#include "perpcore/position.hpp"
#include "perpcore/risk_params.hpp"
#include "perpcore/roller.hpp"
#include "perpcore/types.hpp"

#include <cstdint>
#include <optional>

namespace perpcore {

// =============================================================================
// Market Configuration
// =============================================================================

struct MarketConfig {
    Address address;        // Market's own account on the ledger
    Address fee_recipient;  // Receives trading fees and leftover liquidation margin
};

// =============================================================================
// Market State (everything an operation stages before commit)
// =============================================================================

struct MarketState {
    OiAggregate longs;
    OiAggregate shorts;
    Snapshot volume_ask;
    Snapshot volume_bid;
    Snapshot minted;
    uint64_t timestamp_update_last = 0;
};

// =============================================================================
// Market - build / unwind / liquidate state machine
//
// Every state-changing call runs under a reentrancy lock, reads one risk
// parameter snapshot, stages funding and all mutations on a copy of the
// state, settles with the ledger as one atomic batch, and only then commits.
// A throwing call leaves market and ledger untouched. Events are delivered
// after commit; an exception thrown by the callback propagates to the caller.
// =============================================================================

class Market {
public:
    Market(Feed& feed, Ledger& ledger, const ParamsStore& params, const MarketConfig& config);
    ~Market() = default;

    // Non-copyable
    Market(const Market&) = delete;
    Market& operator=(const Market&) = delete;

    void set_event_callback(EventCallback callback);

    // =========================================================================
    // State-Changing Operations
    // =========================================================================

    // Opens a position and returns its id. collateral, leverage and
    // price_limit are X18; the trader pays collateral plus the trading fee.
    uint64_t build(const Address& owner, I128 collateral, I128 leverage,
                   bool is_long, I128 price_limit);

    // Closes `fraction` (X18, in (0, 1]) of an open position
    void unwind(const Address& owner, uint64_t position_id, I128 fraction, I128 price_limit);

    // Closes a liquidatable position on behalf of any caller
    void liquidate(const Address& liquidator, const Address& owner, uint64_t position_id);

    // Applies funding once per distinct feed timestamp and returns the feed data
    FeedData update();

    // =========================================================================
    // Positions
    // =========================================================================

    // Open record, nullopt when missing, closed or liquidated
    std::optional<Position> position(const Address& owner, uint64_t position_id) const;
    PositionState position_state(const Address& owner, uint64_t position_id) const;

    // Evaluated at the current exit price with pending funding applied.
    // value() and liquidation_price() throw MarketError(POSITION_NOT_FOUND).
    bool liquidatable(const Address& owner, uint64_t position_id) const;
    I128 value(const Address& owner, uint64_t position_id) const;
    I128 liquidation_price(const Address& owner, uint64_t position_id) const;

    uint64_t next_position_id() const { return next_position_id_; }
    size_t open_positions() const { return positions_.open_count(); }

    // =========================================================================
    // Aggregates and Snapshots
    // =========================================================================

    I128 oi_long() const { return state_.longs.oi; }
    I128 oi_short() const { return state_.shorts.oi; }
    I128 oi_long_shares() const { return state_.longs.shares; }
    I128 oi_short_shares() const { return state_.shorts.shares; }

    const Snapshot& snapshot_volume_ask() const { return state_.volume_ask; }
    const Snapshot& snapshot_volume_bid() const { return state_.volume_bid; }
    const Snapshot& snapshot_minted() const { return state_.minted; }

    uint64_t timestamp_update_last() const { return state_.timestamp_update_last; }

    I128 params(RiskParameter param) const;

    const Address& address() const { return config_.address; }
    const Address& fee_recipient() const { return config_.fee_recipient; }

    // =========================================================================
    // Pricing Queries (current parameter snapshot)
    // =========================================================================

    bool data_is_valid(const FeedData& data) const;
    I128 mid_from_feed(const FeedData& data) const;
    I128 ask(const FeedData& data, I128 volume) const;
    I128 bid(const FeedData& data, I128 volume) const;
    I128 front_run_bound(const FeedData& data) const;
    I128 back_run_bound(const FeedData& data) const;
    I128 cap_notional_adjusted_for_bounds(const FeedData& data, I128 cap) const;
    I128 cap_notional_adjusted_for_circuit_breaker(I128 cap) const;
    I128 circuit_breaker(const Snapshot& minted, I128 cap) const;
    I128 oi_from_notional(I128 notional, I128 price) const;

private:
    class Lock;

    struct Staged {
        MarketState state;
        std::optional<FundingPaidEvent> funding;
    };

    struct ExitQuote {
        I128 price;
        I128 oi_unwound;
        Snapshot volume;   // Rolled opposite-side volume snapshot
    };

    FeedData read_feed(const RiskParams& params) const;
    Staged stage_update(const RiskParams& params, const FeedData& data) const;
    ExitQuote quote_exit(const RiskParams& params, const FeedData& data,
                         const MarketState& state, const Position& pos, I128 fraction) const;
    const Position& open_position(const PositionKey& key) const;

    void emit(const MarketEvent& event);

    Feed& feed_;
    Ledger& ledger_;
    const ParamsStore& params_;
    MarketConfig config_;
    EventCallback callback_;

    MarketState state_;
    PositionLedger positions_;
    uint64_t next_position_id_ = 0;
    bool locked_ = false;
};

} // namespace perpcore

#endif // PERPCORE_MARKET_HPP
