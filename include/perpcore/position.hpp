#ifndef PERPCORE_POSITION_HPP
#define PERPCORE_POSITION_HPP

#include "perpcore/types.hpp"

#include <cstdint>
#include <unordered_map>
#include <variant>
#include <vector>

namespace perpcore {

// =============================================================================
// Aggregate Open Interest (one side of the market)
// =============================================================================

// oi / shares is the funding-adjusted OI per share
struct OiAggregate {
    I128 oi = 0;
    I128 shares = 0;
};

// =============================================================================
// Position Record
// =============================================================================

struct Position {
    I128 notional_initial = 0;  // X18 quote
    I128 debt_initial = 0;      // X18 quote, notional - collateral at build
    I128 mid_ratio = 0;         // X18 entry price / mid price at build; query only
    bool is_long = true;
    bool liquidated = false;    // History only; closed records never reopen
    I128 oi_shares = 0;         // Shares of the side aggregate
    I128 oi_initial = 0;        // OI issued at build, scaled by unwinds

    // Fractional slices (fraction is X18 in (0, 1])
    I128 notional(I128 fraction) const;
    I128 debt(I128 fraction) const;
    I128 shares(I128 fraction) const;
    I128 oi_issued(I128 fraction) const;

    // Build price, frozen for the position's lifetime
    I128 entry_price() const;

    // Funding-adjusted OI of `fraction` of the position
    I128 oi_current(I128 fraction, const OiAggregate& side) const;

    // Collateral backing `fraction` of the position
    I128 cost(I128 fraction) const;

    // Funding-adjusted notional plus PnL at `price`, floored at zero.
    // Long gains per unit are capped at cap_payoff * entry.
    I128 notional_with_pnl(I128 fraction, const OiAggregate& side,
                           I128 price, I128 cap_payoff) const;

    // Payout to the trader: notional_with_pnl - debt, floored at zero
    I128 value(I128 fraction, const OiAggregate& side,
               I128 price, I128 cap_payoff) const;

    // value * (1 - liquidation_fee_rate) < notional_initial * maintenance_margin_fraction
    bool liquidatable(const OiAggregate& side, I128 price, I128 cap_payoff,
                      I128 maintenance_margin_fraction, I128 liquidation_fee_rate) const;

    // Price at which the whole position becomes liquidatable
    I128 liquidation_price(const OiAggregate& side, I128 maintenance_margin_fraction,
                           I128 liquidation_fee_rate) const;

    // What remains after unwinding `fraction`; mid_ratio is unchanged
    Position remainder(I128 fraction) const;
};

namespace position {

// entry / mid, the ratio stored at build
I128 calc_mid_ratio(I128 entry_price, I128 mid_price);

} // namespace position

// =============================================================================
// Position Key (owner, id)
// =============================================================================

struct PositionKey {
    Address owner;
    uint64_t id;

    uint64_t hash() const {
        uint64_t h = addresses::hash(owner);
        h = h * 31 + id;
        return h;
    }

    bool operator==(const PositionKey& other) const {
        return owner == other.owner && id == other.id;
    }
};

struct PositionKeyHash {
    size_t operator()(const PositionKey& key) const {
        return static_cast<size_t>(key.hash());
    }
};

// =============================================================================
// Position Ledger
//
// Arena of records addressed through a hash index on (owner, id). Each slot
// is either an open Position or a ClosedPosition; a closed slot never
// reopens and is reported as absent by find().
// =============================================================================

enum class PositionState : uint8_t {
    NONE,        // Never built
    OPEN,
    CLOSED,      // Fully unwound
    LIQUIDATED
};

struct ClosedPosition {
    Position last;      // Record as it stood just before closing
    bool liquidated;
};

class PositionLedger {
public:
    PositionLedger() = default;

    // Throws std::logic_error if the key was ever used
    void insert(const PositionKey& key, const Position& pos);

    // Open record, or nullptr when missing or closed
    const Position* find(const PositionKey& key) const;

    // Replace an open record. Throws MarketError(POSITION_NOT_FOUND) if not open.
    void update(const PositionKey& key, const Position& pos);

    // Close an open record. Throws MarketError(POSITION_NOT_FOUND) if not open.
    void close(const PositionKey& key, bool liquidated);

    PositionState state(const PositionKey& key) const;

    // Final record of a closed or liquidated position
    const ClosedPosition* closed(const PositionKey& key) const;

    size_t open_count() const { return open_count_; }
    size_t size() const { return arena_.size(); }

private:
    struct Entry {
        PositionKey key;
        std::variant<Position, ClosedPosition> slot;
    };

    Entry* open_entry(const PositionKey& key);

    std::vector<Entry> arena_;
    std::unordered_map<PositionKey, size_t, PositionKeyHash> index_;
    size_t open_count_ = 0;
};

} // namespace perpcore

#endif // PERPCORE_POSITION_HPP
