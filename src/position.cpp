// =============================================================================
// position.cpp - Position Valuation and Ledger
// =============================================================================

#include "perpcore/position.hpp"
#include "perpcore/errors.hpp"
#include "perpcore/fixed_point.hpp"

#include <stdexcept>
#include <string>

namespace perpcore {

// =============================================================================
// Fractional Slices
// =============================================================================

I128 Position::notional(I128 fraction) const {
    return x18::mul_down(notional_initial, fraction);
}

I128 Position::debt(I128 fraction) const {
    return x18::mul_down(debt_initial, fraction);
}

I128 Position::shares(I128 fraction) const {
    return x18::mul_down(oi_shares, fraction);
}

I128 Position::oi_issued(I128 fraction) const {
    return x18::mul_down(oi_initial, fraction);
}

I128 Position::entry_price() const {
    return x18::div_down(notional_initial, oi_initial);
}

I128 Position::oi_current(I128 fraction, const OiAggregate& side) const {
    if (side.shares == 0) return 0;
    return x18::mul_div(shares(fraction), side.oi, side.shares);
}

I128 Position::cost(I128 fraction) const {
    return x18::mul_down(notional_initial - debt_initial, fraction);
}

// =============================================================================
// Valuation
// =============================================================================

I128 Position::notional_with_pnl(I128 fraction, const OiAggregate& side,
                                 I128 price, I128 cap_payoff) const {
    I128 oi_init = oi_issued(fraction);
    if (oi_init == 0) return 0;

    I128 oi_now = oi_current(fraction, side);
    I128 entry = entry_price();

    // Notional scaled by the funding drift of this slice's OI
    I128 notional_now = x18::mul_div(notional(fraction), oi_now, oi_init);

    I128 pnl;
    if (is_long) {
        I128 per_unit = x18::min(price - entry, x18::mul_down(cap_payoff, entry));
        pnl = x18::mul_down(oi_now, per_unit);
    } else {
        pnl = x18::mul_down(oi_now, entry - price);
    }

    return x18::max(x18::add(notional_now, pnl), 0);
}

I128 Position::value(I128 fraction, const OiAggregate& side,
                     I128 price, I128 cap_payoff) const {
    I128 nwp = notional_with_pnl(fraction, side, price, cap_payoff);
    return x18::max(nwp - debt(fraction), 0);
}

bool Position::liquidatable(const OiAggregate& side, I128 price, I128 cap_payoff,
                            I128 maintenance_margin_fraction,
                            I128 liquidation_fee_rate) const {
    if (notional_initial == 0) return false;

    I128 val = value(X18_ONE, side, price, cap_payoff);
    I128 maintenance = x18::mul_down(notional_initial, maintenance_margin_fraction);
    return x18::mul_down(val, X18_ONE - liquidation_fee_rate) < maintenance;
}

I128 Position::liquidation_price(const OiAggregate& side, I128 maintenance_margin_fraction,
                                 I128 liquidation_fee_rate) const {
    I128 oi_now = oi_current(X18_ONE, side);
    I128 maintenance = x18::mul_down(notional_initial, maintenance_margin_fraction);
    I128 threshold = x18::add(x18::div_down(maintenance, X18_ONE - liquidation_fee_rate),
                              debt_initial);

    I128 long_price = x18::div_down(threshold, oi_now);
    if (is_long) return long_price;
    return x18::max(x18::sub(2 * entry_price(), long_price), 0);
}

Position Position::remainder(I128 fraction) const {
    Position rest = *this;
    rest.notional_initial -= notional(fraction);
    rest.debt_initial -= debt(fraction);
    rest.oi_shares -= shares(fraction);
    rest.oi_initial -= oi_issued(fraction);
    return rest;
}

namespace position {

I128 calc_mid_ratio(I128 entry_price, I128 mid_price) {
    return x18::div_down(entry_price, mid_price);
}

} // namespace position

// =============================================================================
// Position Ledger
// =============================================================================

void PositionLedger::insert(const PositionKey& key, const Position& pos) {
    if (index_.find(key) != index_.end()) {
        throw std::logic_error("position id " + std::to_string(key.id) + " already used");
    }
    index_.emplace(key, arena_.size());
    arena_.push_back(Entry{key, pos});
    ++open_count_;
}

PositionLedger::Entry* PositionLedger::open_entry(const PositionKey& key) {
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    Entry& entry = arena_[it->second];
    if (!std::holds_alternative<Position>(entry.slot)) return nullptr;
    return &entry;
}

const Position* PositionLedger::find(const PositionKey& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return std::get_if<Position>(&arena_[it->second].slot);
}

void PositionLedger::update(const PositionKey& key, const Position& pos) {
    Entry* entry = open_entry(key);
    if (!entry) throw MarketError(Reason::POSITION_NOT_FOUND);
    entry->slot = pos;
}

void PositionLedger::close(const PositionKey& key, bool liquidated) {
    Entry* entry = open_entry(key);
    if (!entry) throw MarketError(Reason::POSITION_NOT_FOUND);

    ClosedPosition record{std::get<Position>(entry->slot), liquidated};
    record.last.liquidated = liquidated;
    entry->slot = record;
    --open_count_;
}

PositionState PositionLedger::state(const PositionKey& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) return PositionState::NONE;

    const auto& slot = arena_[it->second].slot;
    if (std::holds_alternative<Position>(slot)) return PositionState::OPEN;
    return std::get<ClosedPosition>(slot).liquidated ? PositionState::LIQUIDATED
                                                     : PositionState::CLOSED;
}

const ClosedPosition* PositionLedger::closed(const PositionKey& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return std::get_if<ClosedPosition>(&arena_[it->second].slot);
}

} // namespace perpcore
