// =============================================================================
// market.cpp - Market State Machine
// =============================================================================

#include "perpcore/market.hpp"
#include "perpcore/errors.hpp"
#include "perpcore/fixed_point.hpp"
#include "perpcore/funding.hpp"
#include "perpcore/logging.hpp"
#include "perpcore/pricing.hpp"
#include "perpcore/roller.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>

namespace perpcore {

// =============================================================================
// Reentrancy Lock
// =============================================================================

class Market::Lock {
public:
    explicit Lock(Market& market) : market_(market) {
        if (market_.locked_) {
            throw MarketError(Reason::REENTRANT);
        }
        market_.locked_ = true;
    }

    ~Lock() { market_.locked_ = false; }

    Lock(const Lock&) = delete;
    Lock& operator=(const Lock&) = delete;

private:
    Market& market_;
};

// =============================================================================
// Constructor
// =============================================================================

Market::Market(Feed& feed, Ledger& ledger, const ParamsStore& params, const MarketConfig& config)
    : feed_(feed), ledger_(ledger), params_(params), config_(config) {
    uint64_t now = feed_.latest().timestamp;
    state_.timestamp_update_last = now;
    state_.volume_ask.timestamp = now;
    state_.volume_bid.timestamp = now;
    state_.minted.timestamp = now;
}

void Market::set_event_callback(EventCallback callback) {
    callback_ = std::move(callback);
}

void Market::emit(const MarketEvent& event) {
    if (callback_) callback_(event);
}

// =============================================================================
// Update / Funding
// =============================================================================

FeedData Market::read_feed(const RiskParams& params) const {
    FeedData data = feed_.latest();
    if (!pricing::data_is_valid(params, data)) {
        logging::logger()->warn("feed data invalid at {}: macro={} ago={}",
                                data.timestamp,
                                x18::format(data.price_over_macro_window),
                                x18::format(data.price_one_macro_window_ago));
    }
    return data;
}

Market::Staged Market::stage_update(const RiskParams& params, const FeedData& data) const {
    Staged staged;
    staged.state = state_;

    uint64_t last = state_.timestamp_update_last;
    if (data.timestamp < last) {
        throw ArithmeticError("feed timestamp " + std::to_string(data.timestamp) +
                              " precedes last update " + std::to_string(last));
    }
    if (data.timestamp == last) return staged;

    FundingResult result = funding::oi_after_funding(params, state_.longs, state_.shorts,
                                                     data.timestamp - last);
    staged.state.longs.oi = result.oi_long;
    staged.state.shorts.oi = result.oi_short;
    staged.state.timestamp_update_last = data.timestamp;

    if (result.paid != 0) {
        staged.funding = FundingPaidEvent{result.oi_long, result.oi_short,
                                          result.longs_paid ? result.paid : -result.paid};
    }
    return staged;
}

FeedData Market::update() {
    Lock lock(*this);
    auto params = params_.snapshot();

    FeedData data = read_feed(*params);
    Staged staged = stage_update(*params, data);

    state_ = staged.state;
    if (staged.funding) {
        logging::logger()->debug("funding paid {} (oi_long={} oi_short={})",
                                 x18::format(staged.funding->funding_paid),
                                 x18::format(staged.funding->oi_long),
                                 x18::format(staged.funding->oi_short));
        emit(*staged.funding);
    }
    return data;
}

// =============================================================================
// Build
// =============================================================================

uint64_t Market::build(const Address& owner, I128 collateral, I128 leverage,
                       bool is_long, I128 price_limit) {
    Lock lock(*this);
    auto params = params_.snapshot();
    const RiskParams& p = *params;

    if (leverage < X18_ONE) throw MarketError(Reason::LEVERAGE_MIN);
    if (leverage > p.cap_leverage()) throw MarketError(Reason::LEVERAGE_MAX);
    if (collateral < p.min_collateral()) throw MarketError(Reason::COLLATERAL_MIN);

    FeedData data = read_feed(p);
    Staged staged = stage_update(p, data);
    MarketState& next = staged.state;

    I128 notional = x18::mul_down(collateral, leverage);
    I128 debt = notional - collateral;
    I128 trading_fee = x18::mul_up(notional, p.trading_fee_rate());

    // Cap on new notional, bounded by the reserve and the circuit breaker
    I128 mid = pricing::mid_from_feed(data);
    I128 cap = pricing::cap_notional_adjusted_for_bounds(p, data, p.cap_notional());
    Snapshot minted_now = roller::transform(next.minted, data.timestamp,
                                            p.circuit_breaker_window(), 0);
    cap = pricing::cap_notional_adjusted_for_circuit_breaker(p, minted_now, cap);
    I128 cap_oi = pricing::oi_from_notional(cap, mid);
    if (cap_oi == 0) throw MarketError(Reason::OI_CAP);

    // Volume is priced from the notional at mid before the entry price is known
    I128 volume = pricing::volume_from_oi(pricing::oi_from_notional(notional, mid), cap_oi);
    Snapshot& volume_snapshot = is_long ? next.volume_ask : next.volume_bid;
    volume_snapshot = roller::transform(volume_snapshot, data.timestamp, data.micro_window, volume);

    I128 price = is_long ? pricing::ask(p, data, volume_snapshot.cumulative())
                         : pricing::bid(p, data, volume_snapshot.cumulative());

    I128 oi = pricing::oi_from_notional(notional, price);
    if (oi == 0) throw MarketError(Reason::OI_ZERO);

    OiAggregate& side = is_long ? next.longs : next.shorts;
    if (x18::add(side.oi, oi) > cap_oi) throw MarketError(Reason::OI_CAP);

    I128 shares = (side.oi == 0 || side.shares == 0) ? oi : x18::mul_div(oi, side.shares, side.oi);
    if (shares == 0) throw MarketError(Reason::OI_ZERO);
    side.oi += oi;
    side.shares += shares;

    Position pos;
    pos.notional_initial = notional;
    pos.debt_initial = debt;
    pos.mid_ratio = position::calc_mid_ratio(price, mid);
    pos.is_long = is_long;
    pos.liquidated = false;
    pos.oi_shares = shares;
    pos.oi_initial = oi;

    if (pos.liquidatable(side, mid, p.cap_payoff(), p.maintenance_margin_fraction(),
                         p.liquidation_fee_rate())) {
        throw MarketError(Reason::LIQUIDATABLE);
    }

    if (is_long ? price > price_limit : price < price_limit) {
        throw MarketError(Reason::SLIPPAGE);
    }

    Settlement settlement;
    settlement.transfer(owner, config_.address, x18::add(collateral, trading_fee))
              .transfer(config_.address, config_.fee_recipient, trading_fee);
    settlement.execute(ledger_);

    // Commit
    uint64_t position_id = next_position_id_;
    positions_.insert(PositionKey{owner, position_id}, pos);
    ++next_position_id_;
    state_ = next;

    logging::logger()->debug("build {} {} id={} collateral={} notional={} oi={} price={}",
                             addresses::to_hex(owner), is_long ? "long" : "short", position_id,
                             x18::format(collateral), x18::format(notional),
                             x18::format(oi), x18::format(price));

    if (staged.funding) emit(*staged.funding);
    emit(BuildEvent{owner, position_id, oi, debt, is_long, price});
    return position_id;
}

// =============================================================================
// Unwind
// =============================================================================

const Position& Market::open_position(const PositionKey& key) const {
    const Position* pos = positions_.find(key);
    if (!pos) throw MarketError(Reason::POSITION_NOT_FOUND);
    return *pos;
}

Market::ExitQuote Market::quote_exit(const RiskParams& params, const FeedData& data,
                                     const MarketState& state, const Position& pos,
                                     I128 fraction) const {
    const OiAggregate& side = pos.is_long ? state.longs : state.shorts;

    ExitQuote quote;
    quote.oi_unwound = pos.oi_current(fraction, side);

    // Exits are bounded by the reserve only; the circuit breaker gates new notional
    I128 mid = pricing::mid_from_feed(data);
    I128 cap = pricing::cap_notional_adjusted_for_bounds(params, data, params.cap_notional());
    I128 cap_oi = pricing::oi_from_notional(cap, mid);
    I128 volume = pricing::volume_from_oi(quote.oi_unwound, cap_oi);

    // Longs sell into the bid, shorts buy at the ask
    const Snapshot& last = pos.is_long ? state.volume_bid : state.volume_ask;
    quote.volume = roller::transform(last, data.timestamp, data.micro_window, volume);
    quote.price = pos.is_long ? pricing::bid(params, data, quote.volume.cumulative())
                              : pricing::ask(params, data, quote.volume.cumulative());
    return quote;
}

void Market::unwind(const Address& owner, uint64_t position_id, I128 fraction, I128 price_limit) {
    Lock lock(*this);
    auto params = params_.snapshot();
    const RiskParams& p = *params;

    PositionKey key{owner, position_id};
    Position pos = open_position(key);
    if (fraction <= 0) throw MarketError(Reason::FRACTION_MIN);
    if (fraction > X18_ONE) throw MarketError(Reason::FRACTION_MAX);

    FeedData data = read_feed(p);
    Staged staged = stage_update(p, data);
    MarketState& next = staged.state;
    OiAggregate& side = pos.is_long ? next.longs : next.shorts;

    ExitQuote quote = quote_exit(p, data, next, pos, fraction);

    if (pos.liquidatable(side, quote.price, p.cap_payoff(), p.maintenance_margin_fraction(),
                         p.liquidation_fee_rate())) {
        throw MarketError(Reason::LIQUIDATABLE);
    }

    I128 value = pos.value(fraction, side, quote.price, p.cap_payoff());
    I128 cost = pos.cost(fraction);
    I128 mint = value - cost;
    I128 trading_fee = x18::min(x18::mul_up(value, p.trading_fee_rate()), value);

    if (pos.is_long ? quote.price < price_limit : quote.price > price_limit) {
        throw MarketError(Reason::SLIPPAGE);
    }

    side.oi -= quote.oi_unwound;
    side.shares -= pos.shares(fraction);
    (pos.is_long ? next.volume_bid : next.volume_ask) = quote.volume;
    next.minted = roller::transform(next.minted, data.timestamp, p.circuit_breaker_window(), mint);

    Settlement settlement;
    settlement.mint_or_burn(config_.address, mint)
              .transfer(config_.address, owner, value - trading_fee)
              .transfer(config_.address, config_.fee_recipient, trading_fee);
    settlement.execute(ledger_);

    // Commit
    if (fraction == X18_ONE) {
        positions_.close(key, false);
    } else {
        positions_.update(key, pos.remainder(fraction));
    }
    state_ = next;

    logging::logger()->debug("unwind {} id={} fraction={} value={} mint={} price={}",
                             addresses::to_hex(owner), position_id, x18::format(fraction),
                             x18::format(value), x18::format(mint), x18::format(quote.price));

    if (staged.funding) emit(*staged.funding);
    emit(UnwindEvent{owner, position_id, fraction, quote.price, mint});
}

// =============================================================================
// Liquidate
// =============================================================================

void Market::liquidate(const Address& liquidator, const Address& owner, uint64_t position_id) {
    Lock lock(*this);
    auto params = params_.snapshot();
    const RiskParams& p = *params;

    PositionKey key{owner, position_id};
    Position pos = open_position(key);

    FeedData data = read_feed(p);
    Staged staged = stage_update(p, data);
    MarketState& next = staged.state;
    OiAggregate& side = pos.is_long ? next.longs : next.shorts;

    ExitQuote quote = quote_exit(p, data, next, pos, X18_ONE);

    if (!pos.liquidatable(side, quote.price, p.cap_payoff(), p.maintenance_margin_fraction(),
                          p.liquidation_fee_rate())) {
        throw MarketError(Reason::NOT_LIQUIDATABLE);
    }

    I128 value = pos.value(X18_ONE, side, quote.price, p.cap_payoff());
    I128 cost = pos.cost(X18_ONE);

    // Liquidator fee, then a burn on what is left; the rest goes to the fee recipient
    I128 liquidation_fee = x18::mul_down(value, p.liquidation_fee_rate());
    I128 remaining = value - liquidation_fee;
    I128 margin_burned = x18::mul_down(remaining, p.maintenance_margin_burn_rate());
    remaining -= margin_burned;
    I128 mint = value - cost - margin_burned;

    side.oi -= quote.oi_unwound;
    side.shares -= pos.oi_shares;
    (pos.is_long ? next.volume_bid : next.volume_ask) = quote.volume;
    next.minted = roller::transform(next.minted, data.timestamp, p.circuit_breaker_window(), mint);

    Settlement settlement;
    settlement.mint_or_burn(config_.address, mint)
              .transfer(config_.address, liquidator, liquidation_fee)
              .transfer(config_.address, config_.fee_recipient, remaining);
    settlement.execute(ledger_);

    // Commit
    positions_.close(key, true);
    state_ = next;

    logging::logger()->debug("liquidate {} id={} by {} value={} mint={} price={}",
                             addresses::to_hex(owner), position_id, addresses::to_hex(liquidator),
                             x18::format(value), x18::format(mint), x18::format(quote.price));

    if (staged.funding) emit(*staged.funding);
    emit(LiquidateEvent{liquidator, owner, position_id, quote.price, mint});
}

// =============================================================================
// Position Queries
// =============================================================================

std::optional<Position> Market::position(const Address& owner, uint64_t position_id) const {
    const Position* pos = positions_.find(PositionKey{owner, position_id});
    if (!pos) return std::nullopt;
    return *pos;
}

PositionState Market::position_state(const Address& owner, uint64_t position_id) const {
    return positions_.state(PositionKey{owner, position_id});
}

bool Market::liquidatable(const Address& owner, uint64_t position_id) const {
    const Position* pos = positions_.find(PositionKey{owner, position_id});
    if (!pos) return false;

    auto params = params_.snapshot();
    const RiskParams& p = *params;
    FeedData data = feed_.latest();
    Staged staged = stage_update(p, data);
    ExitQuote quote = quote_exit(p, data, staged.state, *pos, X18_ONE);

    const OiAggregate& side = pos->is_long ? staged.state.longs : staged.state.shorts;
    return pos->liquidatable(side, quote.price, p.cap_payoff(),
                             p.maintenance_margin_fraction(), p.liquidation_fee_rate());
}

I128 Market::value(const Address& owner, uint64_t position_id) const {
    const Position& pos = open_position(PositionKey{owner, position_id});

    auto params = params_.snapshot();
    const RiskParams& p = *params;
    FeedData data = feed_.latest();
    Staged staged = stage_update(p, data);
    ExitQuote quote = quote_exit(p, data, staged.state, pos, X18_ONE);

    const OiAggregate& side = pos.is_long ? staged.state.longs : staged.state.shorts;
    return pos.value(X18_ONE, side, quote.price, p.cap_payoff());
}

I128 Market::liquidation_price(const Address& owner, uint64_t position_id) const {
    const Position& pos = open_position(PositionKey{owner, position_id});

    auto params = params_.snapshot();
    Staged staged = stage_update(*params, feed_.latest());

    const OiAggregate& side = pos.is_long ? staged.state.longs : staged.state.shorts;
    return pos.liquidation_price(side, params->maintenance_margin_fraction(),
                                 params->liquidation_fee_rate());
}

// =============================================================================
// Pricing Queries
// =============================================================================

I128 Market::params(RiskParameter param) const {
    return params_.snapshot()->get(param);
}

bool Market::data_is_valid(const FeedData& data) const {
    return pricing::data_is_valid(*params_.snapshot(), data);
}

I128 Market::mid_from_feed(const FeedData& data) const {
    return pricing::mid_from_feed(data);
}

I128 Market::ask(const FeedData& data, I128 volume) const {
    return pricing::ask(*params_.snapshot(), data, volume);
}

I128 Market::bid(const FeedData& data, I128 volume) const {
    return pricing::bid(*params_.snapshot(), data, volume);
}

I128 Market::front_run_bound(const FeedData& data) const {
    return pricing::front_run_bound(*params_.snapshot(), data);
}

I128 Market::back_run_bound(const FeedData& data) const {
    return pricing::back_run_bound(*params_.snapshot(), data);
}

I128 Market::cap_notional_adjusted_for_bounds(const FeedData& data, I128 cap) const {
    return pricing::cap_notional_adjusted_for_bounds(*params_.snapshot(), data, cap);
}

I128 Market::cap_notional_adjusted_for_circuit_breaker(I128 cap) const {
    auto params = params_.snapshot();
    // Minted amount decayed to the feed clock; never earlier than the last roll
    uint64_t now = std::max(feed_.latest().timestamp, state_.minted.timestamp);
    Snapshot minted_now = roller::transform(state_.minted, now,
                                            params->circuit_breaker_window(), 0);
    return pricing::cap_notional_adjusted_for_circuit_breaker(*params, minted_now, cap);
}

I128 Market::circuit_breaker(const Snapshot& minted, I128 cap) const {
    return pricing::circuit_breaker(*params_.snapshot(), minted, cap);
}

I128 Market::oi_from_notional(I128 notional, I128 price) const {
    return pricing::oi_from_notional(notional, price);
}

} // namespace perpcore
