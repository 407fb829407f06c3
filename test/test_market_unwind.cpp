// perpcore - Market Unwind Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "market_fixture.hpp"

#include <cmath>

using namespace perpcore;
using namespace perpcore::test;
using Catch::Approx;

TEST_CASE("Immediate unwind pays the spread", "[market][unwind]") {
    MarketFixture f;
    uint64_t id = f.build_long(x18::from_int(1000), X18_ONE);

    const I128 alice_before = f.ledger.balance_of(ALICE);
    const I128 fees_before = f.ledger.balance_of(FEE_RECIPIENT);
    const I128 quoted = f.market.value(ALICE, id);
    const I128 fee = x18::min(x18::mul_up(quoted, x18::parse("0.00075")), quoted);

    f.market.unwind(ALICE, id, X18_ONE, 0);

    auto unwinds = f.events_of<UnwindEvent>();
    REQUIRE(unwinds.size() == 1);
    const UnwindEvent& ev = unwinds[0];

    REQUIRE(ev.sender == ALICE);
    REQUIRE(ev.position_id == id);
    REQUIRE(ev.fraction == X18_ONE);
    REQUIRE(ev.price < X18_ONE);
    REQUIRE(ev.mint < 0);
    REQUIRE(ev.mint == quoted - x18::from_int(1000));

    // Round trip through ask and bid loses about 2 * delta plus impact
    REQUIRE(x18::to_double(ev.mint) == Approx(-7.47).margin(0.01));

    SECTION("Payout, fee and burn") {
        REQUIRE(f.ledger.balance_of(ALICE) == alice_before + quoted - fee);
        REQUIRE(f.ledger.balance_of(FEE_RECIPIENT) == fees_before + fee);
        REQUIRE(f.ledger.balance_of(MARKET) == 0);
        REQUIRE(f.ledger.total_supply() == x18::from_int(2000000) + ev.mint);
    }

    SECTION("The position is closed") {
        REQUIRE_FALSE(f.market.position(ALICE, id).has_value());
        REQUIRE(f.market.position_state(ALICE, id) == PositionState::CLOSED);
        REQUIRE(f.market.open_positions() == 0);
        REQUIRE(f.market.oi_long() == 0);
        REQUIRE(f.market.oi_long_shares() == 0);
        REQUIRE_THROWS_WITH(f.market.unwind(ALICE, id, X18_ONE, 0), "!position");
    }

    SECTION("Exit volume rolls into the bid snapshot and minted tracks the burn") {
        REQUIRE(f.market.snapshot_volume_bid().cumulative() > 0);
        REQUIRE(f.market.snapshot_minted().cumulative() == ev.mint);
    }
}

TEST_CASE("Round trip at 1.5x returns less than the collateral", "[market][unwind]") {
    MarketFixture f;
    const I128 leverage = x18::parse("1.5");
    const I128 collateral = x18::div_down(x18::from_int(1000), leverage);

    uint64_t id = f.build_long(collateral, leverage);
    auto pos = f.market.position(ALICE, id);
    REQUIRE(x18::to_double(pos->notional_initial) == Approx(1000.0).epsilon(1e-4));
    REQUIRE(pos->debt_initial == pos->notional_initial - collateral);
    REQUIRE(x18::to_double(x18::div_down(pos->notional_initial, leverage)) ==
            Approx(x18::to_double(collateral)).epsilon(1e-4));

    const I128 before = f.ledger.balance_of(ALICE);
    f.market.unwind(ALICE, id, X18_ONE, 0);

    REQUIRE(f.events_of<UnwindEvent>()[0].mint <= 0);
    REQUIRE(f.ledger.balance_of(ALICE) - before < collateral);
}

TEST_CASE("Partial unwinds add up to a full unwind", "[market][unwind]") {
    RiskParams risk = quiet_risk();
    risk.set(RiskParameter::LMBDA, 0);

    // Without impact the reserve bounds collapse to zero, so price without a reserve
    MarketFixture whole(risk);
    MarketFixture split(risk);
    whole.feed.set_has_reserve(false);
    split.feed.set_has_reserve(false);

    whole.build_long(x18::from_int(1000), x18::from_int(2));
    split.build_long(x18::from_int(1000), x18::from_int(2));

    whole.market.unwind(ALICE, 0, X18_ONE, 0);

    split.market.unwind(ALICE, 0, x18::parse("0.5"), 0);
    auto rest = split.market.position(ALICE, 0);
    REQUIRE(rest.has_value());
    REQUIRE(rest->notional_initial == x18::from_int(1000));
    REQUIRE(rest->debt_initial == x18::from_int(500));
    REQUIRE(split.market.position_state(ALICE, 0) == PositionState::OPEN);

    split.market.unwind(ALICE, 0, X18_ONE, 0);
    REQUIRE(split.market.position_state(ALICE, 0) == PositionState::CLOSED);

    auto whole_mints = whole.events_of<UnwindEvent>();
    auto split_mints = split.events_of<UnwindEvent>();
    REQUIRE(split_mints.size() == 2);
    REQUIRE(split_mints[0].price == whole_mints[0].price);

    double split_total = x18::to_double(split_mints[0].mint) + x18::to_double(split_mints[1].mint);
    REQUIRE(split_total == Approx(x18::to_double(whole_mints[0].mint)).epsilon(1e-12));
    REQUIRE(x18::to_double(split.ledger.balance_of(ALICE)) ==
            Approx(x18::to_double(whole.ledger.balance_of(ALICE))).epsilon(1e-15));
    REQUIRE(split.market.oi_long() == 0);
}

TEST_CASE("Unwind preconditions", "[market][unwind]") {
    MarketFixture f;
    uint64_t id = f.build_long(x18::from_int(1000), X18_ONE);

    SECTION("Only the owner can unwind") {
        REQUIRE_THROWS_WITH(f.market.unwind(BOB, id, X18_ONE, 0), "!position");
        REQUIRE_THROWS_WITH(f.market.unwind(ALICE, 99, X18_ONE, 0), "!position");
    }

    SECTION("Fraction bounds") {
        REQUIRE_THROWS_WITH(f.market.unwind(ALICE, id, 0, 0), "fraction<min");
        REQUIRE_THROWS_WITH(f.market.unwind(ALICE, id, -X18_ONE, 0), "fraction<min");
        REQUIRE_THROWS_WITH(f.market.unwind(ALICE, id, X18_ONE + 1, 0), "fraction>max");
        REQUIRE_THROWS_WITH(f.market.unwind(ALICE, 99, 0, 0), "!position");
    }

    SECTION("Exit price limit") {
        REQUIRE_THROWS_WITH(f.market.unwind(ALICE, id, X18_ONE, X18_ONE), "slippage>max");

        uint64_t short_id = f.build_short(x18::from_int(1000), X18_ONE);
        REQUIRE_THROWS_WITH(f.market.unwind(ALICE, short_id, X18_ONE, X18_ONE), "slippage>max");
        REQUIRE_NOTHROW(f.market.unwind(ALICE, short_id, X18_ONE, x18::parse("1.01")));
    }

    SECTION("Liquidatable positions cannot unwind") {
        uint64_t risky = f.build_long(x18::from_int(100), x18::from_int(5));
        f.feed.set_price(x18::parse("0.85"));
        REQUIRE_THROWS_WITH(f.market.unwind(ALICE, risky, x18::parse("0.5"), 0), "liquidatable");
    }

    SECTION("Failed unwinds change nothing") {
        const I128 oi = f.market.oi_long();
        const I128 balance = f.ledger.balance_of(ALICE);
        REQUIRE_THROWS(f.market.unwind(ALICE, id, X18_ONE, X18_ONE));
        REQUIRE(f.market.oi_long() == oi);
        REQUIRE(f.ledger.balance_of(ALICE) == balance);
        REQUIRE(f.market.snapshot_volume_bid().cumulative() == 0);
        REQUIRE(f.events_of<UnwindEvent>().empty());
    }
}

TEST_CASE("Profitable unwinds mint and trip the circuit breaker", "[market][unwind]") {
    RiskParams risk = quiet_risk();
    risk.set(RiskParameter::CIRCUIT_BREAKER_MINT_TARGET, 0);
    MarketFixture f(risk);

    uint64_t first = f.build_long(x18::from_int(1000), X18_ONE);
    uint64_t second = f.build_long(x18::from_int(1000), X18_ONE);

    f.feed.set_price(x18::parse("1.1"));
    f.market.unwind(ALICE, first, X18_ONE, 0);

    auto unwinds = f.events_of<UnwindEvent>();
    REQUIRE(unwinds[0].mint > 0);
    REQUIRE(f.ledger.total_supply() > x18::from_int(2000000));
    REQUIRE(f.market.snapshot_minted().cumulative() == unwinds[0].mint);

    // New notional is shut, exits stay open
    REQUIRE(f.market.cap_notional_adjusted_for_circuit_breaker(x18::from_int(800000)) == 0);
    REQUIRE_THROWS_WITH(f.build_long(x18::from_int(10), X18_ONE), "oi>cap");
    REQUIRE_NOTHROW(f.market.unwind(ALICE, second, X18_ONE, 0));
}

TEST_CASE("Circuit breaker recovers as the minted amount decays", "[market][unwind]") {
    RiskParams risk = quiet_risk();
    risk.set(RiskParameter::CIRCUIT_BREAKER_MINT_TARGET, 0);
    MarketFixture f(risk);
    const uint64_t window = risk.circuit_breaker_window();
    const I128 cap = x18::from_int(800000);

    uint64_t id = f.build_long(x18::from_int(1000), X18_ONE);
    f.feed.set_price(x18::parse("1.1"));
    f.market.unwind(ALICE, id, X18_ONE, 0);

    // No open positions remain, so nothing rolls the minted snapshot forward
    REQUIRE(f.market.open_positions() == 0);
    REQUIRE(f.market.cap_notional_adjusted_for_circuit_breaker(cap) == 0);

    SECTION("Half a window later the breaker is still tripped") {
        f.feed.advance(window / 2);
        REQUIRE(f.market.cap_notional_adjusted_for_circuit_breaker(cap) == 0);
        REQUIRE_THROWS_WITH(f.build_long(x18::from_int(10), X18_ONE), "oi>cap");
    }

    SECTION("A full window later new notional is open again") {
        f.feed.advance(window);
        REQUIRE(f.market.cap_notional_adjusted_for_circuit_breaker(cap) == cap);
        REQUIRE_NOTHROW(f.build_long(x18::from_int(10), X18_ONE));
    }

    SECTION("Funding updates alone do not hold the breaker shut") {
        f.feed.advance(2 * window);
        f.market.update();
        REQUIRE(f.market.cap_notional_adjusted_for_circuit_breaker(cap) == cap);
        REQUIRE_NOTHROW(f.build_long(x18::from_int(10), X18_ONE));
    }
}

TEST_CASE("Short unwinds profit when the price falls", "[market][unwind]") {
    MarketFixture f;
    uint64_t id = f.build_short(x18::from_int(1000), x18::from_int(2));

    f.feed.set_price(x18::parse("0.9"));
    REQUIRE(f.market.value(ALICE, id) > x18::from_int(1000));
    f.market.unwind(ALICE, id, X18_ONE, I128_MAX);

    auto unwinds = f.events_of<UnwindEvent>();
    REQUIRE(unwinds.size() == 1);
    REQUIRE(unwinds[0].price > x18::parse("0.9"));
    REQUIRE(unwinds[0].mint > 0);
    REQUIRE(f.market.snapshot_volume_ask().cumulative() > 0);
    REQUIRE(f.market.oi_short() == 0);
}
