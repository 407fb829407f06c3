// perpcore - Token Ledger and Settlement Tests

#include <catch2/catch_test_macros.hpp>
#include <perpcore/errors.hpp>
#include <perpcore/fixed_point.hpp>
#include <perpcore/ledger.hpp>

using namespace perpcore;

namespace {

const Address ALICE = addresses::from_u64(1);
const Address BOB = addresses::from_u64(2);
const Address MARKET = addresses::from_u64(0x9000);

I128 units(int64_t n) { return x18::from_int(n); }

} // anonymous namespace

TEST_CASE("TokenLedger balances", "[ledger]") {
    TokenLedger ledger;
    REQUIRE(ledger.balance_of(ALICE) == 0);

    ledger.mint(ALICE, units(100));
    REQUIRE(ledger.balance_of(ALICE) == units(100));
    REQUIRE(ledger.total_supply() == units(100));

    SECTION("Transfer moves balance") {
        ledger.transfer(ALICE, BOB, units(40));
        REQUIRE(ledger.balance_of(ALICE) == units(60));
        REQUIRE(ledger.balance_of(BOB) == units(40));
        REQUIRE(ledger.total_supply() == units(100));
    }

    SECTION("Burn reduces supply") {
        ledger.burn(ALICE, units(30));
        REQUIRE(ledger.balance_of(ALICE) == units(70));
        REQUIRE(ledger.total_supply() == units(70));
    }

    SECTION("Overdraft and negative amounts throw") {
        REQUIRE_THROWS_AS(ledger.transfer(ALICE, BOB, units(101)), LedgerError);
        REQUIRE_THROWS_AS(ledger.burn(BOB, 1), LedgerError);
        REQUIRE_THROWS_AS(ledger.mint(BOB, -1), LedgerError);
        REQUIRE(ledger.balance_of(ALICE) == units(100));
        REQUIRE(ledger.balance_of(BOB) == 0);
    }

    SECTION("Journal records every movement") {
        ledger.transfer(ALICE, BOB, units(10));
        ledger.burn(BOB, units(5));

        auto journal = ledger.journal();
        REQUIRE(journal.size() == 3);
        REQUIRE(journal[0].from == addresses::BURN);
        REQUIRE(journal[0].to == ALICE);
        REQUIRE(journal[1].from == ALICE);
        REQUIRE(journal[1].amount == units(10));
        REQUIRE(journal[2].to == addresses::BURN);
        REQUIRE(journal[2].amount == units(5));
    }
}

TEST_CASE("Settlement applies all or nothing", "[ledger]") {
    TokenLedger ledger;
    ledger.mint(ALICE, units(100));

    SECTION("Funds received earlier in the batch can be spent later") {
        Settlement settlement;
        settlement.transfer(ALICE, MARKET, units(100))
                  .mint(MARKET, units(20))
                  .transfer(MARKET, BOB, units(120));
        settlement.execute(ledger);

        REQUIRE(ledger.balance_of(ALICE) == 0);
        REQUIRE(ledger.balance_of(MARKET) == 0);
        REQUIRE(ledger.balance_of(BOB) == units(120));
        REQUIRE(ledger.total_supply() == units(120));
    }

    SECTION("A failing instruction rolls back the whole batch") {
        Settlement settlement;
        settlement.transfer(ALICE, MARKET, units(50))
                  .burn(MARKET, units(10))
                  .transfer(MARKET, BOB, units(45));

        REQUIRE_THROWS_AS(settlement.execute(ledger), LedgerError);
        REQUIRE(ledger.balance_of(ALICE) == units(100));
        REQUIRE(ledger.balance_of(MARKET) == 0);
        REQUIRE(ledger.balance_of(BOB) == 0);
        REQUIRE(ledger.journal().size() == 1);
    }

    SECTION("Negative amounts are rejected up front") {
        Settlement settlement;
        settlement.transfer(ALICE, BOB, units(1)).transfer(ALICE, BOB, -1);
        REQUIRE_THROWS_AS(settlement.execute(ledger), LedgerError);
        REQUIRE(ledger.balance_of(BOB) == 0);
    }

    SECTION("mint_or_burn follows the sign and skips zero") {
        Settlement settlement;
        settlement.transfer(ALICE, MARKET, units(10))
                  .mint_or_burn(MARKET, -units(4))
                  .mint_or_burn(MARKET, 0)
                  .mint_or_burn(BOB, units(3));
        REQUIRE(settlement.ops().size() == 3);
        REQUIRE(settlement.ops()[1].kind == SettlementKind::BURN);
        REQUIRE(settlement.ops()[2].kind == SettlementKind::MINT);

        settlement.execute(ledger);
        REQUIRE(ledger.balance_of(MARKET) == units(6));
        REQUIRE(ledger.balance_of(BOB) == units(3));
        REQUIRE(ledger.total_supply() == units(99));
    }

    SECTION("Zero-amount transfers leave no journal entry") {
        Settlement settlement;
        settlement.transfer(BOB, MARKET, 0);
        settlement.execute(ledger);
        REQUIRE(ledger.journal().size() == 1);
    }
}
