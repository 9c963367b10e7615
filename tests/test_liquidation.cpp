// VaultUSD - Liquidation Tests

#include <catch2/catch_test_macros.hpp>
#include "fixtures.hpp"

using namespace vusd;
using namespace vusd::test;

namespace {

class RejectingReceiver : public IAssetReceiver {
public:
    bool on_receive(const Address&, const U256&) override {
        calls++;
        return false;
    }
    int calls = 0;
};

// Alice borrows 10000 against 10 ETH; the keeper borrows the same 10000 against
// 30 ETH so it can repay her debt later
void open_positions(Deployment& d) {
    REQUIRE(d.open(ALICE, eth(10), vusd_units(10000)) == errors::OK);
    REQUIRE(d.open(KEEPER, eth(30), vusd_units(10000)) == errors::OK);
}

} // namespace

TEST_CASE("Underwater vault is fully liquidated", "[liquidation]") {
    Deployment d;
    EventLog log;
    log.attach(d.ledger);
    open_positions(d);

    d.set_price(1000);
    REQUIRE_FALSE(d.ledger.is_healthy(eth(10), vusd_units(10000)));
    REQUIRE(d.ledger.is_liquidatable(eth(10), vusd_units(10000)));

    REQUIRE(d.ledger.liquidate(KEEPER, ALICE) == errors::OK);

    Vault vault = d.vault(ALICE);
    REQUIRE(vault.exists);
    REQUIRE(vault.collateral.is_zero());
    REQUIRE(vault.debt.is_zero());

    REQUIRE(d.vusd.asset().balance_of(KEEPER) == eth(1000 - 30 + 10));
    REQUIRE(d.vusd.token().balance_of(KEEPER).is_zero());
    // Alice keeps the liability she minted
    REQUIRE(d.vusd.token().balance_of(ALICE) == vusd_units(10000));
    REQUIRE(d.vusd.token().total_supply() == vusd_units(10000));
    REQUIRE(d.vusd.asset().balance_of(d.ledger.address()) == eth(30));

    const VaultEvent& event = log.events.back();
    REQUIRE(event.type == VaultEventType::LIQUIDATED);
    REQUIRE(event.owner == ALICE);
    REQUIRE(event.liquidator == KEEPER);
    REQUIRE(event.amount == vusd_units(10000));
    REQUIRE(event.collateral_seized == eth(10));

    auto stats = d.ledger.get_stats();
    REQUIRE(stats.total_liquidations == 1);
    REQUIRE(stats.total_burned == vusd_units(10000));
    REQUIRE(stats.total_collateral_seized == eth(10));
}

TEST_CASE("Liquidated vault stays open", "[liquidation]") {
    Deployment d;
    open_positions(d);
    d.set_price(1000);
    REQUIRE(d.ledger.liquidate(KEEPER, ALICE) == errors::OK);

    REQUIRE(d.ledger.create_vault(ALICE) == errors::ALREADY_EXISTS);
    REQUIRE(d.ledger.classify(ALICE) == VaultStatus::HEALTHY);
    REQUIRE(d.ledger.liquidate(KEEPER, ALICE) == errors::NOT_LIQUIDATABLE);

    REQUIRE(d.ledger.deposit_collateral(ALICE, eth(3)) == errors::OK);
    REQUIRE(d.ledger.mint_debt(ALICE, vusd_units(2000)) == errors::OK);
    REQUIRE(d.vault(ALICE).debt == vusd_units(2000));
}

TEST_CASE("Only vaults under 110% can be liquidated", "[liquidation]") {
    Deployment d;
    REQUIRE(d.open(KEEPER, eth(100), vusd_units(50000)) == errors::OK);

    SECTION("Healthy vault") {
        REQUIRE(d.open(ALICE, eth(10), vusd_units(10000)) == errors::OK);
        REQUIRE(d.ledger.liquidate(KEEPER, ALICE) == errors::NOT_LIQUIDATABLE);
    }

    SECTION("Vault exactly at 110%") {
        REQUIRE(d.open(ALICE, eth(11), vusd_units(10000)) == errors::OK);
        d.set_price(1000);
        REQUIRE(d.ledger.classify(ALICE) == VaultStatus::AT_RISK);
        REQUIRE(d.ledger.liquidate(KEEPER, ALICE) == errors::NOT_LIQUIDATABLE);
        REQUIRE(d.vault(ALICE).collateral == eth(11));
    }

    SECTION("Debt-free vault") {
        REQUIRE(d.open(ALICE, eth(1), U256()) == errors::OK);
        d.set_price(1);
        REQUIRE(d.ledger.liquidate(KEEPER, ALICE) == errors::NOT_LIQUIDATABLE);
    }
}

TEST_CASE("Liquidator must hold the whole debt", "[liquidation]") {
    Deployment d;
    open_positions(d);
    d.set_price(1000);

    REQUIRE(d.ledger.liquidate(CAROL, ALICE) == errors::TRANSFER_FAILED);

    Vault vault = d.vault(ALICE);
    REQUIRE(vault.collateral == eth(10));
    REQUIRE(vault.debt == vusd_units(10000));
    REQUIRE(d.vusd.asset().balance_of(CAROL) == eth(1000));
    REQUIRE(d.ledger.get_stats().total_liquidations == 0);
}

TEST_CASE("Rejected payout rolls the liquidation back", "[liquidation]") {
    Deployment d;
    EventLog log;
    open_positions(d);
    log.attach(d.ledger);
    d.set_price(1000);

    RejectingReceiver receiver;
    d.vusd.asset().set_receiver(KEEPER, &receiver);

    REQUIRE(d.ledger.liquidate(KEEPER, ALICE) == errors::TRANSFER_FAILED);
    REQUIRE(receiver.calls == 1);

    Vault vault = d.vault(ALICE);
    REQUIRE(vault.collateral == eth(10));
    REQUIRE(vault.debt == vusd_units(10000));

    // The burned liability is restored to the liquidator
    REQUIRE(d.vusd.token().balance_of(KEEPER) == vusd_units(10000));
    REQUIRE(d.vusd.token().total_supply() == vusd_units(20000));
    REQUIRE(d.vusd.asset().balance_of(d.ledger.address()) == eth(40));

    REQUIRE(log.events.empty());
    auto stats = d.ledger.get_stats();
    REQUIRE(stats.total_liquidations == 0);
    REQUIRE(stats.total_burned.is_zero());

    d.vusd.asset().set_receiver(KEEPER, nullptr);
    REQUIRE(d.ledger.liquidate(KEEPER, ALICE) == errors::OK);
}

TEST_CASE("Liquidatable owners scan", "[liquidation]") {
    Deployment d;
    REQUIRE(d.open(ALICE, eth(10), vusd_units(10000)) == errors::OK);
    REQUIRE(d.open(BOB, eth(11), vusd_units(10000)) == errors::OK);
    REQUIRE(d.open(CAROL, eth(20), vusd_units(10000)) == errors::OK);
    REQUIRE(d.ledger.create_vault(KEEPER) == errors::OK);

    REQUIRE(d.ledger.liquidatable_owners().empty());

    d.set_price(1000);
    const std::vector<Address> expected{ALICE};
    REQUIRE(d.ledger.liquidatable_owners() == expected);

    d.set_price(900);
    const std::vector<Address> wider{ALICE, BOB};
    REQUIRE(d.ledger.liquidatable_owners() == wider);
}
