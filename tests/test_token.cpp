// VaultUSD - Liability Token Tests

#include <catch2/catch_test_macros.hpp>
#include <vusd/token.hpp>

using namespace vusd;

namespace {
constexpr Address MINTER = addresses::from_id(0x9030);
constexpr Address HOLDER = addresses::from_id(0x0001);
constexpr Address OTHER = addresses::from_id(0x0002);
}

TEST_CASE("Only the minter mints and burns", "[token]") {
    LiabilityToken token(MINTER, TokenInfo{"VaultUSD", "vUSD", 18});

    REQUIRE(token.mint(OTHER, HOLDER, U256(100)) == errors::UNAUTHORIZED);
    REQUIRE(token.mint(HOLDER, HOLDER, U256(100)) == errors::UNAUTHORIZED);
    REQUIRE(token.total_supply().is_zero());

    REQUIRE(token.mint(MINTER, HOLDER, U256(100)) == errors::OK);
    REQUIRE(token.burn(HOLDER, HOLDER, U256(100)) == errors::UNAUTHORIZED);
    REQUIRE(token.balance_of(HOLDER) == U256(100));
}

TEST_CASE("Mint and burn track balances and supply", "[token]") {
    LiabilityToken token(MINTER, TokenInfo{"VaultUSD", "vUSD", 18});

    REQUIRE(token.mint(MINTER, HOLDER, x18::from_int(700)) == errors::OK);
    REQUIRE(token.mint(MINTER, OTHER, x18::from_int(300)) == errors::OK);
    REQUIRE(token.total_supply() == x18::from_int(1000));
    REQUIRE(token.holder_count() == 2);

    SECTION("Burn within balance") {
        REQUIRE(token.burn(MINTER, HOLDER, x18::from_int(200)) == errors::OK);
        REQUIRE(token.balance_of(HOLDER) == x18::from_int(500));
        REQUIRE(token.total_supply() == x18::from_int(800));
    }

    SECTION("Burn over balance changes nothing") {
        REQUIRE(token.burn(MINTER, OTHER, x18::from_int(301)) == errors::INSUFFICIENT_BALANCE);
        REQUIRE(token.balance_of(OTHER) == x18::from_int(300));
        REQUIRE(token.total_supply() == x18::from_int(1000));
    }

    SECTION("Emptied holders are dropped") {
        REQUIRE(token.burn(MINTER, OTHER, x18::from_int(300)) == errors::OK);
        REQUIRE(token.balance_of(OTHER).is_zero());
        REQUIRE(token.holder_count() == 1);
    }

    SECTION("Zero burn is a no-op") {
        REQUIRE(token.burn(MINTER, addresses::from_id(0x7777), U256()) == errors::OK);
        REQUIRE(token.total_supply() == x18::from_int(1000));
    }
}

TEST_CASE("Supply cannot overflow", "[token]") {
    LiabilityToken token(MINTER, TokenInfo{"VaultUSD", "vUSD", 18});

    REQUIRE(token.mint(MINTER, HOLDER, U256::max()) == errors::OK);
    REQUIRE(token.mint(MINTER, OTHER, U256(1)) == errors::ARITHMETIC_OVERFLOW);
    REQUIRE(token.balance_of(OTHER).is_zero());
    REQUIRE(token.total_supply() == U256::max());
}

TEST_CASE("Token metadata", "[token]") {
    LiabilityToken token(MINTER, TokenInfo{"Dollar", "DUSD", 6});

    REQUIRE(token.minter() == MINTER);
    REQUIRE(token.info().name == "Dollar");
    REQUIRE(token.info().symbol == "DUSD");
    REQUIRE(token.info().decimals == 6);
}
