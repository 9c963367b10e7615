// VaultUSD - Price Normalization Tests

#include <catch2/catch_test_macros.hpp>
#include <vusd/oracle.hpp>

using namespace vusd;

TEST_CASE("Readings rescale to 18 decimals", "[oracle]") {
    SECTION("Fewer decimals multiply up") {
        REQUIRE(PriceNormalizer::normalize({static_cast<I128>(200000000000LL), 8}) ==
                x18::from_int(2000));
        REQUIRE(PriceNormalizer::normalize({5, 0}) == x18::from_int(5));
    }

    SECTION("Eighteen decimals pass through") {
        REQUIRE(PriceNormalizer::normalize({1234567, 18}) == U256(1234567));
    }

    SECTION("More decimals divide down with truncation") {
        REQUIRE(PriceNormalizer::normalize({123456789, 20}) == U256(1234567));
        REQUIRE(PriceNormalizer::normalize({199, 20}) == U256(1));
    }

    SECTION("Largest positive answer") {
        I128 max_answer = static_cast<I128>(~U128(0) >> 1);
        auto price = PriceNormalizer::normalize({max_answer, 0});
        REQUIRE(price.has_value());
        REQUIRE(*price == U256::from_u128(~U128(0) >> 1) * x18::SCALE);
    }
}

TEST_CASE("Invalid readings are rejected", "[oracle]") {
    SECTION("Zero and negative answers") {
        REQUIRE_FALSE(PriceNormalizer::normalize({0, 8}).has_value());
        REQUIRE_FALSE(PriceNormalizer::normalize({-1, 8}).has_value());
        REQUIRE_FALSE(PriceNormalizer::normalize({-200000000000LL, 8}).has_value());
    }

    SECTION("Answers that truncate to zero") {
        REQUIRE_FALSE(PriceNormalizer::normalize({99, 20}).has_value());
        REQUIRE_FALSE(PriceNormalizer::normalize({1, 95}).has_value());
    }

    SECTION("Decimals beyond range") {
        REQUIRE_FALSE(PriceNormalizer::normalize({1000, 96}).has_value());
        REQUIRE_FALSE(PriceNormalizer::normalize({1000, 255}).has_value());
    }
}

TEST_CASE("Normalizer reads the feed on every call", "[oracle]") {
    ManualPriceFeed feed(200000000000LL, 8);
    PriceNormalizer normalizer(feed);

    REQUIRE(normalizer.unit_price() == x18::from_int(2000));
    REQUIRE(feed.update_count() == 0);

    feed.set_answer(100000000000LL);
    REQUIRE(normalizer.unit_price() == x18::from_int(1000));

    feed.set_answer(0);
    REQUIRE_FALSE(normalizer.unit_price().has_value());

    feed.set_reading({1500, 0});
    REQUIRE(normalizer.unit_price() == x18::from_int(1500));
    REQUIRE(feed.latest_answer().decimals == 0);
    REQUIRE(feed.update_count() == 3);
}

TEST_CASE("Default feed has no valid price", "[oracle]") {
    ManualPriceFeed feed;
    PriceNormalizer normalizer(feed);

    REQUIRE(feed.latest_answer().decimals == 8);
    REQUIRE_FALSE(normalizer.unit_price().has_value());
}
