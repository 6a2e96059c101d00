// Lever - Price oracle tests

#include <catch2/catch.hpp>
#include <lever/oracle.hpp>

using namespace lever;

namespace {

const Currency WETH(addresses::make(0x1001));
const Currency USD(addresses::make(0x1002));

} // namespace

TEST_CASE("Oracle normalizes feed decimals", "[oracle]") {
    Chain chain;
    PriceOracle oracle(chain);
    ManualPriceFeed feed("chainlink-like");
    oracle.set_feed(WETH, &feed);

    SECTION("8 decimals") {
        feed.set_price(WETH, 20000000000, 8, chain.timestamp());
        OracleQuote q = oracle.quote(WETH);
        REQUIRE(q.ok());
        REQUIRE(q.price_x18 == x18::from_int(200));
    }

    SECTION("18 decimals") {
        feed.set_price(WETH, x18::from_int(200), 18, chain.timestamp());
        REQUIRE(oracle.quote(WETH).price_x18 == x18::from_int(200));
    }

    SECTION("More than 18 decimals") {
        feed.set_price(WETH, x18::from_int(200) * 1000, 21, chain.timestamp());
        REQUIRE(oracle.quote(WETH).price_x18 == x18::from_int(200));
    }
}

TEST_CASE("Oracle rejects unusable prices", "[oracle]") {
    Chain chain;
    PriceOracle oracle(chain, 3600);
    ManualPriceFeed feed;

    SECTION("No feed") {
        REQUIRE(oracle.quote(WETH).status == errors::PRICE_FEED_NOT_SET);
    }

    oracle.set_feed(WETH, &feed);

    SECTION("No round") {
        REQUIRE(oracle.quote(WETH).status == errors::INVALID_PRICE);
    }

    SECTION("Non-positive price") {
        feed.set_price(WETH, 0, 8, chain.timestamp());
        REQUIRE(oracle.quote(WETH).status == errors::INVALID_PRICE);
        feed.set_price(WETH, -1, 8, chain.timestamp());
        REQUIRE(oracle.quote(WETH).status == errors::INVALID_PRICE);
    }

    SECTION("Price too large to scale to 18 decimals") {
        feed.set_price(WETH, I128_MAX / 1000, 0, chain.timestamp());
        REQUIRE(oracle.quote(WETH).status == errors::INVALID_PRICE);
        feed.set_price(WETH, I128_MAX / x18::pow10(18), 0, chain.timestamp());
        REQUIRE(oracle.quote(WETH).ok());
    }

    SECTION("Round from the future") {
        feed.set_price(WETH, 100, 8, chain.timestamp() + 1);
        REQUIRE(oracle.quote(WETH).status == errors::INVALID_PRICE);
    }

    SECTION("Staleness boundary") {
        feed.set_price(WETH, 100, 8, chain.timestamp());
        chain.advance_time(3600);
        REQUIRE(oracle.quote(WETH).ok());
        REQUIRE(oracle.price_age(WETH) == 3600);

        chain.advance_time(1);
        REQUIRE(oracle.quote(WETH).status == errors::PRICE_STALE);
        REQUIRE_FALSE(oracle.is_price_fresh(WETH));
    }

    SECTION("Every quote reads the feed") {
        feed.set_price(WETH, 100, 8, chain.timestamp());
        REQUIRE(oracle.quote(WETH).ok());
        feed.clear(WETH);
        REQUIRE(oracle.quote(WETH).status == errors::INVALID_PRICE);
    }
}

TEST_CASE("Oracle feed registry and stats", "[oracle]") {
    Chain chain;
    PriceOracle oracle(chain);
    ManualPriceFeed feed;

    oracle.set_feed(WETH, &feed);
    oracle.set_feed(USD, &feed);
    REQUIRE(oracle.has_feed(USD));
    REQUIRE(oracle.feed(WETH) == &feed);

    oracle.remove_feed(USD);
    REQUIRE_FALSE(oracle.has_feed(USD));

    oracle.quote(WETH);
    feed.set_price(WETH, 100, 8, chain.timestamp());
    oracle.quote(WETH);

    PriceOracle::Stats stats = oracle.get_stats();
    REQUIRE(stats.total_feeds == 1);
    REQUIRE(stats.total_quotes == 2);
    REQUIRE(stats.rejected_quotes == 1);
}
