// Lever - Constant-product router tests

#include <catch2/catch.hpp>
#include <lever/router.hpp>

using namespace lever;

namespace {

const Address OWNER = addresses::make(1);
const Address TRADER = addresses::make(2);
const Address ROUTER = addresses::make(0x2001);

struct Market {
    Chain chain;
    Token usd{chain, addresses::make(0x1002), "lvUSD", 18, OWNER};
    Token weth{chain, addresses::make(0x1001), "WETH", 18, OWNER};
    ConstantProductRouter router{chain, ROUTER, OWNER};

    Market() {
        router.register_token(&usd);
        router.register_token(&weth);
        usd.mint(OWNER, OWNER, x18::from_int(2000000));
        weth.mint(OWNER, OWNER, x18::from_int(1000));
        usd.approve(OWNER, ROUTER, UNLIMITED_ALLOWANCE);
        weth.approve(OWNER, ROUTER, UNLIMITED_ALLOWANCE);
    }

    SwapRoute usd_to_weth() const {
        return SwapRoute{usd.id(), weth.id(), fees::FEE_030};
    }
};

} // namespace

TEST_CASE("Pool creation", "[router]") {
    Market m;

    REQUIRE(m.router.create_pool(TRADER, m.usd.id(), m.weth.id(), fees::FEE_030) == errors::UNAUTHORIZED);
    REQUIRE(m.router.create_pool(OWNER, m.usd.id(), m.usd.id(), fees::FEE_030) == errors::INVALID_ASSET);
    REQUIRE(m.router.create_pool(OWNER, m.usd.id(), m.weth.id(), fees::FEE_MAX + 1) == errors::INVALID_CONFIG);
    REQUIRE(m.router.create_pool(OWNER, m.usd.id(), m.weth.id(), fees::FEE_030) == errors::OK);
    REQUIRE(m.router.create_pool(OWNER, m.weth.id(), m.usd.id(), fees::FEE_030) == errors::POOL_ALREADY_INITIALIZED);

    REQUIRE(m.router.add_liquidity(OWNER, m.usd.id(), m.weth.id(), fees::FEE_030,
                                   x18::from_int(2000000), x18::from_int(1000)) == errors::OK);

    auto reserves = m.router.get_reserves(m.weth.id(), m.usd.id(), fees::FEE_030);
    REQUIRE(reserves.has_value());
    I128 usd_reserve = reserves->token0 == m.usd.id() ? reserves->reserve0 : reserves->reserve1;
    REQUIRE(usd_reserve == x18::from_int(2000000));
    REQUIRE(m.usd.balance_of(ROUTER) == x18::from_int(2000000));
}

TEST_CASE("Exact-input swaps", "[router]") {
    Market m;
    m.router.create_pool(OWNER, m.usd.id(), m.weth.id(), fees::FEE_030);
    m.router.add_liquidity(OWNER, m.usd.id(), m.weth.id(), fees::FEE_030,
                           x18::from_int(2000000), x18::from_int(1000));

    const I128 amount_in = x18::from_int(20000);
    m.usd.mint(OWNER, TRADER, amount_in);
    m.usd.approve(TRADER, ROUTER, amount_in);

    // in_with_fee = 19940; out = 1000 * 19940 / (2000000 + 19940)
    I128 in_with_fee = x18::from_int(19940);
    I128 expected = x18::mul_div(x18::from_int(1000), in_with_fee, x18::from_int(2000000) + in_with_fee);

    SECTION("Quote matches execution") {
        REQUIRE(m.router.quote_exact_input(m.usd_to_weth(), amount_in) == expected);

        SwapResult r = m.router.swap_exact_input(TRADER, m.usd_to_weth(), amount_in, 0, TRADER);
        REQUIRE(r.ok());
        REQUIRE(r.amount_out == expected);
        REQUIRE(m.weth.balance_of(TRADER) == expected);
        REQUIRE(m.usd.balance_of(TRADER) == 0);
        REQUIRE(m.router.total_swaps() == 1);
        REQUIRE(m.chain.count_events("Swap") == 1);
    }

    SECTION("Slippage bound rolls back") {
        SwapResult r = m.router.swap_exact_input(TRADER, m.usd_to_weth(), amount_in,
                                                 expected + 1, TRADER);
        REQUIRE(r.status == errors::SLIPPAGE_EXCEEDED);
        REQUIRE(r.amount_out == 0);
        REQUIRE(m.usd.balance_of(TRADER) == amount_in);
        REQUIRE(m.router.total_swaps() == 0);
    }

    SECTION("Missing allowance fails the swap") {
        m.usd.approve(TRADER, ROUTER, 0);
        SwapResult r = m.router.swap_exact_input(TRADER, m.usd_to_weth(), amount_in, 0, TRADER);
        REQUIRE(r.status == errors::INSUFFICIENT_ALLOWANCE);
        auto reserves = m.router.get_reserves(m.usd.id(), m.weth.id(), fees::FEE_030);
        I128 weth_reserve = reserves->token0 == m.weth.id() ? reserves->reserve0 : reserves->reserve1;
        REQUIRE(weth_reserve == x18::from_int(1000));
    }

    SECTION("Unknown pool") {
        SwapRoute route{m.usd.id(), m.weth.id(), fees::FEE_100};
        REQUIRE(m.router.swap_exact_input(TRADER, route, amount_in, 0, TRADER).status == errors::POOL_NOT_FOUND);
        REQUIRE_FALSE(m.router.quote_exact_input(route, amount_in).has_value());
    }
}
