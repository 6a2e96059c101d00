// Lever - Fixed-point and type helper tests

#include <catch2/catch.hpp>
#include <lever/types.hpp>

using namespace lever;

TEST_CASE("mul_div keeps full precision past 128 bits", "[math]") {
    SECTION("Small operands") {
        REQUIRE(x18::mul_div(I128(6), I128(7), I128(4)) == 10);
        REQUIRE(x18::mul(x18::from_int(3), x18::from_int(4)) == x18::from_int(12));
        REQUIRE(x18::div(x18::from_int(3), x18::from_int(4)) == X18_ONE * 3 / 4);
    }

    SECTION("Amount times price overflows a 128-bit product") {
        // 1e9 tokens (18 dp) at $200,000 (18 dp)
        I128 amount = x18::from_int(1000000000);
        I128 price = x18::from_int(200000);
        I128 value = x18::mul_div(amount, price, X18_ONE);
        REQUIRE(value == x18::from_int(200000000000000LL));
    }

    SECTION("Floors") {
        REQUIRE(x18::mul_div(I128(10), I128(1), I128(3)) == 3);
        REQUIRE(x18::mul_div(I128(2), I128(1), I128(3)) == 0);
    }

    SECTION("Non-positive operands yield zero") {
        REQUIRE(x18::mul_div(I128(-5), I128(7), I128(1)) == 0);
        REQUIRE(x18::mul_div(I128(5), I128(0), I128(1)) == 0);
    }

    SECTION("Saturates instead of wrapping") {
        REQUIRE(x18::mul_div(I128_MAX, I128_MAX, I128(1)) == I128_MAX);
    }
}

TEST_CASE("Decimal helpers", "[math]") {
    REQUIRE(x18::pow10(0) == 1);
    REQUIRE(x18::pow10(8) == 100000000);
    REQUIRE(x18::pow10(18) == X18_ONE);

    REQUIRE(x18::to_string(0) == "0");
    REQUIRE(x18::to_string(x18::from_int(100000)) == "100000000000000000000000");
    REQUIRE(x18::to_string(-42) == "-42");

    REQUIRE(x18::to_int(x18::from_int(77)) == 77);
}

TEST_CASE("Addresses and currencies", "[types]") {
    Address a = addresses::make(0x1001);
    REQUIRE(addresses::to_hex(a) == "0x0000000000000000000000000000000000001001");
    REQUIRE(addresses::is_zero(addresses::ZERO));
    REQUIRE_FALSE(addresses::is_zero(a));

    Currency c1(addresses::make(1));
    Currency c2(addresses::make(2));
    REQUIRE(c1 < c2);
    REQUIRE(c1 != c2);
    REQUIRE(Currency().is_zero());
}

TEST_CASE("Error names", "[types]") {
    REQUIRE(std::string(errors::name(errors::OK)) == "OK");
    REQUIRE(std::string(errors::name(errors::LOAN_EXCEEDS_LTV_LIMIT)) == "LoanExceedsLTVLimit");
    REQUIRE(std::string(errors::name(errors::PRICE_STALE)) == "StalePrice");
    REQUIRE(std::string(errors::name(12345)) == "Unknown");
}
