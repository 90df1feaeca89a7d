// Lend Core - Fixed-Point Arithmetic Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "support.hpp"

#include <stdexcept>

using namespace lend;
using lend::test::D;
using Catch::Approx;

TEST_CASE("X18 multiply and divide", "[fixed_point]") {
    SECTION("Exact products") {
        REQUIRE(x18::mul(D("1.5"), D("2")) == D("3"));
        REQUIRE(x18::mul(D("10000"), D("0.75")) == D("7500"));
        REQUIRE(x18::mul(D("-2"), D("0.5")) == D("-1"));
    }

    SECTION("Division truncates unless rounded up") {
        REQUIRE(x18::div(X18_ONE, D("3")) == I128(333333333333333333LL));
        REQUIRE(x18::div_up(X18_ONE, D("3")) == I128(333333333333333334LL));
        REQUIRE(x18::div(D("9000"), D("10000")) == D("0.9"));
        REQUIRE(x18::mul(I128(1), X18_HALF) == 0);
        REQUIRE(x18::mul_up(I128(1), X18_HALF) == I128(1));
    }

    SECTION("Large operands use a wide intermediate") {
        // 1e12 * 1e6 overflows a naive 128-bit a*b before rescaling
        REQUIRE(x18::mul(D("1000000000000"), D("1000000")) == D("1000000000000000000"));

        I128 big = D("123456789012.345678901234567891");
        REQUIRE(x18::mul_div(big, D("987654321"), D("987654321")) == big);
    }

    SECTION("Zero divisor saturates") {
        REQUIRE(x18::div(X18_ONE, 0) == X18_INFINITY);
    }

    SECTION("Overflowing quotient saturates") {
        I128 huge = X18_INFINITY / 2;
        REQUIRE(x18::mul(huge, D("1000")) == X18_INFINITY);
        REQUIRE(x18::mul(-huge, D("1000")) == -X18_INFINITY);
    }
}

TEST_CASE("X18 decimal parsing", "[fixed_point]") {
    SECTION("Integers and fractions") {
        REQUIRE(D("7500") == x18::from_int(7500));
        REQUIRE(D("0.75") == I128(750000000000000000LL));
        REQUIRE(D("-0.05") == -(X18_ONE / 20));
        REQUIRE(D(".5") == X18_HALF);
        REQUIRE(D("1_000") == x18::from_int(1000));
    }

    SECTION("Digits past the 18th decimal place are truncated") {
        REQUIRE(D("0.0000000000000000019") == 1);
    }

    SECTION("Malformed input") {
        I128 out = 0;
        REQUIRE_FALSE(x18::parse("", out));
        REQUIRE_FALSE(x18::parse("-", out));
        REQUIRE_FALSE(x18::parse("1.2.3", out));
        REQUIRE_FALSE(x18::parse("abc", out));
        REQUIRE_FALSE(x18::parse("12e3", out));
        REQUIRE_THROWS_AS(x18::from_string("1,5"), std::invalid_argument);
    }
}

TEST_CASE("X18 decimal formatting", "[fixed_point]") {
    REQUIRE(x18::to_string(D("7500")) == "7500");
    REQUIRE(x18::to_string(D("0.75")) == "0.75");
    REQUIRE(x18::to_string(D("-1.000001")) == "-1.000001");
    REQUIRE(x18::to_string(0) == "0");
    REQUIRE(x18::to_string(1) == "0.000000000000000001");
    REQUIRE(x18::to_double(D("1050.5")) == Approx(1050.5));
}

TEST_CASE("Identifier parsing", "[fixed_point]") {
    uint64_t id = 0;
    REQUIRE(parse_id("12", id));
    REQUIRE(id == 12);
    REQUIRE(parse_id("18446744073709551615", id));
    REQUIRE(id == UINT64_MAX);

    id = 7;
    REQUIRE_FALSE(parse_id("12abc", id));
    REQUIRE_FALSE(parse_id("-1", id));
    REQUIRE_FALSE(parse_id("+3", id));
    REQUIRE_FALSE(parse_id(" 3", id));
    REQUIRE_FALSE(parse_id("", id));
    REQUIRE_FALSE(parse_id("18446744073709551616", id));
    REQUIRE(id == 7);
}

TEST_CASE("Status and error names", "[fixed_point]") {
    REQUIRE(std::string(to_string(LoanStatus::OPEN)) == "open");
    REQUIRE(std::string(to_string(LoanStatus::PARTIALLY_LIQUIDATED)) == "partially_liquidated");
    REQUIRE(std::string(to_string(LoanStatus::CLOSED)) == "closed");

    REQUIRE(std::string(errors::to_string(errors::EXCEEDS_MAX_BORROW)) == "exceeds_max_borrow");
    REQUIRE(std::string(errors::to_string(errors::PARTIAL_SEIZURE_SHORTFALL)) == "partial_seizure_shortfall");
    REQUIRE(std::string(errors::to_string(-999)) == "unknown_error");
}
