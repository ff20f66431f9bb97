#include <catch2/catch_test_macros.hpp>
#include "Big.hpp"
#include <cmath>
#include <limits>

using namespace bignum;

TEST_CASE("Big creation", "[big]") {
    SECTION("Default constructor creates zero") {
        Big zero;
        REQUIRE(zero.isZero());
        REQUIRE(std::holds_alternative<Zero>(zero.value()));
    }

    SECTION("Exponent extremes stay finite") {
        REQUIRE(Big(1.0, 0).isNumber());
        REQUIRE(Big(-1.0, 0).isNumber());
        REQUIRE(Big(1.0, MAX_EXPONENT).isNumber());
        REQUIRE(Big(1.0, MIN_EXPONENT).isNumber());
    }

    SECTION("Exponent overflow becomes infinity") {
        REQUIRE(Big(100.0, MAX_EXPONENT - 1).isPositiveInfinity());
        REQUIRE(Big(-100.0, MAX_EXPONENT - 1).isNegativeInfinity());
    }

    SECTION("Exponent underflow becomes zero") {
        REQUIRE(Big(0.01, MIN_EXPONENT + 1) == Big(Zero{}));
        REQUIRE(Big(0.5, MIN_EXPONENT).isZero());
    }

    SECTION("Equivalent pairs normalize identically") {
        REQUIRE(Big(1.0, 1) == Big(10.0, 0));
        REQUIRE(Big(0.5, 0) == Big(5.0, -1));
    }
}

TEST_CASE("Big conversion from native values", "[big]") {
    SECTION("Integers") {
        Big value = 42;
        REQUIRE(value.mantissa() == 4.2);
        REQUIRE(value.exponent() == 1);
        REQUIRE(Big(int64_t{-7}) == Big(-7.0, 0));
        REQUIRE(Big(0u).isZero());
    }

    SECTION("Floating point") {
        REQUIRE(Big(0.0).isZero());
        REQUIRE(Big(-0.0).isZero());
        REQUIRE(Big(2.5f) == Big(2.5, 0));
    }

    SECTION("Floating point special values") {
        REQUIRE(Big(std::numeric_limits<double>::quiet_NaN()).isNaN());
        REQUIRE(Big(std::numeric_limits<double>::infinity()).isPositiveInfinity());
        REQUIRE(Big(-std::numeric_limits<double>::infinity()).isNegativeInfinity());
    }
}

TEST_CASE("Big normalization", "[big][normalize]") {
    SECTION("Large mantissa is scaled down") {
        Big value(1234.5, 0);
        REQUIRE(value.mantissa() == 1.2345);
        REQUIRE(value.exponent() == 3);
    }

    SECTION("Negative mantissa keeps its sign") {
        Big value(-1234.5, 0);
        REQUIRE(value.mantissa() == -1.2345);
        REQUIRE(value.exponent() == 3);
    }

    SECTION("Small mantissa is scaled up") {
        Big value(0.001, 0);
        REQUIRE(value.mantissa() == 1.0);
        REQUIRE(value.exponent() == -3);
    }

    SECTION("Zero mantissa is Zero regardless of exponent") {
        REQUIRE(Big(0.0, 4) == Big(Zero{}));
    }

    SECTION("Normalization is idempotent") {
        Big value(98765.4321, -12);
        Big again = value;
        again.normalize();
        REQUIRE(again == value);
        REQUIRE(again.mantissa() == value.mantissa());
        REQUIRE(again.exponent() == value.exponent());
    }

    SECTION("Special states are left alone") {
        Big nan = NaN{};
        nan.normalize();
        REQUIRE(nan.isNaN());

        Big inf = POS_INFINITY;
        inf.normalize();
        REQUIRE(inf.isPositiveInfinity());
    }
}

TEST_CASE("Big unnormalized values", "[big][normalize]") {
    SECTION("Raw pair is kept until normalize") {
        Big raw = Big::unnormalized(1234.5, 0);
        REQUIRE(raw.mantissa() == 1234.5);
        REQUIRE(raw.exponent() == 0);

        raw.normalize();
        REQUIRE(raw == Big(1.2345, 3));
    }

    SECTION("Chained operations with a single normalize") {
        Big value = Big::unnormalized(5.0, 0);
        value.multiplyUnnormalized(Big(4));
        value.multiplyUnnormalized(Big(5));
        REQUIRE(value.mantissa() == 100.0);
        REQUIRE(value.exponent() == 0);

        value.normalize();
        REQUIRE(value == Big(100));
    }

    SECTION("Raw special mantissas collapse") {
        Big nan = Big::unnormalized(std::nan(""), 3);
        nan.normalize();
        REQUIRE(nan.isNaN());

        Big negInf = Big::unnormalized(-std::numeric_limits<double>::infinity(), 3);
        negInf.normalize();
        REQUIRE(negInf.isNegativeInfinity());
    }
}

TEST_CASE("Big predicates and constants", "[big]") {
    SECTION("Infinity constants") {
        REQUIRE(POS_INFINITY.isPositiveInfinity());
        REQUIRE_FALSE(POS_INFINITY.isNegativeInfinity());
        REQUIRE(NEG_INFINITY.isNegativeInfinity());
        REQUIRE(NEG_INFINITY.isInfinity());
    }

    SECTION("Named special values") {
        REQUIRE(Big::zero().isZero());
        REQUIRE(Big::nan().isNaN());
        REQUIRE(Big::infinity(InfinityKind::Positive).isPositiveInfinity());
        REQUIRE(Big::infinity(InfinityKind::Negative).isNegativeInfinity());
    }

    SECTION("Accessors are empty outside the Number state") {
        REQUIRE_FALSE(Big(Zero{}).mantissa().has_value());
        REQUIRE_FALSE(POS_INFINITY.exponent().has_value());
    }

    SECTION("Sign") {
        REQUIRE(Big(-3).isNegative());
        REQUIRE_FALSE(Big(3).isNegative());
        REQUIRE(NEG_INFINITY.isNegative());
        REQUIRE_FALSE(Big(Zero{}).isNegative());
        REQUIRE_FALSE(Big(NaN{}).isNegative());
    }
}

TEST_CASE("Big negation and absolute value", "[big]") {
    SECTION("Negate in place") {
        Big value = 42;
        value.negateInPlace();
        REQUIRE(value == Big(-42));
    }

    SECTION("Unary minus") {
        REQUIRE(-Big(7) == Big(-7));
        REQUIRE((-POS_INFINITY).isNegativeInfinity());
        REQUIRE((-NEG_INFINITY).isPositiveInfinity());
        REQUIRE((-Big(Zero{})).isZero());
        REQUIRE((-Big(NaN{})).isNaN());
    }

    SECTION("Absolute value") {
        REQUIRE(Big(-42).abs() == Big(42));
        REQUIRE(Big(42).abs() == Big(42));
        REQUIRE(NEG_INFINITY.abs().isPositiveInfinity());
        REQUIRE(Big(Zero{}).abs().isZero());

        Big value(-3.5, 900);
        value.absInPlace();
        REQUIRE(value == Big(3.5, 900));
    }
}
