#include <catch2/catch_test_macros.hpp>
#include "Big.hpp"
#include <cmath>
#include <sstream>

using namespace bignum;

TEST_CASE("Big three-way comparison", "[comparison]") {
    SECTION("NaN is unordered against everything") {
        REQUIRE(compare(Big(NaN{}), Big(1)) == Ordering::Unordered);
        REQUIRE(compare(Big(1), Big(NaN{})) == Ordering::Unordered);
        REQUIRE(compare(Big(NaN{}), Big(NaN{})) == Ordering::Unordered);
        REQUIRE(compare(Big(NaN{}), POS_INFINITY) == Ordering::Unordered);
    }

    SECTION("Infinities") {
        REQUIRE(compare(POS_INFINITY, NEG_INFINITY) == Ordering::Greater);
        REQUIRE(compare(NEG_INFINITY, POS_INFINITY) == Ordering::Less);
        REQUIRE(compare(POS_INFINITY, POS_INFINITY) == Ordering::Unordered);
        REQUIRE(compare(NEG_INFINITY, NEG_INFINITY) == Ordering::Unordered);
    }

    SECTION("Infinity against finite values") {
        REQUIRE(compare(POS_INFINITY, Big(9.9, MAX_EXPONENT)) == Ordering::Greater);
        REQUIRE(compare(NEG_INFINITY, Big(Zero{})) == Ordering::Less);
        REQUIRE(compare(Big(-9.9, MAX_EXPONENT), NEG_INFINITY) == Ordering::Greater);
        REQUIRE(compare(Big(Zero{}), POS_INFINITY) == Ordering::Less);
    }

    SECTION("Zero") {
        REQUIRE(compare(Big(Zero{}), Big(Zero{})) == Ordering::Equal);
        REQUIRE(compare(Big(Zero{}), Big(1, MIN_EXPONENT)) == Ordering::Less);
        REQUIRE(compare(Big(Zero{}), Big(-1, MIN_EXPONENT)) == Ordering::Greater);
        REQUIRE(compare(Big(3), Big(Zero{})) == Ordering::Greater);
        REQUIRE(compare(Big(-3), Big(Zero{})) == Ordering::Less);
    }

    SECTION("Numbers with close exponents") {
        REQUIRE(compare(Big(42), Big(42)) == Ordering::Equal);
        REQUIRE(compare(Big(41), Big(42)) == Ordering::Less);
        REQUIRE(compare(Big(420), Big(42)) == Ordering::Greater);
        REQUIRE(compare(Big(-420), Big(42)) == Ordering::Less);
        REQUIRE(compare(Big(-420), Big(-42)) == Ordering::Less);
    }

    SECTION("Numbers far apart compare by exponent") {
        REQUIRE(compare(Big(1.5, 10), Big(1.5, 40)) == Ordering::Less);
        REQUIRE(compare(Big(1.5, 40), Big(1.5, 10)) == Ordering::Greater);
        REQUIRE(compare(Big(1.0, MIN_EXPONENT), Big(1.0, MAX_EXPONENT)) == Ordering::Less);
    }

    SECTION("Far apart with opposite signs compare by sign") {
        REQUIRE(compare(Big(1), Big(-1, 20)) == Ordering::Greater);
        REQUIRE(compare(Big(-1, 20), Big(1)) == Ordering::Less);
        REQUIRE(compare(Big(-1, 1000), Big(1, -1000)) == Ordering::Less);
        REQUIRE(compare(Big(1, -1000), Big(-1, 1000)) == Ordering::Greater);
        REQUIRE(compare(Big(-1.0, MIN_EXPONENT), Big(1.0, MAX_EXPONENT)) == Ordering::Less);
    }

    SECTION("Far apart and both negative compare by inverted magnitude") {
        REQUIRE(compare(Big(-1.5, 10), Big(-1.5, 40)) == Ordering::Greater);
        REQUIRE(compare(Big(-1.5, 40), Big(-1.5, 10)) == Ordering::Less);
        REQUIRE(compare(Big(-1), Big(-1, 20)) == Ordering::Greater);
    }

    SECTION("Ordering stays transitive across zero") {
        const Big small = Big(1);
        const Big hugeNegative = Big(-1, 20);
        REQUIRE(hugeNegative < Big(Zero{}));
        REQUIRE(Big(Zero{}) < small);
        REQUIRE(hugeNegative < small);
        REQUIRE_FALSE(small < hugeNegative);
    }

    SECTION("Broken mantissa is unordered") {
        REQUIRE(compare(Big::unnormalized(std::nan(""), 0), Big(1)) == Ordering::Unordered);
    }
}

TEST_CASE("Big equality", "[comparison]") {
    SECTION("Zero equals zero however it was produced") {
        REQUIRE(Big(Zero{}) == Big(0.0));
        REQUIRE(Big(0.0, 7) == Big(-0.0));
    }

    SECTION("Numbers compare field by field") {
        REQUIRE(Big(1.5, 3) == Big(1500));
        REQUIRE(Big(1.5, 3) != Big(1.5, 4));
        REQUIRE(Big(1.5, 3) != Big(-1.5, 3));
    }

    SECTION("NaN and infinity never compare equal") {
        REQUIRE(Big(NaN{}) != Big(NaN{}));
        REQUIRE(POS_INFINITY != POS_INFINITY);
        REQUIRE(NEG_INFINITY != NEG_INFINITY);
        REQUIRE(POS_INFINITY != Big(1));
    }
}

TEST_CASE("Big relational operators", "[comparison]") {
    SECTION("Ordered values") {
        REQUIRE(Big(1) < Big(2));
        REQUIRE(Big(2) > Big(1));
        REQUIRE(Big(2) <= Big(2));
        REQUIRE(Big(2) >= Big(2));
        REQUIRE(Big(-1, 1000) < Big(1, -1000));
        REQUIRE(NEG_INFINITY < POS_INFINITY);
    }

    SECTION("Unordered values make every relation false") {
        const Big nan = NaN{};
        REQUIRE_FALSE(nan < Big(1));
        REQUIRE_FALSE(nan > Big(1));
        REQUIRE_FALSE(nan <= Big(1));
        REQUIRE_FALSE(nan >= Big(1));
        REQUIRE_FALSE(POS_INFINITY <= POS_INFINITY);
    }

    SECTION("Ordering prints as a word") {
        std::ostringstream out;
        out << Ordering::Less << " " << Ordering::Equal << " "
            << Ordering::Greater << " " << Ordering::Unordered;
        REQUIRE(out.str() == "less equal greater unordered");
    }
}
