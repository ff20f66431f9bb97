#include "Big.hpp"
#include "ExponentMath.hpp"

#include <cmath>
#include <limits>

namespace bignum {

using detail::checkedAdd;
using detail::checkedSub;
using detail::exponentDelta;
using detail::flip;
using detail::powerOfTen;
using detail::signOf;

namespace {

constexpr double QUIET_NAN = std::numeric_limits<double>::quiet_NaN();

template<typename T, typename U>
constexpr bool isSame = std::is_same_v<std::decay_t<T>, U>;

// lhs + rhs (or lhs - rhs) at the exponent of lhs. Anything SIG_DIGITS or more
// orders of magnitude below the other operand is lost at double precision.
Number combine(const Number& lhs, const Number& rhs, bool subtract) {
    const int64_t delta = exponentDelta(lhs.e, rhs.e);
    if (delta >= SIG_DIGITS) {
        return Number{subtract ? -rhs.m : rhs.m, rhs.e};
    }
    if (delta <= -SIG_DIGITS) {
        return lhs;
    }

    const double scaled = rhs.m * powerOfTen(delta);
    return Number{subtract ? lhs.m - scaled : lhs.m + scaled, lhs.e};
}

Infinity withSignOf(const Infinity& infinity, const Number& number) {
    return number.m < 0.0 ? Infinity{flip(infinity.kind)} : infinity;
}

bool isOddInteger(double value) {
    return std::isfinite(value) && std::trunc(value) == value && std::fmod(value, 2.0) != 0.0;
}

} // namespace

void Big::addUnnormalized(const Big& rhs) {
    value_ = std::visit([](const auto& a, const auto& b) -> BigValue {
        using A = decltype(a);
        using B = decltype(b);

        if constexpr (isSame<A, NaN> || isSame<B, NaN>) {
            return NaN{};
        } else if constexpr (isSame<A, Infinity> && isSame<B, Infinity>) {
            // +inf + -inf is undefined
            if (a.kind != b.kind) return NaN{};
            return a;
        } else if constexpr (isSame<A, Infinity>) {
            return a;
        } else if constexpr (isSame<B, Infinity>) {
            return b;
        } else if constexpr (isSame<A, Zero>) {
            return b;
        } else if constexpr (isSame<B, Zero>) {
            return a;
        } else {
            return combine(a, b, false);
        }
    }, value_, rhs.value_);
}

void Big::subtractUnnormalized(const Big& rhs) {
    value_ = std::visit([](const auto& a, const auto& b) -> BigValue {
        using A = decltype(a);
        using B = decltype(b);

        if constexpr (isSame<A, NaN> || isSame<B, NaN>) {
            return NaN{};
        } else if constexpr (isSame<A, Infinity> && isSame<B, Infinity>) {
            return NaN{};
        } else if constexpr (isSame<A, Infinity>) {
            return a;
        } else if constexpr (isSame<B, Infinity>) {
            return Infinity{flip(b.kind)};
        } else if constexpr (isSame<A, Zero> && isSame<B, Zero>) {
            return Zero{};
        } else if constexpr (isSame<A, Zero>) {
            return Number{-b.m, b.e};
        } else if constexpr (isSame<B, Zero>) {
            return a;
        } else {
            return combine(a, b, true);
        }
    }, value_, rhs.value_);
}

void Big::multiplyUnnormalized(const Big& rhs) {
    value_ = std::visit([](const auto& a, const auto& b) -> BigValue {
        using A = decltype(a);
        using B = decltype(b);

        if constexpr (isSame<A, NaN> || isSame<B, NaN>) {
            return NaN{};
        } else if constexpr (isSame<A, Infinity> && isSame<B, Infinity>) {
            // The square of an infinity is treated as indeterminate
            if (a.kind == b.kind) return NaN{};
            return Infinity{InfinityKind::Negative};
        } else if constexpr ((isSame<A, Infinity> && isSame<B, Zero>) ||
                             (isSame<A, Zero> && isSame<B, Infinity>)) {
            return NaN{};
        } else if constexpr (isSame<A, Infinity>) {
            return withSignOf(a, b);
        } else if constexpr (isSame<B, Infinity>) {
            return withSignOf(b, a);
        } else if constexpr (isSame<A, Zero> || isSame<B, Zero>) {
            return Zero{};
        } else {
            const double m = a.m * b.m;
            if (auto e = checkedAdd(a.e, b.e)) {
                return Number{m, *e};
            }
            if (b.e > 0) return Infinity{signOf(m)};
            return Zero{};
        }
    }, value_, rhs.value_);
}

void Big::divideUnnormalized(const Big& rhs) {
    value_ = std::visit([](const auto& a, const auto& b) -> BigValue {
        using A = decltype(a);
        using B = decltype(b);

        if constexpr (isSame<A, NaN> || isSame<B, NaN>) {
            return NaN{};
        } else if constexpr (isSame<B, Zero>) {
            return NaN{};
        } else if constexpr (isSame<A, Infinity> && isSame<B, Infinity>) {
            return NaN{};
        } else if constexpr (isSame<A, Infinity>) {
            return a;
        } else if constexpr (isSame<B, Infinity> || isSame<A, Zero>) {
            return Zero{};
        } else {
            const double m = a.m / b.m;
            if (auto e = checkedSub(a.e, b.e)) {
                return Number{m, *e};
            }
            if (b.e < 0) return Infinity{signOf(m)};
            return Zero{};
        }
    }, value_, rhs.value_);
}

void Big::remainderUnnormalized(const Big& rhs) {
    value_ = std::visit([](const auto& a, const auto& b) -> BigValue {
        using A = decltype(a);
        using B = decltype(b);

        if constexpr (isSame<A, NaN> || isSame<B, NaN>) {
            return NaN{};
        } else if constexpr (isSame<B, Zero> || isSame<A, Infinity>) {
            return NaN{};
        } else if constexpr (isSame<A, Zero>) {
            return Zero{};
        } else if constexpr (isSame<B, Infinity>) {
            return a;
        } else {
            // Divisor rescaled onto the dividend's exponent; the sign of the
            // result follows the dividend.
            const double divisor = b.m * powerOfTen(exponentDelta(a.e, b.e));
            if (std::isinf(divisor)) return a;
            if (divisor == 0.0) return Zero{};
            return Number{std::fmod(a.m, divisor), a.e};
        }
    }, value_, rhs.value_);
}

Big& Big::operator+=(const Big& rhs) {
    addUnnormalized(rhs);
    normalize();
    return *this;
}

Big& Big::operator-=(const Big& rhs) {
    subtractUnnormalized(rhs);
    normalize();
    return *this;
}

Big& Big::operator*=(const Big& rhs) {
    multiplyUnnormalized(rhs);
    normalize();
    return *this;
}

Big& Big::operator/=(const Big& rhs) {
    divideUnnormalized(rhs);
    normalize();
    return *this;
}

Big& Big::operator%=(const Big& rhs) {
    remainderUnnormalized(rhs);
    normalize();
    return *this;
}

Big operator+(Big lhs, const Big& rhs) { return lhs += rhs; }
Big operator-(Big lhs, const Big& rhs) { return lhs -= rhs; }
Big operator*(Big lhs, const Big& rhs) { return lhs *= rhs; }
Big operator/(Big lhs, const Big& rhs) { return lhs /= rhs; }
Big operator%(Big lhs, const Big& rhs) { return lhs %= rhs; }

void Big::powInPlace(double power) {
    if (isZero()) {
        // 0^0 is left undefined
        if (power == 0.0 || std::isnan(power)) {
            value_ = NaN{};
        }
        return;
    }

    const bool negativeBase = isNumber() && isNegative();
    const double target = abs().log10() * power;

    if (std::isnan(target) || target == -std::numeric_limits<double>::infinity()) {
        value_ = NaN{};
        return;
    }
    if (target == std::numeric_limits<double>::infinity()) {
        value_ = POS_INFINITY.value_;
        return;
    }

    // The target exponent itself may not fit into 64 bits
    if (target < static_cast<double>(MIN_EXPONENT)) {
        value_ = Zero{};
        return;
    }
    if (target >= static_cast<double>(MAX_EXPONENT)) {
        value_ = POS_INFINITY.value_;
        return;
    }

    double m = std::pow(10.0, std::fmod(target, 1.0));
    if (negativeBase && isOddInteger(power)) {
        m = -m;
    }
    value_ = Number{m, static_cast<int64_t>(target)};
    normalize();
}

Big Big::pow(double power) const {
    Big result = *this;
    result.powInPlace(power);
    return result;
}

double Big::log10() const {
    return std::visit([](const auto& v) -> double {
        using T = decltype(v);

        if constexpr (isSame<T, Number>) {
            // log10(m * 10^e) without rebuilding the (possibly huge) value
            return std::log10(v.m) + static_cast<double>(v.e);
        } else if constexpr (isSame<T, Infinity>) {
            return v.kind == InfinityKind::Positive ? std::numeric_limits<double>::infinity()
                                                    : QUIET_NAN;
        } else {
            return QUIET_NAN;
        }
    }, value_);
}

double Big::ln() const {
    const double log = log10();
    if (std::isnormal(log)) {
        return log / M_LOG10E;
    }
    return log;
}

double Big::log(double base) const {
    if (!std::isnormal(base) || base < 0.0) {
        return QUIET_NAN;
    }
    return ln() / std::log(base);
}

} // namespace bignum
