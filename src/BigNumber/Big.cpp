#include "Big.hpp"
#include "ExponentMath.hpp"

#include <cmath>

namespace bignum {

using detail::checkedAdd;
using detail::checkedSub;
using detail::powerOfTen;
using detail::signOf;

Big::Big(double mantissa, int64_t exponent) : value_(Number{mantissa, exponent}) {
    normalize();
}

Big Big::unnormalized(double mantissa, int64_t exponent) noexcept {
    Big result;
    result.value_ = Number{mantissa, exponent};
    return result;
}

/**
 * Normalize a raw Number
 *
 * Special states stay as they are. A Number is either collapsed into
 * Zero/NaN/Infinity or rescaled so that 1.0 <= |m| < 10.0.
 */
void Big::normalize() {
    auto* number = std::get_if<Number>(&value_);
    if (!number) {
        return;
    }

    const double m = number->m;
    const int64_t e = number->e;

    if (m == 0.0) {
        value_ = Zero{};
        return;
    }
    if (std::isnan(m)) {
        value_ = NaN{};
        return;
    }
    if (std::isinf(m)) {
        value_ = Infinity{signOf(m)};
        return;
    }

    const double magnitude = std::fabs(m);
    if (magnitude >= 1.0 && magnitude < 10.0) {
        return;
    }

    // Truncated order of magnitude, only used to check that the shift fits
    // into the exponent before anything is rescaled.
    const auto provisional = static_cast<int64_t>(std::log10(magnitude));
    if (provisional <= 0) {
        if (!checkedSub(e, -provisional)) {
            value_ = Zero{};
            return;
        }
    } else if (!checkedAdd(e, provisional)) {
        value_ = Infinity{signOf(m)};
        return;
    }

    // floor() differs from the truncated order for magnitudes below 1, which
    // can still push an exponent at MIN_EXPONENT out of range.
    const auto order = static_cast<int64_t>(std::floor(std::log10(magnitude)));
    const auto shifted = checkedAdd(e, order);
    if (!shifted) {
        value_ = Zero{};
        return;
    }

    number->m = m / powerOfTen(order);
    number->e = *shifted;
}

std::optional<double> Big::mantissa() const noexcept {
    if (const auto* number = std::get_if<Number>(&value_)) {
        return number->m;
    }
    return std::nullopt;
}

std::optional<int64_t> Big::exponent() const noexcept {
    if (const auto* number = std::get_if<Number>(&value_)) {
        return number->e;
    }
    return std::nullopt;
}

bool Big::isPositiveInfinity() const noexcept {
    const auto* infinity = std::get_if<Infinity>(&value_);
    return infinity && infinity->kind == InfinityKind::Positive;
}

bool Big::isNegativeInfinity() const noexcept {
    const auto* infinity = std::get_if<Infinity>(&value_);
    return infinity && infinity->kind == InfinityKind::Negative;
}

bool Big::isNegative() const noexcept {
    if (const auto* number = std::get_if<Number>(&value_)) {
        return number->m < 0.0;
    }
    return isNegativeInfinity();
}

// Flipping the sign never leaves the [1, 10) range, no normalization needed
void Big::negateInPlace() noexcept {
    if (auto* number = std::get_if<Number>(&value_)) {
        number->m = -number->m;
    } else if (auto* infinity = std::get_if<Infinity>(&value_)) {
        infinity->kind = detail::flip(infinity->kind);
    }
}

Big Big::operator-() const {
    Big result = *this;
    result.negateInPlace();
    return result;
}

void Big::absInPlace() noexcept {
    if (auto* number = std::get_if<Number>(&value_)) {
        number->m = std::fabs(number->m);
    } else if (auto* infinity = std::get_if<Infinity>(&value_)) {
        infinity->kind = InfinityKind::Positive;
    }
}

Big Big::abs() const {
    Big result = *this;
    result.absInPlace();
    return result;
}

} // namespace bignum
