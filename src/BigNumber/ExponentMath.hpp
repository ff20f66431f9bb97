#pragma once

#include <cmath>
#include <cstdint>
#include <optional>

#include "Big.hpp"

// Exponent helpers shared by the normalizer, the arithmetic and the comparator.
// Exponent range violations are reported as std::nullopt, never wrapped.

namespace bignum {
namespace detail {

inline std::optional<int64_t> checkedAdd(int64_t a, int64_t b) {
    if ((b > 0 && a > MAX_EXPONENT - b) || (b < 0 && a < MIN_EXPONENT - b)) {
        return std::nullopt;
    }
    return a + b;
}

inline std::optional<int64_t> checkedSub(int64_t a, int64_t b) {
    if ((b < 0 && a > MAX_EXPONENT + b) || (b > 0 && a < MIN_EXPONENT + b)) {
        return std::nullopt;
    }
    return a - b;
}

// rhs - lhs, saturated to the int64 range. A saturated distance is always far
// beyond SIG_DIGITS, which is all the callers need to know.
inline int64_t exponentDelta(int64_t lhs, int64_t rhs) {
    if (auto delta = checkedSub(rhs, lhs)) {
        return *delta;
    }
    return rhs > lhs ? MAX_EXPONENT : MIN_EXPONENT;
}

inline double powerOfTen(int64_t exponent) {
    return std::pow(10.0, static_cast<double>(exponent));
}

inline InfinityKind signOf(double mantissa) {
    return std::signbit(mantissa) ? InfinityKind::Negative : InfinityKind::Positive;
}

inline InfinityKind flip(InfinityKind kind) {
    return kind == InfinityKind::Positive ? InfinityKind::Negative : InfinityKind::Positive;
}

} // namespace detail
} // namespace bignum
