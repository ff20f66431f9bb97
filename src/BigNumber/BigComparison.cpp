#include "Big.hpp"
#include "ExponentMath.hpp"

namespace bignum {

namespace {

Ordering orderBySign(bool negative) {
    return negative ? Ordering::Less : Ordering::Greater;
}

Ordering invert(Ordering ordering) {
    switch (ordering) {
        case Ordering::Less: return Ordering::Greater;
        case Ordering::Greater: return Ordering::Less;
        default: return ordering;
    }
}

Ordering compareNumbers(const Number& lhs, const Number& rhs) {
    const int64_t delta = detail::exponentDelta(lhs.e, rhs.e);
    if (delta >= SIG_DIGITS || delta <= -SIG_DIGITS) {
        // Magnitudes alone decide only between values of the same sign
        const bool lhsNegative = lhs.m < 0.0;
        const bool rhsNegative = rhs.m < 0.0;
        if (lhsNegative != rhsNegative) return orderBySign(lhsNegative);

        const Ordering byMagnitude = delta > 0 ? Ordering::Less : Ordering::Greater;
        return lhsNegative ? invert(byMagnitude) : byMagnitude;
    }

    const double scaled = rhs.m * detail::powerOfTen(delta);
    if (scaled == lhs.m) return Ordering::Equal;
    if (scaled > lhs.m) return Ordering::Less;
    if (scaled < lhs.m) return Ordering::Greater;

    // Only reachable when the rescale produced NaN (e.g. a NaN mantissa left
    // behind by an unnormalized value)
    return Ordering::Unordered;
}

} // namespace

Ordering compare(const Big& lhs, const Big& rhs) {
    return std::visit([](const auto& a, const auto& b) -> Ordering {
        using A = std::decay_t<decltype(a)>;
        using B = std::decay_t<decltype(b)>;

        if constexpr (std::is_same_v<A, NaN> || std::is_same_v<B, NaN>) {
            return Ordering::Unordered;
        } else if constexpr (std::is_same_v<A, Infinity> && std::is_same_v<B, Infinity>) {
            if (a.kind == b.kind) return Ordering::Unordered;
            return orderBySign(a.kind == InfinityKind::Negative);
        } else if constexpr (std::is_same_v<A, Infinity>) {
            return orderBySign(a.kind == InfinityKind::Negative);
        } else if constexpr (std::is_same_v<B, Infinity>) {
            return invert(orderBySign(b.kind == InfinityKind::Negative));
        } else if constexpr (std::is_same_v<A, Zero> && std::is_same_v<B, Zero>) {
            return Ordering::Equal;
        } else if constexpr (std::is_same_v<A, Zero>) {
            return invert(orderBySign(b.m < 0.0));
        } else if constexpr (std::is_same_v<B, Zero>) {
            return orderBySign(a.m < 0.0);
        } else {
            return compareNumbers(a, b);
        }
    }, lhs.value(), rhs.value());
}

bool operator==(const Big& lhs, const Big& rhs) {
    if (lhs.isZero() && rhs.isZero()) {
        return true;
    }
    const auto* a = std::get_if<Number>(&lhs.value());
    const auto* b = std::get_if<Number>(&rhs.value());
    return a && b && a->m == b->m && a->e == b->e;
}

bool operator!=(const Big& lhs, const Big& rhs) {
    return !(lhs == rhs);
}

bool operator<(const Big& lhs, const Big& rhs) {
    return compare(lhs, rhs) == Ordering::Less;
}

bool operator<=(const Big& lhs, const Big& rhs) {
    const auto ordering = compare(lhs, rhs);
    return ordering == Ordering::Less || ordering == Ordering::Equal;
}

bool operator>(const Big& lhs, const Big& rhs) {
    return compare(lhs, rhs) == Ordering::Greater;
}

bool operator>=(const Big& lhs, const Big& rhs) {
    const auto ordering = compare(lhs, rhs);
    return ordering == Ordering::Greater || ordering == Ordering::Equal;
}

std::ostream& operator<<(std::ostream& out, Ordering ordering) {
    switch (ordering) {
        case Ordering::Less: return out << "less";
        case Ordering::Equal: return out << "equal";
        case Ordering::Greater: return out << "greater";
        case Ordering::Unordered: return out << "unordered";
    }
    return out;
}

} // namespace bignum
