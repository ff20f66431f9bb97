#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

/**
 * Big - a real number with a 64-bit power-of-ten exponent
 *
 * A Big keeps the precision and rounding behavior of a double but extends the
 * magnitude range to 10^INT64_MIN .. 10 * 10^INT64_MAX (exclusive).
 *
 * Representation:
 * - Number{m, e}: m * 10^e, with 1.0 <= |m| < 10.0 and the sign carried by m
 * - Zero: the only representation of 0
 * - NaN: never equal to anything, itself included
 * - Infinity: positive or negative
 *
 * Every public operation leaves a Number normalized. The *Unnormalized
 * mutators and Big::unnormalized() skip that step; call normalize() before
 * the value is compared, tested for equality or displayed.
 */

namespace bignum {

enum class InfinityKind : uint8_t {
    Positive,
    Negative
};

struct Number {
    double m{};  // mantissa, 1.0 <= |m| < 10.0 once normalized
    int64_t e{}; // power of ten
};

struct Zero {};
struct NaN {};

struct Infinity {
    InfinityKind kind{InfinityKind::Positive};
};

using BigValue = std::variant<Number, Zero, NaN, Infinity>;

// Exponent distance beyond which the smaller operand of an add/subtract
// disappears below double precision.
constexpr int64_t SIG_DIGITS = 15;

constexpr int64_t MAX_EXPONENT = std::numeric_limits<int64_t>::max();
constexpr int64_t MIN_EXPONENT = std::numeric_limits<int64_t>::min();

// Result of compare(); NaN and equal infinities are Unordered.
enum class Ordering {
    Less,
    Equal,
    Greater,
    Unordered
};

struct ParseResult;

class Big {
public:
    constexpr Big() noexcept : value_(Zero{}) {}
    constexpr Big(Zero zero) noexcept : value_(zero) {}
    constexpr Big(NaN nan) noexcept : value_(nan) {}
    constexpr Big(Infinity infinity) noexcept : value_(infinity) {}

    // mantissa * 10^exponent, normalized
    Big(double mantissa, int64_t exponent);

    // Any native integer or floating-point value, read as value * 10^0
    template<typename T,
             typename = std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>>>
    Big(T value) : Big(static_cast<double>(value), 0) {}

    static constexpr Big zero() noexcept { return Big(Zero{}); }
    static constexpr Big nan() noexcept { return Big(NaN{}); }
    static constexpr Big infinity(InfinityKind kind) noexcept { return Big(Infinity{kind}); }

    // Builds a Number without normalizing it. normalize() must run before
    // the result is read, compared or displayed.
    static Big unnormalized(double mantissa, int64_t exponent) noexcept;

    // Bring a raw Number back to canonical form (or collapse it into
    // Zero/NaN/Infinity). Only needed after the *Unnormalized mutators.
    void normalize();

    const BigValue& value() const noexcept { return value_; }
    std::optional<double> mantissa() const noexcept;
    std::optional<int64_t> exponent() const noexcept;

    bool isNumber() const noexcept { return std::holds_alternative<Number>(value_); }
    bool isZero() const noexcept { return std::holds_alternative<Zero>(value_); }
    bool isNaN() const noexcept { return std::holds_alternative<NaN>(value_); }
    bool isInfinity() const noexcept { return std::holds_alternative<Infinity>(value_); }
    bool isPositiveInfinity() const noexcept;
    bool isNegativeInfinity() const noexcept;
    bool isNegative() const noexcept;

    // Raw combination without the final normalize step
    void addUnnormalized(const Big& rhs);
    void subtractUnnormalized(const Big& rhs);
    void multiplyUnnormalized(const Big& rhs);
    void divideUnnormalized(const Big& rhs);
    void remainderUnnormalized(const Big& rhs);

    Big& operator+=(const Big& rhs);
    Big& operator-=(const Big& rhs);
    Big& operator*=(const Big& rhs);
    Big& operator/=(const Big& rhs);
    Big& operator%=(const Big& rhs);

    Big operator-() const;
    void negateInPlace() noexcept;

    Big abs() const;
    void absInPlace() noexcept;

    // self^power computed as 10^(log10(|self|) * power)
    Big pow(double power) const;
    void powInPlace(double power);

    double log10() const;
    double ln() const;
    double log(double base) const;

    // "0", "NaN", "+inf", "-inf" or "<mantissa>e<exponent>"
    std::string toString() const;
    // Every integer digit is written out, so a Number with exponent e needs
    // e + places + 2 characters. Throws std::length_error when that exceeds
    // std::string::max_size(); large but representable lengths may still
    // throw std::bad_alloc.
    std::string toFixed(std::size_t places) const;
    std::string toExponential(std::size_t places) const;

    static ParseResult parse(std::string_view text);
    // Same as parse(), throws BigParseError on malformed text
    static Big fromString(std::string_view text);

private:
    BigValue value_;
};

inline constexpr Big POS_INFINITY{Infinity{InfinityKind::Positive}};
inline constexpr Big NEG_INFINITY{Infinity{InfinityKind::Negative}};

Big operator+(Big lhs, const Big& rhs);
Big operator-(Big lhs, const Big& rhs);
Big operator*(Big lhs, const Big& rhs);
Big operator/(Big lhs, const Big& rhs);
Big operator%(Big lhs, const Big& rhs);

Ordering compare(const Big& lhs, const Big& rhs);

// Structural equality: Numbers with identical mantissa and exponent, or two
// Zeros. NaN and Infinity are never equal to anything.
bool operator==(const Big& lhs, const Big& rhs);
bool operator!=(const Big& lhs, const Big& rhs);
bool operator<(const Big& lhs, const Big& rhs);
bool operator<=(const Big& lhs, const Big& rhs);
bool operator>(const Big& lhs, const Big& rhs);
bool operator>=(const Big& lhs, const Big& rhs);

std::ostream& operator<<(std::ostream& out, const Big& value);
std::ostream& operator<<(std::ostream& out, Ordering ordering);

// Text parsing errors
enum class ParseErrorKind {
    None = 0,
    WrongPartCount,  // not exactly "<mantissa>e<exponent>"
    InvalidMantissa,
    InvalidExponent
};

struct ParseError {
    ParseErrorKind kind{ParseErrorKind::None};
    std::string fragment;  // offending part of the input
    std::size_t parts{0};  // number of parts found, for WrongPartCount

    std::string message() const;
};

struct ParseResult {
    Big value{};
    ParseError error{};

    explicit operator bool() const { return error.kind == ParseErrorKind::None; }
};

class BigParseError : public std::runtime_error {
public:
    explicit BigParseError(ParseError error)
        : std::runtime_error(error.message()), error_(std::move(error)) {}

    const ParseError& error() const noexcept { return error_; }

private:
    ParseError error_;
};

} // namespace bignum
