#include "Big.hpp"
#include "ExponentMath.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace bignum {

namespace {

// Shortest decimal text that reads back as the same double, never in
// scientific notation
std::string formatMantissa(double m) {
    std::array<char, 32> buffer{};
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), m,
                                   std::chars_format::fixed);
    if (ec != std::errc()) {
        // Only an unnormalized mantissa can be this long
        std::ostringstream oss;
        oss << std::setprecision(17) << m;
        return oss.str();
    }
    return std::string(buffer.data(), end);
}

// A double has at most 1074 nonzero fractional digits. Digits past that are
// always zero and get appended instead of going through the stream precision.
constexpr std::size_t MAX_STREAM_PLACES = 1100;

std::string formatWithPlaces(double value, std::size_t places) {
    const std::size_t streamPlaces = std::min(places, MAX_STREAM_PLACES);
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(static_cast<int>(streamPlaces)) << value;
    std::string result = oss.str();
    if (places > streamPlaces && std::isfinite(value)) {
        result.append(places - streamPlaces, '0');
    }
    return result;
}

std::string zeroWithPlaces(std::size_t places) {
    return "0." + std::string(places, '0');
}

// Fixed-point text for numbers whose integer part has more digits than a
// double holds. The mantissa digits go first, the rest is zero padding.
std::string formatLargeFixed(const Number& number, std::size_t places) {
    std::string digits = formatMantissa(std::fabs(number.m));
    digits.erase(std::remove(digits.begin(), digits.end(), '.'), digits.end());

    const auto integerLength = static_cast<std::size_t>(number.e) + 1;
    std::string result;
    if (integerLength > result.max_size() - 2 || places > result.max_size() - 2 - integerLength) {
        throw std::length_error("toFixed: exponent " + std::to_string(number.e) +
                                " is too large for fixed-point text");
    }

    result = number.m < 0.0 ? "-" : "";
    std::string fraction;
    if (digits.size() <= integerLength) {
        result += digits;
        result.append(integerLength - digits.size(), '0');
    } else {
        result += digits.substr(0, integerLength);
        fraction = digits.substr(integerLength);
    }
    fraction.resize(places, '0');
    result += '.';
    result += fraction;
    return result;
}

bool equalsIgnoreCase(std::string_view text, std::string_view expected) {
    return text.size() == expected.size() &&
           std::equal(text.begin(), text.end(), expected.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) == b;
           });
}

// from_chars rejects a leading '+', the text format allows one
std::string_view stripPlus(std::string_view text) {
    if (text.size() > 1 && text.front() == '+' && text[1] != '-' && text[1] != '+') {
        text.remove_prefix(1);
    }
    return text;
}

// Whole-string double parse; out-of-range magnitudes count as failures
std::optional<double> parseDouble(std::string_view text) {
    text = stripPlus(text);
    double value = 0.0;
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }

    // Saturated results are range errors too, whatever from_chars reported
    const auto digits = text.substr(0, text.find_first_of("eE"));
    if (std::isinf(value) && digits.find_first_of("iI") == std::string_view::npos) {
        return std::nullopt;
    }
    if (value == 0.0 && digits.find_first_of("123456789") != std::string_view::npos) {
        return std::nullopt;
    }
    return value;
}

std::optional<int64_t> parseExponent(std::string_view text) {
    text = stripPlus(text);
    int64_t value = 0;
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

std::vector<std::string_view> splitOnExponentMarker(std::string_view text) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == 'e' || text[i] == 'E') {
            parts.push_back(text.substr(start, i - start));
            start = i + 1;
        }
    }
    parts.push_back(text.substr(start));
    return parts;
}

ParseResult failure(ParseErrorKind kind, std::string_view fragment, std::size_t parts = 0) {
    return {Big(NaN{}), ParseError{kind, std::string(fragment), parts}};
}

} // namespace

std::string Big::toString() const {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, Number>) {
            return formatMantissa(v.m) + "e" + std::to_string(v.e);
        } else if constexpr (std::is_same_v<T, Zero>) {
            return "0";
        } else if constexpr (std::is_same_v<T, NaN>) {
            return "NaN";
        } else {
            return v.kind == InfinityKind::Positive ? "+inf" : "-inf";
        }
    }, value_);
}

/**
 * Format as an ordinary decimal with `places` fractional digits
 *
 * Large numbers are not truncated: a Number with exponent 500 produces a
 * string of more than 500 characters.
 */
std::string Big::toFixed(std::size_t places) const {
    if (isZero()) {
        return zeroWithPlaces(places);
    }
    const auto* number = std::get_if<Number>(&value_);
    if (!number) {
        return toString();
    }
    if (number->e >= SIG_DIGITS) {
        return formatLargeFixed(*number, places);
    }
    return formatWithPlaces(number->m * detail::powerOfTen(number->e), places);
}

std::string Big::toExponential(std::size_t places) const {
    if (isZero()) {
        return zeroWithPlaces(places);
    }
    const auto* number = std::get_if<Number>(&value_);
    if (!number) {
        return toString();
    }
    return formatWithPlaces(number->m, places) + "e" + std::to_string(number->e);
}

std::ostream& operator<<(std::ostream& out, const Big& value) {
    return out << value.toString();
}

/**
 * Parse text into a Big
 *
 * Accepted forms:
 * - "0" and "nan" (any case)
 * - "inf", "+inf", "-inf" (any case), as produced by toString()
 * - any plain floating-point literal that fits into a double
 * - "<mantissa>e<exponent>" with a 64-bit exponent, e.g. "1.23e-1234"
 */
ParseResult Big::parse(std::string_view text) {
    if (equalsIgnoreCase(text, "0")) {
        return {Big(Zero{}), {}};
    }
    if (equalsIgnoreCase(text, "nan")) {
        return {Big(NaN{}), {}};
    }
    if (equalsIgnoreCase(text, "inf") || equalsIgnoreCase(text, "+inf")) {
        return {POS_INFINITY, {}};
    }
    if (equalsIgnoreCase(text, "-inf")) {
        return {NEG_INFINITY, {}};
    }

    if (auto value = parseDouble(text)) {
        return {Big(*value, 0), {}};
    }

    const auto parts = splitOnExponentMarker(text);
    if (parts.size() != 2) {
        return failure(ParseErrorKind::WrongPartCount, text, parts.size());
    }

    const auto mantissa = parseDouble(parts[0]);
    if (!mantissa) {
        return failure(ParseErrorKind::InvalidMantissa, parts[0]);
    }
    const auto exponent = parseExponent(parts[1]);
    if (!exponent) {
        return failure(ParseErrorKind::InvalidExponent, parts[1]);
    }

    return {Big(*mantissa, *exponent), {}};
}

Big Big::fromString(std::string_view text) {
    auto result = parse(text);
    if (!result) {
        throw BigParseError(std::move(result.error));
    }
    return result.value;
}

std::string ParseError::message() const {
    switch (kind) {
        case ParseErrorKind::None:
            return "no error";
        case ParseErrorKind::WrongPartCount:
            return "expected <mantissa>e<exponent>, found " + std::to_string(parts) +
                   " part(s) in '" + fragment + "'";
        case ParseErrorKind::InvalidMantissa:
            return "invalid mantissa '" + fragment + "'";
        case ParseErrorKind::InvalidExponent:
            return "invalid exponent '" + fragment + "'";
    }
    return "unknown parse error";
}

} // namespace bignum
