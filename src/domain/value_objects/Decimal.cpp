#include "domain/value_objects/Decimal.hpp"

#include "config/Precision.hpp"
#include "domain/errors/MoneyErrors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <ostream>
#include <string_view>

namespace mcore::domain {

using BigInt = Decimal::BigInt;

namespace {

// Larger exponents would need unbounded memory; treated like an overflow to
// infinity and rejected as a malformed number.
constexpr std::int64_t kMaxExponent = kMaxScale;

constexpr const char* kDigits = "0123456789abcdefghijklmnopqrstuvwxyz";

BigInt power_of_ten(std::int64_t exponent) {
    return boost::multiprecision::pow(BigInt(10), static_cast<unsigned>(exponent));
}

// num / den rounded half away from zero. den must be positive.
BigInt divide_round_half_away(const BigInt& num, const BigInt& den) {
    BigInt magnitude = abs(num);
    BigInt q;
    BigInt r;
    boost::multiprecision::divide_qr(magnitude, den, q, r);
    if (r * 2 >= den) {
        ++q;
    }
    return num.sign() < 0 ? BigInt(-q) : q;
}

void check_scale(int scale) {
    if (scale < 0 || scale > kMaxScale) {
        throw InvalidScale(scale);
    }
}

// Number of trailing decimal zeros of value, at most limit. Probes growing
// powers of ten so a long run costs O(log k) divisions.
std::int64_t count_trailing_zeros(const BigInt& value, std::int64_t limit) {
    std::int64_t count = 0;
    std::int64_t step = 1;
    BigInt rest = abs(value);
    BigInt q;
    BigInt r;
    while (count < limit) {
        step = std::min(step, limit - count);
        boost::multiprecision::divide_qr(rest, power_of_ten(step), q, r);
        if (r.is_zero()) {
            rest = std::move(q);
            count += step;
            step *= 2;
        } else if (step == 1) {
            break;
        } else {
            step = 1;
        }
    }
    return count;
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

[[noreturn]] void throw_invalid_format(std::string_view text) {
    throw InvalidFormat("Invalid Decimal string format: must be finite and not NaN, got: '" +
                        std::string(text) + "'");
}

} // namespace

Decimal::Decimal(BigInt unscaled, std::int64_t scale) : unscaled_(std::move(unscaled)), scale_(0) {
    if (scale < 0) {
        unscaled_ *= power_of_ten(-scale);
        scale = 0;
    }
    if (unscaled_.is_zero()) {
        scale = 0;
    }
    if (scale > 0) {
        auto zeros = count_trailing_zeros(unscaled_, scale);
        if (zeros > 0) {
            unscaled_ /= power_of_ten(zeros);
            scale -= zeros;
        }
    }
    if (scale > std::numeric_limits<std::int32_t>::max()) {
        throw std::out_of_range("Decimal scale out of range: " + std::to_string(scale));
    }
    scale_ = static_cast<std::int32_t>(scale);
}

Decimal Decimal::from(double value) {
    if (!std::isfinite(value)) {
        throw InvalidNumber("Invalid Decimal number value: must be finite and not NaN");
    }
    // Shortest round-trip form, e.g. 0.1 -> "0.1", 1e22 -> "1e+22"
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc()) {
        throw InvalidNumber("Cannot represent number value as decimal");
    }
    return from(std::string(buf, ptr));
}

Decimal Decimal::from(const std::string& value) {
    std::string_view text(value);
    std::size_t i = 0;
    const std::size_t n = text.size();

    bool negative = false;
    if (i < n && (text[i] == '+' || text[i] == '-')) {
        negative = text[i] == '-';
        ++i;
    }

    std::string digits;
    std::int64_t fraction_digits = 0;
    std::size_t mantissa_digits = 0;
    while (i < n && is_digit(text[i])) {
        digits += text[i++];
        ++mantissa_digits;
    }
    if (i < n && text[i] == '.') {
        ++i;
        while (i < n && is_digit(text[i])) {
            digits += text[i++];
            ++fraction_digits;
            ++mantissa_digits;
        }
    }
    if (mantissa_digits == 0) {
        throw_invalid_format(text);
    }

    std::int64_t exponent = 0;
    bool exponent_overflow = false;
    if (i < n && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        bool negative_exponent = false;
        if (i < n && (text[i] == '+' || text[i] == '-')) {
            negative_exponent = text[i] == '-';
            ++i;
        }
        if (i == n || !is_digit(text[i])) {
            throw_invalid_format(text);
        }
        while (i < n && is_digit(text[i])) {
            if (!exponent_overflow) {
                exponent = exponent * 10 + (text[i] - '0');
                exponent_overflow = exponent > kMaxExponent;
            }
            ++i;
        }
        if (negative_exponent) {
            exponent = -exponent;
        }
    }
    if (i != n) {
        throw_invalid_format(text);
    }

    auto first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        return zero();
    }
    if (exponent_overflow) {
        throw_invalid_format(text);
    }

    std::int64_t scale = fraction_digits - exponent;
    auto last = digits.find_last_not_of('0');
    auto zeros = std::min(static_cast<std::int64_t>(digits.size() - 1 - last),
                          std::max<std::int64_t>(scale, 0));
    digits.resize(digits.size() - static_cast<std::size_t>(zeros));
    scale -= zeros;

    // cpp_int reads a leading 0 as an octal prefix
    BigInt unscaled(digits.substr(first));
    if (negative) {
        unscaled = -unscaled;
    }
    return Decimal(std::move(unscaled), scale);
}

Decimal Decimal::from(const char* value) {
    if (value == nullptr) {
        throw InvalidType("Invalid Decimal input type: null string");
    }
    return from(std::string(value));
}

Decimal Decimal::from(const Decimal& value) {
    return value;
}

Decimal Decimal::from_any(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        if (value.is_number_unsigned()) {
            return from(value.get<std::uint64_t>());
        }
        return from(value.get<std::int64_t>());
    }
    if (value.is_number_float()) {
        return from(value.get<double>());
    }
    if (value.is_string()) {
        return from(value.get<std::string>());
    }
    throw InvalidType(std::string("Invalid Decimal input type: must be number or string, got ") +
                      value.type_name());
}

Decimal Decimal::zero() {
    return Decimal(BigInt(0), 0);
}

Decimal Decimal::add(const Decimal& other) const {
    auto scale = std::max(scale_, other.scale_);
    return Decimal(unscaled_ * power_of_ten(scale - scale_) + other.unscaled_ * power_of_ten(scale - other.scale_),
                   scale);
}

Decimal Decimal::subtract(const Decimal& other) const {
    auto scale = std::max(scale_, other.scale_);
    return Decimal(unscaled_ * power_of_ten(scale - scale_) - other.unscaled_ * power_of_ten(scale - other.scale_),
                   scale);
}

Decimal Decimal::multiply(double multiplier) const {
    auto factor = from(multiplier);
    return Decimal(unscaled_ * factor.unscaled_,
                   static_cast<std::int64_t>(scale_) + factor.scale_);
}

Decimal Decimal::divide(double divisor) const {
    return divide_then_round_to(divisor, config::Precision::default_scale());
}

Decimal Decimal::round_to() const {
    return round_to(config::Precision::default_scale());
}

Decimal Decimal::round_to(int scale) const {
    check_scale(scale);
    if (scale_ <= scale) {
        return *this;
    }
    return Decimal(divide_round_half_away(unscaled_, power_of_ten(scale_ - scale)), scale);
}

Decimal Decimal::multiply_then_round_to(double multiplier) const {
    return multiply_then_round_to(multiplier, config::Precision::default_scale());
}

Decimal Decimal::multiply_then_round_to(double multiplier, int scale) const {
    check_scale(scale);
    return multiply(multiplier).round_to(scale);
}

Decimal Decimal::divide_then_round_to(double divisor) const {
    return divide_then_round_to(divisor, config::Precision::default_scale());
}

Decimal Decimal::divide_then_round_to(double divisor, int scale) const {
    auto d = from(divisor);
    if (d.is_zero()) {
        throw DivisionByZero();
    }
    check_scale(scale);

    // (u1 / 10^s1) / (u2 / 10^s2) * 10^scale == u1 * 10^(s2 + scale) / (u2 * 10^s1)
    BigInt num = unscaled_ * power_of_ten(static_cast<std::int64_t>(d.scale_) + scale);
    BigInt den = d.unscaled_ * power_of_ten(scale_);
    if (den.sign() < 0) {
        num = -num;
        den = -den;
    }
    return Decimal(divide_round_half_away(num, den), scale);
}

int Decimal::compare(const Decimal& other) const {
    if (scale_ == other.scale_) {
        return unscaled_.compare(other.unscaled_);
    }
    if (unscaled_.sign() != other.unscaled_.sign()) {
        return unscaled_.sign() < other.unscaled_.sign() ? -1 : 1;
    }
    auto scale = std::max(scale_, other.scale_);
    BigInt lhs = unscaled_ * power_of_ten(scale - scale_);
    BigInt rhs = other.unscaled_ * power_of_ten(scale - other.scale_);
    return lhs.compare(rhs);
}

bool Decimal::is_equal(const Decimal& other) const {
    return compare(other) == 0;
}

bool Decimal::is_equal(double other) const {
    if (!std::isfinite(other)) {
        return false;
    }
    return is_equal(from(other));
}

bool Decimal::is_less_than(const Decimal& other) const {
    return compare(other) < 0;
}

bool Decimal::is_less_than(double other) const {
    return is_less_than(from(other));
}

bool Decimal::is_less_than_or_equal(const Decimal& other) const {
    return compare(other) <= 0;
}

bool Decimal::is_less_than_or_equal(double other) const {
    return is_less_than_or_equal(from(other));
}

bool Decimal::is_greater_than(const Decimal& other) const {
    return compare(other) > 0;
}

bool Decimal::is_greater_than(double other) const {
    return is_greater_than(from(other));
}

bool Decimal::is_greater_than_or_equal(const Decimal& other) const {
    return compare(other) >= 0;
}

bool Decimal::is_greater_than_or_equal(double other) const {
    return is_greater_than_or_equal(from(other));
}

Decimal Decimal::min(const Decimal& other) const {
    return other.is_less_than(*this) ? other : *this;
}

Decimal Decimal::max(const Decimal& other) const {
    return other.is_greater_than(*this) ? other : *this;
}

Decimal Decimal::sum(const std::vector<Decimal>& values) {
    if (values.empty()) {
        throw EmptySequence("sum");
    }
    Decimal total = values.front();
    for (std::size_t i = 1; i < values.size(); ++i) {
        total = total.add(values[i]);
    }
    return total;
}

Decimal Decimal::min(const std::vector<Decimal>& values) {
    if (values.empty()) {
        throw EmptySequence("get min of");
    }
    auto it = std::min_element(values.begin(), values.end(),
                               [](const Decimal& a, const Decimal& b) { return a.is_less_than(b); });
    return *it;
}

Decimal Decimal::max(const std::vector<Decimal>& values) {
    if (values.empty()) {
        throw EmptySequence("get max of");
    }
    // std::max_element returns the first of equal maxima
    auto it = std::max_element(values.begin(), values.end(),
                               [](const Decimal& a, const Decimal& b) { return a.is_less_than(b); });
    return *it;
}

double Decimal::to_double() const {
    auto text = to_string();
    double result = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
    if (ec == std::errc::result_out_of_range) {
        // Integer part of 0 means underflow, anything else overflow
        bool tiny = text[is_negative() ? 1 : 0] == '0';
        result = tiny ? 0.0 : std::numeric_limits<double>::infinity();
        return is_negative() ? -result : result;
    }
    if (ec != std::errc()) {
        throw InvalidNumber("Cannot represent decimal as number: " + text);
    }
    return result;
}

std::string Decimal::to_string() const {
    BigInt magnitude = abs(unscaled_);
    std::string digits = magnitude.str();
    if (scale_ > 0) {
        auto width = static_cast<std::size_t>(scale_) + 1;
        if (digits.size() < width) {
            digits.insert(0, width - digits.size(), '0');
        }
        digits.insert(digits.size() - scale_, 1, '.');
    }
    return is_negative() ? "-" + digits : digits;
}

std::string Decimal::to_string(int radix) const {
    if (radix < 2 || radix > 36) {
        throw InvalidRadix(radix);
    }
    if (radix == 10) {
        return to_string();
    }

    const int places = config::Precision::default_scale();
    BigInt base(radix);
    BigInt scaled = divide_round_half_away(
        abs(unscaled_) * boost::multiprecision::pow(base, static_cast<unsigned>(places)),
        power_of_ten(scale_));
    if (scaled.is_zero()) {
        return "0";
    }

    std::string digits;
    BigInt q;
    BigInt r;
    while (!scaled.is_zero()) {
        boost::multiprecision::divide_qr(scaled, base, q, r);
        digits += kDigits[r.convert_to<int>()];
        scaled = std::move(q);
    }
    auto width = static_cast<std::size_t>(places) + 1;
    if (digits.size() < width) {
        digits.append(width - digits.size(), '0');
    }
    std::reverse(digits.begin(), digits.end());

    if (places > 0) {
        digits.insert(digits.size() - places, 1, '.');
        digits.erase(digits.find_last_not_of('0') + 1);
        if (digits.back() == '.') {
            digits.pop_back();
        }
    }
    return is_negative() ? "-" + digits : digits;
}

bool Decimal::operator==(const Decimal& other) const {
    return compare(other) == 0;
}

std::strong_ordering Decimal::operator<=>(const Decimal& other) const {
    auto c = compare(other);
    if (c < 0) return std::strong_ordering::less;
    if (c > 0) return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}

std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.to_string();
}

void to_json(nlohmann::json& j, const Decimal& value) {
    j = value.to_string();
}

} // namespace mcore::domain
