#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <nlohmann/json_fwd.hpp>

#include <compare>
#include <concepts>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace mcore::domain {

// Immutable arbitrary-precision signed decimal: unscaled_value / 10^scale.
// Always finite. Stored in canonical form (no trailing fractional zeros,
// zero has scale 0), so equal values have equal representations.
class Decimal {
public:
    using BigInt = boost::multiprecision::cpp_int;

    // Throws InvalidNumber for NaN and +/-infinity. The double is read as the
    // shortest decimal string that converts back to the same double.
    static Decimal from(double value);

    // Accepts [+-]digits[.digits][e[+-]digits]. Throws InvalidFormat.
    static Decimal from(const std::string& value);
    static Decimal from(const char* value);

    static Decimal from(const Decimal& value);
    static Decimal from(bool value) = delete;

    template <std::integral T>
        requires(!std::same_as<T, bool>)
    static Decimal from(T value) {
        return Decimal(BigInt(value), 0);
    }

    // JSON number or string; anything else throws InvalidType.
    static Decimal from_any(const nlohmann::json& value);

    static Decimal zero();

    Decimal add(const Decimal& other) const;
    Decimal subtract(const Decimal& other) const;
    Decimal multiply(double multiplier) const;
    // Quotient rounded to the current default scale. Throws DivisionByZero.
    Decimal divide(double divisor) const;

    // Rounding is half away from zero. Overloads without a scale use
    // config::Precision::default_scale() at the time of the call.
    Decimal round_to() const;
    Decimal round_to(int scale) const;
    Decimal multiply_then_round_to(double multiplier) const;
    Decimal multiply_then_round_to(double multiplier, int scale) const;
    Decimal divide_then_round_to(double divisor) const;
    Decimal divide_then_round_to(double divisor, int scale) const;

    bool is_equal(const Decimal& other) const;
    bool is_equal(double other) const;  // false for NaN / infinity
    bool is_less_than(const Decimal& other) const;
    bool is_less_than(double other) const;
    bool is_less_than_or_equal(const Decimal& other) const;
    bool is_less_than_or_equal(double other) const;
    bool is_greater_than(const Decimal& other) const;
    bool is_greater_than(double other) const;
    bool is_greater_than_or_equal(const Decimal& other) const;
    bool is_greater_than_or_equal(double other) const;

    // The receiver wins ties.
    Decimal min(const Decimal& other) const;
    Decimal max(const Decimal& other) const;

    // Throw EmptySequence when values is empty.
    static Decimal sum(const std::vector<Decimal>& values);
    static Decimal min(const std::vector<Decimal>& values);
    static Decimal max(const std::vector<Decimal>& values);

    double to_double() const;
    std::string to_string() const;
    std::string to_string(int radix) const;

    const BigInt& unscaled_value() const noexcept { return unscaled_; }
    std::int32_t scale() const noexcept { return scale_; }
    bool is_zero() const noexcept { return unscaled_.is_zero(); }
    bool is_negative() const noexcept { return unscaled_.sign() < 0; }
    bool is_integer() const noexcept { return scale_ == 0; }

    bool operator==(const Decimal& other) const;
    std::strong_ordering operator<=>(const Decimal& other) const;

private:
    Decimal(BigInt unscaled, std::int64_t scale);

    int compare(const Decimal& other) const;

    BigInt unscaled_;
    std::int32_t scale_;
};

std::ostream& operator<<(std::ostream& os, const Decimal& value);

void to_json(nlohmann::json& j, const Decimal& value);

} // namespace mcore::domain
