#pragma once

#include "domain/value_objects/Currency.hpp"
#include "domain/value_objects/Decimal.hpp"
#include "domain/value_objects/MoneyRecord.hpp"

#include <nlohmann/json_fwd.hpp>

#include <concepts>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace mcore::domain {

// Immutable (Decimal, Currency) pair. Every operation that combines two or
// more Money values throws CurrencyMismatch unless all currencies agree.
class Money {
public:
    // value is anything Decimal::from accepts. The currency is checked
    // first; Decimal construction errors propagate unchanged.
    template <typename T>
    static Money create(const T& value, Currency currency) {
        require_valid(currency);
        return Money(Decimal::from(value), currency);
    }

    template <typename T>
    static Money create(const T& value, const std::string& currency_code) {
        auto currency = currency_from_string(currency_code);
        return Money(Decimal::from(value), currency);
    }

    static Money zero(Currency currency);

    template <std::integral T>
        requires(!std::same_as<T, bool>)
    static Money from_cents(T cents, Currency currency) {
        require_valid(currency);
        return Money(Decimal::from(cents).divide_then_round_to(100, 2), currency);
    }

    // Throws InvalidCents unless cents is finite and integral.
    static Money from_cents(double cents, Currency currency);

    // Parses record.amount with the general decimal grammar (InvalidFormat)
    // and checks record.currency (InvalidCurrency).
    static Money from_record(const MoneyRecord& record);

    // {"amount", "currency"} object; anything else throws InvalidType.
    static Money from_json(const nlohmann::json& value);

    // JSON number, numeric string, or {"amount", "currency"} object. Plain
    // numbers and strings take the given currency; objects carry their own.
    static Money from_any(const nlohmann::json& value, Currency currency);

    Money add(const Money& other) const;
    Money subtract(const Money& other) const;

    Money multiply_then_round(double multiplier) const;
    Money multiply_then_round(double multiplier, int scale) const;
    Money divide_then_round(double divisor) const;
    Money divide_then_round(double divisor, int scale) const;
    Money round() const;
    Money round(int scale) const;

    // Never throws: a different currency just compares unequal.
    bool is_equal(const Money& other) const;
    bool is_less_than(const Money& other) const;
    bool is_less_than_or_equal(const Money& other) const;
    bool is_greater_than(const Money& other) const;
    bool is_greater_than_or_equal(const Money& other) const;

    // Returns one of the two operands; the receiver on ties.
    Money min(const Money& other) const;
    Money max(const Money& other) const;

    static Money sum(const std::vector<Money>& values);
    static Money min(const std::vector<Money>& values);
    static Money max(const std::vector<Money>& values);

    // value * 100 rounded half away from zero. Throws std::out_of_range if
    // the result does not fit in 64 bits.
    std::int64_t to_cents() const;
    MoneyRecord to_record() const;
    double to_double() const { return value_.to_double(); }
    std::string to_string() const { return value_.to_string(); }
    std::string to_string(int radix) const { return value_.to_string(radix); }

    const Decimal& value() const noexcept { return value_; }
    Currency currency() const noexcept { return currency_; }
    std::string currency_code() const { return domain::to_string(currency_); }

    bool operator==(const Money& other) const { return is_equal(other); }

private:
    Money(Decimal value, Currency currency);

    static void require_valid(Currency currency);
    static void require_same_currency(const std::vector<Money>& values, const char* operation);
    void require_same_currency(const Money& other, const char* operation) const;

    Decimal value_;
    Currency currency_;
};

std::ostream& operator<<(std::ostream& os, const Money& money);

void to_json(nlohmann::json& j, const Money& money);

} // namespace mcore::domain
