#include "domain/value_objects/Money.hpp"

#include "domain/errors/MoneyErrors.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <limits>
#include <ostream>
#include <utility>

namespace mcore::domain {

Money::Money(Decimal value, Currency currency)
    : value_(std::move(value))
    , currency_(currency) {}

void Money::require_valid(Currency currency) {
    if (!is_valid_currency(currency)) {
        throw InvalidCurrency(std::to_string(static_cast<int>(currency)));
    }
}

void Money::require_same_currency(const Money& other, const char* operation) const {
    if (currency_ != other.currency_) {
        throw CurrencyMismatch(operation, currency_code(), other.currency_code());
    }
}

void Money::require_same_currency(const std::vector<Money>& values, const char* operation) {
    const auto& first = values.front();
    for (std::size_t i = 1; i < values.size(); ++i) {
        first.require_same_currency(values[i], operation);
    }
}

Money Money::zero(Currency currency) {
    require_valid(currency);
    return Money(Decimal::zero(), currency);
}

Money Money::from_cents(double cents, Currency currency) {
    require_valid(currency);
    if (!std::isfinite(cents) || std::trunc(cents) != cents) {
        throw InvalidCents();
    }
    return Money(Decimal::from(cents).divide_then_round_to(100, 2), currency);
}

Money Money::from_record(const MoneyRecord& record) {
    auto currency = currency_from_string(record.currency);
    return Money(Decimal::from(record.amount), currency);
}

Money Money::from_json(const nlohmann::json& value) {
    if (!value.is_object()) {
        throw InvalidType(std::string("Invalid Money input type: must be object, got ") + value.type_name());
    }
    return from_record(value.get<MoneyRecord>());
}

Money Money::from_any(const nlohmann::json& value, Currency currency) {
    require_valid(currency);
    if (value.is_object()) {
        return from_record(value.get<MoneyRecord>());
    }
    return Money(Decimal::from_any(value), currency);
}

Money Money::add(const Money& other) const {
    require_same_currency(other, "add");
    return Money(value_.add(other.value_), currency_);
}

Money Money::subtract(const Money& other) const {
    require_same_currency(other, "subtract");
    return Money(value_.subtract(other.value_), currency_);
}

Money Money::multiply_then_round(double multiplier) const {
    return Money(value_.multiply_then_round_to(multiplier), currency_);
}

Money Money::multiply_then_round(double multiplier, int scale) const {
    return Money(value_.multiply_then_round_to(multiplier, scale), currency_);
}

Money Money::divide_then_round(double divisor) const {
    return Money(value_.divide_then_round_to(divisor), currency_);
}

Money Money::divide_then_round(double divisor, int scale) const {
    return Money(value_.divide_then_round_to(divisor, scale), currency_);
}

Money Money::round() const {
    return Money(value_.round_to(), currency_);
}

Money Money::round(int scale) const {
    return Money(value_.round_to(scale), currency_);
}

bool Money::is_equal(const Money& other) const {
    return currency_ == other.currency_ && value_.is_equal(other.value_);
}

bool Money::is_less_than(const Money& other) const {
    require_same_currency(other, "compare");
    return value_.is_less_than(other.value_);
}

bool Money::is_less_than_or_equal(const Money& other) const {
    require_same_currency(other, "compare");
    return value_.is_less_than_or_equal(other.value_);
}

bool Money::is_greater_than(const Money& other) const {
    require_same_currency(other, "compare");
    return value_.is_greater_than(other.value_);
}

bool Money::is_greater_than_or_equal(const Money& other) const {
    require_same_currency(other, "compare");
    return value_.is_greater_than_or_equal(other.value_);
}

Money Money::min(const Money& other) const {
    require_same_currency(other, "compare");
    return other.value_.is_less_than(value_) ? other : *this;
}

Money Money::max(const Money& other) const {
    require_same_currency(other, "compare");
    return other.value_.is_greater_than(value_) ? other : *this;
}

Money Money::sum(const std::vector<Money>& values) {
    if (values.empty()) {
        throw EmptySequence("sum");
    }
    require_same_currency(values, "sum");

    std::vector<Decimal> amounts;
    amounts.reserve(values.size());
    for (const auto& m : values) {
        amounts.push_back(m.value_);
    }
    return Money(Decimal::sum(amounts), values.front().currency_);
}

Money Money::min(const std::vector<Money>& values) {
    if (values.empty()) {
        throw EmptySequence("get min of");
    }
    require_same_currency(values, "compare");

    std::vector<Decimal> amounts;
    amounts.reserve(values.size());
    for (const auto& m : values) {
        amounts.push_back(m.value_);
    }
    return Money(Decimal::min(amounts), values.front().currency_);
}

Money Money::max(const std::vector<Money>& values) {
    if (values.empty()) {
        throw EmptySequence("get max of");
    }
    require_same_currency(values, "compare");

    std::vector<Decimal> amounts;
    amounts.reserve(values.size());
    for (const auto& m : values) {
        amounts.push_back(m.value_);
    }
    return Money(Decimal::max(amounts), values.front().currency_);
}

std::int64_t Money::to_cents() const {
    // Exact decimal rounding; no double intermediate
    auto cents = value_.multiply_then_round_to(100, 0);
    const auto& unscaled = cents.unscaled_value();
    if (unscaled > std::numeric_limits<std::int64_t>::max() ||
        unscaled < std::numeric_limits<std::int64_t>::min()) {
        throw std::out_of_range("Money amount does not fit in 64-bit cents: " + to_string());
    }
    return unscaled.convert_to<std::int64_t>();
}

MoneyRecord Money::to_record() const {
    return MoneyRecord{value_.to_string(), currency_code()};
}

std::ostream& operator<<(std::ostream& os, const Money& money) {
    return os << money.to_string() << ' ' << money.currency_code();
}

void to_json(nlohmann::json& j, const Money& money) {
    j = money.to_record();
}

} // namespace mcore::domain
