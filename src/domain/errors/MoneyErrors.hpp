#pragma once

#include <stdexcept>
#include <string>

namespace mcore::domain {

// Tag shared by every error raised from the decimal / money layer, so callers
// can catch the whole family without naming each type.
struct MoneyError {
    virtual ~MoneyError() = default;
};

class InvalidNumber : public std::invalid_argument, public MoneyError {
public:
    explicit InvalidNumber(const std::string& msg) : std::invalid_argument(msg) {}
};

class InvalidFormat : public std::invalid_argument, public MoneyError {
public:
    explicit InvalidFormat(const std::string& msg) : std::invalid_argument(msg) {}
};

class InvalidType : public std::invalid_argument, public MoneyError {
public:
    explicit InvalidType(const std::string& msg) : std::invalid_argument(msg) {}
};

// Scales (rounding digits and exponents) are limited to this many places.
inline constexpr int kMaxScale = 1'000'000;

class InvalidScale : public std::invalid_argument, public MoneyError {
public:
    explicit InvalidScale(int scale);
};

class InvalidRadix : public std::out_of_range, public MoneyError {
public:
    explicit InvalidRadix(int radix);
};

class DivisionByZero : public std::domain_error, public MoneyError {
public:
    DivisionByZero() : std::domain_error("Division by zero") {}
};

class InvalidCurrency : public std::invalid_argument, public MoneyError {
public:
    explicit InvalidCurrency(const std::string& code);
};

class EmptySequence : public std::invalid_argument, public MoneyError {
public:
    explicit EmptySequence(const std::string& operation);
};

class InvalidCents : public std::invalid_argument, public MoneyError {
public:
    InvalidCents() : std::invalid_argument("Cents must be an integer") {}
};

// Raised when a multi-operand operation sees two currency codes.
// operation() is "add", "subtract", "sum" or "compare".
class CurrencyMismatch : public std::logic_error, public MoneyError {
public:
    CurrencyMismatch(std::string operation, std::string expected, std::string actual);

    const std::string& operation() const noexcept { return operation_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string operation_;
    std::string expected_;
    std::string actual_;
};

} // namespace mcore::domain
