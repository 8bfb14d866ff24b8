#include "domain/errors/MoneyErrors.hpp"

#include <utility>

namespace mcore::domain {

namespace {

std::string mismatch_message(const std::string& operation) {
    if (operation == "sum") {
        return "Cannot sum Money instances with different currencies";
    }
    if (operation == "compare") {
        return "Cannot compare Money instances with different currencies";
    }
    return "Cannot " + operation + " money with different currency codes";
}

} // namespace

InvalidScale::InvalidScale(int scale)
    : std::invalid_argument((scale < 0 ? "Scale must be non-negative, got: "
                                       : "Scale must not exceed " + std::to_string(kMaxScale) + ", got: ") +
                            std::to_string(scale)) {}

InvalidRadix::InvalidRadix(int radix)
    : std::out_of_range("Radix must be between 2 and 36, got: " + std::to_string(radix)) {}

InvalidCurrency::InvalidCurrency(const std::string& code)
    : std::invalid_argument("Invalid currency code: " + code) {}

EmptySequence::EmptySequence(const std::string& operation)
    : std::invalid_argument("Cannot " + operation + " empty array") {}

CurrencyMismatch::CurrencyMismatch(std::string operation, std::string expected, std::string actual)
    : std::logic_error(mismatch_message(operation) + " (" + expected + " vs " + actual + ")")
    , operation_(std::move(operation))
    , expected_(std::move(expected))
    , actual_(std::move(actual)) {}

} // namespace mcore::domain
