#include "domain/value_objects/MoneyRecord.hpp"

#include "domain/errors/MoneyErrors.hpp"
#include "domain/value_objects/Currency.hpp"

#include <nlohmann/json.hpp>

#include <regex>

namespace mcore::domain {

namespace {

std::string string_field(const nlohmann::json& j, const char* name) {
    if (!j.is_object()) {
        throw InvalidType(std::string("MoneyRecord must be a JSON object, got ") + j.type_name());
    }
    auto it = j.find(name);
    if (it == j.end() || !it->is_string()) {
        throw InvalidType(std::string("MoneyRecord field '") + name + "' must be a string");
    }
    return it->get<std::string>();
}

} // namespace

bool is_well_formed_amount(const std::string& amount) {
    static const std::regex pattern(R"(^-?\d+(\.\d+)?$)");
    return std::regex_match(amount, pattern);
}

void MoneyRecord::validate() const {
    if (!is_well_formed_amount(amount)) {
        throw InvalidFormat("Invalid Money string format: '" + amount + "'");
    }
    if (!is_valid_currency(currency)) {
        throw InvalidCurrency(currency);
    }
}

void to_json(nlohmann::json& j, const MoneyRecord& record) {
    j = nlohmann::json{{"amount", record.amount}, {"currency", record.currency}};
}

void from_json(const nlohmann::json& j, MoneyRecord& record) {
    record.amount = string_field(j, "amount");
    record.currency = string_field(j, "currency");
}

} // namespace mcore::domain
