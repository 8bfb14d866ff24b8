#pragma once

#include <nlohmann/json_fwd.hpp>

#include <string>

namespace mcore::domain {

// Plain {amount, currency} pair used to move a Money value across a process
// boundary. The amount stays a string so no precision is lost in transit.
struct MoneyRecord {
    std::string amount;
    std::string currency;

    // Strict interop check: amount matches ^-?\d+(\.\d+)?$ (InvalidFormat)
    // and currency is a recognized code (InvalidCurrency).
    void validate() const;

    bool operator==(const MoneyRecord&) const = default;
};

bool is_well_formed_amount(const std::string& amount);

void to_json(nlohmann::json& j, const MoneyRecord& record);
// Throws InvalidType when a field is missing or not a string.
void from_json(const nlohmann::json& j, MoneyRecord& record);

} // namespace mcore::domain
