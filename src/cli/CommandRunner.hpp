#pragma once

#include "config/Settings.hpp"

#include <nlohmann/json_fwd.hpp>

#include <iosfwd>
#include <string>
#include <vector>

namespace mcore::cli {

struct CommandResult {
    int exit_code = 0;
    std::string output;
    std::string error;
};

// Runs one money_core command against transfer records read from input.
//
//   sum | min | max             JSON array of records -> one record
//   round <scale>               one record -> one record
//   multiply <factor> [scale]   one record -> one record
//   divide <divisor> [scale]    one record -> one record
//   cents                       one record -> integer minor units
//   validate                    one record -> "ok" if strictly well formed
//
// A record may also be a bare JSON number or numeric string, which takes
// settings.money.default_currency.
//
// Exit codes: 0 success, 1 usage error, 2 invalid input or domain error.
class CommandRunner {
public:
    explicit CommandRunner(config::Settings settings);

    CommandResult run(const std::vector<std::string>& args, std::istream& input) const;

    static std::string usage();

private:
    std::string dump(const nlohmann::json& value) const;

    config::Settings settings_;
};

} // namespace mcore::cli
