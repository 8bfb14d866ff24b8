#include "cli/CommandRunner.hpp"

#include "domain/errors/MoneyErrors.hpp"
#include "domain/value_objects/Money.hpp"

#include <nlohmann/json.hpp>

#include <istream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;
using namespace mcore::domain;

namespace mcore::cli {

namespace {

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

json read_json(std::istream& input) {
    std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    return json::parse(text);
}

// Items are {amount, currency} records, or bare numbers / numeric strings
// that take the configured default currency.
std::vector<Money> read_values(std::istream& input, Currency fallback) {
    auto doc = read_json(input);
    if (!doc.is_array()) {
        throw InvalidType(std::string("Expected a JSON array of records, got ") + doc.type_name());
    }
    std::vector<Money> values;
    values.reserve(doc.size());
    for (const auto& item : doc) {
        values.push_back(Money::from_any(item, fallback));
    }
    return values;
}

double number_arg(const std::vector<std::string>& args, std::size_t index, const char* name) {
    if (index >= args.size()) {
        throw UsageError(std::string("missing <") + name + ">");
    }
    try {
        std::size_t pos = 0;
        double value = std::stod(args[index], &pos);
        if (pos != args[index].size()) {
            throw UsageError(std::string("invalid <") + name + ">: " + args[index]);
        }
        return value;
    } catch (const std::logic_error&) {
        throw UsageError(std::string("invalid <") + name + ">: " + args[index]);
    }
}

std::optional<int> scale_arg(const std::vector<std::string>& args, std::size_t index) {
    if (index >= args.size()) {
        return std::nullopt;
    }
    try {
        std::size_t pos = 0;
        int value = std::stoi(args[index], &pos);
        if (pos != args[index].size()) {
            throw UsageError("invalid <scale>: " + args[index]);
        }
        return value;
    } catch (const std::logic_error&) {
        throw UsageError("invalid <scale>: " + args[index]);
    }
}

} // namespace

CommandRunner::CommandRunner(config::Settings settings) : settings_(std::move(settings)) {}

std::string CommandRunner::usage() {
    return "Usage: money_core <command> [args] < input.json\n"
           "  sum | min | max             JSON array of {amount, currency} records\n"
           "  round <scale>               one record\n"
           "  multiply <factor> [scale]   one record\n"
           "  divide <divisor> [scale]    one record\n"
           "  cents                       one record\n"
           "  validate                    one record\n";
}

std::string CommandRunner::dump(const json& value) const {
    return settings_.output.pretty_json ? value.dump(settings_.output.indent) : value.dump();
}

CommandResult CommandRunner::run(const std::vector<std::string>& args, std::istream& input) const {
    if (args.empty()) {
        return {1, "", usage()};
    }
    const auto& command = args[0];

    try {
        auto fallback = currency_from_string(settings_.money.default_currency);

        if (command == "sum" || command == "min" || command == "max") {
            auto values = read_values(input, fallback);
            Money result = command == "sum"   ? Money::sum(values)
                           : command == "min" ? Money::min(values)
                                              : Money::max(values);
            return {0, dump(result.to_record()), ""};
        }
        if (command == "round") {
            if (args.size() < 2) {
                throw UsageError("missing <scale>");
            }
            auto scale = scale_arg(args, 1);
            auto money = Money::from_any(read_json(input), fallback);
            return {0, dump(money.round(*scale).to_record()), ""};
        }
        if (command == "multiply" || command == "divide") {
            double operand = number_arg(args, 1, command == "multiply" ? "factor" : "divisor");
            auto scale = scale_arg(args, 2);
            auto money = Money::from_any(read_json(input), fallback);
            Money result = money;
            if (command == "multiply") {
                result = scale ? money.multiply_then_round(operand, *scale)
                               : money.multiply_then_round(operand);
            } else {
                result = scale ? money.divide_then_round(operand, *scale)
                               : money.divide_then_round(operand);
            }
            return {0, dump(result.to_record()), ""};
        }
        if (command == "cents") {
            auto money = Money::from_any(read_json(input), fallback);
            return {0, std::to_string(money.to_cents()), ""};
        }
        if (command == "validate") {
            auto record = read_json(input).get<MoneyRecord>();
            record.validate();
            return {0, "ok", ""};
        }
    } catch (const UsageError& e) {
        return {1, "", std::string(e.what()) + "\n" + usage()};
    } catch (const json::exception& e) {
        return {2, "", std::string("invalid JSON: ") + e.what()};
    } catch (const std::exception& e) {
        return {2, "", e.what()};
    }

    return {1, "", "unknown command: " + command + "\n" + usage()};
}

} // namespace mcore::cli
