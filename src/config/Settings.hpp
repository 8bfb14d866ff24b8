#pragma once

#include <string>

namespace mcore::config {

struct PrecisionSettings {
    int default_scale = 20;  // fractional digits used when a call omits the scale
};

struct MoneySettings {
    std::string default_currency = "USD";
};

struct OutputSettings {
    bool pretty_json = false;
    int indent = 2;
};

struct Settings {
    PrecisionSettings precision;
    MoneySettings money;
    OutputSettings output;

    static Settings from_environment();
    static Settings development();
    static Settings production();
};

} // namespace mcore::config
