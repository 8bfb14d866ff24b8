#include "config/Settings.hpp"

#include "domain/errors/MoneyErrors.hpp"

#include <cstdlib>

namespace mcore::config {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        return fallback;
    }
}

bool env_bool_or(const char* name, bool fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    std::string s(val);
    return s == "true" || s == "1";
}

} // namespace

Settings Settings::from_environment() {
    std::string env = env_or("MCORE_ENV", "development");
    Settings s = (env == "production") ? production() : development();
    int scale = env_int_or("MCORE_DEFAULT_SCALE", s.precision.default_scale);
    if (scale >= 0 && scale <= domain::kMaxScale) {
        s.precision.default_scale = scale;
    }
    s.money.default_currency = env_or("MCORE_DEFAULT_CURRENCY", s.money.default_currency);
    s.output.pretty_json = env_bool_or("MCORE_PRETTY_JSON", s.output.pretty_json);
    return s;
}

Settings Settings::development() {
    Settings s;
    s.output.pretty_json = true;
    return s;
}

Settings Settings::production() {
    Settings s;
    s.output.pretty_json = false;
    return s;
}

} // namespace mcore::config
