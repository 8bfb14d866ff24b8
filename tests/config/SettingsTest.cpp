#include "config/Settings.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

using namespace mcore::config;

namespace {

void clear_env() {
    unsetenv("MCORE_ENV");
    unsetenv("MCORE_DEFAULT_SCALE");
    unsetenv("MCORE_DEFAULT_CURRENCY");
    unsetenv("MCORE_PRETTY_JSON");
}

} // namespace

TEST(Settings, DefaultsAreReasonable) {
    Settings s;
    EXPECT_EQ(s.precision.default_scale, 20);
    EXPECT_EQ(s.money.default_currency, "USD");
    EXPECT_FALSE(s.output.pretty_json);
    EXPECT_EQ(s.output.indent, 2);
}

TEST(Settings, FromEnvironmentDefaultsToDevelopment) {
    clear_env();
    auto s = Settings::from_environment();
    auto dev = Settings::development();
    EXPECT_EQ(s.precision.default_scale, dev.precision.default_scale);
    EXPECT_EQ(s.output.pretty_json, dev.output.pretty_json);
    EXPECT_EQ(s.money.default_currency, "USD");
}

TEST(Settings, FromEnvironmentSelectsProductionPreset) {
    clear_env();
    setenv("MCORE_ENV", "production", 1);
    auto s = Settings::from_environment();
    EXPECT_FALSE(s.output.pretty_json);
    clear_env();
}

TEST(Settings, FromEnvironmentReadsEnvVars) {
    clear_env();
    setenv("MCORE_DEFAULT_SCALE", "6", 1);
    setenv("MCORE_DEFAULT_CURRENCY", "EUR", 1);
    setenv("MCORE_PRETTY_JSON", "false", 1);

    auto s = Settings::from_environment();
    EXPECT_EQ(s.precision.default_scale, 6);
    EXPECT_EQ(s.money.default_currency, "EUR");
    EXPECT_FALSE(s.output.pretty_json);

    clear_env();
}

TEST(Settings, FromEnvironmentHandlesInvalidScale) {
    clear_env();
    setenv("MCORE_DEFAULT_SCALE", "not_a_number", 1);
    EXPECT_EQ(Settings::from_environment().precision.default_scale, 20);
    setenv("MCORE_DEFAULT_SCALE", "-3", 1);
    EXPECT_EQ(Settings::from_environment().precision.default_scale, 20);
    setenv("MCORE_DEFAULT_SCALE", "2147483647", 1);
    EXPECT_EQ(Settings::from_environment().precision.default_scale, 20);
    clear_env();
}

TEST(Settings, PrettyJsonAcceptsOne) {
    clear_env();
    setenv("MCORE_ENV", "production", 1);
    setenv("MCORE_PRETTY_JSON", "1", 1);
    EXPECT_TRUE(Settings::from_environment().output.pretty_json);
    clear_env();
}

TEST(Settings, DevelopmentPreset) {
    auto s = Settings::development();
    EXPECT_EQ(s.precision.default_scale, 20);
    EXPECT_TRUE(s.output.pretty_json);
}

TEST(Settings, ProductionPreset) {
    auto s = Settings::production();
    EXPECT_EQ(s.precision.default_scale, 20);
    EXPECT_FALSE(s.output.pretty_json);
}
