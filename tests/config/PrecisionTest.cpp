#include "config/Precision.hpp"
#include "config/Settings.hpp"
#include "domain/errors/MoneyErrors.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <limits>
#include <thread>
#include <vector>

using mcore::config::Precision;
using mcore::config::PrecisionSettings;

class PrecisionTest : public ::testing::Test {
protected:
    void TearDown() override { Precision::reset(); }
};

TEST_F(PrecisionTest, DefaultsToTwentyDigits) {
    EXPECT_EQ(Precision::default_scale(), 20);
    EXPECT_EQ(Precision::kDefaultScale, 20);
}

TEST_F(PrecisionTest, SetDefaultScale) {
    Precision::set_default_scale(4);
    EXPECT_EQ(Precision::default_scale(), 4);
    Precision::set_default_scale(0);
    EXPECT_EQ(Precision::default_scale(), 0);
}

TEST_F(PrecisionTest, RejectsNegativeScale) {
    EXPECT_THROW(Precision::set_default_scale(-1), mcore::domain::InvalidScale);
    EXPECT_EQ(Precision::default_scale(), 20);
}

TEST_F(PrecisionTest, RejectsScaleAboveLimit) {
    EXPECT_THROW(Precision::set_default_scale(mcore::domain::kMaxScale + 1), mcore::domain::InvalidScale);
    EXPECT_THROW(Precision::set_default_scale(std::numeric_limits<int>::max()), mcore::domain::InvalidScale);
    EXPECT_EQ(Precision::default_scale(), 20);
    Precision::set_default_scale(mcore::domain::kMaxScale);
    EXPECT_EQ(Precision::default_scale(), mcore::domain::kMaxScale);
}

TEST_F(PrecisionTest, ConfigureFromSettings) {
    PrecisionSettings settings;
    settings.default_scale = 8;
    Precision::configure(settings);
    EXPECT_EQ(Precision::default_scale(), 8);
}

TEST_F(PrecisionTest, ResetRestoresDefault) {
    Precision::set_default_scale(2);
    Precision::reset();
    EXPECT_EQ(Precision::default_scale(), 20);
}

TEST_F(PrecisionTest, ConcurrentReadersSeeAConfiguredValue) {
    std::vector<std::thread> readers;
    std::atomic<bool> bad{false};
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            for (int j = 0; j < 1000; ++j) {
                int s = Precision::default_scale();
                if (s != 20 && s != 6) bad = true;
            }
        });
    }
    for (int j = 0; j < 100; ++j) {
        Precision::set_default_scale(j % 2 ? 6 : 20);
    }
    for (auto& t : readers) t.join();
    EXPECT_FALSE(bad);
}
