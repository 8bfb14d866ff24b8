#include "domain/errors/MoneyErrors.hpp"
#include "domain/value_objects/MoneyRecord.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace mcore::domain;

TEST(MoneyRecord, WellFormedAmounts) {
    EXPECT_TRUE(is_well_formed_amount("0"));
    EXPECT_TRUE(is_well_formed_amount("100.50"));
    EXPECT_TRUE(is_well_formed_amount("-50.25"));
    EXPECT_TRUE(is_well_formed_amount("999999999999999.99"));
}

TEST(MoneyRecord, MalformedAmounts) {
    for (const char* bad : {"", "1e10", "+5", ".5", "5.", "1.2.3", " 1", "abc", "NaN", "--1"}) {
        EXPECT_FALSE(is_well_formed_amount(bad)) << "amount: '" << bad << "'";
    }
}

TEST(MoneyRecord, ValidateAcceptsStrictRecord) {
    MoneyRecord record{"100.5", "USD"};
    EXPECT_NO_THROW(record.validate());
}

TEST(MoneyRecord, ValidateRejectsExponentAmount) {
    MoneyRecord record{"1e10", "USD"};
    EXPECT_THROW(record.validate(), InvalidFormat);
}

TEST(MoneyRecord, ValidateRejectsUnknownCurrency) {
    MoneyRecord record{"1", "XYZ"};
    EXPECT_THROW(record.validate(), InvalidCurrency);
}

TEST(MoneyRecord, SerializesToJsonObject) {
    json j = MoneyRecord{"12.5", "EUR"};
    EXPECT_EQ(j["amount"], "12.5");
    EXPECT_EQ(j["currency"], "EUR");
    EXPECT_EQ(j.size(), 2u);
}

TEST(MoneyRecord, ParsesFromJsonObject) {
    auto record = json::parse(R"({"amount": "-3.75", "currency": "PLN"})").get<MoneyRecord>();
    EXPECT_EQ(record, (MoneyRecord{"-3.75", "PLN"}));
}

TEST(MoneyRecord, ParseThrowsOnMissingField) {
    EXPECT_THROW(json::parse(R"({"amount": "1"})").get<MoneyRecord>(), InvalidType);
    EXPECT_THROW(json::parse(R"({"currency": "USD"})").get<MoneyRecord>(), InvalidType);
}

TEST(MoneyRecord, ParseThrowsOnNonStringAmount) {
    EXPECT_THROW(json::parse(R"({"amount": 1.5, "currency": "USD"})").get<MoneyRecord>(), InvalidType);
}

TEST(MoneyRecord, ParseThrowsOnNonObject) {
    EXPECT_THROW(json::parse(R"(["1", "USD"])").get<MoneyRecord>(), InvalidType);
}

TEST(MoneyRecord, Equality) {
    EXPECT_EQ((MoneyRecord{"1", "USD"}), (MoneyRecord{"1", "USD"}));
    EXPECT_NE((MoneyRecord{"1", "USD"}), (MoneyRecord{"1.0", "USD"}));
}
