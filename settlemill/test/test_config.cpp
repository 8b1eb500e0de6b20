#include "../src/config.hpp"
#include "../src/jsonutils.hpp"
#include "../src/scenario.hpp"
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>

using namespace settlemill;

class DeploymentConfigTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        std::ofstream out("test_deployment.json");
        out << R"({
            "admin": "ops",
            "host_fee_bps": 250,
            "order_close_delay_seconds": 3600,
            "txn_fee_cost": 5000,
            "ata_creation_cost": 2039280,
            "rent_lamports_per_byte": 10,
            "flash_take_order_blocked": true,
            "new_orders_blocked": 0
        })";
        out.close();
    }

    void TearDown() override { std::remove("test_deployment.json"); }
};

TEST_F(DeploymentConfigTest, LoadFromFile)
{
    auto config = DeploymentConfig::loadFromFile("test_deployment.json");
    EXPECT_EQ("ops", config.admin);
    EXPECT_EQ(250, config.hostFeeBps);
    EXPECT_EQ(3600u, config.orderCloseDelaySeconds);
    EXPECT_EQ(5000u, config.txnFeeCost);
    EXPECT_EQ(2039280u, config.ataCreationCost);
    EXPECT_EQ(10u, config.rentLamportsPerByte);
    EXPECT_TRUE(config.flashTakeOrderBlocked);
    EXPECT_FALSE(config.newOrdersBlocked);
    EXPECT_FALSE(config.emergencyMode);
}

TEST_F(DeploymentConfigTest, MissingKeysKeepDefaults)
{
    auto config = DeploymentConfig::parse("{}");
    EXPECT_EQ("admin", config.admin);
    EXPECT_EQ(0, config.hostFeeBps);
    EXPECT_EQ(6960u, config.rentLamportsPerByte);
}

TEST_F(DeploymentConfigTest, RejectsInvalidValues)
{
    EXPECT_THROW(DeploymentConfig::parse(R"({"host_fee_bps": 10001})"), std::runtime_error);
    EXPECT_THROW(DeploymentConfig::parse(R"({"txn_fee_cost": "lots"})"), std::runtime_error);
    EXPECT_THROW(DeploymentConfig::parse(R"({"emergency_mode": "yes"})"), std::runtime_error);
    EXPECT_THROW(DeploymentConfig::loadFromFile("does_not_exist.json"), std::runtime_error);
}

TEST(JsonUtilsTest, ExtractsFlatValues)
{
    std::string json = R"({"op": "take_order", "min_input_amount": 7, "input_amount": 500, "flag": false})";
    EXPECT_EQ("take_order", json::extractString(json, "op"));
    EXPECT_EQ(500u, json::extractUint(json, "input_amount"));
    EXPECT_EQ(7u, json::extractUint(json, "min_input_amount"));
    EXPECT_FALSE(json::extractBool(json, "flag", true));
    EXPECT_TRUE(json::hasKey(json, "flag"));
    EXPECT_FALSE(json::hasKey(json, "missing"));
    EXPECT_EQ(9u, json::extractUint(json, "missing", 9));
    EXPECT_EQ("fallback", json::extractString(json, "input_amount", "fallback"));
}

TEST(JsonUtilsTest, ExtractsObjectsOfAnArray)
{
    std::string json = R"({"name": "x", "steps": [ {"op": "a"}, {"op": "b", "n": 1} ], "tail": [ {"op": "c"} ]})";
    auto objects = json::extractObjects(json, "steps");
    ASSERT_EQ(2u, objects.size());
    EXPECT_EQ("a", json::extractString(objects[0], "op"));
    EXPECT_EQ(1u, json::extractUint(objects[1], "n"));
    EXPECT_TRUE(json::extractObjects(json, "missing").empty());
}

TEST(ScenarioParseTest, ParsesStepsAndExpectedErrors)
{
    auto steps = parseScenario(R"({"steps": [
        {"op": "airdrop", "account": "alice", "lamports": 10},
        {"op": "take_order", "taker": "bob", "order": "o", "input_amount": 1, "min_output_amount": 1,
         "expect_error": "OrderNotActive"}
    ]})");
    ASSERT_EQ(2u, steps.size());
    EXPECT_EQ("airdrop", steps[0].op);
    EXPECT_TRUE(steps[0].expectError.empty());
    EXPECT_EQ("OrderNotActive", steps[1].expectError);
}

TEST(ScenarioParseTest, RejectsUnknownErrorNamesAndMissingOp)
{
    EXPECT_THROW(parseScenario(R"({"steps": [ {"op": "airdrop", "expect_error": "NoSuchError"} ]})"),
                 std::invalid_argument);
    EXPECT_THROW(parseScenario(R"({"steps": [ {"account": "alice"} ]})"), std::runtime_error);
}

TEST(ScenarioParseTest, ConfigModeNames)
{
    EXPECT_EQ(UpdateGlobalConfigMode::HostFeeBps, configModeFromName("host_fee_bps"));
    EXPECT_EQ(UpdateGlobalConfigMode::EmergencyMode, configModeFromName("emergency_mode"));
    EXPECT_THROW(configModeFromName("fee"), std::runtime_error);
}
