#include "../src/scenario.hpp"
#include <filesystem>
#include <memory>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace settlemill;
namespace fs = std::filesystem;

static std::string find_repo_dir(const std::string& name)
{
    // Try to find the directory by moving up from CWD
    fs::path current = fs::current_path();
    for (int i = 0; i < 5; ++i) {
        if (fs::exists(current / name))
            return (current / name).string();
        if (current.has_parent_path())
            current = current.parent_path();
        else
            break;
    }
    return name; // Fallback
}

class ScenarioRunnerTest : public ::testing::Test {
protected:
    DeploymentConfig deployment;
    std::unique_ptr<ScenarioRunner> runner;

    void SetUp() override
    {
        deployment.hostFeeBps = 250;
        deployment.orderCloseDelaySeconds = 60;
        runner = std::make_unique<ScenarioRunner>(deployment);
        runner->deploy();
    }

    StepResult step(const std::string& body)
    {
        auto steps = parseScenario("{\"steps\": [" + body + "]}");
        return runner->run(0, steps.at(0));
    }

    void setUpMarket()
    {
        for (const char* body : {
                 R"({"op": "airdrop", "account": "maker", "lamports": 10000000000})",
                 R"({"op": "airdrop", "account": "taker", "lamports": 10000000000})",
                 R"({"op": "create_mint", "mint": "sol", "decimals": 9})",
                 R"({"op": "create_mint", "mint": "usdc", "decimals": 6})",
                 R"({"op": "mint_to", "owner": "maker", "mint": "sol", "amount": 1000})",
                 R"({"op": "mint_to", "owner": "taker", "mint": "usdc", "amount": 5000})",
                 R"({"op": "init_vault", "mint": "sol"})",
                 R"({"op": "create_order", "maker": "maker", "order": "o1", "input_mint": "sol",
                     "output_mint": "usdc", "input_amount": 1000, "output_amount": 2000})",
                 R"({"op": "update_order", "maker": "maker", "order": "o1", "mode": "permissionless", "value": 1})",
             }) {
            auto result = step(body);
            ASSERT_TRUE(result.passed) << body << " -> " << result.outcome << " " << result.detail;
        }
    }
};

TEST_F(ScenarioRunnerTest, DeployAppliesParameters)
{
    GlobalConfig config = runner->config();
    EXPECT_EQ(250, config.hostFeeBps);
    EXPECT_EQ(60u, config.orderCloseDelaySeconds);
    EXPECT_EQ(runner->admin(), config.adminAuthority);
    EXPECT_EQ(0, config.emergencyMode);
}

TEST_F(ScenarioRunnerTest, TakeAndClose)
{
    setUpMarket();

    auto take = step(R"({"op": "take_order", "taker": "taker", "order": "o1", "input_amount": 500,
                         "min_output_amount": 1000, "tip": 101})");
    ASSERT_TRUE(take.passed) << take.detail;
    EXPECT_FALSE(take.logs.empty());
    EXPECT_EQ(500u, runner->tokenBalance("taker", "sol"));
    EXPECT_EQ(1000u, runner->tokenBalance("maker", "usdc"));
    EXPECT_EQ(98u, runner->order("o1").tipAmount);

    auto early = step(R"({"op": "close_order", "maker": "maker", "order": "o1"})");
    EXPECT_FALSE(early.passed);
    EXPECT_EQ("NotEnoughTimePassedSinceLastUpdate", early.outcome);

    ASSERT_TRUE(step(R"({"op": "advance_clock", "seconds": 60})").passed);
    auto close = step(R"({"op": "close_order", "maker": "maker", "order": "o1"})");
    ASSERT_TRUE(close.passed) << close.detail;
    EXPECT_EQ(500u, runner->tokenBalance("maker", "sol"));
    EXPECT_EQ(3u, runner->config().totalTipAmount);
}

TEST_F(ScenarioRunnerTest, ExpectedErrorPasses)
{
    setUpMarket();
    auto result = step(R"({"op": "take_order", "taker": "taker", "order": "o1", "input_amount": 2000,
                           "min_output_amount": 4000, "expect_error": "OrderInputAmountTooLarge"})");
    EXPECT_TRUE(result.passed);
    EXPECT_EQ("OrderInputAmountTooLarge", result.outcome);

    auto wrong = step(R"({"op": "take_order", "taker": "taker", "order": "o1", "input_amount": 10,
                          "min_output_amount": 20, "expect_error": "OrderNotActive"})");
    EXPECT_FALSE(wrong.passed);
    EXPECT_EQ("ok", wrong.outcome);
}

TEST_F(ScenarioRunnerTest, UnknownOpIsAScenarioError)
{
    EXPECT_THROW(step(R"({"op": "teleport"})"), std::runtime_error);
}

TEST_F(ScenarioRunnerTest, HostFeeWiderThanBpsDoesNotWrap)
{
    // 65636 would wrap to 100 in a u16
    EXPECT_THROW(step(R"({"op": "update_config", "mode": "host_fee_bps", "value": 65636,
                          "expect_error": "InvalidHostFee"})"),
                 std::runtime_error);
    EXPECT_EQ(250, runner->config().hostFeeBps);

    auto tooHigh = step(R"({"op": "update_config", "mode": "host_fee_bps", "value": 10001,
                            "expect_error": "InvalidHostFee"})");
    EXPECT_TRUE(tooHigh.passed) << tooHigh.outcome;
    EXPECT_EQ(250, runner->config().hostFeeBps);
}

TEST_F(ScenarioRunnerTest, ByteValuesOutOfRangeAreScenarioErrors)
{
    setUpMarket();
    ASSERT_TRUE(step(R"({"op": "mint_to", "owner": "maker", "mint": "sol", "amount": 100})").passed);

    // 256 would wrap to Vanilla
    EXPECT_THROW(step(R"({"op": "create_order", "maker": "maker", "order": "o2", "input_mint": "sol",
                          "output_mint": "usdc", "input_amount": 100, "output_amount": 200, "order_type": 256})"),
                 std::runtime_error);
    auto badType = step(R"({"op": "create_order", "maker": "maker", "order": "o2", "input_mint": "sol",
                            "output_mint": "usdc", "input_amount": 100, "output_amount": 200, "order_type": 1})");
    EXPECT_EQ("OrderTypeInvalid", badType.outcome);

    // 256 would wrap to 0 and turn permissionless taking off
    EXPECT_THROW(step(R"({"op": "update_order", "maker": "maker", "order": "o1", "mode": "permissionless",
                          "value": 256})"),
                 std::runtime_error);
    EXPECT_EQ(1, runner->order("o1").permissionless);

    EXPECT_THROW(step(R"({"op": "update_config", "mode": "emergency_mode", "value": 257})"), std::runtime_error);
    EXPECT_EQ(0, runner->config().emergencyMode);

    EXPECT_THROW(step(R"({"op": "create_mint", "mint": "wide", "decimals": 300})"), std::runtime_error);
    EXPECT_EQ(nullptr, runner->runtime().find(Address::fromLabel("wide")));

    EXPECT_THROW(step(R"({"op": "advance_clock", "seconds": 9223372036854775808})"), std::runtime_error);
}

TEST(ScenarioFilesTest, BundledScenariosRunAsExpected)
{
    std::string dir = find_repo_dir("scenarios");
    if (!fs::exists(dir)) {
        GTEST_SKIP() << "scenarios directory not found";
    }

    size_t files = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.path().extension() != ".json") {
            continue;
        }
        ++files;

        ScenarioRunner runner{DeploymentConfig{}};
        runner.deploy();
        auto results = runner.runAll(loadScenarioFile(entry.path().string()));
        ASSERT_FALSE(results.empty()) << entry.path();
        for (const auto& result : results) {
            EXPECT_TRUE(result.passed) << entry.path().filename() << " step " << result.index << " " << result.op
                                       << " -> " << result.outcome << " " << result.detail;
        }
    }
    EXPECT_GT(files, 0u);
}
