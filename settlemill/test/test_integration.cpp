#include "../src/scenario.hpp"
#include <gtest/gtest.h>

#include <memory>
#include <string>

using namespace settlemill;

class IntegrationTest : public ::testing::Test {
protected:
    std::unique_ptr<ScenarioRunner> runner;

    void SetUp() override
    {
        DeploymentConfig deployment;
        deployment.hostFeeBps = 1000;
        runner = std::make_unique<ScenarioRunner>(deployment);
        runner->deploy();
    }

    void expectStep(const std::string& body)
    {
        auto steps = parseScenario("{\"steps\": [" + body + "]}");
        auto result = runner->run(0, steps.at(0));
        EXPECT_TRUE(result.passed) << body << " -> " << result.outcome << " " << result.detail;
    }
};

TEST_F(IntegrationTest, FullSettlementSession)
{
    // 1. Two makers sell SOL for USDC
    expectStep(R"({"op": "airdrop", "account": "alice", "lamports": 10000000000})");
    expectStep(R"({"op": "airdrop", "account": "bob", "lamports": 10000000000})");
    expectStep(R"({"op": "airdrop", "account": "carol", "lamports": 10000000000})");
    expectStep(R"({"op": "create_mint", "mint": "sol", "decimals": 9})");
    expectStep(R"({"op": "create_mint", "mint": "usdc", "decimals": 6})");
    expectStep(R"({"op": "mint_to", "owner": "alice", "mint": "sol", "amount": 1000})");
    expectStep(R"({"op": "mint_to", "owner": "bob", "mint": "sol", "amount": 300})");
    expectStep(R"({"op": "mint_to", "owner": "carol", "mint": "usdc", "amount": 10000})");
    expectStep(R"({"op": "init_vault", "mint": "sol"})");

    expectStep(R"({"op": "create_order", "maker": "alice", "order": "alice-1", "input_mint": "sol",
                   "output_mint": "usdc", "input_amount": 1000, "output_amount": 2000})");
    expectStep(R"({"op": "create_order", "maker": "bob", "order": "bob-1", "input_mint": "sol",
                   "output_mint": "usdc", "input_amount": 300, "output_amount": 900})");
    expectStep(R"({"op": "update_order", "maker": "alice", "order": "alice-1", "mode": "permissionless", "value": 1})");
    expectStep(R"({"op": "update_order", "maker": "bob", "order": "bob-1", "mode": "permissionless", "value": 1})");

    // Both deposits sit in the shared vault
    EXPECT_EQ(0u, runner->tokenBalance("alice", "sol"));
    EXPECT_EQ(0u, runner->tokenBalance("bob", "sol"));

    // 2. Bob restricts his order to Carol, then Carol fills it completely
    expectStep(R"({"op": "update_order", "maker": "bob", "order": "bob-1", "mode": "counterparty", "value": "carol"})");
    expectStep(R"({"op": "take_order", "taker": "carol", "order": "bob-1", "input_amount": 300,
                   "min_output_amount": 900, "tip": 50})");
    EXPECT_EQ(OrderStatus::Filled, runner->order("bob-1").orderStatus());
    EXPECT_EQ(900u, runner->tokenBalance("bob", "usdc"));

    // 3. Carol takes part of Alice's order with a flash fill, then a plain fill
    expectStep(R"({"op": "flash_take_order", "taker": "carol", "order": "alice-1", "input_amount": 250,
                   "min_output_amount": 500, "tip": 20})");
    expectStep(R"({"op": "take_order", "taker": "carol", "order": "alice-1", "input_amount": 250,
                   "min_output_amount": 600, "tip": 30})");

    Order alice = runner->order("alice-1");
    EXPECT_EQ(500u, alice.remainingInputAmount);
    EXPECT_EQ(1100u, alice.filledOutputAmount);
    EXPECT_EQ(2u, alice.numberOfFills);
    EXPECT_EQ(OrderStatus::Active, alice.orderStatus());

    // Carol received every SOL that left the vault
    EXPECT_EQ(800u, runner->tokenBalance("carol", "sol"));
    EXPECT_EQ(10000u - 900u - 1100u, runner->tokenBalance("carol", "usdc"));

    // Tips: 50 + 20 + 30 with a 10% host share, each rounded up
    GlobalConfig config = runner->config();
    EXPECT_EQ(100u, config.totalTipAmount);
    EXPECT_EQ(5u + 2u + 3u, config.hostTipAmount);
    EXPECT_EQ(45u, runner->order("bob-1").tipAmount);
    EXPECT_EQ(18u + 27u, alice.tipAmount);

    // 4. Both makers close; the host withdraws its share
    expectStep(R"({"op": "close_order", "maker": "bob", "order": "bob-1"})");
    expectStep(R"({"op": "close_order", "maker": "alice", "order": "alice-1"})");
    EXPECT_EQ(500u, runner->tokenBalance("alice", "sol"));
    EXPECT_EQ(10u, runner->config().totalTipAmount);

    expectStep(R"({"op": "withdraw_host_tip"})");
    config = runner->config();
    EXPECT_EQ(0u, config.totalTipAmount);
    EXPECT_EQ(0u, config.hostTipAmount);
    EXPECT_EQ(0u, runner->runtime().lamports(runner->client().pdaAuthority(runner->globalConfig())));
}
