#pragma once

#include "address.hpp"
#include "config.hpp"
#include "order.hpp"
#include "runtime.hpp"
#include "settlementix.hpp"
#include "settlementprogram.hpp"

#include <string>
#include <vector>

namespace settlemill {

struct ScenarioStep {
    std::string op;
    std::string body;        // Raw step object
    std::string expectError; // Empty when the step must succeed
};

struct StepResult {
    size_t index = 0;
    std::string op;
    bool passed = false;
    std::string outcome; // "ok" or the error name
    std::string detail;
    std::vector<std::string> logs;
};

// Parses {"steps": [ {...}, ... ]}; unknown expect_error names throw
std::vector<ScenarioStep> parseScenario(const std::string& json);
std::vector<ScenarioStep> loadScenarioFile(const std::string& path);

// Parses names such as "host_fee_bps"; throws std::runtime_error if unknown
UpdateGlobalConfigMode configModeFromName(const std::string& name);

// Drives a fresh runtime with one deployment of the settlement program.
// Accounts, mints and orders are named by labels in the scenario.
class ScenarioRunner {
public:
    explicit ScenarioRunner(DeploymentConfig deployment);

    ScenarioRunner(const ScenarioRunner&) = delete;
    ScenarioRunner& operator=(const ScenarioRunner&) = delete;

    // Creates the global config and applies the deployment parameters
    void deploy();

    StepResult run(size_t index, const ScenarioStep& step);
    std::vector<StepResult> runAll(const std::vector<ScenarioStep>& steps);

    [[nodiscard]] Runtime& runtime() { return m_runtime; }
    [[nodiscard]] const SettlementClient& client() const { return m_client; }
    [[nodiscard]] SettlementProgram& program() { return m_program; }
    [[nodiscard]] const Address& admin() const { return m_admin; }
    [[nodiscard]] const Address& globalConfig() const { return m_globalConfig; }

    [[nodiscard]] GlobalConfig config() const;
    [[nodiscard]] Order order(const std::string& label) const;
    [[nodiscard]] Amount tokenBalance(const std::string& owner, const std::string& mint) const;

    // Wallet token account of owner for mint, created empty when missing
    Address ensureWallet(const Address& owner, const Address& mint);

private:
    void airdrop(const std::string& body);
    void createMint(const std::string& body);
    void mintTo(const std::string& body);
    void initVault(const std::string& body);
    void createOrder(const std::string& body);
    void takeOrder(const std::string& body);
    void flashTakeOrder(const std::string& body);
    void closeOrder(const std::string& body);
    void updateOrder(const std::string& body);
    void updateConfig(const std::string& body);
    void updateConfigAdmin(const std::string& body);
    void withdrawHostTip(const std::string& body);
    void advanceClock(const std::string& body);

    void submit(const Transaction& transaction);
    void applyConfig(UpdateGlobalConfigMode mode, const Bytes& value);
    TakeOrderAccounts takeAccounts(const Address& taker, const Address& orderAddress);

    DeploymentConfig m_deployment;
    Runtime m_runtime;
    SettlementProgram m_program;
    SettlementClient m_client;
    Address m_admin;
    Address m_globalConfig;
    std::vector<std::string> m_stepLogs;
};

} // namespace settlemill
