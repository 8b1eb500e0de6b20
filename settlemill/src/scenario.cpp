#include "scenario.hpp"
#include "assetprograms.hpp"
#include "errors.hpp"
#include "jsonutils.hpp"
#include "layout.hpp"
#include "programids.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace settlemill {

using namespace json;

namespace {

const Address& settlementProgramId()
{
    static const Address id = Address::fromLabel("program:settlemill");
    return id;
}

Address labelOf(const std::string& body, const std::string& key)
{
    std::string label = extractString(body, key);
    if (label.empty()) {
        throw std::runtime_error("Scenario step is missing \"" + key + "\"");
    }
    return Address::fromLabel(label);
}

uint64_t requiredUint(const std::string& body, const std::string& key)
{
    if (!hasKey(body, key)) {
        throw std::runtime_error("Scenario step is missing \"" + key + "\"");
    }
    return extractUint(body, key);
}

// Scenario integers are read as u64; narrower fields must not wrap
template <typename T>
T narrowed(const std::string& key, uint64_t value)
{
    if (value > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        throw std::runtime_error("Scenario value for \"" + key + "\" is out of range: " + std::to_string(value));
    }
    return static_cast<T>(value);
}

} // namespace

std::vector<ScenarioStep> parseScenario(const std::string& json)
{
    std::vector<ScenarioStep> steps;
    for (auto& object : extractObjects(json, "steps")) {
        ScenarioStep step;
        step.op = extractString(object, "op");
        if (step.op.empty()) {
            throw std::runtime_error("Scenario step without \"op\": " + object);
        }
        step.expectError = extractString(object, "expect_error");
        if (!step.expectError.empty()) {
            (void)errorFromName(step.expectError);
        }
        step.body = std::move(object);
        steps.push_back(std::move(step));
    }
    return steps;
}

std::vector<ScenarioStep> loadScenarioFile(const std::string& path) { return parseScenario(readFile(path)); }

UpdateGlobalConfigMode configModeFromName(const std::string& name)
{
    static const std::unordered_map<std::string, UpdateGlobalConfigMode> modes = {
        {"emergency_mode", UpdateGlobalConfigMode::EmergencyMode},
        {"flash_take_order_blocked", UpdateGlobalConfigMode::FlashTakeOrderBlocked},
        {"block_new_orders", UpdateGlobalConfigMode::BlockNewOrders},
        {"block_order_taking", UpdateGlobalConfigMode::BlockOrderTaking},
        {"host_fee_bps", UpdateGlobalConfigMode::HostFeeBps},
        {"admin_authority_cached", UpdateGlobalConfigMode::AdminAuthorityCached},
        {"order_taking_permissionless", UpdateGlobalConfigMode::OrderTakingPermissionless},
        {"order_close_delay_seconds", UpdateGlobalConfigMode::OrderCloseDelaySeconds},
        {"txn_fee_cost", UpdateGlobalConfigMode::TxnFeeCost},
        {"ata_creation_cost", UpdateGlobalConfigMode::AtaCreationCost},
    };
    auto iterator = modes.find(name);
    if (iterator == modes.end()) {
        throw std::runtime_error("Unknown config mode: " + name);
    }
    return iterator->second;
}

ScenarioRunner::ScenarioRunner(DeploymentConfig deployment)
    : m_deployment(std::move(deployment)),
      m_program(settlementProgramId()),
      m_client(settlementProgramId()),
      m_admin(Address::fromLabel(m_deployment.admin)),
      m_globalConfig(Address::fromLabel("global_config"))
{
    m_program.install(m_runtime);
}

void ScenarioRunner::deploy()
{
    m_runtime.setRentPerByte(m_deployment.rentLamportsPerByte);
    m_runtime.airdrop(m_admin, m_deployment.adminFunding);

    submit(Transaction{{m_client.initializeGlobalConfig(m_admin, m_globalConfig)}, {m_admin, m_globalConfig}});

    if (m_deployment.hostFeeBps != 0) {
        applyConfig(UpdateGlobalConfigMode::HostFeeBps, bpsValue(m_deployment.hostFeeBps));
    }
    if (m_deployment.orderCloseDelaySeconds != 0) {
        applyConfig(UpdateGlobalConfigMode::OrderCloseDelaySeconds, u64Value(m_deployment.orderCloseDelaySeconds));
    }
    if (m_deployment.txnFeeCost != 0) {
        applyConfig(UpdateGlobalConfigMode::TxnFeeCost, u64Value(m_deployment.txnFeeCost));
    }
    if (m_deployment.ataCreationCost != 0) {
        applyConfig(UpdateGlobalConfigMode::AtaCreationCost, u64Value(m_deployment.ataCreationCost));
    }

    // Kill-switches last so the parameter updates above are not blocked
    if (m_deployment.newOrdersBlocked) {
        applyConfig(UpdateGlobalConfigMode::BlockNewOrders, flagValue(true));
    }
    if (m_deployment.orderTakingBlocked) {
        applyConfig(UpdateGlobalConfigMode::BlockOrderTaking, flagValue(true));
    }
    if (m_deployment.flashTakeOrderBlocked) {
        applyConfig(UpdateGlobalConfigMode::FlashTakeOrderBlocked, flagValue(true));
    }
    if (m_deployment.emergencyMode) {
        applyConfig(UpdateGlobalConfigMode::EmergencyMode, flagValue(true));
    }
}

StepResult ScenarioRunner::run(size_t index, const ScenarioStep& step)
{
    using Handler = void (ScenarioRunner::*)(const std::string&);
    static const std::unordered_map<std::string, Handler> handlers = {
        {"airdrop", &ScenarioRunner::airdrop},
        {"create_mint", &ScenarioRunner::createMint},
        {"mint_to", &ScenarioRunner::mintTo},
        {"init_vault", &ScenarioRunner::initVault},
        {"create_order", &ScenarioRunner::createOrder},
        {"take_order", &ScenarioRunner::takeOrder},
        {"flash_take_order", &ScenarioRunner::flashTakeOrder},
        {"close_order", &ScenarioRunner::closeOrder},
        {"update_order", &ScenarioRunner::updateOrder},
        {"update_config", &ScenarioRunner::updateConfig},
        {"update_config_admin", &ScenarioRunner::updateConfigAdmin},
        {"withdraw_host_tip", &ScenarioRunner::withdrawHostTip},
        {"advance_clock", &ScenarioRunner::advanceClock},
    };

    auto iterator = handlers.find(step.op);
    if (iterator == handlers.end()) {
        throw std::runtime_error("Unknown scenario op: " + step.op);
    }

    StepResult result;
    result.index = index;
    result.op = step.op;
    m_stepLogs.clear();

    try {
        (this->*(iterator->second))(step.body);
        result.outcome = "ok";
    } catch (const TransactionError& error) {
        result.outcome = errorName(error.code());
        result.detail = error.what();
    } catch (const SettlementError& error) {
        result.outcome = errorName(error.code());
        result.detail = error.what();
    }

    result.passed = step.expectError.empty() ? result.outcome == "ok" : result.outcome == step.expectError;
    result.logs = m_stepLogs;
    return result;
}

std::vector<StepResult> ScenarioRunner::runAll(const std::vector<ScenarioStep>& steps)
{
    std::vector<StepResult> results;
    results.reserve(steps.size());
    for (size_t index = 0; index < steps.size(); ++index) {
        results.push_back(run(index, steps[index]));
    }
    return results;
}

GlobalConfig ScenarioRunner::config() const
{
    const Account* account = m_runtime.find(m_globalConfig);
    if (account == nullptr) {
        throw SettlementError(ErrorCode::InvalidAccount, "global config not deployed");
    }
    return layout::decodeGlobalConfig(account->data);
}

Order ScenarioRunner::order(const std::string& label) const
{
    const Account* account = m_runtime.find(Address::fromLabel(label));
    if (account == nullptr) {
        throw SettlementError(ErrorCode::InvalidAccount, "no order " + label);
    }
    return layout::decodeOrder(account->data);
}

Amount ScenarioRunner::tokenBalance(const std::string& owner, const std::string& mint) const
{
    return token::balanceOf(m_runtime, token::walletAccount(Address::fromLabel(owner), Address::fromLabel(mint)));
}

Address ScenarioRunner::ensureWallet(const Address& owner, const Address& mint)
{
    Address wallet = token::walletAccount(owner, mint);
    if (m_runtime.find(wallet) != nullptr) {
        return wallet;
    }
    const Account* mintAccount = m_runtime.find(mint);
    if (mintAccount == nullptr) {
        throw SettlementError(ErrorCode::InvalidTokenMint, mint.shortHex() + " does not exist");
    }
    token::createTokenAccount(m_runtime, wallet, mint, owner, mintAccount->owner);
    return wallet;
}

void ScenarioRunner::submit(const Transaction& transaction)
{
    try {
        m_runtime.execute(transaction);
    } catch (const TransactionError&) {
        const auto& logs = m_runtime.lastLogs();
        m_stepLogs.insert(m_stepLogs.end(), logs.begin(), logs.end());
        throw;
    }
    const auto& logs = m_runtime.lastLogs();
    m_stepLogs.insert(m_stepLogs.end(), logs.begin(), logs.end());
}

void ScenarioRunner::applyConfig(UpdateGlobalConfigMode mode, const Bytes& value)
{
    submit(Transaction{{m_client.updateGlobalConfig(m_admin, m_globalConfig, mode, value)}, {m_admin}});
}

TakeOrderAccounts ScenarioRunner::takeAccounts(const Address& taker, const Address& orderAddress)
{
    const Account* account = m_runtime.find(orderAddress);
    if (account == nullptr) {
        throw SettlementError(ErrorCode::InvalidAccount, orderAddress.shortHex() + " does not exist");
    }
    Order record = layout::decodeOrder(account->data);

    TakeOrderAccounts accounts;
    accounts.taker = taker;
    accounts.maker = record.maker;
    accounts.globalConfig = record.globalConfig;
    accounts.pdaAuthority = m_client.pdaAuthority(record.globalConfig);
    accounts.order = orderAddress;
    accounts.inputMint = record.inputMint;
    accounts.outputMint = record.outputMint;
    accounts.inputVault = m_client.vault(record.globalConfig, record.inputMint);
    accounts.takerInputAccount = ensureWallet(taker, record.inputMint);
    accounts.takerOutputAccount = ensureWallet(taker, record.outputMint);
    accounts.makerOutputAccount = ensureWallet(record.maker, record.outputMint);
    return accounts;
}

void ScenarioRunner::airdrop(const std::string& body)
{
    m_runtime.airdrop(labelOf(body, "account"), requiredUint(body, "lamports"));
}

void ScenarioRunner::createMint(const std::string& body)
{
    const Address& program = extractBool(body, "token_2022") ? token2022ProgramId() : tokenProgramId();
    auto decimals = narrowed<uint8_t>("decimals", extractUint(body, "decimals", 6));
    token::createMint(m_runtime, labelOf(body, "mint"), decimals, program);
}

void ScenarioRunner::mintTo(const std::string& body)
{
    Address wallet = ensureWallet(labelOf(body, "owner"), labelOf(body, "mint"));
    token::mintTo(m_runtime, wallet, requiredUint(body, "amount"));
}

void ScenarioRunner::initVault(const std::string& body)
{
    Address signer = hasKey(body, "signer") ? labelOf(body, "signer") : m_admin;
    submit(Transaction{{m_client.initializeVault(signer, m_globalConfig, labelOf(body, "mint"))}, {signer}});
}

void ScenarioRunner::createOrder(const std::string& body)
{
    Address maker = labelOf(body, "maker");
    Address orderAddress = labelOf(body, "order");
    Address inputMint = labelOf(body, "input_mint");
    Address outputMint = labelOf(body, "output_mint");

    CreateOrderArgs args;
    args.inputAmount = requiredUint(body, "input_amount");
    args.outputAmount = requiredUint(body, "output_amount");
    args.orderType = narrowed<uint8_t>("order_type", extractUint(body, "order_type", 0));

    Address makerInput = ensureWallet(maker, inputMint);
    submit(Transaction{
        {m_client.createOrder(maker, m_globalConfig, orderAddress, inputMint, outputMint, makerInput, args)},
        {maker, orderAddress}});
}

void ScenarioRunner::takeOrder(const std::string& body)
{
    Address taker = labelOf(body, "taker");
    TakeOrderAccounts accounts = takeAccounts(taker, labelOf(body, "order"));

    TakeOrderArgs args;
    args.inputAmount = requiredUint(body, "input_amount");
    args.minOutputAmount = requiredUint(body, "min_output_amount");
    args.tipAmountPermissionlessTaking = extractUint(body, "tip", 0);

    submit(Transaction{{m_client.takeOrder(accounts, args)}, {taker}});
}

void ScenarioRunner::flashTakeOrder(const std::string& body)
{
    Address taker = labelOf(body, "taker");
    TakeOrderAccounts accounts = takeAccounts(taker, labelOf(body, "order"));

    TakeOrderArgs args;
    args.inputAmount = requiredUint(body, "input_amount");
    args.minOutputAmount = requiredUint(body, "min_output_amount");
    args.tipAmountPermissionlessTaking = extractUint(body, "tip", 0);

    submit(Transaction{{m_client.flashTakeOrderStart(accounts, args), m_client.flashTakeOrderEnd(accounts, args)},
                       {taker}});
}

void ScenarioRunner::closeOrder(const std::string& body)
{
    Address maker = labelOf(body, "maker");
    Address orderAddress = labelOf(body, "order");

    const Account* account = m_runtime.find(orderAddress);
    if (account == nullptr) {
        throw SettlementError(ErrorCode::InvalidAccount, orderAddress.shortHex() + " does not exist");
    }
    Order record = layout::decodeOrder(account->data);
    Address makerInput = ensureWallet(maker, record.inputMint);

    submit(Transaction{{m_client.closeOrderAndClaimTip(maker, orderAddress, record.globalConfig, record.inputMint,
                                                       record.outputMint, makerInput)},
                       {maker}});
}

void ScenarioRunner::updateOrder(const std::string& body)
{
    Address maker = labelOf(body, "maker");
    Address orderAddress = labelOf(body, "order");
    std::string mode = extractString(body, "mode");

    Instruction instruction;
    if (mode == "permissionless") {
        Bytes value{narrowed<uint8_t>("value", requiredUint(body, "value"))};
        instruction = m_client.updateOrder(maker, m_globalConfig, orderAddress, UpdateOrderMode::Permissionless, value);
    } else if (mode == "counterparty") {
        Address counterparty = extractString(body, "value").empty() ? Address{} : labelOf(body, "value");
        instruction = m_client.updateOrder(maker, m_globalConfig, orderAddress, UpdateOrderMode::Counterparty,
                                           addressValue(counterparty));
    } else {
        throw std::runtime_error("Unknown update_order mode: " + mode);
    }

    submit(Transaction{{instruction}, {maker}});
}

void ScenarioRunner::updateConfig(const std::string& body)
{
    Address signer = hasKey(body, "signer") ? labelOf(body, "signer") : m_admin;
    UpdateGlobalConfigMode mode = configModeFromName(extractString(body, "mode"));

    Bytes value;
    switch (mode) {
    case UpdateGlobalConfigMode::AdminAuthorityCached:
        value = addressValue(labelOf(body, "value"));
        break;
    case UpdateGlobalConfigMode::HostFeeBps:
        value = bpsValue(narrowed<Bps>("value", requiredUint(body, "value")));
        break;
    case UpdateGlobalConfigMode::OrderCloseDelaySeconds:
    case UpdateGlobalConfigMode::TxnFeeCost:
    case UpdateGlobalConfigMode::AtaCreationCost:
        value = u64Value(requiredUint(body, "value"));
        break;
    default:
        value = Bytes{narrowed<uint8_t>("value", requiredUint(body, "value"))};
        break;
    }

    submit(Transaction{{m_client.updateGlobalConfig(signer, m_globalConfig, mode, value)}, {signer}});
}

void ScenarioRunner::updateConfigAdmin(const std::string& body)
{
    Address signer = labelOf(body, "signer");
    submit(Transaction{{m_client.updateGlobalConfigAdmin(signer, m_globalConfig)}, {signer}});
}

void ScenarioRunner::withdrawHostTip(const std::string& body)
{
    Address signer = hasKey(body, "signer") ? labelOf(body, "signer") : m_admin;
    submit(Transaction{{m_client.withdrawHostTip(signer, m_globalConfig)}, {signer}});
}

void ScenarioRunner::advanceClock(const std::string& body)
{
    m_runtime.advanceClock(narrowed<Timestamp>("seconds", requiredUint(body, "seconds")));
}

} // namespace settlemill
