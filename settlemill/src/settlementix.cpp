#include "settlementix.hpp"
#include "errors.hpp"
#include "vault.hpp"

#include <algorithm>

namespace settlemill {

namespace {

struct InstructionEntry {
    SettlementInstruction kind;
    const char* name;
};

constexpr InstructionEntry kInstructions[] = {
    {SettlementInstruction::InitializeGlobalConfig, "initialize_global_config"},
    {SettlementInstruction::InitializeVault, "initialize_vault"},
    {SettlementInstruction::CreateOrder, "create_order"},
    {SettlementInstruction::CloseOrderAndClaimTip, "close_order_and_claim_tip"},
    {SettlementInstruction::TakeOrder, "take_order"},
    {SettlementInstruction::FlashTakeOrderStart, "flash_take_order_start"},
    {SettlementInstruction::FlashTakeOrderEnd, "flash_take_order_end"},
    {SettlementInstruction::UpdateGlobalConfig, "update_global_config"},
    {SettlementInstruction::UpdateGlobalConfigAdmin, "update_global_config_admin"},
    {SettlementInstruction::UpdateOrder, "update_order"},
    {SettlementInstruction::WithdrawHostTip, "withdraw_host_tip"},
    {SettlementInstruction::LogUserSwapBalancesStart, "log_user_swap_balances_start"},
    {SettlementInstruction::LogUserSwapBalancesEnd, "log_user_swap_balances_end"},
    {SettlementInstruction::AssertUserSwapBalancesStart, "assert_user_swap_balances_start"},
    {SettlementInstruction::AssertUserSwapBalancesEnd, "assert_user_swap_balances_end"},
};

constexpr size_t kInstructionCount = sizeof(kInstructions) / sizeof(kInstructions[0]);

const std::array<Discriminator, kInstructionCount>& discriminatorTable()
{
    static const auto table = [] {
        std::array<Discriminator, kInstructionCount> result{};
        for (size_t index = 0; index < kInstructionCount; ++index) {
            result[index] = makeDiscriminator(std::string("global:") + kInstructions[index].name);
        }
        return result;
    }();
    return table;
}

void writeTakeOrderArgs(ByteWriter& writer, const TakeOrderArgs& args)
{
    writer.u64(args.inputAmount);
    writer.u64(args.minOutputAmount);
    writer.u64(args.tipAmountPermissionlessTaking);
}

} // namespace

const char* instructionName(SettlementInstruction kind) { return kInstructions[static_cast<size_t>(kind)].name; }

const Discriminator& discriminatorOf(SettlementInstruction kind)
{
    return discriminatorTable()[static_cast<size_t>(kind)];
}

std::optional<SettlementInstruction> instructionFromData(const Bytes& data)
{
    if (data.size() < sizeof(Discriminator)) {
        return std::nullopt;
    }
    const auto& table = discriminatorTable();
    for (size_t index = 0; index < kInstructionCount; ++index) {
        if (std::equal(table[index].begin(), table[index].end(), data.begin())) {
            return kInstructions[index].kind;
        }
    }
    return std::nullopt;
}

CreateOrderArgs decodeCreateOrderArgs(ByteReader& reader)
{
    CreateOrderArgs args;
    args.inputAmount = reader.u64();
    args.outputAmount = reader.u64();
    args.orderType = reader.u8();
    return args;
}

TakeOrderArgs decodeTakeOrderArgs(ByteReader& reader)
{
    TakeOrderArgs args;
    args.inputAmount = reader.u64();
    args.minOutputAmount = reader.u64();
    args.tipAmountPermissionlessTaking = reader.u64();
    return args;
}

UpdateGlobalConfigArgs decodeUpdateGlobalConfigArgs(ByteReader& reader)
{
    UpdateGlobalConfigArgs args;
    args.mode = reader.u16();
    reader.array(args.value);
    return args;
}

UpdateOrderArgs decodeUpdateOrderArgs(ByteReader& reader)
{
    UpdateOrderArgs args;
    args.mode = reader.u16();
    uint32_t size = reader.u32();
    if (size > reader.remaining()) {
        throw SettlementError(ErrorCode::InvalidInstructionData, "update_order value truncated");
    }
    args.value.resize(size);
    reader.raw(args.value.data(), size);
    return args;
}

AssertSwapBalancesEndArgs decodeAssertSwapBalancesEndArgs(ByteReader& reader)
{
    AssertSwapBalancesEndArgs args;
    args.maxInputAmountChange = reader.u64();
    args.minOutputAmountChange = reader.u64();
    return args;
}

TakeOrderArgs takeOrderArgsOf(const Instruction& instruction)
{
    ByteReader reader(instruction.data);
    Discriminator skipped{};
    reader.array(skipped);
    return decodeTakeOrderArgs(reader);
}

std::vector<Address> TakeOrderAccounts::list() const
{
    return {taker,
            maker,
            globalConfig,
            pdaAuthority,
            order,
            inputMint,
            outputMint,
            inputVault,
            takerInputAccount,
            takerOutputAccount,
            makerOutputAccount,
            permission};
}

SettlementClient::SettlementClient(const Address& programId) : m_programId(programId) {}

Address SettlementClient::pdaAuthority(const Address& globalConfig) const
{
    return CustodialAuthority::addressFor(m_programId, globalConfig);
}

Address SettlementClient::vault(const Address& globalConfig, const Address& mint) const
{
    return EscrowVault::addressFor(m_programId, globalConfig, mint);
}

Address SettlementClient::logSwapBalances(const Address& maker) const
{
    return deriveAddress("log_swap_balances", {maker}, m_programId);
}

Address SettlementClient::assertSwapBalances(const Address& maker) const
{
    return deriveAddress("assert_swap_balances", {maker}, m_programId);
}

Instruction SettlementClient::make(SettlementInstruction kind, std::vector<Address> accounts,
                                   const ByteWriter& payload) const
{
    Instruction instruction;
    instruction.programId = m_programId;
    instruction.accounts = std::move(accounts);
    const auto& discriminator = discriminatorOf(kind);
    instruction.data.assign(discriminator.begin(), discriminator.end());
    instruction.data.insert(instruction.data.end(), payload.bytes().begin(), payload.bytes().end());
    return instruction;
}

Instruction SettlementClient::initializeGlobalConfig(const Address& admin, const Address& globalConfig) const
{
    return make(SettlementInstruction::InitializeGlobalConfig, {admin, pdaAuthority(globalConfig), globalConfig},
                ByteWriter{});
}

Instruction SettlementClient::initializeVault(const Address& admin, const Address& globalConfig,
                                              const Address& mint) const
{
    return make(SettlementInstruction::InitializeVault,
                {admin, globalConfig, pdaAuthority(globalConfig), mint, vault(globalConfig, mint)}, ByteWriter{});
}

Instruction SettlementClient::createOrder(const Address& maker, const Address& globalConfig, const Address& order,
                                          const Address& inputMint, const Address& outputMint,
                                          const Address& makerInputAccount, const CreateOrderArgs& args) const
{
    ByteWriter payload;
    payload.u64(args.inputAmount);
    payload.u64(args.outputAmount);
    payload.u8(args.orderType);
    return make(SettlementInstruction::CreateOrder,
                {maker, globalConfig, pdaAuthority(globalConfig), order, inputMint, outputMint, makerInputAccount,
                 vault(globalConfig, inputMint)},
                payload);
}

Instruction SettlementClient::closeOrderAndClaimTip(const Address& maker, const Address& order,
                                                    const Address& globalConfig, const Address& inputMint,
                                                    const Address& outputMint,
                                                    const Address& makerInputAccount) const
{
    return make(SettlementInstruction::CloseOrderAndClaimTip,
                {maker, order, globalConfig, pdaAuthority(globalConfig), inputMint, outputMint, makerInputAccount,
                 vault(globalConfig, inputMint)},
                ByteWriter{});
}

Instruction SettlementClient::takeOrder(const TakeOrderAccounts& accounts, const TakeOrderArgs& args) const
{
    ByteWriter payload;
    writeTakeOrderArgs(payload, args);
    return make(SettlementInstruction::TakeOrder, accounts.list(), payload);
}

Instruction SettlementClient::flashTakeOrderStart(const TakeOrderAccounts& accounts, const TakeOrderArgs& args) const
{
    ByteWriter payload;
    writeTakeOrderArgs(payload, args);
    return make(SettlementInstruction::FlashTakeOrderStart, accounts.list(), payload);
}

Instruction SettlementClient::flashTakeOrderEnd(const TakeOrderAccounts& accounts, const TakeOrderArgs& args) const
{
    ByteWriter payload;
    writeTakeOrderArgs(payload, args);
    return make(SettlementInstruction::FlashTakeOrderEnd, accounts.list(), payload);
}

Instruction SettlementClient::updateGlobalConfig(const Address& admin, const Address& globalConfig,
                                                 UpdateGlobalConfigMode mode, const Bytes& value) const
{
    if (value.size() > kUpdateGlobalConfigValueSize) {
        throw SettlementError(ErrorCode::InvalidParameterType, "config value larger than the value buffer");
    }
    UpdateGlobalConfigValue buffer{};
    std::copy(value.begin(), value.end(), buffer.begin());

    ByteWriter payload;
    payload.u16(static_cast<uint16_t>(mode));
    payload.array(buffer);
    return make(SettlementInstruction::UpdateGlobalConfig, {admin, globalConfig}, payload);
}

Instruction SettlementClient::updateGlobalConfigAdmin(const Address& cachedAdmin, const Address& globalConfig) const
{
    return make(SettlementInstruction::UpdateGlobalConfigAdmin, {cachedAdmin, globalConfig}, ByteWriter{});
}

Instruction SettlementClient::updateOrder(const Address& maker, const Address& globalConfig, const Address& order,
                                          UpdateOrderMode mode, const Bytes& value) const
{
    ByteWriter payload;
    payload.u16(static_cast<uint16_t>(mode));
    payload.u32(static_cast<uint32_t>(value.size()));
    payload.raw(value.data(), value.size());
    return make(SettlementInstruction::UpdateOrder, {maker, globalConfig, order}, payload);
}

Instruction SettlementClient::withdrawHostTip(const Address& admin, const Address& globalConfig) const
{
    return make(SettlementInstruction::WithdrawHostTip, {admin, globalConfig, pdaAuthority(globalConfig)},
                ByteWriter{});
}

Instruction SettlementClient::logUserSwapBalancesStart(const Address& maker, const Address& inputMint,
                                                       const Address& outputMint, const Address& inputAccount,
                                                       const Address& outputAccount,
                                                       const Address& swapProgram) const
{
    ByteWriter payload;
    payload.address(swapProgram);
    return make(SettlementInstruction::LogUserSwapBalancesStart,
                {maker, inputMint, outputMint, inputAccount, outputAccount, logSwapBalances(maker)}, payload);
}

Instruction SettlementClient::logUserSwapBalancesEnd(const Address& maker, const Address& inputMint,
                                                     const Address& outputMint, const Address& inputAccount,
                                                     const Address& outputAccount, const Address& swapProgram) const
{
    ByteWriter payload;
    payload.address(swapProgram);
    return make(SettlementInstruction::LogUserSwapBalancesEnd,
                {maker, inputMint, outputMint, inputAccount, outputAccount, logSwapBalances(maker)}, payload);
}

Instruction SettlementClient::assertUserSwapBalancesStart(const Address& maker, const Address& inputAccount,
                                                          const Address& outputAccount) const
{
    return make(SettlementInstruction::AssertUserSwapBalancesStart,
                {maker, inputAccount, outputAccount, assertSwapBalances(maker)}, ByteWriter{});
}

Instruction SettlementClient::assertUserSwapBalancesEnd(const Address& maker, const Address& inputAccount,
                                                        const Address& outputAccount,
                                                        const AssertSwapBalancesEndArgs& args) const
{
    ByteWriter payload;
    payload.u64(args.maxInputAmountChange);
    payload.u64(args.minOutputAmountChange);
    return make(SettlementInstruction::AssertUserSwapBalancesEnd,
                {maker, inputAccount, outputAccount, assertSwapBalances(maker)}, payload);
}

Bytes flagValue(bool enabled) { return Bytes{static_cast<uint8_t>(enabled ? 1 : 0)}; }

Bytes bpsValue(Bps bps)
{
    ByteWriter writer;
    writer.u16(bps);
    return writer.take();
}

Bytes u64Value(uint64_t value)
{
    ByteWriter writer;
    writer.u64(value);
    return writer.take();
}

Bytes addressValue(const Address& address)
{
    ByteWriter writer;
    writer.address(address);
    return writer.take();
}

} // namespace settlemill
