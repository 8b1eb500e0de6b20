#pragma once

#include "address.hpp"
#include "codec.hpp"
#include "instruction.hpp"
#include "ledger.hpp"
#include "types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace settlemill {

enum class SettlementInstruction {
    InitializeGlobalConfig,
    InitializeVault,
    CreateOrder,
    CloseOrderAndClaimTip,
    TakeOrder,
    FlashTakeOrderStart,
    FlashTakeOrderEnd,
    UpdateGlobalConfig,
    UpdateGlobalConfigAdmin,
    UpdateOrder,
    WithdrawHostTip,
    LogUserSwapBalancesStart,
    LogUserSwapBalancesEnd,
    AssertUserSwapBalancesStart,
    AssertUserSwapBalancesEnd
};

[[nodiscard]] const char* instructionName(SettlementInstruction kind);
[[nodiscard]] const Discriminator& discriminatorOf(SettlementInstruction kind);
[[nodiscard]] std::optional<SettlementInstruction> instructionFromData(const Bytes& data);

struct CreateOrderArgs {
    Amount inputAmount = 0;
    Amount outputAmount = 0;
    uint8_t orderType = 0;
};

// Shared by take_order and both flash halves
struct TakeOrderArgs {
    Amount inputAmount = 0;
    Amount minOutputAmount = 0;
    Amount tipAmountPermissionlessTaking = 0;
};

struct UpdateGlobalConfigArgs {
    uint16_t mode = 0;
    UpdateGlobalConfigValue value{};
};

struct UpdateOrderArgs {
    uint16_t mode = 0;
    Bytes value;
};

struct AssertSwapBalancesEndArgs {
    Amount maxInputAmountChange = 0;
    Amount minOutputAmountChange = 0;
};

// Payload decoders; the reader is positioned after the discriminator
CreateOrderArgs decodeCreateOrderArgs(ByteReader& reader);
TakeOrderArgs decodeTakeOrderArgs(ByteReader& reader);
UpdateGlobalConfigArgs decodeUpdateGlobalConfigArgs(ByteReader& reader);
UpdateOrderArgs decodeUpdateOrderArgs(ByteReader& reader);
AssertSwapBalancesEndArgs decodeAssertSwapBalancesEndArgs(ByteReader& reader);

// Decodes the payload of an already-verified paired take instruction
TakeOrderArgs takeOrderArgsOf(const Instruction& instruction);

// Positional accounts of take_order and the flash halves
struct TakeOrderAccounts {
    Address taker;
    Address maker;
    Address globalConfig;
    Address pdaAuthority;
    Address order;
    Address inputMint;
    Address outputMint;
    Address inputVault;
    Address takerInputAccount;
    Address takerOutputAccount;
    Address makerOutputAccount; // Zero when absent
    Address permission;         // Zero when absent

    [[nodiscard]] std::vector<Address> list() const;
};

// Builds settlement instructions with the derived addresses filled in
class SettlementClient {
public:
    explicit SettlementClient(const Address& programId);

    [[nodiscard]] const Address& programId() const { return m_programId; }

    [[nodiscard]] Address pdaAuthority(const Address& globalConfig) const;
    [[nodiscard]] Address vault(const Address& globalConfig, const Address& mint) const;
    [[nodiscard]] Address logSwapBalances(const Address& maker) const;
    [[nodiscard]] Address assertSwapBalances(const Address& maker) const;

    [[nodiscard]] Instruction initializeGlobalConfig(const Address& admin, const Address& globalConfig) const;
    [[nodiscard]] Instruction initializeVault(const Address& admin, const Address& globalConfig,
                                              const Address& mint) const;
    [[nodiscard]] Instruction createOrder(const Address& maker, const Address& globalConfig, const Address& order,
                                          const Address& inputMint, const Address& outputMint,
                                          const Address& makerInputAccount, const CreateOrderArgs& args) const;
    [[nodiscard]] Instruction closeOrderAndClaimTip(const Address& maker, const Address& order,
                                                    const Address& globalConfig, const Address& inputMint,
                                                    const Address& outputMint,
                                                    const Address& makerInputAccount) const;
    [[nodiscard]] Instruction takeOrder(const TakeOrderAccounts& accounts, const TakeOrderArgs& args) const;
    [[nodiscard]] Instruction flashTakeOrderStart(const TakeOrderAccounts& accounts, const TakeOrderArgs& args) const;
    [[nodiscard]] Instruction flashTakeOrderEnd(const TakeOrderAccounts& accounts, const TakeOrderArgs& args) const;
    [[nodiscard]] Instruction updateGlobalConfig(const Address& admin, const Address& globalConfig,
                                                 UpdateGlobalConfigMode mode, const Bytes& value) const;
    [[nodiscard]] Instruction updateGlobalConfigAdmin(const Address& cachedAdmin, const Address& globalConfig) const;
    [[nodiscard]] Instruction updateOrder(const Address& maker, const Address& globalConfig, const Address& order,
                                          UpdateOrderMode mode, const Bytes& value) const;
    [[nodiscard]] Instruction withdrawHostTip(const Address& admin, const Address& globalConfig) const;
    [[nodiscard]] Instruction logUserSwapBalancesStart(const Address& maker, const Address& inputMint,
                                                       const Address& outputMint, const Address& inputAccount,
                                                       const Address& outputAccount,
                                                       const Address& swapProgram) const;
    [[nodiscard]] Instruction logUserSwapBalancesEnd(const Address& maker, const Address& inputMint,
                                                     const Address& outputMint, const Address& inputAccount,
                                                     const Address& outputAccount, const Address& swapProgram) const;
    [[nodiscard]] Instruction assertUserSwapBalancesStart(const Address& maker, const Address& inputAccount,
                                                          const Address& outputAccount) const;
    [[nodiscard]] Instruction assertUserSwapBalancesEnd(const Address& maker, const Address& inputAccount,
                                                        const Address& outputAccount,
                                                        const AssertSwapBalancesEndArgs& args) const;

private:
    [[nodiscard]] Instruction make(SettlementInstruction kind, std::vector<Address> accounts,
                                   const ByteWriter& payload) const;

    Address m_programId;
};

// Config value buffers for update_global_config
[[nodiscard]] Bytes flagValue(bool enabled);
[[nodiscard]] Bytes bpsValue(Bps bps);
[[nodiscard]] Bytes u64Value(uint64_t value);
[[nodiscard]] Bytes addressValue(const Address& address);

} // namespace settlemill
