#pragma once

#include "address.hpp"
#include "order.hpp"
#include "runtime.hpp"
#include "settlementix.hpp"
#include "types.hpp"

#include <functional>

namespace settlemill {

// Verdict of the external permission router for a permissioned fill
struct PermissionGrant {
    bool accepted = false;
    Amount tip = 0; // Lamports the router credited to the custodial authority
};

// Consulted for fills that present a permission account. The router owns
// the auction side: it decides exclusivity and moves the winning tip into
// the custodial authority itself.
using PermissionRouter =
    std::function<PermissionGrant(InvokeContext& context, const Address& permission, const Address& router)>;

class SettlementProgram {
public:
    explicit SettlementProgram(const Address& programId);

    [[nodiscard]] const Address& programId() const { return m_programId; }

    void setPermissionRouter(PermissionRouter router);

    // Registers the program with the runtime; the program must outlive it
    void install(Runtime& runtime);

    // Entry point for one instruction
    void process(InvokeContext& context);

private:
    void initializeGlobalConfig(InvokeContext& context);
    void initializeVault(InvokeContext& context);
    void createOrder(InvokeContext& context, ByteReader& reader);
    void closeOrderAndClaimTip(InvokeContext& context);
    void takeOrder(InvokeContext& context, ByteReader& reader);
    void flashTakeOrderStart(InvokeContext& context, ByteReader& reader);
    void flashTakeOrderEnd(InvokeContext& context, ByteReader& reader);
    void updateGlobalConfig(InvokeContext& context, ByteReader& reader);
    void updateGlobalConfigAdmin(InvokeContext& context);
    void updateOrder(InvokeContext& context, ByteReader& reader);
    void withdrawHostTip(InvokeContext& context);
    void logUserSwapBalancesStart(InvokeContext& context, ByteReader& reader);
    void logUserSwapBalancesEnd(InvokeContext& context, ByteReader& reader);
    void assertUserSwapBalancesStart(InvokeContext& context);
    void assertUserSwapBalancesEnd(InvokeContext& context, ByteReader& reader);

    // Record access, owner and layout checked
    [[nodiscard]] GlobalConfig loadGlobalConfig(const InvokeContext& context, const Address& address) const;
    [[nodiscard]] Order loadOrder(const InvokeContext& context, const Address& address) const;

    // Order and vault consistency shared by the take paths
    void validateTakeAccounts(const InvokeContext& context, const TakeOrderAccounts& accounts,
                              const GlobalConfig& config, const Order& order) const;

    // Resolves the tip for a fill: the router's for permissioned fills,
    // the declared permissionless tip otherwise
    Amount authorizeTaker(InvokeContext& context, const TakeOrderAccounts& accounts, const Order& order,
                          Amount permissionlessTip) const;

    // Moves the permissionless tip in when needed, then reconciles balances
    void collectTip(InvokeContext& context, const TakeOrderAccounts& accounts, GlobalConfig& config,
                    Amount tip) const;

    Address m_programId;
    PermissionRouter m_permissionRouter;
};

} // namespace settlemill
