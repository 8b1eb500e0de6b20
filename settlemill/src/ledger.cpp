#include "ledger.hpp"
#include "codec.hpp"
#include "errors.hpp"
#include "fraction.hpp"

namespace settlemill {

namespace {

const char* modeName(UpdateGlobalConfigMode mode)
{
    switch (mode) {
    case UpdateGlobalConfigMode::EmergencyMode:
        return "UpdateEmergencyMode";
    case UpdateGlobalConfigMode::FlashTakeOrderBlocked:
        return "UpdateFlashTakeOrderBlocked";
    case UpdateGlobalConfigMode::BlockNewOrders:
        return "UpdateBlockNewOrders";
    case UpdateGlobalConfigMode::BlockOrderTaking:
        return "UpdateBlockOrderTaking";
    case UpdateGlobalConfigMode::HostFeeBps:
        return "UpdateHostFeeBps";
    case UpdateGlobalConfigMode::AdminAuthorityCached:
        return "UpdateAdminAuthorityCached";
    case UpdateGlobalConfigMode::OrderTakingPermissionless:
        return "UpdateOrderTakingPermissionless";
    case UpdateGlobalConfigMode::OrderCloseDelaySeconds:
        return "UpdateOrderCloseDelaySeconds";
    case UpdateGlobalConfigMode::TxnFeeCost:
        return "UpdateTxnFeeCost";
    case UpdateGlobalConfigMode::AtaCreationCost:
        return "UpdateAtaCreationCost";
    }
    return "Unknown";
}

std::string changeLine(uint64_t next, uint64_t previous)
{
    return "new=" + std::to_string(next) + " prev=" + std::to_string(previous);
}

uint8_t* flagField(GlobalConfig& config, UpdateGlobalConfigMode mode)
{
    switch (mode) {
    case UpdateGlobalConfigMode::EmergencyMode:
        return &config.emergencyMode;
    case UpdateGlobalConfigMode::FlashTakeOrderBlocked:
        return &config.flashTakeOrderBlocked;
    case UpdateGlobalConfigMode::BlockNewOrders:
        return &config.newOrdersBlocked;
    case UpdateGlobalConfigMode::BlockOrderTaking:
        return &config.ordersTakingBlocked;
    default:
        return nullptr;
    }
}

Amount* amountField(GlobalConfig& config, UpdateGlobalConfigMode mode)
{
    switch (mode) {
    case UpdateGlobalConfigMode::OrderCloseDelaySeconds:
        return &config.orderCloseDelaySeconds;
    case UpdateGlobalConfigMode::TxnFeeCost:
        return &config.txnFeeCost;
    case UpdateGlobalConfigMode::AtaCreationCost:
        return &config.ataCreationCost;
    default:
        return nullptr;
    }
}

} // namespace

TipSplit splitTip(const GlobalConfig& config, Amount tipAmount)
{
    TipSplit split;
    split.hostTip = bpsOfCeil(tipAmount, config.hostFeeBps);
    split.makerTip = checkedSub(tipAmount, split.hostTip);
    return split;
}

void reconcileAuthorityBalance(GlobalConfig& config, Amount authorityBalance, Amount tipAmount)
{
    // A balance below the snapshot means lamports left without being accounted
    if (authorityBalance < config.pdaAuthorityPreviousLamportsBalance ||
        authorityBalance - config.pdaAuthorityPreviousLamportsBalance < tipAmount) {
        throw SettlementError(ErrorCode::InvalidTipTransferAmount,
                              "balance=" + std::to_string(authorityBalance) +
                                  " previous=" + std::to_string(config.pdaAuthorityPreviousLamportsBalance) +
                                  " tip=" + std::to_string(tipAmount));
    }
    require(authorityBalance >= config.totalTipAmount, ErrorCode::InvalidTipBalance);

    config.pdaAuthorityPreviousLamportsBalance = authorityBalance;
}

Amount withdrawHostTip(GlobalConfig& config, Amount authorityBalance)
{
    require(authorityBalance >= config.hostTipAmount, ErrorCode::InvalidHostTipBalance);

    Amount hostTip = config.hostTipAmount;
    config.totalTipAmount = checkedSub(config.totalTipAmount, hostTip);
    config.hostTipAmount = 0;
    return hostTip;
}

void initializeGlobalConfig(GlobalConfig& config, const Address& admin, const Address& pdaAuthority,
                            Amount authorityBalance)
{
    config.emergencyMode = 0;
    config.pdaAuthority = pdaAuthority;
    config.adminAuthority = admin;
    config.adminAuthorityCached = admin;
    config.totalTipAmount = 0;
    config.hostTipAmount = 0;
    config.pdaAuthorityPreviousLamportsBalance = authorityBalance;
}

std::vector<std::string> updateGlobalConfig(GlobalConfig& config, UpdateGlobalConfigMode mode,
                                            const UpdateGlobalConfigValue& value, Timestamp now)
{
    std::vector<std::string> logs;
    logs.push_back(std::string("update_global_config mode=") + modeName(mode) + " ts=" + std::to_string(now));

    ByteReader reader(value.data(), value.size());

    switch (mode) {
    case UpdateGlobalConfigMode::EmergencyMode:
    case UpdateGlobalConfigMode::FlashTakeOrderBlocked:
    case UpdateGlobalConfigMode::BlockNewOrders:
    case UpdateGlobalConfigMode::BlockOrderTaking: {
        uint8_t flag = reader.u8();
        require(flag == 0 || flag == 1, ErrorCode::InvalidFlag);
        uint8_t* field = flagField(config, mode);
        logs.push_back(changeLine(flag, *field));
        *field = flag;
        break;
    }
    case UpdateGlobalConfigMode::OrderTakingPermissionless: {
        uint8_t flag = reader.u8();
        require(flag == 0 || flag == 1, ErrorCode::InvalidFlag);
        logs.emplace_back("Field deprecated");
        break;
    }
    case UpdateGlobalConfigMode::HostFeeBps: {
        Bps bps = reader.u16();
        require(bps <= kMaxBps, ErrorCode::InvalidHostFee);
        logs.push_back(changeLine(bps, config.hostFeeBps));
        config.hostFeeBps = bps;
        break;
    }
    case UpdateGlobalConfigMode::AdminAuthorityCached: {
        Address admin = reader.address();
        logs.push_back("new=" + admin.toHex() + " prev=" + config.adminAuthorityCached.toHex());
        config.adminAuthorityCached = admin;
        break;
    }
    case UpdateGlobalConfigMode::OrderCloseDelaySeconds:
    case UpdateGlobalConfigMode::TxnFeeCost:
    case UpdateGlobalConfigMode::AtaCreationCost: {
        Amount amount = reader.u64();
        Amount* field = amountField(config, mode);
        logs.push_back(changeLine(amount, *field));
        *field = amount;
        break;
    }
    default:
        throw SettlementError(ErrorCode::InvalidConfigOption);
    }

    return logs;
}

void promoteCachedAdmin(GlobalConfig& config) { config.adminAuthority = config.adminAuthorityCached; }

} // namespace settlemill
