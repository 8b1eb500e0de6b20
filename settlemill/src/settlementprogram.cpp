#include "settlementprogram.hpp"
#include "assetprograms.hpp"
#include "errors.hpp"
#include "fillengine.hpp"
#include "flashverifier.hpp"
#include "layout.hpp"
#include "ledger.hpp"
#include "orderlifecycle.hpp"
#include "programids.hpp"
#include "swapbalances.hpp"
#include "vault.hpp"

#include <string>
#include <utility>

namespace settlemill {

namespace {

constexpr const char* kLogSwapBalancesTag = "log_swap_balances";
constexpr const char* kAssertSwapBalancesTag = "assert_swap_balances";

void requireNoEmergency(const GlobalConfig& config)
{
    require(config.emergencyMode == 0, ErrorCode::EmergencyModeEnabled);
}

void requireNewOrdersAllowed(const GlobalConfig& config)
{
    require(config.newOrdersBlocked == 0, ErrorCode::CreatingNewOrdersBlocked);
}

void requireTakingAllowed(const GlobalConfig& config)
{
    require(config.ordersTakingBlocked == 0, ErrorCode::OrderTakingBlocked);
}

void requireFlashAllowed(const GlobalConfig& config)
{
    require(config.flashTakeOrderBlocked == 0, ErrorCode::FlashTakeOrderBlocked);
}

TakeOrderAccounts takeAccountsOf(const InvokeContext& context)
{
    TakeOrderAccounts accounts;
    accounts.taker = context.accountAt(0);
    accounts.maker = context.accountAt(1);
    accounts.globalConfig = context.accountAt(2);
    accounts.pdaAuthority = context.accountAt(3);
    accounts.order = context.accountAt(4);
    accounts.inputMint = context.accountAt(5);
    accounts.outputMint = context.accountAt(6);
    accounts.inputVault = context.accountAt(7);
    accounts.takerInputAccount = context.accountAt(8);
    accounts.takerOutputAccount = context.accountAt(9);
    accounts.makerOutputAccount = context.accountAt(10);
    if (context.accountCount() > 11) {
        accounts.permission = context.accountAt(11);
    }
    return accounts;
}

// Token program owning the mint
Address tokenProgramOf(const InvokeContext& context, const Address& mint)
{
    const Account& account = context.account(mint);
    if (account.owner != tokenProgramId() && account.owner != token2022ProgramId()) {
        throw SettlementError(ErrorCode::InvalidTokenMint, mint.shortHex() + " is not a mint");
    }
    (void)layout::decodeMint(account.data);
    return account.owner;
}

TokenAccount checkedTokenAccount(const InvokeContext& context, const Address& address, const Address& mint,
                                 const Address& owner)
{
    TokenAccount account = token::readTokenAccount(context, address);
    if (account.mint != mint) {
        throw SettlementError(ErrorCode::InvalidTokenMint, address.shortHex());
    }
    if (account.owner != owner) {
        throw SettlementError(ErrorCode::InvalidTokenAuthority, address.shortHex());
    }
    return account;
}

// Missing or empty accounts read as a zero balance
Amount balanceOrZero(const InvokeContext& context, const Address& address, const Address& mint,
                     const Address& owner)
{
    if (!context.exists(address) || context.account(address).data.empty()) {
        return 0;
    }
    return checkedTokenAccount(context, address, mint, owner).amount;
}

Amount lamportsOf(const InvokeContext& context, const Address& address)
{
    return context.exists(address) ? context.account(address).lamports : 0;
}

void requireSameArgs(const TakeOrderArgs& mine, const TakeOrderArgs& paired)
{
    require(mine.inputAmount == paired.inputAmount, ErrorCode::FlashIxsArgsMismatch);
    require(mine.minOutputAmount == paired.minOutputAmount, ErrorCode::FlashIxsArgsMismatch);
    require(mine.tipAmountPermissionlessTaking == paired.tipAmountPermissionlessTaking,
            ErrorCode::FlashIxsArgsMismatch);
}

std::string fillLine(const Order& order, const TakeOrderEffects& effects, Amount tip)
{
    return "remaining_input_amount=" + std::to_string(order.remainingInputAmount) +
           " filled_output_amount=" + std::to_string(order.filledOutputAmount) +
           " number_of_fills=" + std::to_string(order.numberOfFills) + " status=" + std::to_string(order.status) +
           " on_event_output_amount_filled=" + std::to_string(effects.outputToSendToMaker) +
           " on_event_tip_amount=" + std::to_string(tip);
}

} // namespace

SettlementProgram::SettlementProgram(const Address& programId) : m_programId(programId) {}

void SettlementProgram::setPermissionRouter(PermissionRouter router) { m_permissionRouter = std::move(router); }

void SettlementProgram::install(Runtime& runtime)
{
    runtime.registerProgram(m_programId, [this](InvokeContext& context) { process(context); });
}

void SettlementProgram::process(InvokeContext& context)
{
    const Bytes& data = context.instruction().data;
    auto kind = instructionFromData(data);
    if (!kind) {
        throw SettlementError(ErrorCode::InvalidInstructionData, "unknown discriminator");
    }

    context.log(std::string("Instruction: ") + instructionName(*kind));

    ByteReader reader(data);
    Discriminator discriminator{};
    reader.array(discriminator);

    switch (*kind) {
    case SettlementInstruction::InitializeGlobalConfig:
        initializeGlobalConfig(context);
        break;
    case SettlementInstruction::InitializeVault:
        initializeVault(context);
        break;
    case SettlementInstruction::CreateOrder:
        createOrder(context, reader);
        break;
    case SettlementInstruction::CloseOrderAndClaimTip:
        closeOrderAndClaimTip(context);
        break;
    case SettlementInstruction::TakeOrder:
        takeOrder(context, reader);
        break;
    case SettlementInstruction::FlashTakeOrderStart:
        flashTakeOrderStart(context, reader);
        break;
    case SettlementInstruction::FlashTakeOrderEnd:
        flashTakeOrderEnd(context, reader);
        break;
    case SettlementInstruction::UpdateGlobalConfig:
        updateGlobalConfig(context, reader);
        break;
    case SettlementInstruction::UpdateGlobalConfigAdmin:
        updateGlobalConfigAdmin(context);
        break;
    case SettlementInstruction::UpdateOrder:
        updateOrder(context, reader);
        break;
    case SettlementInstruction::WithdrawHostTip:
        withdrawHostTip(context);
        break;
    case SettlementInstruction::LogUserSwapBalancesStart:
        logUserSwapBalancesStart(context, reader);
        break;
    case SettlementInstruction::LogUserSwapBalancesEnd:
        logUserSwapBalancesEnd(context, reader);
        break;
    case SettlementInstruction::AssertUserSwapBalancesStart:
        assertUserSwapBalancesStart(context);
        break;
    case SettlementInstruction::AssertUserSwapBalancesEnd:
        assertUserSwapBalancesEnd(context, reader);
        break;
    }
}

GlobalConfig SettlementProgram::loadGlobalConfig(const InvokeContext& context, const Address& address) const
{
    const Account& account = context.account(address);
    if (account.owner != m_programId) {
        throw SettlementError(ErrorCode::InvalidAccount, address.shortHex() + " is not a global config");
    }
    return layout::decodeGlobalConfig(account.data);
}

Order SettlementProgram::loadOrder(const InvokeContext& context, const Address& address) const
{
    const Account& account = context.account(address);
    if (account.owner != m_programId) {
        throw SettlementError(ErrorCode::InvalidAccount, address.shortHex() + " is not an order");
    }
    return layout::decodeOrder(account.data);
}

void SettlementProgram::initializeGlobalConfig(InvokeContext& context)
{
    const Address& admin = context.accountAt(0);
    const Address& pdaAuthority = context.accountAt(1);
    const Address& globalConfig = context.accountAt(2);

    context.requireSigner(admin);
    CustodialAuthority authority(m_programId, globalConfig);
    require(authority.address() == pdaAuthority, ErrorCode::InvalidPdaAuthority);

    context.invoke(native::createAccount(admin, globalConfig, context.rentFor(layout::kGlobalConfigSize),
                                         layout::kGlobalConfigSize, m_programId));

    GlobalConfig config;
    settlemill::initializeGlobalConfig(config, admin, pdaAuthority, lamportsOf(context, pdaAuthority));
    context.writeData(globalConfig, layout::encodeGlobalConfig(config));

    context.log("Initializing global config with global authority " + pdaAuthority.toHex());
}

void SettlementProgram::initializeVault(InvokeContext& context)
{
    const Address& admin = context.accountAt(0);
    const Address& globalConfig = context.accountAt(1);
    const Address& pdaAuthority = context.accountAt(2);
    const Address& mint = context.accountAt(3);
    const Address& vaultAddress = context.accountAt(4);

    GlobalConfig config = loadGlobalConfig(context, globalConfig);
    requireNoEmergency(config);

    context.requireSigner(admin);
    require(config.adminAuthority == admin, ErrorCode::InvalidAdminAuthority);
    require(config.pdaAuthority == pdaAuthority, ErrorCode::InvalidPdaAuthority);

    Address tokenProgram = tokenProgramOf(context, mint);
    EscrowVault vault(m_programId, globalConfig, mint);
    require(vault.address() == vaultAddress, ErrorCode::InvalidAccount);

    vault.initialize(context, admin, tokenProgram, CustodialAuthority(m_programId, globalConfig));
    context.log("Initialized vault " + vaultAddress.toHex() + " for mint " + mint.toHex());
}

void SettlementProgram::createOrder(InvokeContext& context, ByteReader& reader)
{
    CreateOrderArgs args = decodeCreateOrderArgs(reader);

    const Address& maker = context.accountAt(0);
    const Address& globalConfig = context.accountAt(1);
    const Address& pdaAuthority = context.accountAt(2);
    const Address& orderAddress = context.accountAt(3);
    const Address& inputMint = context.accountAt(4);
    const Address& outputMint = context.accountAt(5);
    const Address& makerInputAccount = context.accountAt(6);
    const Address& inputVault = context.accountAt(7);

    GlobalConfig config = loadGlobalConfig(context, globalConfig);
    requireNoEmergency(config);
    requireNewOrdersAllowed(config);

    context.requireSigner(maker);
    require(config.pdaAuthority == pdaAuthority, ErrorCode::InvalidPdaAuthority);

    OrderTerms terms;
    terms.inputMint = inputMint;
    terms.inputMintProgramId = tokenProgramOf(context, inputMint);
    terms.outputMint = outputMint;
    terms.outputMintProgramId = tokenProgramOf(context, outputMint);
    terms.inputAmount = args.inputAmount;
    terms.outputAmount = args.outputAmount;
    terms.orderType = args.orderType;

    EscrowVault vault(m_programId, globalConfig, inputMint);
    require(vault.address() == inputVault, ErrorCode::InvalidAccount);
    checkedTokenAccount(context, inputVault, inputMint, pdaAuthority);
    checkedTokenAccount(context, makerInputAccount, inputMint, maker);

    Order order;
    settlemill::createOrder(order, globalConfig, maker, terms, context.now());

    context.invoke(native::createAccount(maker, orderAddress, context.rentFor(layout::kOrderSize), layout::kOrderSize,
                                         m_programId));
    context.writeData(orderAddress, layout::encodeOrder(order));

    vault.deposit(context, terms.inputMintProgramId, makerInputAccount, maker, args.inputAmount);

    context.log("Created order " + orderAddress.toHex() + ", input_amount " + std::to_string(args.inputAmount) +
                ", input_mint " + inputMint.toHex() + ", output_amount " + std::to_string(args.outputAmount) +
                ", output_mint " + outputMint.toHex());
}

void SettlementProgram::closeOrderAndClaimTip(InvokeContext& context)
{
    const Address& maker = context.accountAt(0);
    const Address& orderAddress = context.accountAt(1);
    const Address& globalConfig = context.accountAt(2);
    const Address& pdaAuthority = context.accountAt(3);
    const Address& inputMint = context.accountAt(4);
    const Address& outputMint = context.accountAt(5);
    const Address& makerInputAccount = context.accountAt(6);
    const Address& inputVault = context.accountAt(7);

    GlobalConfig config = loadGlobalConfig(context, globalConfig);
    requireNoEmergency(config);

    context.requireSigner(maker);
    Order order = loadOrder(context, orderAddress);
    require(order.maker == maker, ErrorCode::InvalidOrderOwner);
    require(order.globalConfig == globalConfig, ErrorCode::InvalidAccount);
    require(order.inputMint == inputMint && order.outputMint == outputMint, ErrorCode::InvalidTokenMint);
    require(config.pdaAuthority == pdaAuthority, ErrorCode::InvalidPdaAuthority);

    EscrowVault vault(m_programId, globalConfig, inputMint);
    require(vault.address() == inputVault, ErrorCode::InvalidAccount);
    checkedTokenAccount(context, makerInputAccount, inputMint, maker);

    closeOrder(order, config, context.now());

    CustodialAuthority authority(m_programId, globalConfig);
    vault.release(context, order.inputMintProgramId, makerInputAccount, authority, order.remainingInputAmount);
    authority.pay(context, maker, order.tipAmount);

    config.pdaAuthorityPreviousLamportsBalance = lamportsOf(context, pdaAuthority);
    context.writeData(globalConfig, layout::encodeGlobalConfig(config));

    context.log("Closed order " + orderAddress.toHex() + " returned_input=" +
                std::to_string(order.remainingInputAmount) + " tip=" + std::to_string(order.tipAmount));
    context.closeAccount(orderAddress, maker);
}

void SettlementProgram::validateTakeAccounts(const InvokeContext& context, const TakeOrderAccounts& accounts,
                                             const GlobalConfig& config, const Order& order) const
{
    context.requireSigner(accounts.taker);
    require(config.pdaAuthority == accounts.pdaAuthority, ErrorCode::InvalidPdaAuthority);
    require(order.globalConfig == accounts.globalConfig, ErrorCode::InvalidAccount);
    require(order.maker == accounts.maker, ErrorCode::InvalidOrderOwner);
    require(order.inputMint == accounts.inputMint && order.outputMint == accounts.outputMint,
            ErrorCode::InvalidTokenMint);

    EscrowVault vault(m_programId, accounts.globalConfig, accounts.inputMint);
    require(vault.address() == accounts.inputVault, ErrorCode::InvalidAccount);

    checkedTokenAccount(context, accounts.takerInputAccount, accounts.inputMint, accounts.taker);
    checkedTokenAccount(context, accounts.takerOutputAccount, accounts.outputMint, accounts.taker);

    if (accounts.makerOutputAccount.isZero()) {
        throw SettlementError(ErrorCode::MakerOutputAtaRequired);
    }
    require(accounts.makerOutputAccount == token::walletAccount(accounts.maker, accounts.outputMint),
            ErrorCode::InvalidAccount);
    checkedTokenAccount(context, accounts.makerOutputAccount, accounts.outputMint, accounts.maker);
}

Amount SettlementProgram::authorizeTaker(InvokeContext& context, const TakeOrderAccounts& accounts,
                                         const Order& order, Amount permissionlessTip) const
{
    bool filledByPermission = !accounts.permission.isZero();
    if (order.permissionless == 0 && !filledByPermission) {
        throw SettlementError(ErrorCode::PermissionRequiredPermissionlessNotEnabled);
    }
    require(isCounterpartyMatching(order, accounts.taker), ErrorCode::CounterpartyDisallowed);

    if (!filledByPermission) {
        return permissionlessTip;
    }

    require(accounts.permission == accounts.order, ErrorCode::PermissionDoesNotMatchOrder);
    if (!m_permissionRouter) {
        throw SettlementError(ErrorCode::PermissionNotGranted, "no permission router configured");
    }
    PermissionGrant grant = m_permissionRouter(context, accounts.permission, accounts.pdaAuthority);
    require(grant.accepted, ErrorCode::PermissionNotGranted);
    return grant.tip;
}

void SettlementProgram::collectTip(InvokeContext& context, const TakeOrderAccounts& accounts, GlobalConfig& config,
                                   Amount tip) const
{
    if (accounts.permission.isZero() && tip > 0) {
        context.invoke(native::transfer(accounts.taker, accounts.pdaAuthority, tip));
    }

    reconcileAuthorityBalance(config, lamportsOf(context, accounts.pdaAuthority), tip);
}

void SettlementProgram::takeOrder(InvokeContext& context, ByteReader& reader)
{
    TakeOrderArgs args = decodeTakeOrderArgs(reader);
    TakeOrderAccounts accounts = takeAccountsOf(context);

    GlobalConfig config = loadGlobalConfig(context, accounts.globalConfig);
    requireNoEmergency(config);
    requireTakingAllowed(config);

    Order order = loadOrder(context, accounts.order);
    validateTakeAccounts(context, accounts, config, order);

    Amount tip = authorizeTaker(context, accounts, order, args.tipAmountPermissionlessTaking);

    TakeOrderEffects effects =
        settlemill::takeOrder(config, order, args.inputAmount, args.minOutputAmount, tip, context.now());
    context.log("input_to_send_to_taker: " + std::to_string(effects.inputToSendToTaker));
    context.log("output_to_send_to_maker: " + std::to_string(effects.outputToSendToMaker));

    context.invoke(token::transfer(order.outputMintProgramId, accounts.takerOutputAccount, accounts.makerOutputAccount,
                                   accounts.taker, effects.outputToSendToMaker));
    EscrowVault vault(m_programId, accounts.globalConfig, accounts.inputMint);
    vault.release(context, order.inputMintProgramId, accounts.takerInputAccount,
                  CustodialAuthority(m_programId, accounts.globalConfig), effects.inputToSendToTaker);

    collectTip(context, accounts, config, tip);

    context.writeData(accounts.order, layout::encodeOrder(order));
    context.writeData(accounts.globalConfig, layout::encodeGlobalConfig(config));
    context.log(fillLine(order, effects, tip));
}

void SettlementProgram::flashTakeOrderStart(InvokeContext& context, ByteReader& reader)
{
    TakeOrderArgs args = decodeTakeOrderArgs(reader);
    TakeOrderAccounts accounts = takeAccountsOf(context);

    GlobalConfig config = loadGlobalConfig(context, accounts.globalConfig);
    requireNoEmergency(config);
    requireTakingAllowed(config);
    requireFlashAllowed(config);

    FlashVerifier verifier(context.transactionInstructions(), context.currentIndex(), m_programId);
    verifier.ensureTopLevel(context.stackHeight());

    Order order = loadOrder(context, accounts.order);
    validateTakeAccounts(context, accounts, config, order);

    const Instruction& end = verifier.ensureEndFollows(discriminatorOf(SettlementInstruction::FlashTakeOrderEnd));
    requireSameArgs(args, takeOrderArgsOf(end));

    TakeOrderEffects effects = flashWithdrawOrderInput(order, args.inputAmount, args.minOutputAmount);
    context.log("input_to_send_to_taker: " + std::to_string(effects.inputToSendToTaker));

    EscrowVault vault(m_programId, accounts.globalConfig, accounts.inputMint);
    vault.release(context, order.inputMintProgramId, accounts.takerInputAccount,
                  CustodialAuthority(m_programId, accounts.globalConfig), effects.inputToSendToTaker);

    order.flashStartTakerOutputBalance = token::readTokenAccount(context, accounts.takerOutputAccount).amount;
    context.writeData(accounts.order, layout::encodeOrder(order));
}

void SettlementProgram::flashTakeOrderEnd(InvokeContext& context, ByteReader& reader)
{
    TakeOrderArgs args = decodeTakeOrderArgs(reader);
    TakeOrderAccounts accounts = takeAccountsOf(context);

    GlobalConfig config = loadGlobalConfig(context, accounts.globalConfig);
    requireNoEmergency(config);
    requireTakingAllowed(config);
    requireFlashAllowed(config);

    FlashVerifier verifier(context.transactionInstructions(), context.currentIndex(), m_programId);
    verifier.ensureTopLevel(context.stackHeight());

    Order order = loadOrder(context, accounts.order);
    validateTakeAccounts(context, accounts, config, order);

    const Instruction& start =
        verifier.ensureStartPrecedes(discriminatorOf(SettlementInstruction::FlashTakeOrderStart));
    requireSameArgs(args, takeOrderArgsOf(start));

    Amount tip = authorizeTaker(context, accounts, order, args.tipAmountPermissionlessTaking);

    Amount takerOutputBalance = token::readTokenAccount(context, accounts.takerOutputAccount).amount;
    Amount outputAmount =
        flashEndOutputAmount(order.flashStartTakerOutputBalance, takerOutputBalance, args.minOutputAmount);

    TakeOrderEffects effects =
        flashPayOrderOutput(config, order, args.inputAmount, outputAmount, tip, context.now());
    context.log("output_to_send_to_maker: " + std::to_string(effects.outputToSendToMaker));

    context.invoke(token::transfer(order.outputMintProgramId, accounts.takerOutputAccount, accounts.makerOutputAccount,
                                   accounts.taker, effects.outputToSendToMaker));

    collectTip(context, accounts, config, tip);

    order.flashStartTakerOutputBalance = 0;
    context.writeData(accounts.order, layout::encodeOrder(order));
    context.writeData(accounts.globalConfig, layout::encodeGlobalConfig(config));
    context.log(fillLine(order, effects, tip));
}

void SettlementProgram::updateGlobalConfig(InvokeContext& context, ByteReader& reader)
{
    UpdateGlobalConfigArgs args = decodeUpdateGlobalConfigArgs(reader);

    const Address& admin = context.accountAt(0);
    const Address& globalConfig = context.accountAt(1);

    GlobalConfig config = loadGlobalConfig(context, globalConfig);
    context.requireSigner(admin);
    require(config.adminAuthority == admin, ErrorCode::InvalidAdminAuthority);

    auto logs =
        settlemill::updateGlobalConfig(config, static_cast<UpdateGlobalConfigMode>(args.mode), args.value, context.now());
    for (const auto& line : logs) {
        context.log(line);
    }
    context.writeData(globalConfig, layout::encodeGlobalConfig(config));
}

void SettlementProgram::updateGlobalConfigAdmin(InvokeContext& context)
{
    const Address& cachedAdmin = context.accountAt(0);
    const Address& globalConfig = context.accountAt(1);

    GlobalConfig config = loadGlobalConfig(context, globalConfig);
    context.requireSigner(cachedAdmin);
    require(config.adminAuthorityCached == cachedAdmin, ErrorCode::InvalidAdminAuthority);

    context.log("Updated Global Config admin_authority, previous: " + config.adminAuthority.toHex() +
                ", new: " + config.adminAuthorityCached.toHex());
    promoteCachedAdmin(config);
    context.writeData(globalConfig, layout::encodeGlobalConfig(config));
}

void SettlementProgram::updateOrder(InvokeContext& context, ByteReader& reader)
{
    UpdateOrderArgs args = decodeUpdateOrderArgs(reader);

    const Address& maker = context.accountAt(0);
    const Address& globalConfig = context.accountAt(1);
    const Address& orderAddress = context.accountAt(2);

    context.requireSigner(maker);
    Order order = loadOrder(context, orderAddress);
    require(order.maker == maker, ErrorCode::InvalidOrderOwner);
    require(order.globalConfig == globalConfig, ErrorCode::InvalidAccount);

    auto logs = settlemill::updateOrder(order, static_cast<UpdateOrderMode>(args.mode), args.value);
    for (const auto& line : logs) {
        context.log(line);
    }
    context.writeData(orderAddress, layout::encodeOrder(order));
}

void SettlementProgram::withdrawHostTip(InvokeContext& context)
{
    const Address& admin = context.accountAt(0);
    const Address& globalConfig = context.accountAt(1);
    const Address& pdaAuthority = context.accountAt(2);

    GlobalConfig config = loadGlobalConfig(context, globalConfig);
    requireNoEmergency(config);

    context.requireSigner(admin);
    require(config.adminAuthority == admin, ErrorCode::InvalidAdminAuthority);
    require(config.pdaAuthority == pdaAuthority, ErrorCode::InvalidPdaAuthority);

    Amount hostTip = settlemill::withdrawHostTip(config, lamportsOf(context, pdaAuthority));

    CustodialAuthority(m_programId, globalConfig).pay(context, admin, hostTip);

    config.pdaAuthorityPreviousLamportsBalance = lamportsOf(context, pdaAuthority);
    context.writeData(globalConfig, layout::encodeGlobalConfig(config));
    context.log("Withdrew host tip " + std::to_string(hostTip));
}

void SettlementProgram::logUserSwapBalancesStart(InvokeContext& context, ByteReader& reader)
{
    Address swapProgram = reader.address();

    const Address& maker = context.accountAt(0);
    const Address& inputMint = context.accountAt(1);
    const Address& outputMint = context.accountAt(2);
    const Address& inputAccount = context.accountAt(3);
    const Address& outputAccount = context.accountAt(4);
    const Address& snapshot = context.accountAt(5);

    FlashVerifier verifier(context.transactionInstructions(), context.currentIndex(), m_programId);
    verifier.ensureTopLevel(context.stackHeight());
    const Instruction& end =
        verifier.ensureSwapEndFollows(swapProgram, discriminatorOf(SettlementInstruction::LogUserSwapBalancesEnd));
    ByteReader endReader(end.data);
    Discriminator skipped{};
    endReader.array(skipped);
    require(endReader.address() == swapProgram, ErrorCode::FlashIxsArgsMismatch);

    context.requireSigner(maker);
    (void)tokenProgramOf(context, inputMint);
    (void)tokenProgramOf(context, outputMint);

    require(snapshot == deriveAddress(kLogSwapBalancesTag, {maker}, m_programId), ErrorCode::InvalidAccount);
    context.invoke(native::createAccount(maker, snapshot, context.rentFor(layout::kUserSwapBalancesSize),
                                         layout::kUserSwapBalancesSize, m_programId),
                   {SignerSeeds{kLogSwapBalancesTag, {maker}}});

    UserSwapBalances balances;
    balances.userLamports = context.account(maker).lamports;
    balances.inputBalance = balanceOrZero(context, inputAccount, inputMint, maker);
    balances.outputBalance = balanceOrZero(context, outputAccount, outputMint, maker);
    context.writeData(snapshot, layout::encodeUserSwapBalances(balances));
}

void SettlementProgram::logUserSwapBalancesEnd(InvokeContext& context, ByteReader& reader)
{
    Address swapProgram = reader.address();

    const Address& maker = context.accountAt(0);
    const Address& inputMint = context.accountAt(1);
    const Address& outputMint = context.accountAt(2);
    const Address& inputAccount = context.accountAt(3);
    const Address& outputAccount = context.accountAt(4);
    const Address& snapshot = context.accountAt(5);

    FlashVerifier verifier(context.transactionInstructions(), context.currentIndex(), m_programId);
    verifier.ensureTopLevel(context.stackHeight());
    const Instruction& start = verifier.ensureSwapStartPrecedes(
        swapProgram, discriminatorOf(SettlementInstruction::LogUserSwapBalancesStart));
    ByteReader startReader(start.data);
    Discriminator skipped{};
    startReader.array(skipped);
    require(startReader.address() == swapProgram, ErrorCode::FlashIxsArgsMismatch);

    context.requireSigner(maker);
    require(snapshot == deriveAddress(kLogSwapBalancesTag, {maker}, m_programId), ErrorCode::InvalidAccount);

    const Account& record = context.account(snapshot);
    require(record.owner == m_programId, ErrorCode::InvalidAccount);
    UserSwapBalances before = layout::decodeUserSwapBalances(record.data);

    UserSwapBalances after;
    after.userLamports = context.account(maker).lamports;
    after.inputBalance = balanceOrZero(context, inputAccount, inputMint, maker);
    after.outputBalance = balanceOrZero(context, outputAccount, outputMint, maker);

    context.log("user_lamports_before=" + std::to_string(before.userLamports) +
                " input_ta_balance_before=" + std::to_string(before.inputBalance) +
                " output_ta_balance_before=" + std::to_string(before.outputBalance) +
                " user_lamports_after=" + std::to_string(after.userLamports) +
                " input_ta_balance_after=" + std::to_string(after.inputBalance) +
                " output_ta_balance_after=" + std::to_string(after.outputBalance) +
                " swap_program=" + swapProgram.toHex());

    context.closeAccount(snapshot, maker);
}

void SettlementProgram::assertUserSwapBalancesStart(InvokeContext& context)
{
    const Address& maker = context.accountAt(0);
    const Address& inputAccount = context.accountAt(1);
    const Address& outputAccount = context.accountAt(2);
    const Address& snapshot = context.accountAt(3);

    FlashVerifier verifier(context.transactionInstructions(), context.currentIndex(), m_programId);
    verifier.ensureTopLevel(context.stackHeight());
    verifier.ensureAssertEndFollows(discriminatorOf(SettlementInstruction::AssertUserSwapBalancesStart),
                                    discriminatorOf(SettlementInstruction::AssertUserSwapBalancesEnd));

    context.requireSigner(maker);
    TokenAccount input = token::readTokenAccount(context, inputAccount);
    TokenAccount output = token::readTokenAccount(context, outputAccount);
    require(input.owner == maker && output.owner == maker, ErrorCode::InvalidTokenAuthority);

    require(snapshot == deriveAddress(kAssertSwapBalancesTag, {maker}, m_programId), ErrorCode::InvalidAccount);
    context.invoke(native::createAccount(maker, snapshot, context.rentFor(layout::kUserSwapBalancesSize),
                                         layout::kUserSwapBalancesSize, m_programId),
                   {SignerSeeds{kAssertSwapBalancesTag, {maker}}});

    UserSwapBalances balances;
    balances.userLamports = context.account(maker).lamports;
    balances.inputBalance = input.amount;
    balances.outputBalance = output.amount;
    context.writeData(snapshot, layout::encodeUserSwapBalances(balances));
}

void SettlementProgram::assertUserSwapBalancesEnd(InvokeContext& context, ByteReader& reader)
{
    AssertSwapBalancesEndArgs args = decodeAssertSwapBalancesEndArgs(reader);

    const Address& maker = context.accountAt(0);
    const Address& inputAccount = context.accountAt(1);
    const Address& outputAccount = context.accountAt(2);
    const Address& snapshot = context.accountAt(3);

    FlashVerifier verifier(context.transactionInstructions(), context.currentIndex(), m_programId);
    verifier.ensureTopLevel(context.stackHeight());
    verifier.ensureAssertStartPrecedes(discriminatorOf(SettlementInstruction::AssertUserSwapBalancesStart),
                                       discriminatorOf(SettlementInstruction::AssertUserSwapBalancesEnd));

    context.requireSigner(maker);
    TokenAccount input = token::readTokenAccount(context, inputAccount);
    TokenAccount output = token::readTokenAccount(context, outputAccount);
    require(input.owner == maker && output.owner == maker, ErrorCode::InvalidTokenAuthority);

    require(snapshot == deriveAddress(kAssertSwapBalancesTag, {maker}, m_programId), ErrorCode::InvalidAccount);
    const Account& record = context.account(snapshot);
    require(record.owner == m_programId, ErrorCode::InvalidAccount);
    UserSwapBalances before = layout::decodeUserSwapBalances(record.data);

    UserSwapBalances after;
    after.userLamports = context.account(maker).lamports;
    after.inputBalance = input.amount;
    after.outputBalance = output.amount;
    validateUserSwapBalances(before, after, args.maxInputAmountChange, args.minOutputAmountChange);

    context.closeAccount(snapshot, maker);
}

} // namespace settlemill
