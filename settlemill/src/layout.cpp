#include "layout.hpp"
#include "errors.hpp"

namespace settlemill::layout {

namespace {

void expectRecord(const Bytes& data, size_t size, const Discriminator& discriminator, ByteReader& reader)
{
    if (data.size() != size) {
        throw SettlementError(ErrorCode::InvalidAccount, "record size " + std::to_string(data.size()));
    }
    Discriminator stored{};
    reader.array(stored);
    if (stored != discriminator) {
        throw SettlementError(ErrorCode::InvalidAccount, "record discriminator mismatch");
    }
}

} // namespace

const Discriminator& orderDiscriminator()
{
    static const Discriminator discriminator = makeDiscriminator("account:Order");
    return discriminator;
}

const Discriminator& globalConfigDiscriminator()
{
    static const Discriminator discriminator = makeDiscriminator("account:GlobalConfig");
    return discriminator;
}

const Discriminator& userSwapBalancesDiscriminator()
{
    static const Discriminator discriminator = makeDiscriminator("account:UserSwapBalancesState");
    return discriminator;
}

Bytes encodeOrder(const Order& order)
{
    ByteWriter writer;
    writer.array(orderDiscriminator());
    writer.address(order.globalConfig);
    writer.address(order.maker);
    writer.address(order.inputMint);
    writer.address(order.inputMintProgramId);
    writer.address(order.outputMint);
    writer.address(order.outputMintProgramId);
    writer.u64(order.initialInputAmount);
    writer.u64(order.expectedOutputAmount);
    writer.u64(order.remainingInputAmount);
    writer.u64(order.filledOutputAmount);
    writer.u64(order.tipAmount);
    writer.u64(order.numberOfFills);
    writer.u8(order.orderType);
    writer.u8(order.status);
    writer.u8(order.reserved0);
    writer.u8(order.flashIxLock);
    writer.u8(order.permissionless);
    writer.array(order.padding0);
    writer.u64(order.lastUpdatedTimestamp);
    writer.u64(order.flashStartTakerOutputBalance);
    writer.address(order.counterparty);
    writer.array(order.padding);
    return writer.take();
}

Order decodeOrder(const Bytes& data)
{
    ByteReader reader(data);
    expectRecord(data, kOrderSize, orderDiscriminator(), reader);

    Order order;
    order.globalConfig = reader.address();
    order.maker = reader.address();
    order.inputMint = reader.address();
    order.inputMintProgramId = reader.address();
    order.outputMint = reader.address();
    order.outputMintProgramId = reader.address();
    order.initialInputAmount = reader.u64();
    order.expectedOutputAmount = reader.u64();
    order.remainingInputAmount = reader.u64();
    order.filledOutputAmount = reader.u64();
    order.tipAmount = reader.u64();
    order.numberOfFills = reader.u64();
    order.orderType = reader.u8();
    order.status = reader.u8();
    order.reserved0 = reader.u8();
    order.flashIxLock = reader.u8();
    order.permissionless = reader.u8();
    reader.array(order.padding0);
    order.lastUpdatedTimestamp = reader.u64();
    order.flashStartTakerOutputBalance = reader.u64();
    order.counterparty = reader.address();
    reader.array(order.padding);
    return order;
}

Bytes encodeGlobalConfig(const GlobalConfig& config)
{
    ByteWriter writer;
    writer.array(globalConfigDiscriminator());
    writer.u8(config.emergencyMode);
    writer.u8(config.flashTakeOrderBlocked);
    writer.u8(config.newOrdersBlocked);
    writer.u8(config.ordersTakingBlocked);
    writer.u16(config.hostFeeBps);
    writer.array(config.padding0);
    writer.u64(config.orderCloseDelaySeconds);
    writer.array(config.padding1);
    writer.u64(config.pdaAuthorityPreviousLamportsBalance);
    writer.u64(config.totalTipAmount);
    writer.u64(config.hostTipAmount);
    writer.address(config.pdaAuthority);
    writer.u64(config.reserved0);
    writer.address(config.adminAuthority);
    writer.address(config.adminAuthorityCached);
    writer.u64(config.txnFeeCost);
    writer.u64(config.ataCreationCost);
    writer.array(config.padding2);
    return writer.take();
}

GlobalConfig decodeGlobalConfig(const Bytes& data)
{
    ByteReader reader(data);
    expectRecord(data, kGlobalConfigSize, globalConfigDiscriminator(), reader);

    GlobalConfig config;
    config.emergencyMode = reader.u8();
    config.flashTakeOrderBlocked = reader.u8();
    config.newOrdersBlocked = reader.u8();
    config.ordersTakingBlocked = reader.u8();
    config.hostFeeBps = reader.u16();
    reader.array(config.padding0);
    config.orderCloseDelaySeconds = reader.u64();
    reader.array(config.padding1);
    config.pdaAuthorityPreviousLamportsBalance = reader.u64();
    config.totalTipAmount = reader.u64();
    config.hostTipAmount = reader.u64();
    config.pdaAuthority = reader.address();
    config.reserved0 = reader.u64();
    config.adminAuthority = reader.address();
    config.adminAuthorityCached = reader.address();
    config.txnFeeCost = reader.u64();
    config.ataCreationCost = reader.u64();
    reader.array(config.padding2);
    return config;
}

Bytes encodeUserSwapBalances(const UserSwapBalances& balances)
{
    ByteWriter writer;
    writer.array(userSwapBalancesDiscriminator());
    writer.u64(balances.userLamports);
    writer.u64(balances.inputBalance);
    writer.u64(balances.outputBalance);
    return writer.take();
}

UserSwapBalances decodeUserSwapBalances(const Bytes& data)
{
    ByteReader reader(data);
    expectRecord(data, kUserSwapBalancesSize, userSwapBalancesDiscriminator(), reader);

    UserSwapBalances balances;
    balances.userLamports = reader.u64();
    balances.inputBalance = reader.u64();
    balances.outputBalance = reader.u64();
    return balances;
}

Bytes encodeTokenAccount(const TokenAccount& account)
{
    ByteWriter writer;
    writer.address(account.mint);
    writer.address(account.owner);
    writer.u64(account.amount);
    return writer.take();
}

TokenAccount decodeTokenAccount(const Bytes& data)
{
    if (data.size() != kTokenAccountSize) {
        throw SettlementError(ErrorCode::InvalidAccount, "not a token account");
    }
    ByteReader reader(data);
    TokenAccount account;
    account.mint = reader.address();
    account.owner = reader.address();
    account.amount = reader.u64();
    return account;
}

Bytes encodeMint(const Mint& mint)
{
    ByteWriter writer;
    writer.u64(mint.supply);
    writer.u8(mint.decimals);
    return writer.take();
}

Mint decodeMint(const Bytes& data)
{
    if (data.size() != kMintSize) {
        throw SettlementError(ErrorCode::InvalidAccount, "not a mint");
    }
    ByteReader reader(data);
    Mint mint;
    mint.supply = reader.u64();
    mint.decimals = reader.u8();
    return mint;
}

} // namespace settlemill::layout
