#include "assetprograms.hpp"
#include "codec.hpp"
#include "errors.hpp"
#include "fraction.hpp"
#include "layout.hpp"
#include "programids.hpp"
#include "runtime.hpp"

#include <algorithm>

namespace settlemill {

namespace native {

namespace {

void createAccountInstruction(InvokeContext& context, ByteReader& reader)
{
    Amount lamports = reader.u64();
    uint64_t space = reader.u64();
    Address owner = reader.address();

    const Address& payer = context.accountAt(0);
    const Address& created = context.accountAt(1);
    context.requireSigner(payer);
    context.requireSigner(created);

    if (context.exists(created)) {
        throw SettlementError(ErrorCode::AccountAlreadyInUse, created.shortHex());
    }

    Account& from = context.account(payer);
    if (from.lamports < lamports) {
        throw SettlementError(ErrorCode::InsufficientLamports, payer.shortHex());
    }
    from.lamports -= lamports;

    Account& account = context.accountOrCreate(created);
    account.owner = owner;
    account.lamports = lamports;
    account.data.assign(space, 0);
}

void transferInstruction(InvokeContext& context, ByteReader& reader)
{
    Amount lamports = reader.u64();

    const Address& source = context.accountAt(0);
    const Address& destination = context.accountAt(1);
    context.requireSigner(source);

    if (lamports == 0) {
        return;
    }

    Account& from = context.account(source);
    if (from.owner != systemProgramId() || !from.data.empty()) {
        throw SettlementError(ErrorCode::InvalidAccount, "transfer source must be a plain wallet");
    }
    if (from.lamports < lamports) {
        throw SettlementError(ErrorCode::InsufficientLamports,
                              source.shortHex() + " has " + std::to_string(from.lamports));
    }
    from.lamports -= lamports;

    Account& to = context.accountOrCreate(destination);
    to.lamports = checkedAdd(to.lamports, lamports);
}

} // namespace

void process(InvokeContext& context)
{
    ByteReader reader(context.instruction().data);
    uint32_t tag = reader.u32();
    switch (tag) {
    case kCreateAccount:
        createAccountInstruction(context, reader);
        break;
    case kTransfer:
        transferInstruction(context, reader);
        break;
    default:
        throw SettlementError(ErrorCode::InvalidInstructionData, "system instruction " + std::to_string(tag));
    }
}

Instruction transfer(const Address& from, const Address& to, Amount lamports)
{
    ByteWriter writer;
    writer.u32(kTransfer);
    writer.u64(lamports);
    return Instruction{systemProgramId(), {from, to}, writer.take()};
}

Instruction createAccount(const Address& payer, const Address& account, Amount lamports, uint64_t space,
                          const Address& owner)
{
    ByteWriter writer;
    writer.u32(kCreateAccount);
    writer.u64(lamports);
    writer.u64(space);
    writer.address(owner);
    return Instruction{systemProgramId(), {payer, account}, writer.take()};
}

} // namespace native

namespace token {

namespace {

bool isTokenProgram(const Address& programId)
{
    return programId == tokenProgramId() || programId == token2022ProgramId();
}

void initializeAccountInstruction(InvokeContext& context)
{
    const Address& address = context.accountAt(0);
    const Address& mint = context.accountAt(1);
    const Address& owner = context.accountAt(2);

    const Account& mintAccount = context.account(mint);
    if (mintAccount.owner != context.programId()) {
        throw SettlementError(ErrorCode::InvalidTokenMint, mint.shortHex());
    }
    (void)layout::decodeMint(mintAccount.data);

    const Account& account = context.account(address);
    if (account.owner != context.programId() || account.data.size() != layout::kTokenAccountSize) {
        throw SettlementError(ErrorCode::InvalidAccount, "token account not allocated");
    }
    bool blank = std::all_of(account.data.begin(), account.data.end(), [](uint8_t byte) { return byte == 0; });
    if (!blank) {
        throw SettlementError(ErrorCode::AccountAlreadyInUse, address.shortHex());
    }

    context.writeData(address, layout::encodeTokenAccount(TokenAccount{mint, owner, 0}));
}

void transferInstruction(InvokeContext& context, ByteReader& reader)
{
    Amount amount = reader.u64();

    const Address& source = context.accountAt(0);
    const Address& destination = context.accountAt(1);
    const Address& authority = context.accountAt(2);

    TokenAccount from = readTokenAccount(context, source);
    TokenAccount to = readTokenAccount(context, destination);
    if (context.account(source).owner != context.programId() ||
        context.account(destination).owner != context.programId()) {
        throw SettlementError(ErrorCode::InvalidAccount, "token account belongs to another token program");
    }
    if (from.mint != to.mint) {
        throw SettlementError(ErrorCode::InvalidTokenMint, "transfer between different mints");
    }
    if (from.owner != authority) {
        throw SettlementError(ErrorCode::InvalidTokenAuthority, source.shortHex());
    }
    context.requireSigner(authority);

    if (from.amount < amount) {
        throw SettlementError(ErrorCode::InsufficientTokenBalance,
                              source.shortHex() + " has " + std::to_string(from.amount) + " needs " +
                                  std::to_string(amount));
    }
    if (source == destination) {
        return;
    }

    from.amount -= amount;
    to.amount = checkedAdd(to.amount, amount);
    context.writeData(source, layout::encodeTokenAccount(from));
    context.writeData(destination, layout::encodeTokenAccount(to));
}

} // namespace

void process(InvokeContext& context)
{
    ByteReader reader(context.instruction().data);
    uint8_t tag = reader.u8();
    switch (tag) {
    case kInitializeAccount:
        initializeAccountInstruction(context);
        break;
    case kTransfer:
        transferInstruction(context, reader);
        break;
    default:
        throw SettlementError(ErrorCode::InvalidInstructionData, "token instruction " + std::to_string(tag));
    }
}

Instruction transfer(const Address& tokenProgram, const Address& source, const Address& destination,
                     const Address& authority, Amount amount)
{
    ByteWriter writer;
    writer.u8(kTransfer);
    writer.u64(amount);
    return Instruction{tokenProgram, {source, destination, authority}, writer.take()};
}

Instruction initializeAccount(const Address& tokenProgram, const Address& account, const Address& mint,
                              const Address& owner)
{
    ByteWriter writer;
    writer.u8(kInitializeAccount);
    return Instruction{tokenProgram, {account, mint, owner}, writer.take()};
}

TokenAccount readTokenAccount(const InvokeContext& context, const Address& address)
{
    const Account& account = context.account(address);
    if (!isTokenProgram(account.owner)) {
        throw SettlementError(ErrorCode::InvalidAccount, address.shortHex() + " is not a token account");
    }
    return layout::decodeTokenAccount(account.data);
}

void createMint(Runtime& runtime, const Address& mint, uint8_t decimals, const Address& tokenProgram)
{
    if (runtime.find(mint) != nullptr) {
        throw SettlementError(ErrorCode::AccountAlreadyInUse, mint.shortHex());
    }
    Account account;
    account.owner = tokenProgram;
    account.lamports = runtime.rentFor(layout::kMintSize);
    account.data = layout::encodeMint(Mint{0, decimals});
    runtime.setAccount(mint, std::move(account));
}

void createTokenAccount(Runtime& runtime, const Address& address, const Address& mint, const Address& owner,
                        const Address& tokenProgram)
{
    if (runtime.find(address) != nullptr) {
        throw SettlementError(ErrorCode::AccountAlreadyInUse, address.shortHex());
    }
    const Account* mintAccount = runtime.find(mint);
    if (mintAccount == nullptr || mintAccount->owner != tokenProgram) {
        throw SettlementError(ErrorCode::InvalidTokenMint, mint.shortHex());
    }
    Account account;
    account.owner = tokenProgram;
    account.lamports = runtime.rentFor(layout::kTokenAccountSize);
    account.data = layout::encodeTokenAccount(TokenAccount{mint, owner, 0});
    runtime.setAccount(address, std::move(account));
}

void mintTo(Runtime& runtime, const Address& address, Amount amount)
{
    const Account* existing = runtime.find(address);
    if (existing == nullptr || !isTokenProgram(existing->owner)) {
        throw SettlementError(ErrorCode::InvalidAccount, address.shortHex() + " is not a token account");
    }
    Account account = *existing;
    TokenAccount tokenAccount = layout::decodeTokenAccount(account.data);

    const Account* mintAccount = runtime.find(tokenAccount.mint);
    if (mintAccount == nullptr) {
        throw SettlementError(ErrorCode::InvalidTokenMint, tokenAccount.mint.shortHex());
    }
    Account mintCopy = *mintAccount;
    Mint mint = layout::decodeMint(mintCopy.data);
    mint.supply = checkedAdd(mint.supply, amount);
    mintCopy.data = layout::encodeMint(mint);

    tokenAccount.amount = checkedAdd(tokenAccount.amount, amount);
    account.data = layout::encodeTokenAccount(tokenAccount);

    runtime.setAccount(tokenAccount.mint, std::move(mintCopy));
    runtime.setAccount(address, std::move(account));
}

Amount balanceOf(const Runtime& runtime, const Address& address)
{
    const Account* account = runtime.find(address);
    if (account == nullptr) {
        return 0;
    }
    return layout::decodeTokenAccount(account->data).amount;
}

Address walletAccount(const Address& owner, const Address& mint)
{
    return deriveAddress("token_account", {owner, mint}, associatedTokenProgramId());
}

} // namespace token

} // namespace settlemill
