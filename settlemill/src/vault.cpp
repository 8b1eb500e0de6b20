#include "vault.hpp"
#include "assetprograms.hpp"
#include "layout.hpp"

namespace settlemill {

namespace {

constexpr const char* kAuthorityTag = "authority";
constexpr const char* kVaultTag = "escrow_vault";

} // namespace

CustodialAuthority::CustodialAuthority(const Address& programId, const Address& globalConfig)
    : m_globalConfig(globalConfig), m_address(addressFor(programId, globalConfig))
{
}

Address CustodialAuthority::addressFor(const Address& programId, const Address& globalConfig)
{
    return deriveAddress(kAuthorityTag, {globalConfig}, programId);
}

SignerSeeds CustodialAuthority::seeds() const { return SignerSeeds{kAuthorityTag, {m_globalConfig}}; }

void CustodialAuthority::pay(InvokeContext& context, const Address& recipient, Amount lamports) const
{
    if (lamports == 0) {
        return;
    }
    context.invoke(native::transfer(m_address, recipient, lamports), {seeds()});
}

EscrowVault::EscrowVault(const Address& programId, const Address& globalConfig, const Address& mint)
    : m_globalConfig(globalConfig), m_mint(mint), m_address(addressFor(programId, globalConfig, mint))
{
}

Address EscrowVault::addressFor(const Address& programId, const Address& globalConfig, const Address& mint)
{
    return deriveAddress(kVaultTag, {globalConfig, mint}, programId);
}

void EscrowVault::initialize(InvokeContext& context, const Address& payer, const Address& tokenProgram,
                             const CustodialAuthority& authority) const
{
    SignerSeeds vaultSeeds{kVaultTag, {m_globalConfig, m_mint}};
    context.invoke(native::createAccount(payer, m_address, context.rentFor(layout::kTokenAccountSize),
                                         layout::kTokenAccountSize, tokenProgram),
                   {vaultSeeds});
    context.invoke(token::initializeAccount(tokenProgram, m_address, m_mint, authority.address()));
}

void EscrowVault::deposit(InvokeContext& context, const Address& tokenProgram, const Address& source,
                          const Address& owner, Amount amount) const
{
    context.invoke(token::transfer(tokenProgram, source, m_address, owner, amount));
}

void EscrowVault::release(InvokeContext& context, const Address& tokenProgram, const Address& destination,
                          const CustodialAuthority& authority, Amount amount) const
{
    if (amount == 0) {
        return;
    }
    context.invoke(token::transfer(tokenProgram, m_address, destination, authority.address(), amount),
                   {authority.seeds()});
}

} // namespace settlemill
