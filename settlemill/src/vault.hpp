#pragma once

#include "address.hpp"
#include "runtime.hpp"
#include "types.hpp"

namespace settlemill {

// Derived authority of a deployment: signs for every vault and holds tips
class CustodialAuthority {
public:
    CustodialAuthority(const Address& programId, const Address& globalConfig);

    static Address addressFor(const Address& programId, const Address& globalConfig);

    [[nodiscard]] const Address& address() const { return m_address; }
    [[nodiscard]] SignerSeeds seeds() const;

    // Lamports out of the authority, signed by the program
    void pay(InvokeContext& context, const Address& recipient, Amount lamports) const;

private:
    Address m_globalConfig;
    Address m_address;
};

// Per-(config, mint) escrow token account owned by the custodial authority.
// Only moves tokens; all accounting lives with the order and the config.
class EscrowVault {
public:
    EscrowVault(const Address& programId, const Address& globalConfig, const Address& mint);

    static Address addressFor(const Address& programId, const Address& globalConfig, const Address& mint);

    [[nodiscard]] const Address& address() const { return m_address; }

    // Allocates the vault and hands it to the authority
    void initialize(InvokeContext& context, const Address& payer, const Address& tokenProgram,
                    const CustodialAuthority& authority) const;

    // Maker or taker tokens into the vault, signed by their owner
    void deposit(InvokeContext& context, const Address& tokenProgram, const Address& source, const Address& owner,
                 Amount amount) const;

    // Vault tokens out, signed by the authority
    void release(InvokeContext& context, const Address& tokenProgram, const Address& destination,
                 const CustodialAuthority& authority, Amount amount) const;

private:
    Address m_globalConfig;
    Address m_mint;
    Address m_address;
};

} // namespace settlemill
