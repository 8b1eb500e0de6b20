#pragma once

#include "address.hpp"
#include "instruction.hpp"
#include "order.hpp"
#include "types.hpp"

namespace settlemill {

class InvokeContext;
class Runtime;

namespace native {

constexpr uint32_t kCreateAccount = 0;
constexpr uint32_t kTransfer = 2;

// System program: lamport transfers and account creation
void process(InvokeContext& context);

Instruction transfer(const Address& from, const Address& to, Amount lamports);
Instruction createAccount(const Address& payer, const Address& account, Amount lamports, uint64_t space,
                          const Address& owner);

} // namespace native

namespace token {

constexpr uint8_t kInitializeAccount = 1;
constexpr uint8_t kTransfer = 3;

// Token program; serves both the classic and the 2022 program ids
void process(InvokeContext& context);

Instruction transfer(const Address& tokenProgram, const Address& source, const Address& destination,
                     const Address& authority, Amount amount);
Instruction initializeAccount(const Address& tokenProgram, const Address& account, const Address& mint,
                              const Address& owner);

// Decodes a token account owned by one of the token programs
[[nodiscard]] TokenAccount readTokenAccount(const InvokeContext& context, const Address& address);

// Host-side setup helpers
void createMint(Runtime& runtime, const Address& mint, uint8_t decimals, const Address& tokenProgram);
void createTokenAccount(Runtime& runtime, const Address& account, const Address& mint, const Address& owner,
                        const Address& tokenProgram);
void mintTo(Runtime& runtime, const Address& account, Amount amount);
[[nodiscard]] Amount balanceOf(const Runtime& runtime, const Address& account);

// Canonical wallet token account of owner for mint
[[nodiscard]] Address walletAccount(const Address& owner, const Address& mint);

} // namespace token

} // namespace settlemill
