#pragma once

#include "codec.hpp"
#include "order.hpp"
#include "types.hpp"

#include <cstddef>

namespace settlemill::layout {

// Fixed record sizes, discriminator included
constexpr size_t kOrderSize = 424;
constexpr size_t kGlobalConfigSize = 2168;
constexpr size_t kUserSwapBalancesSize = 32;
constexpr size_t kTokenAccountSize = 72;
constexpr size_t kMintSize = 9;

const Discriminator& orderDiscriminator();
const Discriminator& globalConfigDiscriminator();
const Discriminator& userSwapBalancesDiscriminator();

Bytes encodeOrder(const Order& order);
Order decodeOrder(const Bytes& data);

Bytes encodeGlobalConfig(const GlobalConfig& config);
GlobalConfig decodeGlobalConfig(const Bytes& data);

Bytes encodeUserSwapBalances(const UserSwapBalances& balances);
UserSwapBalances decodeUserSwapBalances(const Bytes& data);

// Token program records carry no discriminator
Bytes encodeTokenAccount(const TokenAccount& account);
TokenAccount decodeTokenAccount(const Bytes& data);

Bytes encodeMint(const Mint& mint);
Mint decodeMint(const Bytes& data);

} // namespace settlemill::layout
