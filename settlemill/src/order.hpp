#pragma once

#include "address.hpp"
#include "types.hpp"

#include <array>

namespace settlemill {

// Order record. Reserved bytes keep their on-record values across rewrites.
struct Order {
    Address globalConfig;
    Address maker;

    Address inputMint;
    Address inputMintProgramId;
    Address outputMint;
    Address outputMintProgramId;

    Amount initialInputAmount = 0;
    Amount expectedOutputAmount = 0;
    Amount remainingInputAmount = 0;
    Amount filledOutputAmount = 0;
    Amount tipAmount = 0; // Accrued maker-side tip
    uint64_t numberOfFills = 0;

    uint8_t orderType = 0;
    uint8_t status = 0;
    uint8_t reserved0 = 0;
    uint8_t flashIxLock = 0;
    uint8_t permissionless = 0;
    std::array<uint8_t, 3> padding0{};

    uint64_t lastUpdatedTimestamp = 0;

    // Taker output balance snapshot, only meaningful during a flash fill
    Amount flashStartTakerOutputBalance = 0;

    Address counterparty; // Zero = any taker

    std::array<uint64_t, 15> padding{};

    [[nodiscard]] OrderStatus orderStatus() const { return static_cast<OrderStatus>(status); }
    [[nodiscard]] bool isActive() const { return orderStatus() == OrderStatus::Active; }
    [[nodiscard]] bool isLocked() const { return flashIxLock != 0; }
};

// Per-deployment configuration and tip accounting totals
struct GlobalConfig {
    uint8_t emergencyMode = 0;
    uint8_t flashTakeOrderBlocked = 0;
    uint8_t newOrdersBlocked = 0;
    uint8_t ordersTakingBlocked = 0;

    Bps hostFeeBps = 0;

    std::array<uint8_t, 2> padding0{};
    uint64_t orderCloseDelaySeconds = 0;
    std::array<uint64_t, 9> padding1{};

    // Last observed lamports of the custodial authority
    Amount pdaAuthorityPreviousLamportsBalance = 0;
    Amount totalTipAmount = 0;
    Amount hostTipAmount = 0;

    Address pdaAuthority;
    uint64_t reserved0 = 0;
    Address adminAuthority;
    Address adminAuthorityCached; // Staged for two-step rotation
    Amount txnFeeCost = 0;
    Amount ataCreationCost = 0;

    std::array<uint64_t, 241> padding2{};
};

// Balances recorded by a *_start bracketing instruction
struct UserSwapBalances {
    Amount userLamports = 0;
    Amount inputBalance = 0;
    Amount outputBalance = 0;
};

struct TokenAccount {
    Address mint;
    Address owner;
    Amount amount = 0;
};

struct Mint {
    Amount supply = 0;
    uint8_t decimals = 0;
};

// Result of a fill computation; drives the transfers, never persisted
struct TakeOrderEffects {
    Amount inputToSendToTaker = 0;
    Amount outputToSendToMaker = 0;
};

struct TipSplit {
    Amount hostTip = 0;
    Amount makerTip = 0;
};

} // namespace settlemill
