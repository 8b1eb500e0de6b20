#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace settlemill {

// Strong typedefs for domain clarity
using Amount = uint64_t;     // Token base units or lamports
using Timestamp = int64_t;   // Unix seconds
using Bps = uint16_t;        // Basis points, 10000 = 100%
using Bytes = std::vector<uint8_t>;

constexpr Bps kMaxBps = 10000;

// Call-stack height of a top-level transaction instruction
constexpr int kTransactionLevelStackHeight = 1;

// Size of the fixed value buffer carried by update_global_config
constexpr size_t kUpdateGlobalConfigValueSize = 128;

// Order status (one-directional: Active -> Filled | Cancelled)
enum class OrderStatus : uint8_t { Active = 0, Filled = 1, Cancelled = 2 };

// Order type
enum class OrderType : uint8_t { Vanilla = 0 };

enum class UpdateGlobalConfigMode : uint16_t {
    EmergencyMode = 0,
    FlashTakeOrderBlocked = 1,
    BlockNewOrders = 2,
    BlockOrderTaking = 3,
    HostFeeBps = 4,
    AdminAuthorityCached = 5,
    OrderTakingPermissionless = 6, // Deprecated, accepted and ignored
    OrderCloseDelaySeconds = 7,
    TxnFeeCost = 8,
    AtaCreationCost = 9
};

enum class UpdateOrderMode : uint16_t { Permissionless = 0, Counterparty = 1 };

} // namespace settlemill
