#pragma once

#include "address.hpp"
#include "order.hpp"
#include "types.hpp"

#include <string>
#include <vector>

namespace settlemill {

struct OrderTerms {
    Address inputMint;
    Address inputMintProgramId;
    Address outputMint;
    Address outputMintProgramId;
    Amount inputAmount = 0;
    Amount outputAmount = 0;
    uint8_t orderType = 0;
};

// Initializes a zeroed order record as Active
void createOrder(Order& order, const Address& globalConfig, const Address& maker, const OrderTerms& terms,
                 Timestamp now);

// Sets the permissionless flag (1-byte value) or the counterparty (32-byte value).
// Returns the log lines describing the change.
std::vector<std::string> updateOrder(Order& order, UpdateOrderMode mode, const Bytes& value);

// Moves an Active or Filled order to Cancelled once the close delay elapsed
// and removes its accrued tip from the global total
void closeOrder(Order& order, GlobalConfig& config, Timestamp now);

// A zero counterparty admits any taker
[[nodiscard]] bool isCounterpartyMatching(const Order& order, const Address& taker);

} // namespace settlemill
