#pragma once

#include "order.hpp"
#include "types.hpp"

namespace settlemill {

// Fails with SwapBalanceAssertionFailed when the input balance fell by more
// than maxInputAmountChange or the output balance rose by less than
// minOutputAmountChange between the two snapshots
void validateUserSwapBalances(const UserSwapBalances& before, const UserSwapBalances& after,
                              Amount maxInputAmountChange, Amount minOutputAmountChange);

} // namespace settlemill
