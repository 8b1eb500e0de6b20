#pragma once

#include "order.hpp"
#include "types.hpp"

namespace settlemill {

// Validates a fill request and returns the transfers it implies.
// desiredOutputAmount must already meet the proportional floor
// ceil(inputAmount * expected / initial); nothing is corrected silently.
TakeOrderEffects computeFill(const Order& order, Amount inputAmount, Amount desiredOutputAmount);

// Records a computed fill on the order and the global tip totals
void applyFill(GlobalConfig& config, Order& order, const TakeOrderEffects& effects, Amount tipAmount,
               Timestamp now);

// Single-instruction fill; rejected while a flash fill is outstanding
TakeOrderEffects takeOrder(GlobalConfig& config, Order& order, Amount inputAmount, Amount outputAmount,
                           Amount tipAmount, Timestamp now);

// First half of a flash fill: validates the fill and takes the flash lock.
// Accounting is deferred to flashPayOrderOutput.
TakeOrderEffects flashWithdrawOrderInput(Order& order, Amount inputAmount, Amount outputAmount);

// Second half of a flash fill: applies the fill and releases the lock
TakeOrderEffects flashPayOrderOutput(GlobalConfig& config, Order& order, Amount inputAmount, Amount outputAmount,
                                     Amount tipAmount, Timestamp now);

// Output owed at flash end given the taker's output balance movement.
// A balance that fell since start throws MathOverflow.
[[nodiscard]] Amount flashEndOutputAmount(Amount startBalance, Amount currentBalance, Amount minOutputAmount);

} // namespace settlemill
