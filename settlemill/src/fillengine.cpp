#include "fillengine.hpp"
#include "errors.hpp"
#include "fraction.hpp"
#include "ledger.hpp"

#include <algorithm>

namespace settlemill {

TakeOrderEffects computeFill(const Order& order, Amount inputAmount, Amount desiredOutputAmount)
{
    require(inputAmount > 0, ErrorCode::OrderInputAmountInvalid);
    require(order.isActive(), ErrorCode::OrderNotActive);
    require(inputAmount <= order.remainingInputAmount, ErrorCode::OrderInputAmountTooLarge);

    Amount minimumOutput = mulDivCeil(inputAmount, order.expectedOutputAmount, order.initialInputAmount);
    if (desiredOutputAmount < minimumOutput) {
        throw SettlementError(ErrorCode::OrderOutputAmountInvalid,
                              "output_amount=" + std::to_string(desiredOutputAmount) +
                                  " minimum_output_to_send_to_maker=" + std::to_string(minimumOutput));
    }

    TakeOrderEffects effects;
    effects.inputToSendToTaker = inputAmount;
    effects.outputToSendToMaker = desiredOutputAmount;
    return effects;
}

void applyFill(GlobalConfig& config, Order& order, const TakeOrderEffects& effects, Amount tipAmount,
               Timestamp now)
{
    order.remainingInputAmount = checkedSub(order.remainingInputAmount, effects.inputToSendToTaker);
    order.filledOutputAmount = checkedAdd(order.filledOutputAmount, effects.outputToSendToMaker);

    TipSplit split = splitTip(config, tipAmount);
    config.hostTipAmount = checkedAdd(config.hostTipAmount, split.hostTip);
    order.tipAmount = checkedAdd(order.tipAmount, split.makerTip);
    config.totalTipAmount = checkedAdd(config.totalTipAmount, tipAmount);

    order.numberOfFills = checkedAdd(order.numberOfFills, 1);

    if (order.remainingInputAmount == 0 && order.filledOutputAmount >= order.expectedOutputAmount) {
        order.status = static_cast<uint8_t>(OrderStatus::Filled);
    }

    require(now >= 0, ErrorCode::IntegerOverflow);
    order.lastUpdatedTimestamp = static_cast<uint64_t>(now);
}

TakeOrderEffects takeOrder(GlobalConfig& config, Order& order, Amount inputAmount, Amount outputAmount,
                           Amount tipAmount, Timestamp now)
{
    require(!order.isLocked(), ErrorCode::OrderWithinFlashOperation);

    TakeOrderEffects effects = computeFill(order, inputAmount, outputAmount);
    applyFill(config, order, effects, tipAmount, now);
    return effects;
}

TakeOrderEffects flashWithdrawOrderInput(Order& order, Amount inputAmount, Amount outputAmount)
{
    TakeOrderEffects effects = computeFill(order, inputAmount, outputAmount);
    require(!order.isLocked(), ErrorCode::OrderWithinFlashOperation);

    order.flashIxLock = 1;
    return effects;
}

TakeOrderEffects flashPayOrderOutput(GlobalConfig& config, Order& order, Amount inputAmount, Amount outputAmount,
                                     Amount tipAmount, Timestamp now)
{
    TakeOrderEffects effects = computeFill(order, inputAmount, outputAmount);
    require(order.isLocked(), ErrorCode::OrderNotWithinFlashOperation);

    applyFill(config, order, effects, tipAmount, now);
    order.flashIxLock = 0;
    return effects;
}

Amount flashEndOutputAmount(Amount startBalance, Amount currentBalance, Amount minOutputAmount)
{
    // A balance that fell since start is an overflow, not a zero gain
    Amount gain = checkedSub(currentBalance, startBalance);
    if (gain == 0) {
        return minOutputAmount;
    }
    return std::min(gain, minOutputAmount);
}

} // namespace settlemill
