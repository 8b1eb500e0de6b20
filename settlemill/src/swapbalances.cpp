#include "swapbalances.hpp"
#include "errors.hpp"

namespace settlemill {

void validateUserSwapBalances(const UserSwapBalances& before, const UserSwapBalances& after,
                              Amount maxInputAmountChange, Amount minOutputAmountChange)
{
    if (after.inputBalance < before.inputBalance) {
        Amount spent = before.inputBalance - after.inputBalance;
        if (spent > maxInputAmountChange) {
            throw SettlementError(ErrorCode::SwapBalanceAssertionFailed,
                                  "input spent " + std::to_string(spent) + " > max " +
                                      std::to_string(maxInputAmountChange));
        }
    }

    Amount received = after.outputBalance > before.outputBalance ? after.outputBalance - before.outputBalance : 0;
    if (received < minOutputAmountChange) {
        throw SettlementError(ErrorCode::SwapBalanceAssertionFailed,
                              "output received " + std::to_string(received) + " < min " +
                                  std::to_string(minOutputAmountChange));
    }
}

} // namespace settlemill
