#include "../src/swapbalances.hpp"
#include "../src/errors.hpp"
#include <gtest/gtest.h>

using namespace settlemill;

TEST(SwapBalancesTest, WithinBoundsPasses)
{
    UserSwapBalances before{5000, 1000, 10};
    UserSwapBalances after{4000, 600, 310};
    EXPECT_NO_THROW(validateUserSwapBalances(before, after, 400, 300));
}

TEST(SwapBalancesTest, InputGrowthIsNeverASpend)
{
    UserSwapBalances before{0, 100, 0};
    UserSwapBalances after{0, 900, 50};
    EXPECT_NO_THROW(validateUserSwapBalances(before, after, 0, 50));
}

TEST(SwapBalancesTest, OverspentInputFails)
{
    UserSwapBalances before{0, 1000, 0};
    UserSwapBalances after{0, 599, 300};
    try {
        validateUserSwapBalances(before, after, 400, 300);
        FAIL() << "expected SwapBalanceAssertionFailed";
    } catch (const SettlementError& error) {
        EXPECT_EQ(ErrorCode::SwapBalanceAssertionFailed, error.code());
    }
}

TEST(SwapBalancesTest, ShortOutputFails)
{
    UserSwapBalances before{0, 1000, 500};
    UserSwapBalances after{0, 1000, 400};
    EXPECT_THROW(validateUserSwapBalances(before, after, 0, 1), SettlementError);
}
