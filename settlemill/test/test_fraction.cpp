#include "../src/fraction.hpp"
#include <gtest/gtest.h>

#include <limits>

using namespace settlemill;

namespace {

constexpr Amount kMax = std::numeric_limits<Amount>::max();

ErrorCode codeOf(void (*call)())
{
    try {
        call();
    } catch (const SettlementError& error) {
        return error.code();
    }
    ADD_FAILURE() << "expected a SettlementError";
    return ErrorCode::InvalidAccount;
}

} // namespace

TEST(FractionTest, CheckedAddAndSub)
{
    EXPECT_EQ(7u, checkedAdd(3, 4));
    EXPECT_EQ(kMax, checkedAdd(kMax, 0));
    EXPECT_EQ(0u, checkedSub(5, 5));

    EXPECT_EQ(ErrorCode::MathOverflow, codeOf([] { (void)checkedAdd(kMax, 1); }));
    EXPECT_EQ(ErrorCode::MathOverflow, codeOf([] { (void)checkedSub(1, 2); }));
}

TEST(FractionTest, MulDivCeilRoundsUp)
{
    EXPECT_EQ(1000u, mulDivCeil(500, 2000, 1000));
    EXPECT_EQ(1u, mulDivCeil(1, 1, 3));
    EXPECT_EQ(667u, mulDivCeil(1000, 2, 3));
    EXPECT_EQ(0u, mulDivCeil(0, 2000, 1000));
}

TEST(FractionTest, MulDivCeilUsesWideIntermediate)
{
    // The product overflows 64 bits but the quotient does not
    EXPECT_EQ(kMax, mulDivCeil(kMax, kMax, kMax));
    EXPECT_EQ(kMax / 2 + 1, mulDivCeil(kMax, 1, 2));
}

TEST(FractionTest, MulDivCeilRejectsOverflowAndZeroDenominator)
{
    EXPECT_EQ(ErrorCode::MathOverflow, codeOf([] { (void)mulDivCeil(kMax, 2, 1); }));
    EXPECT_EQ(ErrorCode::MathOverflow, codeOf([] { (void)mulDivCeil(1, 1, 0); }));
}

TEST(FractionTest, BpsShare)
{
    EXPECT_EQ(3u, bpsOfCeil(101, 250));
    EXPECT_EQ(0u, bpsOfCeil(101, 0));
    EXPECT_EQ(101u, bpsOfCeil(101, kMaxBps));
    EXPECT_EQ(1u, bpsOfCeil(1, 1));
}
