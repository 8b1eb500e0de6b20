#include "../src/layout.hpp"
#include "../src/errors.hpp"
#include <gtest/gtest.h>

#include <algorithm>

using namespace settlemill;

TEST(LayoutTest, RecordSizesMatchFixedLayouts)
{
    EXPECT_EQ(layout::kOrderSize, layout::encodeOrder(Order{}).size());
    EXPECT_EQ(layout::kGlobalConfigSize, layout::encodeGlobalConfig(GlobalConfig{}).size());
    EXPECT_EQ(layout::kUserSwapBalancesSize, layout::encodeUserSwapBalances(UserSwapBalances{}).size());
    EXPECT_EQ(layout::kTokenAccountSize, layout::encodeTokenAccount(TokenAccount{}).size());
    EXPECT_EQ(layout::kMintSize, layout::encodeMint(Mint{}).size());
}

TEST(LayoutTest, RecordsStartWithTheirDiscriminator)
{
    Bytes data = layout::encodeOrder(Order{});
    EXPECT_TRUE(std::equal(layout::orderDiscriminator().begin(), layout::orderDiscriminator().end(), data.begin()));
    EXPECT_NE(layout::orderDiscriminator(), layout::globalConfigDiscriminator());
    EXPECT_NE(layout::orderDiscriminator(), layout::userSwapBalancesDiscriminator());
}

TEST(LayoutTest, OrderFieldOffsets)
{
    Order order;
    order.initialInputAmount = 0x0102030405060708ULL;
    order.status = static_cast<uint8_t>(OrderStatus::Filled);
    order.flashIxLock = 1;
    Bytes data = layout::encodeOrder(order);

    // Discriminator, then six addresses
    EXPECT_EQ(0x08, data[200]);
    EXPECT_EQ(0x01, data[207]);
    // Six amounts, then type and status
    EXPECT_EQ(1, data[249]);
    EXPECT_EQ(1, data[251]);
}

TEST(LayoutTest, ReservedBytesSurviveRewrite)
{
    Order order;
    order.maker = Address::fromLabel("maker");
    order.padding[3] = 0xdeadbeef;
    order.padding0[1] = 7;
    order.reserved0 = 9;

    Order decoded = layout::decodeOrder(layout::encodeOrder(order));
    EXPECT_EQ(0xdeadbeefULL, decoded.padding[3]);
    EXPECT_EQ(7, decoded.padding0[1]);
    EXPECT_EQ(9, decoded.reserved0);
    EXPECT_EQ(order.maker, decoded.maker);

    GlobalConfig config;
    config.padding2[240] = 42;
    config.padding1[0] = 11;
    config.hostFeeBps = 250;
    GlobalConfig decodedConfig = layout::decodeGlobalConfig(layout::encodeGlobalConfig(config));
    EXPECT_EQ(42u, decodedConfig.padding2[240]);
    EXPECT_EQ(11u, decodedConfig.padding1[0]);
    EXPECT_EQ(250, decodedConfig.hostFeeBps);
}

TEST(LayoutTest, RejectsWrongSizeOrDiscriminator)
{
    Bytes config = layout::encodeGlobalConfig(GlobalConfig{});
    EXPECT_THROW(layout::decodeOrder(config), SettlementError);

    Bytes order = layout::encodeOrder(Order{});
    order[0] ^= 0xff;
    try {
        layout::decodeOrder(order);
        FAIL() << "expected InvalidAccount";
    } catch (const SettlementError& error) {
        EXPECT_EQ(ErrorCode::InvalidAccount, error.code());
    }

    EXPECT_THROW(layout::decodeTokenAccount(Bytes(71, 0)), SettlementError);
    EXPECT_THROW(layout::decodeMint(Bytes{}), SettlementError);
}
