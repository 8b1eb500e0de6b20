#include "../src/ledger.hpp"
#include "../src/codec.hpp"
#include "../src/errors.hpp"
#include <gtest/gtest.h>

#include <algorithm>

using namespace settlemill;

namespace {

UpdateGlobalConfigValue valueOf(const Bytes& bytes)
{
    UpdateGlobalConfigValue value{};
    std::copy(bytes.begin(), bytes.end(), value.begin());
    return value;
}

UpdateGlobalConfigValue u8Value(uint8_t byte) { return valueOf(Bytes{byte}); }

UpdateGlobalConfigValue u64ValueOf(uint64_t number)
{
    ByteWriter writer;
    writer.u64(number);
    return valueOf(writer.bytes());
}

} // namespace

class LedgerTest : public ::testing::Test {
protected:
    GlobalConfig config;
    Address admin = Address::fromLabel("admin");
    Address authority = Address::fromLabel("authority");

    void SetUp() override { initializeGlobalConfig(config, admin, authority, 1000); }

    template <typename Call>
    static ErrorCode codeOf(Call call)
    {
        try {
            call();
        } catch (const SettlementError& error) {
            return error.code();
        }
        ADD_FAILURE() << "expected a SettlementError";
        return ErrorCode::InvalidAccount;
    }
};

TEST_F(LedgerTest, InitializeSetsAuthorities)
{
    EXPECT_EQ(admin, config.adminAuthority);
    EXPECT_EQ(admin, config.adminAuthorityCached);
    EXPECT_EQ(authority, config.pdaAuthority);
    EXPECT_EQ(1000u, config.pdaAuthorityPreviousLamportsBalance);
    EXPECT_EQ(0, config.emergencyMode);
}

TEST_F(LedgerTest, SplitTipSumsToTip)
{
    for (Bps bps : {0, 1, 250, 3333, 9999, 10000}) {
        config.hostFeeBps = bps;
        for (Amount tip : {0ULL, 1ULL, 7ULL, 101ULL, 1000000007ULL}) {
            auto split = splitTip(config, tip);
            EXPECT_EQ(tip, split.hostTip + split.makerTip) << "bps=" << bps << " tip=" << tip;
        }
    }

    config.hostFeeBps = 250;
    auto split = splitTip(config, 101);
    EXPECT_EQ(3u, split.hostTip);
    EXPECT_EQ(98u, split.makerTip);
}

TEST_F(LedgerTest, ReconcileAcceptsCoveredTip)
{
    config.totalTipAmount = 100;
    reconcileAuthorityBalance(config, 1100, 100);
    EXPECT_EQ(1100u, config.pdaAuthorityPreviousLamportsBalance);
}

TEST_F(LedgerTest, ReconcileRejectsShortDelta)
{
    EXPECT_EQ(ErrorCode::InvalidTipTransferAmount, codeOf([&] { reconcileAuthorityBalance(config, 1050, 100); }));
    EXPECT_EQ(ErrorCode::InvalidTipTransferAmount, codeOf([&] { reconcileAuthorityBalance(config, 900, 0); }));
    EXPECT_EQ(1000u, config.pdaAuthorityPreviousLamportsBalance);
}

TEST_F(LedgerTest, ReconcileRejectsBalanceBelowTotalTips)
{
    config.totalTipAmount = 5000;
    EXPECT_EQ(ErrorCode::InvalidTipBalance, codeOf([&] { reconcileAuthorityBalance(config, 1100, 100); }));
}

TEST_F(LedgerTest, WithdrawHostTip)
{
    config.hostTipAmount = 30;
    config.totalTipAmount = 130;

    EXPECT_EQ(30u, withdrawHostTip(config, 1130));
    EXPECT_EQ(0u, config.hostTipAmount);
    EXPECT_EQ(100u, config.totalTipAmount);

    config.hostTipAmount = 2000;
    config.totalTipAmount = 2000;
    EXPECT_EQ(ErrorCode::InvalidHostTipBalance, codeOf([&] { (void)withdrawHostTip(config, 1000); }));
}

TEST_F(LedgerTest, UpdateFlagLogsChange)
{
    auto logs = updateGlobalConfig(config, UpdateGlobalConfigMode::BlockNewOrders, u8Value(1), 77);
    EXPECT_EQ(1, config.newOrdersBlocked);
    ASSERT_EQ(2u, logs.size());
    EXPECT_EQ("update_global_config mode=UpdateBlockNewOrders ts=77", logs[0]);
    EXPECT_EQ("new=1 prev=0", logs[1]);
}

TEST_F(LedgerTest, UpdateRejectsBadFlagAndFee)
{
    EXPECT_EQ(ErrorCode::InvalidFlag,
              codeOf([&] { (void)updateGlobalConfig(config, UpdateGlobalConfigMode::EmergencyMode, u8Value(2), 0); }));

    ByteWriter writer;
    writer.u16(10001);
    EXPECT_EQ(ErrorCode::InvalidHostFee, codeOf([&] {
                  (void)updateGlobalConfig(config, UpdateGlobalConfigMode::HostFeeBps, valueOf(writer.bytes()), 0);
              }));

    EXPECT_EQ(ErrorCode::InvalidConfigOption,
              codeOf([&] { (void)updateGlobalConfig(config, static_cast<UpdateGlobalConfigMode>(42), u8Value(0), 0); }));
}

TEST_F(LedgerTest, UpdateAmountsAndCachedAdmin)
{
    updateGlobalConfig(config, UpdateGlobalConfigMode::OrderCloseDelaySeconds, u64ValueOf(3600), 0);
    updateGlobalConfig(config, UpdateGlobalConfigMode::TxnFeeCost, u64ValueOf(5000), 0);
    updateGlobalConfig(config, UpdateGlobalConfigMode::AtaCreationCost, u64ValueOf(2039280), 0);
    EXPECT_EQ(3600u, config.orderCloseDelaySeconds);
    EXPECT_EQ(5000u, config.txnFeeCost);
    EXPECT_EQ(2039280u, config.ataCreationCost);

    Address next = Address::fromLabel("next-admin");
    ByteWriter writer;
    writer.address(next);
    updateGlobalConfig(config, UpdateGlobalConfigMode::AdminAuthorityCached, valueOf(writer.bytes()), 0);
    EXPECT_EQ(admin, config.adminAuthority);
    EXPECT_EQ(next, config.adminAuthorityCached);

    promoteCachedAdmin(config);
    EXPECT_EQ(next, config.adminAuthority);
}

TEST_F(LedgerTest, DeprecatedModeIsAcceptedAndIgnored)
{
    GlobalConfig before = config;
    auto logs = updateGlobalConfig(config, UpdateGlobalConfigMode::OrderTakingPermissionless, u8Value(1), 0);
    ASSERT_EQ(2u, logs.size());
    EXPECT_EQ("Field deprecated", logs[1]);
    EXPECT_EQ(before.ordersTakingBlocked, config.ordersTakingBlocked);
}
