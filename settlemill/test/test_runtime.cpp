#include "../src/assetprograms.hpp"
#include "../src/programids.hpp"
#include "../src/runtime.hpp"
#include <gtest/gtest.h>

#include <limits>

using namespace settlemill;

class RuntimeTest : public ::testing::Test {
protected:
    Runtime runtime;
    Address alice = Address::fromLabel("alice");
    Address bob = Address::fromLabel("bob");
    Address usdc = Address::fromLabel("usdc");
    Address aliceUsdc = token::walletAccount(alice, usdc);
    Address bobUsdc = token::walletAccount(bob, usdc);

    void SetUp() override
    {
        runtime.airdrop(alice, 1'000'000);
        token::createMint(runtime, usdc, 6, tokenProgramId());
        token::createTokenAccount(runtime, aliceUsdc, usdc, alice, tokenProgramId());
        token::createTokenAccount(runtime, bobUsdc, usdc, bob, tokenProgramId());
        token::mintTo(runtime, aliceUsdc, 500);
    }

    ErrorCode failureOf(const Transaction& transaction)
    {
        try {
            runtime.execute(transaction);
        } catch (const TransactionError& error) {
            return error.code();
        }
        ADD_FAILURE() << "expected the transaction to fail";
        return ErrorCode::InvalidAccount;
    }
};

TEST_F(RuntimeTest, LamportTransfer)
{
    runtime.execute(Transaction{{native::transfer(alice, bob, 400)}, {alice}});
    EXPECT_EQ(999'600u, runtime.lamports(alice));
    EXPECT_EQ(400u, runtime.lamports(bob));
}

TEST_F(RuntimeTest, TransferNeedsSignatureAndFunds)
{
    EXPECT_EQ(ErrorCode::MissingSigner, failureOf(Transaction{{native::transfer(alice, bob, 1)}, {}}));
    EXPECT_EQ(ErrorCode::InsufficientLamports,
              failureOf(Transaction{{native::transfer(alice, bob, 2'000'000)}, {alice}}));
}

TEST_F(RuntimeTest, TokenTransfer)
{
    runtime.execute(Transaction{{token::transfer(tokenProgramId(), aliceUsdc, bobUsdc, alice, 120)}, {alice}});
    EXPECT_EQ(380u, token::balanceOf(runtime, aliceUsdc));
    EXPECT_EQ(120u, token::balanceOf(runtime, bobUsdc));

    EXPECT_EQ(ErrorCode::InvalidTokenAuthority,
              failureOf(Transaction{{token::transfer(tokenProgramId(), aliceUsdc, bobUsdc, bob, 1)}, {bob}}));
    EXPECT_EQ(ErrorCode::InsufficientTokenBalance,
              failureOf(Transaction{{token::transfer(tokenProgramId(), aliceUsdc, bobUsdc, alice, 381)}, {alice}}));
}

TEST_F(RuntimeTest, FailedTransactionRollsBackEveryInstruction)
{
    Transaction transaction{{native::transfer(alice, bob, 100),
                             token::transfer(tokenProgramId(), aliceUsdc, bobUsdc, alice, 50),
                             token::transfer(tokenProgramId(), aliceUsdc, bobUsdc, alice, 10'000)},
                            {alice}};
    try {
        runtime.execute(transaction);
        FAIL() << "expected failure";
    } catch (const TransactionError& error) {
        EXPECT_EQ(2u, error.instructionIndex());
        EXPECT_EQ(ErrorCode::InsufficientTokenBalance, error.code());
    }

    EXPECT_EQ(1'000'000u, runtime.lamports(alice));
    EXPECT_EQ(0u, runtime.lamports(bob));
    EXPECT_EQ(500u, token::balanceOf(runtime, aliceUsdc));
    EXPECT_EQ(0u, token::balanceOf(runtime, bobUsdc));
    EXPECT_EQ("Program failed: ", runtime.lastLogs().back().substr(0, 16));
}

TEST_F(RuntimeTest, UnknownProgramFails)
{
    Instruction instruction{Address::fromLabel("program:missing"), {}, Bytes{}};
    EXPECT_EQ(ErrorCode::UnknownProgram, failureOf(Transaction{{instruction}, {}}));
}

TEST_F(RuntimeTest, CrossProgramInvocationRaisesStackHeight)
{
    Address outer = Address::fromLabel("program:outer");
    Address inner = Address::fromLabel("program:inner");
    std::vector<int> heights;
    std::vector<size_t> indices;

    runtime.registerProgram(inner, [&](InvokeContext& context) {
        heights.push_back(context.stackHeight());
        indices.push_back(context.currentIndex());
    });
    runtime.registerProgram(outer, [&](InvokeContext& context) {
        heights.push_back(context.stackHeight());
        context.invoke(Instruction{inner, {}, Bytes{}});
    });

    runtime.execute(Transaction{{Instruction{inner, {}, Bytes{}}, Instruction{outer, {}, Bytes{}}}, {}});

    EXPECT_EQ((std::vector<int>{1, 1, 2}), heights);
    EXPECT_EQ((std::vector<size_t>{0, 1}), indices);
}

TEST_F(RuntimeTest, SignerSeedsAuthorizeDerivedAddresses)
{
    Address program = Address::fromLabel("program:custody");
    Address custody = deriveAddress("custody", {alice}, program);
    runtime.airdrop(custody, 1000);

    runtime.registerProgram(program, [&](InvokeContext& context) {
        bool withSeeds = context.instruction().data.at(0) == 1;
        std::vector<SignerSeeds> seeds;
        if (withSeeds) {
            seeds.push_back(SignerSeeds{"custody", {alice}});
        }
        context.invoke(native::transfer(custody, bob, 300), seeds);
    });

    EXPECT_EQ(ErrorCode::MissingSigner, failureOf(Transaction{{Instruction{program, {}, Bytes{0}}}, {}}));

    runtime.execute(Transaction{{Instruction{program, {}, Bytes{1}}}, {}});
    EXPECT_EQ(700u, runtime.lamports(custody));
    EXPECT_EQ(300u, runtime.lamports(bob));
}

TEST_F(RuntimeTest, OnlyOwnerWritesAccountData)
{
    Address program = Address::fromLabel("program:writer");
    runtime.registerProgram(program, [&](InvokeContext& context) { context.writeData(aliceUsdc, Bytes(72, 0)); });
    EXPECT_EQ(ErrorCode::InvalidAccount, failureOf(Transaction{{Instruction{program, {}, Bytes{}}}, {}}));
    EXPECT_EQ(500u, token::balanceOf(runtime, aliceUsdc));
}

TEST_F(RuntimeTest, CreateAccountRequiresFreshAddress)
{
    Address record = Address::fromLabel("record");
    Address owner = Address::fromLabel("program:owner");
    Amount rent = runtime.rentFor(32);
    EXPECT_EQ((128u + 32u) * 6960u, rent);
    runtime.airdrop(alice, rent);

    runtime.execute(Transaction{{native::createAccount(alice, record, rent, 32, owner)}, {alice, record}});
    ASSERT_NE(nullptr, runtime.find(record));
    EXPECT_EQ(owner, runtime.find(record)->owner);
    EXPECT_EQ(32u, runtime.find(record)->data.size());

    runtime.airdrop(alice, rent);
    EXPECT_EQ(ErrorCode::AccountAlreadyInUse,
              failureOf(Transaction{{native::createAccount(alice, record, rent, 32, owner)}, {alice, record}}));
}

TEST_F(RuntimeTest, RentThatOverflowsIsRejected)
{
    runtime.setRentPerByte(std::numeric_limits<Amount>::max() / 100);
    try {
        (void)runtime.rentFor(424);
        FAIL() << "expected the rent computation to overflow";
    } catch (const SettlementError& error) {
        EXPECT_EQ(ErrorCode::MathOverflow, error.code());
    }

    runtime.setRentPerByte(1);
    EXPECT_EQ(128u + 424u, runtime.rentFor(424));
}
