#include "../src/address.hpp"
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace settlemill;

TEST(AddressTest, LabelsAreStable)
{
    EXPECT_EQ(Address::fromLabel("alice"), Address::fromLabel("alice"));
    EXPECT_NE(Address::fromLabel("alice"), Address::fromLabel("bob"));
    EXPECT_FALSE(Address::fromLabel("").isZero());
    EXPECT_EQ(64u, Address::fromLabel("alice").toHex().size());
}

TEST(AddressTest, DerivedAddressDependsOnEveryInput)
{
    Address program = Address::fromLabel("program:a");
    Address other = Address::fromLabel("program:b");
    Address seed = Address::fromLabel("seed");

    Address derived = deriveAddress("authority", {seed}, program);
    EXPECT_EQ(derived, deriveAddress("authority", {seed}, program));
    EXPECT_NE(derived, deriveAddress("authority", {seed}, other));
    EXPECT_NE(derived, deriveAddress("escrow_vault", {seed}, program));
    EXPECT_NE(derived, deriveAddress("authority", {}, program));
    EXPECT_NE(derived, Address::fromLabel("authority"));
}

TEST(AddressTest, LongTagIsNotConfusedWithSeeds)
{
    // A 256-byte tag carries the same bytes as eight seeds of 0x61
    std::string tag(256, 'a');
    Address filled;
    filled.bytes.fill('a');
    std::vector<Address> seeds(8, filled);
    Address program = Address::fromLabel("program:a");

    EXPECT_NE(deriveAddress(tag, {}, program), deriveAddress("", seeds, program));
}

TEST(AddressTest, LongLabelsStayDistinct)
{
    std::string longLabel(300, 'x');
    EXPECT_NE(Address::fromLabel(longLabel), Address::fromLabel(longLabel.substr(0, 44)));
    EXPECT_NE(Address::fromLabel(longLabel), Address::fromLabel(longLabel + "x"));
}
