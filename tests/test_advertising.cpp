// tests/test_advertising.cpp
#include <cstdint>
#include <gtest/gtest.h>
#include <vector>

#include "proto/advertising.hpp"
#include "test_util.hpp"

using namespace advert;

TEST(Advertising, ParsesSensorTileWithoutMac)
{
    bluest::Error err;
    auto          d = parse(testutil::payload(0x02, 0x00E40000u), &err);
    ASSERT_TRUE(d.has_value()) << err.message;
    EXPECT_EQ(d->protocol_version, 0x01);
    EXPECT_EQ(d->device_id, 0x02);
    EXPECT_EQ(d->type, NodeType::SensorTile);
    EXPECT_EQ(d->feature_mask, 0x00E40000u);
    EXPECT_FALSE(d->sleeping);
    EXPECT_FALSE(d->has_general_purpose);
    EXPECT_FALSE(d->mac.has_value());
    EXPECT_EQ(d->mac_string(), "");
    EXPECT_FALSE(err);
}

TEST(Advertising, ParsesMacAndFlags)
{
    // sleeping + general purpose bits on a BlueCoin
    auto d = parse(testutil::payload(0x03 | SLEEPING_BIT | GENERAL_PURPOSE_BIT, 0x00000400u, true));
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->device_id, 0x03);
    EXPECT_EQ(d->type, NodeType::BlueCoin);
    EXPECT_TRUE(d->sleeping);
    EXPECT_TRUE(d->has_general_purpose);
    EXPECT_EQ(d->mac_string(), "C0:FF:EE:00:00:01");
}

TEST(Advertising, NucleoKeepsFullDeviceId)
{
    auto d = parse(testutil::payload(0x85, 0));
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->device_id, 0x85);
    EXPECT_EQ(d->type, NodeType::Nucleo);
}

TEST(Advertising, UnknownBoardIsGeneric)
{
    EXPECT_EQ(node_type_from_id(0x00), NodeType::Generic);
    EXPECT_EQ(node_type_from_id(0x1F), NodeType::Generic);
    EXPECT_EQ(node_type_from_id(0x06), NodeType::SensorTileBox);
    EXPECT_EQ(node_type_from_id(0x07), NodeType::DiscoveryIot01A);
    EXPECT_STREQ(node_type_name(NodeType::Nucleo), "NUCLEO");
}

TEST(Advertising, RejectsBadLength)
{
    for (std::size_t n : {0u, 5u, 7u, 11u, 13u})
    {
        std::vector<std::uint8_t> p(n, 0x01);
        bluest::Error             err;
        EXPECT_FALSE(parse(p, &err).has_value()) << n;
        EXPECT_EQ(err.code, bluest::Errc::malformed_advertisement) << n;
    }
}

TEST(Advertising, RejectsUnknownVersion)
{
    auto p = testutil::payload(0x02, 0x00800000u);
    p[0]   = 0x02;
    bluest::Error err;
    EXPECT_FALSE(parse(p, &err).has_value());
    EXPECT_EQ(err.code, bluest::Errc::malformed_advertisement);
    EXPECT_NE(err.message.find("version"), std::string::npos);
}

TEST(Advertising, NullErrorPointerIsAllowed)
{
    EXPECT_FALSE(parse(std::vector<std::uint8_t>{1, 2, 3}).has_value());
}
