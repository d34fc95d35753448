#include "unit-tests.hpp"

using namespace lens;
using namespace lens::tests;

TEST_F(UnitTest, Crypto_EventTopic_Transfer)
{
    EXPECT_EQ(crypto::constructEventTopicHex("Transfer(address,address,uint256)"), TRANSFER_TOPIC);
}

TEST_F(UnitTest, Crypto_EventTopic_Approval)
{
    EXPECT_EQ(crypto::constructEventTopicHex("Approval(address,address,uint256)"),
        "0x8c5be1e5ebec7d5bd14f71427d1e84f3dd0314c0f7b2291e5b200ac8c7c3b925");
}

TEST_F(UnitTest, Crypto_EventTopic_KeccakNotSha3)
{
    EXPECT_EQ(crypto::constructEventTopicHex(""), "0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
    EXPECT_EQ(crypto::constructEventTopicHex("hello world!"), "0x57caa176af1ac0433c5df30e8dabcd2ec1af1e92a26eced5f719b88458777cd6");
}

TEST_F(UnitTest, Crypto_DecodeTopicWord_AcceptsWithAndWithoutPrefix)
{
    const auto with_prefix = crypto::decodeTopicWord(TRANSFER_TOPIC);
    const auto without_prefix = crypto::decodeTopicWord(std::string(TRANSFER_TOPIC).substr(2));
    ASSERT_TRUE(with_prefix.has_value());
    ASSERT_TRUE(without_prefix.has_value());
    EXPECT_EQ(*with_prefix, *without_prefix);
    EXPECT_EQ(*with_prefix, crypto::constructEventTopic("Transfer(address,address,uint256)"));
}

TEST_F(UnitTest, Crypto_DecodeTopicWord_RejectsShortAndInvalid)
{
    EXPECT_FALSE(crypto::decodeTopicWord("0x01").has_value());
    EXPECT_FALSE(crypto::decodeTopicWord("").has_value());
    EXPECT_FALSE(crypto::decodeTopicWord(std::string("0x") + std::string(64, 'z')).has_value());
    EXPECT_FALSE(crypto::decodeTopicWord(std::string(TRANSFER_TOPIC) + "00").has_value());
    EXPECT_FALSE(crypto::decodeTopicWord(std::string("0X") + std::string(TRANSFER_TOPIC).substr(2)).has_value());
}
