// tests/test_codec.cpp
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "crypto/codec.hpp"

TEST(Codec, Base64KnownVector)
{
    std::vector<std::uint8_t> out;
    ASSERT_TRUE(codec::base64_decode("aGVsbG8=", out));
    EXPECT_EQ(std::string(out.begin(), out.end()), "hello");

    const std::vector<std::uint8_t> hello = {'h', 'e', 'l', 'l', 'o'};
    EXPECT_EQ(codec::base64_encode(hello), "aGVsbG8=");
}

TEST(Codec, Base64Empty)
{
    std::vector<std::uint8_t> out = {1, 2, 3};
    ASSERT_TRUE(codec::base64_decode("", out));
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(codec::base64_encode({}), "");
}

TEST(Codec, Base64RejectsGarbage)
{
    std::vector<std::uint8_t> out;
    EXPECT_FALSE(codec::base64_decode("aGVsbG8=!", out));
    EXPECT_FALSE(codec::base64_decode("a*b", out));
    EXPECT_TRUE(out.empty());
}

TEST(Codec, Hex)
{
    const std::uint8_t buf[] = {0x00, 0x1f, 0xa0, 0xff};
    EXPECT_EQ(codec::to_hex(buf, sizeof(buf)), "001fa0ff");
    EXPECT_EQ(codec::to_hex(buf, 0), "");
}
