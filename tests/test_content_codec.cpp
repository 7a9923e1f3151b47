// tests/test_content_codec.cpp
#include <gtest/gtest.h>

#include "chunkvault/content_codec.hpp"
#include "test_support.hpp"

using ChunkVault::Codec::ContentCodec;

namespace
{
    std::vector<char> bytesOf(const std::string &s)
    {
        return std::vector<char>(s.begin(), s.end());
    }
} // namespace

TEST(ContentCodecTest, EncodesKnownVectors)
{
    EXPECT_EQ(ContentCodec::encodeBase64({}), "");
    EXPECT_EQ(ContentCodec::encodeBase64(bytesOf("f")), "Zg==");
    EXPECT_EQ(ContentCodec::encodeBase64(bytesOf("fo")), "Zm8=");
    EXPECT_EQ(ContentCodec::encodeBase64(bytesOf("foo")), "Zm9v");
    EXPECT_EQ(ContentCodec::encodeBase64(bytesOf("hello")), "aGVsbG8=");
}

TEST(ContentCodecTest, DecodesPaddedInput)
{
    EXPECT_EQ(ContentCodec::decodeBase64("Zg=="), bytesOf("f"));
    EXPECT_EQ(ContentCodec::decodeBase64("Zm8="), bytesOf("fo"));
    EXPECT_EQ(ContentCodec::decodeBase64("Zm9v"), bytesOf("foo"));
    EXPECT_TRUE(ContentCodec::decodeBase64("").empty());
}

TEST(ContentCodecTest, RoundTripsEveryByteValue)
{
    std::vector<char> all;
    for (int i = 0; i < 256; ++i)
    {
        all.push_back(static_cast<char>(i));
    }
    EXPECT_EQ(ContentCodec::decodeBase64(ContentCodec::encodeBase64(all)), all);

    std::vector<char> noise = ChunkVault::Testing::pseudoRandomBytes(10001);
    std::string encoded = ContentCodec::encodeBase64(noise);
    EXPECT_EQ(encoded.size(), 4u * ((10001 + 2) / 3));
    EXPECT_EQ(ContentCodec::decodeBase64(encoded), noise);
}

TEST(ContentCodecTest, RejectsMalformedInput)
{
    EXPECT_THROW(ContentCodec::decodeBase64("abc"), std::invalid_argument);
    EXPECT_THROW(ContentCodec::decodeBase64("ab!d"), std::invalid_argument);
}

TEST(ContentCodecTest, Sha256MatchesKnownDigests)
{
    EXPECT_EQ(ContentCodec::sha256Hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(ContentCodec::sha256Hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ContentCodecTest, RandomHexHasRequestedLength)
{
    std::string a = ContentCodec::randomHex(16);
    std::string b = ContentCodec::randomHex(16);
    EXPECT_EQ(a.size(), 32u);
    EXPECT_NE(a, b);
    EXPECT_EQ(a.find_first_not_of("0123456789abcdef"), std::string::npos);
}
