#include "gtest/gtest.h"
#include "utils/base36.h"

#include <string>

using namespace Base36;

namespace {

Bytes toBytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

} // namespace

TEST(Base36Test, KnownVectors) {
    // Vectors from the multibase test suite
    EXPECT_EQ(encodeMultibase(toBytes("yes mani !")), "k2lcpzo5yikidynfl");
    EXPECT_EQ(encodeMultibase(toBytes(std::string("\0yes mani !", 11))), "k02lcpzo5yikidynfl");
    EXPECT_EQ(encodeMultibase(toBytes(std::string("\0\0yes mani !", 12))), "k002lcpzo5yikidynfl");
    EXPECT_EQ(encode(Bytes{0x00}), "0");
    EXPECT_EQ(encode(Bytes{0xff}), "73");
    EXPECT_EQ(encode(Bytes()), "");
}

TEST(Base36Test, DecodeIsCaseInsensitive) {
    EXPECT_EQ(decodeMultibase("k2lcpzo5yikidynfl"), toBytes("yes mani !"));
    EXPECT_EQ(decodeMultibase("K2LCPZO5YIKIDYNFL"), toBytes("yes mani !"));
    EXPECT_EQ(decode("002lcpzo5yikidynfl"), toBytes(std::string("\0\0yes mani !", 12)));
}

TEST(Base36Test, RejectsBadInput) {
    EXPECT_THROW(decode("abc-def"), FormatError);
    EXPECT_THROW(decodeMultibase(""), FormatError);
    EXPECT_THROW(decodeMultibase("bafy"), FormatError);
}
