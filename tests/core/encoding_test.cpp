#include "core/digest.hpp"
#include "core/encoding.hpp"
#include "core/identifiers.hpp"
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <vector>

using namespace lockbox::core;

TEST(EncodingTest, HexIsLowercase) {
    std::vector<uint8_t> bytes = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(hexEncode(bytes), "000fabff");
}

TEST(EncodingTest, Sha256KnownAnswer) {
    EXPECT_EQ(hexEncode(sha256("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(EncodingTest, HmacSha256KnownAnswer) {
    // RFC 4231, test case 2
    std::vector<uint8_t> key = {'J', 'e', 'f', 'e'};
    EXPECT_EQ(hexEncode(hmacSha256(key, "what do ya want for nothing?")),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(EncodingTest, Base64UrlHasNoPaddingOrUnsafeCharacters) {
    std::vector<uint8_t> bytes = {0xfb, 0xff, 0xfe};
    EXPECT_EQ(base64UrlEncode(bytes.data(), bytes.size()), "-__-");
    EXPECT_EQ(base64UrlEncode("f"), "Zg");
    EXPECT_EQ(base64UrlEncode("fo"), "Zm8");
    EXPECT_EQ(base64UrlEncode("foo"), "Zm9v");
}

TEST(EncodingTest, Base64UrlDecode) {
    auto decoded = base64UrlDecode("Zm8");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::string(decoded->begin(), decoded->end()), "fo");

    auto padded = base64UrlDecode("Zg==");
    ASSERT_TRUE(padded.has_value());
    EXPECT_EQ(std::string(padded->begin(), padded->end()), "f");

    EXPECT_FALSE(base64UrlDecode("Zm9v+").has_value());
    EXPECT_FALSE(base64UrlDecode("abcde").has_value());
    EXPECT_FALSE(base64UrlDecode("ab/c").has_value());
}

TEST(EncodingTest, PercentEncoding) {
    EXPECT_EQ(percentEncode("a b/c~"), "a%20b%2Fc~");
    EXPECT_EQ(percentEncode("a b/c", true), "a%20b/c");

    EXPECT_EQ(percentDecode("a%20b+c").value(), "a b c");
    EXPECT_EQ(percentDecode("a+b", false).value(), "a+b");
    EXPECT_FALSE(percentDecode("bad%2").has_value());
    EXPECT_FALSE(percentDecode("bad%zz").has_value());
}

TEST(EncodingTest, EmailsCompareCaseInsensitively) {
    EXPECT_EQ(canonicalEmail("  Guest@Example.COM "), "guest@example.com");
    EXPECT_TRUE(looksLikeEmail("guest@example.com"));
    EXPECT_FALSE(looksLikeEmail("guest"));
    EXPECT_FALSE(looksLikeEmail("@example.com"));
    EXPECT_FALSE(looksLikeEmail("guest@example"));
    EXPECT_FALSE(looksLikeEmail("gu est@example.com"));
    EXPECT_FALSE(looksLikeEmail("a@b@example.com"));
}

TEST(EncodingTest, ConstantTimeEquals) {
    EXPECT_TRUE(constantTimeEquals("abc", "abc"));
    EXPECT_FALSE(constantTimeEquals("abc", "abd"));
    EXPECT_FALSE(constantTimeEquals("abc", "abcd"));
}

TEST(IdentifiersTest, UuidsAreVersion4AndUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        std::string id = generateUuid();
        EXPECT_TRUE(isUuid(id)) << id;
        EXPECT_EQ(id[14], '4');
        EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos);
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 100u);
    EXPECT_FALSE(isUuid("not-a-uuid"));
    EXPECT_FALSE(isUuid("0123456789abcdef0123456789abcdef0123"));
}
