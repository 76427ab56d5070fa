#include "core/tokencodec.hpp"
#include <gtest/gtest.h>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace lockbox::core;

class TokenCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        secret_.assign(32, 0x42);
        codec_ = std::make_unique<TokenCodec>(secret_);
    }

    std::vector<uint8_t> secret_;
    std::unique_ptr<TokenCodec> codec_;
};

TEST_F(TokenCodecTest, GeneratesUrlSafeTokens) {
    auto token = codec_->generate();

    // 32 bytes -> 43 unpadded base64url characters
    EXPECT_EQ(token.raw.size(), 43u);
    EXPECT_EQ(token.raw.find_first_not_of(
                  "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_"),
              std::string::npos);
    EXPECT_EQ(token.hash.size(), 64u);
    EXPECT_NE(token.hash, token.raw);
}

TEST_F(TokenCodecTest, TokensAreUnique) {
    std::set<std::string> raws;
    std::set<std::string> hashes;
    for (int i = 0; i < 200; ++i) {
        auto token = codec_->generate();
        raws.insert(token.raw);
        hashes.insert(token.hash);
    }
    EXPECT_EQ(raws.size(), 200u);
    EXPECT_EQ(hashes.size(), 200u);
}

TEST_F(TokenCodecTest, HashIsDeterministic) {
    auto token = codec_->generate();
    EXPECT_EQ(codec_->hash(token.raw), token.hash);
    EXPECT_EQ(codec_->hash(token.raw), codec_->hash(token.raw));
}

TEST_F(TokenCodecTest, MatchesOnlyTheIssuedToken) {
    auto token = codec_->generate();
    EXPECT_TRUE(codec_->matches(token.raw, token.hash));

    std::string altered = token.raw;
    altered[0] = altered[0] == 'A' ? 'B' : 'A';
    EXPECT_FALSE(codec_->matches(altered, token.hash));
    EXPECT_FALSE(codec_->matches("", token.hash));
    EXPECT_FALSE(codec_->matches(token.raw, ""));
}

TEST_F(TokenCodecTest, HashDependsOnSecret) {
    TokenCodec other(std::vector<uint8_t>(32, 0x43));
    auto token = codec_->generate();
    EXPECT_NE(other.hash(token.raw), token.hash);
    EXPECT_FALSE(other.matches(token.raw, token.hash));
}

TEST_F(TokenCodecTest, RejectsEmptySecret) {
    EXPECT_THROW(TokenCodec(std::vector<uint8_t>{}), std::invalid_argument);
}
