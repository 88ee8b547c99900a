/**
 * @file CryptoTest.cpp
 * @brief Unit tests for HMAC helpers, SecureKey and PanHasher
 */

#include <gtest/gtest.h>
#include "utils/Crypto.hpp"
#include "utils/PanHasher.hpp"
#include "utils/SecureKey.hpp"
#include "domain/Exceptions.hpp"

using namespace issuer;
using namespace issuer::utils;

// ============================================================================
// HMAC / HEX
// ============================================================================

TEST(CryptoTest, HmacSha256_Rfc4231Case2) {
    SecureKey key(std::string("Jefe"));
    auto mac = hmacSha256(key, std::string("what do ya want for nothing?"));

    EXPECT_EQ(toHex(mac),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(CryptoTest, Hex_RoundTripMixedCase) {
    auto bytes = fromHex("00FFa5");
    ASSERT_EQ(bytes.size(), 3u);
    EXPECT_EQ(bytes[1], 0xFF);
    EXPECT_EQ(toHex(bytes), "00ffa5");
}

TEST(CryptoTest, FromHex_Invalid) {
    EXPECT_THROW(fromHex("abc"), domain::ValidationException);
    EXPECT_THROW(fromHex("zz"), domain::ValidationException);
}

// ============================================================================
// SECURE KEY
// ============================================================================

TEST(SecureKeyTest, Move_EmptiesSource) {
    SecureKey a(std::string("secret"));
    SecureKey b(std::move(a));

    EXPECT_TRUE(a.empty());
    EXPECT_EQ(b.size(), 6u);
}

TEST(SecureKeyTest, Wipe_Clears) {
    SecureKey key = SecureKey::fromHex("0102030405060708");
    EXPECT_EQ(key.size(), 8u);
    key.wipe();
    EXPECT_TRUE(key.empty());
}

// ============================================================================
// PAN HASHER
// ============================================================================

TEST(PanHasherTest, Hash_IgnoresSeparators) {
    PanHasher hasher(SecureKey(std::string("pepper")));

    auto h1 = hasher.hash("4111111111111111");
    auto h2 = hasher.hash("4111 1111-1111 1111");

    EXPECT_EQ(h1, h2);
    EXPECT_EQ(h1.size(), 64u);
}

TEST(PanHasherTest, Hash_DependsOnPepper) {
    PanHasher a(SecureKey(std::string("pepper-a")));
    PanHasher b(SecureKey(std::string("pepper-b")));

    EXPECT_NE(a.hash("4111111111111111"), b.hash("4111111111111111"));
    EXPECT_NE(a.hash("4111111111111111"), a.hash("5555555555554444"));
}

TEST(PanHasherTest, EmptyPepper_Throws) {
    EXPECT_THROW(PanHasher{SecureKey{}}, domain::ProviderConfigException);
}
