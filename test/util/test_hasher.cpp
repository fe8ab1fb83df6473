#include <gtest/gtest.h>
#include <algorithm>
#include <vector>
#include <string>
#include "util/Sha1Hasher.hpp"
#include "util/IHasher.hpp"

using namespace rit;

// Test: SHA-1 known test vectors
TEST(HasherTest, Sha1KnownVectors) {
    Sha1Hasher hasher;

    // Empty string
    hasher.update("");
    auto hex = IHasher::toHex(hasher.digest());
    EXPECT_EQ(hex, "da39a3ee5e6b4b0d3255bfef95601890afd80709");

    // "abc"
    hasher.update("abc");
    hex = IHasher::toHex(hasher.digest());
    EXPECT_EQ(hex, "a9993e364706816aba3e25717850c26c9cd0d89d");

    // Two-block message
    hasher.update("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq");
    hex = IHasher::toHex(hasher.digest());
    EXPECT_EQ(hex, "84983e441c3bd26ebaae4aa1f95129e5e54670f1");
}

// Test: Content hash matches `sha1sum` of the same bytes
TEST(HasherTest, Sha1OfFileContent) {
    Sha1Hasher hasher;
    EXPECT_EQ(hasher.hexDigest("hello\n"), "f572d396fae9206628714fb2ce00f72e94f2258f");
}

// Test: A million 'a's fed in uneven chunks
TEST(HasherTest, Sha1ChunkedUpdates) {
    Sha1Hasher hasher;
    std::string chunk(997, 'a');
    size_t remaining = 1000000;
    while (remaining > 0) {
        size_t n = std::min(remaining, chunk.size());
        hasher.update(reinterpret_cast<const uint8_t*>(chunk.data()), n);
        remaining -= n;
    }
    EXPECT_EQ(IHasher::toHex(hasher.digest()), "34aa973cd4c4daa4f61eeb2bdbad27316534016f");
}

// Test: Digest resets the hasher
TEST(HasherTest, DigestResetsState) {
    Sha1Hasher hasher;
    std::string first = hasher.hexDigest("content");
    std::string second = hasher.hexDigest("content");
    EXPECT_EQ(first, second);
}

// Test: SHA-1 digest size
TEST(HasherTest, Sha1DigestSize) {
    Sha1Hasher hasher;
    EXPECT_EQ(hasher.digestSize(), 20u);
    EXPECT_STREQ(hasher.name(), "sha1");
}

// Test: Hasher factory creates SHA-1 by default
TEST(HasherTest, FactoryCreatesDefault) {
    auto hasher = HasherFactory::createDefault();
    ASSERT_NE(hasher, nullptr);
    EXPECT_STREQ(hasher->name(), "sha1");
}

// Test: Factory rejects unknown algorithms
TEST(HasherTest, FactoryUnknownAlgorithm) {
    EXPECT_NE(HasherFactory::create("sha1"), nullptr);
    EXPECT_EQ(HasherFactory::create("md5"), nullptr);
}

// Test: Hex encoding
TEST(HasherTest, ToHex) {
    std::vector<uint8_t> bytes{0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(IHasher::toHex(bytes), "000fabff");
}
