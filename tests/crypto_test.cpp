#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <string>
#include <vector>

#include "radlink/crypto/crypto.hpp"
#include "radlink/crypto/hmac.hpp"

namespace radlink::crypto {
namespace {

std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

class CryptoTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(init());
    }
};

TEST_F(CryptoTest, RandomBytesGeneratesDifferentValues) {
    std::array<uint8_t, 32> bytes1{}, bytes2{};
    random_bytes(bytes1);
    random_bytes(bytes2);

    EXPECT_NE(bytes1, bytes2);
}

TEST_F(CryptoTest, GeneratedKeysAreDistinct) {
    auto a = generate_key();
    auto b = generate_key();
    EXPECT_EQ(a.size(), DEFAULT_KEY_SIZE);
    EXPECT_NE(a, b);
    EXPECT_EQ(generate_key(16).size(), 16u);
    EXPECT_TRUE(init());
}

TEST_F(CryptoTest, ConstantTimeCompare) {
    std::array<uint8_t, 4> a = {1, 2, 3, 4};
    std::array<uint8_t, 4> b = {1, 2, 3, 4};
    std::array<uint8_t, 4> c = {1, 2, 3, 5};
    std::array<uint8_t, 3> d = {1, 2, 3};

    EXPECT_TRUE(constant_time_compare(a, b));
    EXPECT_FALSE(constant_time_compare(a, c));
    EXPECT_FALSE(constant_time_compare(a, d));
}

TEST_F(CryptoTest, SecureZero) {
    std::array<uint8_t, 16> buffer;
    buffer.fill(0xAB);
    secure_zero(buffer.data(), buffer.size());
    EXPECT_THAT(buffer, ::testing::Each(0));
}

TEST_F(CryptoTest, HmacRfc4231TestCase2) {
    auto key = bytes_of("Jefe");
    auto data = bytes_of("what do ya want for nothing?");

    HmacDigest expected = {
        0x5b, 0xdc, 0xc1, 0x46, 0xbf, 0x60, 0x75, 0x4e, 0x6a, 0x04, 0x24, 0x26,
        0x08, 0x95, 0x75, 0xc7, 0x5a, 0x00, 0x3f, 0x08, 0x9d, 0x27, 0x39, 0x83,
        0x9d, 0xec, 0x58, 0xb9, 0x64, 0xec, 0x38, 0x43};

    EXPECT_EQ(hmac_sha256(key, data), expected);
    EXPECT_EQ(sign(key, data), expected);
}

TEST_F(CryptoTest, SplitSignMatchesConcatenated) {
    auto key = bytes_of("shared-secret");
    auto header = bytes_of("header-bytes");
    auto payload = bytes_of("payload");

    auto joined = header;
    joined.insert(joined.end(), payload.begin(), payload.end());

    EXPECT_EQ(sign(key, header, payload), sign(key, joined));
}

TEST_F(CryptoTest, VerifyAcceptsOwnTag) {
    auto key = bytes_of("k");
    auto data = bytes_of("start scan");
    auto tag = sign(key, data);

    EXPECT_TRUE(verify(key, data, tag));
}

TEST_F(CryptoTest, VerifyRejectsEveryDataBitFlip) {
    auto key = bytes_of("detector-key");
    auto data = bytes_of("GET_STATUS");
    auto tag = sign(key, data);

    for (size_t byte = 0; byte < data.size(); ++byte) {
        for (int bit = 0; bit < 8; ++bit) {
            auto mutated = data;
            mutated[byte] ^= static_cast<uint8_t>(1u << bit);
            EXPECT_FALSE(verify(key, mutated, tag));
        }
    }
}

TEST_F(CryptoTest, VerifyRejectsEveryTagBitFlip) {
    auto key = bytes_of("detector-key");
    auto data = bytes_of("GET_STATUS");
    auto tag = sign(key, data);

    for (size_t byte = 0; byte < tag.size(); ++byte) {
        for (int bit = 0; bit < 8; ++bit) {
            auto mutated = tag;
            mutated[byte] ^= static_cast<uint8_t>(1u << bit);
            EXPECT_FALSE(verify(key, data, mutated));
        }
    }
}

TEST_F(CryptoTest, VerifyRejectsWrongTagLength) {
    auto key = bytes_of("k");
    auto data = bytes_of("x");
    auto tag = sign(key, data);

    std::span<const uint8_t> truncated(tag.data(), tag.size() - 1);
    EXPECT_FALSE(verify(key, data, truncated));
    EXPECT_FALSE(verify(key, data, std::span<const uint8_t>()));
}

TEST_F(CryptoTest, VerifyRejectsWrongKey) {
    auto data = bytes_of("STOP_SCAN");
    auto tag = sign(bytes_of("key-a"), data);
    EXPECT_FALSE(verify(bytes_of("key-b"), data, tag));
}

TEST_F(CryptoTest, StaticSecretReturnsKey) {
    auto key = bytes_of("0123456789abcdef");
    auto provider = static_secret(key);

    EXPECT_EQ(provider(), key);

    // Copies of the provider share the same key
    auto copy = provider;
    EXPECT_EQ(copy(), key);
}

}  // namespace
}  // namespace radlink::crypto
