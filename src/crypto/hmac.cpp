#include "radlink/crypto/hmac.hpp"

#include <sodium.h>

#include <memory>

namespace radlink::crypto {

namespace {

// Wraps libsodium's incremental crypto_auth_hmacsha256 API
void hmac_sha256_impl(std::span<const uint8_t> key,
                      std::span<const uint8_t> first,
                      std::span<const uint8_t> second,
                      uint8_t* out) {
    crypto_auth_hmacsha256_state state;
    crypto_auth_hmacsha256_init(&state, key.data(), key.size());
    if (!first.empty()) {
        crypto_auth_hmacsha256_update(&state, first.data(), first.size());
    }
    if (!second.empty()) {
        crypto_auth_hmacsha256_update(&state, second.data(), second.size());
    }
    crypto_auth_hmacsha256_final(&state, out);
    sodium_memzero(&state, sizeof(state));
}

struct SecretHolder {
    std::vector<uint8_t> key;

    ~SecretHolder() {
        if (!key.empty()) {
            secure_zero(key.data(), key.size());
        }
    }
};

}  // namespace

HmacDigest hmac_sha256(std::span<const uint8_t> key, std::span<const uint8_t> message) {
    HmacDigest digest;
    hmac_sha256_impl(key, message, {}, digest.data());
    return digest;
}

HmacDigest sign(std::span<const uint8_t> key,
                std::span<const uint8_t> header,
                std::span<const uint8_t> payload) {
    HmacDigest digest;
    hmac_sha256_impl(key, header, payload, digest.data());
    return digest;
}

HmacDigest sign(std::span<const uint8_t> key, std::span<const uint8_t> message) {
    return hmac_sha256(key, message);
}

bool verify(std::span<const uint8_t> key,
            std::span<const uint8_t> message,
            std::span<const uint8_t> tag) {
    return verify(key, message, {}, tag);
}

bool verify(std::span<const uint8_t> key,
            std::span<const uint8_t> header,
            std::span<const uint8_t> payload,
            std::span<const uint8_t> tag) {
    if (tag.size() != HMAC_SHA256_SIZE) {
        return false;
    }
    auto expected = sign(key, header, payload);
    bool match = constant_time_compare(expected, tag);
    secure_zero(expected.data(), expected.size());
    return match;
}

SecretProvider static_secret(std::vector<uint8_t> key) {
    auto holder = std::make_shared<SecretHolder>();
    holder->key = std::move(key);
    return [holder]() { return holder->key; };
}

}  // namespace radlink::crypto
