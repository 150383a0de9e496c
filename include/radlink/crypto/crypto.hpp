#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace radlink::crypto {

// HMAC-SHA256 tag length and the shared command key length
constexpr size_t HMAC_SHA256_SIZE = 32;
constexpr size_t DEFAULT_KEY_SIZE = 32;

using HmacDigest = std::array<uint8_t, HMAC_SHA256_SIZE>;

// Initialise libsodium. Safe to call from several threads and more than once;
// returns false only if the library cannot be used.
bool init();

// Wipe key material
void secure_zero(void* ptr, size_t len);

void random_bytes(std::span<uint8_t> output);

// Fresh shared secret for the command channel
std::vector<uint8_t> generate_key(size_t size = DEFAULT_KEY_SIZE);

// Length check plus a constant-time byte comparison
bool constant_time_compare(std::span<const uint8_t> a, std::span<const uint8_t> b);

}  // namespace radlink::crypto
