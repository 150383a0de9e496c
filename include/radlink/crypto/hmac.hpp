#pragma once

#include <functional>
#include <span>
#include <vector>

#include "crypto.hpp"

namespace radlink::crypto {

// HMAC-SHA256
HmacDigest hmac_sha256(std::span<const uint8_t> key, std::span<const uint8_t> message);

// Tag over header || payload without concatenating them first
HmacDigest sign(std::span<const uint8_t> key,
                std::span<const uint8_t> header,
                std::span<const uint8_t> payload);

HmacDigest sign(std::span<const uint8_t> key, std::span<const uint8_t> message);

// Recompute and compare in constant time. Never throws; a tag of the wrong
// length is simply rejected.
bool verify(std::span<const uint8_t> key,
            std::span<const uint8_t> message,
            std::span<const uint8_t> tag);

bool verify(std::span<const uint8_t> key,
            std::span<const uint8_t> header,
            std::span<const uint8_t> payload,
            std::span<const uint8_t> tag);

// Supplies the shared secret for the command channel. Called per frame so the
// key can be rotated underneath a running processor.
using SecretProvider = std::function<std::vector<uint8_t>()>;

// Provider over a fixed key; the copy held by the provider is wiped when the
// last reference goes away
SecretProvider static_secret(std::vector<uint8_t> key);

}  // namespace radlink::crypto
