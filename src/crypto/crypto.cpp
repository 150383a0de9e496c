#include "radlink/crypto/crypto.hpp"

#include <sodium.h>
#include <spdlog/spdlog.h>

namespace radlink::crypto {

bool init() {
    // 0 on first initialisation, 1 when already initialised
    int rc = sodium_init();
    if (rc < 0) {
        spdlog::critical("libsodium failed to initialise, command channel unavailable");
        return false;
    }
    return true;
}

void secure_zero(void* ptr, size_t len) {
    if (ptr != nullptr && len > 0) {
        sodium_memzero(ptr, len);
    }
}

void random_bytes(std::span<uint8_t> output) {
    if (!output.empty()) {
        randombytes_buf(output.data(), output.size());
    }
}

std::vector<uint8_t> generate_key(size_t size) {
    std::vector<uint8_t> key(size);
    random_bytes(key);
    return key;
}

bool constant_time_compare(std::span<const uint8_t> a, std::span<const uint8_t> b) {
    return a.size() == b.size() && sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

}  // namespace radlink::crypto
