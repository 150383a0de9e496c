#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace radlink::transport {

// Datagram with the identity of its sender ("host:port" for UDP)
struct Datagram {
    std::string peer;
    std::vector<uint8_t> data;
};

// Moves opaque byte strings between peers. Implementations never interpret
// the bytes.
class DatagramTransport {
public:
    virtual ~DatagramTransport() = default;

    virtual bool send_to(const std::string& peer, std::span<const uint8_t> data) = 0;

    // Wait up to timeout for one datagram
    virtual std::optional<Datagram> receive(std::chrono::milliseconds timeout) = 0;
};

}  // namespace radlink::transport
