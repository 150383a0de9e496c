#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "datagram_transport.hpp"

namespace radlink::transport {

// Socket address
struct SocketAddress {
    std::string host;
    uint16_t port{0};

    bool operator==(const SocketAddress& other) const {
        return host == other.host && port == other.port;
    }

    // "host:port", the peer identity used by DatagramTransport
    [[nodiscard]] std::string to_string() const;

    // Parse "host:port"
    static std::optional<SocketAddress> parse(const std::string& text);
};

// UDP socket configuration
struct UdpSocketConfig {
    SocketAddress bind_address;        // Address to bind to
    bool reuse_port = false;           // SO_REUSEPORT / SO_REUSEADDR
    size_t recv_buffer_size = 1048576; // Receive buffer size (1MB)
    size_t send_buffer_size = 1048576; // Send buffer size (1MB)
};

// Received packet
struct ReceivedPacket {
    SocketAddress from;
    std::vector<uint8_t> data;
};

// Non-blocking IPv4 UDP socket with epoll readiness
class UdpSocket : public DatagramTransport {
public:
    UdpSocket() = default;
    ~UdpSocket() override;

    // Disable copy
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    // Enable move
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    // Open and bind socket
    bool open(const UdpSocketConfig& config);

    // Close socket
    void close();

    // Check if socket is open
    [[nodiscard]] bool is_open() const { return fd_ >= 0; }

    // Send data to address
    bool send_to(const SocketAddress& to, std::span<const uint8_t> data);

    // Receive single packet (non-blocking)
    std::optional<ReceivedPacket> recv();

    // Wait for readability. Returns >0 when readable, 0 on timeout, -1 on error.
    int poll_recv(int timeout_ms);

    // DatagramTransport
    bool send_to(const std::string& peer, std::span<const uint8_t> data) override;
    std::optional<Datagram> receive(std::chrono::milliseconds timeout) override;

    // Get bound address
    [[nodiscard]] const SocketAddress& local_address() const { return local_addr_; }

    // Statistics
    [[nodiscard]] uint64_t packets_sent() const { return packets_sent_; }
    [[nodiscard]] uint64_t packets_received() const { return packets_received_; }
    [[nodiscard]] uint64_t bytes_sent() const { return bytes_sent_; }
    [[nodiscard]] uint64_t bytes_received() const { return bytes_received_; }
    [[nodiscard]] uint64_t send_errors() const { return send_errors_; }
    [[nodiscard]] uint64_t recv_errors() const { return recv_errors_; }

private:
    int fd_{-1};
    int epoll_fd_{-1};
    SocketAddress local_addr_;
    UdpSocketConfig config_;

    // Statistics
    uint64_t packets_sent_{0};
    uint64_t packets_received_{0};
    uint64_t bytes_sent_{0};
    uint64_t bytes_received_{0};
    uint64_t send_errors_{0};
    uint64_t recv_errors_{0};

    void log_error(int error_code, const char* context);
};

}  // namespace radlink::transport
