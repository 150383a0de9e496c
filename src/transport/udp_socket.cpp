#include "radlink/transport/udp_socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace radlink::transport {

namespace {

constexpr size_t MAX_DATAGRAM_SIZE = 65536;

bool resolve(const std::string& host, struct in_addr& out) {
    if (inet_pton(AF_INET, host.c_str(), &out) > 0) {
        return true;
    }

    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    struct addrinfo* result = nullptr;
    if (getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0 || !result) {
        return false;
    }
    out = reinterpret_cast<struct sockaddr_in*>(result->ai_addr)->sin_addr;
    freeaddrinfo(result);
    return true;
}

}  // namespace

std::string SocketAddress::to_string() const {
    return host + ":" + std::to_string(port);
}

std::optional<SocketAddress> SocketAddress::parse(const std::string& text) {
    auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) {
        return std::nullopt;
    }

    unsigned long port = 0;
    try {
        size_t used = 0;
        port = std::stoul(text.substr(colon + 1), &used);
        if (used != text.size() - colon - 1) {
            return std::nullopt;
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (port > 65535) {
        return std::nullopt;
    }

    return SocketAddress{text.substr(0, colon), static_cast<uint16_t>(port)};
}

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : fd_(other.fd_),
      epoll_fd_(other.epoll_fd_),
      local_addr_(std::move(other.local_addr_)),
      config_(other.config_),
      packets_sent_(other.packets_sent_),
      packets_received_(other.packets_received_),
      bytes_sent_(other.bytes_sent_),
      bytes_received_(other.bytes_received_),
      send_errors_(other.send_errors_),
      recv_errors_(other.recv_errors_) {
    other.fd_ = -1;
    other.epoll_fd_ = -1;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        epoll_fd_ = other.epoll_fd_;
        local_addr_ = std::move(other.local_addr_);
        config_ = other.config_;
        packets_sent_ = other.packets_sent_;
        packets_received_ = other.packets_received_;
        bytes_sent_ = other.bytes_sent_;
        bytes_received_ = other.bytes_received_;
        send_errors_ = other.send_errors_;
        recv_errors_ = other.recv_errors_;
        other.fd_ = -1;
        other.epoll_fd_ = -1;
    }
    return *this;
}

bool UdpSocket::open(const UdpSocketConfig& config) {
    close();
    config_ = config;

    fd_ = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) {
        log_error(errno, "socket()");
        return false;
    }

    int optval = 1;
    if (config.reuse_port) {
#ifdef SO_REUSEPORT
        if (setsockopt(fd_, SOL_SOCKET, SO_REUSEPORT, &optval, sizeof(optval)) < 0) {
            log_error(errno, "setsockopt(SO_REUSEPORT)");
        }
#endif
        if (setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval)) < 0) {
            log_error(errno, "setsockopt(SO_REUSEADDR)");
        }
    }

    // Buffer sizes are advisory; the kernel may clamp them
    int recv_buf = static_cast<int>(config.recv_buffer_size);
    int send_buf = static_cast<int>(config.send_buffer_size);
    if (setsockopt(fd_, SOL_SOCKET, SO_RCVBUF, &recv_buf, sizeof(recv_buf)) < 0) {
        log_error(errno, "setsockopt(SO_RCVBUF)");
    }
    if (setsockopt(fd_, SOL_SOCKET, SO_SNDBUF, &send_buf, sizeof(send_buf)) < 0) {
        log_error(errno, "setsockopt(SO_SNDBUF)");
    }

    int flags = fcntl(fd_, F_GETFL, 0);
    if (flags < 0 || fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
        log_error(errno, "fcntl(O_NONBLOCK)");
        close();
        return false;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config.bind_address.port);

    if (config.bind_address.host.empty() || config.bind_address.host == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (!resolve(config.bind_address.host, addr.sin_addr)) {
        spdlog::error("Cannot resolve bind address {}", config.bind_address.host);
        close();
        return false;
    }

    if (bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        log_error(errno, "bind()");
        close();
        return false;
    }

    // Get actual bound address
    socklen_t addr_len = sizeof(addr);
    if (getsockname(fd_, reinterpret_cast<struct sockaddr*>(&addr), &addr_len) == 0) {
        char ip_str[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &addr.sin_addr, ip_str, sizeof(ip_str));
        local_addr_.host = ip_str;
        local_addr_.port = ntohs(addr.sin_port);
    }

    epoll_fd_ = epoll_create1(0);
    if (epoll_fd_ < 0) {
        log_error(errno, "epoll_create1()");
        close();
        return false;
    }

    struct epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd_, &ev) < 0) {
        log_error(errno, "epoll_ctl()");
        close();
        return false;
    }

    spdlog::debug("UDP socket bound to {}", local_addr_.to_string());
    return true;
}

void UdpSocket::close() {
    if (epoll_fd_ >= 0) {
        ::close(epoll_fd_);
        epoll_fd_ = -1;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool UdpSocket::send_to(const SocketAddress& to, std::span<const uint8_t> data) {
    if (fd_ < 0) {
        return false;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(to.port);
    if (!resolve(to.host, addr.sin_addr)) {
        ++send_errors_;
        return false;
    }

    ssize_t sent = sendto(fd_, data.data(), data.size(), 0,
                          reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (sent < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            ++send_errors_;
            log_error(errno, "sendto()");
        }
        return false;
    }

    ++packets_sent_;
    bytes_sent_ += static_cast<uint64_t>(sent);
    return true;
}

bool UdpSocket::send_to(const std::string& peer, std::span<const uint8_t> data) {
    auto address = SocketAddress::parse(peer);
    if (!address) {
        ++send_errors_;
        spdlog::warn("Invalid peer address '{}'", peer);
        return false;
    }
    return send_to(*address, data);
}

std::optional<ReceivedPacket> UdpSocket::recv() {
    if (fd_ < 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> buffer(MAX_DATAGRAM_SIZE);
    struct sockaddr_in from_addr{};
    socklen_t from_len = sizeof(from_addr);

    ssize_t received = recvfrom(fd_, buffer.data(), buffer.size(), 0,
                                reinterpret_cast<struct sockaddr*>(&from_addr), &from_len);
    if (received < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            ++recv_errors_;
            log_error(errno, "recvfrom()");
        }
        return std::nullopt;
    }

    ++packets_received_;
    bytes_received_ += static_cast<uint64_t>(received);

    ReceivedPacket packet;
    char ip_str[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &from_addr.sin_addr, ip_str, sizeof(ip_str));
    packet.from.host = ip_str;
    packet.from.port = ntohs(from_addr.sin_port);
    buffer.resize(static_cast<size_t>(received));
    packet.data = std::move(buffer);
    return packet;
}

int UdpSocket::poll_recv(int timeout_ms) {
    if (epoll_fd_ < 0) {
        return -1;
    }
    struct epoll_event events[1];
    int nfds = epoll_wait(epoll_fd_, events, 1, timeout_ms);
    if (nfds < 0 && errno != EINTR) {
        log_error(errno, "epoll_wait()");
    }
    return nfds;
}

std::optional<Datagram> UdpSocket::receive(std::chrono::milliseconds timeout) {
    // Drain anything already queued before waiting
    auto packet = recv();
    if (!packet) {
        if (poll_recv(static_cast<int>(timeout.count())) <= 0) {
            return std::nullopt;
        }
        packet = recv();
        if (!packet) {
            return std::nullopt;
        }
    }
    return Datagram{packet->from.to_string(), std::move(packet->data)};
}

void UdpSocket::log_error(int error_code, const char* context) {
    spdlog::warn("{}: {}", context, std::strerror(error_code));
}

}  // namespace radlink::transport
