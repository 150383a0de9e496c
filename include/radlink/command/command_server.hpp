#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "command_processor.hpp"
#include "radlink/transport/datagram_transport.hpp"

namespace radlink::command {

// Pumps datagrams from a transport through a CommandProcessor and sends back
// whatever response it produces. Neither the transport nor the processor is
// owned.
class CommandServer {
public:
    CommandServer(transport::DatagramTransport& transport, CommandProcessor& processor);

    // Wait up to timeout for one datagram and handle it.
    // Returns true if a datagram was received.
    bool poll_once(std::chrono::milliseconds timeout);

    // Loop until running becomes false
    void run(const std::atomic<bool>& running,
             std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));

    [[nodiscard]] uint64_t datagrams_received() const { return datagrams_received_; }
    [[nodiscard]] uint64_t responses_sent() const { return responses_sent_; }
    [[nodiscard]] uint64_t send_failures() const { return send_failures_; }

private:
    transport::DatagramTransport& transport_;
    CommandProcessor& processor_;

    std::atomic<uint64_t> datagrams_received_{0};
    std::atomic<uint64_t> responses_sent_{0};
    std::atomic<uint64_t> send_failures_{0};
};

}  // namespace radlink::command
