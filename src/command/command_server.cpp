#include "radlink/command/command_server.hpp"

#include <spdlog/spdlog.h>

namespace radlink::command {

CommandServer::CommandServer(transport::DatagramTransport& transport, CommandProcessor& processor)
    : transport_(transport), processor_(processor) {
}

bool CommandServer::poll_once(std::chrono::milliseconds timeout) {
    auto datagram = transport_.receive(timeout);
    if (!datagram) {
        return false;
    }
    ++datagrams_received_;

    auto response = processor_.process(datagram->data, datagram->peer);
    if (!response) {
        return true;
    }

    if (transport_.send_to(datagram->peer, *response)) {
        ++responses_sent_;
    } else {
        ++send_failures_;
        spdlog::warn("Failed to send response to {}", datagram->peer);
    }
    return true;
}

void CommandServer::run(const std::atomic<bool>& running, std::chrono::milliseconds poll_interval) {
    spdlog::info("Command server started");
    while (running.load()) {
        poll_once(poll_interval);
    }
    spdlog::info("Command server stopped ({} datagrams, {} responses)",
                 datagrams_received_.load(), responses_sent_.load());
}

}  // namespace radlink::command
