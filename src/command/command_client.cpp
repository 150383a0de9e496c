#include "radlink/command/command_client.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

#include "radlink/utils/time.hpp"

namespace radlink::command {

CommandClient::CommandClient(crypto::SecretProvider secret, uint32_t first_sequence)
    : secret_(std::move(secret)), next_sequence_(first_sequence) {
    if (!secret_) {
        throw std::invalid_argument("command client needs a secret provider");
    }
    if (first_sequence == 0) {
        throw std::invalid_argument("sequence 0 is never accepted");
    }
}

std::vector<uint8_t> CommandClient::build_command(CommandId id, std::span<const uint8_t> payload,
                                                  uint32_t* sequence) {
    uint32_t assigned = next_sequence_.fetch_add(1);
    if (sequence) *sequence = assigned;

    std::vector<uint8_t> key = secret_();
    auto frame = encode_command(key, assigned, static_cast<uint16_t>(id), payload);
    crypto::secure_zero(key.data(), key.size());
    return frame;
}

std::optional<ResponseFrame> CommandClient::parse_response(std::span<const uint8_t> datagram,
                                                           uint32_t sequence,
                                                           ErrorCode* error) const {
    auto response = decode_response(datagram, error);
    if (!response) {
        return std::nullopt;
    }

    std::vector<uint8_t> key = secret_();
    bool authentic = verify_frame_mac(key, datagram);
    crypto::secure_zero(key.data(), key.size());
    if (!authentic) {
        if (error) *error = ErrorCode::INTEGRITY_MISMATCH;
        return std::nullopt;
    }

    if (response->sequence != sequence) {
        if (error) *error = ErrorCode::REPLAY_REJECTED;
        return std::nullopt;
    }

    if (error) *error = ErrorCode::SUCCESS;
    return response;
}

std::optional<ResponseFrame> CommandClient::request(transport::DatagramTransport& transport,
                                                    const std::string& peer,
                                                    CommandId id,
                                                    std::span<const uint8_t> payload,
                                                    std::chrono::milliseconds timeout,
                                                    ErrorCode* error) {
    uint32_t sequence = 0;
    auto frame = build_command(id, payload, &sequence);
    if (!transport.send_to(peer, frame)) {
        spdlog::warn("Failed to send {} to {}", command_id_to_string(static_cast<uint16_t>(id)),
                     peer);
        if (error) *error = ErrorCode::RESOURCE_EXHAUSTED;
        return std::nullopt;
    }

    utils::Timer timer;
    ErrorCode last_error = ErrorCode::INCOMPLETE_FRAME;
    while (timer.elapsed() < timeout) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            timeout - timer.elapsed());
        auto datagram = transport.receive(remaining);
        if (!datagram) {
            continue;
        }
        if (datagram->peer != peer) {
            continue;
        }
        auto response = parse_response(datagram->data, sequence, &last_error);
        if (response) {
            if (error) *error = ErrorCode::SUCCESS;
            return response;
        }
        spdlog::debug("Ignoring response from {}: {}", peer, error_to_string(last_error));
    }

    if (error) *error = last_error;
    return std::nullopt;
}

}  // namespace radlink::command
