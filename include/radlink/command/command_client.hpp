#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "command_frame.hpp"
#include "radlink/common/error.hpp"
#include "radlink/crypto/hmac.hpp"
#include "radlink/transport/datagram_transport.hpp"

namespace radlink::command {

// Host side of the command channel: numbers and signs commands, checks the
// responses that come back.
class CommandClient {
public:
    explicit CommandClient(crypto::SecretProvider secret, uint32_t first_sequence = 1);

    // Signed command carrying the next sequence number, which is also written
    // to `sequence` when given
    std::vector<uint8_t> build_command(CommandId id, std::span<const uint8_t> payload = {},
                                       uint32_t* sequence = nullptr);

    // Validate a response to `sequence`:
    //   MALFORMED_HEADER    bad length or magic
    //   INTEGRITY_MISMATCH  MAC does not verify
    //   REPLAY_REJECTED     sequence is not the one expected
    std::optional<ResponseFrame> parse_response(std::span<const uint8_t> datagram,
                                                uint32_t sequence,
                                                ErrorCode* error = nullptr) const;

    // Send a command and wait for its response. Datagrams that fail
    // validation are skipped until the timeout expires. A send failure reports
    // RESOURCE_EXHAUSTED; silence reports INCOMPLETE_FRAME unless an invalid
    // response was seen.
    std::optional<ResponseFrame> request(transport::DatagramTransport& transport,
                                         const std::string& peer,
                                         CommandId id,
                                         std::span<const uint8_t> payload,
                                         std::chrono::milliseconds timeout,
                                         ErrorCode* error = nullptr);

    [[nodiscard]] uint32_t next_sequence() const { return next_sequence_.load(); }

private:
    crypto::SecretProvider secret_;
    std::atomic<uint32_t> next_sequence_;
};

}  // namespace radlink::command
