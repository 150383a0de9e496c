#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "radlink/common/error.hpp"
#include "radlink/crypto/crypto.hpp"

namespace radlink::command {

// Command / response frame (little-endian):
// [magic: 4][sequence: 4][command_id | status: 2][payload_len: 2][mac: 32][payload]
// mac = HMAC-SHA256(key, bytes 0..11 || payload)
constexpr uint32_t COMMAND_MAGIC = 0xBEEFCAFE;
constexpr uint32_t RESPONSE_MAGIC = 0xCAFEBEEF;
constexpr size_t MAC_OFFSET = 12;
constexpr size_t FRAME_HEADER_SIZE = MAC_OFFSET + crypto::HMAC_SHA256_SIZE;  // 44
constexpr size_t MAX_COMMAND_PAYLOAD = 0xFFFF;

enum class CommandId : uint16_t {
    START_SCAN = 0x01,
    STOP_SCAN = 0x02,
    GET_STATUS = 0x10,
    SET_CONFIG = 0x20
};

enum class ResponseStatus : uint16_t {
    OK = 0x0000,
    ERROR = 0x0001,
    BUSY = 0x0002,
    INVALID_COMMAND = 0x0003
};

[[nodiscard]] bool is_known_command(uint16_t command_id);
const char* command_id_to_string(uint16_t command_id);
const char* response_status_to_string(ResponseStatus status);

struct CommandFrame {
    uint32_t sequence{0};
    uint16_t command_id{0};
    std::vector<uint8_t> payload;
    crypto::HmacDigest mac{};
};

struct ResponseFrame {
    uint32_t sequence{0};
    ResponseStatus status{ResponseStatus::OK};
    std::vector<uint8_t> payload;
    crypto::HmacDigest mac{};
};

// Signed encoders. Throw std::invalid_argument when the payload does not fit
// in payload_len.
std::vector<uint8_t> encode_command(std::span<const uint8_t> key,
                                    uint32_t sequence,
                                    uint16_t command_id,
                                    std::span<const uint8_t> payload);

std::vector<uint8_t> encode_response(std::span<const uint8_t> key,
                                     uint32_t sequence,
                                     ResponseStatus status,
                                     std::span<const uint8_t> payload);

// Magic of a buffer long enough to carry one
std::optional<uint32_t> peek_magic(std::span<const uint8_t> data);

// True when the buffer holds exactly one header plus payload_len bytes
[[nodiscard]] bool has_valid_length(std::span<const uint8_t> data);

// Structure-only decoders (length and magic, MALFORMED_HEADER on failure).
// The MAC is not checked; use verify_frame_mac.
std::optional<CommandFrame> decode_command(std::span<const uint8_t> data,
                                           ErrorCode* error = nullptr);
std::optional<ResponseFrame> decode_response(std::span<const uint8_t> data,
                                             ErrorCode* error = nullptr);

// Recompute the MAC of an encoded frame of either direction
[[nodiscard]] bool verify_frame_mac(std::span<const uint8_t> key, std::span<const uint8_t> data);

}  // namespace radlink::command
