#include "radlink/command/command_frame.hpp"

#include <algorithm>
#include <stdexcept>

#include "radlink/codec/byte_order.hpp"
#include "radlink/crypto/hmac.hpp"

namespace radlink::command {

namespace {

std::vector<uint8_t> encode_frame(std::span<const uint8_t> key,
                                  uint32_t magic,
                                  uint32_t sequence,
                                  uint16_t code,
                                  std::span<const uint8_t> payload) {
    if (payload.size() > MAX_COMMAND_PAYLOAD) {
        throw std::invalid_argument("command payload exceeds 65535 bytes");
    }

    std::vector<uint8_t> frame;
    frame.reserve(FRAME_HEADER_SIZE + payload.size());
    codec::write_u32_le(frame, magic);
    codec::write_u32_le(frame, sequence);
    codec::write_u16_le(frame, code);
    codec::write_u16_le(frame, static_cast<uint16_t>(payload.size()));

    auto mac = crypto::sign(key, std::span<const uint8_t>(frame), payload);
    frame.insert(frame.end(), mac.begin(), mac.end());
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

struct RawFrame {
    uint32_t sequence;
    uint16_t code;
    std::span<const uint8_t> mac;
    std::span<const uint8_t> payload;
};

std::optional<RawFrame> decode_frame(std::span<const uint8_t> data,
                                     uint32_t expected_magic,
                                     ErrorCode* error) {
    if (!has_valid_length(data) || codec::read_u32_le(data) != expected_magic) {
        if (error) *error = ErrorCode::MALFORMED_HEADER;
        return std::nullopt;
    }

    RawFrame raw;
    raw.sequence = codec::read_u32_le(data.subspan(4));
    raw.code = codec::read_u16_le(data.subspan(8));
    raw.mac = data.subspan(MAC_OFFSET, crypto::HMAC_SHA256_SIZE);
    raw.payload = data.subspan(FRAME_HEADER_SIZE);

    if (error) *error = ErrorCode::SUCCESS;
    return raw;
}

}  // namespace

bool is_known_command(uint16_t command_id) {
    switch (static_cast<CommandId>(command_id)) {
        case CommandId::START_SCAN:
        case CommandId::STOP_SCAN:
        case CommandId::GET_STATUS:
        case CommandId::SET_CONFIG:
            return true;
    }
    return false;
}

const char* command_id_to_string(uint16_t command_id) {
    switch (static_cast<CommandId>(command_id)) {
        case CommandId::START_SCAN: return "START_SCAN";
        case CommandId::STOP_SCAN: return "STOP_SCAN";
        case CommandId::GET_STATUS: return "GET_STATUS";
        case CommandId::SET_CONFIG: return "SET_CONFIG";
    }
    return "UNKNOWN";
}

const char* response_status_to_string(ResponseStatus status) {
    switch (status) {
        case ResponseStatus::OK: return "OK";
        case ResponseStatus::ERROR: return "ERROR";
        case ResponseStatus::BUSY: return "BUSY";
        case ResponseStatus::INVALID_COMMAND: return "INVALID_COMMAND";
    }
    return "UNKNOWN";
}

std::vector<uint8_t> encode_command(std::span<const uint8_t> key,
                                    uint32_t sequence,
                                    uint16_t command_id,
                                    std::span<const uint8_t> payload) {
    return encode_frame(key, COMMAND_MAGIC, sequence, command_id, payload);
}

std::vector<uint8_t> encode_response(std::span<const uint8_t> key,
                                     uint32_t sequence,
                                     ResponseStatus status,
                                     std::span<const uint8_t> payload) {
    return encode_frame(key, RESPONSE_MAGIC, sequence, static_cast<uint16_t>(status), payload);
}

std::optional<uint32_t> peek_magic(std::span<const uint8_t> data) {
    if (data.size() < sizeof(uint32_t)) {
        return std::nullopt;
    }
    return codec::read_u32_le(data);
}

bool has_valid_length(std::span<const uint8_t> data) {
    if (data.size() < FRAME_HEADER_SIZE) {
        return false;
    }
    uint16_t payload_len = codec::read_u16_le(data.subspan(10));
    return data.size() == FRAME_HEADER_SIZE + payload_len;
}

std::optional<CommandFrame> decode_command(std::span<const uint8_t> data, ErrorCode* error) {
    auto raw = decode_frame(data, COMMAND_MAGIC, error);
    if (!raw) {
        return std::nullopt;
    }

    CommandFrame frame;
    frame.sequence = raw->sequence;
    frame.command_id = raw->code;
    frame.payload.assign(raw->payload.begin(), raw->payload.end());
    std::copy(raw->mac.begin(), raw->mac.end(), frame.mac.begin());
    return frame;
}

std::optional<ResponseFrame> decode_response(std::span<const uint8_t> data, ErrorCode* error) {
    auto raw = decode_frame(data, RESPONSE_MAGIC, error);
    if (!raw) {
        return std::nullopt;
    }

    ResponseFrame frame;
    frame.sequence = raw->sequence;
    frame.status = static_cast<ResponseStatus>(raw->code);
    frame.payload.assign(raw->payload.begin(), raw->payload.end());
    std::copy(raw->mac.begin(), raw->mac.end(), frame.mac.begin());
    return frame;
}

bool verify_frame_mac(std::span<const uint8_t> key, std::span<const uint8_t> data) {
    if (data.size() < FRAME_HEADER_SIZE) {
        return false;
    }
    return crypto::verify(key, data.first(MAC_OFFSET), data.subspan(FRAME_HEADER_SIZE),
                          data.subspan(MAC_OFFSET, crypto::HMAC_SHA256_SIZE));
}

}  // namespace radlink::command
