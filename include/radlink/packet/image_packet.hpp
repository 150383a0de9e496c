#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "radlink/common/error.hpp"

namespace radlink::packet {

// Packet kinds use the CSI-2 data-type codes
enum class PacketKind : uint8_t {
    FRAME_START = 0x00,
    FRAME_END = 0x01,
    LINE_DATA = 0x2E  // RAW16
};

// Wire layout:
// [kind: 1][virtual_channel: 1][payload_len: 2][payload][crc16: 2]
constexpr size_t PACKET_HEADER_SIZE = 4;
constexpr size_t PACKET_TRAILER_SIZE = 2;
constexpr size_t PACKET_OVERHEAD = PACKET_HEADER_SIZE + PACKET_TRAILER_SIZE;
constexpr size_t MAX_PACKET_PAYLOAD = 0xFFFF;
constexpr uint8_t MAX_VIRTUAL_CHANNEL = 3;

// Payload sizes
constexpr size_t FRAME_START_PAYLOAD_SIZE = 13;  // frame_number(4) rows(4) cols(4) bit_depth(1)
constexpr size_t LINE_INDEX_SIZE = 4;
constexpr size_t FRAME_END_PAYLOAD_SIZE = 4;     // frame_number(4)

struct ImagePacket {
    PacketKind kind{PacketKind::FRAME_START};
    uint8_t virtual_channel{0};
    std::vector<uint8_t> payload;
    uint16_t integrity{0};  // CRC-16 of payload
};

struct FrameStartInfo {
    uint32_t frame_number{0};
    uint32_t rows{0};
    uint32_t cols{0};
    uint8_t bit_depth{16};
};

// Line index plus a view of the row bytes inside the packet payload
struct LineView {
    uint32_t line_index{0};
    std::span<const uint8_t> samples;
};

const char* packet_kind_to_string(PacketKind kind);

// Build a packet and stamp its CRC. Throws std::invalid_argument if the
// payload does not fit in 16 bits or the channel is out of range.
ImagePacket make_packet(PacketKind kind, uint8_t virtual_channel, std::vector<uint8_t> payload);

ImagePacket make_frame_start(uint8_t virtual_channel, const FrameStartInfo& info);
ImagePacket make_line(uint8_t virtual_channel, uint32_t line_index,
                      std::span<const uint8_t> row_bytes);
ImagePacket make_frame_end(uint8_t virtual_channel, uint32_t frame_number);

// True if the stored CRC matches the payload
[[nodiscard]] bool verify_integrity(const ImagePacket& packet);

std::vector<uint8_t> serialize_packet(const ImagePacket& packet);

// Parse one packet from the front of data. Structure only: the CRC is carried
// through unchecked so that a damaged line can still be placed. `consumed`
// receives the number of bytes taken.
std::optional<ImagePacket> parse_packet(std::span<const uint8_t> data,
                                        ErrorCode* error = nullptr,
                                        size_t* consumed = nullptr);

// Parse a back-to-back sequence of packets; stops at the first malformed one
std::optional<std::vector<ImagePacket>> parse_packet_stream(std::span<const uint8_t> data,
                                                            ErrorCode* error = nullptr);

// Payload decoders; MALFORMED_HEADER on wrong kind or size
std::optional<FrameStartInfo> decode_frame_start(const ImagePacket& packet,
                                                 ErrorCode* error = nullptr);
std::optional<LineView> decode_line(const ImagePacket& packet, ErrorCode* error = nullptr);
std::optional<uint32_t> decode_frame_end(const ImagePacket& packet, ErrorCode* error = nullptr);

}  // namespace radlink::packet
