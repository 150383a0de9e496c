#include "radlink/packet/image_packet.hpp"

#include <stdexcept>

#include "radlink/codec/byte_order.hpp"
#include "radlink/codec/crc16.hpp"

namespace radlink::packet {

namespace {

bool known_kind(uint8_t value) {
    return value == static_cast<uint8_t>(PacketKind::FRAME_START) ||
           value == static_cast<uint8_t>(PacketKind::FRAME_END) ||
           value == static_cast<uint8_t>(PacketKind::LINE_DATA);
}

template <typename T>
std::optional<T> fail(ErrorCode* error, ErrorCode code) {
    if (error) *error = code;
    return std::nullopt;
}

}  // namespace

const char* packet_kind_to_string(PacketKind kind) {
    switch (kind) {
        case PacketKind::FRAME_START: return "FrameStart";
        case PacketKind::FRAME_END: return "FrameEnd";
        case PacketKind::LINE_DATA: return "LineData";
    }
    return "Unknown";
}

ImagePacket make_packet(PacketKind kind, uint8_t virtual_channel, std::vector<uint8_t> payload) {
    if (virtual_channel > MAX_VIRTUAL_CHANNEL) {
        throw std::invalid_argument("virtual channel must be in [0, 3]");
    }
    if (payload.size() > MAX_PACKET_PAYLOAD) {
        throw std::invalid_argument("packet payload exceeds 65535 bytes");
    }

    ImagePacket packet;
    packet.kind = kind;
    packet.virtual_channel = virtual_channel;
    packet.integrity = codec::crc16_ccitt(payload);
    packet.payload = std::move(payload);
    return packet;
}

ImagePacket make_frame_start(uint8_t virtual_channel, const FrameStartInfo& info) {
    std::vector<uint8_t> payload;
    payload.reserve(FRAME_START_PAYLOAD_SIZE);
    codec::write_u32_le(payload, info.frame_number);
    codec::write_u32_le(payload, info.rows);
    codec::write_u32_le(payload, info.cols);
    payload.push_back(info.bit_depth);
    return make_packet(PacketKind::FRAME_START, virtual_channel, std::move(payload));
}

ImagePacket make_line(uint8_t virtual_channel, uint32_t line_index,
                      std::span<const uint8_t> row_bytes) {
    std::vector<uint8_t> payload;
    payload.reserve(LINE_INDEX_SIZE + row_bytes.size());
    codec::write_u32_le(payload, line_index);
    payload.insert(payload.end(), row_bytes.begin(), row_bytes.end());
    return make_packet(PacketKind::LINE_DATA, virtual_channel, std::move(payload));
}

ImagePacket make_frame_end(uint8_t virtual_channel, uint32_t frame_number) {
    std::vector<uint8_t> payload;
    payload.reserve(FRAME_END_PAYLOAD_SIZE);
    codec::write_u32_le(payload, frame_number);
    return make_packet(PacketKind::FRAME_END, virtual_channel, std::move(payload));
}

bool verify_integrity(const ImagePacket& packet) {
    return codec::crc16_verify(packet.payload, packet.integrity);
}

std::vector<uint8_t> serialize_packet(const ImagePacket& packet) {
    std::vector<uint8_t> result;
    result.reserve(PACKET_OVERHEAD + packet.payload.size());
    result.push_back(static_cast<uint8_t>(packet.kind));
    result.push_back(packet.virtual_channel);
    codec::write_u16_le(result, static_cast<uint16_t>(packet.payload.size()));
    result.insert(result.end(), packet.payload.begin(), packet.payload.end());
    codec::write_u16_le(result, packet.integrity);
    return result;
}

std::optional<ImagePacket> parse_packet(std::span<const uint8_t> data,
                                        ErrorCode* error,
                                        size_t* consumed) {
    if (data.size() < PACKET_OVERHEAD) {
        return fail<ImagePacket>(error, ErrorCode::MALFORMED_HEADER);
    }
    if (!known_kind(data[0]) || data[1] > MAX_VIRTUAL_CHANNEL) {
        return fail<ImagePacket>(error, ErrorCode::MALFORMED_HEADER);
    }

    uint16_t payload_len = codec::read_u16_le(data.subspan(2));
    size_t total = PACKET_OVERHEAD + payload_len;
    if (data.size() < total) {
        return fail<ImagePacket>(error, ErrorCode::MALFORMED_HEADER);
    }

    ImagePacket packet;
    packet.kind = static_cast<PacketKind>(data[0]);
    packet.virtual_channel = data[1];
    auto payload = data.subspan(PACKET_HEADER_SIZE, payload_len);
    packet.payload.assign(payload.begin(), payload.end());
    packet.integrity = codec::read_u16_le(data.subspan(PACKET_HEADER_SIZE + payload_len));

    if (consumed) *consumed = total;
    if (error) *error = ErrorCode::SUCCESS;
    return packet;
}

std::optional<std::vector<ImagePacket>> parse_packet_stream(std::span<const uint8_t> data,
                                                            ErrorCode* error) {
    std::vector<ImagePacket> packets;
    size_t offset = 0;
    while (offset < data.size()) {
        size_t consumed = 0;
        auto packet = parse_packet(data.subspan(offset), error, &consumed);
        if (!packet) {
            return std::nullopt;
        }
        packets.push_back(std::move(*packet));
        offset += consumed;
    }
    if (error) *error = ErrorCode::SUCCESS;
    return packets;
}

std::optional<FrameStartInfo> decode_frame_start(const ImagePacket& packet, ErrorCode* error) {
    if (packet.kind != PacketKind::FRAME_START ||
        packet.payload.size() != FRAME_START_PAYLOAD_SIZE) {
        return fail<FrameStartInfo>(error, ErrorCode::MALFORMED_HEADER);
    }

    std::span<const uint8_t> p = packet.payload;
    FrameStartInfo info;
    info.frame_number = codec::read_u32_le(p);
    info.rows = codec::read_u32_le(p.subspan(4));
    info.cols = codec::read_u32_le(p.subspan(8));
    info.bit_depth = p[12];

    if (error) *error = ErrorCode::SUCCESS;
    return info;
}

std::optional<LineView> decode_line(const ImagePacket& packet, ErrorCode* error) {
    if (packet.kind != PacketKind::LINE_DATA || packet.payload.size() < LINE_INDEX_SIZE) {
        return fail<LineView>(error, ErrorCode::MALFORMED_HEADER);
    }

    std::span<const uint8_t> p = packet.payload;
    LineView view;
    view.line_index = codec::read_u32_le(p);
    view.samples = p.subspan(LINE_INDEX_SIZE);

    if (error) *error = ErrorCode::SUCCESS;
    return view;
}

std::optional<uint32_t> decode_frame_end(const ImagePacket& packet, ErrorCode* error) {
    if (packet.kind != PacketKind::FRAME_END || packet.payload.size() != FRAME_END_PAYLOAD_SIZE) {
        return fail<uint32_t>(error, ErrorCode::MALFORMED_HEADER);
    }
    if (error) *error = ErrorCode::SUCCESS;
    return codec::read_u32_le(packet.payload);
}

}  // namespace radlink::packet
