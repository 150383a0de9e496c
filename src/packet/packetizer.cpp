#include "radlink/packet/packetizer.hpp"

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace radlink::packet {

namespace {

std::optional<DepacketizeResult> fail(ErrorCode* error, size_t* offending_index,
                                      ErrorCode code, size_t index) {
    if (error) *error = code;
    if (offending_index) *offending_index = index;
    return std::nullopt;
}

}  // namespace

Packetizer::Packetizer(uint8_t virtual_channel) : virtual_channel_(virtual_channel) {
    if (virtual_channel > MAX_VIRTUAL_CHANNEL) {
        throw std::invalid_argument("virtual channel must be in [0, 3]");
    }
}

bool Packetizer::fits_line_packets(const frame::PixelFrame& frame) {
    return frame.valid() && LINE_INDEX_SIZE + frame.row_bytes() <= MAX_PACKET_PAYLOAD;
}

std::vector<ImagePacket> Packetizer::packetize(const frame::PixelFrame& frame) const {
    if (!frame.valid()) {
        throw std::invalid_argument("pixel count does not match frame dimensions");
    }
    if (LINE_INDEX_SIZE + frame.row_bytes() > MAX_PACKET_PAYLOAD) {
        throw std::invalid_argument("row too large for a single line packet");
    }

    std::vector<ImagePacket> packets;
    packets.reserve(static_cast<size_t>(frame.rows) + 2);

    packets.push_back(make_frame_start(virtual_channel_, FrameStartInfo{
        .frame_number = frame.frame_number,
        .rows = frame.rows,
        .cols = frame.cols,
        .bit_depth = frame.bit_depth}));

    auto bytes = frame::to_bytes(frame);
    std::span<const uint8_t> all(bytes);
    for (uint32_t row = 0; row < frame.rows; ++row) {
        packets.push_back(make_line(virtual_channel_, row,
                                    all.subspan(row * frame.row_bytes(), frame.row_bytes())));
    }

    packets.push_back(make_frame_end(virtual_channel_, frame.frame_number));
    return packets;
}

std::optional<DepacketizeResult> Packetizer::depacketize(std::span<const ImagePacket> packets,
                                                         ErrorCode* error,
                                                         size_t* offending_index) {
    if (packets.empty() || packets[0].kind != PacketKind::FRAME_START) {
        return fail(error, offending_index, ErrorCode::OUT_OF_ORDER_PACKET, 0);
    }

    const ImagePacket& start = packets[0];
    if (!verify_integrity(start)) {
        return fail(error, offending_index, ErrorCode::INTEGRITY_MISMATCH, 0);
    }
    auto info = decode_frame_start(start);
    if (!info || info->bit_depth == 0 || info->bit_depth > frame::MAX_BIT_DEPTH) {
        return fail(error, offending_index, ErrorCode::MALFORMED_HEADER, 0);
    }
    if (LINE_INDEX_SIZE + static_cast<size_t>(info->cols) * frame::BYTES_PER_SAMPLE >
        MAX_PACKET_PAYLOAD) {
        return fail(error, offending_index, ErrorCode::MALFORMED_HEADER, 0);
    }
    // Too few packets for the declared rows: either a marker arrived early or
    // the sequence was cut short. Decided before allocating the frame.
    if (static_cast<size_t>(info->rows) + 2 > packets.size()) {
        for (size_t i = 1; i < packets.size(); ++i) {
            if (packets[i].kind != PacketKind::LINE_DATA) {
                return fail(error, offending_index, ErrorCode::OUT_OF_ORDER_PACKET, i);
            }
        }
        return fail(error, offending_index, ErrorCode::INCOMPLETE_FRAME, packets.size());
    }

    DepacketizeResult result;
    result.frame = frame::make_blank_frame(info->frame_number, info->rows, info->cols,
                                           info->bit_depth);
    const size_t row_bytes = result.frame.row_bytes();

    size_t index = 1;
    for (uint32_t row = 0; row < info->rows; ++row, ++index) {
        if (index >= packets.size()) {
            return fail(error, offending_index, ErrorCode::INCOMPLETE_FRAME, index);
        }
        const ImagePacket& packet = packets[index];
        if (packet.kind != PacketKind::LINE_DATA ||
            packet.virtual_channel != start.virtual_channel) {
            return fail(error, offending_index, ErrorCode::OUT_OF_ORDER_PACKET, index);
        }

        if (!verify_integrity(packet)) {
            // Index bytes are covered by the CRC too, so the line is placed at
            // the position the sequence dictates
            spdlog::debug("Frame {}: line {} failed CRC", info->frame_number, row);
            if (packet.payload.size() > LINE_INDEX_SIZE) {
                std::span<const uint8_t> samples(packet.payload);
                samples = samples.subspan(LINE_INDEX_SIZE);
                frame::write_row(result.frame, row,
                                 samples.first(std::min(samples.size(), row_bytes)));
            }
            result.corrupted_lines.push_back(row);
            continue;
        }

        auto line = decode_line(packet);
        if (!line) {
            return fail(error, offending_index, ErrorCode::MALFORMED_HEADER, index);
        }
        if (line->line_index != row) {
            return fail(error, offending_index, ErrorCode::OUT_OF_ORDER_PACKET, index);
        }
        if (line->samples.size() != row_bytes) {
            return fail(error, offending_index, ErrorCode::MALFORMED_HEADER, index);
        }
        frame::write_row(result.frame, row, line->samples);
    }

    if (index >= packets.size()) {
        return fail(error, offending_index, ErrorCode::INCOMPLETE_FRAME, index);
    }
    const ImagePacket& end = packets[index];
    if (end.kind != PacketKind::FRAME_END || end.virtual_channel != start.virtual_channel) {
        return fail(error, offending_index, ErrorCode::OUT_OF_ORDER_PACKET, index);
    }
    if (!verify_integrity(end)) {
        return fail(error, offending_index, ErrorCode::INTEGRITY_MISMATCH, index);
    }
    auto end_number = decode_frame_end(end);
    if (!end_number) {
        return fail(error, offending_index, ErrorCode::MALFORMED_HEADER, index);
    }
    if (*end_number != info->frame_number) {
        return fail(error, offending_index, ErrorCode::OUT_OF_ORDER_PACKET, index);
    }
    if (index + 1 != packets.size()) {
        return fail(error, offending_index, ErrorCode::OUT_OF_ORDER_PACKET, index + 1);
    }

    if (error) *error = ErrorCode::SUCCESS;
    return result;
}

}  // namespace radlink::packet
