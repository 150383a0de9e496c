#pragma once

#include <optional>
#include <span>
#include <vector>

#include "image_packet.hpp"
#include "radlink/frame/pixel_frame.hpp"

namespace radlink::packet {

// Frame rebuilt from a packet sequence. Lines whose CRC failed are kept in
// place and listed in corrupted_lines.
struct DepacketizeResult {
    frame::PixelFrame frame;
    std::vector<uint32_t> corrupted_lines;

    [[nodiscard]] bool intact() const { return corrupted_lines.empty(); }
};

// Splits frames into FrameStart / LineData x rows / FrameEnd on one virtual
// channel, and rebuilds them from a strictly ordered sequence.
class Packetizer {
public:
    explicit Packetizer(uint8_t virtual_channel = 0);

    // Frame is valid and every row fits in one LineData payload
    [[nodiscard]] static bool fits_line_packets(const frame::PixelFrame& frame);

    // Throws std::invalid_argument for an invalid frame or a row that would not
    // fit in a 16-bit payload length
    [[nodiscard]] std::vector<ImagePacket> packetize(const frame::PixelFrame& frame) const;

    // Strict inverse of packetize. On failure `error` holds the cause and
    // `offending_index` the position of the packet that caused it:
    //   OUT_OF_ORDER_PACKET  wrong kind, line index or channel, or trailing packets
    //   INTEGRITY_MISMATCH   FrameStart or FrameEnd CRC failed
    //   MALFORMED_HEADER     undecodable payload on a packet whose CRC is good
    //   INCOMPLETE_FRAME     sequence ends before FrameEnd
    static std::optional<DepacketizeResult> depacketize(std::span<const ImagePacket> packets,
                                                        ErrorCode* error = nullptr,
                                                        size_t* offending_index = nullptr);

    [[nodiscard]] uint8_t virtual_channel() const { return virtual_channel_; }

private:
    uint8_t virtual_channel_;
};

}  // namespace radlink::packet
