#include "radlink/frame/pixel_frame.hpp"

#include <algorithm>

#include "radlink/codec/byte_order.hpp"

namespace radlink::frame {

bool PixelFrame::valid() const {
    if (bit_depth == 0 || bit_depth > MAX_BIT_DEPTH) {
        return false;
    }
    return pixels.size() == static_cast<size_t>(rows) * cols;
}

bool frame_fits(uint32_t rows, uint32_t cols, size_t max_bytes) {
    return cols == 0 || rows <= max_bytes / BYTES_PER_SAMPLE / cols;
}

PixelFrame make_blank_frame(uint32_t frame_number, uint32_t rows, uint32_t cols,
                            uint8_t bit_depth) {
    PixelFrame frame;
    frame.frame_number = frame_number;
    frame.rows = rows;
    frame.cols = cols;
    frame.bit_depth = bit_depth;
    frame.pixels.assign(static_cast<size_t>(rows) * cols, 0);
    return frame;
}

std::vector<uint8_t> to_bytes(const PixelFrame& frame) {
    std::vector<uint8_t> result;
    result.reserve(frame.pixels.size() * BYTES_PER_SAMPLE);
    for (uint16_t sample : frame.pixels) {
        codec::write_u16_le(result, sample);
    }
    return result;
}

void write_row(PixelFrame& frame, uint32_t row, std::span<const uint8_t> row_bytes) {
    size_t base = static_cast<size_t>(row) * frame.cols;
    size_t samples = std::min<size_t>(frame.cols, row_bytes.size() / BYTES_PER_SAMPLE);
    for (size_t c = 0; c < samples; ++c) {
        frame.pixels[base + c] = codec::read_u16_le(row_bytes.subspan(c * BYTES_PER_SAMPLE));
    }
}

std::optional<PixelFrame> from_bytes(std::span<const uint8_t> data,
                                     uint32_t frame_number,
                                     uint32_t rows,
                                     uint32_t cols,
                                     uint8_t bit_depth,
                                     ErrorCode* error) {
    if (!frame_fits(rows, cols, data.size()) ||
        data.size() != static_cast<size_t>(rows) * cols * BYTES_PER_SAMPLE || bit_depth == 0 || bit_depth > MAX_BIT_DEPTH) {
        if (error) *error = ErrorCode::MALFORMED_HEADER;
        return std::nullopt;
    }

    PixelFrame frame = make_blank_frame(frame_number, rows, cols, bit_depth);
    for (size_t i = 0; i < frame.pixels.size(); ++i) {
        frame.pixels[i] = codec::read_u16_le(data.subspan(i * BYTES_PER_SAMPLE));
    }

    if (error) *error = ErrorCode::SUCCESS;
    return frame;
}

}  // namespace radlink::frame
