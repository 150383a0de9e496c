#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "radlink/common/error.hpp"

namespace radlink::frame {

constexpr uint8_t MAX_BIT_DEPTH = 16;
constexpr size_t BYTES_PER_SAMPLE = 2;

// One detector frame, row-major, one u16 sample per pixel
struct PixelFrame {
    uint32_t frame_number{0};
    uint32_t rows{0};
    uint32_t cols{0};
    uint8_t bit_depth{16};
    std::vector<uint16_t> pixels;

    // Pixel count matches the dimensions and bit_depth is in [1, 16]
    [[nodiscard]] bool valid() const;

    [[nodiscard]] size_t row_bytes() const { return static_cast<size_t>(cols) * BYTES_PER_SAMPLE; }
    [[nodiscard]] size_t byte_size() const { return row_bytes() * rows; }

    bool operator==(const PixelFrame& other) const = default;
};

// True when rows * cols * 2 fits in max_bytes. Never overflows.
[[nodiscard]] bool frame_fits(uint32_t rows, uint32_t cols, size_t max_bytes);

// Frame sized for rows x cols with all samples zero
PixelFrame make_blank_frame(uint32_t frame_number, uint32_t rows, uint32_t cols,
                            uint8_t bit_depth = 16);

// Little-endian, 2 bytes per sample, row-major
std::vector<uint8_t> to_bytes(const PixelFrame& frame);

// Copy row bytes into row `row` of the frame
void write_row(PixelFrame& frame, uint32_t row, std::span<const uint8_t> row_bytes);

// Inverse of to_bytes. Fails with MALFORMED_HEADER when the byte count does not
// match rows * cols * 2.
std::optional<PixelFrame> from_bytes(std::span<const uint8_t> data,
                                     uint32_t frame_number,
                                     uint32_t rows,
                                     uint32_t cols,
                                     uint8_t bit_depth = 16,
                                     ErrorCode* error = nullptr);

}  // namespace radlink::frame
