#pragma once

#include <cstdint>

#include "pixel_frame.hpp"

namespace radlink::frame {

// Producer of detector frames
class PixelSource {
public:
    virtual ~PixelSource() = default;

    virtual PixelFrame next_frame() = 0;
};

// Deterministic test pattern: sample (r, c) of frame n is
// (r * cols + c + n) masked to bit_depth bits
class CounterPatternSource : public PixelSource {
public:
    CounterPatternSource(uint32_t rows, uint32_t cols, uint8_t bit_depth = 16,
                         uint32_t first_frame_number = 0);

    PixelFrame next_frame() override;

    [[nodiscard]] uint32_t frames_generated() const { return frames_generated_; }

private:
    uint32_t rows_;
    uint32_t cols_;
    uint8_t bit_depth_;
    uint32_t next_frame_number_;
    uint32_t frames_generated_{0};
};

}  // namespace radlink::frame
