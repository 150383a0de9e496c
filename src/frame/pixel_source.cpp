#include "radlink/frame/pixel_source.hpp"

#include <stdexcept>

namespace radlink::frame {

CounterPatternSource::CounterPatternSource(uint32_t rows, uint32_t cols, uint8_t bit_depth,
                                           uint32_t first_frame_number)
    : rows_(rows), cols_(cols), bit_depth_(bit_depth), next_frame_number_(first_frame_number) {
    if (bit_depth == 0 || bit_depth > MAX_BIT_DEPTH) {
        throw std::invalid_argument("bit_depth must be in [1, 16]");
    }
}

PixelFrame CounterPatternSource::next_frame() {
    PixelFrame frame = make_blank_frame(next_frame_number_, rows_, cols_, bit_depth_);
    uint32_t mask = (1u << bit_depth_) - 1;
    for (size_t i = 0; i < frame.pixels.size(); ++i) {
        frame.pixels[i] = static_cast<uint16_t>((i + next_frame_number_) & mask);
    }
    ++next_frame_number_;
    ++frames_generated_;
    return frame;
}

}  // namespace radlink::frame
