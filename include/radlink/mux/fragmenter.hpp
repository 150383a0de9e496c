#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "fragment_header.hpp"
#include "radlink/frame/pixel_frame.hpp"

namespace radlink::mux {

struct FragmenterConfig {
    size_t max_payload = 8192;  // Bytes per fragment after the header
};

// Splits a frame into datagrams of at most FRAGMENT_HEADER_SIZE + max_payload
// bytes. Frame ids are drawn from a monotonic counter unless one is given.
class Fragmenter {
public:
    explicit Fragmenter(const FragmenterConfig& config = {});

    std::vector<std::vector<uint8_t>> fragment(const frame::PixelFrame& frame,
                                               uint64_t timestamp_ns);

    std::vector<std::vector<uint8_t>> fragment(const frame::PixelFrame& frame,
                                               uint32_t frame_id,
                                               uint64_t timestamp_ns) const;

    // max(1, ceil(frame_bytes / max_payload))
    static uint32_t fragment_count_for(size_t frame_bytes, size_t max_payload);

    [[nodiscard]] size_t max_payload() const { return config_.max_payload; }
    [[nodiscard]] uint32_t next_frame_id() const { return next_frame_id_.load(); }

private:
    FragmenterConfig config_;
    std::atomic<uint32_t> next_frame_id_{0};
};

}  // namespace radlink::mux
