#include "radlink/mux/fragmenter.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace radlink::mux {

Fragmenter::Fragmenter(const FragmenterConfig& config) : config_(config) {
    if (config.max_payload == 0) {
        throw std::invalid_argument("max_payload must be positive");
    }
}

uint32_t Fragmenter::fragment_count_for(size_t frame_bytes, size_t max_payload) {
    if (max_payload == 0) {
        throw std::invalid_argument("max_payload must be positive");
    }
    size_t count = (frame_bytes + max_payload - 1) / max_payload;
    count = std::max<size_t>(1, count);
    if (count > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("frame needs more than 2^32 fragments");
    }
    return static_cast<uint32_t>(count);
}

std::vector<std::vector<uint8_t>> Fragmenter::fragment(const frame::PixelFrame& frame,
                                                       uint64_t timestamp_ns) {
    return fragment(frame, next_frame_id_.fetch_add(1), timestamp_ns);
}

std::vector<std::vector<uint8_t>> Fragmenter::fragment(const frame::PixelFrame& frame,
                                                       uint32_t frame_id,
                                                       uint64_t timestamp_ns) const {
    if (!frame.valid()) {
        throw std::invalid_argument("pixel count does not match frame dimensions");
    }

    auto bytes = frame::to_bytes(frame);
    std::span<const uint8_t> data(bytes);
    uint32_t count = fragment_count_for(data.size(), config_.max_payload);

    FragmentHeader header;
    header.frame_id = frame_id;
    header.fragment_count = count;
    header.timestamp_ns = timestamp_ns;
    header.rows = frame.rows;
    header.cols = frame.cols;

    std::vector<std::vector<uint8_t>> datagrams;
    datagrams.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        size_t offset = static_cast<size_t>(i) * config_.max_payload;
        size_t length = std::min(config_.max_payload, data.size() - offset);
        header.fragment_index = i;
        datagrams.push_back(serialize_fragment(header, data.subspan(offset, length)));
    }
    return datagrams;
}

}  // namespace radlink::mux
