#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <span>
#include <unordered_map>
#include <vector>

#include "fragment_header.hpp"
#include "radlink/common/error.hpp"

namespace radlink::mux {

// Configuration for fragment assembler
struct FragmentAssemblerConfig {
    size_t max_pending_frames = 64;               // Frames being assembled at once
    size_t max_fragments_per_frame = 65536;       // Upper bound on fragment_count
    size_t max_frame_bytes = 64 * 1024 * 1024;    // rows * cols * 2 upper bound
    uint64_t fragment_timeout_ms = 1000;          // Idle time before eviction
    size_t finished_history = 1024;               // Frame ids remembered after completion
};

// Complete frame rebuilt from its fragments
struct AssembledFrame {
    uint32_t frame_id{0};
    uint32_t rows{0};
    uint32_t cols{0};
    uint64_t timestamp_ns{0};
    std::vector<uint8_t> data;
};

// Frame evicted with fragments still missing
struct IncompleteFrame {
    uint32_t frame_id{0};
    uint32_t fragment_count{0};
    uint32_t received{0};
    std::vector<uint32_t> missing_indices;

    [[nodiscard]] uint32_t missing() const { return fragment_count - received; }
};

enum class FragmentStatus : uint8_t {
    ACCEPTED,   // Stored, frame still incomplete
    COMPLETED,  // Last missing fragment; frame delivered
    DUPLICATE,  // Index already held, or frame already completed
    STALE,      // Frame was already evicted
    REJECTED    // See the error code
};

const char* fragment_status_to_string(FragmentStatus status);

struct FragmentAssemblerStats {
    uint64_t datagrams_received{0};
    uint64_t fragments_accepted{0};
    uint64_t duplicates{0};
    uint64_t stale{0};
    uint64_t malformed{0};
    uint64_t header_crc_failures{0};
    uint64_t payload_crc_failures{0};
    uint64_t inconsistent{0};       // fragment_count or dimensions disagree
    uint64_t resource_rejections{0};
    uint64_t frames_completed{0};
    uint64_t frames_timed_out{0};
    size_t pending_frames{0};
};

// Rebuilds frames from datagram fragments arriving in any order. A frame whose
// fragments stop arriving is evicted by expire() once it has been idle for
// fragment_timeout_ms; nothing is retried.
class FragmentAssembler {
public:
    using AssembleCallback = std::function<void(AssembledFrame frame)>;

    explicit FragmentAssembler(const FragmentAssemblerConfig& config = {});

    // Set callback for when a frame is fully assembled. Invoked without any
    // internal lock held.
    void set_assemble_callback(AssembleCallback callback);

    // Add one datagram received at now_ms
    FragmentStatus add_datagram(std::span<const uint8_t> datagram,
                                uint64_t now_ms,
                                ErrorCode* error = nullptr);

    // Evict frames idle for longer than the timeout
    std::vector<IncompleteFrame> expire(uint64_t now_ms);

    [[nodiscard]] FragmentAssemblerStats stats() const;
    [[nodiscard]] size_t pending_frames() const;

    // Reset state
    void reset();

private:
    struct PendingFrame {
        uint32_t fragment_count{0};
        uint32_t rows{0};
        uint32_t cols{0};
        uint64_t timestamp_ns{0};
        size_t expected_bytes{0};
        size_t total_bytes{0};
        uint64_t last_activity_ms{0};
        std::map<uint32_t, std::vector<uint8_t>> fragments;
    };

    FragmentStatus reject(ErrorCode* error, ErrorCode code);
    void remember_finished_locked(uint32_t frame_id, bool completed);
    static AssembledFrame assemble(uint32_t frame_id, PendingFrame& pending);

    FragmentAssemblerConfig config_;
    mutable std::mutex mutex_;
    std::map<uint32_t, PendingFrame> pending_;
    AssembleCallback callback_;

    // Finished frame ids (true = completed, false = evicted), oldest first
    std::unordered_map<uint32_t, bool> finished_;
    std::deque<uint32_t> finished_order_;

    FragmentAssemblerStats stats_;
};

}  // namespace radlink::mux
