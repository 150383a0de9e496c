#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "pixel_frame.hpp"
#include "radlink/common/error.hpp"
#include "radlink/packet/image_packet.hpp"

namespace radlink::frame {

// Slot lifecycle: FREE -> FILLING -> READY -> SENDING -> FREE.
// Any non-free slot may be forced back to FREE when it is reclaimed.
enum class SlotState : uint8_t {
    FREE,
    FILLING,
    READY,
    SENDING
};

const char* slot_state_to_string(SlotState state);

struct FrameReassemblerConfig {
    size_t num_slots = 4;
    size_t max_frame_bytes = 64 * 1024 * 1024;  // Larger FrameStarts are refused
};

struct ReassemblerStats {
    uint64_t packets_received{0};
    uint64_t frames_started{0};
    uint64_t frames_complete{0};
    uint64_t frames_partial{0};
    uint64_t frames_sent{0};        // Released by the consumer
    uint64_t drops{0};              // Oldest-wins reclamations
    uint64_t overruns{0};           // FrameStart arrived while a frame was filling
    uint64_t corrupted_lines{0};
    uint64_t duplicate_lines{0};
    uint64_t orphan_packets{0};     // Line or FrameEnd with no frame filling
    uint64_t rejected_packets{0};   // Bad CRC on markers, malformed payloads
    uint64_t stale_releases{0};     // release() after the slot was reclaimed
};

// Read-only handle to a frame moved to SENDING by acquire_ready()
struct ReadyFrame {
    size_t slot{0};
    uint64_t generation{0};
    std::shared_ptr<const PixelFrame> frame;
    uint32_t missing_lines{0};
    std::vector<uint32_t> corrupted_lines;
    bool partial{false};
};

// Consumes image packets into a fixed ring of frame buffers. The producer never
// blocks: when every slot is busy the least recently acquired one is reclaimed
// and counted as a drop.
class FrameReassembler {
public:
    explicit FrameReassembler(const FrameReassemblerConfig& config = {});

    // Feed one packet. Returns SUCCESS when the packet was applied or ignored as
    // a duplicate; INTEGRITY_MISMATCH for a damaged packet (damaged lines are
    // still stored and flagged); OUT_OF_ORDER_PACKET for packets that belong to
    // no filling frame; MALFORMED_HEADER or RESOURCE_EXHAUSTED otherwise.
    ErrorCode on_packet(const packet::ImagePacket& packet);

    // Oldest READY frame, now SENDING
    std::optional<ReadyFrame> acquire_ready();

    // SENDING -> FREE. False if the slot was reclaimed since acquire_ready().
    bool release(const ReadyFrame& handle);

    [[nodiscard]] std::vector<SlotState> slot_states() const;
    [[nodiscard]] ReassemblerStats stats() const;
    [[nodiscard]] uint64_t drop_count() const;
    [[nodiscard]] size_t num_slots() const { return config_.num_slots; }

    // Free every slot and clear statistics
    void reset();

private:
    enum class LineState : uint8_t { MISSING, VALID, CORRUPTED };

    struct Slot {
        SlotState state{SlotState::FREE};
        uint64_t generation{0};
        uint64_t sequence{0};  // Acquisition order
        std::shared_ptr<PixelFrame> frame;
        std::vector<LineState> lines;
        uint32_t missing_lines{0};
        std::vector<uint32_t> corrupted_lines;
        bool partial{false};
    };

    ErrorCode on_frame_start(const packet::ImagePacket& packet);
    ErrorCode on_line(const packet::ImagePacket& packet);
    ErrorCode on_frame_end(const packet::ImagePacket& packet);

    size_t claim_slot_locked();
    void close_filling_locked(bool saw_frame_end);

    FrameReassemblerConfig config_;
    mutable std::mutex mutex_;
    std::vector<Slot> slots_;
    std::optional<size_t> filling_;
    uint64_t next_sequence_{0};
    ReassemblerStats stats_;
};

}  // namespace radlink::frame
