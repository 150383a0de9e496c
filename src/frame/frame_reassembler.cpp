#include "radlink/frame/frame_reassembler.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace radlink::frame {

const char* slot_state_to_string(SlotState state) {
    switch (state) {
        case SlotState::FREE: return "FREE";
        case SlotState::FILLING: return "FILLING";
        case SlotState::READY: return "READY";
        case SlotState::SENDING: return "SENDING";
    }
    return "UNKNOWN";
}

FrameReassembler::FrameReassembler(const FrameReassemblerConfig& config)
    : config_(config), slots_(config.num_slots) {
    if (config.num_slots == 0) {
        throw std::invalid_argument("frame reassembler needs at least one slot");
    }
}

ErrorCode FrameReassembler::on_packet(const packet::ImagePacket& packet) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.packets_received;

    switch (packet.kind) {
        case packet::PacketKind::FRAME_START: return on_frame_start(packet);
        case packet::PacketKind::LINE_DATA: return on_line(packet);
        case packet::PacketKind::FRAME_END: return on_frame_end(packet);
    }
    ++stats_.rejected_packets;
    return ErrorCode::MALFORMED_HEADER;
}

ErrorCode FrameReassembler::on_frame_start(const packet::ImagePacket& packet) {
    // Dimensions of a damaged FrameStart cannot be trusted
    if (!packet::verify_integrity(packet)) {
        ++stats_.rejected_packets;
        spdlog::debug("FrameStart failed CRC, dropped");
        return ErrorCode::INTEGRITY_MISMATCH;
    }
    auto info = packet::decode_frame_start(packet);
    if (!info || info->bit_depth == 0 || info->bit_depth > MAX_BIT_DEPTH) {
        ++stats_.rejected_packets;
        return ErrorCode::MALFORMED_HEADER;
    }
    if (!frame_fits(info->rows, info->cols, config_.max_frame_bytes)) {
        ++stats_.rejected_packets;
        spdlog::warn("Frame {} ({}x{}) exceeds buffer limit", info->frame_number, info->rows,
                     info->cols);
        return ErrorCode::RESOURCE_EXHAUSTED;
    }

    if (filling_) {
        ++stats_.overruns;
        close_filling_locked(false);
    }

    size_t index = claim_slot_locked();
    auto& slot = slots_[index];

    // A consumer may still hold the previous buffer of this slot
    if (!slot.frame || slot.frame.use_count() > 1) {
        slot.frame = std::make_shared<PixelFrame>();
    }
    slot.frame->frame_number = info->frame_number;
    slot.frame->rows = info->rows;
    slot.frame->cols = info->cols;
    slot.frame->bit_depth = info->bit_depth;
    slot.frame->pixels.assign(static_cast<size_t>(info->rows) * info->cols, 0);

    slot.state = SlotState::FILLING;
    slot.lines.assign(info->rows, LineState::MISSING);
    slot.missing_lines = 0;
    slot.corrupted_lines.clear();
    slot.partial = false;

    filling_ = index;
    ++stats_.frames_started;
    return ErrorCode::SUCCESS;
}

ErrorCode FrameReassembler::on_line(const packet::ImagePacket& packet) {
    if (!filling_) {
        ++stats_.orphan_packets;
        return ErrorCode::OUT_OF_ORDER_PACKET;
    }
    auto& slot = slots_[*filling_];
    auto& frame = *slot.frame;

    auto line = packet::decode_line(packet);
    if (!line) {
        ++stats_.rejected_packets;
        return ErrorCode::MALFORMED_HEADER;
    }

    bool intact = packet::verify_integrity(packet);
    if (line->line_index >= frame.rows || line->samples.size() != frame.row_bytes()) {
        if (!intact) {
            // Damage landed in the index or length; nothing to place
            ++stats_.corrupted_lines;
            return ErrorCode::INTEGRITY_MISMATCH;
        }
        ++stats_.rejected_packets;
        return line->line_index >= frame.rows ? ErrorCode::OUT_OF_ORDER_PACKET
                                              : ErrorCode::MALFORMED_HEADER;
    }

    auto& state = slot.lines[line->line_index];
    if (!intact) {
        ++stats_.corrupted_lines;
        if (state == LineState::MISSING) {
            write_row(frame, line->line_index, line->samples);
            state = LineState::CORRUPTED;
        }
        return ErrorCode::INTEGRITY_MISMATCH;
    }

    if (state == LineState::VALID) {
        ++stats_.duplicate_lines;
        return ErrorCode::SUCCESS;
    }
    write_row(frame, line->line_index, line->samples);
    state = LineState::VALID;
    return ErrorCode::SUCCESS;
}

ErrorCode FrameReassembler::on_frame_end(const packet::ImagePacket& packet) {
    if (!filling_) {
        ++stats_.orphan_packets;
        return ErrorCode::OUT_OF_ORDER_PACKET;
    }
    if (!packet::verify_integrity(packet)) {
        // Left filling; the next FrameStart closes it as partial
        ++stats_.rejected_packets;
        return ErrorCode::INTEGRITY_MISMATCH;
    }
    auto frame_number = packet::decode_frame_end(packet);
    if (!frame_number) {
        ++stats_.rejected_packets;
        return ErrorCode::MALFORMED_HEADER;
    }
    if (*frame_number != slots_[*filling_].frame->frame_number) {
        ++stats_.orphan_packets;
        return ErrorCode::OUT_OF_ORDER_PACKET;
    }

    close_filling_locked(true);
    return ErrorCode::SUCCESS;
}

size_t FrameReassembler::claim_slot_locked() {
    for (size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].state == SlotState::FREE) {
            auto& slot = slots_[i];
            ++slot.generation;
            slot.sequence = next_sequence_++;
            return i;
        }
    }

    // Oldest-wins: reclaim the least recently acquired slot
    size_t oldest = 0;
    for (size_t i = 1; i < slots_.size(); ++i) {
        if (slots_[i].sequence < slots_[oldest].sequence) {
            oldest = i;
        }
    }

    auto& slot = slots_[oldest];
    spdlog::debug("Reclaiming slot {} ({}, frame {})", oldest, slot_state_to_string(slot.state),
                  slot.frame ? slot.frame->frame_number : 0);
    ++stats_.drops;
    slot.state = SlotState::FREE;
    ++slot.generation;
    slot.sequence = next_sequence_++;
    return oldest;
}

void FrameReassembler::close_filling_locked(bool saw_frame_end) {
    auto& slot = slots_[*filling_];
    filling_.reset();

    slot.missing_lines = 0;
    slot.corrupted_lines.clear();
    for (uint32_t i = 0; i < slot.lines.size(); ++i) {
        if (slot.lines[i] == LineState::MISSING) {
            ++slot.missing_lines;
        } else if (slot.lines[i] == LineState::CORRUPTED) {
            slot.corrupted_lines.push_back(i);
        }
    }
    slot.partial = !saw_frame_end || slot.missing_lines > 0 || !slot.corrupted_lines.empty();
    slot.state = SlotState::READY;

    if (slot.partial) {
        ++stats_.frames_partial;
    } else {
        ++stats_.frames_complete;
    }
}

std::optional<ReadyFrame> FrameReassembler::acquire_ready() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::optional<size_t> oldest;
    for (size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].state != SlotState::READY) {
            continue;
        }
        if (!oldest || slots_[i].sequence < slots_[*oldest].sequence) {
            oldest = i;
        }
    }
    if (!oldest) {
        return std::nullopt;
    }

    auto& slot = slots_[*oldest];
    slot.state = SlotState::SENDING;

    ReadyFrame handle;
    handle.slot = *oldest;
    handle.generation = slot.generation;
    handle.frame = slot.frame;
    handle.missing_lines = slot.missing_lines;
    handle.corrupted_lines = slot.corrupted_lines;
    handle.partial = slot.partial;
    return handle;
}

bool FrameReassembler::release(const ReadyFrame& handle) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (handle.slot >= slots_.size()) {
        ++stats_.stale_releases;
        return false;
    }
    auto& slot = slots_[handle.slot];
    if (slot.generation != handle.generation || slot.state != SlotState::SENDING) {
        ++stats_.stale_releases;
        return false;
    }

    slot.state = SlotState::FREE;
    ++stats_.frames_sent;
    return true;
}

std::vector<SlotState> FrameReassembler::slot_states() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SlotState> states;
    states.reserve(slots_.size());
    for (const auto& slot : slots_) {
        states.push_back(slot.state);
    }
    return states;
}

ReassemblerStats FrameReassembler::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

uint64_t FrameReassembler::drop_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_.drops;
}

void FrameReassembler::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
        slot.state = SlotState::FREE;
        ++slot.generation;
        slot.lines.clear();
        slot.corrupted_lines.clear();
        slot.missing_lines = 0;
        slot.partial = false;
    }
    filling_.reset();
    stats_ = ReassemblerStats{};
}

}  // namespace radlink::frame
