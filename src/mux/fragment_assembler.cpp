#include "radlink/mux/fragment_assembler.hpp"

#include <optional>

#include <spdlog/spdlog.h>

#include "radlink/codec/crc16.hpp"
#include "radlink/frame/pixel_frame.hpp"

namespace radlink::mux {

const char* fragment_status_to_string(FragmentStatus status) {
    switch (status) {
        case FragmentStatus::ACCEPTED: return "accepted";
        case FragmentStatus::COMPLETED: return "completed";
        case FragmentStatus::DUPLICATE: return "duplicate";
        case FragmentStatus::STALE: return "stale";
        case FragmentStatus::REJECTED: return "rejected";
    }
    return "unknown";
}

FragmentAssembler::FragmentAssembler(const FragmentAssemblerConfig& config)
    : config_(config) {
}

void FragmentAssembler::set_assemble_callback(AssembleCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

FragmentStatus FragmentAssembler::reject(ErrorCode* error, ErrorCode code) {
    if (error) *error = code;
    return FragmentStatus::REJECTED;
}

FragmentStatus FragmentAssembler::add_datagram(std::span<const uint8_t> datagram,
                                               uint64_t now_ms,
                                               ErrorCode* error) {
    std::optional<AssembledFrame> completed;
    AssembleCallback callback;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.datagrams_received;

        ErrorCode parse_error = ErrorCode::SUCCESS;
        auto header = parse_fragment_header(datagram, &parse_error);
        if (!header) {
            if (parse_error == ErrorCode::INTEGRITY_MISMATCH) {
                ++stats_.header_crc_failures;
            } else {
                ++stats_.malformed;
            }
            spdlog::debug("Fragment dropped: {}", error_to_string(parse_error));
            return reject(error, parse_error);
        }

        auto payload = datagram.subspan(FRAGMENT_HEADER_SIZE);
        if (!codec::crc16_verify(payload, header->payload_crc16)) {
            ++stats_.payload_crc_failures;
            spdlog::debug("Fragment {}/{} of frame {} failed payload CRC",
                          header->fragment_index, header->fragment_count, header->frame_id);
            return reject(error, ErrorCode::INTEGRITY_MISMATCH);
        }

        if (auto done = finished_.find(header->frame_id); done != finished_.end()) {
            if (error) *error = ErrorCode::SUCCESS;
            if (done->second) {
                ++stats_.duplicates;
                return FragmentStatus::DUPLICATE;
            }
            ++stats_.stale;
            return FragmentStatus::STALE;
        }

        auto it = pending_.find(header->frame_id);
        if (it == pending_.end()) {
            if (header->fragment_count > config_.max_fragments_per_frame ||
                !frame::frame_fits(header->rows, header->cols, config_.max_frame_bytes)) {
                ++stats_.resource_rejections;
                return reject(error, ErrorCode::RESOURCE_EXHAUSTED);
            }
            if (pending_.size() >= config_.max_pending_frames) {
                ++stats_.resource_rejections;
                spdlog::warn("Fragment assembler full ({} frames), dropping frame {}",
                             pending_.size(), header->frame_id);
                return reject(error, ErrorCode::RESOURCE_EXHAUSTED);
            }

            PendingFrame frame;
            frame.fragment_count = header->fragment_count;
            frame.rows = header->rows;
            frame.cols = header->cols;
            frame.timestamp_ns = header->timestamp_ns;
            frame.expected_bytes =
                static_cast<size_t>(header->rows) * header->cols * frame::BYTES_PER_SAMPLE;
            frame.last_activity_ms = now_ms;
            it = pending_.emplace(header->frame_id, std::move(frame)).first;
        }

        auto& frame = it->second;

        // All fragments of a frame must agree on count and dimensions
        if (frame.fragment_count != header->fragment_count || frame.rows != header->rows ||
            frame.cols != header->cols) {
            ++stats_.inconsistent;
            return reject(error, ErrorCode::MALFORMED_HEADER);
        }

        if (frame.fragments.count(header->fragment_index) > 0) {
            ++stats_.duplicates;
            if (error) *error = ErrorCode::SUCCESS;
            return FragmentStatus::DUPLICATE;
        }

        if (frame.total_bytes + payload.size() > frame.expected_bytes) {
            ++stats_.inconsistent;
            return reject(error, ErrorCode::MALFORMED_HEADER);
        }

        frame.fragments[header->fragment_index] =
            std::vector<uint8_t>(payload.begin(), payload.end());
        frame.total_bytes += payload.size();
        frame.last_activity_ms = now_ms;
        ++stats_.fragments_accepted;

        if (error) *error = ErrorCode::SUCCESS;
        if (frame.fragments.size() < frame.fragment_count) {
            return FragmentStatus::ACCEPTED;
        }

        if (frame.total_bytes != frame.expected_bytes) {
            // Every index is present but the sizes do not add up to rows x cols
            ++stats_.inconsistent;
            pending_.erase(it);
            remember_finished_locked(header->frame_id, false);
            return reject(error, ErrorCode::MALFORMED_HEADER);
        }

        completed = assemble(header->frame_id, frame);
        pending_.erase(it);
        remember_finished_locked(header->frame_id, true);
        ++stats_.frames_completed;
        callback = callback_;
    }

    if (callback) {
        callback(std::move(*completed));
    }
    return FragmentStatus::COMPLETED;
}

AssembledFrame FragmentAssembler::assemble(uint32_t frame_id, PendingFrame& pending) {
    AssembledFrame result;
    result.frame_id = frame_id;
    result.rows = pending.rows;
    result.cols = pending.cols;
    result.timestamp_ns = pending.timestamp_ns;
    result.data.reserve(pending.total_bytes);

    // std::map iterates in fragment index order
    for (auto& [index, bytes] : pending.fragments) {
        result.data.insert(result.data.end(), bytes.begin(), bytes.end());
    }
    return result;
}

void FragmentAssembler::remember_finished_locked(uint32_t frame_id, bool completed) {
    if (config_.finished_history == 0) {
        return;
    }
    if (finished_.emplace(frame_id, completed).second) {
        finished_order_.push_back(frame_id);
    }
    while (finished_order_.size() > config_.finished_history) {
        finished_.erase(finished_order_.front());
        finished_order_.pop_front();
    }
}

std::vector<IncompleteFrame> FragmentAssembler::expire(uint64_t now_ms) {
    std::vector<IncompleteFrame> expired;
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto it = pending_.begin(); it != pending_.end(); ) {
        auto& frame = it->second;
        if (now_ms < frame.last_activity_ms ||
            now_ms - frame.last_activity_ms <= config_.fragment_timeout_ms) {
            ++it;
            continue;
        }

        IncompleteFrame incomplete;
        incomplete.frame_id = it->first;
        incomplete.fragment_count = frame.fragment_count;
        incomplete.received = static_cast<uint32_t>(frame.fragments.size());
        for (uint32_t i = 0; i < frame.fragment_count; ++i) {
            if (frame.fragments.count(i) == 0) {
                incomplete.missing_indices.push_back(i);
            }
        }

        spdlog::info("Frame {} timed out with {}/{} fragments", incomplete.frame_id,
                     incomplete.received, incomplete.fragment_count);

        remember_finished_locked(it->first, false);
        ++stats_.frames_timed_out;
        expired.push_back(std::move(incomplete));
        it = pending_.erase(it);
    }

    return expired;
}

FragmentAssemblerStats FragmentAssembler::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto snapshot = stats_;
    snapshot.pending_frames = pending_.size();
    return snapshot;
}

size_t FragmentAssembler::pending_frames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void FragmentAssembler::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.clear();
    finished_.clear();
    finished_order_.clear();
    stats_ = FragmentAssemblerStats{};
}

}  // namespace radlink::mux
