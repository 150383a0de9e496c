#include "radlink/pipeline/pipeline.hpp"

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "radlink/utils/time.hpp"

namespace radlink::pipeline {

namespace {

Snapshot snapshot_of(const std::vector<std::vector<uint8_t>>& datagrams) {
    Snapshot s{datagrams.size(), 0};
    for (const auto& d : datagrams) {
        s.bytes += d.size();
    }
    return s;
}

Snapshot snapshot_of(const std::vector<packet::ImagePacket>& packets) {
    Snapshot s{packets.size(), 0};
    for (const auto& p : packets) {
        s.bytes += packet::PACKET_OVERHEAD + p.payload.size();
    }
    return s;
}

Snapshot snapshot_of(const frame::PixelFrame& frame) {
    return Snapshot{1, frame.byte_size()};
}

}  // namespace

Pipeline::Pipeline(const PipelineConfig& config)
    : config_(config),
      packetizer_(config.virtual_channel),
      reassembler_(config.reassembler),
      fragmenter_(config.fragmenter),
      channel_(config.impairment),
      assembler_(config.assembler) {
    for (const auto& stage : stage_names()) {
        stage_latency_.emplace(stage, utils::LatencyRecorder(stage));
    }

    // The callback runs synchronously inside add_datagram
    assembler_.set_assemble_callback([this](mux::AssembledFrame frame) {
        uint32_t id = frame.frame_id;
        delivered_[id] = std::move(frame);
    });
}

std::vector<std::string> Pipeline::stage_names() {
    return {STAGE_PACKETIZE, STAGE_CSI2_REASSEMBLY, STAGE_FRAGMENT, STAGE_IMPAIRMENT,
            STAGE_UDP_REASSEMBLY};
}

const utils::LatencyRecorder& Pipeline::stage_latency(const std::string& stage) const {
    return stage_latency_.at(stage);
}

void Pipeline::add_checkpoint(PipelineResult& result, const char* stage, Snapshot input,
                              Snapshot output, std::chrono::nanoseconds latency) {
    stage_latency_.at(stage).record(latency);
    result.checkpoints.push_back(Checkpoint{stage, input, output, latency});
}

PipelineResult& Pipeline::fail(PipelineResult& result, const char* stage, ErrorCode error) {
    result.error = error;
    result.failed_stage = stage;
    result.frame.reset();
    spdlog::debug("Pipeline frame {} failed at {}: {}", result.frame_id, stage,
                  error_to_string(error));
    return result;
}

PipelineResult Pipeline::run(const frame::PixelFrame& source) {
    PipelineResult result;
    utils::Timer total;

    // Packetize
    utils::Timer timer;
    if (!packet::Packetizer::fits_line_packets(source)) {
        add_checkpoint(result, STAGE_PACKETIZE, snapshot_of(source), Snapshot{}, timer.elapsed());
        end_to_end_.record(total.elapsed());
        return fail(result, STAGE_PACKETIZE, ErrorCode::MALFORMED_HEADER);
    }
    auto packets = packetizer_.packetize(source);
    add_checkpoint(result, STAGE_PACKETIZE, snapshot_of(source), snapshot_of(packets),
                   timer.elapsed());

    // CSI-2 reassembly through the buffer ring
    timer.reset();
    for (const auto& p : packets) {
        reassembler_.on_packet(p);
    }
    auto ready = reassembler_.acquire_ready();
    if (!ready) {
        add_checkpoint(result, STAGE_CSI2_REASSEMBLY, snapshot_of(packets), Snapshot{},
                       timer.elapsed());
        end_to_end_.record(total.elapsed());
        return fail(result, STAGE_CSI2_REASSEMBLY, ErrorCode::INCOMPLETE_FRAME);
    }
    frame::PixelFrame reassembled = *ready->frame;
    result.corrupted_lines = ready->corrupted_lines;
    bool partial = ready->partial;
    reassembler_.release(*ready);
    add_checkpoint(result, STAGE_CSI2_REASSEMBLY, snapshot_of(packets), snapshot_of(reassembled),
                   timer.elapsed());
    if (partial) {
        end_to_end_.record(total.elapsed());
        return fail(result, STAGE_CSI2_REASSEMBLY, ErrorCode::INCOMPLETE_FRAME);
    }

    // Fragment
    timer.reset();
    result.frame_id = next_frame_id_++;
    auto datagrams = fragmenter_.fragment(reassembled, result.frame_id, utils::unix_time_ns());
    add_checkpoint(result, STAGE_FRAGMENT, snapshot_of(reassembled), snapshot_of(datagrams),
                   timer.elapsed());

    // Impairment
    timer.reset();
    Snapshot sent = snapshot_of(datagrams);
    auto fragment_count = static_cast<uint32_t>(datagrams.size());
    auto received = channel_.transmit(std::move(datagrams));
    auto delays = channel_.sample_delays(received.size());
    add_checkpoint(result, STAGE_IMPAIRMENT, sent, snapshot_of(received), timer.elapsed());

    // UDP reassembly on the simulated clock
    timer.reset();
    uint64_t start_ms = clock_ms_;
    uint64_t last_arrival_ms = start_ms;
    for (size_t i = 0; i < received.size(); ++i) {
        uint64_t arrival_ms = start_ms + delays[i];
        last_arrival_ms = std::max(last_arrival_ms, arrival_ms);
        assembler_.add_datagram(received[i], arrival_ms);
    }
    clock_ms_ = last_arrival_ms + config_.assembler.fragment_timeout_ms + 1;
    result.incomplete = assembler_.expire(clock_ms_);

    auto delivered = delivered_.find(result.frame_id);
    if (delivered == delivered_.end()) {
        bool reported = std::any_of(
            result.incomplete.begin(), result.incomplete.end(),
            [&](const mux::IncompleteFrame& f) { return f.frame_id == result.frame_id; });
        if (!reported) {
            // No fragment reached the assembler, so it never opened a context
            mux::IncompleteFrame lost{result.frame_id, fragment_count, 0, {}};
            for (uint32_t i = 0; i < fragment_count; ++i) {
                lost.missing_indices.push_back(i);
            }
            result.incomplete.push_back(std::move(lost));
        }
        add_checkpoint(result, STAGE_UDP_REASSEMBLY, snapshot_of(received), Snapshot{},
                       timer.elapsed());
        end_to_end_.record(total.elapsed());
        return fail(result, STAGE_UDP_REASSEMBLY, ErrorCode::INCOMPLETE_FRAGMENT_SET);
    }

    ErrorCode decode_error = ErrorCode::SUCCESS;
    auto output = frame::from_bytes(delivered->second.data, reassembled.frame_number,
                                    delivered->second.rows, delivered->second.cols,
                                    reassembled.bit_depth, &decode_error);
    delivered_.erase(delivered);
    if (!output) {
        add_checkpoint(result, STAGE_UDP_REASSEMBLY, snapshot_of(received), Snapshot{},
                       timer.elapsed());
        end_to_end_.record(total.elapsed());
        return fail(result, STAGE_UDP_REASSEMBLY, decode_error);
    }

    add_checkpoint(result, STAGE_UDP_REASSEMBLY, snapshot_of(received), snapshot_of(*output),
                   timer.elapsed());
    end_to_end_.record(total.elapsed());
    result.frame = std::move(*output);
    return result;
}

}  // namespace radlink::pipeline
