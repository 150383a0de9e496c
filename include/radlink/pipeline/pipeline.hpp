#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "radlink/common/error.hpp"
#include "radlink/frame/frame_reassembler.hpp"
#include "radlink/frame/pixel_frame.hpp"
#include "radlink/mux/fragment_assembler.hpp"
#include "radlink/mux/fragmenter.hpp"
#include "radlink/packet/packetizer.hpp"
#include "radlink/sim/impairment_channel.hpp"
#include "radlink/utils/latency_recorder.hpp"

namespace radlink::pipeline {

// Stage names, in execution order
constexpr const char* STAGE_PACKETIZE = "packetize";
constexpr const char* STAGE_CSI2_REASSEMBLY = "csi2_reassembly";
constexpr const char* STAGE_FRAGMENT = "fragment";
constexpr const char* STAGE_IMPAIRMENT = "impairment";
constexpr const char* STAGE_UDP_REASSEMBLY = "udp_reassembly";

struct Snapshot {
    size_t items{0};
    size_t bytes{0};
};

struct Checkpoint {
    std::string stage;
    Snapshot input;
    Snapshot output;
    std::chrono::nanoseconds latency{0};
};

struct PipelineConfig {
    uint8_t virtual_channel = 0;
    frame::FrameReassemblerConfig reassembler;
    mux::FragmenterConfig fragmenter;
    mux::FragmentAssemblerConfig assembler;
    sim::ImpairmentConfig impairment;
};

struct PipelineResult {
    std::optional<frame::PixelFrame> frame;
    ErrorCode error{ErrorCode::SUCCESS};
    std::string failed_stage;
    uint32_t frame_id{0};
    std::vector<Checkpoint> checkpoints;
    std::vector<uint32_t> corrupted_lines;        // From the CSI-2 stage
    std::vector<mux::IncompleteFrame> incomplete; // Evicted by the UDP stage

    [[nodiscard]] bool ok() const { return frame.has_value(); }
};

// Runs one frame through packetize -> CSI-2 reassembly -> fragment ->
// impairment -> UDP reassembly and records what each stage saw. Fragment
// timeouts run on a simulated clock that advances with every run, so a run
// never sleeps. One instance serves one caller at a time.
class Pipeline {
public:
    explicit Pipeline(const PipelineConfig& config = {});

    PipelineResult run(const frame::PixelFrame& source);

    // Throws std::out_of_range for an unknown stage
    [[nodiscard]] const utils::LatencyRecorder& stage_latency(const std::string& stage) const;
    [[nodiscard]] const utils::LatencyRecorder& end_to_end_latency() const { return end_to_end_; }
    [[nodiscard]] static std::vector<std::string> stage_names();

    // Impairment rates may be changed between runs
    sim::ImpairmentChannel& channel() { return channel_; }

    [[nodiscard]] frame::ReassemblerStats reassembler_stats() const { return reassembler_.stats(); }
    [[nodiscard]] mux::FragmentAssemblerStats assembler_stats() const { return assembler_.stats(); }
    [[nodiscard]] uint64_t simulated_time_ms() const { return clock_ms_; }

private:
    void add_checkpoint(PipelineResult& result, const char* stage, Snapshot input,
                        Snapshot output, std::chrono::nanoseconds latency);
    PipelineResult& fail(PipelineResult& result, const char* stage, ErrorCode error);

    PipelineConfig config_;
    packet::Packetizer packetizer_;
    frame::FrameReassembler reassembler_;
    mux::Fragmenter fragmenter_;
    sim::ImpairmentChannel channel_;
    mux::FragmentAssembler assembler_;

    std::map<uint32_t, mux::AssembledFrame> delivered_;
    uint64_t clock_ms_{0};
    uint32_t next_frame_id_{0};

    std::map<std::string, utils::LatencyRecorder> stage_latency_;
    utils::LatencyRecorder end_to_end_{"end_to_end"};
};

}  // namespace radlink::pipeline
