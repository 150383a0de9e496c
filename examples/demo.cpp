#include <atomic>
#include <chrono>
#include <csignal>
#include <string>

#include <spdlog/spdlog.h>

#include "radlink/codec/byte_order.hpp"
#include "radlink/command/command_client.hpp"
#include "radlink/command/command_processor.hpp"
#include "radlink/command/command_server.hpp"
#include "radlink/config/config.hpp"
#include "radlink/crypto/crypto.hpp"
#include "radlink/frame/pixel_source.hpp"
#include "radlink/pipeline/pipeline.hpp"
#include "radlink/transport/udp_socket.hpp"
#include "radlink/utils/logging.hpp"

using namespace radlink;

std::atomic<bool> g_running{true};

void signal_handler(int sig) {
    spdlog::info("Received signal {}, shutting down...", sig);
    g_running = false;
}

namespace {

int run_pipeline(const config::RadlinkConfig& config) {
    pipeline::PipelineConfig pipeline_config;
    pipeline_config.reassembler = config.reassembly;
    pipeline_config.fragmenter = config.fragmentation;
    pipeline_config.assembler = config.assembler;
    pipeline_config.impairment = config.impairment;

    pipeline::Pipeline pipeline(pipeline_config);
    frame::CounterPatternSource source(config.source.rows, config.source.cols,
                                       config.source.bit_depth);

    spdlog::info("Running {} frames of {}x{} (loss {}, reorder {}, corruption {})",
                 config.source.frames, config.source.rows, config.source.cols,
                 config.impairment.loss_rate, config.impairment.reorder_rate,
                 config.impairment.corruption_rate);

    uint32_t delivered = 0;
    uint32_t mismatched = 0;
    for (uint32_t i = 0; i < config.source.frames && g_running; ++i) {
        auto frame = source.next_frame();
        auto result = pipeline.run(frame);
        if (!result.ok()) {
            spdlog::info("Frame {} lost at {}: {}", frame.frame_number, result.failed_stage,
                         error_to_string(result.error));
            continue;
        }
        if (*result.frame != frame) {
            ++mismatched;
            spdlog::error("Frame {} differs from the source", frame.frame_number);
            continue;
        }
        ++delivered;
        for (const auto& checkpoint : result.checkpoints) {
            spdlog::debug("  {:<16} in {:>6} items {:>10} bytes -> out {:>6} items {:>10} bytes"
                          " ({} us)",
                          checkpoint.stage, checkpoint.input.items, checkpoint.input.bytes,
                          checkpoint.output.items, checkpoint.output.bytes,
                          checkpoint.latency.count() / 1000);
        }
    }

    spdlog::info("Delivered {}/{} frames intact, {} mismatched", delivered, config.source.frames,
                 mismatched);

    for (const auto& stage : pipeline::Pipeline::stage_names()) {
        auto summary = pipeline.stage_latency(stage).percentiles();
        spdlog::info("{:<16} p50 {:>9.1f} us  p95 {:>9.1f} us  p99 {:>9.1f} us", stage,
                     summary.p50, summary.p95, summary.p99);
    }
    const auto& total = pipeline.end_to_end_latency();
    auto summary = total.percentiles();
    spdlog::info("{:<16} p50 {:>9.1f} us  p95 {:>9.1f} us  p99 {:>9.1f} us", "end_to_end",
                 summary.p50, summary.p95, summary.p99);
    if (total.count() > 0) {
        spdlog::info("End-to-end latency histogram (us):\n{}",
                     utils::format_histogram(total.histogram(10)));
    }

    auto channel = pipeline.channel().stats();
    spdlog::info("Channel: sent {} lost {} corrupted {} reordered {}", channel.sent, channel.lost,
                 channel.corrupted, channel.reordered);
    return mismatched == 0 ? 0 : 1;
}

int run_server(const config::RadlinkConfig& config) {
    transport::UdpSocket socket;
    transport::UdpSocketConfig socket_config;
    socket_config.bind_address = {config.command.bind_host, config.command.port};
    if (!socket.open(socket_config)) {
        spdlog::error("Failed to bind {}:{}", config.command.bind_host, config.command.port);
        return 1;
    }

    command::CommandProcessor processor(crypto::static_secret(config.command.key),
                                        config.command.max_peers);

    // Minimal scan controller standing in for the acquisition state machine
    std::atomic<bool> scanning{false};
    std::atomic<uint32_t> scans{0};

    processor.register_handler(command::CommandId::START_SCAN, [&](std::span<const uint8_t>) {
        if (scanning.exchange(true)) {
            return command::CommandResult{command::ResponseStatus::BUSY, {}};
        }
        ++scans;
        spdlog::info("Scan started");
        return command::CommandResult{};
    });
    processor.register_handler(command::CommandId::STOP_SCAN, [&](std::span<const uint8_t>) {
        scanning = false;
        spdlog::info("Scan stopped");
        return command::CommandResult{};
    });
    processor.register_handler(command::CommandId::GET_STATUS, [&](std::span<const uint8_t>) {
        command::CommandResult result;
        result.payload.push_back(scanning ? 1 : 0);
        codec::write_u32_le(result.payload, scans.load());
        return result;
    });
    processor.register_handler(command::CommandId::SET_CONFIG,
                               [](std::span<const uint8_t> payload) {
        if (payload.empty()) {
            return command::CommandResult{command::ResponseStatus::ERROR, {}};
        }
        spdlog::info("Received {} bytes of configuration", payload.size());
        return command::CommandResult{};
    });

    spdlog::info("Command server listening on {}. Press Ctrl+C to stop.",
                 socket.local_address().to_string());

    command::CommandServer server(socket, processor);
    server.run(g_running);

    auto stats = processor.stats();
    spdlog::info("Accepted {} commands; {} auth failures, {} replays", stats.commands_accepted,
                 stats.auth_failures, stats.replay_rejections);
    return 0;
}

std::optional<command::CommandId> command_from_name(const std::string& name) {
    if (name == "START_SCAN") return command::CommandId::START_SCAN;
    if (name == "STOP_SCAN") return command::CommandId::STOP_SCAN;
    if (name == "GET_STATUS") return command::CommandId::GET_STATUS;
    if (name == "SET_CONFIG") return command::CommandId::SET_CONFIG;
    return std::nullopt;
}

int run_client(const config::RadlinkConfig& config, const std::string& command_name) {
    auto id = command_from_name(command_name);
    if (!id) {
        spdlog::error("Unknown command '{}'", command_name);
        return 1;
    }

    transport::UdpSocket socket;
    transport::UdpSocketConfig socket_config;
    socket_config.bind_address = {"127.0.0.1", 0};
    if (!socket.open(socket_config)) {
        spdlog::error("Failed to open client socket");
        return 1;
    }

    // Start from the clock so a restarted client is not taken for a replay
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    command::CommandClient client(crypto::static_secret(config.command.key),
                                  static_cast<uint32_t>(seconds));

    std::vector<uint8_t> payload;
    if (*id == command::CommandId::SET_CONFIG) {
        payload = {0x01};
    }

    ErrorCode error = ErrorCode::SUCCESS;
    auto response = client.request(socket, config.command.peer, *id, payload,
                                   std::chrono::milliseconds(2000), &error);
    if (!response) {
        spdlog::error("No valid response from {}: {}", config.command.peer,
                      error_to_string(error));
        return 1;
    }

    spdlog::info("{} -> {} (seq {}, {} payload bytes)", command_name,
                 command::response_status_to_string(response->status), response->sequence,
                 response->payload.size());
    return response->status == command::ResponseStatus::OK ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto options = config::parse_cli(argc, argv);
    if (!options) {
        return 1;
    }

    config::RadlinkConfig config;
    if (!options->config_path.empty()) {
        auto loaded = config::load_config(options->config_path);
        if (!loaded) {
            return 1;
        }
        config = *loaded;
    }
    config = config::merge_config(config, options->overrides);

    // Initialize logging
    utils::init_logging(config.log_level);

    // Initialize crypto
    if (!crypto::init()) {
        spdlog::error("Failed to initialize crypto subsystem");
        return 1;
    }

    if (config.command.key.empty()) {
        if (options->mode == "client") {
            spdlog::error("Client mode needs --key or a [command] key");
            return 1;
        }
        config.command.key = crypto::generate_key();
        if (options->mode == "server") {
            spdlog::info("Generated command key {} (share with the client)",
                         config::to_hex(config.command.key));
        }
    }

    auto validation = config::validate_config(config);
    for (const auto& warning : validation.warnings) {
        spdlog::warn("{}", warning);
    }
    if (!validation.valid) {
        for (const auto& error : validation.errors) {
            spdlog::error("{}", error);
        }
        return 1;
    }

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int rc = 0;
    if (options->mode == "server") {
        rc = run_server(config);
    } else if (options->mode == "client") {
        rc = run_client(config, options->command);
    } else {
        rc = run_pipeline(config);
    }

    spdlog::info("Demo finished");
    return rc;
}
