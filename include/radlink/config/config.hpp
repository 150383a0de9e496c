#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "radlink/frame/frame_reassembler.hpp"
#include "radlink/mux/fragment_assembler.hpp"
#include "radlink/mux/fragmenter.hpp"
#include "radlink/sim/impairment_channel.hpp"
#include "radlink/utils/logging.hpp"

namespace radlink::config {

// Frames produced by the counter-pattern source in the demo
struct SourceSettings {
    uint32_t rows = 256;
    uint32_t cols = 256;
    uint8_t bit_depth = 16;
    uint32_t frames = 10;
};

struct CommandSettings {
    std::string bind_host = "127.0.0.1";
    uint16_t port = 5000;
    std::string peer = "127.0.0.1:5000";  // Server the client talks to
    std::vector<uint8_t> key;             // Shared HMAC secret
    size_t max_peers = 16;
};

struct RadlinkConfig {
    sim::ImpairmentConfig impairment;
    mux::FragmenterConfig fragmentation;
    mux::FragmentAssemblerConfig assembler;
    frame::FrameReassemblerConfig reassembly;
    CommandSettings command;
    SourceSettings source;
    utils::LogLevel log_level = utils::LogLevel::INFO;
};

// Command-line options of the demo tool
struct CliOptions {
    std::string mode = "pipeline";  // pipeline | server | client
    std::string config_path;
    std::string command = "GET_STATUS";  // Client mode command name
    RadlinkConfig overrides;             // Values given on the command line
};

// Parse configuration from an INI file. Returns nullopt if the file cannot be
// read or a value does not parse.
std::optional<RadlinkConfig> load_config(const std::string& path);

// Parse configuration from CLI arguments; prints help or the parse error and
// returns nullopt when the program should exit
std::optional<CliOptions> parse_cli(int argc, char* argv[]);

// Save configuration to file
bool save_config(const RadlinkConfig& config, const std::string& path);

// Values in overlay that differ from the defaults replace those in base
RadlinkConfig merge_config(const RadlinkConfig& base, const RadlinkConfig& overlay);

// Validate configuration
struct ValidationResult {
    bool valid{true};
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

ValidationResult validate_config(const RadlinkConfig& config);

// Hex helpers for keys; an optional 0x prefix is accepted
std::optional<std::vector<uint8_t>> parse_hex(const std::string& hex);
std::string to_hex(const std::vector<uint8_t>& bytes);

}  // namespace radlink::config
