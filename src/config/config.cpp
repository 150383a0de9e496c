#include "radlink/config/config.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "radlink/packet/image_packet.hpp"

namespace radlink::config {

namespace {

// Simple INI parser
class IniParser {
public:
    struct Entry {
        std::string section;
        std::string key;
        std::string value;
        size_t line{0};
    };

    static std::vector<Entry> parse(std::istream& input) {
        std::vector<Entry> entries;
        std::string current_section;
        std::string line;
        size_t line_number = 0;

        while (std::getline(input, line)) {
            ++line_number;

            // Trim whitespace
            line.erase(0, line.find_first_not_of(" \t\r\n"));
            line.erase(line.find_last_not_of(" \t\r\n") + 1);

            // Skip empty lines and comments
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            // Section header
            if (line[0] == '[' && line.back() == ']') {
                current_section = line.substr(1, line.size() - 2);
                continue;
            }

            // Key=value
            auto eq_pos = line.find('=');
            if (eq_pos != std::string::npos) {
                std::string key = line.substr(0, eq_pos);
                std::string value = line.substr(eq_pos + 1);

                // Trim
                key.erase(key.find_last_not_of(" \t") + 1);
                value.erase(0, value.find_first_not_of(" \t"));

                // Remove quotes
                if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                    value = value.substr(1, value.size() - 2);
                }

                entries.push_back({current_section, key, value, line_number});
            }
        }

        return entries;
    }
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

template <typename T>
T parse_unsigned(const std::string& value) {
    size_t used = 0;
    unsigned long long parsed = std::stoull(value, &used);
    if (used != value.size() || value.find('-') != std::string::npos ||
        parsed > std::numeric_limits<T>::max()) {
        throw std::out_of_range(value);
    }
    return static_cast<T>(parsed);
}

double parse_double(const std::string& value) {
    size_t used = 0;
    double parsed = std::stod(value, &used);
    if (used != value.size()) {
        throw std::invalid_argument(value);
    }
    return parsed;
}

// Apply one INI entry. Returns false for a key this loader does not know.
bool apply_entry(RadlinkConfig& config, const std::string& section, const std::string& key,
                 const std::string& value) {
    if (section == "impairment") {
        if (key == "loss_rate") {
            config.impairment.loss_rate = parse_double(value);
        } else if (key == "reorder_rate") {
            config.impairment.reorder_rate = parse_double(value);
        } else if (key == "corruption_rate") {
            config.impairment.corruption_rate = parse_double(value);
        } else if (key == "min_delay_ms") {
            config.impairment.min_delay_ms = parse_unsigned<uint32_t>(value);
        } else if (key == "max_delay_ms") {
            config.impairment.max_delay_ms = parse_unsigned<uint32_t>(value);
        } else if (key == "seed") {
            config.impairment.seed = parse_unsigned<uint64_t>(value);
        } else {
            return false;
        }
    } else if (section == "fragmentation") {
        if (key == "max_payload") {
            config.fragmentation.max_payload = parse_unsigned<size_t>(value);
        } else if (key == "timeout_ms") {
            config.assembler.fragment_timeout_ms = parse_unsigned<uint64_t>(value);
        } else if (key == "max_pending_frames") {
            config.assembler.max_pending_frames = parse_unsigned<size_t>(value);
        } else {
            return false;
        }
    } else if (section == "reassembly") {
        if (key == "slots") {
            config.reassembly.num_slots = parse_unsigned<size_t>(value);
        } else {
            return false;
        }
    } else if (section == "command") {
        if (key == "bind_host") {
            config.command.bind_host = value;
        } else if (key == "port") {
            config.command.port = parse_unsigned<uint16_t>(value);
        } else if (key == "peer") {
            config.command.peer = value;
        } else if (key == "key") {
            auto bytes = parse_hex(value);
            if (!bytes) {
                throw std::invalid_argument("key is not valid hex");
            }
            config.command.key = std::move(*bytes);
        } else if (key == "max_peers") {
            config.command.max_peers = parse_unsigned<size_t>(value);
        } else {
            return false;
        }
    } else if (section == "source") {
        if (key == "rows") {
            config.source.rows = parse_unsigned<uint32_t>(value);
        } else if (key == "cols") {
            config.source.cols = parse_unsigned<uint32_t>(value);
        } else if (key == "bit_depth") {
            config.source.bit_depth = parse_unsigned<uint8_t>(value);
        } else if (key == "frames") {
            config.source.frames = parse_unsigned<uint32_t>(value);
        } else {
            return false;
        }
    } else if (section == "logging") {
        if (key == "level") {
            config.log_level = utils::string_to_log_level(value);
        } else {
            return false;
        }
    } else {
        return false;
    }
    return true;
}

}  // namespace

std::optional<std::vector<uint8_t>> parse_hex(const std::string& hex) {
    std::string digits = hex;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.size() % 2 != 0) {
        return std::nullopt;
    }
    if (!std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isxdigit(c); })) {
        return std::nullopt;
    }

    std::vector<uint8_t> bytes(digits.size() / 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<uint8_t>(std::stoul(digits.substr(i * 2, 2), nullptr, 16));
    }
    return bytes;
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
    std::ostringstream out;
    for (auto b : bytes) {
        out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return out.str();
}

std::optional<RadlinkConfig> load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::error("Cannot open config file {}", path);
        return std::nullopt;
    }

    auto entries = IniParser::parse(file);
    RadlinkConfig config;

    for (const auto& entry : entries) {
        std::string section = to_lower(entry.section);
        std::string key = to_lower(entry.key);

        try {
            if (!apply_entry(config, section, key, entry.value)) {
                spdlog::warn("{}:{}: unknown key [{}] {}", path, entry.line, section, key);
            }
        } catch (const std::exception&) {
            spdlog::error("{}:{}: bad value for [{}] {}: '{}'", path, entry.line, section, key,
                          entry.value);
            return std::nullopt;
        }
    }

    return config;
}

std::optional<CliOptions> parse_cli(int argc, char* argv[]) {
    CLI::App app{"radlink - detector data-path protocol stack"};

    CliOptions options;
    RadlinkConfig& config = options.overrides;
    std::string key_hex;
    std::string log_level;
    unsigned bit_depth = config.source.bit_depth;

    app.add_option("-m,--mode", options.mode, "Run mode")
        ->check(CLI::IsMember({"pipeline", "server", "client"}));
    app.add_option("-c,--config", options.config_path, "INI configuration file");
    app.add_option("--command", options.command,
                   "Client command (START_SCAN, STOP_SCAN, GET_STATUS, SET_CONFIG)");

    app.add_option("--loss-rate", config.impairment.loss_rate, "Datagram loss rate")
        ->check(CLI::Range(0.0, 1.0));
    app.add_option("--reorder-rate", config.impairment.reorder_rate, "Datagram reorder rate")
        ->check(CLI::Range(0.0, 1.0));
    app.add_option("--corruption-rate", config.impairment.corruption_rate,
                   "Datagram corruption rate")
        ->check(CLI::Range(0.0, 1.0));
    app.add_option("--min-delay", config.impairment.min_delay_ms, "Minimum delay (ms)");
    app.add_option("--max-delay", config.impairment.max_delay_ms, "Maximum delay (ms)");
    app.add_option("--seed", config.impairment.seed, "Impairment RNG seed");

    app.add_option("--max-payload", config.fragmentation.max_payload,
                   "Fragment payload size (bytes)");
    app.add_option("--timeout", config.assembler.fragment_timeout_ms,
                   "Fragment reassembly timeout (ms)");
    app.add_option("--slots", config.reassembly.num_slots, "Frame buffer slots");

    app.add_option("--rows", config.source.rows, "Frame rows");
    app.add_option("--cols", config.source.cols, "Frame columns");
    app.add_option("--bit-depth", bit_depth, "Bits per sample")->check(CLI::Range(1u, 16u));
    app.add_option("--frames", config.source.frames, "Frames to run through the pipeline");

    app.add_option("-b,--bind", config.command.bind_host, "Command server bind address");
    app.add_option("-p,--port", config.command.port, "Command server port");
    app.add_option("-r,--peer", config.command.peer, "Command server address (host:port)");
    app.add_option("--key", key_hex, "Shared command key (hex)");
    app.add_option("-l,--log-level", log_level, "Log level (trace..off)");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        app.exit(e);
        return std::nullopt;
    }

    config.source.bit_depth = static_cast<uint8_t>(bit_depth);

    if (!key_hex.empty()) {
        auto key = parse_hex(key_hex);
        if (!key) {
            spdlog::error("--key is not valid hex");
            return std::nullopt;
        }
        config.command.key = std::move(*key);
    }
    if (!log_level.empty()) {
        config.log_level = utils::string_to_log_level(log_level);
    }

    return options;
}

bool save_config(const RadlinkConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        return false;
    }

    file << "[impairment]\n";
    file << "loss_rate = " << config.impairment.loss_rate << "\n";
    file << "reorder_rate = " << config.impairment.reorder_rate << "\n";
    file << "corruption_rate = " << config.impairment.corruption_rate << "\n";
    file << "min_delay_ms = " << config.impairment.min_delay_ms << "\n";
    file << "max_delay_ms = " << config.impairment.max_delay_ms << "\n";
    file << "seed = " << config.impairment.seed << "\n";
    file << "\n";

    file << "[fragmentation]\n";
    file << "max_payload = " << config.fragmentation.max_payload << "\n";
    file << "timeout_ms = " << config.assembler.fragment_timeout_ms << "\n";
    file << "max_pending_frames = " << config.assembler.max_pending_frames << "\n";
    file << "\n";

    file << "[reassembly]\n";
    file << "slots = " << config.reassembly.num_slots << "\n";
    file << "\n";

    file << "[command]\n";
    file << "bind_host = " << config.command.bind_host << "\n";
    file << "port = " << config.command.port << "\n";
    file << "peer = " << config.command.peer << "\n";
    file << "key = 0x" << to_hex(config.command.key) << "\n";
    file << "max_peers = " << config.command.max_peers << "\n";
    file << "\n";

    file << "[source]\n";
    file << "rows = " << config.source.rows << "\n";
    file << "cols = " << config.source.cols << "\n";
    file << "bit_depth = " << static_cast<int>(config.source.bit_depth) << "\n";
    file << "frames = " << config.source.frames << "\n";
    file << "\n";

    file << "[logging]\n";
    file << "level = " << utils::log_level_to_string(config.log_level) << "\n";

    return static_cast<bool>(file);
}

RadlinkConfig merge_config(const RadlinkConfig& base, const RadlinkConfig& overlay) {
    const RadlinkConfig defaults;
    RadlinkConfig result = base;

    auto take = [](auto& target, const auto& value, const auto& default_value) {
        if (value != default_value) {
            target = value;
        }
    };

    take(result.impairment.loss_rate, overlay.impairment.loss_rate, defaults.impairment.loss_rate);
    take(result.impairment.reorder_rate, overlay.impairment.reorder_rate,
         defaults.impairment.reorder_rate);
    take(result.impairment.corruption_rate, overlay.impairment.corruption_rate,
         defaults.impairment.corruption_rate);
    take(result.impairment.min_delay_ms, overlay.impairment.min_delay_ms,
         defaults.impairment.min_delay_ms);
    take(result.impairment.max_delay_ms, overlay.impairment.max_delay_ms,
         defaults.impairment.max_delay_ms);
    take(result.impairment.seed, overlay.impairment.seed, defaults.impairment.seed);

    take(result.fragmentation.max_payload, overlay.fragmentation.max_payload,
         defaults.fragmentation.max_payload);
    take(result.assembler.fragment_timeout_ms, overlay.assembler.fragment_timeout_ms,
         defaults.assembler.fragment_timeout_ms);
    take(result.assembler.max_pending_frames, overlay.assembler.max_pending_frames,
         defaults.assembler.max_pending_frames);
    take(result.reassembly.num_slots, overlay.reassembly.num_slots,
         defaults.reassembly.num_slots);

    take(result.command.bind_host, overlay.command.bind_host, defaults.command.bind_host);
    take(result.command.port, overlay.command.port, defaults.command.port);
    take(result.command.peer, overlay.command.peer, defaults.command.peer);
    take(result.command.key, overlay.command.key, defaults.command.key);
    take(result.command.max_peers, overlay.command.max_peers, defaults.command.max_peers);

    take(result.source.rows, overlay.source.rows, defaults.source.rows);
    take(result.source.cols, overlay.source.cols, defaults.source.cols);
    take(result.source.bit_depth, overlay.source.bit_depth, defaults.source.bit_depth);
    take(result.source.frames, overlay.source.frames, defaults.source.frames);

    take(result.log_level, overlay.log_level, defaults.log_level);

    return result;
}

ValidationResult validate_config(const RadlinkConfig& config) {
    ValidationResult result;
    auto error = [&result](std::string message) {
        result.errors.push_back(std::move(message));
        result.valid = false;
    };

    // Impairment
    auto check_rate = [&error](double rate, const char* name) {
        if (!(rate >= 0.0 && rate <= 1.0)) {
            error(std::string(name) + " must be between 0 and 1");
        }
    };
    check_rate(config.impairment.loss_rate, "loss_rate");
    check_rate(config.impairment.reorder_rate, "reorder_rate");
    check_rate(config.impairment.corruption_rate, "corruption_rate");
    if (config.impairment.min_delay_ms > config.impairment.max_delay_ms) {
        error("min_delay_ms exceeds max_delay_ms");
    }

    // Fragmentation
    if (config.fragmentation.max_payload < 64) {
        error("max_payload too small (minimum 64)");
    }
    if (config.fragmentation.max_payload > 65000) {
        error("max_payload too large (maximum 65000)");
    }
    if (config.assembler.fragment_timeout_ms == 0) {
        result.warnings.push_back("Fragment timeout is 0 - frames expire on the next poll");
    }
    if (config.assembler.max_pending_frames == 0) {
        error("max_pending_frames must be positive");
    }

    // Reassembly
    if (config.reassembly.num_slots < 2) {
        error("At least 2 frame buffer slots are required");
    }

    // Command channel
    if (config.command.key.empty()) {
        error("Command key is empty");
    } else if (config.command.key.size() < 16) {
        result.warnings.push_back("Command key is shorter than 16 bytes");
    }
    if (config.command.max_peers == 0) {
        error("max_peers must be positive");
    }
    if (config.command.port == 0) {
        result.warnings.push_back("Command port is 0 - will use ephemeral port");
    }

    // Source
    if (config.source.rows == 0 || config.source.cols == 0) {
        error("Frame dimensions must be positive");
    }
    if (config.source.cols > (packet::MAX_PACKET_PAYLOAD - packet::LINE_INDEX_SIZE) /
                                 frame::BYTES_PER_SAMPLE) {
        error("cols too large for a single line packet");
    }
    if (config.source.bit_depth == 0 || config.source.bit_depth > 16) {
        error("bit_depth must be between 1 and 16");
    }

    return result;
}

}  // namespace radlink::config
