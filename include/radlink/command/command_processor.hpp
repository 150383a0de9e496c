#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "command_frame.hpp"
#include "replay_table.hpp"
#include "radlink/common/error.hpp"
#include "radlink/crypto/hmac.hpp"

namespace radlink::command {

// What a handler wants sent back
struct CommandResult {
    ResponseStatus status{ResponseStatus::OK};
    std::vector<uint8_t> payload;
};

using CommandHandler = std::function<CommandResult(std::span<const uint8_t> payload)>;

struct CommandProcessorStats {
    uint64_t frames_received{0};
    uint64_t commands_accepted{0};   // Passed MAC and replay checks
    uint64_t auth_failures{0};       // malformed + bad_magic + mac_failures + replay_rejections
    uint64_t malformed{0};
    uint64_t bad_magic{0};
    uint64_t mac_failures{0};
    uint64_t replay_rejections{0};
    uint64_t invalid_commands{0};
    uint64_t handler_errors{0};
    uint64_t responses_sent{0};
};

// Validates command frames and dispatches them. Checks run in order:
// length, magic, MAC, replay, dispatch. Frames failing any of the first four
// are dropped without a response; the replay record is updated before the
// handler runs.
class CommandProcessor {
public:
    explicit CommandProcessor(crypto::SecretProvider secret,
                              size_t max_peers = DEFAULT_MAX_PEERS);

    // Install or replace the handler for a command
    void register_handler(CommandId id, CommandHandler handler);
    void unregister_handler(CommandId id);

    // Returns the signed response to send back, or nullopt for a silent drop.
    // `error` tells why a frame was dropped.
    std::optional<std::vector<uint8_t>> process(std::span<const uint8_t> datagram,
                                                const std::string& peer,
                                                ErrorCode* error = nullptr);

    [[nodiscard]] CommandProcessorStats stats() const;
    [[nodiscard]] const ReplayTable& replay_table() const { return replay_; }

    void reset_stats();

private:
    std::optional<std::vector<uint8_t>> drop(ErrorCode* error, ErrorCode code,
                                             uint64_t CommandProcessorStats::*counter);

    crypto::SecretProvider secret_;
    ReplayTable replay_;

    mutable std::mutex mutex_;  // Guards handlers_ and stats_
    std::map<CommandId, CommandHandler> handlers_;
    CommandProcessorStats stats_;
};

}  // namespace radlink::command
