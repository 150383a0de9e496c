#include "radlink/command/command_processor.hpp"

#include <exception>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace radlink::command {

CommandProcessor::CommandProcessor(crypto::SecretProvider secret, size_t max_peers)
    : secret_(std::move(secret)), replay_(max_peers) {
    if (!secret_) {
        throw std::invalid_argument("command processor needs a secret provider");
    }
}

void CommandProcessor::register_handler(CommandId id, CommandHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[id] = std::move(handler);
}

void CommandProcessor::unregister_handler(CommandId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(id);
}

std::optional<std::vector<uint8_t>> CommandProcessor::drop(
    ErrorCode* error, ErrorCode code, uint64_t CommandProcessorStats::*counter) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++(stats_.*counter);
    ++stats_.auth_failures;
    if (error) *error = code;
    return std::nullopt;
}

std::optional<std::vector<uint8_t>> CommandProcessor::process(std::span<const uint8_t> datagram,
                                                              const std::string& peer,
                                                              ErrorCode* error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.frames_received;
    }

    // 1. Length
    if (!has_valid_length(datagram)) {
        spdlog::debug("Command from {} dropped: bad length {}", peer, datagram.size());
        return drop(error, ErrorCode::MALFORMED_HEADER, &CommandProcessorStats::malformed);
    }

    // 2. Magic
    if (peek_magic(datagram) != COMMAND_MAGIC) {
        spdlog::debug("Command from {} dropped: bad magic", peer);
        return drop(error, ErrorCode::MALFORMED_HEADER, &CommandProcessorStats::bad_magic);
    }

    // 3. MAC
    std::vector<uint8_t> key = secret_();
    if (!verify_frame_mac(key, datagram)) {
        crypto::secure_zero(key.data(), key.size());
        spdlog::debug("Command from {} dropped: MAC mismatch", peer);
        return drop(error, ErrorCode::INTEGRITY_MISMATCH, &CommandProcessorStats::mac_failures);
    }

    auto command = decode_command(datagram);
    if (!command) {
        crypto::secure_zero(key.data(), key.size());
        return drop(error, ErrorCode::MALFORMED_HEADER, &CommandProcessorStats::malformed);
    }

    // 4. Replay
    if (!replay_.check_and_update(peer, command->sequence)) {
        crypto::secure_zero(key.data(), key.size());
        spdlog::debug("Command seq {} from {} rejected as replay", command->sequence, peer);
        return drop(error, ErrorCode::REPLAY_REJECTED, &CommandProcessorStats::replay_rejections);
    }

    // 5. Dispatch
    CommandHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.commands_accepted;
        if (is_known_command(command->command_id)) {
            auto it = handlers_.find(static_cast<CommandId>(command->command_id));
            if (it != handlers_.end()) {
                handler = it->second;
            }
        }
        if (!handler) {
            ++stats_.invalid_commands;
        }
    }

    CommandResult result;
    if (!handler) {
        spdlog::info("No handler for command 0x{:04x} ({}) from {}", command->command_id,
                     command_id_to_string(command->command_id), peer);
        result.status = ResponseStatus::INVALID_COMMAND;
    } else {
        try {
            result = handler(command->payload);
        } catch (const std::exception& e) {
            spdlog::error("Handler for {} failed: {}", command_id_to_string(command->command_id),
                          e.what());
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.handler_errors;
            result = CommandResult{ResponseStatus::ERROR, {}};
        }
    }

    if (result.payload.size() > MAX_COMMAND_PAYLOAD) {
        spdlog::error("Response to {} too large ({} bytes)",
                      command_id_to_string(command->command_id), result.payload.size());
        result = CommandResult{ResponseStatus::ERROR, {}};
    }

    auto response = encode_response(key, command->sequence, result.status, result.payload);
    crypto::secure_zero(key.data(), key.size());

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.responses_sent;
    }
    if (error) *error = ErrorCode::SUCCESS;
    return response;
}

CommandProcessorStats CommandProcessor::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void CommandProcessor::reset_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = CommandProcessorStats{};
}

}  // namespace radlink::command
