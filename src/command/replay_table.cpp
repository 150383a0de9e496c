#include "radlink/command/replay_table.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace radlink::command {

ReplayTable::ReplayTable(size_t max_peers) : max_peers_(max_peers) {
    if (max_peers == 0) {
        throw std::invalid_argument("replay table needs room for at least one peer");
    }
}

bool ReplayTable::check(const std::string& peer, uint32_t sequence) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(peer);
    uint32_t last = it == peers_.end() ? 0 : it->second.last_accepted;
    return sequence > last;
}

bool ReplayTable::check_and_update(const std::string& peer, uint32_t sequence) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = peers_.find(peer);
    if (it != peers_.end()) {
        if (sequence <= it->second.last_accepted) {
            return false;
        }
        it->second.last_accepted = sequence;
        it->second.last_used = ++use_counter_;
        return true;
    }

    if (sequence == 0) {
        return false;
    }

    if (peers_.size() >= max_peers_) {
        auto oldest = peers_.begin();
        for (auto candidate = peers_.begin(); candidate != peers_.end(); ++candidate) {
            if (candidate->second.last_used < oldest->second.last_used) {
                oldest = candidate;
            }
        }
        spdlog::info("Replay table full, forgetting peer {}", oldest->first);
        peers_.erase(oldest);
        ++evictions_;
    }

    peers_.emplace(peer, PeerRecord{sequence, ++use_counter_});
    return true;
}

std::optional<uint32_t> ReplayTable::last_accepted(const std::string& peer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(peer);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second.last_accepted;
}

size_t ReplayTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.size();
}

uint64_t ReplayTable::evictions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evictions_;
}

void ReplayTable::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    peers_.clear();
    evictions_ = 0;
}

}  // namespace radlink::command
