#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace radlink::command {

constexpr size_t DEFAULT_MAX_PEERS = 16;

// Per-peer anti-replay state. A sequence number is accepted only if it is
// strictly greater than the last one accepted from the same peer; a peer
// never seen before behaves as if its last accepted sequence were 0.
// When the table is full the least recently used peer is forgotten.
class ReplayTable {
public:
    explicit ReplayTable(size_t max_peers = DEFAULT_MAX_PEERS);

    // Check if a sequence number would be accepted
    [[nodiscard]] bool check(const std::string& peer, uint32_t sequence) const;

    // Check and record in one step. Returns true if accepted.
    bool check_and_update(const std::string& peer, uint32_t sequence);

    // Last accepted sequence of a tracked peer
    [[nodiscard]] std::optional<uint32_t> last_accepted(const std::string& peer) const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t max_peers() const { return max_peers_; }
    [[nodiscard]] uint64_t evictions() const;

    // Forget every peer
    void reset();

private:
    struct PeerRecord {
        uint32_t last_accepted{0};
        uint64_t last_used{0};
    };

    size_t max_peers_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, PeerRecord> peers_;
    uint64_t use_counter_{0};
    uint64_t evictions_{0};
};

}  // namespace radlink::command
