#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <vector>

#include "radlink/mux/fragment_header.hpp"

namespace radlink::sim {

struct ImpairmentConfig {
    double loss_rate = 0.0;
    double reorder_rate = 0.0;
    double corruption_rate = 0.0;
    uint32_t min_delay_ms = 0;
    uint32_t max_delay_ms = 0;
    uint64_t seed = 0;
    // Leading bytes of each datagram that corruption never touches
    size_t protected_header_bytes = mux::FRAGMENT_HEADER_SIZE;
};

struct ImpairmentStats {
    uint64_t sent{0};
    uint64_t lost{0};
    uint64_t reordered{0};  // Swaps actually performed
    uint64_t corrupted{0};
    uint64_t delivered{0};
};

// Seeded lossy network model. transmit() applies, in this order:
//   1. loss: each datagram dropped with loss_rate
//   2. corruption: with corruption_rate one bit of one payload byte is flipped
//   3. reorder: reverse Fisher-Yates pass, each position swapped with reorder_rate
// Two channels with the same configuration produce identical output for the
// same input.
class ImpairmentChannel {
public:
    explicit ImpairmentChannel(const ImpairmentConfig& config = {});

    std::vector<std::vector<uint8_t>> transmit(std::vector<std::vector<uint8_t>> datagrams);

    // Per-datagram delays in [min_delay_ms, max_delay_ms]. Drawn from a
    // separate generator so they never shift the impairment sequence.
    std::vector<uint32_t> sample_delays(size_t count);

    // Rates must be in [0, 1]; std::invalid_argument otherwise
    void set_loss_rate(double rate);
    void set_reorder_rate(double rate);
    void set_corruption_rate(double rate);
    void set_delay_range(uint32_t min_delay_ms, uint32_t max_delay_ms);

    // Restart both generators from a new seed
    void reseed(uint64_t seed);

    [[nodiscard]] ImpairmentConfig config() const;
    [[nodiscard]] ImpairmentStats stats() const;
    void reset_stats();

    // Throws std::invalid_argument for rates outside [0, 1] or min > max delay
    static void validate(const ImpairmentConfig& config);

private:
    bool chance(double rate);

    mutable std::mutex mutex_;
    ImpairmentConfig config_;
    std::mt19937_64 rng_;
    std::mt19937_64 delay_rng_;
    ImpairmentStats stats_;
};

}  // namespace radlink::sim
