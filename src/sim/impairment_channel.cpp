#include "radlink/sim/impairment_channel.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace radlink::sim {

namespace {

// Keeps the delay stream independent of the impairment stream
constexpr uint64_t DELAY_SEED_MIX = 0x9E3779B97F4A7C15ULL;

void check_rate(double rate, const char* name) {
    if (!(rate >= 0.0 && rate <= 1.0)) {
        throw std::invalid_argument(std::string(name) + " must be in [0, 1]");
    }
}

}  // namespace

ImpairmentChannel::ImpairmentChannel(const ImpairmentConfig& config)
    : config_(config), rng_(config.seed), delay_rng_(config.seed ^ DELAY_SEED_MIX) {
    validate(config);
}

void ImpairmentChannel::validate(const ImpairmentConfig& config) {
    check_rate(config.loss_rate, "loss_rate");
    check_rate(config.reorder_rate, "reorder_rate");
    check_rate(config.corruption_rate, "corruption_rate");
    if (config.min_delay_ms > config.max_delay_ms) {
        throw std::invalid_argument("min_delay_ms must not exceed max_delay_ms");
    }
}

bool ImpairmentChannel::chance(double rate) {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng_) < rate;
}

std::vector<std::vector<uint8_t>> ImpairmentChannel::transmit(
    std::vector<std::vector<uint8_t>> datagrams) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.sent += datagrams.size();

    // 1. Loss
    std::vector<std::vector<uint8_t>> survivors;
    survivors.reserve(datagrams.size());
    for (auto& datagram : datagrams) {
        if (chance(config_.loss_rate)) {
            ++stats_.lost;
            continue;
        }
        survivors.push_back(std::move(datagram));
    }

    // 2. Corruption
    for (auto& datagram : survivors) {
        if (!chance(config_.corruption_rate)) {
            continue;
        }
        if (datagram.size() <= config_.protected_header_bytes) {
            continue;
        }
        std::uniform_int_distribution<size_t> byte_dist(config_.protected_header_bytes,
                                                        datagram.size() - 1);
        std::uniform_int_distribution<int> bit_dist(0, 7);
        size_t index = byte_dist(rng_);
        datagram[index] ^= static_cast<uint8_t>(1u << bit_dist(rng_));
        ++stats_.corrupted;
    }

    // 3. Reorder
    for (size_t i = survivors.size(); i > 1; --i) {
        size_t pos = i - 1;
        if (!chance(config_.reorder_rate)) {
            continue;
        }
        std::uniform_int_distribution<size_t> dist(0, pos);
        size_t other = dist(rng_);
        if (other != pos) {
            std::swap(survivors[pos], survivors[other]);
            ++stats_.reordered;
        }
    }

    stats_.delivered += survivors.size();
    return survivors;
}

std::vector<uint32_t> ImpairmentChannel::sample_delays(size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::uniform_int_distribution<uint32_t> dist(config_.min_delay_ms, config_.max_delay_ms);
    std::vector<uint32_t> delays(count);
    for (auto& delay : delays) {
        delay = dist(delay_rng_);
    }
    return delays;
}

void ImpairmentChannel::set_loss_rate(double rate) {
    check_rate(rate, "loss_rate");
    std::lock_guard<std::mutex> lock(mutex_);
    config_.loss_rate = rate;
}

void ImpairmentChannel::set_reorder_rate(double rate) {
    check_rate(rate, "reorder_rate");
    std::lock_guard<std::mutex> lock(mutex_);
    config_.reorder_rate = rate;
}

void ImpairmentChannel::set_corruption_rate(double rate) {
    check_rate(rate, "corruption_rate");
    std::lock_guard<std::mutex> lock(mutex_);
    config_.corruption_rate = rate;
}

void ImpairmentChannel::set_delay_range(uint32_t min_delay_ms, uint32_t max_delay_ms) {
    if (min_delay_ms > max_delay_ms) {
        throw std::invalid_argument("min_delay_ms must not exceed max_delay_ms");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_delay_ms = min_delay_ms;
    config_.max_delay_ms = max_delay_ms;
}

void ImpairmentChannel::reseed(uint64_t seed) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.seed = seed;
    rng_.seed(seed);
    delay_rng_.seed(seed ^ DELAY_SEED_MIX);
}

ImpairmentConfig ImpairmentChannel::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

ImpairmentStats ImpairmentChannel::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void ImpairmentChannel::reset_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = ImpairmentStats{};
}

}  // namespace radlink::sim
