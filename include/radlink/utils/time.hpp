#pragma once

#include <cstdint>
#include <chrono>

namespace radlink::utils {

// Wall-clock nanoseconds since the Unix epoch, stamped into fragment headers
inline uint64_t unix_time_ns() {
    auto now = std::chrono::system_clock::now();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count());
}

// Monotonic stopwatch for stage latencies and request deadlines
class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    void reset() { start_ = std::chrono::steady_clock::now(); }

    [[nodiscard]] std::chrono::nanoseconds elapsed() const {
        return std::chrono::steady_clock::now() - start_;
    }

private:
    std::chrono::steady_clock::time_point start_;
};

}  // namespace radlink::utils
