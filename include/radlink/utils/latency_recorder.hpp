#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace radlink::utils {

struct PercentileSummary {
    size_t count{0};
    double min{0.0};
    double max{0.0};
    double mean{0.0};
    double p50{0.0};
    double p95{0.0};
    double p99{0.0};
};

// Equal-width buckets over [min, max]; boundaries has one more entry than counts
struct Histogram {
    std::vector<double> boundaries;
    std::vector<uint64_t> counts;
};

// One line per bucket: "[lo, hi) count ####"
std::string format_histogram(const Histogram& histogram, size_t bar_width = 40);

// Thread-safe sample store. Every recorded sample is kept until clear().
// Samples are unitless; the pipeline records microseconds.
class LatencyRecorder {
public:
    explicit LatencyRecorder(std::string name = {});

    LatencyRecorder(const LatencyRecorder& other);
    LatencyRecorder& operator=(const LatencyRecorder& other);

    void record(double sample);

    // Record a duration in microseconds
    void record(std::chrono::nanoseconds duration);

    // Percentile in [0, 100] by linear interpolation on the sorted samples.
    // 0 when empty; std::invalid_argument outside the range.
    [[nodiscard]] double percentile(double p) const;

    [[nodiscard]] PercentileSummary percentiles() const;

    // Throws std::invalid_argument when bucket_count is 0
    [[nodiscard]] Histogram histogram(size_t bucket_count) const;

    [[nodiscard]] size_t count() const;
    [[nodiscard]] std::vector<double> samples() const;
    [[nodiscard]] const std::string& name() const { return name_; }

    void clear();

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::vector<double> samples_;
};

}  // namespace radlink::utils
