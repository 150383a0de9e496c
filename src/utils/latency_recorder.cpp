#include "radlink/utils/latency_recorder.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

namespace radlink::utils {

namespace {

double interpolate(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) {
        return 0.0;
    }
    double index = p / 100.0 * static_cast<double>(sorted.size() - 1);
    auto lower = static_cast<size_t>(std::floor(index));
    auto upper = static_cast<size_t>(std::ceil(index));
    double fraction = index - static_cast<double>(lower);
    return sorted[lower] + (sorted[upper] - sorted[lower]) * fraction;
}

void check_percentile(double p) {
    if (!(p >= 0.0 && p <= 100.0)) {
        throw std::invalid_argument("percentile must be in [0, 100]");
    }
}

}  // namespace

std::string format_histogram(const Histogram& histogram, size_t bar_width) {
    uint64_t peak = 0;
    for (uint64_t count : histogram.counts) {
        peak = std::max(peak, count);
    }

    std::string out;
    for (size_t i = 0; i < histogram.counts.size(); ++i) {
        uint64_t count = histogram.counts[i];
        size_t bar = peak == 0 ? 0 : static_cast<size_t>(count * bar_width / peak);
        out += fmt::format("[{:>10.2f}, {:>10.2f}) {:>8} {}\n", histogram.boundaries[i],
                           histogram.boundaries[i + 1], count, std::string(bar, '#'));
    }
    return out;
}

LatencyRecorder::LatencyRecorder(std::string name) : name_(std::move(name)) {
}

LatencyRecorder::LatencyRecorder(const LatencyRecorder& other) : name_(other.name_) {
    std::lock_guard<std::mutex> lock(other.mutex_);
    samples_ = other.samples_;
}

LatencyRecorder& LatencyRecorder::operator=(const LatencyRecorder& other) {
    if (this != &other) {
        std::scoped_lock lock(mutex_, other.mutex_);
        name_ = other.name_;
        samples_ = other.samples_;
    }
    return *this;
}

void LatencyRecorder::record(double sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.push_back(sample);
}

void LatencyRecorder::record(std::chrono::nanoseconds duration) {
    record(std::chrono::duration<double, std::micro>(duration).count());
}

double LatencyRecorder::percentile(double p) const {
    check_percentile(p);
    auto sorted = samples();
    std::sort(sorted.begin(), sorted.end());
    return interpolate(sorted, p);
}

PercentileSummary LatencyRecorder::percentiles() const {
    auto sorted = samples();
    PercentileSummary summary;
    if (sorted.empty()) {
        return summary;
    }
    std::sort(sorted.begin(), sorted.end());

    summary.count = sorted.size();
    summary.min = sorted.front();
    summary.max = sorted.back();
    summary.mean = std::accumulate(sorted.begin(), sorted.end(), 0.0) /
                   static_cast<double>(sorted.size());
    summary.p50 = interpolate(sorted, 50.0);
    summary.p95 = interpolate(sorted, 95.0);
    summary.p99 = interpolate(sorted, 99.0);
    return summary;
}

Histogram LatencyRecorder::histogram(size_t bucket_count) const {
    if (bucket_count == 0) {
        throw std::invalid_argument("histogram needs at least one bucket");
    }

    auto values = samples();
    Histogram result;
    result.counts.assign(bucket_count, 0);
    result.boundaries.assign(bucket_count + 1, 0.0);
    if (values.empty()) {
        return result;
    }

    auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
    double lo = *min_it;
    double hi = *max_it;
    double width = (hi - lo) / static_cast<double>(bucket_count);

    for (size_t i = 0; i <= bucket_count; ++i) {
        result.boundaries[i] = lo + width * static_cast<double>(i);
    }
    result.boundaries[bucket_count] = hi;

    for (double value : values) {
        size_t bucket = 0;
        if (width > 0.0) {
            bucket = static_cast<size_t>((value - lo) / width);
            bucket = std::min(bucket, bucket_count - 1);
        }
        ++result.counts[bucket];
    }
    return result;
}

size_t LatencyRecorder::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size();
}

std::vector<double> LatencyRecorder::samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_;
}

void LatencyRecorder::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.clear();
}

}  // namespace radlink::utils
