/**
 * @file vxs_latency_stats.cpp
 * @brief VoxStream Core - Latency statistics collector
 */

#include "voxstream/core/vxs_latency_stats.h"

#include <algorithm>
#include <cmath>

namespace voxstream {

namespace {

double mean_of(const std::vector<double>& values) {
    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    return sum / static_cast<double>(values.size());
}

double stddev_of(const std::vector<double>& values, double mean_val) {
    if (values.size() <= 1) {
        return 0.0;
    }
    double sum_sq = 0.0;
    for (double v : values) {
        double diff = v - mean_val;
        sum_sq += diff * diff;
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

}  // namespace

nlohmann::json LatencySummary::to_json() const {
    nlohmann::json j;
    j["count"] = count;
    j["p50_ms"] = p50_ms;
    j["p95_ms"] = p95_ms;
    j["p99_ms"] = p99_ms;
    j["min_ms"] = min_ms;
    j["max_ms"] = max_ms;
    j["mean_ms"] = mean_ms;
    j["stddev_ms"] = stddev_ms;
    j["outlier_count"] = outlier_count;
    return j;
}

void LatencyStats::record(double value_ms) {
    if (value_ms < 0.0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    values_.push_back(value_ms);
}

void LatencyStats::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
}

int32_t LatencyStats::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int32_t>(values_.size());
}

vxs_result_t LatencyStats::get_summary(LatencySummary& out) const {
    std::vector<double> sorted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sorted = values_;
    }
    out = LatencySummary();
    if (sorted.empty()) {
        return VXS_ERROR_INVALID_STATE;
    }

    std::sort(sorted.begin(), sorted.end());
    out.count = static_cast<int32_t>(sorted.size());
    out.p50_ms = percentile(sorted, 50);
    out.p95_ms = percentile(sorted, 95);
    out.p99_ms = percentile(sorted, 99);
    out.min_ms = sorted.front();
    out.max_ms = sorted.back();
    out.mean_ms = mean_of(sorted);
    out.stddev_ms = stddev_of(sorted, out.mean_ms);

    double threshold = out.mean_ms + 2.0 * out.stddev_ms;
    for (double v : sorted) {
        if (v > threshold) {
            out.outlier_count++;
        }
    }
    return VXS_SUCCESS;
}

nlohmann::json LatencyStats::to_json() const {
    LatencySummary summary;
    if (get_summary(summary) != VXS_SUCCESS) {
        return nlohmann::json{{"count", 0}};
    }
    return summary.to_json();
}

/**
 * Nearest-rank percentile. Assumes sorted is non-empty and ascending.
 */
double LatencyStats::percentile(const std::vector<double>& sorted, int p) {
    size_t n = sorted.size();
    if (n == 1) {
        return sorted[0];
    }
    size_t rank = static_cast<size_t>(std::ceil(static_cast<double>(p) / 100.0 * n));
    if (rank == 0) {
        rank = 1;
    }
    if (rank > n) {
        rank = n;
    }
    return sorted[rank - 1];
}

}  // namespace voxstream
