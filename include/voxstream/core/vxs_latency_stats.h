/**
 * @file vxs_latency_stats.h
 * @brief VoxStream Core - Latency statistics collector
 *
 * Thread-safe collector of latency observations (milliseconds). Summaries
 * use nearest-rank percentiles.
 */

#ifndef VOXSTREAM_CORE_LATENCY_STATS_H
#define VOXSTREAM_CORE_LATENCY_STATS_H

#include <cstdint>
#include <mutex>
#include <vector>

#include <nlohmann/json.hpp>

#include "voxstream/core/vxs_types.h"

namespace voxstream {

struct LatencySummary {
    int32_t count = 0;
    double p50_ms = 0.0;
    double p95_ms = 0.0;
    double p99_ms = 0.0;
    double min_ms = 0.0;
    double max_ms = 0.0;
    double mean_ms = 0.0;
    double stddev_ms = 0.0;

    // Observations above mean + 2 * stddev
    int32_t outlier_count = 0;

    nlohmann::json to_json() const;
};

class LatencyStats {
   public:
    LatencyStats() = default;

    void record(double value_ms);
    void reset();
    int32_t count() const;

    /**
     * @brief Compute the summary of everything recorded so far.
     * @return VXS_ERROR_INVALID_STATE when nothing has been recorded
     */
    vxs_result_t get_summary(LatencySummary& out) const;

    /** Summary as JSON; an empty collector yields {"count": 0}. */
    nlohmann::json to_json() const;

    static double percentile(const std::vector<double>& sorted, int p);

   private:
    mutable std::mutex mutex_;
    std::vector<double> values_;
};

}  // namespace voxstream

#endif  // VOXSTREAM_CORE_LATENCY_STATS_H
