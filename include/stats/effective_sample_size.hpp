#pragma once

#include "stats/timestamp.hpp"
#include <string>
#include <vector>

namespace cred {

/**
 * @brief A single timestamped score
 */
struct TimedObservation {
    TimePoint timestamp;
    double value = 0.0;

    TimedObservation() = default;
    TimedObservation(TimePoint ts, double v) : timestamp(ts), value(v) {}

    static TimedObservation from_epoch_millis(int64_t millis, double value);

    /**
     * @brief Build from an ISO-8601 timestamp
     * @throws std::invalid_argument if the timestamp cannot be parsed
     */
    static TimedObservation from_iso8601(const std::string& timestamp, double value);
};

/**
 * @brief Unweighted fallback used when no timestamps are available
 * @return scores.size()
 */
double effective_sample_size_count_only(const std::vector<double>& scores);

/**
 * @brief Temporal effective sample size
 *
 * Observations are ordered by timestamp. The first one counts fully; every
 * later one is weighted by the gap since its predecessor:
 *
 *   gap < 1 day      0.3
 *   1 - 7 days       0.6
 *   7 - 30 days      0.85
 *   >= 30 days       1.0
 *
 * Five submissions within an hour are worth about 2.2 samples, not 5.
 *
 * @return 1 + sum of weights rounded to one decimal; 0 for empty input
 */
double effective_sample_size_temporal(const std::vector<TimedObservation>& observations);

// Weight contributed by an observation arriving gap_days after the previous one
double temporal_gap_weight(double gap_days);

} // namespace cred
