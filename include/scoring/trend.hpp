#pragma once

#include "stats/effective_sample_size.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace cred {

enum class TrendDirection {
    IMPROVING,
    STABLE,
    DECLINING
};

inline std::string trend_direction_to_string(TrendDirection direction) {
    switch (direction) {
        case TrendDirection::IMPROVING: return "improving";
        case TrendDirection::STABLE: return "stable";
        case TrendDirection::DECLINING: return "declining";
        default: return "stable";
    }
}

struct TrendSummary {
    TrendDirection direction = TrendDirection::STABLE;
    std::optional<double> change_30_days;
    std::optional<double> change_90_days;
    std::vector<double> sparkline;

    nlohmann::json to_json() const;
};

// Direction from a 30-day change: > 3 improving, < -3 declining
TrendDirection classify_trend(std::optional<double> change_30_days);

/**
 * @brief Score movement of a source relative to `now`
 *
 * Scores after now - 30d form the recent bucket; scores at or before
 * now - 30d and now - 90d form the two comparison buckets. Deltas are
 * recent mean minus bucket mean, rounded to one decimal, and null when
 * either side is empty. Fewer than five observations are reported as
 * stable with no deltas.
 *
 * The sparkline holds the last 20 scores in chronological order.
 */
TrendSummary analyze_trend(const std::vector<TimedObservation>& observations, TimePoint now);

} // namespace cred
