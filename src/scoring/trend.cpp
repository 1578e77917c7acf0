#include "scoring/trend.hpp"
#include "stats/statistics.hpp"
#include <algorithm>

namespace cred {

namespace {

constexpr size_t kMinTrendSamples = 5;
constexpr size_t kSparklineLength = 20;
constexpr double kTrendThreshold = 3.0;

std::optional<double> bucket_delta(const std::vector<double>& recent,
                                   const std::vector<double>& older) {
    if (recent.empty() || older.empty()) {
        return std::nullopt;
    }
    return round_to(mean(recent) - mean(older), 1);
}

} // anonymous namespace

nlohmann::json TrendSummary::to_json() const {
    nlohmann::json j;
    j["direction"] = trend_direction_to_string(direction);
    j["change30Days"] = change_30_days ? nlohmann::json(*change_30_days) : nlohmann::json(nullptr);
    j["change90Days"] = change_90_days ? nlohmann::json(*change_90_days) : nlohmann::json(nullptr);
    j["sparklineData"] = sparkline;
    return j;
}

TrendDirection classify_trend(std::optional<double> change_30_days) {
    if (!change_30_days) return TrendDirection::STABLE;
    if (*change_30_days > kTrendThreshold) return TrendDirection::IMPROVING;
    if (*change_30_days < -kTrendThreshold) return TrendDirection::DECLINING;
    return TrendDirection::STABLE;
}

TrendSummary analyze_trend(const std::vector<TimedObservation>& observations, TimePoint now) {
    std::vector<TimedObservation> sorted = observations;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const TimedObservation& a, const TimedObservation& b) {
                         return a.timestamp < b.timestamp;
                     });

    TrendSummary trend;

    if (sorted.size() < kMinTrendSamples) {
        for (const auto& obs : sorted) {
            trend.sparkline.push_back(obs.value);
        }
        return trend;
    }

    const TimePoint thirty_days_ago = now - std::chrono::hours(24 * 30);
    const TimePoint ninety_days_ago = now - std::chrono::hours(24 * 90);

    std::vector<double> recent, older_30, older_90;
    for (const auto& obs : sorted) {
        if (obs.timestamp > thirty_days_ago) {
            recent.push_back(obs.value);
        } else {
            older_30.push_back(obs.value);
        }
        if (obs.timestamp <= ninety_days_ago) {
            older_90.push_back(obs.value);
        }
    }

    trend.change_30_days = bucket_delta(recent, older_30);
    trend.change_90_days = bucket_delta(recent, older_90);
    trend.direction = classify_trend(trend.change_30_days);

    size_t start = sorted.size() > kSparklineLength ? sorted.size() - kSparklineLength : 0;
    for (size_t i = start; i < sorted.size(); ++i) {
        trend.sparkline.push_back(sorted[i].value);
    }

    return trend;
}

} // namespace cred
