#include "stats/effective_sample_size.hpp"
#include "stats/statistics.hpp"
#include <algorithm>
#include <stdexcept>

namespace cred {

TimedObservation TimedObservation::from_epoch_millis(int64_t millis, double value) {
    return TimedObservation(cred::from_epoch_millis(millis), value);
}

TimedObservation TimedObservation::from_iso8601(const std::string& timestamp, double value) {
    auto tp = parse_iso8601(timestamp);
    if (!tp) {
        throw std::invalid_argument("Unrecognized timestamp: " + timestamp);
    }
    return TimedObservation(*tp, value);
}

double effective_sample_size_count_only(const std::vector<double>& scores) {
    return static_cast<double>(scores.size());
}

double temporal_gap_weight(double gap_days) {
    if (gap_days < 1.0) return 0.3;
    if (gap_days < 7.0) return 0.6;
    if (gap_days < 30.0) return 0.85;
    return 1.0;
}

double effective_sample_size_temporal(const std::vector<TimedObservation>& observations) {
    if (observations.empty()) {
        return 0.0;
    }
    if (observations.size() == 1) {
        return 1.0;
    }

    std::vector<TimedObservation> sorted = observations;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const TimedObservation& a, const TimedObservation& b) {
                         return a.timestamp < b.timestamp;
                     });

    double ess = 1.0;
    for (size_t i = 1; i < sorted.size(); ++i) {
        double gap = days_between(sorted[i - 1].timestamp, sorted[i].timestamp);
        ess += temporal_gap_weight(gap);
    }

    return round_to(ess, 1);
}

} // namespace cred
