#include "stats/statistics.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace cred {

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

double variance(const std::vector<double>& values) {
    if (values.size() <= 1) {
        return 0.0;
    }

    double avg = mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        double diff = v - avg;
        sum_sq += diff * diff;
    }
    return sum_sq / static_cast<double>(values.size() - 1);
}

double standard_deviation(const std::vector<double>& values) {
    return std::sqrt(variance(values));
}

double median(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    size_t mid = sorted.size() / 2;
    if (sorted.size() % 2 == 0) {
        return (sorted[mid - 1] + sorted[mid]) / 2.0;
    }
    return sorted[mid];
}

double percentile(const std::vector<double>& values, double p) {
    if (values.empty()) {
        return 0.0;
    }
    if (values.size() == 1) {
        return values.front();
    }

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    double rank = clamp_range(p, 0.0, 100.0) / 100.0 * static_cast<double>(sorted.size() - 1);
    size_t lower = static_cast<size_t>(std::floor(rank));
    size_t upper = static_cast<size_t>(std::ceil(rank));
    if (lower == upper) {
        return sorted[lower];
    }

    double fraction = rank - static_cast<double>(lower);
    return sorted[lower] + (sorted[upper] - sorted[lower]) * fraction;
}

double round_to(double value, int decimals) {
    double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

double clamp_range(double value, double lo, double hi) {
    return std::min(hi, std::max(lo, value));
}

} // namespace cred
