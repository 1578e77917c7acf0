#pragma once

#include "stats/effective_sample_size.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace cred {

/**
 * @brief How much the data supports a grade
 */
enum class GradeConfidence {
    HIGH,
    MEDIUM,
    LOW,
    INSUFFICIENT
};

inline std::string grade_confidence_to_string(GradeConfidence confidence) {
    switch (confidence) {
        case GradeConfidence::HIGH: return "HIGH";
        case GradeConfidence::MEDIUM: return "MEDIUM";
        case GradeConfidence::LOW: return "LOW";
        case GradeConfidence::INSUFFICIENT: return "INSUFFICIENT";
        default: return "INSUFFICIENT";
    }
}

/**
 * @brief System-wide belief about an unseen source
 *
 * Mean and variance of every truth score in the system. Falls back to
 * {50, 225} (a standard deviation of 15) when there is no data.
 */
struct GlobalPrior {
    static constexpr double kDefaultMean = 50.0;
    static constexpr double kDefaultVariance = 225.0;

    double mean = kDefaultMean;
    double variance = kDefaultVariance;

    nlohmann::json to_json() const {
        return {{"mean", mean}, {"variance", variance}};
    }
};

/**
 * @brief Compute the prior from all truth scores
 *
 * Mean defaults when there are no scores; variance defaults when fewer
 * than two scores exist or the spread is zero.
 */
GlobalPrior compute_global_prior(const std::vector<double>& truth_scores,
                                 double default_mean = GlobalPrior::kDefaultMean,
                                 double default_variance = GlobalPrior::kDefaultVariance);

struct CredibleInterval {
    double lower = 0.0;
    double upper = 100.0;

    double width() const { return upper - lower; }
};

/**
 * @brief Shrunk credibility estimate for a single source
 */
struct BayesianSourceScore {
    double raw_mean = 0.0;
    double raw_variance = 0.0;
    size_t sample_size = 0;
    double shrunk_score = 0.0;
    CredibleInterval credible_interval;
    double effective_sample_size = 0.0;
    GradeConfidence grade_confidence = GradeConfidence::INSUFFICIENT;

    nlohmann::json to_json() const;
};

/**
 * @brief Bühlmann credibility estimate from a plain score list
 *
 * The credibility weight is Z = n / (n + K) with K = raw_variance /
 * prior.variance, so small or noisy samples are pulled toward the prior
 * mean and large, tight samples keep their own mean. The credible interval
 * comes from the normal-normal posterior variance
 * 1 / (1 / prior.variance + n / raw_variance) and narrows as n grows.
 *
 * effective_sample_size equals n; no temporal discount is applied here.
 */
BayesianSourceScore calculate_bayesian_score(const std::vector<double>& scores,
                                             const GlobalPrior& prior);

/**
 * @brief Credibility estimate from timestamped scores
 *
 * Same estimator, but the temporal effective sample size replaces n as
 * the credibility count, so bursts of submissions narrow the interval
 * less than well-spaced ones.
 */
BayesianSourceScore calculate_bayesian_score(const std::vector<TimedObservation>& observations,
                                             const GlobalPrior& prior);

// Confidence tier for a sample of sample_size scores weighted as credibility_count
GradeConfidence classify_confidence(size_t sample_size,
                                    double credibility_count,
                                    double raw_variance,
                                    double prior_variance);

} // namespace cred
