#include "stats/bayesian.hpp"
#include "stats/statistics.hpp"
#include <algorithm>
#include <cmath>

namespace cred {

namespace {

// Two-sided 95% normal quantile
constexpr double kIntervalZ = 1.96;

constexpr double kHighConfidenceCount = 30.0;
constexpr double kLowConfidenceCount = 10.0;

BayesianSourceScore empty_score(const GlobalPrior& prior) {
    BayesianSourceScore score;
    score.raw_mean = prior.mean;
    score.raw_variance = prior.variance;
    score.sample_size = 0;
    score.shrunk_score = prior.mean;
    score.credible_interval = {0.0, 100.0};
    score.effective_sample_size = 0.0;
    score.grade_confidence = GradeConfidence::INSUFFICIENT;
    return score;
}

// Shared pipeline: raw moments -> shrinkage -> interval
BayesianSourceScore estimate(const std::vector<double>& scores,
                             double credibility_count,
                             const GlobalPrior& prior) {
    BayesianSourceScore score;
    score.sample_size = scores.size();
    score.effective_sample_size = credibility_count;
    score.raw_mean = mean(scores);

    double prior_variance = prior.variance > 0.0 ? prior.variance : GlobalPrior::kDefaultVariance;
    double observed_variance = variance(scores);
    score.raw_variance = observed_variance > 0.0 ? observed_variance : prior_variance;

    double k = score.raw_variance / prior_variance;
    double m = std::max(credibility_count, 0.0);
    double z = m / (m + k);

    double lo = std::min(score.raw_mean, prior.mean);
    double hi = std::max(score.raw_mean, prior.mean);
    double shrunk = z * score.raw_mean + (1.0 - z) * prior.mean;
    score.shrunk_score = clamp_range(round_to(shrunk, 1), lo, hi);

    double posterior_precision = 1.0 / prior_variance + m / score.raw_variance;
    double half_width = kIntervalZ * std::sqrt(1.0 / posterior_precision);

    double lower = round_to(clamp_range(score.shrunk_score - half_width, 0.0, 100.0), 1);
    double upper = round_to(clamp_range(score.shrunk_score + half_width, 0.0, 100.0), 1);
    score.credible_interval.lower = std::min(lower, score.shrunk_score);
    score.credible_interval.upper = std::max(upper, score.shrunk_score);

    score.grade_confidence = classify_confidence(
        score.sample_size, m, score.raw_variance, prior_variance);
    return score;
}

} // anonymous namespace

GlobalPrior compute_global_prior(const std::vector<double>& truth_scores,
                                 double default_mean,
                                 double default_variance) {
    GlobalPrior prior;
    prior.mean = truth_scores.empty() ? default_mean : mean(truth_scores);

    double v = truth_scores.size() > 1 ? variance(truth_scores) : 0.0;
    prior.variance = v > 0.0 ? v : default_variance;
    return prior;
}

nlohmann::json BayesianSourceScore::to_json() const {
    nlohmann::json j;
    j["rawMean"] = raw_mean;
    j["rawVariance"] = raw_variance;
    j["sampleSize"] = sample_size;
    j["shrunkScore"] = shrunk_score;
    j["credibleInterval"] = {
        {"lower", credible_interval.lower},
        {"upper", credible_interval.upper}
    };
    j["effectiveSampleSize"] = effective_sample_size;
    j["gradeConfidence"] = grade_confidence_to_string(grade_confidence);
    return j;
}

GradeConfidence classify_confidence(size_t sample_size,
                                    double credibility_count,
                                    double raw_variance,
                                    double prior_variance) {
    if (sample_size <= 1) {
        return GradeConfidence::INSUFFICIENT;
    }
    if (credibility_count < kLowConfidenceCount) {
        return GradeConfidence::LOW;
    }
    if (credibility_count >= kHighConfidenceCount && raw_variance <= prior_variance) {
        return GradeConfidence::HIGH;
    }
    return GradeConfidence::MEDIUM;
}

BayesianSourceScore calculate_bayesian_score(const std::vector<double>& scores,
                                             const GlobalPrior& prior) {
    if (scores.empty()) {
        return empty_score(prior);
    }
    return estimate(scores, effective_sample_size_count_only(scores), prior);
}

BayesianSourceScore calculate_bayesian_score(const std::vector<TimedObservation>& observations,
                                             const GlobalPrior& prior) {
    if (observations.empty()) {
        return empty_score(prior);
    }

    std::vector<double> scores;
    scores.reserve(observations.size());
    for (const auto& obs : observations) {
        scores.push_back(obs.value);
    }
    return estimate(scores, effective_sample_size_temporal(observations), prior);
}

} // namespace cred
