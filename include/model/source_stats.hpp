#pragma once

#include "scoring/grader.hpp"
#include "scoring/trend.hpp"
#include "stats/bayesian.hpp"
#include "stats/timestamp.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cred {

struct TypeCount {
    std::string type;
    int count = 0;
};

struct FactCheckPerformance {
    int supported = 0;
    int partially_supported = 0;
    int refuted = 0;
    double success_rate = 0.0;   ///< (supported + partially) / total * 100

    nlohmann::json to_json() const;
};

/**
 * @brief Aggregate credibility report for one publication
 *
 * Recomputed on every query and never persisted.
 */
struct SourceStats {
    std::string id;                  // URL-safe slug of the publication
    std::string publication;
    size_t article_count = 0;

    BayesianSourceScore bayesian_score;

    std::string grade;
    std::string grade_display;
    double numeric_score = 0.0;

    ComponentScores components;

    double penalty = 0.0;
    std::optional<std::string> penalty_reason;

    std::map<std::string, int> credibility_distribution;
    std::map<std::string, int> article_type_distribution;

    std::map<std::string, int> manipulation_breakdown;
    std::vector<TypeCount> top_deception_types;
    std::vector<TypeCount> top_fallacies;
    FactCheckPerformance fact_check_performance;

    TrendSummary trend;

    TimePoint first_analysis;
    TimePoint last_analysis;
    int time_span_days = 0;

    nlohmann::json to_json() const;
};

/**
 * @brief One page of ranked sources
 */
struct SourceStatsPage {
    std::vector<SourceStats> sources;
    size_t total = 0;            // Matching sources before pagination
    double global_mean = 0.0;

    nlohmann::json to_json() const;
};

// Lowercase, every character outside [a-z0-9] replaced by '-'
std::string slugify(const std::string& publication);

} // namespace cred
