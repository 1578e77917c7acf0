#pragma once

#include "stats/bayesian.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace cred {

/**
 * @brief The five 0-100 components of a source grade
 */
struct ComponentScores {
    double logical_structure = 0.0;      ///< Fallacy frequency and severity
    double methodology_rigor = 0.0;      ///< Evidence and sourcing quality
    double factual_reliability = 0.0;    ///< Shrunk truth score
    double manipulation_absence = 0.0;   ///< Deception rate
    double consistency = 0.0;            ///< Spread of truth scores

    nlohmann::json to_json() const;
};

// Composite weights (sum to 1)
struct CompositeWeights {
    static constexpr double kLogicalStructure = 0.30;
    static constexpr double kMethodologyRigor = 0.20;
    static constexpr double kFactualReliability = 0.25;
    static constexpr double kManipulationAbsence = 0.15;
    static constexpr double kConsistency = 0.10;
};

/**
 * @brief Result of grading one source
 */
struct CompositeGrade {
    double base_score = 0.0;
    double penalty = 0.0;
    std::optional<std::string> penalty_reason;
    double final_score = 0.0;
    std::string grade;
    std::string grade_display;
};

/**
 * @brief max(0, 100 - deceptions per analysis * 20); 0 without analyses
 */
double manipulation_absence_score(size_t deception_count, size_t analysis_count);

/**
 * @brief max(0, 100 - stddev * 4)
 */
double consistency_score(double raw_variance);

double weighted_base_score(const ComponentScores& components);

/**
 * @brief Small-sample penalty
 *
 * 10 * (1 - n / 20) below 20 analyses, 0 from 20 on.
 */
double small_sample_penalty(size_t analysis_count);

/**
 * @brief Letter grade with inclusive lower bounds
 *
 * 93 A, 90 A-, 87 B+, 83 B, 80 B-, 77 C+, 73 C, 70 C-, 67 D+, 63 D, 60 D-,
 * anything lower is F.
 */
std::string score_to_grade(double score);

/**
 * @brief Qualify a grade by confidence
 *
 * HIGH shows the bare grade, MEDIUM appends " ±", LOW prefixes "~" and
 * INSUFFICIENT is never rated ("N/R").
 */
std::string format_grade_display(const std::string& grade, GradeConfidence confidence);

/**
 * @brief Weight the components, apply the penalty and assign the grade
 */
CompositeGrade grade_source(const ComponentScores& components,
                            size_t analysis_count,
                            GradeConfidence confidence);

} // namespace cred
