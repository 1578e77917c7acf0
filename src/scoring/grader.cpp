#include "scoring/grader.hpp"
#include "stats/statistics.hpp"
#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace cred {

namespace {

constexpr size_t kPenaltyFreeSampleSize = 20;
constexpr double kMaxSamplePenalty = 10.0;

const std::vector<std::pair<double, const char*>>& grade_thresholds() {
    static const std::vector<std::pair<double, const char*>> thresholds = {
        {93.0, "A"},
        {90.0, "A-"},
        {87.0, "B+"},
        {83.0, "B"},
        {80.0, "B-"},
        {77.0, "C+"},
        {73.0, "C"},
        {70.0, "C-"},
        {67.0, "D+"},
        {63.0, "D"},
        {60.0, "D-"}
    };
    return thresholds;
}

} // anonymous namespace

nlohmann::json ComponentScores::to_json() const {
    nlohmann::json j;
    j["logicalStructure"] = logical_structure;
    j["methodologyRigor"] = methodology_rigor;
    j["factualReliability"] = factual_reliability;
    j["manipulationAbsence"] = manipulation_absence;
    j["consistency"] = consistency;
    return j;
}

double manipulation_absence_score(size_t deception_count, size_t analysis_count) {
    if (analysis_count == 0) {
        return 0.0;
    }
    double rate = static_cast<double>(deception_count) / static_cast<double>(analysis_count);
    return std::max(0.0, 100.0 - rate * 20.0);
}

double consistency_score(double raw_variance) {
    return std::max(0.0, 100.0 - std::sqrt(std::max(raw_variance, 0.0)) * 4.0);
}

double weighted_base_score(const ComponentScores& c) {
    return c.logical_structure * CompositeWeights::kLogicalStructure +
           c.methodology_rigor * CompositeWeights::kMethodologyRigor +
           c.factual_reliability * CompositeWeights::kFactualReliability +
           c.manipulation_absence * CompositeWeights::kManipulationAbsence +
           c.consistency * CompositeWeights::kConsistency;
}

double small_sample_penalty(size_t analysis_count) {
    if (analysis_count >= kPenaltyFreeSampleSize) {
        return 0.0;
    }
    double fraction = static_cast<double>(analysis_count) / static_cast<double>(kPenaltyFreeSampleSize);
    return kMaxSamplePenalty * (1.0 - fraction);
}

std::string score_to_grade(double score) {
    for (const auto& [threshold, grade] : grade_thresholds()) {
        if (score >= threshold) return grade;
    }
    return "F";
}

std::string format_grade_display(const std::string& grade, GradeConfidence confidence) {
    switch (confidence) {
        case GradeConfidence::HIGH: return grade;
        case GradeConfidence::MEDIUM: return grade + " ±";
        case GradeConfidence::LOW: return "~" + grade;
        case GradeConfidence::INSUFFICIENT: return "N/R";
        default: return "N/R";
    }
}

CompositeGrade grade_source(const ComponentScores& components,
                            size_t analysis_count,
                            GradeConfidence confidence) {
    CompositeGrade result;
    result.base_score = weighted_base_score(components);
    result.penalty = small_sample_penalty(analysis_count);
    if (result.penalty > 0.0) {
        result.penalty_reason = "Low sample size (" + std::to_string(analysis_count) + " articles)";
    }

    result.final_score = std::max(0.0, result.base_score - result.penalty);
    result.grade = score_to_grade(result.final_score);
    result.grade_display = format_grade_display(result.grade, confidence);
    return result;
}

} // namespace cred
