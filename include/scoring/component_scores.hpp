#pragma once

#include <string>
#include <vector>

namespace cred {

// Severity of a detected logical fallacy
enum class FallacySeverity {
    LOW,
    MEDIUM,
    HIGH
};

inline std::string fallacy_severity_to_string(FallacySeverity severity) {
    switch (severity) {
        case FallacySeverity::LOW: return "low";
        case FallacySeverity::MEDIUM: return "medium";
        case FallacySeverity::HIGH: return "high";
        default: return "low";
    }
}

// Unknown labels count as low
inline FallacySeverity string_to_fallacy_severity(const std::string& s) {
    if (s == "low" || s == "LOW") return FallacySeverity::LOW;
    if (s == "medium" || s == "MEDIUM") return FallacySeverity::MEDIUM;
    if (s == "high" || s == "HIGH") return FallacySeverity::HIGH;
    return FallacySeverity::LOW;
}

/**
 * @brief Severity weight of a fallacy: low 1, medium 2, high 3
 */
double fallacy_deduction(FallacySeverity severity);

/**
 * @brief Range-checked inputs of the methodology score
 *
 * Averages produced upstream on fixed scales. Construction throws
 * std::out_of_range when a value is outside its scale or not finite.
 */
class MethodologyInputs {
public:
    static constexpr double kMaxEvidenceQuality = 40.0;
    static constexpr double kMaxMethodologyRigor = 25.0;

    MethodologyInputs(double avg_evidence_quality,
                      double avg_methodology_rigor,
                      double primary_source_rate,
                      double verified_claim_rate);

    double avg_evidence_quality() const { return avg_evidence_quality_; }
    double avg_methodology_rigor() const { return avg_methodology_rigor_; }
    double primary_source_rate() const { return primary_source_rate_; }
    double verified_claim_rate() const { return verified_claim_rate_; }

private:
    double avg_evidence_quality_;    // [0, 40]
    double avg_methodology_rigor_;   // [0, 25]
    double primary_source_rate_;     // [0, 1]
    double verified_claim_rate_;     // [0, 1]
};

/**
 * @brief Methodology component on a 0-100 scale
 *
 * (eq / 40) * 40 + (mr / 25) * 30 + psr * 15 + vcr * 15, rounded to one
 * decimal. Each term is monotonic in its own input.
 */
double methodology_score(const MethodologyInputs& inputs);

/**
 * @brief Logic component on a 0-100 scale
 *
 * Starts at 100 and subtracts 20 points per unit of severity weight per
 * article, so one low fallacy in every article costs 20. Clamped to [0, 100]
 * and rounded to one decimal; 0 when total_articles is 0.
 */
double logic_score(const std::vector<FallacySeverity>& fallacies, size_t total_articles);

} // namespace cred
