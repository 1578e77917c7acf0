#include "scoring/component_scores.hpp"
#include "stats/statistics.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace cred {

namespace {

constexpr double kLogicPointsPerWeight = 20.0;

double require_range(double value, double lo, double hi, const char* name) {
    if (!std::isfinite(value) || value < lo || value > hi) {
        std::stringstream ss;
        ss << name << " must be within [" << lo << ", " << hi << "], got " << value;
        throw std::out_of_range(ss.str());
    }
    return value;
}

} // anonymous namespace

double fallacy_deduction(FallacySeverity severity) {
    switch (severity) {
        case FallacySeverity::LOW: return 1.0;
        case FallacySeverity::MEDIUM: return 2.0;
        case FallacySeverity::HIGH: return 3.0;
        default: return 1.0;
    }
}

MethodologyInputs::MethodologyInputs(double avg_evidence_quality,
                                     double avg_methodology_rigor,
                                     double primary_source_rate,
                                     double verified_claim_rate)
    : avg_evidence_quality_(require_range(avg_evidence_quality, 0.0, kMaxEvidenceQuality, "avg_evidence_quality")),
      avg_methodology_rigor_(require_range(avg_methodology_rigor, 0.0, kMaxMethodologyRigor, "avg_methodology_rigor")),
      primary_source_rate_(require_range(primary_source_rate, 0.0, 1.0, "primary_source_rate")),
      verified_claim_rate_(require_range(verified_claim_rate, 0.0, 1.0, "verified_claim_rate")) {}

double methodology_score(const MethodologyInputs& inputs) {
    double score = (inputs.avg_evidence_quality() / MethodologyInputs::kMaxEvidenceQuality) * 40.0 +
                   (inputs.avg_methodology_rigor() / MethodologyInputs::kMaxMethodologyRigor) * 30.0 +
                   inputs.primary_source_rate() * 15.0 +
                   inputs.verified_claim_rate() * 15.0;
    return round_to(score, 1);
}

double logic_score(const std::vector<FallacySeverity>& fallacies, size_t total_articles) {
    if (total_articles == 0) {
        return 0.0;
    }

    double total_deduction = 0.0;
    for (auto severity : fallacies) {
        total_deduction += fallacy_deduction(severity);
    }

    double per_article = total_deduction / static_cast<double>(total_articles);
    double score = 100.0 - per_article * kLogicPointsPerWeight;
    return round_to(clamp_range(score, 0.0, 100.0), 1);
}

} // namespace cred
