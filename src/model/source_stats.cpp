#include "model/source_stats.hpp"
#include <cctype>

namespace cred {

namespace {

nlohmann::json type_counts_to_json(const std::vector<TypeCount>& counts) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& tc : counts) {
        arr.push_back({{"type", tc.type}, {"count", tc.count}});
    }
    return arr;
}

} // anonymous namespace

nlohmann::json FactCheckPerformance::to_json() const {
    nlohmann::json j;
    j["supported"] = supported;
    j["partiallySupported"] = partially_supported;
    j["refuted"] = refuted;
    j["successRate"] = success_rate;
    return j;
}

nlohmann::json SourceStats::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["publication"] = publication;
    j["articleCount"] = article_count;
    j["bayesianScore"] = bayesian_score.to_json();
    j["grade"] = grade;
    j["gradeDisplay"] = grade_display;
    j["numericScore"] = numeric_score;
    j["components"] = components.to_json();
    j["penalty"] = penalty;
    j["penaltyReason"] = penalty_reason ? nlohmann::json(*penalty_reason) : nlohmann::json(nullptr);
    j["credibilityDistribution"] = credibility_distribution;
    j["articleTypeDistribution"] = article_type_distribution;
    j["manipulationBreakdown"] = manipulation_breakdown;
    j["topDeceptionTypes"] = type_counts_to_json(top_deception_types);
    j["topFallacies"] = type_counts_to_json(top_fallacies);
    j["factCheckPerformance"] = fact_check_performance.to_json();
    j["trend"] = trend.to_json();
    j["firstAnalysis"] = format_iso8601(first_analysis);
    j["lastAnalysis"] = format_iso8601(last_analysis);
    j["timeSpanDays"] = time_span_days;
    return j;
}

nlohmann::json SourceStatsPage::to_json() const {
    nlohmann::json j;
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& s : sources) {
        arr.push_back(s.to_json());
    }
    j["sources"] = arr;
    j["total"] = total;
    j["globalMean"] = global_mean;
    return j;
}

std::string slugify(const std::string& publication) {
    std::string out;
    out.reserve(publication.size());
    for (unsigned char c : publication) {
        char lower = static_cast<char>(std::tolower(c));
        bool keep = (lower >= 'a' && lower <= 'z') || (lower >= '0' && lower <= '9');
        out.push_back(keep ? lower : '-');
    }
    return out;
}

} // namespace cred
