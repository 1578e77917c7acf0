#pragma once

#include "scoring/component_scores.hpp"
#include "stats/timestamp.hpp"
#include <nlohmann/json.hpp>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace cred {

// ==========================================
// Upstream analysis records (read-only)
// ==========================================

enum class Verification {
    SUPPORTED,
    PARTIALLY_SUPPORTED,
    REFUTED,
    UNVERIFIABLE
};

inline std::string verification_to_string(Verification v) {
    switch (v) {
        case Verification::SUPPORTED: return "supported";
        case Verification::PARTIALLY_SUPPORTED: return "partially_supported";
        case Verification::REFUTED: return "refuted";
        case Verification::UNVERIFIABLE: return "unverifiable";
        default: return "unverifiable";
    }
}

inline Verification string_to_verification(const std::string& s) {
    if (s == "supported") return Verification::SUPPORTED;
    if (s == "partially_supported" || s == "partially-supported") return Verification::PARTIALLY_SUPPORTED;
    if (s == "refuted") return Verification::REFUTED;
    return Verification::UNVERIFIABLE;
}

struct DeceptionInstance {
    std::string type;
    std::string category;
};

struct FallacyInstance {
    std::string type;
    FallacySeverity severity = FallacySeverity::LOW;
};

struct FactCheckResult {
    Verification verification = Verification::UNVERIFIABLE;
};

/**
 * @brief Per-article sub-scores
 *
 * Each field sits on its own scale. A missing field is filled with the
 * midpoint of its scale so incomplete legacy data is not read as zero.
 */
struct ScoreBreakdown {
    static constexpr double kMaxEvidenceQuality = 40.0;
    static constexpr double kMaxMethodologyRigor = 25.0;
    static constexpr double kMaxLogicalStructure = 20.0;
    static constexpr double kMaxManipulationAbsence = 15.0;

    double evidence_quality = kMaxEvidenceQuality / 2;
    double methodology_rigor = kMaxMethodologyRigor / 2;
    double logical_structure = kMaxLogicalStructure / 2;
    double manipulation_absence = kMaxManipulationAbsence / 2;

    nlohmann::json to_json() const;
    static ScoreBreakdown from_json(const nlohmann::json& j);
};

/**
 * @brief One truth-score analysis of one article
 */
struct AnalysisRecord {
    std::string id;
    double truth_score = 0.0;                       ///< [0, 100]
    std::string credibility = "UNKNOWN";            ///< Upstream label, e.g. "HIGH"
    TimePoint created_at;
    std::optional<ScoreBreakdown> score_breakdown;
    std::vector<DeceptionInstance> deceptions;
    std::vector<FallacyInstance> fallacies;
    std::vector<FactCheckResult> fact_checks;

    nlohmann::json to_json() const;

    /**
     * @brief Normalize a loosely typed upstream record
     *
     * Numbers may arrive as JSON numbers or numeric strings and are clamped
     * to their scales. Unknown severities become low and unknown
     * verification outcomes become unverifiable.
     *
     * @return nullopt when the truth score or timestamp is unusable
     */
    static std::optional<AnalysisRecord> from_json(const nlohmann::json& j);
};

/**
 * @brief An article and its analyses, grouped under a publication
 */
struct ArticleRecord {
    std::string id;
    std::string publication;
    std::string article_type = "unknown";
    std::vector<AnalysisRecord> analyses;

    nlohmann::json to_json() const;

    // Unusable analyses are dropped
    static ArticleRecord from_json(const nlohmann::json& j);
};

// ==========================================
// Boundary coercion helpers
// ==========================================

/**
 * @brief Read a JSON number or numeric string
 * @return nullopt for anything else, including non-finite values
 */
std::optional<double> parse_number(const nlohmann::json& value);

/**
 * @brief Read j[key] as a number, falling back to default_value
 */
double coerce_number(const nlohmann::json& j, const std::string& key, double default_value);

/**
 * @brief Read j[key] as text, falling back to default_value
 *
 * Numbers are written out in JSON form (an id of 7 becomes "7"); null,
 * booleans and containers take the default.
 */
std::string coerce_string(const nlohmann::json& j, const std::string& key, const std::string& default_value);

/**
 * @brief Read a timestamp in any supported representation
 *
 * JSON numbers and all-digit strings are epoch milliseconds; other strings
 * are parsed as ISO-8601.
 */
std::optional<TimePoint> parse_timestamp(const nlohmann::json& value);

// First key of `keys` present in j, or nullptr
const nlohmann::json* find_first(const nlohmann::json& j, std::initializer_list<const char*> keys);

} // namespace cred
