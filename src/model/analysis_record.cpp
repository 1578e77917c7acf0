#include "model/analysis_record.hpp"
#include "stats/statistics.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace cred {

// ==========================================
// Boundary coercion
// ==========================================

std::optional<double> parse_number(const nlohmann::json& value) {
    if (value.is_number()) {
        double v = value.get<double>();
        if (std::isfinite(v)) return v;
        return std::nullopt;
    }
    if (value.is_string()) {
        const std::string& s = value.get_ref<const std::string&>();
        if (s.empty()) return std::nullopt;
        char* end = nullptr;
        double v = std::strtod(s.c_str(), &end);
        while (end && *end && std::isspace(static_cast<unsigned char>(*end))) ++end;
        if (end == s.c_str() || (end && *end != '\0') || !std::isfinite(v)) {
            return std::nullopt;
        }
        return v;
    }
    return std::nullopt;
}

double coerce_number(const nlohmann::json& j, const std::string& key, double default_value) {
    if (!j.is_object() || !j.contains(key)) {
        return default_value;
    }
    auto v = parse_number(j[key]);
    return v ? *v : default_value;
}

std::string coerce_string(const nlohmann::json& j, const std::string& key, const std::string& default_value) {
    if (!j.is_object()) {
        return default_value;
    }
    auto it = j.find(key);
    if (it == j.end()) {
        return default_value;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number()) {
        return it->dump();
    }
    return default_value;
}

std::optional<TimePoint> parse_timestamp(const nlohmann::json& value) {
    if (value.is_number()) {
        auto v = parse_number(value);
        if (!v) return std::nullopt;
        return checked_from_epoch_millis(*v);
    }
    if (!value.is_string()) {
        return std::nullopt;
    }

    const std::string& s = value.get_ref<const std::string&>();
    bool all_digits = !s.empty();
    for (unsigned char c : s) {
        if (!std::isdigit(c)) {
            all_digits = false;
            break;
        }
    }
    if (all_digits) {
        // More than 18 digits cannot fit an int64_t
        if (s.size() > 18) return std::nullopt;
        int64_t millis = std::strtoll(s.c_str(), nullptr, 10);
        if (millis >= max_epoch_millis()) return std::nullopt;
        return from_epoch_millis(millis);
    }
    return parse_iso8601(s);
}

const nlohmann::json* find_first(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    if (!j.is_object()) return nullptr;
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) return &(*it);
    }
    return nullptr;
}

// ==========================================
// ScoreBreakdown
// ==========================================

nlohmann::json ScoreBreakdown::to_json() const {
    nlohmann::json j;
    j["evidenceQuality"] = evidence_quality;
    j["methodologyRigor"] = methodology_rigor;
    j["logicalStructure"] = logical_structure;
    j["manipulationAbsence"] = manipulation_absence;
    return j;
}

ScoreBreakdown ScoreBreakdown::from_json(const nlohmann::json& j) {
    ScoreBreakdown b;
    b.evidence_quality = clamp_range(
        coerce_number(j, "evidenceQuality", b.evidence_quality), 0.0, kMaxEvidenceQuality);
    b.methodology_rigor = clamp_range(
        coerce_number(j, "methodologyRigor", b.methodology_rigor), 0.0, kMaxMethodologyRigor);
    b.logical_structure = clamp_range(
        coerce_number(j, "logicalStructure", b.logical_structure), 0.0, kMaxLogicalStructure);
    b.manipulation_absence = clamp_range(
        coerce_number(j, "manipulationAbsence", b.manipulation_absence), 0.0, kMaxManipulationAbsence);
    return b;
}

// ==========================================
// AnalysisRecord
// ==========================================

nlohmann::json AnalysisRecord::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["truthScore"] = truth_score;
    j["credibility"] = credibility;
    j["createdAt"] = format_iso8601(created_at);
    j["scoreBreakdown"] = score_breakdown ? score_breakdown->to_json() : nlohmann::json(nullptr);

    nlohmann::json deception_arr = nlohmann::json::array();
    for (const auto& d : deceptions) {
        deception_arr.push_back({{"type", d.type}, {"category", d.category}});
    }
    j["deceptionDetected"] = deception_arr;

    nlohmann::json fallacy_arr = nlohmann::json::array();
    for (const auto& f : fallacies) {
        fallacy_arr.push_back({{"type", f.type}, {"severity", fallacy_severity_to_string(f.severity)}});
    }
    j["fallacies"] = fallacy_arr;

    nlohmann::json fact_arr = nlohmann::json::array();
    for (const auto& fc : fact_checks) {
        fact_arr.push_back({{"verification", verification_to_string(fc.verification)}});
    }
    j["factCheckResults"] = fact_arr;
    return j;
}

std::optional<AnalysisRecord> AnalysisRecord::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    const auto* score_json = find_first(j, {"truthScore", "truth_score"});
    const auto* created_json = find_first(j, {"createdAt", "created_at"});
    if (!score_json || !created_json) {
        return std::nullopt;
    }

    auto score = parse_number(*score_json);
    auto created = parse_timestamp(*created_json);
    if (!score || !created) {
        return std::nullopt;
    }

    AnalysisRecord rec;
    rec.id = coerce_string(j, "id", "");
    rec.truth_score = clamp_range(*score, 0.0, 100.0);
    rec.created_at = *created;
    rec.credibility = coerce_string(j, "credibility", rec.credibility);

    if (const auto* breakdown = find_first(j, {"scoreBreakdown", "score_breakdown"})) {
        if (breakdown->is_object()) {
            rec.score_breakdown = ScoreBreakdown::from_json(*breakdown);
        }
    }

    if (const auto* arr = find_first(j, {"deceptionDetected", "deceptionInstances", "deceptions"})) {
        if (arr->is_array()) {
            for (const auto& d : *arr) {
                if (!d.is_object()) continue;
                DeceptionInstance inst;
                inst.type = coerce_string(d, "type", "unknown");
                inst.category = coerce_string(d, "category", "other");
                rec.deceptions.push_back(inst);
            }
        }
    }

    if (const auto* arr = find_first(j, {"fallacies", "fallacyInstances"})) {
        if (arr->is_array()) {
            for (const auto& f : *arr) {
                if (!f.is_object()) continue;
                FallacyInstance inst;
                inst.type = coerce_string(f, "type", "logical_fallacy");
                if (f.contains("severity") && f["severity"].is_string()) {
                    inst.severity = string_to_fallacy_severity(f["severity"].get<std::string>());
                }
                rec.fallacies.push_back(inst);
            }
        }
    }

    if (const auto* arr = find_first(j, {"factCheckResults", "fact_check_results"})) {
        if (arr->is_array()) {
            for (const auto& fc : *arr) {
                if (!fc.is_object()) continue;
                FactCheckResult result;
                if (fc.contains("verification") && fc["verification"].is_string()) {
                    result.verification = string_to_verification(fc["verification"].get<std::string>());
                }
                rec.fact_checks.push_back(result);
            }
        }
    }

    return rec;
}

// ==========================================
// ArticleRecord
// ==========================================

nlohmann::json ArticleRecord::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["publication"] = publication;
    j["articleType"] = article_type;
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& a : analyses) {
        arr.push_back(a.to_json());
    }
    j["analyses"] = arr;
    return j;
}

ArticleRecord ArticleRecord::from_json(const nlohmann::json& j) {
    ArticleRecord article;
    article.id = coerce_string(j, "id", "");
    article.publication = coerce_string(j, "publication", "");
    if (const auto* type = find_first(j, {"articleType", "article_type"})) {
        if (type->is_string()) article.article_type = type->get<std::string>();
    }

    if (j.contains("analyses") && j["analyses"].is_array()) {
        for (const auto& a : j["analyses"]) {
            auto rec = AnalysisRecord::from_json(a);
            if (rec) {
                article.analyses.push_back(std::move(*rec));
            }
        }
    }
    return article;
}

} // namespace cred
