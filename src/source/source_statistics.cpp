#include "source/source_statistics.hpp"
#include "scoring/component_scores.hpp"
#include "scoring/grader.hpp"
#include "scoring/trend.hpp"
#include "stats/statistics.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <stdexcept>

using json = nlohmann::json;

namespace cred {

namespace {

constexpr size_t kTopPatternCount = 5;

// Count occurrences, most frequent first; ties keep first-seen order
std::vector<TypeCount> top_counts(const std::vector<std::string>& labels, size_t max_items) {
    std::vector<TypeCount> counts;
    std::map<std::string, size_t> position;
    for (const auto& label : labels) {
        auto it = position.find(label);
        if (it == position.end()) {
            position[label] = counts.size();
            counts.push_back({label, 1});
        } else {
            counts[it->second].count++;
        }
    }

    std::stable_sort(counts.begin(), counts.end(),
                     [](const TypeCount& a, const TypeCount& b) { return a.count > b.count; });
    if (counts.size() > max_items) {
        counts.resize(max_items);
    }
    return counts;
}

FactCheckPerformance summarize_fact_checks(const std::vector<FactCheckResult>& checks) {
    FactCheckPerformance perf;
    for (const auto& fc : checks) {
        switch (fc.verification) {
            case Verification::SUPPORTED: perf.supported++; break;
            case Verification::PARTIALLY_SUPPORTED: perf.partially_supported++; break;
            case Verification::REFUTED: perf.refuted++; break;
            default: break;
        }
    }
    if (!checks.empty()) {
        perf.success_rate = static_cast<double>(perf.supported + perf.partially_supported) /
                            static_cast<double>(checks.size()) * 100.0;
    }
    return perf;
}

bool env_flag(const char* value) {
    std::string s(value);
    return s == "1" || s == "true" || s == "TRUE" || s == "yes";
}

} // anonymous namespace

// ============================================================================
// SourceStatisticsConfig
// ============================================================================

SourceStatisticsConfig SourceStatisticsConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    file >> j;

    SourceStatisticsConfig config;

    if (j.contains("prior_ttl_seconds")) config.prior_ttl_seconds = j["prior_ttl_seconds"];
    if (j.contains("default_prior_mean")) config.default_prior_mean = j["default_prior_mean"];
    if (j.contains("default_prior_variance")) config.default_prior_variance = j["default_prior_variance"];
    if (j.contains("default_primary_source_rate")) config.default_primary_source_rate = j["default_primary_source_rate"];
    if (j.contains("default_verified_claim_rate")) config.default_verified_claim_rate = j["default_verified_claim_rate"];
    if (j.contains("data_path")) config.data_path = j["data_path"].get<std::string>();
    if (j.contains("verbose")) config.verbose = j["verbose"];

    return config;
}

void SourceStatisticsConfig::to_json_file(const std::string& path) const {
    json j;
    j["prior_ttl_seconds"] = prior_ttl_seconds;
    j["default_prior_mean"] = default_prior_mean;
    j["default_prior_variance"] = default_prior_variance;
    j["default_primary_source_rate"] = default_primary_source_rate;
    j["default_verified_claim_rate"] = default_verified_claim_rate;
    j["data_path"] = data_path;
    j["verbose"] = verbose;

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write config file: " + path);
    }
    file << j.dump(2);
}

SourceStatisticsConfig SourceStatisticsConfig::from_environment() {
    SourceStatisticsConfig config;

    const char* data_path = std::getenv("CRED_DATA_PATH");
    if (data_path) config.data_path = data_path;

    const char* ttl = std::getenv("CRED_PRIOR_TTL_SECONDS");
    if (ttl) {
        try {
            config.prior_ttl_seconds = std::stoi(ttl);
        } catch (const std::exception&) {
            std::cerr << "Ignoring invalid CRED_PRIOR_TTL_SECONDS: " << ttl << "\n";
        }
    }

    const char* verbose = std::getenv("CRED_VERBOSE");
    if (verbose) config.verbose = env_flag(verbose);

    return config;
}

bool SourceStatisticsConfig::validate(std::string& error_message) const {
    if (prior_ttl_seconds < 0) {
        error_message = "Prior TTL must not be negative";
        return false;
    }

    if (default_prior_mean < 0.0 || default_prior_mean > 100.0) {
        error_message = "Default prior mean must be between 0 and 100";
        return false;
    }

    if (!(default_prior_variance > 0.0)) {
        error_message = "Default prior variance must be positive";
        return false;
    }

    if (default_primary_source_rate < 0.0 || default_primary_source_rate > 1.0) {
        error_message = "Default primary source rate must be between 0.0 and 1.0";
        return false;
    }

    if (default_verified_claim_rate < 0.0 || default_verified_claim_rate > 1.0) {
        error_message = "Default verified claim rate must be between 0.0 and 1.0";
        return false;
    }

    return true;
}

// ============================================================================
// Query parsing
// ============================================================================

TimeRange parse_time_range(const std::string& s) {
    if (s == "all") return TimeRange::ALL;
    if (s == "30d") return TimeRange::DAYS_30;
    if (s == "90d") return TimeRange::DAYS_90;
    if (s == "1y") return TimeRange::YEAR_1;
    throw std::invalid_argument("Unknown time range: " + s + " (expected all, 30d, 90d or 1y)");
}

SortBy parse_sort_by(const std::string& s) {
    if (s == "grade") return SortBy::GRADE;
    if (s == "articles") return SortBy::ARTICLES;
    if (s == "recent") return SortBy::RECENT;
    throw std::invalid_argument("Unknown sort key: " + s + " (expected grade, articles or recent)");
}

SortOrder parse_sort_order(const std::string& s) {
    if (s == "asc") return SortOrder::ASC;
    if (s == "desc") return SortOrder::DESC;
    throw std::invalid_argument("Unknown sort order: " + s + " (expected asc or desc)");
}

std::string time_range_to_string(TimeRange range) {
    switch (range) {
        case TimeRange::ALL: return "all";
        case TimeRange::DAYS_30: return "30d";
        case TimeRange::DAYS_90: return "90d";
        case TimeRange::YEAR_1: return "1y";
        default: return "all";
    }
}

std::optional<int> time_range_days(TimeRange range) {
    switch (range) {
        case TimeRange::DAYS_30: return 30;
        case TimeRange::DAYS_90: return 90;
        case TimeRange::YEAR_1: return 365;
        default: return std::nullopt;
    }
}

// ============================================================================
// Per-source computation
// ============================================================================

SourceStats calculate_source_statistics(const std::string& publication,
                                        const std::vector<ArticleRecord>& articles,
                                        const GlobalPrior& prior,
                                        const SourceStatisticsConfig& config,
                                        TimePoint now) {
    std::vector<const AnalysisRecord*> analyses;
    for (const auto& article : articles) {
        for (const auto& analysis : article.analyses) {
            analyses.push_back(&analysis);
        }
    }
    const size_t n = analyses.size();

    std::vector<TimedObservation> observations;
    observations.reserve(n);
    std::vector<FallacySeverity> severities;
    std::vector<std::string> fallacy_types;
    std::vector<std::string> deception_types;
    std::vector<FactCheckResult> fact_checks;
    std::vector<double> evidence_quality;
    std::vector<double> methodology_rigor;

    SourceStats stats;
    stats.id = slugify(publication);
    stats.publication = publication;
    stats.article_count = articles.size();

    for (const auto* a : analyses) {
        observations.emplace_back(a->created_at, a->truth_score);
        stats.credibility_distribution[a->credibility]++;

        for (const auto& f : a->fallacies) {
            severities.push_back(f.severity);
            fallacy_types.push_back(f.type);
        }
        for (const auto& d : a->deceptions) {
            deception_types.push_back(d.type);
            stats.manipulation_breakdown[d.category]++;
        }
        fact_checks.insert(fact_checks.end(), a->fact_checks.begin(), a->fact_checks.end());

        if (a->score_breakdown) {
            evidence_quality.push_back(a->score_breakdown->evidence_quality);
            methodology_rigor.push_back(a->score_breakdown->methodology_rigor);
        }
    }

    for (const auto& article : articles) {
        stats.article_type_distribution[article.article_type]++;
    }

    // Factual reliability: shrinkage weighted by temporal effective sample size
    stats.bayesian_score = calculate_bayesian_score(observations, prior);

    stats.fact_check_performance = summarize_fact_checks(fact_checks);
    double verified_rate = fact_checks.empty()
        ? config.default_verified_claim_rate
        : stats.fact_check_performance.success_rate / 100.0;

    ScoreBreakdown midpoints;
    MethodologyInputs inputs(
        evidence_quality.empty() ? midpoints.evidence_quality : mean(evidence_quality),
        methodology_rigor.empty() ? midpoints.methodology_rigor : mean(methodology_rigor),
        config.default_primary_source_rate,
        verified_rate);

    stats.components.logical_structure = logic_score(severities, articles.size());
    stats.components.methodology_rigor = methodology_score(inputs);
    stats.components.factual_reliability = stats.bayesian_score.shrunk_score;
    stats.components.manipulation_absence = manipulation_absence_score(deception_types.size(), n);
    stats.components.consistency = consistency_score(stats.bayesian_score.raw_variance);

    CompositeGrade composite = grade_source(stats.components, n, stats.bayesian_score.grade_confidence);
    stats.grade = composite.grade;
    stats.grade_display = composite.grade_display;
    stats.numeric_score = round_to(composite.final_score, 1);
    stats.penalty = round_to(composite.penalty, 1);
    stats.penalty_reason = composite.penalty_reason;

    stats.top_deception_types = top_counts(deception_types, kTopPatternCount);
    stats.top_fallacies = top_counts(fallacy_types, kTopPatternCount);

    stats.trend = analyze_trend(observations, now);

    if (observations.empty()) {
        stats.first_analysis = now;
        stats.last_analysis = now;
    } else {
        auto [min_it, max_it] = std::minmax_element(
            observations.begin(), observations.end(),
            [](const TimedObservation& a, const TimedObservation& b) { return a.timestamp < b.timestamp; });
        stats.first_analysis = min_it->timestamp;
        stats.last_analysis = max_it->timestamp;
    }
    stats.time_span_days = static_cast<int>(std::ceil(days_between(stats.first_analysis, stats.last_analysis)));

    return stats;
}

// ============================================================================
// SourceStatisticsService
// ============================================================================

SourceStatisticsService::SourceStatisticsService(AnalysisRepository& repository,
                                                 SourceStatisticsConfig config,
                                                 ClockFn clock)
    : repository_(repository),
      config_(std::move(config)),
      clock_(std::move(clock)),
      prior_cache_(std::chrono::seconds(config_.prior_ttl_seconds), clock_) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }
}

GlobalPrior SourceStatisticsService::global_prior() {
    return prior_cache_.get_or_compute([this]() {
        auto scores = repository_.all_truth_scores();
        GlobalPrior prior = compute_global_prior(
            scores, config_.default_prior_mean, config_.default_prior_variance);
        if (config_.verbose) {
            std::cerr << "Recomputed global prior from " << scores.size()
                      << " analyses: mean=" << prior.mean
                      << " variance=" << prior.variance << "\n";
        }
        return prior;
    });
}

SourceStatsPage SourceStatisticsService::get_source_stats(const SourceStatsQuery& query) {
    const TimePoint now = clock_();

    ArticleFilter filter;
    filter.article_type = query.article_type;
    if (auto days = time_range_days(query.time_range)) {
        filter.since = now - std::chrono::hours(24 * *days);
    }

    GlobalPrior prior = global_prior();

    auto articles = repository_.find_articles(filter);

    // Group by publication, keeping first-seen order
    std::vector<std::string> order;
    std::map<std::string, std::vector<ArticleRecord>> by_publication;
    for (auto& article : articles) {
        auto it = by_publication.find(article.publication);
        if (it == by_publication.end()) {
            order.push_back(article.publication);
            it = by_publication.emplace(article.publication, std::vector<ArticleRecord>{}).first;
        }
        it->second.push_back(std::move(article));
    }

    std::vector<SourceStats> sources;
    for (const auto& publication : order) {
        const auto& pub_articles = by_publication[publication];
        size_t analysis_count = 0;
        for (const auto& a : pub_articles) {
            analysis_count += a.analyses.size();
        }

        if (analysis_count == 0 || analysis_count < query.min_articles) {
            if (config_.verbose) {
                std::cerr << "Skipping " << publication << ": " << analysis_count
                          << " analyses (minimum " << query.min_articles << ")\n";
            }
            continue;
        }

        sources.push_back(calculate_source_statistics(publication, pub_articles, prior, config_, now));
    }

    auto key_less = [&query](const SourceStats& a, const SourceStats& b) {
        switch (query.sort_by) {
            case SortBy::ARTICLES: return a.article_count < b.article_count;
            case SortBy::RECENT: return a.last_analysis < b.last_analysis;
            case SortBy::GRADE:
            default: return a.numeric_score < b.numeric_score;
        }
    };

    if (query.sort_order == SortOrder::DESC) {
        std::stable_sort(sources.begin(), sources.end(),
                         [&key_less](const SourceStats& a, const SourceStats& b) { return key_less(b, a); });
    } else {
        std::stable_sort(sources.begin(), sources.end(), key_less);
    }

    SourceStatsPage page;
    page.total = sources.size();
    page.global_mean = prior.mean;

    size_t begin = std::min(query.offset, sources.size());
    size_t end = begin + std::min(query.limit, sources.size() - begin);
    for (size_t i = begin; i < end; ++i) {
        page.sources.push_back(std::move(sources[i]));
    }

    if (config_.verbose) {
        std::cerr << "Graded " << page.total << " sources, returning "
                  << page.sources.size() << " (offset " << query.offset << ")\n";
    }

    return page;
}

std::optional<SourceStats> SourceStatisticsService::get_source_stats_by_id(const std::string& publication) {
    GlobalPrior prior = global_prior();

    auto articles = repository_.find_articles_by_publication(publication);
    if (articles.empty()) {
        return std::nullopt;
    }

    size_t analysis_count = 0;
    for (const auto& a : articles) {
        analysis_count += a.analyses.size();
    }
    if (analysis_count == 0) {
        return std::nullopt;
    }

    return calculate_source_statistics(publication, articles, prior, config_, clock_());
}

} // namespace cred
