#pragma once

#include "model/source_stats.hpp"
#include "source/analysis_repository.hpp"
#include "source/ttl_cache.hpp"
#include "stats/bayesian.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cred {

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Configuration for the source statistics service
 */
struct SourceStatisticsConfig {
    int prior_ttl_seconds = 3600;                  ///< Global prior lifetime
    double default_prior_mean = GlobalPrior::kDefaultMean;
    double default_prior_variance = GlobalPrior::kDefaultVariance;
    double default_primary_source_rate = 0.5;      ///< No upstream signal exists yet
    double default_verified_claim_rate = 0.5;      ///< Used when a source has no fact checks
    std::string data_path;                         ///< Analyses export for the CLI
    bool verbose = false;

    /**
     * @brief Load configuration from JSON file
     */
    static SourceStatisticsConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Load from environment variables
     *
     * CRED_DATA_PATH, CRED_PRIOR_TTL_SECONDS, CRED_VERBOSE
     */
    static SourceStatisticsConfig from_environment();

    bool validate(std::string& error_message) const;
};

// ============================================================================
// Query
// ============================================================================

enum class TimeRange { ALL, DAYS_30, DAYS_90, YEAR_1 };
enum class SortBy { GRADE, ARTICLES, RECENT };
enum class SortOrder { ASC, DESC };

// Parsers throw std::invalid_argument on unknown names
TimeRange parse_time_range(const std::string& s);
SortBy parse_sort_by(const std::string& s);
SortOrder parse_sort_order(const std::string& s);

std::string time_range_to_string(TimeRange range);

// Window length in days; nullopt for ALL
std::optional<int> time_range_days(TimeRange range);

struct SourceStatsQuery {
    size_t min_articles = 1;                  ///< Minimum analyses per source
    TimeRange time_range = TimeRange::ALL;
    std::optional<std::string> article_type;
    SortBy sort_by = SortBy::GRADE;
    SortOrder sort_order = SortOrder::DESC;
    size_t limit = 50;
    size_t offset = 0;
};

// ============================================================================
// Per-source computation
// ============================================================================

/**
 * @brief Assemble the full report for one publication
 *
 * Runs the Bayesian estimator over the timestamped analyses, the component
 * scorers, the grader and the trend analyzer. Pure given its inputs.
 * `articles` must contain at least one analysis in total.
 */
SourceStats calculate_source_statistics(const std::string& publication,
                                        const std::vector<ArticleRecord>& articles,
                                        const GlobalPrior& prior,
                                        const SourceStatisticsConfig& config,
                                        TimePoint now);

// ============================================================================
// Service
// ============================================================================

/**
 * @brief Ranked, filtered credibility reports over a repository
 *
 * Owns the global prior cache. The prior is recomputed from all truth
 * scores at most once per TTL window and handed to the estimator as a
 * plain value.
 */
class SourceStatisticsService {
public:
    /**
     * @throws std::invalid_argument if the configuration does not validate
     */
    SourceStatisticsService(AnalysisRepository& repository,
                            SourceStatisticsConfig config = {},
                            ClockFn clock = system_now);

    /**
     * @brief Filter, grade, sort and paginate all sources
     */
    SourceStatsPage get_source_stats(const SourceStatsQuery& query = {});

    /**
     * @brief Full-history report for one publication
     * @return nullopt when the publication has no analyses
     */
    std::optional<SourceStats> get_source_stats_by_id(const std::string& publication);

    // Cached global prior
    GlobalPrior global_prior();

    void invalidate_prior() { prior_cache_.invalidate(); }

    const SourceStatisticsConfig& config() const { return config_; }

private:
    AnalysisRepository& repository_;
    SourceStatisticsConfig config_;
    ClockFn clock_;
    TtlCache<GlobalPrior> prior_cache_;
};

} // namespace cred
