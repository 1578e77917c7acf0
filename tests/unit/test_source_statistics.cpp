#include <gtest/gtest.h>
#include "source/source_statistics.hpp"
#include <cstdio>
#include <stdexcept>

using namespace cred;

namespace {

// Counts prior recomputations
class CountingRepository : public JsonAnalysisRepository {
public:
    using JsonAnalysisRepository::JsonAnalysisRepository;

    std::vector<double> all_truth_scores() override {
        ++truth_score_calls;
        return JsonAnalysisRepository::all_truth_scores();
    }

    int truth_score_calls = 0;
};

} // namespace

class SourceStatisticsTest : public ::testing::Test {
protected:
    TimePoint now = *parse_iso8601("2026-06-01T00:00:00Z");
    CountingRepository repo;

    ClockFn clock() {
        return [this]() { return now; };
    }

    AnalysisRecord analysis(int days_ago, double score) {
        AnalysisRecord rec;
        rec.truth_score = score;
        rec.created_at = now - std::chrono::hours(24 * days_ago);
        return rec;
    }

    ArticleRecord article(const std::string& id, const std::string& publication,
                          const std::string& type, std::vector<AnalysisRecord> analyses) {
        ArticleRecord a;
        a.id = id;
        a.publication = publication;
        a.article_type = type;
        a.analyses = std::move(analyses);
        return a;
    }

    void SetUp() override {
        repo.add_article(article("dp-1", "Daily Planet", "news",
                                 {analysis(100, 70), analysis(60, 72), analysis(10, 80)}));
        repo.add_article(article("dp-2", "Daily Planet", "news",
                                 {analysis(5, 78), analysis(2, 82)}));
        repo.add_article(article("dp-3", "Daily Planet", "opinion",
                                 {analysis(45, 65)}));
        repo.add_article(article("g-1", "Gazette", "news",
                                 {analysis(3, 90)}));
        repo.add_article(article("t-1", "Tribune", "news",
                                 {analysis(120, 40)}));
        repo.add_article(article("t-2", "Tribune", "opinion",
                                 {analysis(90, 45)}));
    }

    static std::vector<std::string> publications(const SourceStatsPage& page) {
        std::vector<std::string> names;
        for (const auto& s : page.sources) names.push_back(s.publication);
        return names;
    }
};

// ==========================================
// Listing Tests
// ==========================================

TEST_F(SourceStatisticsTest, DefaultQueryRanksByGrade) {
    SourceStatisticsService service(repo, {}, clock());
    auto page = service.get_source_stats();

    EXPECT_EQ(page.total, 3u);
    ASSERT_EQ(page.sources.size(), 3u);
    for (size_t i = 1; i < page.sources.size(); ++i) {
        EXPECT_GE(page.sources[i - 1].numeric_score, page.sources[i].numeric_score);
    }
}

TEST_F(SourceStatisticsTest, GlobalMeanComesFromAllScores) {
    SourceStatisticsService service(repo, {}, clock());
    auto page = service.get_source_stats();
    // (70 + 72 + 80 + 78 + 82 + 65 + 90 + 40 + 45) / 9
    EXPECT_NEAR(page.global_mean, 622.0 / 9.0, 1e-9);
}

TEST_F(SourceStatisticsTest, MinArticlesExcludesSmallSources) {
    SourceStatisticsService service(repo, {}, clock());
    SourceStatsQuery query;
    query.min_articles = 2;
    auto page = service.get_source_stats(query);

    EXPECT_EQ(page.total, 2u);
    for (const auto& s : page.sources) {
        EXPECT_NE(s.publication, "Gazette");
    }
}

TEST_F(SourceStatisticsTest, TimeRangeKeepsRecentAnalyses) {
    SourceStatisticsService service(repo, {}, clock());
    SourceStatsQuery query;
    query.time_range = TimeRange::DAYS_30;
    auto page = service.get_source_stats(query);

    EXPECT_EQ(page.total, 2u);
    for (const auto& s : page.sources) {
        EXPECT_NE(s.publication, "Tribune");
        if (s.publication == "Daily Planet") {
            EXPECT_EQ(s.bayesian_score.sample_size, 3u);
            EXPECT_EQ(s.article_count, 2u);
        }
    }
}

TEST_F(SourceStatisticsTest, ArticleTypeFilter) {
    SourceStatisticsService service(repo, {}, clock());
    SourceStatsQuery query;
    query.article_type = std::string("opinion");
    query.sort_by = SortBy::ARTICLES;
    auto page = service.get_source_stats(query);

    EXPECT_EQ(page.total, 2u);
    for (const auto& s : page.sources) {
        EXPECT_EQ(s.article_count, 1u);
        EXPECT_EQ(s.article_type_distribution.count("news"), 0u);
    }
}

TEST_F(SourceStatisticsTest, SortByArticlesAscending) {
    SourceStatisticsService service(repo, {}, clock());
    SourceStatsQuery query;
    query.sort_by = SortBy::ARTICLES;
    query.sort_order = SortOrder::ASC;
    auto page = service.get_source_stats(query);

    EXPECT_EQ(publications(page), (std::vector<std::string>{"Gazette", "Tribune", "Daily Planet"}));
}

TEST_F(SourceStatisticsTest, SortByRecent) {
    SourceStatisticsService service(repo, {}, clock());
    SourceStatsQuery query;
    query.sort_by = SortBy::RECENT;
    auto page = service.get_source_stats(query);

    EXPECT_EQ(publications(page), (std::vector<std::string>{"Daily Planet", "Gazette", "Tribune"}));
}

TEST_F(SourceStatisticsTest, Pagination) {
    SourceStatisticsService service(repo, {}, clock());
    SourceStatsQuery query;
    query.sort_by = SortBy::ARTICLES;
    query.sort_order = SortOrder::ASC;
    query.limit = 1;
    query.offset = 1;
    auto page = service.get_source_stats(query);

    EXPECT_EQ(page.total, 3u);
    EXPECT_EQ(publications(page), (std::vector<std::string>{"Tribune"}));

    query.offset = 10;
    auto past_end = service.get_source_stats(query);
    EXPECT_EQ(past_end.total, 3u);
    EXPECT_TRUE(past_end.sources.empty());
}

TEST_F(SourceStatisticsTest, EmptyRepository) {
    CountingRepository empty;
    SourceStatisticsService service(empty, {}, clock());
    auto page = service.get_source_stats();
    EXPECT_EQ(page.total, 0u);
    EXPECT_TRUE(page.sources.empty());
    EXPECT_DOUBLE_EQ(page.global_mean, GlobalPrior::kDefaultMean);
}

// ==========================================
// Single Source Tests
// ==========================================

TEST_F(SourceStatisticsTest, ByIdUnknownPublication) {
    SourceStatisticsService service(repo, {}, clock());
    EXPECT_FALSE(service.get_source_stats_by_id("Nobody").has_value());
}

TEST_F(SourceStatisticsTest, ByIdFullReport) {
    SourceStatisticsService service(repo, {}, clock());
    auto stats = service.get_source_stats_by_id("Daily Planet");
    ASSERT_TRUE(stats.has_value());

    EXPECT_EQ(stats->id, "daily-planet");
    EXPECT_EQ(stats->article_count, 3u);
    EXPECT_EQ(stats->bayesian_score.sample_size, 6u);
    EXPECT_EQ(stats->credibility_distribution.at("UNKNOWN"), 6);
    EXPECT_EQ(stats->article_type_distribution.at("news"), 2);
    EXPECT_EQ(stats->article_type_distribution.at("opinion"), 1);
    EXPECT_EQ(stats->first_analysis, now - std::chrono::hours(24 * 100));
    EXPECT_EQ(stats->last_analysis, now - std::chrono::hours(24 * 2));
    EXPECT_EQ(stats->time_span_days, 98);

    EXPECT_DOUBLE_EQ(stats->penalty, 7.0);
    ASSERT_TRUE(stats->penalty_reason.has_value());
    EXPECT_EQ(*stats->penalty_reason, "Low sample size (6 articles)");

    EXPECT_EQ(stats->trend.sparkline.size(), 6u);
    EXPECT_FALSE(stats->grade.empty());
}

TEST_F(SourceStatisticsTest, ComponentsStayInRange) {
    SourceStatisticsService service(repo, {}, clock());
    for (const auto& s : service.get_source_stats().sources) {
        for (double c : {s.components.logical_structure, s.components.methodology_rigor,
                         s.components.factual_reliability, s.components.manipulation_absence,
                         s.components.consistency}) {
            EXPECT_GE(c, 0.0);
            EXPECT_LE(c, 100.0);
        }
        EXPECT_GE(s.numeric_score, 0.0);
        EXPECT_LE(s.numeric_score, 100.0);
    }
}

TEST_F(SourceStatisticsTest, MethodologyDefaultsWithoutSignals) {
    SourceStatisticsService service(repo, {}, clock());
    auto stats = service.get_source_stats_by_id("Gazette");
    ASSERT_TRUE(stats.has_value());
    // Midpoint breakdown, default source and claim rates
    EXPECT_DOUBLE_EQ(stats->components.methodology_rigor, 50.0);
    EXPECT_DOUBLE_EQ(stats->components.logical_structure, 100.0);
    EXPECT_DOUBLE_EQ(stats->components.manipulation_absence, 100.0);
    EXPECT_EQ(stats->grade_display, "N/R");
}

TEST_F(SourceStatisticsTest, PatternsAndFactChecks) {
    AnalysisRecord rec = analysis(1, 60);
    for (const char* type : {"a", "b", "a", "c", "b", "a", "d", "e", "f"}) {
        rec.deceptions.push_back({type, "framing"});
    }
    rec.deceptions.push_back({"g", "omission"});
    rec.fallacies.push_back({"strawman", FallacySeverity::HIGH});
    rec.fact_checks = {
        {Verification::SUPPORTED}, {Verification::SUPPORTED},
        {Verification::PARTIALLY_SUPPORTED}, {Verification::REFUTED}
    };

    JsonAnalysisRepository single({article("x-1", "Observer", "news", {rec, analysis(40, 70)})});
    SourceStatisticsService service(single, {}, clock());
    auto stats = service.get_source_stats_by_id("Observer");
    ASSERT_TRUE(stats.has_value());

    ASSERT_EQ(stats->top_deception_types.size(), 5u);
    EXPECT_EQ(stats->top_deception_types[0].type, "a");
    EXPECT_EQ(stats->top_deception_types[0].count, 3);
    EXPECT_EQ(stats->top_deception_types[1].type, "b");
    EXPECT_EQ(stats->top_deception_types[1].count, 2);
    EXPECT_EQ(stats->top_deception_types[2].type, "c");
    EXPECT_EQ(stats->top_deception_types[4].type, "e");

    EXPECT_EQ(stats->manipulation_breakdown.at("framing"), 9);
    EXPECT_EQ(stats->manipulation_breakdown.at("omission"), 1);

    ASSERT_EQ(stats->top_fallacies.size(), 1u);
    EXPECT_EQ(stats->top_fallacies[0].type, "strawman");

    EXPECT_EQ(stats->fact_check_performance.supported, 2);
    EXPECT_EQ(stats->fact_check_performance.partially_supported, 1);
    EXPECT_EQ(stats->fact_check_performance.refuted, 1);
    EXPECT_DOUBLE_EQ(stats->fact_check_performance.success_rate, 75.0);

    // 10 deceptions over 2 analyses
    EXPECT_DOUBLE_EQ(stats->components.manipulation_absence, 0.0);
    // One high fallacy in one article
    EXPECT_DOUBLE_EQ(stats->components.logical_structure, 40.0);
}

TEST_F(SourceStatisticsTest, ToJsonShape) {
    SourceStatisticsService service(repo, {}, clock());
    auto j = service.get_source_stats().to_json();
    ASSERT_TRUE(j["sources"].is_array());
    EXPECT_EQ(j["total"], 3);

    const auto& first = j["sources"][0];
    EXPECT_TRUE(first.contains("bayesianScore"));
    EXPECT_TRUE(first.contains("gradeDisplay"));
    EXPECT_TRUE(first["trend"].contains("sparklineData"));
    EXPECT_TRUE(first["components"].contains("factualReliability"));
}

// ==========================================
// Prior Cache Tests
// ==========================================

TEST_F(SourceStatisticsTest, PriorIsCachedWithinTtl) {
    SourceStatisticsService service(repo, {}, clock());
    service.get_source_stats();
    service.get_source_stats();
    service.get_source_stats_by_id("Gazette");
    EXPECT_EQ(repo.truth_score_calls, 1);

    now += std::chrono::seconds(3600);
    service.get_source_stats();
    EXPECT_EQ(repo.truth_score_calls, 2);

    service.invalidate_prior();
    service.global_prior();
    EXPECT_EQ(repo.truth_score_calls, 3);

    // Refilled after invalidation
    service.get_source_stats();
    EXPECT_EQ(repo.truth_score_calls, 3);
}

TEST_F(SourceStatisticsTest, PriorDefaultsFromConfig) {
    CountingRepository empty;
    SourceStatisticsConfig config;
    config.default_prior_mean = 60.0;
    config.default_prior_variance = 100.0;
    SourceStatisticsService service(empty, config, clock());

    GlobalPrior prior = service.global_prior();
    EXPECT_DOUBLE_EQ(prior.mean, 60.0);
    EXPECT_DOUBLE_EQ(prior.variance, 100.0);
}

// ==========================================
// Configuration Tests
// ==========================================

TEST_F(SourceStatisticsTest, ConfigValidation) {
    SourceStatisticsConfig config;
    std::string error;
    EXPECT_TRUE(config.validate(error));

    config.prior_ttl_seconds = -1;
    EXPECT_FALSE(config.validate(error));
    EXPECT_FALSE(error.empty());

    config = SourceStatisticsConfig{};
    config.default_prior_variance = 0.0;
    EXPECT_FALSE(config.validate(error));

    config = SourceStatisticsConfig{};
    config.default_verified_claim_rate = 1.5;
    EXPECT_FALSE(config.validate(error));
}

TEST_F(SourceStatisticsTest, InvalidConfigThrows) {
    SourceStatisticsConfig config;
    config.default_primary_source_rate = -0.5;
    EXPECT_THROW({
        SourceStatisticsService service(repo, config, clock());
    }, std::invalid_argument);
}

TEST_F(SourceStatisticsTest, ConfigFileRoundTrip) {
    SourceStatisticsConfig config;
    config.prior_ttl_seconds = 120;
    config.default_prior_mean = 55.0;
    config.data_path = "/data/analyses.json";
    config.verbose = true;

    std::string path = ::testing::TempDir() + "credgrade_config_test.json";
    config.to_json_file(path);
    auto loaded = SourceStatisticsConfig::from_json_file(path);
    std::remove(path.c_str());

    EXPECT_EQ(loaded.prior_ttl_seconds, 120);
    EXPECT_DOUBLE_EQ(loaded.default_prior_mean, 55.0);
    EXPECT_EQ(loaded.data_path, "/data/analyses.json");
    EXPECT_TRUE(loaded.verbose);
}

TEST_F(SourceStatisticsTest, MissingConfigFileThrows) {
    EXPECT_THROW(SourceStatisticsConfig::from_json_file("/nonexistent/credgrade.json"), std::runtime_error);
}

TEST_F(SourceStatisticsTest, UnwritableConfigPathThrows) {
    SourceStatisticsConfig config;
    EXPECT_THROW(config.to_json_file("/nonexistent/dir/credgrade.json"), std::runtime_error);
}

// ==========================================
// Query Parsing Tests
// ==========================================

TEST_F(SourceStatisticsTest, QueryParsing) {
    EXPECT_EQ(parse_time_range("30d"), TimeRange::DAYS_30);
    EXPECT_EQ(parse_time_range("1y"), TimeRange::YEAR_1);
    EXPECT_EQ(parse_sort_by("recent"), SortBy::RECENT);
    EXPECT_EQ(parse_sort_order("asc"), SortOrder::ASC);
    EXPECT_EQ(time_range_to_string(TimeRange::DAYS_90), "90d");
    EXPECT_FALSE(time_range_days(TimeRange::ALL).has_value());
    EXPECT_EQ(*time_range_days(TimeRange::YEAR_1), 365);

    EXPECT_THROW(parse_time_range("week"), std::invalid_argument);
    EXPECT_THROW(parse_sort_by("name"), std::invalid_argument);
    EXPECT_THROW(parse_sort_order("up"), std::invalid_argument);
}

TEST_F(SourceStatisticsTest, Slugify) {
    EXPECT_EQ(slugify("The New York Times"), "the-new-york-times");
    EXPECT_EQ(slugify("BBC.co.uk"), "bbc-co-uk");
}
