#include "source/source_statistics.hpp"
#include <cmath>
#include <iostream>
#include <iomanip>

using namespace cred;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

// Build an analysis `days_ago` days before `now`
AnalysisRecord make_analysis(TimePoint now, int days_ago, double truth_score,
                             const std::string& credibility) {
    AnalysisRecord rec;
    rec.id = "an-" + std::to_string(days_ago) + "-" + std::to_string(static_cast<int>(truth_score));
    rec.truth_score = truth_score;
    rec.credibility = credibility;
    rec.created_at = now - std::chrono::hours(24 * days_ago);
    return rec;
}

ArticleRecord make_article(const std::string& id, const std::string& publication,
                           const std::string& type, std::vector<AnalysisRecord> analyses) {
    ArticleRecord article;
    article.id = id;
    article.publication = publication;
    article.article_type = type;
    article.analyses = std::move(analyses);
    return article;
}

int main(int argc, char* argv[]) {
    print_separator("Source Credibility Report");

    TimePoint now = Clock::now();

    // =========================================================================
    // Sample history
    // =========================================================================

    JsonAnalysisRepository repo;

    AnalysisRecord flagged = make_analysis(now, 12, 58, "MEDIUM");
    flagged.deceptions.push_back({"cherry_picking", "framing"});
    flagged.fallacies.push_back({"strawman", FallacySeverity::MEDIUM});
    flagged.fact_checks.push_back({Verification::PARTIALLY_SUPPORTED});

    AnalysisRecord checked = make_analysis(now, 3, 84, "HIGH");
    checked.score_breakdown = ScoreBreakdown{};
    checked.score_breakdown->evidence_quality = 34;
    checked.score_breakdown->methodology_rigor = 21;
    checked.fact_checks.push_back({Verification::SUPPORTED});
    checked.fact_checks.push_back({Verification::SUPPORTED});

    repo.add_article(make_article("a1", "Morning Ledger", "news", {
        make_analysis(now, 200, 71, "HIGH"),
        make_analysis(now, 140, 74, "HIGH"),
        make_analysis(now, 95, 69, "MEDIUM")
    }));
    repo.add_article(make_article("a2", "Morning Ledger", "news", {
        make_analysis(now, 40, 77, "HIGH"),
        checked
    }));
    repo.add_article(make_article("a3", "Morning Ledger", "opinion", {
        flagged
    }));
    repo.add_article(make_article("b1", "Evening Wire", "news", {
        make_analysis(now, 20, 45, "LOW"),
        make_analysis(now, 20, 47, "LOW"),
        make_analysis(now, 19, 44, "LOW")
    }));
    repo.add_article(make_article("c1", "Weekly Digest", "analysis", {
        make_analysis(now, 8, 88, "HIGH")
    }));

    std::cout << "Articles: " << repo.num_articles() << "\n";
    std::cout << "Analyses: " << repo.num_analyses() << "\n";

    // =========================================================================
    // Ranking
    // =========================================================================

    print_separator("Ranked Sources");

    SourceStatisticsConfig config;
    config.verbose = argc > 1 && std::string(argv[1]) == "--verbose";
    SourceStatisticsService service(repo, config);

    GlobalPrior prior = service.global_prior();
    std::cout << "Global prior: mean=" << std::fixed << std::setprecision(1) << prior.mean
              << " sd=" << std::sqrt(prior.variance) << "\n\n";

    SourceStatsPage page = service.get_source_stats();
    for (const auto& s : page.sources) {
        std::cout << std::left << std::setw(18) << s.publication
                  << std::setw(8) << s.grade_display
                  << std::right << std::setw(6) << s.numeric_score
                  << "  shrunk " << s.bayesian_score.shrunk_score
                  << " [" << s.bayesian_score.credible_interval.lower
                  << ", " << s.bayesian_score.credible_interval.upper << "]"
                  << "  ess " << s.bayesian_score.effective_sample_size
                  << "  " << trend_direction_to_string(s.trend.direction) << "\n";
    }

    // =========================================================================
    // Single source
    // =========================================================================

    print_separator("Morning Ledger (full report)");

    auto ledger = service.get_source_stats_by_id("Morning Ledger");
    if (!ledger) {
        std::cerr << "No analyses for Morning Ledger\n";
        return 1;
    }
    std::cout << ledger->to_json().dump(2) << "\n";

    return 0;
}
