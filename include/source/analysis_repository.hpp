#pragma once

#include "model/analysis_record.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cred {

/**
 * @brief Narrowing applied when fetching analysis history
 */
struct ArticleFilter {
    std::optional<TimePoint> since;           ///< Keep analyses created at or after
    std::optional<std::string> article_type;  ///< Keep articles of this type only
};

/**
 * @brief Read-only access to stored articles and their analyses
 *
 * The persistent store is owned by another layer; the statistics engine
 * only reads through this interface.
 */
class AnalysisRepository {
public:
    virtual ~AnalysisRepository() = default;

    /**
     * @brief Articles matching the filter
     *
     * Each article carries only its analyses inside the time window;
     * articles left with no analyses are omitted.
     */
    virtual std::vector<ArticleRecord> find_articles(const ArticleFilter& filter) = 0;

    /**
     * @brief All articles of a publication with their full history
     */
    virtual std::vector<ArticleRecord> find_articles_by_publication(const std::string& publication) = 0;

    /**
     * @brief Every truth score in the store
     */
    virtual std::vector<double> all_truth_scores() = 0;
};

/**
 * @brief In-memory repository, optionally loaded from a JSON export
 *
 * File format:
 * {
 *   "articles": [
 *     {"id": "...", "publication": "...", "articleType": "...",
 *      "analyses": [{"truthScore": 72, "createdAt": "2026-01-01T00:00:00Z", ...}]}
 *   ]
 * }
 */
class JsonAnalysisRepository : public AnalysisRepository {
public:
    JsonAnalysisRepository() = default;
    explicit JsonAnalysisRepository(std::vector<ArticleRecord> articles);

    std::vector<ArticleRecord> find_articles(const ArticleFilter& filter) override;
    std::vector<ArticleRecord> find_articles_by_publication(const std::string& publication) override;
    std::vector<double> all_truth_scores() override;

    void add_article(ArticleRecord article);
    size_t num_articles() const { return articles_.size(); }
    size_t num_analyses() const;

    nlohmann::json to_json() const;
    static JsonAnalysisRepository from_json(const nlohmann::json& j);

    void save_to_json(const std::string& path) const;

    /**
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static JsonAnalysisRepository load_from_json(const std::string& path);

private:
    std::vector<ArticleRecord> articles_;
};

} // namespace cred
