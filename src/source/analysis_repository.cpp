#include "source/analysis_repository.hpp"
#include <fstream>
#include <stdexcept>

namespace cred {

JsonAnalysisRepository::JsonAnalysisRepository(std::vector<ArticleRecord> articles)
    : articles_(std::move(articles)) {}

std::vector<ArticleRecord> JsonAnalysisRepository::find_articles(const ArticleFilter& filter) {
    std::vector<ArticleRecord> result;

    for (const auto& article : articles_) {
        if (filter.article_type && article.article_type != *filter.article_type) {
            continue;
        }

        ArticleRecord copy;
        copy.id = article.id;
        copy.publication = article.publication;
        copy.article_type = article.article_type;
        for (const auto& analysis : article.analyses) {
            if (filter.since && analysis.created_at < *filter.since) continue;
            copy.analyses.push_back(analysis);
        }

        if (!copy.analyses.empty()) {
            result.push_back(std::move(copy));
        }
    }

    return result;
}

std::vector<ArticleRecord> JsonAnalysisRepository::find_articles_by_publication(const std::string& publication) {
    std::vector<ArticleRecord> result;
    for (const auto& article : articles_) {
        if (article.publication == publication) {
            result.push_back(article);
        }
    }
    return result;
}

std::vector<double> JsonAnalysisRepository::all_truth_scores() {
    std::vector<double> scores;
    for (const auto& article : articles_) {
        for (const auto& analysis : article.analyses) {
            scores.push_back(analysis.truth_score);
        }
    }
    return scores;
}

void JsonAnalysisRepository::add_article(ArticleRecord article) {
    articles_.push_back(std::move(article));
}

size_t JsonAnalysisRepository::num_analyses() const {
    size_t total = 0;
    for (const auto& article : articles_) {
        total += article.analyses.size();
    }
    return total;
}

nlohmann::json JsonAnalysisRepository::to_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& article : articles_) {
        arr.push_back(article.to_json());
    }
    return {{"articles", arr}};
}

JsonAnalysisRepository JsonAnalysisRepository::from_json(const nlohmann::json& j) {
    JsonAnalysisRepository repo;

    const nlohmann::json* articles = nullptr;
    if (j.is_array()) {
        articles = &j;
    } else if (j.is_object() && j.contains("articles") && j["articles"].is_array()) {
        articles = &j["articles"];
    }

    if (articles) {
        for (const auto& article_json : *articles) {
            if (!article_json.is_object()) continue;
            repo.add_article(ArticleRecord::from_json(article_json));
        }
    }
    return repo;
}

void JsonAnalysisRepository::save_to_json(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write analyses file: " + path);
    }
    file << to_json().dump(2);
}

JsonAnalysisRepository JsonAnalysisRepository::load_from_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open analyses file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed analyses file " + path + ": " + e.what());
    }
    return from_json(j);
}

} // namespace cred
