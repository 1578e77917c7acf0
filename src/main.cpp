#include "cli/cli.hpp"
#include "source/analysis_repository.hpp"
#include "source/source_statistics.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

using namespace cred;

// ============== Helper Functions ==============

// Config file if given, environment otherwise; --verbose always wins
SourceStatisticsConfig load_config(const OptionValues& options) {
    auto config_path = options.find("config");
    SourceStatisticsConfig config = config_path
        ? SourceStatisticsConfig::from_json_file(*config_path)
        : SourceStatisticsConfig::from_environment();
    if (options.has("verbose")) {
        config.verbose = true;
    }
    return config;
}

JsonAnalysisRepository load_repository(const OptionValues& options, const SourceStatisticsConfig& config) {
    std::string path = options.find("input").value_or(config.data_path);
    if (path.empty()) {
        throw std::runtime_error("Missing required option: --input (or set CRED_DATA_PATH)");
    }

    if (config.verbose) {
        std::cerr << "Loading analyses from: " << path << "\n";
    }
    JsonAnalysisRepository repo = JsonAnalysisRepository::load_from_json(path);
    if (config.verbose) {
        std::cerr << "Loaded " << repo.num_articles() << " articles and "
                  << repo.num_analyses() << " analyses\n";
    }
    return repo;
}

void write_output(const nlohmann::json& j, const OptionValues& options) {
    auto output_path = options.find("output");
    if (!output_path) {
        std::cout << j.dump(2) << "\n";
        return;
    }

    fs::path out_path(*output_path);
    if (out_path.has_parent_path()) {
        fs::create_directories(out_path.parent_path());
    }
    std::ofstream file(*output_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write output file: " + *output_path);
    }
    file << j.dump(2);
    std::cerr << "Saved: " << *output_path << "\n";
}

// Options every subcommand shares
std::vector<OptionSpec> common_options() {
    return {
        {"input", 'i', "Analyses JSON export (defaults to CRED_DATA_PATH)"},
        {"output", 'o', "Write JSON here instead of stdout"},
        {"config", 'c', "Path to JSON config file"},
        {"verbose", 'V', "Print progress to stderr", "", false}
    };
}

// ============== credgrade stats ==============
int cmd_stats(const OptionValues& options) {
    SourceStatsQuery query = query_from_options(options);
    SourceStatisticsConfig config = load_config(options);
    JsonAnalysisRepository repo = load_repository(options, config);

    SourceStatisticsService service(repo, config);
    write_output(service.get_source_stats(query).to_json(), options);
    return 0;
}

// ============== credgrade source ==============
int cmd_source(const OptionValues& options) {
    const std::string& publication = options.text("publication");
    SourceStatisticsConfig config = load_config(options);
    JsonAnalysisRepository repo = load_repository(options, config);

    SourceStatisticsService service(repo, config);
    auto stats = service.get_source_stats_by_id(publication);
    if (!stats) {
        std::cerr << "No analyses found for publication: " << publication << "\n";
        return 1;
    }

    write_output(stats->to_json(), options);
    return 0;
}

// ============== credgrade prior ==============
int cmd_prior(const OptionValues& options) {
    SourceStatisticsConfig config = load_config(options);
    JsonAnalysisRepository repo = load_repository(options, config);

    SourceStatisticsService service(repo, config);
    nlohmann::json j = service.global_prior().to_json();
    j["analyses"] = repo.num_analyses();
    write_output(j, options);
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CommandDispatcher dispatcher("credgrade", "Source credibility statistics", "1.0.0");

    std::vector<OptionSpec> stats_options = {
        {"min-articles", 'm', "Minimum analyses per publication", "1"},
        {"time-range", 't', "Time window: all, 30d, 90d, 1y", "all"},
        {"article-type", 'a', "Only articles of this type"},
        {"sort-by", 's', "Sort key: grade, articles, recent", "grade"},
        {"sort-order", 'r', "Sort order: asc, desc", "desc"},
        {"limit", 'l', "Page size", "50"},
        {"offset", 'f', "Page offset", "0"}
    };
    for (auto& opt : common_options()) stats_options.push_back(opt);
    dispatcher.add({"stats", "Grade and rank every publication", stats_options, cmd_stats});

    std::vector<OptionSpec> source_options = {
        {"publication", 'p', "Publication name", "", true, true}
    };
    for (auto& opt : common_options()) source_options.push_back(opt);
    dispatcher.add({"source", "Full report for a single publication", source_options, cmd_source});

    dispatcher.add({"prior", "Print the global prior used for shrinkage", common_options(), cmd_prior});

    return dispatcher.run(argc, argv);
}
