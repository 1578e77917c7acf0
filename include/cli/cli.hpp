#pragma once

#include "source/source_statistics.hpp"
#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace cred {

// ============================================================================
// Options
// ============================================================================

/**
 * @brief One "--name" option accepted by a subcommand
 *
 * Options that take no value are flags; their presence stores "true".
 */
struct OptionSpec {
    std::string name;
    char short_name = '\0';
    std::string help;
    std::string default_value;
    bool takes_value = true;
    bool required = false;
};

/**
 * @brief Option values after parsing, with defaults filled in
 */
class OptionValues {
public:
    void set(const std::string& name, std::string value);

    bool has(const std::string& name) const;

    // Throws std::invalid_argument naming the option when it is absent
    const std::string& text(const std::string& name) const;

    std::optional<std::string> find(const std::string& name) const;

    /**
     * @brief Read a non-negative integer option
     *
     * @return fallback when the option is absent
     * @throws std::invalid_argument if the value is not a plain decimal count
     */
    size_t count(const std::string& name, size_t fallback) const;

private:
    std::map<std::string, std::string> values_;
};

/**
 * @brief Parse the arguments that follow the subcommand name
 *
 * Accepts "--name value", "--name=value" and "-x value". Positional
 * arguments are rejected.
 *
 * @throws std::invalid_argument on unknown options, missing values or
 *         missing required options
 */
OptionValues parse_options(const std::vector<std::string>& arguments,
                           const std::vector<OptionSpec>& specs);

/**
 * @brief Build a ranking query from the stats subcommand's options
 *
 * Reads --min-articles, --time-range, --article-type, --sort-by,
 * --sort-order, --limit and --offset; absent options keep the
 * SourceStatsQuery defaults.
 */
SourceStatsQuery query_from_options(const OptionValues& options);

// ============================================================================
// Subcommand dispatch
// ============================================================================

struct Subcommand {
    std::string name;
    std::string summary;
    std::vector<OptionSpec> options;
    std::function<int(const OptionValues&)> handler;
};

void print_subcommand_usage(std::ostream& out, const std::string& program, const Subcommand& cmd);

/**
 * @brief Routes "program <subcommand> [options]" to a handler
 *
 * Handler exceptions are reported on std::cerr and turn into exit code 1.
 */
class CommandDispatcher {
public:
    CommandDispatcher(std::string program, std::string summary, std::string version);

    void add(Subcommand cmd);

    int run(int argc, char** argv) const;

    void print_usage(std::ostream& out) const;

private:
    std::string program_;
    std::string summary_;
    std::string version_;
    std::map<std::string, Subcommand> subcommands_;
};

} // namespace cred
