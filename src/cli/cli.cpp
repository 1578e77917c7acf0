#include "cli/cli.hpp"
#include <cctype>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace cred {

// ==========================================
// OptionValues
// ==========================================

void OptionValues::set(const std::string& name, std::string value) {
    values_[name] = std::move(value);
}

bool OptionValues::has(const std::string& name) const {
    return values_.count(name) > 0;
}

const std::string& OptionValues::text(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        throw std::invalid_argument("Missing required option: --" + name);
    }
    return it->second;
}

std::optional<std::string> OptionValues::find(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t OptionValues::count(const std::string& name, size_t fallback) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        return fallback;
    }

    const std::string& value = it->second;
    bool digits_only = !value.empty();
    for (unsigned char c : value) {
        if (!std::isdigit(c)) {
            digits_only = false;
            break;
        }
    }
    if (!digits_only) {
        throw std::invalid_argument("Option --" + name + " expects a non-negative integer, got '" + value + "'");
    }

    try {
        return static_cast<size_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Option --" + name + " is out of range: " + value);
    }
}

// ==========================================
// Parsing
// ==========================================

OptionValues parse_options(const std::vector<std::string>& arguments,
                           const std::vector<OptionSpec>& specs) {
    auto lookup = [&specs](const std::string& token) -> const OptionSpec* {
        for (const auto& spec : specs) {
            if (token == "--" + spec.name) return &spec;
            if (spec.short_name != '\0' && token.size() == 2 &&
                token[0] == '-' && token[1] == spec.short_name) {
                return &spec;
            }
        }
        return nullptr;
    };

    OptionValues values;
    for (size_t i = 0; i < arguments.size(); ++i) {
        std::string token = arguments[i];
        std::optional<std::string> inline_value;

        if (token.rfind("--", 0) == 0) {
            auto eq = token.find('=');
            if (eq != std::string::npos) {
                inline_value = token.substr(eq + 1);
                token = token.substr(0, eq);
            }
        } else if (token.empty() || token[0] != '-') {
            throw std::invalid_argument("Unexpected argument: " + token);
        }

        const OptionSpec* spec = lookup(token);
        if (!spec) {
            throw std::invalid_argument("Unknown option: " + token);
        }

        if (!spec->takes_value) {
            if (inline_value) {
                throw std::invalid_argument("Option --" + spec->name + " takes no value");
            }
            values.set(spec->name, "true");
        } else if (inline_value) {
            values.set(spec->name, *inline_value);
        } else if (i + 1 < arguments.size()) {
            values.set(spec->name, arguments[++i]);
        } else {
            throw std::invalid_argument("Option --" + spec->name + " needs a value");
        }
    }

    for (const auto& spec : specs) {
        if (values.has(spec.name)) continue;
        if (spec.required) {
            throw std::invalid_argument("Missing required option: --" + spec.name);
        }
        if (!spec.default_value.empty()) {
            values.set(spec.name, spec.default_value);
        }
    }
    return values;
}

SourceStatsQuery query_from_options(const OptionValues& options) {
    SourceStatsQuery query;
    query.min_articles = options.count("min-articles", query.min_articles);
    query.limit = options.count("limit", query.limit);
    query.offset = options.count("offset", query.offset);

    if (auto range = options.find("time-range")) {
        query.time_range = parse_time_range(*range);
    }
    if (auto key = options.find("sort-by")) {
        query.sort_by = parse_sort_by(*key);
    }
    if (auto order = options.find("sort-order")) {
        query.sort_order = parse_sort_order(*order);
    }
    query.article_type = options.find("article-type");
    return query;
}

// ==========================================
// CommandDispatcher
// ==========================================

void print_subcommand_usage(std::ostream& out, const std::string& program, const Subcommand& cmd) {
    out << "\nUsage: " << program << " " << cmd.name << " [options]\n\n"
        << cmd.summary << "\n\nOptions:\n";
    for (const auto& opt : cmd.options) {
        std::string flag = "--" + opt.name;
        if (opt.short_name != '\0') {
            flag += ", -" + std::string(1, opt.short_name);
        }
        if (opt.takes_value) {
            flag += " <value>";
        }
        out << "  " << std::left << std::setw(30) << flag << opt.help;
        if (!opt.default_value.empty()) {
            out << " (default: " << opt.default_value << ")";
        }
        if (opt.required) {
            out << " [required]";
        }
        out << "\n";
    }
    out << "\n";
}

CommandDispatcher::CommandDispatcher(std::string program, std::string summary, std::string version)
    : program_(std::move(program)), summary_(std::move(summary)), version_(std::move(version)) {}

void CommandDispatcher::add(Subcommand cmd) {
    std::string name = cmd.name;
    subcommands_[name] = std::move(cmd);
}

void CommandDispatcher::print_usage(std::ostream& out) const {
    out << program_ << " " << version_ << " - " << summary_ << "\n\n"
        << "Usage: " << program_ << " <command> [options]\n\nCommands:\n";
    for (const auto& entry : subcommands_) {
        out << "  " << std::left << std::setw(10) << entry.first << entry.second.summary << "\n";
    }
    out << "\nRun '" << program_ << " <command> --help' for the options of one command.\n";
}

int CommandDispatcher::run(int argc, char** argv) const {
    if (argc < 2) {
        print_usage(std::cerr);
        return 1;
    }

    std::string name = argv[1];
    if (name == "--help" || name == "-h") {
        print_usage(std::cout);
        return 0;
    }
    if (name == "--version") {
        std::cout << program_ << " " << version_ << "\n";
        return 0;
    }

    auto it = subcommands_.find(name);
    if (it == subcommands_.end()) {
        std::cerr << "Unknown command: " << name << "\n";
        print_usage(std::cerr);
        return 1;
    }
    const Subcommand& cmd = it->second;

    std::vector<std::string> arguments(argv + 2, argv + argc);
    for (const auto& arg : arguments) {
        if (arg == "--help" || arg == "-h") {
            print_subcommand_usage(std::cout, program_, cmd);
            return 0;
        }
    }

    OptionValues options;
    try {
        options = parse_options(arguments, cmd.options);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_subcommand_usage(std::cerr, program_, cmd);
        return 1;
    }

    try {
        return cmd.handler(options);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace cred
