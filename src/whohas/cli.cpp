#include "whohas/cli.hpp"
#include "whohas/utils.hpp" // For utils::safe_stoul

#include <limits>  // For std::numeric_limits
#include <sstream>

namespace whohas {

namespace {

enum class Option {
    HELP,
    VERBOSE,
    CONFIG,
    INTERFACE,
    REDRAW_FREQUENCY,
    REVERSE_RESOLVE,
    ARP_RESOLVE,
    STALE_THRESHOLD,
    PROBE_TIMEOUT,
    DATABASE_OUTPUT,
    ANALYSIS_OUTPUT,
    PCAP_OUTPUT,
    OUTPUT_COLUMNS,
    COLOR_PROFILE,
    PCAP_FILES,
    SQLITE_FILES,
    WHITELIST,
    BLACKLIST,
    SENDER_WHITELIST,
    TARGET_WHITELIST,
    SENDER_BLACKLIST,
    TARGET_BLACKLIST
};

struct OptionSpec {
    const char* long_name;
    const char* short_name;
    Option option;
    bool capture;
    bool analyze;
};

const OptionSpec OPTIONS[] = {
    {"--help",                 "-h",   Option::HELP,             true,  true},
    {"--verbose",              "-v",   Option::VERBOSE,          true,  true},
    {"--config",               "-c",   Option::CONFIG,           true,  true},
    {"--interface",            "-i",   Option::INTERFACE,        true,  false},
    {"--redraw-frequency",     "-rf",  Option::REDRAW_FREQUENCY, true,  false},
    {"--reverse-resolve",      "-rr",  Option::REVERSE_RESOLVE,  true,  true},
    {"--arp-resolve",          "-ar",  Option::ARP_RESOLVE,      true,  false},
    {"--stale-threshold",      "-st",  Option::STALE_THRESHOLD,  true,  false},
    {"--probe-timeout",        "-pt",  Option::PROBE_TIMEOUT,    true,  false},
    {"--database-output-file", "-dof", Option::DATABASE_OUTPUT,  true,  true},
    {"--database-output-file", "-dbo", Option::DATABASE_OUTPUT,  false, true},
    {"--analysis-output-file", "-aof", Option::ANALYSIS_OUTPUT,  true,  true},
    {"--pcap-output-file",     "-pof", Option::PCAP_OUTPUT,      true,  false},
    {"--output-columns",       "-oc",  Option::OUTPUT_COLUMNS,   true,  true},
    {"--color-profile",        "-cp",  Option::COLOR_PROFILE,    true,  true},
    {"--pcap-files",           "-pfs", Option::PCAP_FILES,       false, true},
    {"--sqlite-files",         "-sfs", Option::SQLITE_FILES,     false, true},
    {"--whitelist",            "-wl",  Option::WHITELIST,        true,  true},
    {"--blacklist",            "-bl",  Option::BLACKLIST,        true,  true},
    {"--sender-whitelist",     "-sw",  Option::SENDER_WHITELIST, true,  true},
    {"--target-whitelist",     "-tw",  Option::TARGET_WHITELIST, true,  true},
    {"--sender-blacklist",     "-sb",  Option::SENDER_BLACKLIST, true,  true},
    {"--target-blacklist",     "-tb",  Option::TARGET_BLACKLIST, true,  true},
};

const OptionSpec* find_option(const std::string& token, CommandMode mode) {
    for (const auto& spec : OPTIONS) {
        if (token != spec.long_name && token != spec.short_name) {
            continue;
        }
        if ((mode == CommandMode::CAPTURE && spec.capture) || (mode == CommandMode::ANALYZE && spec.analyze)) {
            return &spec;
        }
    }
    return nullptr;
}

bool is_option_token(const std::string& token) {
    return token.size() > 1 && token[0] == '-';
}

// Single value following args[i]; advances i.
std::optional<std::string> take_value(const std::vector<std::string>& args, std::size_t& i) {
    if (i + 1 >= args.size() || is_option_token(args[i + 1])) {
        return std::nullopt;
    }
    return args[++i];
}

// Every value up to the next option; advances i.
std::vector<std::string> take_values(const std::vector<std::string>& args, std::size_t& i) {
    std::vector<std::string> values;
    while (i + 1 < args.size() && !is_option_token(args[i + 1])) {
        values.push_back(args[++i]);
    }
    return values;
}

std::optional<uint64_t> positive_number(const std::string& text) {
    auto value = utils::safe_stoul(text);
    if (!value || *value == 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(*value);
}

void append(std::vector<std::string>& dst, const std::vector<std::string>& src) {
    dst.insert(dst.end(), src.begin(), src.end());
}

} // namespace

ParseResult parse_command_line(const std::vector<std::string>& args) {
    ParseResult result;
    if (args.empty()) {
        result.error = "No command given.";
        return result;
    }

    CliOptions options;
    const std::string& command = args[0];
    if (command == "capture") {
        options.mode = CommandMode::CAPTURE;
    } else if (command == "analyze") {
        options.mode = CommandMode::ANALYZE;
    } else if (command == "-h" || command == "--help" || command == "help") {
        options.mode = CommandMode::HELP;
        result.options = options;
        return result;
    } else {
        result.error = "Unknown command: " + command;
        return result;
    }

    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string& token = args[i];
        const OptionSpec* spec = find_option(token, options.mode);
        if (!spec) {
            result.error = "Unknown option for " + command + ": " + token;
            return result;
        }

        std::string missing = "Option " + token + " requires a value.";
        switch (spec->option) {
            case Option::HELP:
                options.mode = CommandMode::HELP;
                result.options = options;
                return result;
            case Option::VERBOSE:
                options.verbose = true;
                break;
            case Option::REVERSE_RESOLVE:
                options.reverse_resolve = true;
                break;
            case Option::ARP_RESOLVE:
                options.arp_resolve = true;
                break;
            case Option::CONFIG:
            case Option::INTERFACE:
            case Option::DATABASE_OUTPUT:
            case Option::ANALYSIS_OUTPUT:
            case Option::PCAP_OUTPUT:
            case Option::COLOR_PROFILE: {
                auto value = take_value(args, i);
                if (!value) {
                    result.error = missing;
                    return result;
                }
                if (spec->option == Option::CONFIG) options.config_file = *value;
                else if (spec->option == Option::INTERFACE) options.interface = *value;
                else if (spec->option == Option::DATABASE_OUTPUT) options.database = *value;
                else if (spec->option == Option::ANALYSIS_OUTPUT) options.analysis_output = *value;
                else if (spec->option == Option::PCAP_OUTPUT) options.pcap_output = *value;
                else {
                    if (*value != "default" && *value != "disable") {
                        result.error = "Invalid color profile: " + *value + " (choose default or disable)";
                        return result;
                    }
                    options.color_profile = *value;
                }
                break;
            }
            case Option::REDRAW_FREQUENCY:
            case Option::STALE_THRESHOLD:
            case Option::PROBE_TIMEOUT: {
                auto value = take_value(args, i);
                if (!value) {
                    result.error = missing;
                    return result;
                }
                auto number = positive_number(*value);
                if (!number) {
                    result.error = "Invalid value for " + token + ": " + *value + " (expected a positive integer)";
                    return result;
                }
                if (spec->option != Option::STALE_THRESHOLD && *number > std::numeric_limits<uint32_t>::max()) {
                    result.error = "Value for " + token + " is out of range: " + *value;
                    return result;
                }
                if (spec->option == Option::REDRAW_FREQUENCY) options.redraw_frequency = static_cast<uint32_t>(*number);
                else if (spec->option == Option::STALE_THRESHOLD) options.stale_threshold = *number;
                else options.probe_timeout_ms = static_cast<uint32_t>(*number);
                break;
            }
            case Option::OUTPUT_COLUMNS:
            case Option::PCAP_FILES:
            case Option::SQLITE_FILES:
            case Option::WHITELIST:
            case Option::BLACKLIST:
            case Option::SENDER_WHITELIST:
            case Option::TARGET_WHITELIST:
            case Option::SENDER_BLACKLIST:
            case Option::TARGET_BLACKLIST: {
                auto values = take_values(args, i);
                if (values.empty()) {
                    result.error = "Option " + token + " requires at least one value.";
                    return result;
                }
                switch (spec->option) {
                    case Option::OUTPUT_COLUMNS:   options.columns = values; break;
                    case Option::PCAP_FILES:       append(options.pcap_files, values); break;
                    case Option::SQLITE_FILES:     append(options.sqlite_files, values); break;
                    case Option::WHITELIST:        append(options.filters.whitelist, values); break;
                    case Option::BLACKLIST:        append(options.filters.blacklist, values); break;
                    case Option::SENDER_WHITELIST: append(options.filters.sender_whitelist, values); break;
                    case Option::TARGET_WHITELIST: append(options.filters.target_whitelist, values); break;
                    case Option::SENDER_BLACKLIST: append(options.filters.sender_blacklist, values); break;
                    case Option::TARGET_BLACKLIST: append(options.filters.target_blacklist, values); break;
                    default: break;
                }
                break;
            }
        }
    }

    if (options.mode == CommandMode::ANALYZE && options.pcap_files.empty() && options.sqlite_files.empty()) {
        result.error = "analyze requires --pcap-files or --sqlite-files.";
        return result;
    }

    result.options = options;
    return result;
}

std::string usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage:\n"
        << "  " << program << " capture [--interface|-i IF] [--redraw-frequency|-rf N]\n"
        << "        [--reverse-resolve|-rr] [--arp-resolve|-ar] [--stale-threshold|-st N]\n"
        << "        [--probe-timeout|-pt MS] [--database-output-file|-dof FILE]\n"
        << "        [--analysis-output-file|-aof FILE] [--pcap-output-file|-pof FILE]\n"
        << "        [--output-columns|-oc COL...] [--color-profile|-cp default|disable]\n"
        << "        [--config|-c FILE] [--verbose|-v] [filter args]\n"
        << "  " << program << " analyze (--pcap-files|-pfs FILE... | --sqlite-files|-sfs FILE...)\n"
        << "        [--database-output-file|-dbo FILE] [--reverse-resolve|-rr]\n"
        << "        [--output-columns|-oc COL...] [--color-profile|-cp default|disable]\n"
        << "        [--analysis-output-file|-aof FILE] [--config|-c FILE] [--verbose|-v] [filter args]\n"
        << "\n"
        << "Filter args (each takes one or more addresses or address files):\n"
        << "  --whitelist|-wl --blacklist|-bl --sender-whitelist|-sw --target-whitelist|-tw\n"
        << "  --sender-blacklist|-sb --target-blacklist|-tb\n"
        << "\n"
        << "Columns: arp_count sender sender_mac target target_mac stale sender_ptr target_ptr mitm_op\n";
    return oss.str();
}

EngineConfig default_engine_config(CommandMode mode) {
    EngineConfig config;
    config.database = (mode == CommandMode::ANALYZE) ? "whohas_dump.db" : "whohas.db";
    return config;
}

void apply_overrides(const CliOptions& options, EngineConfig& config) {
    if (options.interface) config.interface = *options.interface;
    if (options.redraw_frequency) config.redraw_frequency = *options.redraw_frequency;
    if (options.reverse_resolve) config.reverse_resolve = *options.reverse_resolve;
    if (options.arp_resolve) config.arp_resolve = *options.arp_resolve;
    if (options.stale_threshold) config.stale_threshold = *options.stale_threshold;
    if (options.probe_timeout_ms) config.probe_timeout_ms = *options.probe_timeout_ms;
    if (options.database) config.database = *options.database;
    if (options.analysis_output) config.analysis_output = *options.analysis_output;
    if (options.pcap_output) config.pcap_output = *options.pcap_output;
    if (options.columns) config.columns = *options.columns;
    if (options.color_profile) config.color_profile = *options.color_profile;
}

std::size_t populate_filters(const FilterArgs& args, FilterLists& lists, Logger* logger) {
    std::size_t rejected = 0;
    rejected += lists.add_global(ListType::WHITE, args.whitelist, logger);
    rejected += lists.add_global(ListType::BLACK, args.blacklist, logger);
    rejected += lists.sender.add_all(ListType::WHITE, args.sender_whitelist);
    rejected += lists.target.add_all(ListType::WHITE, args.target_whitelist);
    rejected += lists.sender.add_all(ListType::BLACK, args.sender_blacklist);
    rejected += lists.target.add_all(ListType::BLACK, args.target_blacklist);
    lists.sender.finalize();
    lists.target.finalize();
    return rejected;
}

} // namespace whohas
