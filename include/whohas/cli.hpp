#ifndef WHOHAS_CLI_HPP
#define WHOHAS_CLI_HPP

#include "address_filter.hpp" // For FilterLists
#include "config_manager.hpp" // For EngineConfig
#include "logger.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace whohas {

enum class CommandMode {
    CAPTURE,
    ANALYZE,
    HELP
};

// Filter arguments exactly as given; each may be an address or an address file.
struct FilterArgs {
    std::vector<std::string> whitelist;
    std::vector<std::string> blacklist;
    std::vector<std::string> sender_whitelist;
    std::vector<std::string> target_whitelist;
    std::vector<std::string> sender_blacklist;
    std::vector<std::string> target_blacklist;
};

// Parsed command line. Unset optionals leave the configured value alone.
struct CliOptions {
    CommandMode mode = CommandMode::HELP;
    bool verbose = false;
    std::optional<std::string> config_file;

    std::optional<std::string> interface;
    std::optional<uint32_t> redraw_frequency;
    std::optional<bool> reverse_resolve;
    std::optional<bool> arp_resolve;
    std::optional<uint64_t> stale_threshold;
    std::optional<uint32_t> probe_timeout_ms;
    std::optional<std::string> database;
    std::optional<std::string> analysis_output;
    std::optional<std::string> pcap_output;
    std::optional<std::vector<std::string>> columns;
    std::optional<std::string> color_profile;

    std::vector<std::string> pcap_files;
    std::vector<std::string> sqlite_files;

    FilterArgs filters;
};

struct ParseResult {
    std::optional<CliOptions> options;
    std::string error; // Set when options is empty
};

// `args` excludes the program name.
ParseResult parse_command_line(const std::vector<std::string>& args);

std::string usage(const std::string& program);

// Mode-dependent defaults (database name) before any file or flag is applied.
EngineConfig default_engine_config(CommandMode mode);

// Copies every option that was given onto `config`.
void apply_overrides(const CliOptions& options, EngineConfig& config);

// Global lists feed both roles; sender/target lists feed their own role only.
// Returns the number of values rejected.
std::size_t populate_filters(const FilterArgs& args, FilterLists& lists, Logger* logger = nullptr);

} // namespace whohas

#endif // WHOHAS_CLI_HPP
