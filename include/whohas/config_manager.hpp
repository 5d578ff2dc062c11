#ifndef WHOHAS_CONFIG_MANAGER_HPP
#define WHOHAS_CONFIG_MANAGER_HPP

#include <cstdint>   // For uint32_t, uint64_t
#include <string>
#include <vector>
#include <map>
#include <variant>
#include <optional>

namespace whohas {

class Logger;

// Supported configuration value types
using ConfigValue = std::variant<
    bool,
    int,
    uint32_t,
    uint64_t,
    double,
    std::string,
    std::vector<std::string> // Comma-separated values in the file
>;

// Configuration data is stored as a map of dotted keys to ConfigValue
using ConfigurationData = std::map<std::string, ConfigValue>;

// Settings shared by the capture and analyze commands. Defaults match the CLI.
struct EngineConfig {
    std::string interface = "eth0";
    uint32_t redraw_frequency = 5;
    bool reverse_resolve = false;
    bool arp_resolve = false;
    uint32_t dns_timeout_s = 2;
    uint32_t probe_timeout_ms = 1000;
    uint64_t stale_threshold = 3;
    std::string database;
    std::string analysis_output;
    std::string pcap_output;
    std::string color_profile = "default";
    std::vector<std::string> columns;
};

class ConfigManager {
public:
    ConfigManager() = default;

    // Reads `key = value` lines. Blank lines and lines starting with '#' are skipped,
    // as are lines without '=' or with an empty key (with a warning).
    bool load_config(const std::string& filename);

    bool save_config(const std::string& filename_param = "") const;

    std::optional<ConfigValue> get_parameter(const std::string& path) const;

    template<typename T>
    std::optional<T> get_parameter_as(const std::string& path) const {
        auto it = config_data_.find(path);
        if (it == config_data_.end()) {
            return std::nullopt;
        }
        if (const T* val = std::get_if<T>(&it->second)) {
            return *val;
        }
        return std::nullopt; // Stored under a different type
    }

    void set_parameter(const std::string& path, ConfigValue value);

    const ConfigurationData& get_current_config_data() const {
        return config_data_;
    }

    void set_logger(Logger* logger) {
        logger_ = logger;
    }

    // One message per problem; empty when the data can be applied.
    std::vector<std::string> validate_config(const ConfigurationData& config_to_validate) const;

    // Copies every recognised key onto `target`. Unknown keys and mistyped values are
    // logged and skipped.
    void apply_config(const ConfigurationData& config_data_to_apply, EngineConfig& target) const;

    static ConfigValue parse_value(const std::string& value_str);

private:
    ConfigurationData config_data_;
    std::string loaded_config_filename_;
    Logger* logger_ = nullptr;
};

} // namespace whohas

#endif // WHOHAS_CONFIG_MANAGER_HPP
