#include "whohas/config_manager.hpp"
#include "whohas/logger.hpp"
#include "whohas/utils.hpp" // For utils::trim

#include <algorithm> // For std::transform
#include <charconv>  // For std::from_chars
#include <fstream>   // For std::ifstream, std::ofstream
#include <limits>    // For std::numeric_limits
#include <sstream>   // For std::stringstream
#include <type_traits>
#include <utility>   // For std::move

namespace whohas {

namespace {

enum class ValueKind {
    STRING,
    BOOL,
    POSITIVE_INT,
    STRING_LIST
};

struct KeySpec {
    const char* key;
    ValueKind kind;
};

const KeySpec KNOWN_KEYS[] = {
    {"capture.interface",         ValueKind::STRING},
    {"capture.redraw_frequency",  ValueKind::POSITIVE_INT},
    {"resolve.reverse",           ValueKind::BOOL},
    {"resolve.arp",               ValueKind::BOOL},
    {"resolve.dns_timeout_s",     ValueKind::POSITIVE_INT},
    {"resolve.probe_timeout_ms",  ValueKind::POSITIVE_INT},
    {"stale.threshold",           ValueKind::POSITIVE_INT},
    {"output.database",           ValueKind::STRING},
    {"output.analysis",           ValueKind::STRING},
    {"output.pcap",               ValueKind::STRING},
    {"output.color_profile",      ValueKind::STRING},
    {"output.columns",            ValueKind::STRING_LIST},
};

const KeySpec* find_key(const std::string& key) {
    for (const auto& spec : KNOWN_KEYS) {
        if (key == spec.key) {
            return &spec;
        }
    }
    return nullptr;
}

std::optional<uint64_t> as_positive(const ConfigValue& value) {
    uint64_t result = 0;
    if (auto* v = std::get_if<int>(&value)) {
        if (*v <= 0) return std::nullopt;
        result = static_cast<uint64_t>(*v);
    } else if (auto* v32 = std::get_if<uint32_t>(&value)) {
        result = *v32;
    } else if (auto* v64 = std::get_if<uint64_t>(&value)) {
        result = *v64;
    } else {
        return std::nullopt;
    }
    if (result == 0) return std::nullopt;
    return result;
}

// Scalar values of any type render as the text they were written as.
std::optional<std::string> as_string(const ConfigValue& value) {
    std::optional<std::string> result;
    std::visit([&](const auto& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, bool>) {
            result = val ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            result = val;
        } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            result = std::nullopt;
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << val;
            result = oss.str();
        } else {
            result = std::to_string(val);
        }
    }, value);
    return result;
}

std::optional<std::vector<std::string>> as_string_list(const ConfigValue& value) {
    if (auto* list = std::get_if<std::vector<std::string>>(&value)) {
        return *list;
    }
    if (auto* single = std::get_if<std::string>(&value)) {
        return std::vector<std::string>{*single};
    }
    return std::nullopt;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += delimiter;
        out += parts[i];
    }
    return out;
}

} // namespace

ConfigValue ConfigManager::parse_value(const std::string& value_str) {
    if (value_str.find(',') != std::string::npos) {
        std::vector<std::string> items;
        std::stringstream ss(value_str);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = utils::trim(item);
            if (!item.empty()) {
                items.push_back(item);
            }
        }
        return items;
    }

    std::string lower_value_str = value_str;
    std::transform(lower_value_str.begin(), lower_value_str.end(), lower_value_str.begin(), ::tolower);
    if (lower_value_str == "true") {
        return true;
    }
    if (lower_value_str == "false") {
        return false;
    }

    const char* begin = value_str.data();
    const char* end = value_str.data() + value_str.size();

    int int_val;
    auto [ptr, ec] = std::from_chars(begin, end, int_val);
    if (ec == std::errc() && ptr == end) {
        return int_val;
    }

    uint64_t uint64_val;
    auto [ptr_u64, ec_u64] = std::from_chars(begin, end, uint64_val);
    if (ec_u64 == std::errc() && ptr_u64 == end) {
        if (uint64_val <= std::numeric_limits<uint32_t>::max()) {
            return static_cast<uint32_t>(uint64_val);
        }
        return uint64_val;
    }

    double double_val;
    std::stringstream ss_double(value_str);
    ss_double >> double_val;
    if (!value_str.empty() && !ss_double.fail() && ss_double.eof()) {
        return double_val;
    }
    return value_str;
}

bool ConfigManager::load_config(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        if (logger_) logger_->error("Config", "Failed to open config file: " + filename);
        return false;
    }

    config_data_.clear();
    std::string line;
    int line_num = 0;
    while (std::getline(file, line)) {
        line_num++;
        line = utils::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::size_t delimiter_pos = line.find('=');
        if (delimiter_pos == std::string::npos) {
            if (logger_) logger_->warning("Config", filename + ":" + std::to_string(line_num) + ": skipping line without '='");
            continue;
        }

        std::string key = utils::trim(line.substr(0, delimiter_pos));
        std::string value_str = utils::trim(line.substr(delimiter_pos + 1));
        if (key.empty()) {
            if (logger_) logger_->warning("Config", filename + ":" + std::to_string(line_num) + ": skipping line with empty key");
            continue;
        }

        config_data_[key] = parse_value(value_str);
    }

    loaded_config_filename_ = filename;
    if (logger_) {
        logger_->info("Config", "Loaded " + std::to_string(config_data_.size()) + " parameter(s) from " + filename);
    }
    return true;
}

bool ConfigManager::save_config(const std::string& filename_param) const {
    const std::string& target_filename = filename_param.empty() ? loaded_config_filename_ : filename_param;
    if (target_filename.empty()) {
        if (logger_) logger_->error("Config", "Save failed: no filename given and no config previously loaded.");
        return false;
    }

    std::ofstream file(target_filename);
    if (!file.is_open()) {
        if (logger_) logger_->error("Config", "Failed to open file for saving: " + target_filename);
        return false;
    }

    for (const auto& pair : config_data_) {
        std::string value_str;
        if (auto list = std::get_if<std::vector<std::string>>(&pair.second)) {
            value_str = join(*list, ",");
        } else {
            value_str = as_string(pair.second).value_or("");
        }
        file << pair.first << "=" << value_str << "\n";
    }
    return static_cast<bool>(file);
}

std::optional<ConfigValue> ConfigManager::get_parameter(const std::string& path) const {
    auto it = config_data_.find(path);
    if (it != config_data_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void ConfigManager::set_parameter(const std::string& path, ConfigValue value) {
    config_data_[path] = std::move(value);
}

std::vector<std::string> ConfigManager::validate_config(const ConfigurationData& config_to_validate) const {
    std::vector<std::string> errors;

    for (const auto& pair : config_to_validate) {
        const std::string& key = pair.first;
        const ConfigValue& value = pair.second;

        const KeySpec* spec = find_key(key);
        if (!spec) {
            errors.push_back("Unknown configuration key '" + key + "'.");
            continue;
        }

        switch (spec->kind) {
            case ValueKind::BOOL:
                if (!std::holds_alternative<bool>(value)) {
                    errors.push_back("Invalid value for '" + key + "'. Expected true or false.");
                }
                break;
            case ValueKind::POSITIVE_INT:
                if (!as_positive(value)) {
                    errors.push_back("Invalid value for '" + key + "'. Expected a positive integer.");
                }
                break;
            case ValueKind::STRING: {
                auto text = as_string(value);
                if (!text || text->empty()) {
                    errors.push_back("Invalid value for '" + key + "'. Expected a single value.");
                } else if (key == "output.color_profile" && *text != "default" && *text != "disable") {
                    errors.push_back("Invalid value for '" + key + "'. Expected default or disable.");
                }
                break;
            }
            case ValueKind::STRING_LIST:
                if (!as_string_list(value)) {
                    errors.push_back("Invalid value for '" + key + "'. Expected a comma-separated list.");
                }
                break;
        }
    }

    if (logger_ && !errors.empty()) {
        logger_->warning("Config", "Configuration validation found " + std::to_string(errors.size()) + " error(s).");
    }
    return errors;
}

void ConfigManager::apply_config(const ConfigurationData& config_data_to_apply, EngineConfig& target) const {
    for (const auto& pair : config_data_to_apply) {
        const std::string& path = pair.first;
        const ConfigValue& value = pair.second;

        const KeySpec* spec = find_key(path);
        if (!spec) {
            if (logger_) logger_->warning("Config", "Unrecognized key " + path);
            continue;
        }

        bool applied = false;
        if (spec->kind == ValueKind::BOOL) {
            if (auto* b = std::get_if<bool>(&value)) {
                if (path == "resolve.reverse") target.reverse_resolve = *b;
                else if (path == "resolve.arp") target.arp_resolve = *b;
                applied = true;
            }
        } else if (spec->kind == ValueKind::POSITIVE_INT) {
            if (auto n = as_positive(value)) {
                uint32_t clamped = static_cast<uint32_t>(std::min<uint64_t>(*n, std::numeric_limits<uint32_t>::max()));
                if (path == "capture.redraw_frequency") target.redraw_frequency = clamped;
                else if (path == "resolve.dns_timeout_s") target.dns_timeout_s = clamped;
                else if (path == "resolve.probe_timeout_ms") target.probe_timeout_ms = clamped;
                else if (path == "stale.threshold") target.stale_threshold = *n;
                applied = true;
            }
        } else if (spec->kind == ValueKind::STRING) {
            if (auto text = as_string(value)) {
                if (path == "capture.interface") target.interface = *text;
                else if (path == "output.database") target.database = *text;
                else if (path == "output.analysis") target.analysis_output = *text;
                else if (path == "output.pcap") target.pcap_output = *text;
                else if (path == "output.color_profile") target.color_profile = *text;
                applied = true;
            }
        } else if (spec->kind == ValueKind::STRING_LIST) {
            if (auto list = as_string_list(value)) {
                target.columns = *list;
                applied = true;
            }
        }

        if (!applied) {
            if (logger_) logger_->error("Config", "Invalid type for " + path + ", keeping current value");
        } else if (logger_) {
            logger_->debug("Config", "Applied " + path);
        }
    }
}

} // namespace whohas
