#ifndef WHOHAS_LOGGER_HPP
#define WHOHAS_LOGGER_HPP

#include "packet.hpp" // For MacAddress, IpAddress
#include "utils.hpp"  // For utils::ip_to_string

#include <string>    // For std::string, std::to_string
#include <iostream>  // For std::cout, std::cerr, std::endl, std::ostream
#include <ctime>     // For std::time_t, std::time, std::strftime, struct std::tm
#include <cstdio>    // For std::snprintf
#include <cstdint>   // For uint64_t

namespace whohas {

struct IngestCounters {
    uint64_t frames_seen = 0;
    uint64_t requests_decoded = 0;
    uint64_t requests_accepted = 0;
    uint64_t requests_filtered = 0;
    uint64_t requests_own = 0;
};

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

class Logger {
public:
    explicit Logger(LogLevel min_level = LogLevel::INFO) : min_log_level_(min_level) {}

    void set_min_log_level(LogLevel level) {
        min_log_level_ = level;
    }

    LogLevel get_min_log_level() const {
        return min_log_level_;
    }

    // Routes every level to `out` instead of stdout/stderr. nullptr restores the default.
    void set_output(std::ostream* out) {
        output_override_ = out;
    }

    void log(LogLevel level, const std::string& component, const std::string& message) const {
        if (level < min_log_level_) {
            return;
        }

        std::time_t t = std::time(nullptr);
        char time_buf[100];
        struct std::tm local_tm;

        if (!(localtime_r(&t, &local_tm) && std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", &local_tm))) {
            std::snprintf(time_buf, sizeof(time_buf), "YYYY-MM-DD HH:MM:SS");
        }

        std::ostream& output_stream = output_override_
            ? *output_override_
            : ((level >= LogLevel::ERROR) ? std::cerr : std::cout);

        output_stream << "[" << time_buf << "] "
                      << "[" << level_to_string(level) << "] "
                      << "[" << component << "] "
                      << message << std::endl;
    }

    void debug(const std::string& component, const std::string& message) const {
        log(LogLevel::DEBUG, component, message);
    }
    void info(const std::string& component, const std::string& message) const {
        log(LogLevel::INFO, component, message);
    }
    void warning(const std::string& component, const std::string& message) const {
        log(LogLevel::WARNING, component, message);
    }
    void error(const std::string& component, const std::string& message) const {
        log(LogLevel::ERROR, component, message);
    }
    void critical(const std::string& component, const std::string& message) const {
        log(LogLevel::CRITICAL, component, message);
    }

    std::string mac_to_string(const MacAddress& mac) const {
        return mac.to_string();
    }

    std::string ip_to_string(const IpAddress& ip_addr_net_order) const {
        return utils::ip_to_string(ip_addr_net_order);
    }

    void log_new_transaction(IpAddress sender, IpAddress target) const {
        if (min_log_level_ > LogLevel::DEBUG) return;
        log(LogLevel::DEBUG, "STORE", "New transaction " + ip_to_string(sender) + " -> " + ip_to_string(target));
    }

    void log_rebinding(IpAddress ip, const MacAddress& old_mac, const MacAddress& new_mac) const {
        if (min_log_level_ > LogLevel::WARNING) return;
        std::string message = "Sender " + ip_to_string(ip) + " changed link address from " +
                              mac_to_string(old_mac) + " to " + mac_to_string(new_mac);
        log(LogLevel::WARNING, "REBIND", message);
    }

    void log_ingest_stats(const IngestCounters& counters) const {
        if (min_log_level_ > LogLevel::INFO) return;
        std::string message = "Ingest Stats: FramesSeen=" + std::to_string(counters.frames_seen) +
                              ", RequestsDecoded=" + std::to_string(counters.requests_decoded) +
                              ", Accepted=" + std::to_string(counters.requests_accepted) +
                              ", Filtered=" + std::to_string(counters.requests_filtered) +
                              ", Own=" + std::to_string(counters.requests_own);
        log(LogLevel::INFO, "STATS", message);
    }

private:
    LogLevel min_log_level_;
    std::ostream* output_override_ = nullptr;

    std::string level_to_string(LogLevel level) const {
        switch (level) {
            case LogLevel::DEBUG:    return "DEBUG   ";
            case LogLevel::INFO:     return "INFO    ";
            case LogLevel::WARNING:  return "WARNING ";
            case LogLevel::ERROR:    return "ERROR   ";
            case LogLevel::CRITICAL: return "CRITICAL";
            default:                 return "UNKNOWN ";
        }
    }
};

} // namespace whohas

#endif // WHOHAS_LOGGER_HPP
