#include "whohas/utils.hpp"

#include <string>
#include <regex>
#include <fstream>
#include <stdexcept> // For std::stoul, std::stoi exceptions
#include <ctime>
#include <sys/stat.h>

namespace whohas {
namespace utils {

namespace {
const std::regex& ipv4_pattern() {
    static const std::regex pattern("^(?:[0-9]{1,3}\\.){3}[0-9]{1,3}$");
    return pattern;
}
} // namespace

std::optional<unsigned long> safe_stoul(const std::string& str) {
    if (str.empty() || str[0] == '-') {
        return std::nullopt;
    }
    try {
        size_t processed_chars = 0;
        unsigned long val = std::stoul(str, &processed_chars, 10);
        if (processed_chars != str.length()) { // Ensure the entire string was consumed
            return std::nullopt;
        }
        return val;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<int> safe_stoi(const std::string& str) {
    try {
        size_t processed_chars = 0;
        int val = std::stoi(str, &processed_chars, 10);
        if (processed_chars != str.length()) {
            return std::nullopt;
        }
        return val;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string trim(const std::string& str) {
    const char* whitespace = " \t\n\r\f\v";
    auto begin = str.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = str.find_last_not_of(whitespace);
    return str.substr(begin, end - begin + 1);
}

bool matches_ipv4_pattern(const std::string& value) {
    return std::regex_match(value, ipv4_pattern());
}

std::optional<IpAddress> parse_ipv4(const std::string& value) {
    if (!matches_ipv4_pattern(value)) {
        return std::nullopt;
    }
    uint32_t host_order = 0;
    std::stringstream ss(value);
    std::string octet;
    while (std::getline(ss, octet, '.')) {
        auto parsed = safe_stoul(octet);
        if (!parsed || *parsed > 255) {
            return std::nullopt;
        }
        host_order = (host_order << 8) | static_cast<uint32_t>(*parsed);
    }
    return htonl(host_order);
}

std::string ip_to_string(IpAddress ip_net_order) {
    uint32_t ip_host_order = ntohl(ip_net_order);
    std::ostringstream oss;
    oss << ((ip_host_order >> 24) & 0xFF) << "."
        << ((ip_host_order >> 16) & 0xFF) << "."
        << ((ip_host_order >> 8) & 0xFF) << "."
        << (ip_host_order & 0xFF);
    return oss.str();
}

int64_t to_epoch_micros(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::microseconds>(ts.time_since_epoch()).count();
}

Timestamp from_epoch_micros(int64_t micros) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::microseconds(micros)));
}

std::string format_timestamp(Timestamp ts) {
    std::time_t t = std::chrono::system_clock::to_time_t(ts);
    char time_buf[32];
    struct std::tm tm_buf;
    if (localtime_r(&t, &tm_buf) && std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", &tm_buf)) {
        return std::string(time_buf);
    }
    return "YYYY-MM-DD HH:MM:SS";
}

uint64_t fnv1a64(const uint8_t* data, std::size_t length, uint64_t seed) {
    uint64_t hash = seed;
    for (std::size_t i = 0; i < length; ++i) {
        hash ^= data[i];
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

std::optional<uint64_t> fnv1a64_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    uint64_t hash = 0xcbf29ce484222325ULL;
    std::vector<char> chunk(64 * 1024);
    while (file) {
        file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        std::streamsize got = file.gcount();
        if (got <= 0) break;
        hash = fnv1a64(reinterpret_cast<const uint8_t*>(chunk.data()), static_cast<std::size_t>(got), hash);
    }
    if (file.bad()) {
        return std::nullopt;
    }
    return hash;
}

bool file_exists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

} // namespace utils
} // namespace whohas
