#ifndef WHOHAS_UTILS_HPP
#define WHOHAS_UTILS_HPP

#include "packet.hpp" // For IpAddress

#include <string>    // For std::string
#include <optional>  // For std::optional
#include <vector>    // For std::vector
#include <sstream>   // For std::stringstream
#include <iomanip>   // For std::hex, std::setfill, std::setw
#include <cstdint>   // For uint8_t, uint64_t
#include <chrono>    // For std::chrono::system_clock

namespace whohas {

using Timestamp = std::chrono::system_clock::time_point;

namespace utils {

// Safely converts a string to an unsigned long.
// Returns std::nullopt if conversion fails.
std::optional<unsigned long> safe_stoul(const std::string& str);

// Safely converts a string to an int.
// Returns std::nullopt if conversion fails.
std::optional<int> safe_stoi(const std::string& str);

std::string trim(const std::string& str);

// True when the value has the strict dotted-quad shape a.b.c.d (1-3 digits per part).
// Octet range is not checked here, see parse_ipv4.
bool matches_ipv4_pattern(const std::string& value);

// Parses a dotted-quad IPv4 literal into network byte order.
std::optional<IpAddress> parse_ipv4(const std::string& value);

std::string ip_to_string(IpAddress ip_net_order);

// Numeric ordering of two network-order addresses.
inline bool ip_less(IpAddress a, IpAddress b) {
    return ntohl(a) < ntohl(b);
}

struct IpOrder {
    bool operator()(IpAddress a, IpAddress b) const { return ip_less(a, b); }
};

// Microseconds since the Unix epoch, the on-disk timestamp representation.
int64_t to_epoch_micros(Timestamp ts);
Timestamp from_epoch_micros(int64_t micros);

std::string format_timestamp(Timestamp ts);

// 64-bit FNV-1a over a byte range, continuing from `seed`.
uint64_t fnv1a64(const uint8_t* data, std::size_t length, uint64_t seed = 0xcbf29ce484222325ULL);

// FNV-1a digest of a whole file. std::nullopt when the file cannot be read.
std::optional<uint64_t> fnv1a64_file(const std::string& path);

bool file_exists(const std::string& path);

template <typename TContainer>
std::string to_hex_string(const TContainer& container, char delimiter = '\0') {
    std::stringstream ss;
    bool first = true;
    for (const auto& byte_val : container) {
        if (!first && delimiter != '\0') {
            ss << delimiter;
        }
        ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(static_cast<uint8_t>(byte_val));
        first = false;
    }
    return ss.str();
}

inline std::string to_hex_string(uint64_t value) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(16) << value;
    return ss.str();
}

} // namespace utils
} // namespace whohas

#endif // WHOHAS_UTILS_HPP
