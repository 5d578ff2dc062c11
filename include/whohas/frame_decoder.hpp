#ifndef WHOHAS_FRAME_DECODER_HPP
#define WHOHAS_FRAME_DECODER_HPP

#include "packet.hpp"
#include "utils.hpp" // For Timestamp

#include <cstdint>
#include <cstddef>
#include <optional>
#include <vector>

namespace whohas {

// A captured link-layer frame as delivered by a capture facility.
struct RawFrame {
    Timestamp timestamp;
    std::vector<uint8_t> data;
    uint32_t original_length = 0; // On-the-wire length, may exceed data.size()
};

struct ArpRequestEvent {
    IpAddress sender_ip = 0;
    MacAddress sender_mac;
    IpAddress target_ip = 0;
    Timestamp timestamp;
};

// Sequential access to frames from a capture file or similar.
class FrameReader {
public:
    virtual ~FrameReader() = default;
    // Fills `frame` and returns true, or returns false at end of input / on error.
    virtual bool next(RawFrame& frame) = 0;
};

// Extracts an IPv4-over-Ethernet ARP request ("who-has") from a frame.
// Replies, other ethertypes and truncated frames yield std::nullopt.
std::optional<ArpRequestEvent> decode_arp_request(const uint8_t* data, std::size_t length, Timestamp timestamp);

inline std::optional<ArpRequestEvent> decode_arp_request(const RawFrame& frame) {
    return decode_arp_request(frame.data.data(), frame.data.size(), frame.timestamp);
}

// Extracts the sender of an ARP reply, used by the active prober.
std::optional<ArpRequestEvent> decode_arp_reply(const uint8_t* data, std::size_t length, Timestamp timestamp);

} // namespace whohas

#endif // WHOHAS_FRAME_DECODER_HPP
