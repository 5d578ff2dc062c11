#ifndef WHOHAS_PACKET_HPP
#define WHOHAS_PACKET_HPP

#include <cstdint>   // For uint8_t, uint16_t, uint32_t
#include <vector>    // For std::vector
#include <optional>  // For std::optional, std::nullopt
#include <string>    // For std::string
#include <array>     // For std::array
#include <algorithm> // For std::copy
#include <cstdio>    // For std::sscanf, std::snprintf
#include <cstddef>   // For std::size_t
#include <initializer_list>

#include <arpa/inet.h> // For ntohs, htons, ntohl, htonl

namespace whohas {

#if defined(__GNUC__) || defined(__clang__)
#pragma pack(push, 1)
#endif
struct MacAddress {
    std::array<uint8_t, 6> bytes{};

    MacAddress() = default;

    MacAddress(const uint8_t* mac_bytes_ptr) {
        if (mac_bytes_ptr) {
            std::copy(mac_bytes_ptr, mac_bytes_ptr + 6, bytes.begin());
        } else {
            bytes.fill(0);
        }
    }

    MacAddress(std::initializer_list<uint8_t> init) {
        std::size_t i = 0;
        for (uint8_t b : init) {
            if (i >= bytes.size()) break;
            bytes[i++] = b;
        }
    }

    // Accepts "aa:bb:cc:dd:ee:ff" (either case). Anything else yields the zero address.
    MacAddress(const std::string& mac_str) {
        bytes.fill(0);
        if (mac_str.length() == 17) {
            unsigned int temp_b[6];
            int matched = std::sscanf(mac_str.c_str(), "%02x:%02x:%02x:%02x:%02x:%02x",
                                      &temp_b[0], &temp_b[1], &temp_b[2],
                                      &temp_b[3], &temp_b[4], &temp_b[5]);
            if (matched == 6) {
                for (std::size_t i = 0; i < 6; ++i) {
                    if (temp_b[i] > 255) {
                        bytes.fill(0);
                        return;
                    }
                    bytes[i] = static_cast<uint8_t>(temp_b[i]);
                }
            }
        }
    }

    bool operator==(const MacAddress& other) const {
        return bytes == other.bytes;
    }

    bool operator!=(const MacAddress& other) const {
        return !(*this == other);
    }

    bool operator<(const MacAddress& other) const {
        return bytes < other.bytes;
    }

    std::string to_string() const {
        char buf[18];
        std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                      bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5]);
        return std::string(buf);
    }

    bool is_zero() const {
        for (uint8_t b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    bool is_broadcast() const {
        for (uint8_t b : bytes) {
            if (b != 0xFF) return false;
        }
        return true;
    }

    static MacAddress broadcast() {
        return MacAddress{0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
    }
};
#if defined(__GNUC__) || defined(__clang__)
#pragma pack(pop)
#endif

constexpr uint16_t ETHERTYPE_IPV4 = 0x0800;
constexpr uint16_t ETHERTYPE_ARP = 0x0806;
constexpr uint16_t ETHERTYPE_VLAN = 0x8100;

constexpr uint16_t ARP_HTYPE_ETHERNET = 1;
constexpr uint16_t ARP_OPCODE_REQUEST = 1;
constexpr uint16_t ARP_OPCODE_REPLY = 2;

#if defined(__GNUC__) || defined(__clang__)
#pragma pack(push, 1)
#endif
struct EthernetHeader {
    MacAddress dst_mac;
    MacAddress src_mac;
    uint16_t ethertype;
    static constexpr std::size_t SIZE = sizeof(MacAddress) * 2 + sizeof(uint16_t);
};
#if defined(__GNUC__) || defined(__clang__)
#pragma pack(pop)
#endif

#if defined(__GNUC__) || defined(__clang__)
#pragma pack(push, 1)
#endif
struct VlanHeader {
    uint16_t tci;
    uint16_t ethertype;
    static constexpr std::size_t SIZE = sizeof(uint16_t) * 2;

    uint16_t get_vlan_id() const {
        return ntohs(tci) & 0x0FFF;
    }
    void set_vlan_id(uint16_t id) {
        tci = htons((ntohs(tci) & 0xF000) | (id & 0x0FFF));
    }
};
#if defined(__GNUC__) || defined(__clang__)
#pragma pack(pop)
#endif

// IPv4 address in network byte order.
using IpAddress = uint32_t;

#if defined(__GNUC__) || defined(__clang__)
#pragma pack(push, 1)
#endif
struct ArpHeader {
    uint16_t hardware_type;
    uint16_t protocol_type;
    uint8_t  hardware_addr_len;
    uint8_t  protocol_addr_len;
    uint16_t opcode;
    MacAddress sender_mac;
    IpAddress  sender_ip;
    MacAddress target_mac;
    IpAddress  target_ip;
    static constexpr std::size_t SIZE = 2 * sizeof(uint16_t) + 2 * sizeof(uint8_t) + sizeof(uint16_t) + 2 * sizeof(MacAddress) + 2 * sizeof(IpAddress);

    bool is_ipv4_over_ethernet() const {
        return ntohs(hardware_type) == ARP_HTYPE_ETHERNET &&
               ntohs(protocol_type) == ETHERTYPE_IPV4 &&
               hardware_addr_len == 6 && protocol_addr_len == 4;
    }
};
#if defined(__GNUC__) || defined(__clang__)
#pragma pack(pop)
#endif

// Read-only view over a captured Ethernet frame. Does not own the bytes.
class Packet {
public:
    Packet(const uint8_t* data, std::size_t length) : data_(data), length_(data ? length : 0) {}

    explicit Packet(const std::vector<uint8_t>& frame) : Packet(frame.data(), frame.size()) {}

    std::size_t length() const { return length_; }

    template <typename HeaderType>
    const HeaderType* get_header(std::size_t offset) const {
        if (!data_ || offset + sizeof(HeaderType) > length_) {
            return nullptr;
        }
        return reinterpret_cast<const HeaderType*>(data_ + offset);
    }

    const EthernetHeader* ethernet() const {
        return get_header<EthernetHeader>(0);
    }

    const VlanHeader* vlan() const {
        auto* eth = ethernet();
        if (eth && ntohs(eth->ethertype) == ETHERTYPE_VLAN) {
            return get_header<VlanHeader>(EthernetHeader::SIZE);
        }
        return nullptr;
    }

    bool has_vlan() const {
        auto* eth = ethernet();
        return eth && ntohs(eth->ethertype) == ETHERTYPE_VLAN;
    }

    std::optional<uint16_t> vlan_id() const {
        if (auto* vlan_hdr = vlan()) {
            return vlan_hdr->get_vlan_id();
        }
        return std::nullopt;
    }

    // Ethertype after skipping a single 802.1Q tag, if present.
    std::optional<uint16_t> effective_ethertype() const {
        auto* eth = ethernet();
        if (!eth) return std::nullopt;
        uint16_t ethertype = ntohs(eth->ethertype);
        if (ethertype == ETHERTYPE_VLAN) {
            auto* vlan_hdr = vlan();
            if (!vlan_hdr) return std::nullopt;
            ethertype = ntohs(vlan_hdr->ethertype);
        }
        return ethertype;
    }

    const ArpHeader* arp() const {
        auto ethertype = effective_ethertype();
        if (!ethertype || *ethertype != ETHERTYPE_ARP) {
            return nullptr;
        }
        std::size_t l2_size = has_vlan() ? EthernetHeader::SIZE + VlanHeader::SIZE : EthernetHeader::SIZE;
        return get_header<ArpHeader>(l2_size);
    }

    std::optional<MacAddress> src_mac() const {
        if (auto* eth = ethernet()) return eth->src_mac;
        return std::nullopt;
    }

private:
    const uint8_t* data_;
    std::size_t length_;
};

// Builds an untagged Ethernet/ARP frame. All addresses are taken as-is (IPs in network order).
std::vector<uint8_t> build_arp_frame(uint16_t opcode,
                                     const MacAddress& eth_src, const MacAddress& eth_dst,
                                     const MacAddress& sender_mac, IpAddress sender_ip,
                                     const MacAddress& target_mac, IpAddress target_ip);

} // namespace whohas

#endif // WHOHAS_PACKET_HPP
