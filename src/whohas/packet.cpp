#include "whohas/packet.hpp"

#include <cstring> // For std::memcpy

namespace whohas {

std::vector<uint8_t> build_arp_frame(uint16_t opcode,
                                     const MacAddress& eth_src, const MacAddress& eth_dst,
                                     const MacAddress& sender_mac, IpAddress sender_ip,
                                     const MacAddress& target_mac, IpAddress target_ip) {
    EthernetHeader eth_header_data;
    eth_header_data.dst_mac = eth_dst;
    eth_header_data.src_mac = eth_src;
    eth_header_data.ethertype = htons(ETHERTYPE_ARP);

    ArpHeader arp_header_data;
    arp_header_data.hardware_type = htons(ARP_HTYPE_ETHERNET);
    arp_header_data.protocol_type = htons(ETHERTYPE_IPV4);
    arp_header_data.hardware_addr_len = 6;
    arp_header_data.protocol_addr_len = 4;
    arp_header_data.opcode = htons(opcode);
    arp_header_data.sender_mac = sender_mac;
    arp_header_data.sender_ip = sender_ip;
    arp_header_data.target_mac = target_mac;
    arp_header_data.target_ip = target_ip;

    std::vector<uint8_t> frame(EthernetHeader::SIZE + ArpHeader::SIZE);
    std::memcpy(frame.data(), &eth_header_data, EthernetHeader::SIZE);
    std::memcpy(frame.data() + EthernetHeader::SIZE, &arp_header_data, ArpHeader::SIZE);
    return frame;
}

} // namespace whohas
