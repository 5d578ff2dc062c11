#include "whohas/frame_decoder.hpp"

namespace whohas {

namespace {

std::optional<ArpRequestEvent> decode_arp(const uint8_t* data, std::size_t length,
                                          Timestamp timestamp, uint16_t wanted_opcode) {
    Packet packet(data, length);
    const ArpHeader* arp_header = packet.arp();
    if (!arp_header) {
        return std::nullopt;
    }
    if (!arp_header->is_ipv4_over_ethernet() || ntohs(arp_header->opcode) != wanted_opcode) {
        return std::nullopt;
    }

    ArpRequestEvent event;
    event.sender_ip = arp_header->sender_ip;
    event.sender_mac = arp_header->sender_mac;
    event.target_ip = arp_header->target_ip;
    event.timestamp = timestamp;
    return event;
}

} // namespace

std::optional<ArpRequestEvent> decode_arp_request(const uint8_t* data, std::size_t length, Timestamp timestamp) {
    return decode_arp(data, length, timestamp, ARP_OPCODE_REQUEST);
}

std::optional<ArpRequestEvent> decode_arp_reply(const uint8_t* data, std::size_t length, Timestamp timestamp) {
    return decode_arp(data, length, timestamp, ARP_OPCODE_REPLY);
}

} // namespace whohas
