#include "whohas/pcap_prober.hpp"
#include "whohas/frame_decoder.hpp" // For decode_arp_reply
#include "whohas/pcap_io.hpp"       // For make_raw_frame

#include <cerrno>
#include <cstring> // For std::strncpy, std::memcpy, std::strerror
#include <vector>
#include <utility>

#include <net/if.h>
#include <netinet/in.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace whohas {

namespace {
constexpr int SNAPLEN = 128;
constexpr int READ_TIMEOUT_MS = 50;
constexpr const char* REPLY_FILTER = "arp and arp[6:2] = 2";
}

PcapArpProber::PcapArpProber(std::string interface, Logger* logger)
    : interface_(std::move(interface)), logger_(logger) {}

PcapArpProber::~PcapArpProber() {
    if (handle_) {
        pcap_close(handle_);
    }
}

bool PcapArpProber::read_interface_addresses() {
    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        if (logger_) logger_->error("Probe", std::string("socket() failed: ") + std::strerror(errno));
        return false;
    }

    struct ifreq ifr;
    std::memset(&ifr, 0, sizeof(ifr));
    std::strncpy(ifr.ifr_name, interface_.c_str(), IFNAMSIZ - 1);

    bool ok = true;
    if (ioctl(fd, SIOCGIFHWADDR, &ifr) == 0) {
        local_mac_ = MacAddress(reinterpret_cast<const uint8_t*>(ifr.ifr_hwaddr.sa_data));
    } else {
        if (logger_) logger_->error("Probe", "Unable to read link address of " + interface_ + ": " + std::strerror(errno));
        ok = false;
    }

    if (ok && ioctl(fd, SIOCGIFADDR, &ifr) == 0) {
        struct sockaddr_in addr;
        std::memcpy(&addr, &ifr.ifr_addr, sizeof(addr));
        local_ip_ = addr.sin_addr.s_addr;
    } else if (ok) {
        if (logger_) logger_->error("Probe", "Unable to read IPv4 address of " + interface_ + ": " + std::strerror(errno));
        ok = false;
    }

    ::close(fd);
    return ok;
}

bool PcapArpProber::open() {
    if (!read_interface_addresses()) {
        return false;
    }

    char errbuf[PCAP_ERRBUF_SIZE] = {0};
    handle_ = pcap_open_live(interface_.c_str(), SNAPLEN, 0, READ_TIMEOUT_MS, errbuf);
    if (!handle_) {
        if (logger_) logger_->error("Probe", "Unable to open " + interface_ + " for probing: " + errbuf);
        return false;
    }

    struct bpf_program program;
    bool filtered = pcap_compile(handle_, &program, REPLY_FILTER, 1, PCAP_NETMASK_UNKNOWN) != PCAP_ERROR;
    if (filtered) {
        filtered = pcap_setfilter(handle_, &program) != PCAP_ERROR;
        pcap_freecode(&program);
    }
    if (!filtered) {
        if (logger_) logger_->error("Probe", std::string("Unable to install reply filter: ") + pcap_geterr(handle_));
        pcap_close(handle_);
        handle_ = nullptr;
        return false;
    }

    if (logger_) {
        logger_->debug("Probe", "Probing from " + local_mac_.to_string() + " / " + logger_->ip_to_string(local_ip_));
    }
    return true;
}

std::optional<MacAddress> PcapArpProber::probe(IpAddress target, std::chrono::milliseconds timeout) {
    if (!handle_) {
        return std::nullopt;
    }

    std::vector<uint8_t> request = build_arp_frame(ARP_OPCODE_REQUEST,
                                                   local_mac_, MacAddress::broadcast(),
                                                   local_mac_, local_ip_,
                                                   MacAddress(), target);
    if (pcap_inject(handle_, request.data(), request.size()) == PCAP_ERROR) {
        if (logger_) logger_->warning("Probe", std::string("pcap_inject failed: ") + pcap_geterr(handle_));
        return std::nullopt;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        struct pcap_pkthdr* header = nullptr;
        const u_char* packet = nullptr;
        int rc = pcap_next_ex(handle_, &header, &packet);
        if (rc == 0) {
            continue; // Read timeout
        }
        if (rc < 0) {
            if (logger_) logger_->warning("Probe", std::string("Reading reply failed: ") + pcap_geterr(handle_));
            return std::nullopt;
        }
        RawFrame frame = make_raw_frame(header, packet);
        auto reply = decode_arp_reply(frame.data.data(), frame.data.size(), frame.timestamp);
        if (reply && reply->sender_ip == target) {
            return reply->sender_mac;
        }
    }
    return std::nullopt;
}

} // namespace whohas
