#ifndef WHOHAS_PCAP_PROBER_HPP
#define WHOHAS_PCAP_PROBER_HPP

#include "resolver.hpp" // For ArpProber
#include "packet.hpp"
#include "logger.hpp"

#include <pcap/pcap.h>

#include <chrono>
#include <optional>
#include <string>

namespace whohas {

// Sends a single ARP request with pcap_inject and waits a bounded time for the
// matching reply on a dedicated capture handle.
class PcapArpProber : public ArpProber {
public:
    explicit PcapArpProber(std::string interface, Logger* logger = nullptr);
    ~PcapArpProber() override;

    PcapArpProber(const PcapArpProber&) = delete;
    PcapArpProber& operator=(const PcapArpProber&) = delete;

    // Looks up the interface's link and IPv4 address and opens the handle.
    bool open();
    bool is_open() const { return handle_ != nullptr; }

    std::optional<MacAddress> probe(IpAddress target, std::chrono::milliseconds timeout) override;

    const MacAddress& local_mac() const { return local_mac_; }
    IpAddress local_ip() const { return local_ip_; }

private:
    std::string interface_;
    Logger* logger_;
    pcap_t* handle_ = nullptr;
    MacAddress local_mac_;
    IpAddress local_ip_ = 0;

    bool read_interface_addresses();
};

} // namespace whohas

#endif // WHOHAS_PCAP_PROBER_HPP
