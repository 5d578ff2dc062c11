#ifndef WHOHAS_DNS_RESOLVER_HPP
#define WHOHAS_DNS_RESOLVER_HPP

#include "resolver.hpp" // For NameResolver
#include "logger.hpp"

#include <chrono>
#include <optional>
#include <string>

#include <netinet/in.h>
#include <resolv.h>

namespace whohas {

// NameResolver backed by the system stub resolver (libresolv). Each query is
// bounded by `timeout` per attempt, `attempts` times per configured server.
class DnsNameResolver : public NameResolver {
public:
    explicit DnsNameResolver(std::chrono::seconds timeout = std::chrono::seconds(2),
                             int attempts = 1, Logger* logger = nullptr);
    ~DnsNameResolver() override;

    DnsNameResolver(const DnsNameResolver&) = delete;
    DnsNameResolver& operator=(const DnsNameResolver&) = delete;

    bool is_ready() const { return ready_; }

    std::optional<std::string> reverse_lookup(IpAddress ip) override;
    std::optional<IpAddress> forward_lookup(const std::string& hostname) override;

    // "10.0.0.9" -> "9.0.0.10.in-addr.arpa"
    static std::string reverse_name(IpAddress ip);

    // First PTR target (resp. first 4-byte A record) in the answer section of a
    // raw DNS response. Other record types, such as a leading CNAME, are skipped.
    static std::optional<std::string> parse_ptr_answer(const unsigned char* answer, int length);
    static std::optional<IpAddress> parse_a_answer(const unsigned char* answer, int length);

private:
    struct __res_state state_;
    bool ready_ = false;
    Logger* logger_;

    int query(const std::string& name, int type, unsigned char* answer, int answer_len);
};

} // namespace whohas

#endif // WHOHAS_DNS_RESOLVER_HPP
