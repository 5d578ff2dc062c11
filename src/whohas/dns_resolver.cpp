#include "whohas/dns_resolver.hpp"
#include "whohas/utils.hpp"

#include <algorithm> // For std::min
#include <cstring>
#include <arpa/nameser.h>

namespace whohas {

namespace {
constexpr int kAnswerBufferSize = 4096;
}

DnsNameResolver::DnsNameResolver(std::chrono::seconds timeout, int attempts, Logger* logger)
    : logger_(logger) {
    std::memset(&state_, 0, sizeof(state_));
    if (res_ninit(&state_) != 0) {
        if (logger_) logger_->error("DNS", "Failed to initialise the system resolver; name lookups disabled.");
        return;
    }
    state_.retrans = static_cast<int>(timeout.count() > 0 ? timeout.count() : 1);
    state_.retry = attempts > 0 ? attempts : 1;
    ready_ = true;
}

DnsNameResolver::~DnsNameResolver() {
    if (ready_) {
        res_nclose(&state_);
    }
}

std::string DnsNameResolver::reverse_name(IpAddress ip) {
    uint32_t host_order = ntohl(ip);
    return std::to_string(host_order & 0xFF) + "." +
           std::to_string((host_order >> 8) & 0xFF) + "." +
           std::to_string((host_order >> 16) & 0xFF) + "." +
           std::to_string((host_order >> 24) & 0xFF) + ".in-addr.arpa";
}

int DnsNameResolver::query(const std::string& name, int type, unsigned char* answer, int answer_len) {
    if (!ready_) {
        return -1;
    }
    int len = res_nquery(&state_, name.c_str(), ns_c_in, type, answer, answer_len);
    if (len < 0 && logger_) {
        logger_->debug("DNS", "Query failed for " + name);
    }
    return len;
}

std::optional<std::string> DnsNameResolver::parse_ptr_answer(const unsigned char* answer, int length) {
    ns_msg msg;
    if (length <= 0 || ns_initparse(answer, length, &msg) != 0) {
        return std::nullopt;
    }
    int count = ns_msg_count(msg, ns_s_an);
    for (int i = 0; i < count; ++i) {
        ns_rr rr;
        if (ns_parserr(&msg, ns_s_an, i, &rr) != 0) {
            continue;
        }
        if (ns_rr_type(rr) != ns_t_ptr) {
            continue;
        }
        char name[NS_MAXDNAME];
        if (ns_name_uncompress(ns_msg_base(msg), ns_msg_end(msg), ns_rr_rdata(rr), name, sizeof(name)) < 0) {
            continue;
        }
        return std::string(name);
    }
    return std::nullopt;
}

std::optional<IpAddress> DnsNameResolver::parse_a_answer(const unsigned char* answer, int length) {
    ns_msg msg;
    if (length <= 0 || ns_initparse(answer, length, &msg) != 0) {
        return std::nullopt;
    }
    int count = ns_msg_count(msg, ns_s_an);
    for (int i = 0; i < count; ++i) {
        ns_rr rr;
        if (ns_parserr(&msg, ns_s_an, i, &rr) != 0) {
            continue;
        }
        if (ns_rr_type(rr) == ns_t_a && ns_rr_rdlen(rr) == 4) {
            IpAddress ip;
            std::memcpy(&ip, ns_rr_rdata(rr), sizeof(ip)); // rdata is already in network order
            return ip;
        }
    }
    return std::nullopt;
}

std::optional<std::string> DnsNameResolver::reverse_lookup(IpAddress ip) {
    unsigned char answer[kAnswerBufferSize];
    int len = query(reverse_name(ip), ns_t_ptr, answer, sizeof(answer));
    if (len < 0) {
        return std::nullopt;
    }
    return parse_ptr_answer(answer, std::min(len, kAnswerBufferSize));
}

std::optional<IpAddress> DnsNameResolver::forward_lookup(const std::string& hostname) {
    unsigned char answer[kAnswerBufferSize];
    int len = query(hostname, ns_t_a, answer, sizeof(answer));
    if (len < 0) {
        return std::nullopt;
    }
    return parse_a_answer(answer, std::min(len, kAnswerBufferSize));
}

} // namespace whohas
