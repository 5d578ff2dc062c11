#ifndef WHOHAS_TRANSACTION_STORE_HPP
#define WHOHAS_TRANSACTION_STORE_HPP

#include "packet.hpp" // For MacAddress, IpAddress
#include "logger.hpp" // For Logger
#include "utils.hpp"  // For Timestamp, IpOrder

#include <cstdint>    // For uint64_t
#include <map>        // For std::map
#include <set>        // For std::set
#include <string>     // For std::string
#include <vector>     // For std::vector
#include <optional>   // For std::optional
#include <functional> // For std::function
#include <utility>    // For std::move
#include <cstddef>    // For std::size_t

namespace whohas {

// Names one independent event stream (a capture file, a live session).
using SourceId = std::string;

enum class NamingConsistency {
    UNKNOWN,      // No PTR record obtained
    CONSISTENT,   // PTR name resolves back to the address
    INCONSISTENT  // PTR name does not resolve, or resolves elsewhere
};

struct Host {
    IpAddress ip = 0;
    std::optional<MacAddress> mac_address;
    std::optional<Timestamp> mac_seen;
    std::optional<std::string> ptr_hostname;
    std::optional<IpAddress> fwd_resolved_ip;
    std::optional<Timestamp> probe_replied;

    Host() = default;
    explicit Host(IpAddress addr) : ip(addr) {}

    NamingConsistency naming_consistency() const {
        if (!ptr_hostname) {
            return NamingConsistency::UNKNOWN;
        }
        if (!fwd_resolved_ip || *fwd_resolved_ip != ip) {
            return NamingConsistency::INCONSISTENT;
        }
        return NamingConsistency::CONSISTENT;
    }
};

struct TransactionKey {
    IpAddress sender = 0;
    IpAddress target = 0;

    TransactionKey() = default;
    TransactionKey(IpAddress s, IpAddress t) : sender(s), target(t) {}

    bool operator<(const TransactionKey& other) const {
        if (sender != other.sender) {
            return utils::ip_less(sender, other.sender);
        }
        return utils::ip_less(target, other.target);
    }

    bool operator==(const TransactionKey& other) const {
        return sender == other.sender && target == other.target;
    }
};

// Events one source contributed to a transaction.
struct Contribution {
    uint64_t count = 0;
    Timestamp first_seen;
    Timestamp last_seen;
};

struct Transaction {
    IpAddress sender_ip = 0;
    IpAddress target_ip = 0;
    uint64_t count = 0;
    Timestamp first_seen;
    Timestamp last_seen;
    bool stale = false;
    bool mitm_op = false;
    std::map<SourceId, Contribution> contributions;

    Transaction() = default;
    Transaction(IpAddress sender, IpAddress target) : sender_ip(sender), target_ip(target) {}

    TransactionKey key() const { return TransactionKey(sender_ip, target_ip); }

    // Rebuilds count, first_seen and last_seen from the contributions.
    void recompute_totals();
};

struct RebindingEvent {
    IpAddress ip = 0;
    MacAddress previous_mac;
    MacAddress new_mac;
    Timestamp timestamp;
};

class TransactionStore {
public:
    using HostMap = std::map<IpAddress, Host, utils::IpOrder>;
    using TransactionMap = std::map<TransactionKey, Transaction>;
    using RebindingObserver = std::function<void(const RebindingEvent&)>;

    explicit TransactionStore(SourceId ingest_source = "local", Logger* logger = nullptr);

    void set_logger(Logger* logger) { logger_ = logger; }
    void set_ingest_source(const SourceId& source) { ingest_source_ = source; }
    const SourceId& ingest_source() const { return ingest_source_; }

    // Called before the stored sender link address is replaced by a different one.
    void set_rebinding_observer(RebindingObserver observer) { rebinding_observer_ = std::move(observer); }

    // Accounts one accepted request to the current ingest source.
    Transaction& record(IpAddress sender_ip, const MacAddress& sender_mac,
                        IpAddress target_ip, Timestamp timestamp);

    Transaction* find(IpAddress sender_ip, IpAddress target_ip);
    const Transaction* find(IpAddress sender_ip, IpAddress target_ip) const;

    Host* host(IpAddress ip);
    const Host* host(IpAddress ip) const;
    Host& ensure_host(IpAddress ip);

    // Finds or creates an empty transaction (and both hosts) for `key`.
    Transaction& ensure_transaction(const TransactionKey& key);

    const TransactionMap& transactions() const { return transactions_; }
    const HostMap& hosts() const { return hosts_; }

    void mark_dirty(const TransactionKey& key) { dirty_.insert(key); }
    bool has_dirty() const { return !dirty_.empty(); }
    // Returns and clears the keys touched since the previous call.
    std::vector<TransactionKey> take_dirty();

    void reset();
    std::size_t size() const { return transactions_.size(); }
    bool empty() const { return transactions_.empty(); }

private:
    HostMap hosts_;
    TransactionMap transactions_;
    std::set<TransactionKey> dirty_;
    SourceId ingest_source_;
    RebindingObserver rebinding_observer_;
    Logger* logger_;

    void observe_sender_mac(Host& sender, const MacAddress& mac, Timestamp timestamp);
};

} // namespace whohas

#endif // WHOHAS_TRANSACTION_STORE_HPP
