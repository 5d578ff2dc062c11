#ifndef WHOHAS_RESOLVER_HPP
#define WHOHAS_RESOLVER_HPP

#include "transaction_store.hpp"
#include "packet.hpp"
#include "logger.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace whohas {

// Naming-system transport. Both calls are bounded in time and return
// std::nullopt on timeout or lookup failure.
class NameResolver {
public:
    virtual ~NameResolver() = default;
    virtual std::optional<std::string> reverse_lookup(IpAddress ip) = 0;
    virtual std::optional<IpAddress> forward_lookup(const std::string& hostname) = 0;
};

// Active link-layer probe. Returns the replying link address, or std::nullopt
// when nothing answered within `timeout`.
class ArpProber {
public:
    virtual ~ArpProber() = default;
    virtual std::optional<MacAddress> probe(IpAddress target, std::chrono::milliseconds timeout) = 0;
};

enum class ProbeOutcome {
    NOT_PROBED,
    REPLIED,
    NO_REPLY
};

struct StaleInputs {
    uint64_t count = 0;
    // Time since the target last answered a probe; empty if it never has.
    std::optional<std::chrono::system_clock::duration> since_last_reply;
    ProbeOutcome outcome = ProbeOutcome::NOT_PROBED;
};

using StalePredicate = std::function<bool(const StaleInputs&)>;

// Default predicate: the probe went unanswered and the sender asked at least `threshold` times.
StalePredicate make_repeat_threshold_predicate(uint64_t threshold);

struct ResolverOptions {
    bool reverse_resolve = false;
    bool arp_resolve = false;
    uint64_t stale_threshold = 3;
    std::chrono::milliseconds probe_timeout{1000};
};

struct EnrichmentResult {
    NamingConsistency sender_naming = NamingConsistency::UNKNOWN;
    NamingConsistency target_naming = NamingConsistency::UNKNOWN;
    ProbeOutcome probe = ProbeOutcome::NOT_PROBED;
    bool mitm_op = false;
    bool stale = false;
};

class Resolver {
public:
    using Clock = std::function<Timestamp()>;
    using RebindingHandler = std::function<void(const RebindingEvent&, TransactionStore&)>;

    // `names` and `prober` may be null; the corresponding steps are then skipped.
    Resolver(NameResolver* names, ArpProber* prober, ResolverOptions options, Logger* logger = nullptr);

    void set_stale_predicate(StalePredicate predicate) { stale_predicate_ = std::move(predicate); }
    void set_clock(Clock clock) { clock_ = std::move(clock); }
    void set_rebinding_handler(RebindingHandler handler) { rebinding_handler_ = std::move(handler); }

    const ResolverOptions& options() const { return options_; }

    // Routes the store's rebinding events to this resolver.
    void attach(TransactionStore& store);

    void on_rebinding(const RebindingEvent& event, TransactionStore& store);
    const std::vector<RebindingEvent>& rebindings() const { return rebindings_; }

    // Idempotent. Returns std::nullopt when the key is unknown to the store.
    std::optional<EnrichmentResult> enrich(TransactionStore& store, const TransactionKey& key);

    // Enriches `keys`, probing each distinct target at most once. Returns the number enriched.
    std::size_t enrich_all(TransactionStore& store, const std::vector<TransactionKey>& keys);

    std::size_t enrich_dirty(TransactionStore& store) {
        return enrich_all(store, store.take_dirty());
    }

private:
    NameResolver* names_;
    ArpProber* prober_;
    ResolverOptions options_;
    Logger* logger_;
    StalePredicate stale_predicate_;
    Clock clock_;
    RebindingHandler rebinding_handler_;
    std::vector<RebindingEvent> rebindings_;

    NamingConsistency check_naming(Host& host);
    ProbeOutcome probe_target(Host& target);
    std::optional<EnrichmentResult> enrich_with(TransactionStore& store, const TransactionKey& key,
                                                std::map<IpAddress, ProbeOutcome>* probe_cache);
};

} // namespace whohas

#endif // WHOHAS_RESOLVER_HPP
