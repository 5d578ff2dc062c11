#include "whohas/resolver.hpp"

#include <utility>

namespace whohas {

StalePredicate make_repeat_threshold_predicate(uint64_t threshold) {
    return [threshold](const StaleInputs& inputs) {
        return inputs.outcome == ProbeOutcome::NO_REPLY && inputs.count >= threshold;
    };
}

Resolver::Resolver(NameResolver* names, ArpProber* prober, ResolverOptions options, Logger* logger)
    : names_(names),
      prober_(prober),
      options_(options),
      logger_(logger),
      stale_predicate_(make_repeat_threshold_predicate(options.stale_threshold)),
      clock_([]() { return std::chrono::system_clock::now(); }) {}

void Resolver::attach(TransactionStore& store) {
    TransactionStore* store_ptr = &store;
    store.set_rebinding_observer([this, store_ptr](const RebindingEvent& event) {
        on_rebinding(event, *store_ptr);
    });
}

void Resolver::on_rebinding(const RebindingEvent& event, TransactionStore& store) {
    rebindings_.push_back(event);
    if (logger_) {
        logger_->log_rebinding(event.ip, event.previous_mac, event.new_mac);
    }
    if (rebinding_handler_) {
        rebinding_handler_(event, store);
    }
}

std::optional<EnrichmentResult> Resolver::enrich(TransactionStore& store, const TransactionKey& key) {
    return enrich_with(store, key, nullptr);
}

std::size_t Resolver::enrich_all(TransactionStore& store, const std::vector<TransactionKey>& keys) {
    std::map<IpAddress, ProbeOutcome> probe_cache;
    std::size_t enriched = 0;
    for (const auto& key : keys) {
        if (enrich_with(store, key, &probe_cache)) {
            ++enriched;
        }
    }
    if (logger_ && enriched > 0) {
        logger_->debug("Resolver", "Enriched " + std::to_string(enriched) + " transaction(s).");
    }
    return enriched;
}

std::optional<EnrichmentResult> Resolver::enrich_with(TransactionStore& store, const TransactionKey& key,
                                                      std::map<IpAddress, ProbeOutcome>* probe_cache) {
    Transaction* txn = store.find(key.sender, key.target);
    if (!txn) {
        return std::nullopt;
    }
    Host& sender = store.ensure_host(key.sender);
    Host& target = store.ensure_host(key.target);

    EnrichmentResult result;
    result.sender_naming = check_naming(sender);
    result.target_naming = check_naming(target);

    // A failed reverse step is "unknown", never anomalous.
    txn->mitm_op = (result.target_naming == NamingConsistency::INCONSISTENT);
    result.mitm_op = txn->mitm_op;

    if (options_.arp_resolve && prober_) {
        ProbeOutcome outcome = ProbeOutcome::NOT_PROBED;
        bool cached = false;
        if (probe_cache) {
            auto it = probe_cache->find(key.target);
            if (it != probe_cache->end()) {
                outcome = it->second;
                cached = true;
            }
        }
        if (!cached) {
            outcome = probe_target(target);
            if (probe_cache) (*probe_cache)[key.target] = outcome;
        }
        result.probe = outcome;

        StaleInputs inputs;
        inputs.count = txn->count;
        inputs.outcome = outcome;
        if (target.probe_replied) {
            inputs.since_last_reply = clock_() - *target.probe_replied;
        }
        txn->stale = stale_predicate_ ? stale_predicate_(inputs) : false;
    }
    result.stale = txn->stale;

    if (logger_ && result.mitm_op) {
        logger_->info("Resolver", "Naming mismatch for target " + utils::ip_to_string(key.target) +
                                  " (PTR " + target.ptr_hostname.value_or("?") + ")");
    }
    return result;
}

NamingConsistency Resolver::check_naming(Host& host) {
    if (options_.reverse_resolve && names_) {
        if (!host.ptr_hostname) {
            host.ptr_hostname = names_->reverse_lookup(host.ip);
            if (logger_ && !host.ptr_hostname) {
                logger_->debug("Resolver", "No PTR record for " + utils::ip_to_string(host.ip));
            }
        }
        if (host.ptr_hostname && !host.fwd_resolved_ip) {
            host.fwd_resolved_ip = names_->forward_lookup(*host.ptr_hostname);
        }
    }
    return host.naming_consistency();
}

ProbeOutcome Resolver::probe_target(Host& target) {
    auto reply = prober_->probe(target.ip, options_.probe_timeout);
    if (!reply) {
        if (logger_) logger_->debug("Resolver", "No ARP reply from " + utils::ip_to_string(target.ip));
        return ProbeOutcome::NO_REPLY;
    }
    Timestamp now = clock_();
    target.mac_address = *reply;
    target.mac_seen = now;
    target.probe_replied = now;
    return ProbeOutcome::REPLIED;
}

} // namespace whohas
