#include "whohas/transaction_store.hpp"

#include <algorithm> // For std::min, std::max
#include <utility>   // For std::move

namespace whohas {

void Transaction::recompute_totals() {
    count = 0;
    bool first = true;
    for (const auto& pair : contributions) {
        const Contribution& c = pair.second;
        count += c.count;
        if (first) {
            first_seen = c.first_seen;
            last_seen = c.last_seen;
            first = false;
        } else {
            first_seen = std::min(first_seen, c.first_seen);
            last_seen = std::max(last_seen, c.last_seen);
        }
    }
}

TransactionStore::TransactionStore(SourceId ingest_source, Logger* logger)
    : ingest_source_(std::move(ingest_source)), logger_(logger) {}

Transaction& TransactionStore::record(IpAddress sender_ip, const MacAddress& sender_mac,
                                      IpAddress target_ip, Timestamp timestamp) {
    Host& sender = ensure_host(sender_ip);
    ensure_host(target_ip);
    observe_sender_mac(sender, sender_mac, timestamp);

    TransactionKey key(sender_ip, target_ip);
    auto it = transactions_.find(key);
    bool created = (it == transactions_.end());
    if (created) {
        it = transactions_.emplace(key, Transaction(sender_ip, target_ip)).first;
    }
    Transaction& txn = it->second;

    auto contrib_it = txn.contributions.find(ingest_source_);
    if (contrib_it == txn.contributions.end()) {
        txn.contributions[ingest_source_] = Contribution{1, timestamp, timestamp};
    } else {
        Contribution& contrib = contrib_it->second;
        contrib.count += 1;
        contrib.first_seen = std::min(contrib.first_seen, timestamp);
        contrib.last_seen = std::max(contrib.last_seen, timestamp);
    }

    if (created || txn.count == 0) {
        txn.count = 1;
        txn.first_seen = timestamp;
        txn.last_seen = timestamp;
        if (logger_) logger_->log_new_transaction(sender_ip, target_ip);
    } else {
        txn.count += 1;
        txn.first_seen = std::min(txn.first_seen, timestamp);
        txn.last_seen = std::max(txn.last_seen, timestamp);
    }

    dirty_.insert(key);
    return txn;
}

void TransactionStore::observe_sender_mac(Host& sender, const MacAddress& mac, Timestamp timestamp) {
    if (sender.mac_address && *sender.mac_address != mac) {
        RebindingEvent event{sender.ip, *sender.mac_address, mac, timestamp};
        if (rebinding_observer_) {
            rebinding_observer_(event);
        }
    }
    // Replayed sources can arrive out of order; an older sighting never overrides a newer one.
    if (!sender.mac_seen || timestamp >= *sender.mac_seen) {
        sender.mac_address = mac;
        sender.mac_seen = timestamp;
    }
}

Transaction* TransactionStore::find(IpAddress sender_ip, IpAddress target_ip) {
    auto it = transactions_.find(TransactionKey(sender_ip, target_ip));
    return it != transactions_.end() ? &it->second : nullptr;
}

const Transaction* TransactionStore::find(IpAddress sender_ip, IpAddress target_ip) const {
    auto it = transactions_.find(TransactionKey(sender_ip, target_ip));
    return it != transactions_.end() ? &it->second : nullptr;
}

Host* TransactionStore::host(IpAddress ip) {
    auto it = hosts_.find(ip);
    return it != hosts_.end() ? &it->second : nullptr;
}

const Host* TransactionStore::host(IpAddress ip) const {
    auto it = hosts_.find(ip);
    return it != hosts_.end() ? &it->second : nullptr;
}

Host& TransactionStore::ensure_host(IpAddress ip) {
    auto it = hosts_.find(ip);
    if (it == hosts_.end()) {
        it = hosts_.emplace(ip, Host(ip)).first;
    }
    return it->second;
}

Transaction& TransactionStore::ensure_transaction(const TransactionKey& key) {
    ensure_host(key.sender);
    ensure_host(key.target);
    auto it = transactions_.find(key);
    if (it == transactions_.end()) {
        it = transactions_.emplace(key, Transaction(key.sender, key.target)).first;
    }
    return it->second;
}

std::vector<TransactionKey> TransactionStore::take_dirty() {
    std::vector<TransactionKey> keys(dirty_.begin(), dirty_.end());
    dirty_.clear();
    return keys;
}

void TransactionStore::reset() {
    hosts_.clear();
    transactions_.clear();
    dirty_.clear();
    if (logger_) logger_->info("STORE", "Transaction store reset.");
}

} // namespace whohas
