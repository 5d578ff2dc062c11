#include "whohas/aggregator.hpp"
#include "whohas/aggregate_db.hpp"
#include "whohas/engine.hpp"
#include "whohas/utils.hpp"

#include <algorithm>

namespace whohas {

MergeStats Merger::merge(const TransactionStore& source, TransactionStore& destination,
                         const FilterLists* lists) const {
    MergeStats stats;

    for (const auto& pair : source.transactions()) {
        const Transaction& src = pair.second;
        if (lists && !lists->accepts(src.sender_ip, src.target_ip)) {
            stats.transactions_skipped++;
            continue;
        }

        bool existed = destination.find(src.sender_ip, src.target_ip) != nullptr;
        Transaction& dst = destination.ensure_transaction(pair.first);
        existed ? stats.transactions_updated++ : stats.transactions_created++;

        for (const auto& contrib_pair : src.contributions) {
            const Contribution& incoming = contrib_pair.second;
            auto it = dst.contributions.find(contrib_pair.first);
            if (it == dst.contributions.end()) {
                dst.contributions.emplace(contrib_pair.first, incoming);
                stats.contributions_added++;
            } else {
                Contribution& held = it->second;
                held.count = std::max(held.count, incoming.count);
                held.first_seen = std::min(held.first_seen, incoming.first_seen);
                held.last_seen = std::max(held.last_seen, incoming.last_seen);
            }
        }
        dst.recompute_totals();
        dst.stale = dst.stale || src.stale;
        dst.mitm_op = dst.mitm_op || src.mitm_op;
        destination.mark_dirty(pair.first);

        if (const Host* src_sender = source.host(src.sender_ip)) {
            merge_host(*src_sender, destination.ensure_host(src.sender_ip));
        }
        if (const Host* src_target = source.host(src.target_ip)) {
            merge_host(*src_target, destination.ensure_host(src.target_ip));
        }
    }

    if (logger_) {
        logger_->debug("Merger", "Merged " + std::to_string(stats.transactions_created) + " new and " +
                                 std::to_string(stats.transactions_updated) + " existing transaction(s), " +
                                 std::to_string(stats.contributions_added) + " new contribution(s).");
    }
    return stats;
}

void Merger::merge_host(const Host& source, Host& destination) {
    // Most recent link-address sighting wins.
    if (source.mac_address) {
        bool take = !destination.mac_address ||
                    (source.mac_seen && (!destination.mac_seen || *source.mac_seen > *destination.mac_seen));
        if (take) {
            destination.mac_address = source.mac_address;
            destination.mac_seen = source.mac_seen;
        }
    }
    if (!destination.ptr_hostname && source.ptr_hostname) {
        destination.ptr_hostname = source.ptr_hostname;
        destination.fwd_resolved_ip = source.fwd_resolved_ip;
    } else if (destination.ptr_hostname && source.ptr_hostname &&
               *destination.ptr_hostname == *source.ptr_hostname &&
               !destination.fwd_resolved_ip && source.fwd_resolved_ip) {
        destination.fwd_resolved_ip = source.fwd_resolved_ip;
    }
    if (source.probe_replied && (!destination.probe_replied || *source.probe_replied > *destination.probe_replied)) {
        destination.probe_replied = source.probe_replied;
    }
}

std::optional<SourceId> capture_file_source_id(const std::string& path) {
    auto digest = utils::fnv1a64_file(path);
    if (!digest) {
        return std::nullopt;
    }
    return "pcap:" + utils::to_hex_string(*digest);
}

Aggregator::Aggregator(TransactionStore& destination, const FilterLists& lists, Logger* logger)
    : destination_(destination), lists_(lists), logger_(logger), merger_(logger) {}

std::size_t Aggregator::add_capture(const SourceId& source, FrameReader& reader) {
    TransactionStore scratch(source, logger_);
    Engine engine(scratch, lists_, logger_);
    std::size_t accepted = engine.ingest_all(reader);
    merger_.merge(scratch, destination_);
    inputs_merged_++;
    if (logger_) {
        logger_->info("Aggregator", "Merged " + std::to_string(accepted) + " request(s) from " + source);
    }
    return accepted;
}

bool Aggregator::add_database(const std::string& path) {
    AggregateDatabase database(logger_);
    if (!database.open_read_only(path)) {
        return false;
    }
    TransactionStore scratch("db", logger_);
    if (!database.load(scratch)) {
        return false;
    }
    merger_.merge(scratch, destination_, &lists_);
    inputs_merged_++;
    if (logger_) {
        logger_->info("Aggregator", "Merged " + std::to_string(scratch.size()) + " transaction(s) from " + path);
    }
    return true;
}

MergeStats Aggregator::add_store(const TransactionStore& store) {
    inputs_merged_++;
    return merger_.merge(store, destination_, &lists_);
}

} // namespace whohas
