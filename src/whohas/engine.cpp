#include "whohas/engine.hpp"

namespace whohas {

Engine::Engine(TransactionStore& store, const FilterLists& lists, Logger* logger)
    : store_(store), lists_(lists), logger_(logger) {}

Engine::~Engine() {
    if (resolver_) {
        store_.set_rebinding_observer(nullptr);
    }
}

void Engine::set_resolver(Resolver* resolver) {
    resolver_ = resolver;
    if (resolver_) {
        resolver_->attach(store_);
    } else {
        store_.set_rebinding_observer(nullptr);
    }
}

void Engine::set_local_station(const MacAddress& mac, IpAddress ip) {
    local_station_ = std::make_pair(mac, ip);
}

bool Engine::ingest(const ArpRequestEvent& event) {
    counters_.requests_decoded++;
    if (local_station_ && event.sender_mac == local_station_->first && event.sender_ip == local_station_->second) {
        counters_.requests_own++;
        return false;
    }
    if (!lists_.accepts(event.sender_ip, event.target_ip)) {
        counters_.requests_filtered++;
        return false;
    }
    store_.record(event.sender_ip, event.sender_mac, event.target_ip, event.timestamp);
    counters_.requests_accepted++;
    return true;
}

bool Engine::ingest_frame(const RawFrame& frame) {
    counters_.frames_seen++;
    auto event = decode_arp_request(frame);
    if (!event) {
        return false;
    }
    return ingest(*event);
}

std::size_t Engine::ingest_batch(const std::vector<RawFrame>& frames) {
    std::size_t accepted = 0;
    for (const auto& frame : frames) {
        if (ingest_frame(frame)) {
            ++accepted;
        }
    }
    return accepted;
}

std::size_t Engine::ingest_all(FrameReader& reader) {
    std::size_t accepted = 0;
    RawFrame frame;
    while (reader.next(frame)) {
        if (ingest_frame(frame)) {
            ++accepted;
        }
    }
    if (logger_) logger_->log_ingest_stats(counters_);
    return accepted;
}

std::size_t Engine::enrich_dirty() {
    if (!resolver_) {
        store_.take_dirty();
        return 0;
    }
    return resolver_->enrich_dirty(store_);
}

} // namespace whohas
