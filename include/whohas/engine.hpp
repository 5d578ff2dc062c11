#ifndef WHOHAS_ENGINE_HPP
#define WHOHAS_ENGINE_HPP

#include "address_filter.hpp"
#include "frame_decoder.hpp"
#include "logger.hpp"
#include "resolver.hpp"
#include "transaction_store.hpp"

#include <cstddef>
#include <optional>
#include <utility> // For std::pair
#include <vector>

namespace whohas {

// Frame -> decode -> filter -> store pipeline, followed by enrichment of the
// transactions a batch touched. Single-threaded; owns none of its collaborators.
class Engine {
public:
    Engine(TransactionStore& store, const FilterLists& lists, Logger* logger = nullptr);
    // Detaches the resolver from the store, which usually outlives both.
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Optional. Also routes the store's rebinding events to the resolver.
    void set_resolver(Resolver* resolver);

    // Requests sent by this station (the ARP prober's own frames, seen again by
    // the capture handle) are dropped before filtering.
    void set_local_station(const MacAddress& mac, IpAddress ip);
    void clear_local_station() { local_station_.reset(); }

    bool ingest(const ArpRequestEvent& event);
    bool ingest_frame(const RawFrame& frame);

    // Returns the number of accepted requests.
    std::size_t ingest_batch(const std::vector<RawFrame>& frames);
    std::size_t ingest_all(FrameReader& reader);

    // Enriches the transactions touched since the previous call.
    std::size_t enrich_dirty();

    TransactionStore& store() { return store_; }
    const IngestCounters& counters() const { return counters_; }

private:
    TransactionStore& store_;
    const FilterLists& lists_;
    Resolver* resolver_ = nullptr;
    std::optional<std::pair<MacAddress, IpAddress>> local_station_;
    Logger* logger_;
    IngestCounters counters_;
};

} // namespace whohas

#endif // WHOHAS_ENGINE_HPP
