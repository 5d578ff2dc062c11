#ifndef WHOHAS_AGGREGATOR_HPP
#define WHOHAS_AGGREGATOR_HPP

#include "address_filter.hpp"
#include "frame_decoder.hpp"
#include "logger.hpp"
#include "transaction_store.hpp"

#include <cstddef>
#include <string>

namespace whohas {

struct MergeStats {
    std::size_t transactions_created = 0;
    std::size_t transactions_updated = 0;
    std::size_t contributions_added = 0;
    std::size_t transactions_skipped = 0; // Rejected by the filter lists
};

// Folds one store into another. Per transaction, contributions are joined by
// source id (max count, min first_seen, max last_seen), so merging is
// idempotent, and commutative/associative for disjoint sources.
class Merger {
public:
    explicit Merger(Logger* logger = nullptr) : logger_(logger) {}

    MergeStats merge(const TransactionStore& source, TransactionStore& destination,
                     const FilterLists* lists = nullptr) const;

private:
    Logger* logger_;

    static void merge_host(const Host& source, Host& destination);
};

// Source id of a replayed capture file, derived from its content so the same
// capture is recognised under any file name.
std::optional<SourceId> capture_file_source_id(const std::string& path);

// Batch driver: each input is ingested into a scratch store, then merged into
// the destination.
class Aggregator {
public:
    Aggregator(TransactionStore& destination, const FilterLists& lists, Logger* logger = nullptr);

    // Decodes, filters and merges every frame from `reader` under `source`.
    // Returns the number of accepted requests.
    std::size_t add_capture(const SourceId& source, FrameReader& reader);

    // Merges a previously persisted aggregate. False if the database cannot be read.
    bool add_database(const std::string& path);

    MergeStats add_store(const TransactionStore& store);

    std::size_t inputs_merged() const { return inputs_merged_; }

private:
    TransactionStore& destination_;
    const FilterLists& lists_;
    Logger* logger_;
    Merger merger_;
    std::size_t inputs_merged_ = 0;
};

} // namespace whohas

#endif // WHOHAS_AGGREGATOR_HPP
