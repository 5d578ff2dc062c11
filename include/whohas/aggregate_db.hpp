#ifndef WHOHAS_AGGREGATE_DB_HPP
#define WHOHAS_AGGREGATE_DB_HPP

#include "logger.hpp"            // For Logger
#include "transaction_store.hpp" // For TransactionStore

#include <map>    // For std::map
#include <set>    // For std::set
#include <string> // For std::string

struct sqlite3;

namespace whohas {

// SQLite persistence for an aggregate: hosts, transactions and the per-source
// contributions behind every transaction count. Timestamps are stored as
// microseconds since the Unix epoch.
class AggregateDatabase {
public:
    static constexpr int SCHEMA_VERSION = 1;

    explicit AggregateDatabase(Logger* logger = nullptr);
    ~AggregateDatabase();

    AggregateDatabase(const AggregateDatabase&) = delete;
    AggregateDatabase& operator=(const AggregateDatabase&) = delete;

    // Opens (and, when `create` is set, creates) the database and ensures the schema.
    bool open(const std::string& path, bool create = true);
    // Opens an input database without modifying it: no schema changes and no
    // journal mode switch. Fails unless the file has the hosts and transactions tables.
    bool open_read_only(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }
    const std::string& path() const { return path_; }

    // Adds the persisted contents to `store`. Rows without contributions are
    // attributed to snapshot_source().
    bool load(TransactionStore& store) const;

    // "snapshot:<digest of the database file>", so that distinct databases
    // written without contributions stay distinct sources when merged.
    SourceId snapshot_source() const;

    // Replaces the persisted contents with `store` in one transaction.
    bool save(const TransactionStore& store);

    int schema_version() const;

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    Logger* logger_;

    bool exec(const char* sql) const;
    bool has_table(const char* name) const;
    bool create_schema();
    bool load_hosts(TransactionStore& store) const;
    bool load_transactions(TransactionStore& store) const;
    bool load_contributions(TransactionStore& store, const std::map<TransactionKey, Contribution>& snapshots,
                            std::set<TransactionKey>& contributed) const;
    bool save_hosts(const TransactionStore& store);
    bool save_transactions(const TransactionStore& store);
    void report_error(const std::string& what) const;
};

} // namespace whohas

#endif // WHOHAS_AGGREGATE_DB_HPP
