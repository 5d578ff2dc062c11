#include "whohas/aggregate_db.hpp"
#include "whohas/utils.hpp"

#include <sqlite3.h>

#include <algorithm> // For std::min, std::max
#include <map>       // For std::map
#include <set>       // For std::set

namespace whohas {

namespace {

constexpr const char* SNAPSHOT_SOURCE_PREFIX = "snapshot:";

constexpr const char* SCHEMA_SQL = R"(
    CREATE TABLE IF NOT EXISTS db_version (
        version INTEGER NOT NULL
    );

    CREATE TABLE IF NOT EXISTS hosts (
        ip TEXT PRIMARY KEY NOT NULL,
        mac_address TEXT,
        mac_seen INTEGER,
        ptr_hostname TEXT,
        fwd_resolved_ip TEXT,
        probe_replied INTEGER
    );

    CREATE TABLE IF NOT EXISTS transactions (
        sender_ip TEXT NOT NULL,
        target_ip TEXT NOT NULL,
        count INTEGER NOT NULL,
        first_seen INTEGER NOT NULL,
        last_seen INTEGER NOT NULL,
        stale INTEGER NOT NULL DEFAULT 0,
        mitm_op INTEGER NOT NULL DEFAULT 0,
        PRIMARY KEY(sender_ip, target_ip)
    );

    CREATE TABLE IF NOT EXISTS contributions (
        sender_ip TEXT NOT NULL,
        target_ip TEXT NOT NULL,
        source TEXT NOT NULL,
        count INTEGER NOT NULL,
        first_seen INTEGER NOT NULL,
        last_seen INTEGER NOT NULL,
        PRIMARY KEY(sender_ip, target_ip, source),
        FOREIGN KEY(sender_ip, target_ip) REFERENCES transactions(sender_ip, target_ip) ON DELETE CASCADE
    );

    CREATE INDEX IF NOT EXISTS idx_contributions_source ON contributions(source);
)";

// Finalizes a prepared statement on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            stmt_ = nullptr;
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return stmt_ != nullptr; }
    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

void bind_text(sqlite3_stmt* stmt, int idx, const std::string& value) {
    sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bind_optional_time(sqlite3_stmt* stmt, int idx, const std::optional<Timestamp>& value) {
    if (value) {
        sqlite3_bind_int64(stmt, idx, utils::to_epoch_micros(*value));
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

std::optional<std::string> column_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    const unsigned char* text = sqlite3_column_text(stmt, col);
    if (!text) {
        return std::nullopt;
    }
    return std::string(reinterpret_cast<const char*>(text));
}

std::optional<Timestamp> column_time(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return utils::from_epoch_micros(sqlite3_column_int64(stmt, col));
}

// Reads the (sender_ip, target_ip) pair at columns 0 and 1.
std::optional<TransactionKey> column_key(sqlite3_stmt* stmt) {
    auto sender = column_text(stmt, 0);
    auto target = column_text(stmt, 1);
    if (!sender || !target) {
        return std::nullopt;
    }
    auto sender_ip = utils::parse_ipv4(*sender);
    auto target_ip = utils::parse_ipv4(*target);
    if (!sender_ip || !target_ip) {
        return std::nullopt;
    }
    return TransactionKey(*sender_ip, *target_ip);
}

} // namespace

AggregateDatabase::AggregateDatabase(Logger* logger) : logger_(logger) {}

AggregateDatabase::~AggregateDatabase() {
    close();
}

bool AggregateDatabase::open(const std::string& path, bool create) {
    close();

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX;
    if (create) {
        flags |= SQLITE_OPEN_CREATE;
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        if (logger_) {
            logger_->error("DB", "Failed to open database " + path + ": " +
                                 (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc)));
        }
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    path_ = path;

    sqlite3_busy_timeout(db_, 5000);
    if (!exec("PRAGMA foreign_keys = ON;") || !exec("PRAGMA journal_mode = WAL;") || !create_schema()) {
        close();
        return false;
    }

    if (logger_) logger_->debug("DB", "Opened database " + path);
    return true;
}

bool AggregateDatabase::open_read_only(const std::string& path) {
    close();

    int rc = sqlite3_open_v2(path.c_str(), &db_, SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        if (logger_) {
            logger_->error("DB", "Failed to open database " + path + ": " +
                                 (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc)));
        }
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    path_ = path;
    sqlite3_busy_timeout(db_, 5000);

    if (!has_table("hosts") || !has_table("transactions")) {
        if (logger_) logger_->error("DB", path + " is not a whohas database (missing hosts or transactions table).");
        close();
        return false;
    }

    if (logger_) logger_->debug("DB", "Opened database " + path + " read-only");
    return true;
}

void AggregateDatabase::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool AggregateDatabase::exec(const char* sql) const {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        if (logger_) {
            logger_->error("DB", std::string("SQL error: ") + (err_msg ? err_msg : sqlite3_errstr(rc)));
        }
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

bool AggregateDatabase::has_table(const char* name) const {
    Statement stmt(db_, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?;");
    if (!stmt.ok()) {
        report_error("Failed to query the schema");
        return false;
    }
    sqlite3_bind_text(stmt.get(), 1, name, -1, SQLITE_STATIC);
    return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

SourceId AggregateDatabase::snapshot_source() const {
    auto digest = utils::fnv1a64_file(path_);
    if (!digest) {
        return SNAPSHOT_SOURCE_PREFIX + path_;
    }
    return SNAPSHOT_SOURCE_PREFIX + utils::to_hex_string(*digest);
}

void AggregateDatabase::report_error(const std::string& what) const {
    if (logger_) {
        logger_->error("DB", what + ": " + sqlite3_errmsg(db_));
    }
}

bool AggregateDatabase::create_schema() {
    if (!exec(SCHEMA_SQL)) {
        return false;
    }
    if (schema_version() == 0) {
        Statement stmt(db_, "INSERT INTO db_version (version) VALUES (?);");
        if (!stmt.ok()) {
            report_error("Failed to prepare version insert");
            return false;
        }
        sqlite3_bind_int(stmt.get(), 1, SCHEMA_VERSION);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            report_error("Failed to record schema version");
            return false;
        }
    }
    return true;
}

int AggregateDatabase::schema_version() const {
    if (!db_) {
        return 0;
    }
    Statement stmt(db_, "SELECT version FROM db_version LIMIT 1;");
    if (!stmt.ok()) {
        return 0;
    }
    int version = 0;
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        version = sqlite3_column_int(stmt.get(), 0);
    }
    return version;
}

bool AggregateDatabase::load(TransactionStore& store) const {
    if (!db_) {
        if (logger_) logger_->error("DB", "load() called without an open database.");
        return false;
    }
    if (schema_version() > SCHEMA_VERSION) {
        if (logger_) {
            logger_->error("DB", path_ + " has schema version " + std::to_string(schema_version()) +
                                 ", newer than supported version " + std::to_string(SCHEMA_VERSION));
        }
        return false;
    }
    return load_hosts(store) && load_transactions(store);
}

bool AggregateDatabase::load_hosts(TransactionStore& store) const {
    Statement stmt(db_, "SELECT ip, mac_address, mac_seen, ptr_hostname, fwd_resolved_ip, probe_replied FROM hosts;");
    if (!stmt.ok()) {
        report_error("Failed to prepare host query");
        return false;
    }

    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        auto ip_text = column_text(stmt.get(), 0);
        std::optional<IpAddress> ip;
        if (ip_text) {
            ip = utils::parse_ipv4(*ip_text);
        }
        if (!ip) {
            if (logger_) logger_->warning("DB", "Skipping host row with invalid address.");
            continue;
        }
        Host& host = store.ensure_host(*ip);
        if (auto mac_text = column_text(stmt.get(), 1)) {
            MacAddress mac(*mac_text);
            if (!mac.is_zero()) {
                host.mac_address = mac;
                host.mac_seen = column_time(stmt.get(), 2);
            }
        }
        host.ptr_hostname = column_text(stmt.get(), 3);
        if (auto fwd_text = column_text(stmt.get(), 4)) {
            host.fwd_resolved_ip = utils::parse_ipv4(*fwd_text);
        }
        host.probe_replied = column_time(stmt.get(), 5);
    }
    if (rc != SQLITE_DONE) {
        report_error("Failed to read hosts");
        return false;
    }
    return true;
}

bool AggregateDatabase::load_transactions(TransactionStore& store) const {
    Statement stmt(db_, "SELECT sender_ip, target_ip, count, first_seen, last_seen, stale, mitm_op FROM transactions;");
    if (!stmt.ok()) {
        report_error("Failed to prepare transaction query");
        return false;
    }

    // Row totals, used when a transaction has no contribution rows.
    std::map<TransactionKey, Contribution> snapshots;

    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        auto key = column_key(stmt.get());
        if (!key) {
            if (logger_) logger_->warning("DB", "Skipping transaction row with invalid address.");
            continue;
        }
        int64_t count = sqlite3_column_int64(stmt.get(), 2);
        if (count <= 0) {
            continue;
        }
        Transaction& txn = store.ensure_transaction(*key);
        txn.stale = txn.stale || sqlite3_column_int(stmt.get(), 5) != 0;
        txn.mitm_op = txn.mitm_op || sqlite3_column_int(stmt.get(), 6) != 0;
        snapshots[*key] = Contribution{static_cast<uint64_t>(count),
                                       utils::from_epoch_micros(sqlite3_column_int64(stmt.get(), 3)),
                                       utils::from_epoch_micros(sqlite3_column_int64(stmt.get(), 4))};
    }
    if (rc != SQLITE_DONE) {
        report_error("Failed to read transactions");
        return false;
    }

    std::set<TransactionKey> contributed;
    if (has_table("contributions") && !load_contributions(store, snapshots, contributed)) {
        return false;
    }

    const SourceId snapshot = snapshots.size() > contributed.size() ? snapshot_source() : SourceId();
    for (const auto& pair : snapshots) {
        Transaction* txn = store.find(pair.first.sender, pair.first.target);
        if (contributed.find(pair.first) == contributed.end()) {
            txn->contributions.emplace(snapshot, pair.second);
        }
        txn->recompute_totals();
        store.mark_dirty(pair.first);
    }

    if (logger_) {
        logger_->info("DB", "Loaded " + std::to_string(snapshots.size()) + " transaction(s) from " + path_);
    }
    return true;
}

bool AggregateDatabase::load_contributions(TransactionStore& store,
                                           const std::map<TransactionKey, Contribution>& snapshots,
                                           std::set<TransactionKey>& contributed) const {
    Statement contrib_stmt(db_, "SELECT sender_ip, target_ip, source, count, first_seen, last_seen FROM contributions;");
    if (!contrib_stmt.ok()) {
        report_error("Failed to prepare contribution query");
        return false;
    }

    int rc;
    while ((rc = sqlite3_step(contrib_stmt.get())) == SQLITE_ROW) {
        auto key = column_key(contrib_stmt.get());
        auto source = column_text(contrib_stmt.get(), 2);
        int64_t count = sqlite3_column_int64(contrib_stmt.get(), 3);
        if (!key || !source || count <= 0 || snapshots.find(*key) == snapshots.end()) {
            continue;
        }
        Contribution contrib{static_cast<uint64_t>(count),
                             utils::from_epoch_micros(sqlite3_column_int64(contrib_stmt.get(), 4)),
                             utils::from_epoch_micros(sqlite3_column_int64(contrib_stmt.get(), 5))};
        Transaction* txn = store.find(key->sender, key->target);
        auto it = txn->contributions.find(*source);
        if (it == txn->contributions.end()) {
            txn->contributions.emplace(*source, contrib);
        } else {
            it->second.count = std::max(it->second.count, contrib.count);
            it->second.first_seen = std::min(it->second.first_seen, contrib.first_seen);
            it->second.last_seen = std::max(it->second.last_seen, contrib.last_seen);
        }
        contributed.insert(*key);
    }
    if (rc != SQLITE_DONE) {
        report_error("Failed to read contributions");
        return false;
    }
    return true;
}

bool AggregateDatabase::save(const TransactionStore& store) {
    if (!db_) {
        if (logger_) logger_->error("DB", "save() called without an open database.");
        return false;
    }
    if (!exec("BEGIN IMMEDIATE TRANSACTION;")) {
        return false;
    }
    bool ok = exec("DELETE FROM contributions;") &&
              exec("DELETE FROM transactions;") &&
              exec("DELETE FROM hosts;") &&
              save_hosts(store) &&
              save_transactions(store);
    if (!ok) {
        exec("ROLLBACK;");
        return false;
    }
    if (!exec("COMMIT;")) {
        exec("ROLLBACK;");
        return false;
    }
    if (logger_) {
        logger_->info("DB", "Saved " + std::to_string(store.size()) + " transaction(s) to " + path_);
    }
    return true;
}

bool AggregateDatabase::save_hosts(const TransactionStore& store) {
    Statement stmt(db_, "INSERT INTO hosts (ip, mac_address, mac_seen, ptr_hostname, fwd_resolved_ip, probe_replied) "
                        "VALUES (?, ?, ?, ?, ?, ?);");
    if (!stmt.ok()) {
        report_error("Failed to prepare host insert");
        return false;
    }

    for (const auto& pair : store.hosts()) {
        const Host& host = pair.second;
        sqlite3_reset(stmt.get());
        sqlite3_clear_bindings(stmt.get());

        bind_text(stmt.get(), 1, utils::ip_to_string(host.ip));
        if (host.mac_address) {
            bind_text(stmt.get(), 2, host.mac_address->to_string());
        } else {
            sqlite3_bind_null(stmt.get(), 2);
        }
        bind_optional_time(stmt.get(), 3, host.mac_seen);
        if (host.ptr_hostname) {
            bind_text(stmt.get(), 4, *host.ptr_hostname);
        } else {
            sqlite3_bind_null(stmt.get(), 4);
        }
        if (host.fwd_resolved_ip) {
            bind_text(stmt.get(), 5, utils::ip_to_string(*host.fwd_resolved_ip));
        } else {
            sqlite3_bind_null(stmt.get(), 5);
        }
        bind_optional_time(stmt.get(), 6, host.probe_replied);

        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            report_error("Failed to insert host " + utils::ip_to_string(host.ip));
            return false;
        }
    }
    return true;
}

bool AggregateDatabase::save_transactions(const TransactionStore& store) {
    Statement txn_stmt(db_, "INSERT INTO transactions (sender_ip, target_ip, count, first_seen, last_seen, stale, mitm_op) "
                            "VALUES (?, ?, ?, ?, ?, ?, ?);");
    Statement contrib_stmt(db_, "INSERT INTO contributions (sender_ip, target_ip, source, count, first_seen, last_seen) "
                                "VALUES (?, ?, ?, ?, ?, ?);");
    if (!txn_stmt.ok() || !contrib_stmt.ok()) {
        report_error("Failed to prepare transaction insert");
        return false;
    }

    for (const auto& pair : store.transactions()) {
        const Transaction& txn = pair.second;
        if (txn.count == 0) {
            continue;
        }
        const std::string sender = utils::ip_to_string(txn.sender_ip);
        const std::string target = utils::ip_to_string(txn.target_ip);

        sqlite3_reset(txn_stmt.get());
        bind_text(txn_stmt.get(), 1, sender);
        bind_text(txn_stmt.get(), 2, target);
        sqlite3_bind_int64(txn_stmt.get(), 3, static_cast<sqlite3_int64>(txn.count));
        sqlite3_bind_int64(txn_stmt.get(), 4, utils::to_epoch_micros(txn.first_seen));
        sqlite3_bind_int64(txn_stmt.get(), 5, utils::to_epoch_micros(txn.last_seen));
        sqlite3_bind_int(txn_stmt.get(), 6, txn.stale ? 1 : 0);
        sqlite3_bind_int(txn_stmt.get(), 7, txn.mitm_op ? 1 : 0);
        if (sqlite3_step(txn_stmt.get()) != SQLITE_DONE) {
            report_error("Failed to insert transaction " + sender + " -> " + target);
            return false;
        }

        for (const auto& contrib_pair : txn.contributions) {
            const Contribution& contrib = contrib_pair.second;
            sqlite3_reset(contrib_stmt.get());
            bind_text(contrib_stmt.get(), 1, sender);
            bind_text(contrib_stmt.get(), 2, target);
            bind_text(contrib_stmt.get(), 3, contrib_pair.first);
            sqlite3_bind_int64(contrib_stmt.get(), 4, static_cast<sqlite3_int64>(contrib.count));
            sqlite3_bind_int64(contrib_stmt.get(), 5, utils::to_epoch_micros(contrib.first_seen));
            sqlite3_bind_int64(contrib_stmt.get(), 6, utils::to_epoch_micros(contrib.last_seen));
            if (sqlite3_step(contrib_stmt.get()) != SQLITE_DONE) {
                report_error("Failed to insert contribution from " + contrib_pair.first);
                return false;
            }
        }
    }
    return true;
}

} // namespace whohas
