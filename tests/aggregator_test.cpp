#include "gtest/gtest.h"
#include "whohas/aggregator.hpp"
#include "whohas/aggregate_db.hpp"
#include "whohas/packet.hpp"
#include "whohas/utils.hpp"

#include <sqlite3.h>

#include <cstdio> // For std::remove
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace {

whohas::IpAddress ip(const char* text) {
    return *whohas::utils::parse_ipv4(text);
}

whohas::Timestamp at(int64_t seconds) {
    return whohas::utils::from_epoch_micros(seconds * 1000000LL);
}

const whohas::MacAddress MAC_1{0x00, 0x00, 0x00, 0x00, 0x00, 0x01};
const whohas::MacAddress MAC_2{0x00, 0x00, 0x00, 0x00, 0x00, 0x02};

// Builds a database the way an older tool version wrote it: hosts and
// transactions only, no per-source contributions.
void write_legacy_database(const std::string& path, const std::string& rows) {
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
    std::string sql =
        "CREATE TABLE hosts (ip TEXT PRIMARY KEY NOT NULL, mac_address TEXT, mac_seen INTEGER, "
        "ptr_hostname TEXT, fwd_resolved_ip TEXT, probe_replied INTEGER);"
        "CREATE TABLE transactions (sender_ip TEXT NOT NULL, target_ip TEXT NOT NULL, count INTEGER NOT NULL, "
        "first_seen INTEGER NOT NULL, last_seen INTEGER NOT NULL, stale INTEGER NOT NULL DEFAULT 0, "
        "mitm_op INTEGER NOT NULL DEFAULT 0, PRIMARY KEY(sender_ip, target_ip));" + rows;
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    std::string message = err ? err : "";
    sqlite3_free(err);
    sqlite3_close(db);
    ASSERT_EQ(rc, SQLITE_OK) << message;
}

using Totals = std::map<std::pair<whohas::IpAddress, whohas::IpAddress>, std::tuple<uint64_t, int64_t, int64_t>>;

Totals totals_of(const whohas::TransactionStore& store) {
    Totals totals;
    for (const auto& pair : store.transactions()) {
        const whohas::Transaction& txn = pair.second;
        totals[{txn.sender_ip, txn.target_ip}] = std::make_tuple(
            txn.count, whohas::utils::to_epoch_micros(txn.first_seen), whohas::utils::to_epoch_micros(txn.last_seen));
    }
    return totals;
}

class VectorFrameReader : public whohas::FrameReader {
public:
    explicit VectorFrameReader(std::vector<whohas::RawFrame> frames) : frames_(std::move(frames)) {}

    bool next(whohas::RawFrame& frame) override {
        if (index_ >= frames_.size()) {
            return false;
        }
        frame = frames_[index_++];
        return true;
    }

private:
    std::vector<whohas::RawFrame> frames_;
    std::size_t index_ = 0;
};

whohas::RawFrame request_frame(const char* sender, const char* target, int64_t second) {
    whohas::RawFrame frame;
    frame.timestamp = at(second);
    frame.data = whohas::build_arp_frame(whohas::ARP_OPCODE_REQUEST, MAC_1, whohas::MacAddress::broadcast(),
                                         MAC_1, ip(sender), whohas::MacAddress(), ip(target));
    frame.original_length = static_cast<uint32_t>(frame.data.size());
    return frame;
}

} // namespace

class AggregatorTest : public ::testing::Test {
protected:
    std::ostringstream log_sink;
    whohas::Logger logger{whohas::LogLevel::DEBUG};
    whohas::Merger merger{&logger};

    whohas::TransactionStore a{"pcap:a"};
    whohas::TransactionStore b{"pcap:b"};
    whohas::TransactionStore c{"pcap:c"};

    void SetUp() override {
        logger.set_output(&log_sink);

        a.record(ip("10.0.0.1"), MAC_1, ip("10.0.0.2"), at(10));
        a.record(ip("10.0.0.1"), MAC_1, ip("10.0.0.2"), at(20));
        a.record(ip("10.0.0.3"), MAC_2, ip("10.0.0.2"), at(15));

        b.record(ip("10.0.0.1"), MAC_1, ip("10.0.0.2"), at(5));
        b.record(ip("10.0.0.4"), MAC_2, ip("10.0.0.1"), at(40));

        c.record(ip("10.0.0.1"), MAC_1, ip("10.0.0.2"), at(30));
        c.record(ip("10.0.0.1"), MAC_1, ip("10.0.0.2"), at(31));
        c.record(ip("10.0.0.1"), MAC_1, ip("10.0.0.2"), at(32));
    }
};

TEST_F(AggregatorTest, MergeSumsDisjointSources) {
    whohas::TransactionStore out("local");
    merger.merge(a, out);
    merger.merge(b, out);
    merger.merge(c, out);

    const whohas::Transaction* txn = out.find(ip("10.0.0.1"), ip("10.0.0.2"));
    ASSERT_NE(txn, nullptr);
    EXPECT_EQ(txn->count, 6u);
    EXPECT_EQ(txn->first_seen, at(5));
    EXPECT_EQ(txn->last_seen, at(32));
    EXPECT_EQ(txn->contributions.size(), 3u);
    EXPECT_EQ(out.size(), 3u);
}

TEST_F(AggregatorTest, MergeOrderDoesNotMatter) {
    whohas::TransactionStore abc("local");
    merger.merge(a, abc);
    merger.merge(b, abc);
    merger.merge(c, abc);

    whohas::TransactionStore cab("local");
    merger.merge(c, cab);
    merger.merge(a, cab);
    merger.merge(b, cab);

    // (a + b) + c versus a + (b + c)
    whohas::TransactionStore ab("local");
    merger.merge(a, ab);
    merger.merge(b, ab);
    whohas::TransactionStore left("local");
    merger.merge(ab, left);
    merger.merge(c, left);

    whohas::TransactionStore bc("local");
    merger.merge(b, bc);
    merger.merge(c, bc);
    whohas::TransactionStore right("local");
    merger.merge(a, right);
    merger.merge(bc, right);

    EXPECT_EQ(totals_of(abc), totals_of(cab));
    EXPECT_EQ(totals_of(left), totals_of(right));
    EXPECT_EQ(totals_of(abc), totals_of(left));
}

TEST_F(AggregatorTest, RemergingIsIdempotent) {
    whohas::TransactionStore out("local");
    merger.merge(a, out);
    merger.merge(b, out);
    Totals once = totals_of(out);

    whohas::MergeStats stats = merger.merge(a, out);
    merger.merge(b, out);
    EXPECT_EQ(totals_of(out), once);
    EXPECT_EQ(stats.transactions_created, 0u);
    EXPECT_EQ(stats.contributions_added, 0u);
    EXPECT_EQ(stats.transactions_updated, 2u);
}

TEST_F(AggregatorTest, OverlappingSourceKeepsLargerView) {
    // A later replay of the same source saw more of it.
    whohas::TransactionStore more("pcap:a");
    for (int i = 0; i < 4; ++i) {
        more.record(ip("10.0.0.1"), MAC_1, ip("10.0.0.2"), at(8 + i * 10));
    }

    whohas::TransactionStore out("local");
    merger.merge(a, out);
    merger.merge(more, out);
    const whohas::Transaction* txn = out.find(ip("10.0.0.1"), ip("10.0.0.2"));
    ASSERT_NE(txn, nullptr);
    EXPECT_EQ(txn->count, 4u);
    EXPECT_EQ(txn->first_seen, at(8));
    EXPECT_EQ(txn->last_seen, at(38));
}

TEST_F(AggregatorTest, HostKeepsMostRecentMac) {
    whohas::TransactionStore early("pcap:early");
    early.record(ip("10.0.0.1"), MAC_1, ip("10.0.0.2"), at(10));
    whohas::TransactionStore late("pcap:late");
    late.record(ip("10.0.0.1"), MAC_2, ip("10.0.0.2"), at(90));

    whohas::TransactionStore forward("local");
    merger.merge(early, forward);
    merger.merge(late, forward);
    whohas::TransactionStore backward("local");
    merger.merge(late, backward);
    merger.merge(early, backward);

    EXPECT_EQ(forward.host(ip("10.0.0.1"))->mac_address, MAC_2);
    EXPECT_EQ(backward.host(ip("10.0.0.1"))->mac_address, MAC_2);
}

TEST_F(AggregatorTest, HostNamesFillGapsAndFlagsAreKept) {
    whohas::TransactionStore named("pcap:named");
    whohas::Transaction& txn = named.record(ip("10.0.0.1"), MAC_1, ip("10.0.0.2"), at(10));
    txn.mitm_op = true;
    whohas::Host& target = named.ensure_host(ip("10.0.0.2"));
    target.ptr_hostname = "printer.local";
    target.fwd_resolved_ip = ip("10.0.0.50");

    whohas::TransactionStore out("local");
    merger.merge(a, out);
    merger.merge(named, out);

    const whohas::Host* merged = out.host(ip("10.0.0.2"));
    ASSERT_NE(merged, nullptr);
    EXPECT_EQ(merged->ptr_hostname, std::string("printer.local"));
    EXPECT_EQ(merged->fwd_resolved_ip, ip("10.0.0.50"));
    EXPECT_TRUE(out.find(ip("10.0.0.1"), ip("10.0.0.2"))->mitm_op);
}

TEST_F(AggregatorTest, FilterListsApplyToMergedRows) {
    whohas::FilterLists lists(&logger);
    lists.sender.add_black("10.0.0.3");

    whohas::TransactionStore out("local");
    whohas::MergeStats stats = merger.merge(a, out, &lists);
    EXPECT_EQ(stats.transactions_skipped, 1u);
    EXPECT_EQ(out.find(ip("10.0.0.3"), ip("10.0.0.2")), nullptr);
    EXPECT_NE(out.find(ip("10.0.0.1"), ip("10.0.0.2")), nullptr);
}

TEST_F(AggregatorTest, MergedKeysAreDirty) {
    whohas::TransactionStore out("local");
    merger.merge(b, out);
    EXPECT_EQ(out.take_dirty().size(), 2u);
}

TEST_F(AggregatorTest, AddCaptureDecodesAndMerges) {
    whohas::FilterLists lists(&logger);
    lists.target.add_black("10.0.0.99");
    whohas::TransactionStore out("local");
    whohas::Aggregator aggregator(out, lists, &logger);

    VectorFrameReader first({request_frame("10.0.0.1", "10.0.0.2", 1),
                             request_frame("10.0.0.1", "10.0.0.2", 2),
                             request_frame("10.0.0.1", "10.0.0.99", 3)});
    EXPECT_EQ(aggregator.add_capture("pcap:first", first), 2u);

    // The same capture seen again contributes nothing new.
    VectorFrameReader again({request_frame("10.0.0.1", "10.0.0.2", 1),
                             request_frame("10.0.0.1", "10.0.0.2", 2)});
    aggregator.add_capture("pcap:first", again);

    VectorFrameReader second({request_frame("10.0.0.1", "10.0.0.2", 7)});
    aggregator.add_capture("pcap:second", second);

    EXPECT_EQ(aggregator.inputs_merged(), 3u);
    const whohas::Transaction* txn = out.find(ip("10.0.0.1"), ip("10.0.0.2"));
    ASSERT_NE(txn, nullptr);
    EXPECT_EQ(txn->count, 3u);
    EXPECT_EQ(out.find(ip("10.0.0.1"), ip("10.0.0.99")), nullptr);
}

TEST_F(AggregatorTest, AddDatabaseMergesPersistedAggregate) {
    const std::string path = "aggregator_test_input.db";
    {
        whohas::AggregateDatabase db(&logger);
        ASSERT_TRUE(db.open(path));
        ASSERT_TRUE(db.save(a));
    }

    whohas::FilterLists lists(&logger);
    whohas::TransactionStore out("local");
    whohas::Aggregator aggregator(out, lists, &logger);
    EXPECT_TRUE(aggregator.add_database(path));
    EXPECT_TRUE(aggregator.add_database(path));
    EXPECT_EQ(totals_of(out), totals_of(a));

    EXPECT_FALSE(aggregator.add_database("aggregator_test_missing.db"));

    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());
}

TEST_F(AggregatorTest, LegacyDatabasesAreDistinctSources) {
    const std::string first = "aggregator_test_legacy_a.db";
    const std::string second = "aggregator_test_legacy_b.db";
    write_legacy_database(first, "INSERT INTO transactions (sender_ip, target_ip, count, first_seen, last_seen) "
                                 "VALUES ('10.0.0.1', '10.0.0.2', 3, 1000000, 3000000);");
    write_legacy_database(second, "INSERT INTO transactions (sender_ip, target_ip, count, first_seen, last_seen) "
                                  "VALUES ('10.0.0.1', '10.0.0.2', 2, 5000000, 6000000);");

    whohas::FilterLists lists(&logger);
    whohas::TransactionStore out("local");
    whohas::Aggregator aggregator(out, lists, &logger);
    ASSERT_TRUE(aggregator.add_database(first));
    ASSERT_TRUE(aggregator.add_database(second));
    ASSERT_TRUE(aggregator.add_database(first));

    const whohas::Transaction* txn = out.find(ip("10.0.0.1"), ip("10.0.0.2"));
    ASSERT_NE(txn, nullptr);
    EXPECT_EQ(txn->count, 5u);
    EXPECT_EQ(txn->first_seen, at(1));
    EXPECT_EQ(txn->last_seen, at(6));
    EXPECT_EQ(txn->contributions.size(), 2u);

    std::remove(first.c_str());
    std::remove(second.c_str());
}

TEST_F(AggregatorTest, ForeignDatabaseIsRejectedAndLeftAlone) {
    const std::string path = "aggregator_test_foreign.db";
    {
        sqlite3* db = nullptr;
        ASSERT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
        ASSERT_EQ(sqlite3_exec(db, "CREATE TABLE other (x INTEGER);", nullptr, nullptr, nullptr), SQLITE_OK);
        sqlite3_close(db);
    }
    auto digest_before = whohas::utils::fnv1a64_file(path);

    whohas::FilterLists lists(&logger);
    whohas::TransactionStore out("local");
    whohas::Aggregator aggregator(out, lists, &logger);
    EXPECT_FALSE(aggregator.add_database(path));
    EXPECT_EQ(aggregator.inputs_merged(), 0u);
    EXPECT_EQ(whohas::utils::fnv1a64_file(path), digest_before);

    std::remove(path.c_str());
}

TEST(CaptureFileSourceIdTest, DependsOnContentOnly) {
    const std::string first = "source_id_test_one.pcap";
    const std::string second = "source_id_test_two.pcap";
    for (const auto& path : {first, second}) {
        std::ofstream out(path, std::ios::binary);
        out << "identical bytes";
    }
    auto id_one = whohas::capture_file_source_id(first);
    auto id_two = whohas::capture_file_source_id(second);
    ASSERT_TRUE(id_one.has_value());
    ASSERT_TRUE(id_two.has_value());
    EXPECT_EQ(*id_one, *id_two);
    EXPECT_EQ(id_one->rfind("pcap:", 0), 0u);

    std::remove(first.c_str());
    std::remove(second.c_str());
    EXPECT_FALSE(whohas::capture_file_source_id(first).has_value());
}
