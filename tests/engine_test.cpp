#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "whohas/engine.hpp"
#include "whohas/packet.hpp"
#include "whohas/utils.hpp"

#include <cstddef>
#include <sstream>
#include <utility>
#include <vector>

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

whohas::IpAddress ip(const char* text) {
    return *whohas::utils::parse_ipv4(text);
}

whohas::RawFrame make_frame(uint16_t opcode, const char* sender, const char* target, int64_t second) {
    whohas::MacAddress mac{0x00, 0x00, 0x00, 0x00, 0x00, 0x01};
    whohas::RawFrame frame;
    frame.timestamp = whohas::utils::from_epoch_micros(second * 1000000LL);
    frame.data = whohas::build_arp_frame(opcode, mac, whohas::MacAddress::broadcast(),
                                         mac, ip(sender), whohas::MacAddress(), ip(target));
    frame.original_length = static_cast<uint32_t>(frame.data.size());
    return frame;
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

class MockArpProber : public whohas::ArpProber {
public:
    MOCK_METHOD(std::optional<whohas::MacAddress>, probe,
                (whohas::IpAddress target, std::chrono::milliseconds timeout), (override));
};

} // namespace

class EngineTest : public ::testing::Test {
protected:
    std::ostringstream log_sink;
    whohas::Logger logger{whohas::LogLevel::DEBUG};
    whohas::TransactionStore store{"capture:test"};
    whohas::FilterLists lists;

    void SetUp() override {
        logger.set_output(&log_sink);
        lists.set_logger(&logger);
    }
};

TEST_F(EngineTest, RequestsAreRecorded) {
    whohas::Engine engine(store, lists, &logger);
    std::vector<whohas::RawFrame> frames = {
        make_frame(whohas::ARP_OPCODE_REQUEST, "10.0.0.1", "10.0.0.2", 1),
        make_frame(whohas::ARP_OPCODE_REQUEST, "10.0.0.1", "10.0.0.2", 2),
        make_frame(whohas::ARP_OPCODE_REPLY, "10.0.0.2", "10.0.0.1", 3),
    };
    EXPECT_EQ(engine.ingest_batch(frames), 2u);
    EXPECT_EQ(store.find(ip("10.0.0.1"), ip("10.0.0.2"))->count, 2u);
    EXPECT_EQ(store.find(ip("10.0.0.2"), ip("10.0.0.1")), nullptr);

    const whohas::IngestCounters& counters = engine.counters();
    EXPECT_EQ(counters.frames_seen, 3u);
    EXPECT_EQ(counters.requests_decoded, 2u);
    EXPECT_EQ(counters.requests_accepted, 2u);
    EXPECT_EQ(counters.requests_filtered, 0u);
}

TEST_F(EngineTest, FilteredRequestsNeverCount) {
    lists.sender.add_black("10.0.0.66");
    lists.target.add_white("10.0.0.2");
    whohas::Engine engine(store, lists, &logger);

    engine.ingest_frame(make_frame(whohas::ARP_OPCODE_REQUEST, "10.0.0.66", "10.0.0.2", 1));
    engine.ingest_frame(make_frame(whohas::ARP_OPCODE_REQUEST, "10.0.0.1", "10.0.0.3", 1));
    engine.ingest_frame(make_frame(whohas::ARP_OPCODE_REQUEST, "10.0.0.1", "10.0.0.2", 1));

    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.find(ip("10.0.0.66"), ip("10.0.0.2")), nullptr);
    EXPECT_EQ(store.host(ip("10.0.0.66")), nullptr);
    EXPECT_EQ(engine.counters().requests_filtered, 2u);
}

TEST_F(EngineTest, IngestAllDrainsReaderAndLogsStats) {
    logger.set_min_log_level(whohas::LogLevel::INFO);
    VectorFrameReader reader({
        make_frame(whohas::ARP_OPCODE_REQUEST, "10.0.0.1", "10.0.0.2", 1),
        make_frame(whohas::ARP_OPCODE_REQUEST, "10.0.0.3", "10.0.0.2", 2),
    });
    whohas::Engine engine(store, lists, &logger);
    EXPECT_EQ(engine.ingest_all(reader), 2u);
    EXPECT_EQ(store.size(), 2u);
    EXPECT_NE(log_sink.str().find("Accepted=2"), std::string::npos);
}

TEST_F(EngineTest, EnrichWithoutResolverClearsDirtySet) {
    whohas::Engine engine(store, lists, &logger);
    engine.ingest_frame(make_frame(whohas::ARP_OPCODE_REQUEST, "10.0.0.1", "10.0.0.2", 1));
    EXPECT_TRUE(store.has_dirty());
    EXPECT_EQ(engine.enrich_dirty(), 0u);
    EXPECT_FALSE(store.has_dirty());
}

TEST_F(EngineTest, EnrichesTouchedTransactions) {
    NiceMock<MockArpProber> prober;
    EXPECT_CALL(prober, probe(ip("10.0.0.2"), _)).Times(1).WillOnce(Return(std::nullopt));

    whohas::ResolverOptions options;
    options.arp_resolve = true;
    options.stale_threshold = 2;
    whohas::Resolver resolver(nullptr, &prober, options, &logger);

    whohas::Engine engine(store, lists, &logger);
    engine.set_resolver(&resolver);
    engine.ingest_batch({
        make_frame(whohas::ARP_OPCODE_REQUEST, "10.0.0.1", "10.0.0.2", 1),
        make_frame(whohas::ARP_OPCODE_REQUEST, "10.0.0.1", "10.0.0.2", 2),
    });
    EXPECT_EQ(engine.enrich_dirty(), 1u);
    EXPECT_TRUE(store.find(ip("10.0.0.1"), ip("10.0.0.2"))->stale);
}

TEST_F(EngineTest, ResolverSeesRebindings) {
    whohas::Resolver resolver(nullptr, nullptr, whohas::ResolverOptions(), &logger);
    whohas::Engine engine(store, lists, &logger);
    engine.set_resolver(&resolver);

    whohas::ArpRequestEvent event;
    event.sender_ip = ip("10.0.0.1");
    event.target_ip = ip("10.0.0.2");
    event.sender_mac = whohas::MacAddress{0x00, 0x00, 0x00, 0x00, 0x00, 0x01};
    EXPECT_TRUE(engine.ingest(event));
    event.sender_mac = whohas::MacAddress{0x00, 0x00, 0x00, 0x00, 0x00, 0x02};
    EXPECT_TRUE(engine.ingest(event));

    EXPECT_EQ(resolver.rebindings().size(), 1u);
}

TEST_F(EngineTest, StoreOutlivesEngineAndResolver) {
    whohas::ArpRequestEvent event;
    event.sender_ip = ip("10.0.0.1");
    event.target_ip = ip("10.0.0.2");
    {
        whohas::Resolver resolver(nullptr, nullptr, whohas::ResolverOptions(), &logger);
        whohas::Engine engine(store, lists, &logger);
        engine.set_resolver(&resolver);
        event.sender_mac = whohas::MacAddress{0x00, 0x00, 0x00, 0x00, 0x00, 0x01};
        EXPECT_TRUE(engine.ingest(event));
    }

    // A rebinding after both are gone must not reach the destroyed resolver.
    event.sender_mac = whohas::MacAddress{0x00, 0x00, 0x00, 0x00, 0x00, 0x02};
    store.record(event.sender_ip, event.sender_mac, event.target_ip, event.timestamp);
    EXPECT_EQ(*store.host(ip("10.0.0.1"))->mac_address, event.sender_mac);
    EXPECT_EQ(log_sink.str().find("changed link address"), std::string::npos);
}

TEST_F(EngineTest, LocalStationRequestsAreNotCounted) {
    whohas::Engine engine(store, lists, &logger);
    whohas::MacAddress local_mac{0x02, 0x00, 0x00, 0x00, 0x00, 0xaa};
    engine.set_local_station(local_mac, ip("10.0.0.100"));

    whohas::RawFrame own;
    own.timestamp = whohas::utils::from_epoch_micros(1000000);
    own.data = whohas::build_arp_frame(whohas::ARP_OPCODE_REQUEST, local_mac, whohas::MacAddress::broadcast(),
                                       local_mac, ip("10.0.0.100"), whohas::MacAddress(), ip("10.0.0.2"));
    own.original_length = static_cast<uint32_t>(own.data.size());

    EXPECT_FALSE(engine.ingest_frame(own));
    EXPECT_EQ(store.size(), 0u);
    EXPECT_TRUE(store.take_dirty().empty());
    EXPECT_EQ(engine.counters().requests_own, 1u);
    EXPECT_EQ(engine.counters().requests_accepted, 0u);

    // Another host using the monitor's address is still observed.
    EXPECT_TRUE(engine.ingest_frame(make_frame(whohas::ARP_OPCODE_REQUEST, "10.0.0.100", "10.0.0.2", 2)));
    EXPECT_EQ(store.find(ip("10.0.0.100"), ip("10.0.0.2"))->count, 1u);

    engine.clear_local_station();
    EXPECT_TRUE(engine.ingest_frame(own));
    EXPECT_EQ(store.find(ip("10.0.0.100"), ip("10.0.0.2"))->count, 2u);
}
