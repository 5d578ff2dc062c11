#include "gtest/gtest.h"
#include "whohas/engine.hpp"
#include "whohas/pcap_io.hpp"
#include "whohas/packet.hpp"
#include "whohas/utils.hpp"

#include <cstdio> // For std::remove
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace {

whohas::IpAddress ip(const char* text) {
    return *whohas::utils::parse_ipv4(text);
}

whohas::RawFrame request_frame(const char* sender, const char* target, int64_t micros) {
    whohas::MacAddress mac{0x00, 0x11, 0x22, 0x33, 0x44, 0x55};
    whohas::RawFrame frame;
    frame.timestamp = whohas::utils::from_epoch_micros(micros);
    frame.data = whohas::build_arp_frame(whohas::ARP_OPCODE_REQUEST, mac, whohas::MacAddress::broadcast(),
                                         mac, ip(sender), whohas::MacAddress(), ip(target));
    frame.original_length = static_cast<uint32_t>(frame.data.size());
    return frame;
}

} // namespace

class PcapIoTest : public ::testing::Test {
protected:
    std::ostringstream log_sink;
    whohas::Logger logger{whohas::LogLevel::DEBUG};
    std::string capture_path = "pcap_io_test.pcap";

    void SetUp() override {
        logger.set_output(&log_sink);
    }

    void TearDown() override {
        std::remove(capture_path.c_str());
    }
};

TEST_F(PcapIoTest, WrittenFramesReadBackIdentically) {
    std::vector<whohas::RawFrame> frames = {
        request_frame("10.0.0.1", "10.0.0.2", 1600000000000001LL),
        request_frame("10.0.0.1", "10.0.0.3", 1600000000500000LL),
        request_frame("10.0.0.4", "10.0.0.2", 1600000001999999LL),
    };
    {
        whohas::PcapDumpWriter writer(&logger);
        ASSERT_TRUE(writer.open(capture_path));
        EXPECT_TRUE(writer.is_open());
        EXPECT_EQ(writer.write_all(frames), 3u);
        EXPECT_TRUE(writer.flush());
        EXPECT_EQ(writer.frames_written(), 3u);
    }

    whohas::PcapFileReader reader(&logger);
    ASSERT_TRUE(reader.open(capture_path));
    whohas::RawFrame frame;
    for (const auto& expected : frames) {
        ASSERT_TRUE(reader.next(frame));
        EXPECT_EQ(frame.data, expected.data);
        EXPECT_EQ(frame.timestamp, expected.timestamp);
        EXPECT_EQ(frame.original_length, expected.original_length);
    }
    EXPECT_FALSE(reader.next(frame));
    EXPECT_FALSE(reader.failed());
    EXPECT_EQ(reader.frames_read(), 3u);
}

TEST_F(PcapIoTest, ReplayedCaptureFeedsEngine) {
    {
        whohas::PcapDumpWriter writer(&logger);
        ASSERT_TRUE(writer.open(capture_path));
        writer.write(request_frame("10.0.0.1", "10.0.0.2", 1000000));
        writer.write(request_frame("10.0.0.1", "10.0.0.2", 2000000));
        writer.close();
        EXPECT_FALSE(writer.write(request_frame("10.0.0.1", "10.0.0.2", 3000000)));
    }

    whohas::PcapFileReader reader(&logger);
    ASSERT_TRUE(reader.open(capture_path));
    whohas::TransactionStore store("pcap:test");
    whohas::FilterLists lists;
    whohas::Engine engine(store, lists, &logger);
    EXPECT_EQ(engine.ingest_all(reader), 2u);
    EXPECT_EQ(store.find(ip("10.0.0.1"), ip("10.0.0.2"))->count, 2u);
}

TEST_F(PcapIoTest, OpenRejectsMissingAndInvalidFiles) {
    whohas::PcapFileReader reader(&logger);
    EXPECT_FALSE(reader.open("pcap_io_test_missing.pcap"));
    EXPECT_FALSE(reader.is_open());

    {
        std::ofstream out(capture_path, std::ios::binary);
        out << "definitely not a capture file";
    }
    EXPECT_FALSE(reader.open(capture_path));
    whohas::RawFrame frame;
    EXPECT_FALSE(reader.next(frame));
}

TEST_F(PcapIoTest, WriterFailsOnBadPath) {
    whohas::PcapDumpWriter writer(&logger);
    EXPECT_FALSE(writer.open("no_such_dir/out.pcap"));
    EXPECT_FALSE(writer.is_open());
    EXPECT_FALSE(writer.flush());
}

TEST_F(PcapIoTest, FinishReportsFailedWrites) {
    {
        whohas::PcapDumpWriter writer(&logger);
        ASSERT_TRUE(writer.open(capture_path));
        writer.write(request_frame("10.0.0.1", "10.0.0.2", 1000000));
        EXPECT_TRUE(writer.finish());
        EXPECT_FALSE(writer.is_open());
    }

    if (!std::ifstream("/dev/full").good()) {
        GTEST_SKIP() << "/dev/full is not available";
    }
    whohas::PcapDumpWriter full(&logger);
    ASSERT_TRUE(full.open("/dev/full"));
    full.write(request_frame("10.0.0.1", "10.0.0.2", 1000000));
    EXPECT_FALSE(full.finish());
    EXPECT_FALSE(full.is_open());
    EXPECT_NE(log_sink.str().find("Failed to flush /dev/full"), std::string::npos);
}

TEST(MakeRawFrameTest, CopiesHeaderFields) {
    std::vector<uint8_t> bytes = {1, 2, 3, 4};
    struct pcap_pkthdr header{};
    header.ts.tv_sec = 10;
    header.ts.tv_usec = 250;
    header.caplen = 4;
    header.len = 60;

    whohas::RawFrame frame = whohas::make_raw_frame(&header, bytes.data());
    EXPECT_EQ(frame.data, bytes);
    EXPECT_EQ(frame.original_length, 60u);
    EXPECT_EQ(whohas::utils::to_epoch_micros(frame.timestamp), 10000250LL);
}
