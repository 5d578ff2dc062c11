#ifndef WHOHAS_PCAP_IO_HPP
#define WHOHAS_PCAP_IO_HPP

#include "frame_decoder.hpp" // For RawFrame, FrameReader
#include "logger.hpp"

#include <pcap/pcap.h>

#include <cstddef>
#include <string>
#include <vector>

namespace whohas {

// Converts a libpcap record into a RawFrame.
RawFrame make_raw_frame(const struct pcap_pkthdr* header, const u_char* packet);

// Replays an offline capture file frame by frame.
class PcapFileReader : public FrameReader {
public:
    explicit PcapFileReader(Logger* logger = nullptr) : logger_(logger) {}
    ~PcapFileReader() override;

    PcapFileReader(const PcapFileReader&) = delete;
    PcapFileReader& operator=(const PcapFileReader&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return handle_ != nullptr; }

    // False at end of file or on a read error (see failed()).
    bool next(RawFrame& frame) override;

    bool failed() const { return failed_; }
    std::size_t frames_read() const { return frames_read_; }

private:
    pcap_t* handle_ = nullptr;
    std::string path_;
    Logger* logger_;
    bool failed_ = false;
    std::size_t frames_read_ = 0;
};

// Writes Ethernet frames to a capture file.
class PcapDumpWriter {
public:
    explicit PcapDumpWriter(Logger* logger = nullptr) : logger_(logger) {}
    ~PcapDumpWriter();

    PcapDumpWriter(const PcapDumpWriter&) = delete;
    PcapDumpWriter& operator=(const PcapDumpWriter&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return dumper_ != nullptr; }

    bool write(const RawFrame& frame);
    std::size_t write_all(const std::vector<RawFrame>& frames);
    bool flush();
    // Flushes and closes. False when buffered frames could not be written.
    bool finish();

    std::size_t frames_written() const { return frames_written_; }

private:
    pcap_t* dead_handle_ = nullptr;
    pcap_dumper_t* dumper_ = nullptr;
    std::string path_;
    Logger* logger_;
    std::size_t frames_written_ = 0;
};

} // namespace whohas

#endif // WHOHAS_PCAP_IO_HPP
