#include "whohas/pcap_io.hpp"

#include <chrono>

namespace whohas {

namespace {
constexpr int SNAPLEN = 65535;
}

RawFrame make_raw_frame(const struct pcap_pkthdr* header, const u_char* packet) {
    RawFrame frame;
    frame.timestamp = Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::seconds(header->ts.tv_sec) + std::chrono::microseconds(header->ts.tv_usec)));
    frame.data.assign(packet, packet + header->caplen);
    frame.original_length = header->len;
    return frame;
}

PcapFileReader::~PcapFileReader() {
    close();
}

bool PcapFileReader::open(const std::string& path) {
    close();
    char errbuf[PCAP_ERRBUF_SIZE] = {0};
    handle_ = pcap_open_offline(path.c_str(), errbuf);
    if (!handle_) {
        if (logger_) logger_->error("Pcap", "Unable to open capture file " + path + ": " + errbuf);
        return false;
    }
    if (pcap_datalink(handle_) != DLT_EN10MB) {
        if (logger_) logger_->error("Pcap", path + " is not an Ethernet capture.");
        close();
        return false;
    }
    path_ = path;
    failed_ = false;
    frames_read_ = 0;
    return true;
}

void PcapFileReader::close() {
    if (handle_) {
        pcap_close(handle_);
        handle_ = nullptr;
    }
}

bool PcapFileReader::next(RawFrame& frame) {
    if (!handle_) {
        return false;
    }
    struct pcap_pkthdr* header = nullptr;
    const u_char* packet = nullptr;
    int rc = pcap_next_ex(handle_, &header, &packet);
    if (rc == 1) {
        frame = make_raw_frame(header, packet);
        ++frames_read_;
        return true;
    }
    if (rc == PCAP_ERROR) {
        failed_ = true;
        if (logger_) logger_->error("Pcap", "Error reading " + path_ + ": " + pcap_geterr(handle_));
    }
    // PCAP_ERROR_BREAK: end of file
    return false;
}

PcapDumpWriter::~PcapDumpWriter() {
    close();
}

bool PcapDumpWriter::open(const std::string& path) {
    close();
    dead_handle_ = pcap_open_dead(DLT_EN10MB, SNAPLEN);
    if (!dead_handle_) {
        if (logger_) logger_->error("Pcap", "pcap_open_dead failed.");
        return false;
    }
    dumper_ = pcap_dump_open(dead_handle_, path.c_str());
    if (!dumper_) {
        if (logger_) logger_->error("Pcap", "Unable to create capture file " + path + ": " + pcap_geterr(dead_handle_));
        pcap_close(dead_handle_);
        dead_handle_ = nullptr;
        return false;
    }
    path_ = path;
    frames_written_ = 0;
    return true;
}

void PcapDumpWriter::close() {
    if (dumper_) {
        pcap_dump_close(dumper_);
        dumper_ = nullptr;
    }
    if (dead_handle_) {
        pcap_close(dead_handle_);
        dead_handle_ = nullptr;
    }
}

bool PcapDumpWriter::write(const RawFrame& frame) {
    if (!dumper_) {
        return false;
    }
    struct pcap_pkthdr header{};
    auto since_epoch = frame.timestamp.time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    header.ts.tv_sec = static_cast<time_t>(secs.count());
    header.ts.tv_usec = static_cast<suseconds_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - secs).count());
    header.caplen = static_cast<bpf_u_int32>(frame.data.size());
    header.len = frame.original_length > 0 ? frame.original_length : header.caplen;

    pcap_dump(reinterpret_cast<u_char*>(dumper_), &header, frame.data.data());
    ++frames_written_;
    return true;
}

std::size_t PcapDumpWriter::write_all(const std::vector<RawFrame>& frames) {
    std::size_t written = 0;
    for (const auto& frame : frames) {
        if (write(frame)) {
            ++written;
        }
    }
    return written;
}

bool PcapDumpWriter::flush() {
    if (!dumper_) {
        return false;
    }
    if (pcap_dump_flush(dumper_) != 0) {
        if (logger_) logger_->error("Pcap", "Failed to flush " + path_);
        return false;
    }
    return true;
}

bool PcapDumpWriter::finish() {
    bool ok = flush();
    if (ok && logger_) {
        logger_->info("Pcap", "Wrote " + std::to_string(frames_written_) + " frame(s) to " + path_);
    }
    close();
    return ok;
}

} // namespace whohas
