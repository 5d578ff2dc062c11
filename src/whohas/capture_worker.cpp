#include "whohas/capture_worker.hpp"
#include "whohas/pcap_io.hpp" // For make_raw_frame

#include <utility>

namespace whohas {

namespace {
constexpr int SNAPLEN = 65535;
constexpr int READ_TIMEOUT_MS = 200;
}

CaptureWorker::CaptureWorker(std::string interface, BoundedChannel<RawFrame>& channel, Logger* logger)
    : interface_(std::move(interface)), channel_(channel), logger_(logger) {}

CaptureWorker::~CaptureWorker() {
    stop();
    if (thread_.joinable()) {
        thread_.join();
    }
    if (handle_) {
        pcap_close(handle_);
    }
}

bool CaptureWorker::open(const std::string& filter) {
    char errbuf[PCAP_ERRBUF_SIZE] = {0};
    handle_ = pcap_open_live(interface_.c_str(), SNAPLEN, 1, READ_TIMEOUT_MS, errbuf);
    if (!handle_) {
        set_error(std::string("Unable to open interface ") + interface_ + ": " + errbuf);
        return false;
    }
    if (!install_filter(filter)) {
        return false;
    }
    if (logger_) logger_->info("Capture", "Listening on " + interface_ + " (filter: " + filter + ")");
    return true;
}

bool CaptureWorker::open_offline(const std::string& path, const std::string& filter) {
    char errbuf[PCAP_ERRBUF_SIZE] = {0};
    handle_ = pcap_open_offline(path.c_str(), errbuf);
    if (!handle_) {
        set_error("Unable to open capture file " + path + ": " + errbuf);
        return false;
    }
    return install_filter(filter);
}

bool CaptureWorker::install_filter(const std::string& filter) {
    if (pcap_datalink(handle_) != DLT_EN10MB) {
        set_error(interface_ + " is not an Ethernet interface.");
        return false;
    }

    struct bpf_program program;
    if (pcap_compile(handle_, &program, filter.c_str(), 1, PCAP_NETMASK_UNKNOWN) == PCAP_ERROR) {
        set_error("Unable to compile capture filter '" + filter + "': " + pcap_geterr(handle_));
        return false;
    }
    int rc = pcap_setfilter(handle_, &program);
    pcap_freecode(&program);
    if (rc == PCAP_ERROR) {
        set_error("Unable to install capture filter: " + std::string(pcap_geterr(handle_)));
        return false;
    }
    return true;
}

bool CaptureWorker::start() {
    if (!handle_ || running_.load() || thread_.joinable()) {
        return false;
    }
    std::promise<void> done;
    finished_ = done.get_future();
    running_ = true;
    thread_ = std::thread(&CaptureWorker::run, this, std::move(done));
    return true;
}

void CaptureWorker::run(std::promise<void> done) {
    int rc = pcap_loop(handle_, -1, &CaptureWorker::on_packet, reinterpret_cast<u_char*>(this));
    if (rc == PCAP_ERROR) {
        set_error("Capture on " + interface_ + " failed: " + pcap_geterr(handle_));
    }
    // PCAP_ERROR_BREAK: pcap_breakloop() was called.
    running_ = false;
    channel_.close();
    done.set_value();
}

void CaptureWorker::on_packet(u_char* user, const struct pcap_pkthdr* header, const u_char* packet) {
    auto* self = reinterpret_cast<CaptureWorker*>(user);
    if (!self->channel_.push(make_raw_frame(header, packet))) {
        pcap_breakloop(self->handle_);
    }
}

void CaptureWorker::stop() {
    if (handle_ && running_.load()) {
        pcap_breakloop(handle_);
    }
    channel_.close();
}

bool CaptureWorker::join_for(std::chrono::milliseconds timeout) {
    if (!thread_.joinable()) {
        return true;
    }
    bool in_time = !finished_.valid() || finished_.wait_for(timeout) == std::future_status::ready;
    if (!in_time) {
        if (logger_) logger_->warning("Capture", "Capture worker is slow to stop, still waiting.");
        stop();
    }
    thread_.join();
    return in_time;
}

std::string CaptureWorker::error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return error_;
}

void CaptureWorker::set_error(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        error_ = message;
    }
    failed_ = true;
    if (logger_) logger_->error("Capture", message);
}

} // namespace whohas
