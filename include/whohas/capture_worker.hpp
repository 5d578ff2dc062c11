#ifndef WHOHAS_CAPTURE_WORKER_HPP
#define WHOHAS_CAPTURE_WORKER_HPP

#include "bounded_channel.hpp"
#include "frame_decoder.hpp" // For RawFrame
#include "logger.hpp"

#include <pcap/pcap.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <thread>

namespace whohas {

// Runs pcap_loop on a live interface in its own thread and hands every frame
// to a bounded channel. The worker never touches the transaction store.
class CaptureWorker {
public:
    static constexpr const char* DEFAULT_FILTER = "arp or (vlan and arp)";

    CaptureWorker(std::string interface, BoundedChannel<RawFrame>& channel, Logger* logger = nullptr);
    ~CaptureWorker();

    CaptureWorker(const CaptureWorker&) = delete;
    CaptureWorker& operator=(const CaptureWorker&) = delete;

    // Opens the interface and installs the capture filter.
    bool open(const std::string& filter = DEFAULT_FILTER);
    // Replays a capture file through the same thread and channel; the loop ends
    // at end of file.
    bool open_offline(const std::string& path, const std::string& filter = DEFAULT_FILTER);
    bool start();

    // Breaks the capture loop and closes the channel. Safe to call more than once,
    // including from a different thread than the one that called start().
    void stop();

    // Waits for the thread to finish. The capture loop is already broken and the
    // handle's read timeout bounds the wait; false means it took longer than
    // `timeout` (a warning is logged).
    bool join_for(std::chrono::milliseconds timeout);

    bool running() const { return running_.load(); }
    bool failed() const { return failed_.load(); }
    std::string error() const;
    const std::string& interface() const { return interface_; }

private:
    std::string interface_;
    BoundedChannel<RawFrame>& channel_;
    Logger* logger_;
    pcap_t* handle_ = nullptr;
    std::thread thread_;
    std::future<void> finished_;
    std::atomic<bool> running_{false};
    std::atomic<bool> failed_{false};
    mutable std::mutex error_mutex_;
    std::string error_;

    bool install_filter(const std::string& filter);
    void run(std::promise<void> done);
    void set_error(const std::string& message);
    static void on_packet(u_char* user, const struct pcap_pkthdr* header, const u_char* packet);
};

} // namespace whohas

#endif // WHOHAS_CAPTURE_WORKER_HPP
