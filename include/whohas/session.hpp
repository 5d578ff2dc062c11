#ifndef WHOHAS_SESSION_HPP
#define WHOHAS_SESSION_HPP

#include "address_filter.hpp"
#include "config_manager.hpp" // For EngineConfig
#include "logger.hpp"
#include "report.hpp"
#include "transaction_store.hpp"

#include <chrono>
#include <iosfwd>
#include <string>
#include <vector>

namespace whohas {

// Process exit codes.
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_INPUT = 1;
constexpr int EXIT_FAILURE_PERSIST = 2;
constexpr int EXIT_FAILURE_CAPTURE = 3;

// Live capture: a capture worker feeds frames to this single-threaded loop,
// which records, enriches and re-renders every `redraw_frequency` frames until
// interrupted.
class CaptureSession {
public:
    CaptureSession(EngineConfig config, const FilterLists& lists, ReportRenderer renderer, Logger& logger);

    void set_output(std::ostream& out) { out_ = &out; }

    int run();

    // Async-signal-safe.
    static void request_stop();
    static bool stop_requested();
    static void reset_stop();

    // Routes SIGINT and SIGTERM to request_stop().
    static bool install_signal_handlers();

    const TransactionStore& store() const { return store_; }

private:
    EngineConfig config_;
    const FilterLists& lists_;
    ReportRenderer renderer_;
    Logger& logger_;
    TransactionStore store_;
    std::ostream* out_;

    void redraw();
};

// Batch analysis of replay files and previously written databases.
class AnalyzeSession {
public:
    AnalyzeSession(EngineConfig config, const FilterLists& lists, ReportRenderer renderer, Logger& logger,
                   std::vector<std::string> pcap_files, std::vector<std::string> sqlite_files);

    void set_output(std::ostream& out) { out_ = &out; }

    int run();

    const TransactionStore& store() const { return store_; }

private:
    EngineConfig config_;
    const FilterLists& lists_;
    ReportRenderer renderer_;
    Logger& logger_;
    std::vector<std::string> pcap_files_;
    std::vector<std::string> sqlite_files_;
    TransactionStore store_;
    std::ostream* out_;
};

// Saves `store` to `database`, and writes the uncolored report to `analysis_output`
// when set. On failure the table is printed to `out` and false is returned.
bool persist_outputs(const TransactionStore& store, const std::string& database,
                     const std::string& analysis_output, const ReportRenderer& renderer,
                     const FilterLists& lists, Logger& logger, std::ostream& out);

} // namespace whohas

#endif // WHOHAS_SESSION_HPP
