#include "whohas/session.hpp"
#include "whohas/aggregate_db.hpp"
#include "whohas/aggregator.hpp"
#include "whohas/bounded_channel.hpp"
#include "whohas/capture_worker.hpp"
#include "whohas/dns_resolver.hpp"
#include "whohas/engine.hpp"
#include "whohas/pcap_io.hpp"
#include "whohas/pcap_prober.hpp"
#include "whohas/resolver.hpp"
#include "whohas/utils.hpp"

#include <algorithm> // For std::max
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <utility>

namespace whohas {

namespace {

std::atomic<bool> g_stop_requested{false};

extern "C" void handle_stop_signal(int) {
    g_stop_requested.store(true);
}

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(200);
constexpr auto WORKER_JOIN_TIMEOUT = std::chrono::milliseconds(2000);
constexpr std::size_t MIN_CHANNEL_CAPACITY = 1024;

} // namespace

bool persist_outputs(const TransactionStore& store, const std::string& database,
                     const std::string& analysis_output, const ReportRenderer& renderer,
                     const FilterLists& lists, Logger& logger, std::ostream& out) {
    bool ok = true;
    if (!database.empty()) {
        AggregateDatabase db(&logger);
        ok = db.open(database) && db.save(store);
    }
    if (ok && !analysis_output.empty()) {
        ReportRenderer plain(renderer.columns(), ColorProfile::disabled());
        ok = write_report_file(analysis_output, plain.render(store, &lists), &logger);
    }
    if (!ok) {
        logger.critical("Session", "Unable to write outputs, final results follow.");
        out << renderer.render(store, &lists) << std::endl;
    }
    return ok;
}

// ---------------------------------------------------------------------------
// CaptureSession
// ---------------------------------------------------------------------------

CaptureSession::CaptureSession(EngineConfig config, const FilterLists& lists, ReportRenderer renderer, Logger& logger)
    : config_(std::move(config)),
      lists_(lists),
      renderer_(std::move(renderer)),
      logger_(logger),
      store_("local", &logger),
      out_(&std::cout) {}

void CaptureSession::request_stop() {
    g_stop_requested.store(true);
}

bool CaptureSession::stop_requested() {
    return g_stop_requested.load();
}

void CaptureSession::reset_stop() {
    g_stop_requested.store(false);
}

bool CaptureSession::install_signal_handlers() {
    struct sigaction action{};
    action.sa_handler = handle_stop_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    return sigaction(SIGINT, &action, nullptr) == 0 && sigaction(SIGTERM, &action, nullptr) == 0;
}

void CaptureSession::redraw() {
    if (renderer_.profile().enabled()) {
        *out_ << "\033[2J\033[H";
    }
    *out_ << renderer_.render(store_, &lists_) << std::endl;
}

int CaptureSession::run() {
    Timestamp started = std::chrono::system_clock::now();
    store_.set_ingest_source("capture:" + config_.interface + ":" + std::to_string(utils::to_epoch_micros(started)));

    // Previous sessions written to the same database are carried forward.
    AggregateDatabase database(&logger_);
    if (!database.open(config_.database) || !database.load(store_)) {
        logger_.critical("Capture", "Unable to use database " + config_.database);
        return EXIT_FAILURE_PERSIST;
    }
    store_.take_dirty();

    std::unique_ptr<DnsNameResolver> names;
    if (config_.reverse_resolve) {
        names = std::make_unique<DnsNameResolver>(std::chrono::seconds(config_.dns_timeout_s), 1, &logger_);
        if (!names->is_ready()) {
            logger_.warning("Capture", "System resolver unavailable, reverse resolution disabled.");
            names.reset();
        }
    }
    std::unique_ptr<PcapArpProber> prober;
    if (config_.arp_resolve) {
        prober = std::make_unique<PcapArpProber>(config_.interface, &logger_);
        if (!prober->open()) {
            logger_.warning("Capture", "ARP probing disabled.");
            prober.reset();
        }
    }

    ResolverOptions options;
    options.reverse_resolve = names != nullptr;
    options.arp_resolve = prober != nullptr;
    options.stale_threshold = config_.stale_threshold;
    options.probe_timeout = std::chrono::milliseconds(config_.probe_timeout_ms);
    Resolver resolver(names.get(), prober.get(), options, &logger_);

    Engine engine(store_, lists_, &logger_);
    engine.set_resolver(&resolver);
    if (prober) {
        engine.set_local_station(prober->local_mac(), prober->local_ip());
    }

    PcapDumpWriter dump(&logger_);
    if (!config_.pcap_output.empty() && !dump.open(config_.pcap_output)) {
        logger_.critical("Capture", "Unable to create " + config_.pcap_output);
        return EXIT_FAILURE_PERSIST;
    }

    const std::size_t batch_size = std::max<std::size_t>(config_.redraw_frequency, 1);
    BoundedChannel<RawFrame> channel(std::max<std::size_t>(batch_size * 64, MIN_CHANNEL_CAPACITY));
    CaptureWorker worker(config_.interface, channel, &logger_);
    if (!worker.open() || !worker.start()) {
        logger_.critical("Capture", "Capture could not be started: " + worker.error());
        return EXIT_FAILURE_CAPTURE;
    }

    redraw();

    std::vector<RawFrame> batch;
    batch.reserve(batch_size);
    bool worker_failed = false;
    bool persist_failed = false;

    while (!stop_requested()) {
        auto frame = channel.pop_for(POLL_INTERVAL);
        if (frame) {
            batch.push_back(std::move(*frame));
        } else if (channel.closed() && channel.size() == 0) {
            worker_failed = worker.failed();
            break;
        }
        if (batch.size() < batch_size) {
            continue;
        }

        dump.write_all(batch);
        engine.ingest_batch(batch);
        engine.enrich_dirty();
        batch.clear();

        if (!database.save(store_)) {
            persist_failed = true;
            break;
        }
        redraw();
    }

    // Frames not yet processed go to the raw-packet file only.
    worker.stop();
    std::vector<RawFrame> remaining = channel.drain();
    dump.write_all(batch);
    dump.write_all(remaining);
    worker.join_for(WORKER_JOIN_TIMEOUT);
    const bool dump_failed = dump.is_open() && !dump.finish();
    database.close();
    logger_.log_ingest_stats(engine.counters());

    bool outputs_written = false;
    if (persist_failed) {
        *out_ << renderer_.render(store_, &lists_) << std::endl;
    } else {
        outputs_written = persist_outputs(store_, config_.database, config_.analysis_output,
                                          renderer_, lists_, logger_, *out_);
        if (outputs_written && dump_failed) {
            logger_.critical("Capture", "Unable to write " + config_.pcap_output + ", final results follow.");
            *out_ << renderer_.render(store_, &lists_) << std::endl;
        }
    }
    if (!outputs_written || dump_failed) {
        return EXIT_FAILURE_PERSIST;
    }

    redraw();
    if (worker_failed) {
        logger_.error("Capture", worker.error());
        return EXIT_FAILURE_CAPTURE;
    }
    return EXIT_OK;
}

// ---------------------------------------------------------------------------
// AnalyzeSession
// ---------------------------------------------------------------------------

AnalyzeSession::AnalyzeSession(EngineConfig config, const FilterLists& lists, ReportRenderer renderer, Logger& logger,
                               std::vector<std::string> pcap_files, std::vector<std::string> sqlite_files)
    : config_(std::move(config)),
      lists_(lists),
      renderer_(std::move(renderer)),
      logger_(logger),
      pcap_files_(std::move(pcap_files)),
      sqlite_files_(std::move(sqlite_files)),
      store_("local", &logger),
      out_(&std::cout) {}

int AnalyzeSession::run() {
    for (const auto* files : {&pcap_files_, &sqlite_files_}) {
        for (const auto& path : *files) {
            if (!utils::file_exists(path)) {
                logger_.error("Analyze", "Input file not found: " + path);
                return EXIT_FAILURE_INPUT;
            }
        }
    }

    // The output database is the starting point when it already exists.
    if (!config_.database.empty() && utils::file_exists(config_.database)) {
        AggregateDatabase existing(&logger_);
        if (!existing.open(config_.database, false) || !existing.load(store_)) {
            logger_.critical("Analyze", "Unable to read existing database " + config_.database);
            return EXIT_FAILURE_PERSIST;
        }
    }

    Aggregator aggregator(store_, lists_, &logger_);

    for (const auto& path : pcap_files_) {
        auto source = capture_file_source_id(path);
        PcapFileReader reader(&logger_);
        if (!source || !reader.open(path)) {
            logger_.error("Analyze", "Unable to read capture file " + path);
            return EXIT_FAILURE_INPUT;
        }
        aggregator.add_capture(*source, reader);
        if (reader.failed()) {
            logger_.warning("Analyze", path + " ended with a read error, frames up to it were used.");
        }
    }
    for (const auto& path : sqlite_files_) {
        if (!aggregator.add_database(path)) {
            logger_.error("Analyze", "Unable to read database " + path);
            return EXIT_FAILURE_INPUT;
        }
    }

    if (config_.reverse_resolve) {
        DnsNameResolver names(std::chrono::seconds(config_.dns_timeout_s), 1, &logger_);
        if (names.is_ready()) {
            ResolverOptions options;
            options.reverse_resolve = true;
            Resolver resolver(&names, nullptr, options, &logger_);
            resolver.enrich_dirty(store_);
        } else {
            logger_.warning("Analyze", "System resolver unavailable, reverse resolution skipped.");
            store_.take_dirty();
        }
    } else {
        store_.take_dirty();
    }

    if (!persist_outputs(store_, config_.database, config_.analysis_output, renderer_, lists_, logger_, *out_)) {
        return EXIT_FAILURE_PERSIST;
    }
    *out_ << renderer_.render(store_, &lists_) << std::endl;
    return EXIT_OK;
}

} // namespace whohas
