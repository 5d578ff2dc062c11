#include "whohas/address_filter.hpp"
#include "whohas/cli.hpp"
#include "whohas/config_manager.hpp"
#include "whohas/logger.hpp"
#include "whohas/report.hpp"
#include "whohas/session.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "whohas";
    std::vector<std::string> args(argv + 1, argv + argc);

    whohas::ParseResult parsed = whohas::parse_command_line(args);
    if (!parsed.options) {
        std::cerr << "Error: " << parsed.error << "\n\n" << whohas::usage(program);
        return whohas::EXIT_FAILURE_INPUT;
    }
    const whohas::CliOptions& options = *parsed.options;
    if (options.mode == whohas::CommandMode::HELP) {
        std::cout << whohas::usage(program);
        return whohas::EXIT_OK;
    }

    whohas::Logger logger(options.verbose ? whohas::LogLevel::DEBUG : whohas::LogLevel::WARNING);

    // Defaults, then the config file, then the command line.
    whohas::EngineConfig config = whohas::default_engine_config(options.mode);
    if (options.config_file) {
        whohas::ConfigManager config_manager;
        config_manager.set_logger(&logger);
        if (!config_manager.load_config(*options.config_file)) {
            std::cerr << "Error: unable to read config file " << *options.config_file << std::endl;
            return whohas::EXIT_FAILURE_INPUT;
        }
        std::vector<std::string> errors = config_manager.validate_config(config_manager.get_current_config_data());
        if (!errors.empty()) {
            for (const auto& error : errors) {
                std::cerr << "Error: " << *options.config_file << ": " << error << std::endl;
            }
            return whohas::EXIT_FAILURE_INPUT;
        }
        config_manager.apply_config(config_manager.get_current_config_data(), config);
    }
    whohas::apply_overrides(options, config);

    std::vector<whohas::Column> columns = whohas::default_columns();
    if (!config.columns.empty()) {
        std::string bad_name;
        auto selected = whohas::parse_columns(config.columns, &bad_name);
        if (!selected) {
            std::cerr << "Error: invalid output column: " << bad_name << std::endl;
            return whohas::EXIT_FAILURE_INPUT;
        }
        columns = *selected;
    }

    auto profile = whohas::ColorProfile::by_name(config.color_profile);
    if (!profile) {
        std::cerr << "Error: unknown color profile: " << config.color_profile << std::endl;
        return whohas::EXIT_FAILURE_INPUT;
    }

    whohas::FilterLists lists(&logger);
    whohas::populate_filters(options.filters, lists, &logger);

    whohas::ReportRenderer renderer(columns, *profile);

    if (options.mode == whohas::CommandMode::CAPTURE) {
        if (!whohas::CaptureSession::install_signal_handlers()) {
            logger.warning("MAIN", "Unable to install signal handlers, Ctrl-C will not flush outputs.");
        }
        whohas::CaptureSession session(config, lists, renderer, logger);
        return session.run();
    }

    whohas::AnalyzeSession session(config, lists, renderer, logger, options.pcap_files, options.sqlite_files);
    return session.run();
}
