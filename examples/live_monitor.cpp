/*
 * ============================================================================
 * BTLM LIVE MONITOR
 * ============================================================================
 *
 * Scans for authenticated battery telemetry beacons, stores every accepted
 * frame in SQLite and shows the latest value per battery in a terminal table.
 *
 *   scan loop (main thread)   HCI socket -> FrameExtractor -> TelemetryHub
 *   hub consumer thread       IdentityRepository, TableModel
 *   render thread             CursesView
 *
 * Run (needs CAP_NET_RAW for live scanning):
 *   sudo ./btlm_live_monitor --db telemetry.db --secret "$KEY"
 *   ./btlm_live_monitor --replay capture.txt
 *
 * Ctrl-C or q quits. The terminal is restored on every exit path.
 *
 * ============================================================================
 */

#include "btlm_config.hpp"
#include "btlm_controller.hpp"
#include "btlm_curses_view.hpp"
#include "btlm_extractor.hpp"
#include "btlm_log.hpp"
#include "btlm_repository.hpp"
#include "btlm_runtime.hpp"
#include "btlm_signature.hpp"
#include "btlm_storage.hpp"
#include "btlm_view.hpp"

#include "btlm_capture_replay.hpp"
#include "btlm_hci_scanner.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>

using namespace btlm;

// Global flag for graceful shutdown
std::atomic<bool> g_running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running.store(false);
    }
}

static std::unique_ptr<IAdvertisementSource> make_source(const MonitorConfig& config,
                                                         Logger& logger) {
    if (!config.replay_path.empty()) {
        return CaptureReplaySource::from_file(config.replay_path, logger, config.scan_poll_ms);
    }
    return std::make_unique<HciAdvertisementScanner>(config.hci_device, logger);
}

int main(int argc, char** argv) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    MonitorConfig config;
    bool help = false;
    try {
        config = parse_monitor_args(argc, argv, help);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << monitor_usage(argv[0]);
        return 2;
    }
    if (help) {
        std::cout << monitor_usage(argv[0]);
        return 0;
    }

    std::ofstream log_file(config.log_file, std::ios::app);
    if (!log_file.is_open()) {
        std::cerr << "Error: cannot open log file " << config.log_file << "\n";
        return 1;
    }

    // The log file receives everything enabled; the Log screen INFO and up.
    Logger logger(config.verbose ? LogLevel::DEBUG : LogLevel::INFO);
    auto memory_sink = std::make_shared<MemoryLogSink>(config.log_capacity, LogLevel::INFO);
    logger.add_sink(std::make_shared<StreamLogSink>(log_file, LogLevel::DEBUG));
    logger.add_sink(memory_sink);

    logger.info("BTLM monitor v" + get_version_string() + " starting (db " + config.db_path + ")");
    if (config.uses_default_secret()) {
        logger.warning("Using the built-in default secret; set --secret or " +
                       std::string(SECRET_KEY_ENV));
    }

    uint64_t processed = 0;
    uint64_t failed = 0;
    std::string view_error;

    try {
        SqliteTelemetryStore store(config.db_path);
        SystemClock clock;
        IdentityRepository repository(store, clock, logger);

        ViewChannel channel;
        TableModel table(channel);
        DisplayController controller(repository, table, channel, logger);
        TelemetryHub hub(controller, logger);

        SignatureVerifier verifier(config.secret_key);
        FrameExtractor extractor(verifier, hub.telemetry_sink(), logger, config.device_name);

        ViewOptions view_options;
        view_options.render_interval = config.render_interval();
        view_options.flash_duration = config.flash_duration();
        CursesView view(channel, *memory_sink, logger, view_options);
        view.set_rename_callback([&hub](const std::string& external_id, const std::string& label) {
            return hub.submit_rename(external_id, label);
        });

        auto source = make_source(config, logger);

        hub.start();
        view.start();

        {
            ScanSession session(*source);
            DetectionCallback on_detection =
                [&extractor](const AdvertisedDevice& device, const AdvertisementData& data) {
                    extractor.detection_callback(device, data);
                };

            bool source_exhausted = false;
            try {
                while (g_running.load() && !view.quit_requested() && !hub.faulted()) {
                    if (source_exhausted) {
                        std::this_thread::sleep_for(std::chrono::milliseconds(config.scan_poll_ms));
                        continue;
                    }
                    if (!session.poll(on_detection, config.scan_poll_ms)) {
                        source_exhausted = true;
                        logger.info("Advertisement source exhausted; press q to quit");
                    }
                }
            } catch (const ScanCancelled&) {
                logger.info("Scan loop cancelled");
            }
        }

        view.stop();
        hub.stop();

        processed = hub.processed();
        failed = hub.failed();
        view_error = view.last_error();
        logger.info("Monitor stopped: " + std::to_string(processed) + " events, " +
                    std::to_string(failed) + " failed");
    } catch (const std::exception& e) {
        logger.error(std::string("Fatal: ") + e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (!view_error.empty()) {
        std::cerr << "Terminal view error: " << view_error << "\n";
    }
    std::cout << "Processed " << processed << " events (" << failed << " failed). Log: "
              << config.log_file << "\n";
    return 0;
}
