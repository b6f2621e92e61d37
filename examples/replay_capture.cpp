/*
 * ============================================================================
 * BTLM REPLAY - HEADLESS CAPTURE INGESTION
 * ============================================================================
 *
 * Feeds a text capture through the full ingestion pipeline (authentication,
 * decoding, dedup, storage) without a terminal UI, then prints a summary.
 *
 * Run:
 *   ./btlm_replay --replay capture.txt --db replay.db --secret "$KEY"
 *
 * Capture format: see src/btlm_capture_replay.hpp
 *
 * ============================================================================
 */

#include "btlm_config.hpp"
#include "btlm_controller.hpp"
#include "btlm_extractor.hpp"
#include "btlm_log.hpp"
#include "btlm_repository.hpp"
#include "btlm_runtime.hpp"
#include "btlm_signature.hpp"
#include "btlm_storage.hpp"
#include "btlm_view.hpp"

#include "btlm_capture_replay.hpp"

#include <iomanip>
#include <iostream>
#include <memory>

using namespace btlm;

int main(int argc, char** argv) {
    MonitorConfig config;
    bool help = false;
    try {
        config = parse_monitor_args(argc, argv, help);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << monitor_usage(argv[0]);
        return 2;
    }
    if (help || config.replay_path.empty()) {
        std::cout << monitor_usage(argv[0]) << "\n--replay is required.\n";
        return help ? 0 : 2;
    }

    Logger logger(config.verbose ? LogLevel::DEBUG : LogLevel::INFO);
    logger.add_sink(std::make_shared<StreamLogSink>(std::cerr));

    std::cout << "============================================================================\n";
    std::cout << "BTLM CAPTURE REPLAY v" << get_version_string() << "\n";
    std::cout << "============================================================================\n\n";
    std::cout << "Capture:  " << config.replay_path << "\n";
    std::cout << "Database: " << config.db_path << "\n\n";

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

        auto source = CaptureReplaySource::from_file(config.replay_path, logger);

        hub.start();
        {
            ScanSession session(*source);
            DetectionCallback on_detection =
                [&extractor](const AdvertisedDevice& device, const AdvertisementData& data) {
                    extractor.detection_callback(device, data);
                };
            try {
                while (session.poll(on_detection, 0)) {
                }
            } catch (const ScanCancelled&) {
                logger.warning("Replay cancelled before the end of the capture");
            }
        }
        hub.stop();

        const ExtractorStats& stats = extractor.stats();
        std::cout << "Advertisements replayed: " << source->delivered() << "\n";
        std::cout << "Malformed capture lines: " << source->skipped() << "\n";
        std::cout << "Telemetry frames seen:   " << stats.frames_seen << "\n";
        std::cout << "  not telemetry:         " << stats.not_telemetry << "\n";
        std::cout << "  MAC failures:          " << stats.auth_failures << "\n";
        std::cout << "  decode failures:       " << stats.decode_failures << "\n";
        std::cout << "  duplicates:            " << stats.duplicates << "\n";
        std::cout << "  forwarded:             " << stats.forwarded << "\n";
        std::cout << "Stored events:           " << hub.processed() - hub.failed()
                  << " (" << hub.failed() << " failed)\n\n";

        std::cout << std::left << std::setw(14) << "battery" << std::setw(20) << "source"
                  << std::setw(10) << "mV" << std::setw(10) << "adv" << std::setw(10) << "uptime"
                  << "mode\n";
        for (const auto& row : table.sorted_rows()) {
            std::cout << std::setw(14) << row.label << std::setw(20) << row.external_id
                      << std::setw(10) << row.voltage_mv << std::setw(10) << row.adv_count
                      << std::setw(10) << std::fixed << std::setprecision(1) << row.uptime_s
                      << row.mode_name << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
