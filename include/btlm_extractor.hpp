#ifndef BTLM_EXTRACTOR_HPP
#define BTLM_EXTRACTOR_HPP

#include "btlm_frame.hpp"
#include "btlm_interfaces.hpp"
#include "btlm_log.hpp"
#include "btlm_signature.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace btlm {

/*
 * Thrown when the downstream pipeline has shut down. It is the only exception
 * allowed out of FrameExtractor::detection_callback, so the scan loop can
 * terminate on it.
 */
class ScanCancelled : public std::runtime_error {
public:
    ScanCancelled() : std::runtime_error("Scan cancelled") {}
};

// Receives every accepted (authenticated, decoded, changed) snapshot.
using TelemetrySink =
    std::function<void(const TelemetrySnapshot& snapshot, const std::string& source_address)>;

struct ExtractorStats {
    uint64_t frames_seen = 0;
    uint64_t not_telemetry = 0;
    uint64_t auth_failures = 0;
    uint64_t decode_failures = 0;
    uint64_t duplicates = 0;
    uint64_t forwarded = 0;
};

// ============================================================================
// FRAME EXTRACTOR
// ============================================================================
//
// Runs entirely on the scan context. Locates the telemetry service data in an
// advertisement, authenticates it, decodes it and forwards each distinct value
// once per source address.
//
class FrameExtractor {
public:
    FrameExtractor(const SignatureVerifier& verifier,
                   TelemetrySink sink,
                   Logger& logger,
                   std::string expected_name = "ESP32 TLM Beacon")
        : verifier_(verifier),
          sink_(std::move(sink)),
          logger_(logger),
          expected_name_(std::move(expected_name)) {}

    // Scanner entry point. Filters on the advertised name and contains every
    // failure except ScanCancelled.
    void detection_callback(const AdvertisedDevice& device,
                            const AdvertisementData& advertisement) {
        try {
            if (device.name != expected_name_) return;
            parse_advertisement(device.address, advertisement.service_data);
        } catch (const ScanCancelled&) {
            throw;
        } catch (const std::exception& e) {
            logger_.error("[" + device.address + "] Advertisement handling failed: " + e.what());
        }
    }

    void parse_advertisement(const std::string& source_address,
                             const std::vector<ServiceDataEntry>& entries) {
        for (const auto& entry : entries) {
            if (entry.uuid != TELEMETRY_SERVICE_UUID) continue;
            ++stats_.frames_seen;

            const auto& data = entry.data;
            if (data.size() != TELEMETRY_FRAME_LEN && data.size() != LEGACY_FRAME_LEN) {
                ++stats_.not_telemetry;
                logger_.debug("[" + source_address + "] Not a telemetry payload (" +
                              std::to_string(data.size()) + " bytes)");
                continue;
            }

            // The MAC covers everything in front of it, legacy prefix included.
            const size_t body_len = data.size() - MAC_TRUNC_LEN;
            if (!verifier_.verify(data.data(), body_len,
                                  data.data() + body_len, MAC_TRUNC_LEN)) {
                ++stats_.auth_failures;
                logger_.warning("[" + source_address + "] Invalid MAC, frame dropped: " +
                                to_hex_string(data));
                continue;
            }

            const uint8_t* payload = data.data();
            size_t payload_len = body_len;
            if (payload_len == TELEMETRY_PAYLOAD_LEN + TELEMETRY_SERVICE_PREFIX.size()) {
                if (!std::equal(TELEMETRY_SERVICE_PREFIX.begin(),
                                TELEMETRY_SERVICE_PREFIX.end(), payload)) {
                    ++stats_.not_telemetry;
                    logger_.debug("[" + source_address + "] Not a telemetry payload (unknown prefix)");
                    continue;
                }
                payload += TELEMETRY_SERVICE_PREFIX.size();
                payload_len -= TELEMETRY_SERVICE_PREFIX.size();
            }

            TelemetrySnapshot snapshot;
            try {
                snapshot = FrameDecoder::decode(payload, payload_len);
            } catch (const FrameLengthError& e) {
                ++stats_.decode_failures;
                logger_.error("[" + source_address + "] Failed to decode telemetry: " + e.what());
                continue;
            }

            auto prev = last_seen_.find(source_address);
            if (prev != last_seen_.end() && prev->second == snapshot) {
                ++stats_.duplicates;
            } else {
                last_seen_[source_address] = snapshot;
                ++stats_.forwarded;
                sink_(snapshot, source_address);
            }
            break;
        }
    }

    const ExtractorStats& stats() const { return stats_; }
    const std::string& expected_name() const { return expected_name_; }

    size_t tracked_sources() const { return last_seen_.size(); }

private:
    const SignatureVerifier& verifier_;
    TelemetrySink sink_;
    Logger& logger_;
    std::string expected_name_;

    std::map<std::string, TelemetrySnapshot> last_seen_;
    ExtractorStats stats_;
};

} // namespace btlm

#endif // BTLM_EXTRACTOR_HPP
