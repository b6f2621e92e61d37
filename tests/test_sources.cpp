/*
 * ============================================================================
 * BTLM - ADVERTISEMENT SOURCE TESTS
 * ============================================================================
 *
 * HCI advertising report parsing and capture replay (no adapter needed)
 *
 * ============================================================================
 */

#include "btlm_extractor.hpp"
#include "btlm_frame.hpp"
#include "btlm_interfaces.hpp"
#include "btlm_log.hpp"
#include "btlm_signature.hpp"

#include "btlm_capture_replay.hpp"
#include "btlm_hci_report.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace btlm;

namespace {

const char* const BEACON = "ESP32 TLM Beacon";

std::vector<uint8_t> signed_frame(const SignatureVerifier& verifier, uint32_t adv) {
    std::vector<uint8_t> frame = {TELEMETRY_FRAME_TYPE, 0x01, 0x0E, 0x74, 0x00, 0x32,
                                  static_cast<uint8_t>(adv >> 24), static_cast<uint8_t>(adv >> 16),
                                  static_cast<uint8_t>(adv >> 8), static_cast<uint8_t>(adv),
                                  0x00, 0x00, 0x27, 0x10};
    auto mac = verifier.sign(frame);
    frame.insert(frame.end(), mac.begin(), mac.end());
    return frame;
}

// LE Advertising Report parameters carrying one report
std::vector<uint8_t> report_params(const std::vector<uint8_t>& ad, int8_t rssi) {
    std::vector<uint8_t> p = {hci::LE_SUBEVT_ADVERTISING_REPORT, 0x01,
                              0x00, 0x00,                              // ADV_IND, public
                              0xCC, 0xBB, 0xAA, 0x28, 0x6F, 0x24,      // 24:6F:28:AA:BB:CC
                              static_cast<uint8_t>(ad.size())};
    p.insert(p.end(), ad.begin(), ad.end());
    p.push_back(static_cast<uint8_t>(rssi));
    return p;
}

std::vector<uint8_t> beacon_ad(const std::vector<uint8_t>& frame) {
    std::vector<uint8_t> ad = {0x02, 0x01, 0x06};                      // flags
    ad.push_back(static_cast<uint8_t>(1 + std::string(BEACON).size()));
    ad.push_back(hci::AD_COMPLETE_NAME);
    ad.insert(ad.end(), BEACON, BEACON + std::string(BEACON).size());
    ad.push_back(static_cast<uint8_t>(1 + 2 + frame.size()));
    ad.push_back(hci::AD_SERVICE_DATA_16);
    ad.push_back(0xAA);
    ad.push_back(0xFE);
    ad.insert(ad.end(), frame.begin(), frame.end());
    return ad;
}

} // namespace

bool test_uuid_and_address_formatting() {
    std::cout << "Testing UUID and address formatting..." << std::flush;

    assert(hci::uuid16_to_string(0xFEAA) == TELEMETRY_SERVICE_UUID);
    assert(hci::uuid32_to_string(0x0000180F) == "0000180f-0000-1000-8000-00805f9b34fb");

    const uint8_t le128[16] = {0xfb, 0x34, 0x9b, 0x5f, 0x80, 0x00, 0x00, 0x80,
                               0x00, 0x10, 0x00, 0x00, 0xaa, 0xfe, 0x00, 0x00};
    assert(hci::uuid128_to_string(le128) == TELEMETRY_SERVICE_UUID);

    const uint8_t addr[6] = {0x01, 0x02, 0x03, 0x0A, 0x0B, 0xFF};
    assert(hci::format_bdaddr(addr) == "FF:0B:0A:03:02:01");

    std::cout << " PASS\n";
    return true;
}

bool test_parse_ad_structures() {
    std::cout << "Testing AD structure parsing..." << std::flush;

    SignatureVerifier verifier("secretKey");
    auto frame = signed_frame(verifier, 7);

    AdvertisementData data;
    auto ad = beacon_ad(frame);
    hci::parse_ad_structures(ad.data(), ad.size(), data);

    assert(data.local_name == BEACON);
    assert(data.service_data.size() == 1);
    assert(data.service_data[0].uuid == TELEMETRY_SERVICE_UUID);
    assert(data.service_data[0].data == frame);

    // Complete name wins over the shortened one, in either order
    const std::vector<uint8_t> names = {0x03, hci::AD_SHORT_NAME, 'E', 'S',
                                        0x04, hci::AD_COMPLETE_NAME, 'E', 'S', 'P',
                                        0x03, hci::AD_SHORT_NAME, 'X', 'Y'};
    AdvertisementData named;
    hci::parse_ad_structures(names.data(), names.size(), named);
    assert(named.local_name == "ESP");

    // A structure running past the end is dropped, earlier ones survive
    std::vector<uint8_t> truncated = ad;
    truncated.resize(ad.size() - 5);
    AdvertisementData partial;
    hci::parse_ad_structures(truncated.data(), truncated.size(), partial);
    assert(partial.local_name == BEACON);
    assert(partial.service_data.empty());

    // 128-bit service data
    std::vector<uint8_t> wide = {static_cast<uint8_t>(1 + 16 + 2), hci::AD_SERVICE_DATA_128,
                                 0xfb, 0x34, 0x9b, 0x5f, 0x80, 0x00, 0x00, 0x80,
                                 0x00, 0x10, 0x00, 0x00, 0xaa, 0xfe, 0x00, 0x00,
                                 0x12, 0x34};
    AdvertisementData wide_data;
    hci::parse_ad_structures(wide.data(), wide.size(), wide_data);
    assert(wide_data.service_data.size() == 1);
    assert(wide_data.service_data[0].uuid == TELEMETRY_SERVICE_UUID);
    assert((wide_data.service_data[0].data == std::vector<uint8_t>{0x12, 0x34}));

    std::cout << " PASS\n";
    return true;
}

bool test_parse_advertising_report() {
    std::cout << "Testing LE advertising report parsing..." << std::flush;

    SignatureVerifier verifier("secretKey");
    auto params = report_params(beacon_ad(signed_frame(verifier, 7)), -60);

    auto reports = hci::parse_advertising_report(params.data(), params.size());
    assert(reports.size() == 1);
    assert(reports[0].address == "24:6F:28:AA:BB:CC");
    assert(reports[0].data.rssi == -60);
    assert(reports[0].data.local_name == BEACON);
    assert(reports[0].data.service_data.size() == 1);

    // Claims two reports but carries one
    params[1] = 0x02;
    assert(hci::parse_advertising_report(params.data(), params.size()).size() == 1);

    // Cut inside the first report
    assert(hci::parse_advertising_report(params.data(), 12).empty());

    // Other subevents are ignored
    params[0] = 0x01;
    assert(hci::parse_advertising_report(params.data(), params.size()).empty());

    std::cout << " PASS\n";
    return true;
}

bool test_parse_capture_line() {
    std::cout << "Testing capture line parsing..." << std::flush;

    assert(!parse_capture_line(""));
    assert(!parse_capture_line("   "));
    assert(!parse_capture_line("# recorded 2026-03-01"));

    auto entry = parse_capture_line(
        "24:6F:28:AA:BB:CC|ESP32 TLM Beacon|0000feaa-0000-1000-8000-00805f9b34fb=20:01:0e:74, "
        "0000180f-0000-1000-8000-00805f9b34fb=64");
    assert(entry);
    assert(entry->device.address == "24:6F:28:AA:BB:CC");
    assert(entry->device.name == BEACON);
    assert(entry->data.local_name == BEACON);
    assert(entry->data.service_data.size() == 2);
    assert((entry->data.service_data[0].data == std::vector<uint8_t>{0x20, 0x01, 0x0E, 0x74}));
    assert((entry->data.service_data[1].data == std::vector<uint8_t>{0x64}));

    auto bare = parse_capture_line("11:22:33:44:55:66||");
    assert(bare && bare->device.name.empty() && bare->data.service_data.empty());

    const char* bad[] = {
        "no separators",
        "|name|",
        "AA:BB|name|uuid-without-value",
        "AA:BB|name|uuid=abc",
        "AA:BB|name|uuid=zz"
    };
    for (const char* line : bad) {
        bool threw = false;
        try {
            parse_capture_line(line);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    std::vector<ServiceDataEntry> sd = {{TELEMETRY_SERVICE_UUID, {0x20, 0xAB}}};
    assert(format_capture_line("24:6F:28:AA:BB:CC", BEACON, sd) ==
           "24:6F:28:AA:BB:CC|ESP32 TLM Beacon|0000feaa-0000-1000-8000-00805f9b34fb=20ab");

    std::cout << " PASS\n";
    return true;
}

bool test_capture_replay_source() {
    std::cout << "Testing capture replay source..." << std::flush;

    Logger logger;
    auto input = std::make_unique<std::istringstream>(
        "# capture\n"
        "AA:AA:AA:AA:AA:01|one|\n"
        "broken line\n"
        "\n"
        "AA:AA:AA:AA:AA:02|two|\n");
    CaptureReplaySource source(std::move(input), logger);

    std::vector<std::string> seen;
    DetectionCallback collect = [&seen](const AdvertisedDevice& d, const AdvertisementData&) {
        seen.push_back(d.name);
    };

    bool threw = false;
    try {
        source.poll(collect, 0);
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    {
        ScanSession session(source);
        assert(session.poll(collect, 0));
        assert(session.poll(collect, 0));
        assert(!session.poll(collect, 0));
    }

    assert((seen == std::vector<std::string>{"one", "two"}));
    assert(source.delivered() == 2);
    assert(source.skipped() == 1);

    bool missing = false;
    try {
        CaptureReplaySource::from_file("/nonexistent/btlm/capture.txt", logger);
    } catch (const std::runtime_error&) {
        missing = true;
    }
    assert(missing);

    std::cout << " PASS\n";
    return true;
}

bool test_replay_through_extractor() {
    std::cout << "Testing replay through the extractor..." << std::flush;

    Logger logger;
    SignatureVerifier verifier("secretKey");

    std::ostringstream capture;
    for (uint32_t adv : {1u, 1u, 2u}) {
        capture << format_capture_line("24:6F:28:AA:BB:CC", BEACON,
                                       {{TELEMETRY_SERVICE_UUID, signed_frame(verifier, adv)}})
                << "\n";
    }
    // Right frame, wrong beacon name
    capture << format_capture_line("24:6F:28:AA:BB:DD", "Other",
                                   {{TELEMETRY_SERVICE_UUID, signed_frame(verifier, 9)}})
            << "\n";

    std::vector<uint32_t> forwarded;
    FrameExtractor extractor(
        verifier,
        [&forwarded](const TelemetrySnapshot& s, const std::string&) {
            forwarded.push_back(s.adv_count);
        },
        logger);

    CaptureReplaySource source(std::make_unique<std::istringstream>(capture.str()), logger);
    DetectionCallback on_detection =
        [&extractor](const AdvertisedDevice& d, const AdvertisementData& a) {
            extractor.detection_callback(d, a);
        };
    {
        ScanSession session(source);
        while (session.poll(on_detection, 0)) {
        }
    }

    assert((forwarded == std::vector<uint32_t>{1, 2}));
    assert(extractor.stats().duplicates == 1);

    std::cout << " PASS\n";
    return true;
}

int main() {
    std::cout << "============================================================================\n";
    std::cout << "BTLM ADVERTISEMENT SOURCE TESTS\n";
    std::cout << "============================================================================\n\n";

    try {
        bool all_passed = true;

        all_passed &= test_uuid_and_address_formatting();
        all_passed &= test_parse_ad_structures();
        all_passed &= test_parse_advertising_report();
        all_passed &= test_parse_capture_line();
        all_passed &= test_capture_replay_source();
        all_passed &= test_replay_through_extractor();

        std::cout << "\n============================================================================\n";
        if (all_passed) {
            std::cout << "✓ All source tests PASSED\n";
        } else {
            std::cout << "✗ Some tests FAILED\n";
            return 1;
        }
        std::cout << "============================================================================\n";

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
