#pragma once
/*
 * ============================================================================
 * BTLM Capture Replay – text capture advertisement source
 * ============================================================================
 *
 * PURPOSE:
 *   Feeds recorded advertisements through the same IAdvertisementSource
 *   contract as the live scanner, for headless runs, demos and tests.
 *
 * CAPTURE FORMAT (one advertisement per line):
 *
 *   address|name|uuid=hex[,uuid=hex...]
 *
 *   24:6F:28:AA:BB:CC|ESP32 TLM Beacon|0000feaa-0000-1000-8000-00805f9b34fb=2001...
 *
 *   Blank lines and lines starting with '#' are skipped. The service-data
 *   field may be empty. Hex digits may be separated by ':' or spaces.
 *
 * ============================================================================
 */

#include "btlm_frame.hpp"
#include "btlm_interfaces.hpp"
#include "btlm_log.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <istream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace btlm {

struct CaptureEntry {
    AdvertisedDevice device;
    AdvertisementData data;
};

namespace capture {

inline std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return std::string();
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

inline int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Throws std::invalid_argument on odd digit counts or non-hex characters.
inline std::vector<uint8_t> parse_hex(const std::string& text) {
    std::vector<uint8_t> out;
    int high = -1;
    for (char c : text) {
        if (c == ':' || c == ' ') continue;
        int v = hex_value(c);
        if (v < 0) {
            throw std::invalid_argument(std::string("Invalid hex character '") + c + "'");
        }
        if (high < 0) {
            high = v;
        } else {
            out.push_back(static_cast<uint8_t>((high << 4) | v));
            high = -1;
        }
    }
    if (high >= 0) {
        throw std::invalid_argument("Odd number of hex digits");
    }
    return out;
}

inline std::string to_plain_hex(const std::vector<uint8_t>& bytes) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

} // namespace capture

// std::nullopt for blank and comment lines; std::invalid_argument for
// malformed ones.
inline std::optional<CaptureEntry> parse_capture_line(const std::string& raw) {
    const std::string line = capture::trim(raw);
    if (line.empty() || line[0] == '#') return std::nullopt;

    size_t first = line.find('|');
    size_t second = first == std::string::npos ? std::string::npos : line.find('|', first + 1);
    if (second == std::string::npos) {
        throw std::invalid_argument("Capture line needs 'address|name|service-data': " + line);
    }

    CaptureEntry entry;
    entry.device.address = capture::trim(line.substr(0, first));
    entry.device.name = capture::trim(line.substr(first + 1, second - first - 1));
    entry.data.local_name = entry.device.name;
    if (entry.device.address.empty()) {
        throw std::invalid_argument("Capture line has an empty address: " + line);
    }

    std::stringstream fields(line.substr(second + 1));
    std::string field;
    while (std::getline(fields, field, ',')) {
        field = capture::trim(field);
        if (field.empty()) continue;

        size_t eq = field.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw std::invalid_argument("Service data must be 'uuid=hex': " + field);
        }
        ServiceDataEntry sd;
        sd.uuid = capture::trim(field.substr(0, eq));
        sd.data = capture::parse_hex(capture::trim(field.substr(eq + 1)));
        entry.data.service_data.push_back(std::move(sd));
    }
    return entry;
}

inline std::string format_capture_line(const std::string& address, const std::string& name,
                                       const std::vector<ServiceDataEntry>& service_data) {
    std::string line = address + "|" + name + "|";
    for (size_t i = 0; i < service_data.size(); ++i) {
        if (i > 0) line += ",";
        line += service_data[i].uuid + "=" + capture::to_plain_hex(service_data[i].data);
    }
    return line;
}

/* ============================================================================
 * CaptureReplaySource
 * ============================================================================
 */

class CaptureReplaySource final : public IAdvertisementSource {
public:
    // interval_ms paces delivery (0 replays as fast as poll() is called).
    CaptureReplaySource(std::unique_ptr<std::istream> input, Logger& logger, int interval_ms = 0)
        : input_(std::move(input)), logger_(logger), interval_ms_(interval_ms) {
        if (!input_) throw std::invalid_argument("CaptureReplaySource requires an input stream");
    }

    static std::unique_ptr<CaptureReplaySource> from_file(const std::string& path, Logger& logger,
                                                          int interval_ms = 0) {
        auto file = std::make_unique<std::ifstream>(path);
        if (!file->is_open()) {
            throw std::runtime_error("Cannot open capture file: " + path);
        }
        return std::make_unique<CaptureReplaySource>(std::move(file), logger, interval_ms);
    }

    void start() override {
        started_ = true;
        logger_.info("Capture replay started");
    }

    void stop() override {
        if (!started_) return;
        started_ = false;
        logger_.info("Capture replay stopped after " + std::to_string(delivered_) +
                     " advertisements");
    }

    // Delivers one advertisement per call.
    bool poll(const DetectionCallback& callback, int timeout_ms) override {
        (void)timeout_ms;
        if (!started_) throw std::logic_error("CaptureReplaySource polled before start()");

        std::string line;
        while (std::getline(*input_, line)) {
            ++line_number_;
            std::optional<CaptureEntry> entry;
            try {
                entry = parse_capture_line(line);
            } catch (const std::invalid_argument& e) {
                ++skipped_;
                logger_.warning("Capture line " + std::to_string(line_number_) +
                                " skipped: " + e.what());
                continue;
            }
            if (!entry) continue;

            if (interval_ms_ > 0 && delivered_ > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms_));
            }
            ++delivered_;
            callback(entry->device, entry->data);
            return true;
        }
        return false;
    }

    uint64_t delivered() const { return delivered_; }
    uint64_t skipped() const { return skipped_; }

private:
    std::unique_ptr<std::istream> input_;
    Logger& logger_;
    int interval_ms_;
    bool started_ = false;
    uint64_t line_number_ = 0;
    uint64_t delivered_ = 0;
    uint64_t skipped_ = 0;
};

} // namespace btlm
