/*
 * ============================================================================
 * BTLM TELEMETRY FRAME
 * ============================================================================
 *
 * Wire format of the authenticated telemetry advertisement broadcast by the
 * charger beacons. Service data keyed by the telemetry service UUID, all
 * multi-byte fields big-endian:
 *
 *   Offset  Size  Field
 *   0       1     frame type (0x20)
 *   1       1     version
 *   2       2     battery millivolts      (unsigned)
 *   4       2     resistance raw          (signed)
 *   6       4     advertisement counter   (unsigned)
 *   10      4     uptime raw              (unsigned)
 *   14      4     truncated HMAC-SHA256(secret, bytes[0..14])
 *
 * Legacy transmitters repeat the 2-byte service UUID in front of the payload
 * (20 bytes in total). Their MAC covers the prefixed form.
 *
 * ============================================================================
 */

#ifndef BTLM_FRAME_HPP
#define BTLM_FRAME_HPP

#include <array>
#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

namespace btlm {

// ============================================================================
// WIRE CONSTANTS
// ============================================================================

constexpr const char* TELEMETRY_SERVICE_UUID = "0000feaa-0000-1000-8000-00805f9b34fb";

// 0xFEAA as transmitted (little-endian)
constexpr std::array<uint8_t, 2> TELEMETRY_SERVICE_PREFIX = {0xAA, 0xFE};

constexpr uint8_t TELEMETRY_FRAME_TYPE = 0x20;
constexpr size_t TELEMETRY_PAYLOAD_LEN = 14;
constexpr size_t MAC_TRUNC_LEN = 4;
constexpr size_t TELEMETRY_FRAME_LEN = TELEMETRY_PAYLOAD_LEN + MAC_TRUNC_LEN;
constexpr size_t LEGACY_FRAME_LEN = TELEMETRY_FRAME_LEN + TELEMETRY_SERVICE_PREFIX.size();

// The uptime field is documented in tenths of a second, but deployed firmware
// is decoded with a divisor of 1000. Kept as-is until the firmware units are
// confirmed.
constexpr double UPTIME_DIVISOR = 1000.0;

// ============================================================================
// DECODED FRAME
// ============================================================================

enum class ChargerMode : uint8_t {
    Charge = 0,
    Discharge = 1,
    Analysis = 2,
    InternalResistance = 3
};

inline const char* charger_mode_name(int mode) {
    switch (mode) {
        case 0: return "Charge";
        case 1: return "Discharge";
        case 2: return "Analysis";
        case 3: return "InternalResistance";
        default: return "Unknown";
    }
}

/*
 * Strongly-typed result of a successful decode. The last three fields are not
 * carried by the current frame layout and stay zero ("unknown").
 */
struct TelemetrySnapshot {
    uint8_t frame_type = 0;
    uint8_t version = 0;
    uint16_t battery_mv = 0;
    int16_t resistance_raw = 0;
    uint32_t adv_count = 0;
    double uptime_s = 0.0;

    int32_t capacity = 0;
    int32_t discharge_current = 0;
    uint8_t mode = 0;

    bool operator==(const TelemetrySnapshot& o) const {
        return frame_type == o.frame_type &&
               version == o.version &&
               battery_mv == o.battery_mv &&
               resistance_raw == o.resistance_raw &&
               adv_count == o.adv_count &&
               uptime_s == o.uptime_s &&
               capacity == o.capacity &&
               discharge_current == o.discharge_current &&
               mode == o.mode;
    }

    bool operator!=(const TelemetrySnapshot& o) const { return !(*this == o); }
};

// ============================================================================
// ERRORS
// ============================================================================

class FrameLengthError : public std::runtime_error {
public:
    FrameLengthError(size_t expected, size_t actual)
        : std::runtime_error("Telemetry payload length mismatch: expected " +
                             std::to_string(expected) + ", got " +
                             std::to_string(actual)),
          expected_(expected),
          actual_(actual) {}

    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

// ============================================================================
// DECODER
// ============================================================================

class FrameDecoder {
public:
    static TelemetrySnapshot decode(const uint8_t* payload, size_t len) {
        if (len != TELEMETRY_PAYLOAD_LEN) {
            throw FrameLengthError(TELEMETRY_PAYLOAD_LEN, len);
        }

        TelemetrySnapshot s;
        s.frame_type = payload[0];
        s.version = payload[1];
        s.battery_mv = read_u16_be(payload + 2);
        s.resistance_raw = static_cast<int16_t>(read_u16_be(payload + 4));
        s.adv_count = read_u32_be(payload + 6);
        s.uptime_s = read_u32_be(payload + 10) / UPTIME_DIVISOR;
        return s;
    }

    static TelemetrySnapshot decode(const std::vector<uint8_t>& payload) {
        return decode(payload.data(), payload.size());
    }

private:
    static uint16_t read_u16_be(const uint8_t* p) {
        return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
    }

    static uint32_t read_u32_be(const uint8_t* p) {
        return (static_cast<uint32_t>(p[0]) << 24) |
               (static_cast<uint32_t>(p[1]) << 16) |
               (static_cast<uint32_t>(p[2]) << 8) |
               static_cast<uint32_t>(p[3]);
    }
};

// ============================================================================
// HEX HELPERS
// ============================================================================

// {0x01, 0xab} -> "01:ab"
inline std::string to_hex_string(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len * 3);
    char buf[4];
    for (size_t i = 0; i < len; ++i) {
        std::snprintf(buf, sizeof(buf), "%02x", data[i]);
        if (i > 0) out += ':';
        out += buf;
    }
    return out;
}

inline std::string to_hex_string(const std::vector<uint8_t>& data) {
    return to_hex_string(data.data(), data.size());
}

} // namespace btlm

#endif // BTLM_FRAME_HPP
