#pragma once
/*
 * ============================================================================
 * BTLM HCI Report Parsing
 * ============================================================================
 *
 * Decodes LE Advertising Report events and the AD structures they carry into
 * the AdvertisementData the extractor consumes. Pure byte parsing; the
 * socket side lives in btlm_hci_scanner.hpp.
 *
 * ============================================================================
 */

#include "btlm_interfaces.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace btlm {
namespace hci {

constexpr uint8_t LE_SUBEVT_ADVERTISING_REPORT = 0x02;

// AD types (Bluetooth CSS part A)
constexpr uint8_t AD_SHORT_NAME = 0x08;
constexpr uint8_t AD_COMPLETE_NAME = 0x09;
constexpr uint8_t AD_SERVICE_DATA_16 = 0x16;
constexpr uint8_t AD_SERVICE_DATA_32 = 0x20;
constexpr uint8_t AD_SERVICE_DATA_128 = 0x21;

/* ============================================================================
 * PARSING
 * ============================================================================
 */

// Bluetooth base UUID expansion: 0xFEAA -> "0000feaa-0000-1000-8000-00805f9b34fb"
inline std::string uuid32_to_string(uint32_t uuid) {
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%08x-0000-1000-8000-00805f9b34fb", uuid);
    return buf;
}

inline std::string uuid16_to_string(uint16_t uuid) {
    return uuid32_to_string(uuid);
}

// 16 bytes, little-endian as transmitted
inline std::string uuid128_to_string(const uint8_t* le) {
    char buf[40];
    std::snprintf(buf, sizeof(buf),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  le[15], le[14], le[13], le[12], le[11], le[10], le[9], le[8],
                  le[7], le[6], le[5], le[4], le[3], le[2], le[1], le[0]);
    return buf;
}

// 6 bytes, little-endian as transmitted -> "AA:BB:CC:DD:EE:FF"
inline std::string format_bdaddr(const uint8_t* le) {
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X",
                  le[5], le[4], le[3], le[2], le[1], le[0]);
    return buf;
}

// Walks the length-type-value AD structures of one advertising payload.
// Malformed trailing structures are ignored.
inline void parse_ad_structures(const uint8_t* data, size_t len, AdvertisementData& out) {
    size_t pos = 0;
    while (pos < len) {
        const uint8_t field_len = data[pos];
        if (field_len == 0) break;
        if (pos + 1 + field_len > len) break;

        const uint8_t type = data[pos + 1];
        const uint8_t* value = data + pos + 2;
        const size_t value_len = field_len - 1;

        switch (type) {
            case AD_SHORT_NAME:
            case AD_COMPLETE_NAME:
                if (type == AD_COMPLETE_NAME || out.local_name.empty()) {
                    out.local_name.assign(reinterpret_cast<const char*>(value), value_len);
                }
                break;
            case AD_SERVICE_DATA_16:
                if (value_len >= 2) {
                    uint16_t uuid = static_cast<uint16_t>(value[0] | (value[1] << 8));
                    out.service_data.push_back(
                        {uuid16_to_string(uuid), std::vector<uint8_t>(value + 2, value + value_len)});
                }
                break;
            case AD_SERVICE_DATA_32:
                if (value_len >= 4) {
                    uint32_t uuid = static_cast<uint32_t>(value[0]) |
                                    (static_cast<uint32_t>(value[1]) << 8) |
                                    (static_cast<uint32_t>(value[2]) << 16) |
                                    (static_cast<uint32_t>(value[3]) << 24);
                    out.service_data.push_back(
                        {uuid32_to_string(uuid), std::vector<uint8_t>(value + 4, value + value_len)});
                }
                break;
            case AD_SERVICE_DATA_128:
                if (value_len >= 16) {
                    out.service_data.push_back(
                        {uuid128_to_string(value), std::vector<uint8_t>(value + 16, value + value_len)});
                }
                break;
            default:
                break;
        }
        pos += 1 + field_len;
    }
}

struct AdvertisingReport {
    std::string address;
    AdvertisementData data;
};

// Parameters of an LE Advertising Report subevent, starting at the subevent
// code. Reports are laid out back to back (event type, address type,
// address, data length, data, rssi).
inline std::vector<AdvertisingReport> parse_advertising_report(const uint8_t* params, size_t len) {
    std::vector<AdvertisingReport> reports;
    if (len < 2 || params[0] != LE_SUBEVT_ADVERTISING_REPORT) return reports;

    const uint8_t count = params[1];
    size_t pos = 2;
    for (uint8_t i = 0; i < count; ++i) {
        if (pos + 9 > len) break;               // type, addr type, addr[6], data len
        const uint8_t* addr = params + pos + 2;
        const uint8_t data_len = params[pos + 8];
        if (pos + 9 + data_len + 1 > len) break;  // data + rssi

        AdvertisingReport report;
        report.address = format_bdaddr(addr);
        parse_ad_structures(params + pos + 9, data_len, report.data);
        report.data.rssi = static_cast<int8_t>(params[pos + 9 + data_len]);
        reports.push_back(std::move(report));

        pos += 9 + data_len + 1;
    }
    return reports;
}

} // namespace hci
} // namespace btlm
