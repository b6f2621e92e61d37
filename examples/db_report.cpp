/*
 * ============================================================================
 * BTLM DATABASE REPORT
 * ============================================================================
 *
 * Read-only summary of a telemetry database: devices, their batteries and
 * the latest telemetry row of each battery.
 *
 * Run:
 *   ./btlm_db_report telemetry.db
 *   ./btlm_db_report telemetry.db --label "Main pack"
 *   ./btlm_db_report telemetry.db --mac 24:6F:28:AA:BB:CC
 *
 * ============================================================================
 */

#include "btlm_config.hpp"
#include "btlm_frame.hpp"
#include "btlm_storage.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace btlm;

static void print_battery(ITelemetryStore& store, const Battery& battery) {
    auto rows = store.get_telemetry_by_battery_id(battery.battery_id);

    std::cout << "    battery " << std::setw(6) << battery.battery_id
              << "  label " << std::setw(14) << battery.display_label()
              << "  R " << std::setw(6) << battery.resistance
              << "  C " << std::setw(6) << battery.capacity
              << "  I " << std::setw(6) << battery.discharge_current
              << "  rows " << rows.size() << "\n";

    if (!rows.empty()) {
        const TelemetryRecord& last = rows.back();
        std::cout << "      latest: " << last.voltage << " mV, adv " << last.adv_count
                  << ", uptime " << std::fixed << std::setprecision(1) << last.uptime_s << " s, "
                  << charger_mode_name(last.mode) << "\n";
    }
}

static void print_device(ITelemetryStore& store, const Device& device) {
    std::cout << "device " << device.device_id << "  " << device.device_uuid;
    if (device.name) std::cout << "  \"" << *device.name << "\"";
    if (device.mac_address) std::cout << "  mac " << *device.mac_address;
    std::cout << "  first seen " << device.first_seen << "\n";

    for (const auto& battery : store.get_batteries_by_device_id(device.device_id)) {
        print_battery(store, battery);
    }
}

int main(int argc, char** argv) {
    std::string db_path = "telemetry.db";
    std::string label;
    std::string mac;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--label" && i + 1 < argc) {
            label = argv[++i];
        } else if (arg == "--mac" && i + 1 < argc) {
            mac = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [DB] [--label LABEL] [--mac ADDRESS]\n";
            return 0;
        } else {
            db_path = arg;
        }
    }

    std::cout << "============================================================================\n";
    std::cout << "BTLM DATABASE REPORT v" << get_version_string() << " - " << db_path << "\n";
    std::cout << "============================================================================\n\n";

    try {
        SqliteTelemetryStore store(db_path);

        if (!label.empty()) {
            auto batteries = store.get_batteries_by_label(label);
            if (batteries.empty()) {
                std::cout << "No battery labelled '" << label << "'\n";
                return 1;
            }
            for (const auto& battery : batteries) {
                print_battery(store, battery);
            }
            return 0;
        }

        if (!mac.empty()) {
            auto device = store.get_device_by_mac(mac);
            if (!device) device = store.get_device_by_external_id(mac);
            if (!device) {
                std::cout << "No device with address " << mac << "\n";
                return 1;
            }
            print_device(store, *device);
            return 0;
        }

        auto devices = store.list_devices();
        for (const auto& device : devices) {
            print_device(store, device);
        }
        std::cout << "\n" << devices.size() << " devices, " << store.list_batteries().size()
                  << " batteries, " << store.list_telemetry().size() << " telemetry rows\n";
    } catch (const StorageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
