/*
 * ============================================================================
 * BTLM - STORAGE & IDENTITY REPOSITORY TESTS
 * ============================================================================
 *
 * Runs against private in-memory SQLite databases
 *
 * ============================================================================
 */

#include "btlm_frame.hpp"
#include "btlm_interfaces.hpp"
#include "btlm_log.hpp"
#include "btlm_repository.hpp"
#include "btlm_storage.hpp"
#include "test_support.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace btlm;
using btlm::testing::FixedClock;
using btlm::testing::InstrumentedStore;

namespace {

TelemetrySnapshot snapshot(uint16_t mv, uint32_t adv,
                           int16_t resistance = 0, int32_t capacity = 0, int32_t discharge = 0) {
    TelemetrySnapshot s;
    s.frame_type = TELEMETRY_FRAME_TYPE;
    s.version = 1;
    s.battery_mv = mv;
    s.adv_count = adv;
    s.uptime_s = adv * 0.5;
    s.resistance_raw = resistance;
    s.capacity = capacity;
    s.discharge_current = discharge;
    return s;
}

const char* const ADDR_A = "24:6F:28:00:00:0A";
const char* const ADDR_B = "24:6F:28:00:00:0B";

} // namespace

bool test_store_crud() {
    std::cout << "Testing SQLite store CRUD..." << std::flush;

    SqliteTelemetryStore store(":memory:");

    Device d;
    d.device_uuid = ADDR_A;
    d.first_seen = 1000;
    d.device_id = store.insert_device(d);
    assert(d.device_id > 0);

    auto loaded = store.get_device(d.device_id);
    assert(loaded && loaded->device_uuid == ADDR_A);
    assert(!loaded->mac_address && !loaded->name);
    assert(store.get_device_by_external_id(ADDR_A)->device_id == d.device_id);
    assert(!store.get_device_by_external_id(ADDR_B));

    assert(store.set_mac_address_by_device_id(d.device_id, "AA:BB:CC:DD:EE:FF") == 1);
    assert(store.set_mac_address_by_device_id(9999, "AA:BB:CC:DD:EE:FF") == 0);
    assert(store.get_device_by_mac("AA:BB:CC:DD:EE:FF")->device_id == d.device_id);

    Battery b;
    b.device_id = d.device_id;
    b.battery_id = store.insert_battery(b);
    auto battery = store.get_battery(b.battery_id);
    assert(battery && !battery->label);
    assert(battery->display_label() == std::to_string(b.battery_id));

    assert(store.set_label_by_battery_id(b.battery_id, "Main pack") == 1);
    assert(store.get_batteries_by_label("Main pack").size() == 1);
    assert(store.get_batteries_by_label("Spare").empty());
    assert(store.get_batteries_by_device_id(d.device_id).size() == 1);

    TelemetryRecord r;
    r.voltage = 3700;
    r.adv_count = 7;
    r.uptime_s = 10.0;
    r.mode = 2;
    r.battery_id = b.battery_id;
    r.recorded_at = 1001;
    int64_t first_id = store.insert_telemetry(r);
    r.voltage = 3690;
    store.insert_telemetry(r);

    auto rows = store.get_telemetry_by_battery_id(b.battery_id);
    assert(rows.size() == 2);
    assert(rows[0].telemetry_id == first_id);
    assert(rows[0].voltage == 3700 && rows[1].voltage == 3690);
    assert(std::fabs(rows[0].uptime_s - 10.0) < 1e-9);
    assert(store.get_telemetry(first_id)->mode == 2);
    assert(store.list_telemetry().size() == 2);

    std::cout << " PASS\n";
    return true;
}

bool test_store_constraints() {
    std::cout << "Testing SQLite store constraints..." << std::flush;

    SqliteTelemetryStore store(":memory:");

    Device d;
    d.device_uuid = ADDR_A;
    store.insert_device(d);

    bool threw = false;
    try {
        store.insert_device(d);  // device_uuid is unique
    } catch (const StorageError&) {
        threw = true;
    }
    assert(threw);

    Battery orphan;
    orphan.device_id = 4242;
    threw = false;
    try {
        store.insert_battery(orphan);
    } catch (const StorageError&) {
        threw = true;
    }
    assert(threw);

    std::cout << " PASS\n";
    return true;
}

bool test_save_creates_one_identity() {
    std::cout << "Testing save_telemetry identity creation..." << std::flush;

    SqliteTelemetryStore store(":memory:");
    FixedClock clock(1700000000);
    Logger logger;
    IdentityRepository repo(store, clock, logger);

    auto first = repo.save_telemetry(snapshot(3700, 7), ADDR_A);
    clock.advance(5);
    auto second = repo.save_telemetry(snapshot(3690, 8), ADDR_A);

    assert(store.list_devices().size() == 1);
    assert(store.list_batteries().size() == 1);
    assert(store.list_telemetry().size() == 2);
    assert(first.battery_id == second.battery_id);
    assert(first.recorded_at == 1700000000);
    assert(second.recorded_at == 1700000005);
    assert(store.list_devices()[0].first_seen == 1700000000);

    auto battery = repo.get_battery_by_external_id(ADDR_A);
    assert(battery && battery->battery_id == first.battery_id);
    assert(repo.get_device_by_external_id(ADDR_A)->device_uuid == ADDR_A);
    assert(!repo.get_battery_by_external_id(ADDR_B));

    repo.save_telemetry(snapshot(3800, 1), ADDR_B);
    assert(store.list_devices().size() == 2);
    assert(store.list_batteries().size() == 2);
    assert(repo.cached_devices() == 2);
    assert(repo.cached_batteries() == 2);

    std::cout << " PASS\n";
    return true;
}

bool test_last_known_fields() {
    std::cout << "Testing last-known battery fields..." << std::flush;

    SqliteTelemetryStore sqlite(":memory:");
    InstrumentedStore store(sqlite);
    FixedClock clock(1700000000);
    Logger logger;
    IdentityRepository repo(store, clock, logger);

    auto rec = repo.save_telemetry(snapshot(3700, 1, 50, 2000, 500), ADDR_A);
    assert(store.battery_updates == 3);  // one persist per refreshed field

    auto stored = sqlite.get_battery(rec.battery_id);
    assert(stored->resistance == 50);
    assert(stored->capacity == 2000);
    assert(stored->discharge_current == 500);

    // Zero (and negative resistance) never overwrite
    repo.save_telemetry(snapshot(3690, 2, 0, 0, 0), ADDR_A);
    repo.save_telemetry(snapshot(3680, 3, -5, 0, 0), ADDR_A);
    assert(store.battery_updates == 3);
    stored = sqlite.get_battery(rec.battery_id);
    assert(stored->resistance == 50);
    assert(stored->capacity == 2000);
    assert(stored->discharge_current == 500);

    // Positive values always overwrite, even when smaller
    repo.save_telemetry(snapshot(3670, 4, 45, 0, 0), ADDR_A);
    assert(store.battery_updates == 4);
    stored = sqlite.get_battery(rec.battery_id);
    assert(stored->resistance == 45);
    assert(stored->capacity == 2000);

    // The telemetry rows keep the raw values
    auto rows = sqlite.get_telemetry_by_battery_id(rec.battery_id);
    assert(rows.size() == 4);
    assert(rows[1].resistance == 0);
    assert(rows[2].resistance == -5);

    std::cout << " PASS\n";
    return true;
}

bool test_update_battery_label() {
    std::cout << "Testing update_battery_label..." << std::flush;

    SqliteTelemetryStore store(":memory:");
    FixedClock clock(1700000000);
    Logger logger;
    IdentityRepository repo(store, clock, logger);

    bool threw = false;
    try {
        repo.update_battery_label(ADDR_A, "Main pack");
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    auto rec = repo.save_telemetry(snapshot(3700, 1, 50), ADDR_A);
    repo.update_battery_label(ADDR_A, "Main pack");

    assert(repo.get_battery_by_external_id(ADDR_A)->label == std::string("Main pack"));
    auto stored = store.get_battery(rec.battery_id);
    assert(stored->label == std::string("Main pack"));
    assert(stored->resistance == 50);  // label update keeps the other fields

    std::cout << " PASS\n";
    return true;
}

bool test_preload_and_restart() {
    std::cout << "Testing preload from an existing database..." << std::flush;

    SqliteTelemetryStore store(":memory:");
    FixedClock clock(1700000000);
    Logger logger;

    int64_t battery_id = 0;
    {
        IdentityRepository first_session(store, clock, logger);
        battery_id = first_session.save_telemetry(snapshot(3700, 1, 50), ADDR_A).battery_id;
        first_session.update_battery_label(ADDR_A, "Main pack");
    }

    IdentityRepository repo(store, clock, logger);
    assert(repo.cached_devices() == 1);
    assert(repo.cached_batteries() == 0);  // batteries load lazily

    auto rec = repo.save_telemetry(snapshot(3650, 2), ADDR_A);
    assert(rec.battery_id == battery_id);
    assert(store.list_devices().size() == 1);
    assert(store.list_batteries().size() == 1);
    assert(repo.get_battery_by_external_id(ADDR_A)->label == std::string("Main pack"));

    std::cout << " PASS\n";
    return true;
}

bool test_reload() {
    std::cout << "Testing reload..." << std::flush;

    SqliteTelemetryStore store(":memory:");
    FixedClock clock(1700000000);
    Logger logger;
    IdentityRepository repo(store, clock, logger);

    repo.save_telemetry(snapshot(3700, 1), ADDR_A);

    // Written behind the repository's back
    Device other;
    other.device_uuid = ADDR_B;
    store.insert_device(other);
    assert(repo.cached_devices() == 1);

    repo.reload();
    assert(repo.cached_devices() == 2);
    assert(repo.cached_batteries() == 0);

    repo.save_telemetry(snapshot(3700, 2), ADDR_B);
    assert(store.list_devices().size() == 2);

    std::cout << " PASS\n";
    return true;
}

bool test_update_device_details() {
    std::cout << "Testing update_device_details..." << std::flush;

    SqliteTelemetryStore store(":memory:");
    FixedClock clock(1700000000);
    Logger logger;
    IdentityRepository repo(store, clock, logger);

    repo.update_device_details(ADDR_A, std::string(ADDR_A), std::string("beacon"));  // unknown: no-op
    assert(store.list_devices().empty());

    repo.save_telemetry(snapshot(3700, 1), ADDR_A);
    repo.update_device_details(ADDR_A, std::string(ADDR_A), std::string("ESP32 TLM Beacon"));

    auto device = store.get_device_by_external_id(ADDR_A);
    assert(device->mac_address == std::string(ADDR_A));
    assert(device->name == std::string("ESP32 TLM Beacon"));

    // Empty names do not erase a known one
    repo.update_device_details(ADDR_A, std::nullopt, std::string(""));
    assert(store.get_device_by_external_id(ADDR_A)->name == std::string("ESP32 TLM Beacon"));

    std::cout << " PASS\n";
    return true;
}

bool test_storage_failure_propagates() {
    std::cout << "Testing storage failure surfaces as StorageError..." << std::flush;

    SqliteTelemetryStore sqlite(":memory:");
    InstrumentedStore store(sqlite);
    FixedClock clock(1700000000);
    Logger logger;
    IdentityRepository repo(store, clock, logger);

    store.fail_telemetry_inserts = true;
    bool threw = false;
    try {
        repo.save_telemetry(snapshot(3700, 1), ADDR_A);
    } catch (const StorageError&) {
        threw = true;
    }
    assert(threw);
    assert(sqlite.list_telemetry().empty());

    // The identity created before the failure is reused afterwards
    store.fail_telemetry_inserts = false;
    repo.save_telemetry(snapshot(3700, 2), ADDR_A);
    assert(sqlite.list_devices().size() == 1);
    assert(sqlite.list_batteries().size() == 1);
    assert(sqlite.list_telemetry().size() == 1);

    std::cout << " PASS\n";
    return true;
}

bool test_failed_battery_update_keeps_cache() {
    std::cout << "Testing failed battery update leaves cache unchanged..." << std::flush;

    SqliteTelemetryStore sqlite(":memory:");
    InstrumentedStore store(sqlite);
    FixedClock clock(1700000000);
    Logger logger;
    IdentityRepository repo(store, clock, logger);

    auto rec = repo.save_telemetry(snapshot(3700, 1, 50, 2000, 0), ADDR_A);

    store.fail_battery_updates = true;
    bool threw = false;
    try {
        repo.save_telemetry(snapshot(3690, 2, 60, 2100, 0), ADDR_A);
    } catch (const StorageError&) {
        threw = true;
    }
    assert(threw);

    // The telemetry row was appended before the failing update
    assert(sqlite.get_telemetry_by_battery_id(rec.battery_id).size() == 2);

    auto cached = repo.get_battery_by_external_id(ADDR_A);
    auto stored = sqlite.get_battery(rec.battery_id);
    assert(cached->resistance == 50 && stored->resistance == 50);
    assert(cached->capacity == 2000 && stored->capacity == 2000);

    // A later write lands in both
    store.fail_battery_updates = false;
    repo.save_telemetry(snapshot(3680, 3, 0, 2200, 0), ADDR_A);
    cached = repo.get_battery_by_external_id(ADDR_A);
    stored = sqlite.get_battery(rec.battery_id);
    assert(cached->capacity == 2200 && stored->capacity == 2200);
    assert(cached->resistance == 50 && stored->resistance == 50);

    std::cout << " PASS\n";
    return true;
}

int main() {
    std::cout << "============================================================================\n";
    std::cout << "BTLM STORAGE & REPOSITORY TESTS\n";
    std::cout << "============================================================================\n\n";

    try {
        bool all_passed = true;

        all_passed &= test_store_crud();
        all_passed &= test_store_constraints();
        all_passed &= test_save_creates_one_identity();
        all_passed &= test_last_known_fields();
        all_passed &= test_update_battery_label();
        all_passed &= test_preload_and_restart();
        all_passed &= test_reload();
        all_passed &= test_update_device_details();
        all_passed &= test_storage_failure_propagates();
        all_passed &= test_failed_battery_update_keeps_cache();

        std::cout << "\n============================================================================\n";
        if (all_passed) {
            std::cout << "✓ All storage & repository tests PASSED\n";
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
