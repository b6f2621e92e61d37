#ifndef BTLM_REPOSITORY_HPP
#define BTLM_REPOSITORY_HPP

#include "btlm_frame.hpp"
#include "btlm_interfaces.hpp"
#include "btlm_log.hpp"
#include "btlm_storage.hpp"

#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace btlm {

/*
 * ============================================================================
 * IDENTITY REPOSITORY
 * ============================================================================
 * Maps external device identifiers (beacon addresses) to the synthetic
 * device/battery ids of the store and persists accepted telemetry.
 *
 * CACHES:
 *   - devices: preloaded from the store at construction
 *   - batteries: filled lazily on first telemetry per device
 * Both are a subset view of the store; reload() rebuilds them.
 *
 * THREADING:
 *   Not synchronized. Owned by the single consumer task of TelemetryHub.
 * ============================================================================
 */
class IdentityRepository {
public:
    IdentityRepository(ITelemetryStore& store, const IClock& clock, Logger& logger)
        : store_(store), clock_(clock), logger_(logger) {
        load_devices();
    }

    TelemetryRecord save_telemetry(const TelemetrySnapshot& snapshot,
                                   const std::string& external_id) {
        ScopedTimer timer(logger_, "save_telemetry");
        const int64_t now = clock_.now_unix();

        Device& device = get_or_create_device(external_id, now);
        Battery& battery = get_or_create_battery(external_id, device);

        TelemetryRecord record;
        record.voltage = snapshot.battery_mv;
        record.resistance = snapshot.resistance_raw;
        record.capacity = snapshot.capacity;
        record.adv_count = snapshot.adv_count;
        record.uptime_s = snapshot.uptime_s;
        record.mode = snapshot.mode;
        record.discharge_current = snapshot.discharge_current;
        record.battery_id = battery.battery_id;
        record.recorded_at = now;
        record.telemetry_id = store_.insert_telemetry(record);

        // Last-known fields: zero means "unknown", never a reset. One persist
        // per refreshed field; the cache only takes values the store accepted.
        Battery updated = battery;
        if (record.resistance > 0) {
            updated.resistance = record.resistance;
            store_.update_battery(updated);
            battery.resistance = updated.resistance;
        }
        if (record.capacity > 0) {
            updated.capacity = record.capacity;
            store_.update_battery(updated);
            battery.capacity = updated.capacity;
        }
        if (record.discharge_current > 0) {
            updated.discharge_current = record.discharge_current;
            store_.update_battery(updated);
            battery.discharge_current = updated.discharge_current;
        }

        return record;
    }

    std::optional<Battery> get_battery_by_external_id(const std::string& external_id) const {
        auto it = battery_cache_.find(external_id);
        if (it == battery_cache_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<Device> get_device_by_external_id(const std::string& external_id) const {
        auto it = device_cache_.find(external_id);
        if (it == device_cache_.end()) return std::nullopt;
        return it->second;
    }

    // Precondition: a battery for external_id has been cached by
    // save_telemetry(). Violations throw std::logic_error.
    void update_battery_label(const std::string& external_id, const std::string& label) {
        auto it = battery_cache_.find(external_id);
        if (it == battery_cache_.end()) {
            throw std::logic_error("update_battery_label: no cached battery for '" +
                                   external_id + "'");
        }
        Battery updated = it->second;
        updated.label = label;
        store_.update_battery(updated);
        it->second = std::move(updated);
    }

    // Backfill the optional device attributes; the id and uuid never change.
    void update_device_details(const std::string& external_id,
                               const std::optional<std::string>& mac_address,
                               const std::optional<std::string>& name) {
        auto it = device_cache_.find(external_id);
        if (it == device_cache_.end()) return;

        Device updated = it->second;
        bool changed = false;
        if (mac_address && updated.mac_address != mac_address) {
            updated.mac_address = mac_address;
            changed = true;
        }
        if (name && !name->empty() && updated.name != name) {
            updated.name = name;
            changed = true;
        }
        if (!changed) return;

        store_.update_device(updated);
        it->second = std::move(updated);
    }

    // Rebuild the caches from the store.
    void reload() {
        device_cache_.clear();
        battery_cache_.clear();
        load_devices();
    }

    size_t cached_devices() const { return device_cache_.size(); }
    size_t cached_batteries() const { return battery_cache_.size(); }

private:
    void load_devices() {
        for (auto& device : store_.list_devices()) {
            std::string key = device.device_uuid;
            device_cache_.emplace(std::move(key), std::move(device));
        }
        logger_.debug("Loaded " + std::to_string(device_cache_.size()) + " devices from storage");
    }

    Device& get_or_create_device(const std::string& external_id, int64_t now) {
        auto it = device_cache_.find(external_id);
        if (it != device_cache_.end()) return it->second;

        Device device;
        device.device_uuid = external_id;
        device.first_seen = now;
        device.device_id = store_.insert_device(device);
        logger_.info("New device " + external_id + " -> id " + std::to_string(device.device_id));

        return device_cache_.emplace(external_id, std::move(device)).first->second;
    }

    Battery& get_or_create_battery(const std::string& external_id, const Device& device) {
        auto it = battery_cache_.find(external_id);
        if (it != battery_cache_.end()) return it->second;

        // A previous session may already have created the battery.
        auto existing = store_.get_batteries_by_device_id(device.device_id);
        if (!existing.empty()) {
            return battery_cache_.emplace(external_id, std::move(existing.back())).first->second;
        }

        Battery battery;
        battery.device_id = device.device_id;
        battery.battery_id = store_.insert_battery(battery);
        logger_.info("New battery " + std::to_string(battery.battery_id) +
                     " for device " + std::to_string(device.device_id));

        return battery_cache_.emplace(external_id, std::move(battery)).first->second;
    }

    ITelemetryStore& store_;
    const IClock& clock_;
    Logger& logger_;

    std::map<std::string, Device> device_cache_;
    std::map<std::string, Battery> battery_cache_;
};

} // namespace btlm

#endif // BTLM_REPOSITORY_HPP
