#ifndef BTLM_CONTROLLER_HPP
#define BTLM_CONTROLLER_HPP

#include "btlm_frame.hpp"
#include "btlm_log.hpp"
#include "btlm_repository.hpp"
#include "btlm_storage.hpp"
#include "btlm_view.hpp"

#include <iomanip>
#include <sstream>
#include <string>

namespace btlm {

/*
 * Glue between the repository and the table: persists each accepted
 * snapshot, derives the display row and logs a one-line summary.
 */
class DisplayController {
public:
    DisplayController(IdentityRepository& repo, TableModel& table, ViewChannel& channel,
                      Logger& logger)
        : repo_(repo), table_(table), channel_(channel), logger_(logger) {}

    // Returns false when the snapshot could not be stored. A lost row is
    // logged; it never ends the session.
    bool handle_telemetry(const TelemetrySnapshot& snapshot, const std::string& external_id) {
        TelemetryRecord record;
        try {
            record = repo_.save_telemetry(snapshot, external_id);
        } catch (const StorageError& e) {
            logger_.error("Storage write failed for " + external_id + ": " + e.what());
            return false;
        }

        auto battery = repo_.get_battery_by_external_id(external_id);
        if (!battery) {
            logger_.error("No battery cached for " + external_id + " after save");
            return false;
        }

        table_.update_row(build_row(record, *battery, external_id));

        std::ostringstream msg;
        msg << "Telemetry from " << external_id
            << " V=" << snapshot.battery_mv << "mV"
            << " adv=" << snapshot.adv_count
            << " uptime=" << std::fixed << std::setprecision(1) << snapshot.uptime_s << "s";
        logger_.info(msg.str());
        return true;
    }

    void handle_label_change(const std::string& external_id, const std::string& label) {
        try {
            repo_.update_battery_label(external_id, label);
        } catch (const StorageError& e) {
            logger_.error("Label update failed for " + external_id + ": " + e.what());
            return;
        }

        auto battery = repo_.get_battery_by_external_id(external_id);
        if (battery) {
            table_.rename(battery->battery_id, label);
            logger_.info("Battery " + std::to_string(battery->battery_id) +
                         " renamed to '" + label + "'");
        }
        channel_.mark_dirty();
    }

    static DisplayRow build_row(const TelemetryRecord& record, const Battery& battery,
                                const std::string& external_id) {
        DisplayRow row;
        row.battery_id = battery.battery_id;
        row.external_id = external_id;
        row.label = battery.display_label();
        row.capacity = battery.capacity;
        row.resistance = battery.resistance;
        row.voltage_mv = record.voltage;
        row.discharge_current = battery.discharge_current;
        row.adv_count = record.adv_count;
        row.uptime_s = record.uptime_s;
        row.mode = record.mode;
        row.mode_name = charger_mode_name(record.mode);
        return row;
    }

private:
    IdentityRepository& repo_;
    TableModel& table_;
    ViewChannel& channel_;
    Logger& logger_;
};

} // namespace btlm

#endif // BTLM_CONTROLLER_HPP
