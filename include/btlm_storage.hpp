/*
 * ============================================================================
 * BTLM STORAGE
 * ============================================================================
 *
 * Durable rows for devices, batteries and telemetry. The pipeline talks to
 * ITelemetryStore only; SqliteTelemetryStore is the production backend.
 *
 * SCHEMA:
 *   device    (device_id PK, device_uuid UNIQUE, mac_address?, name?, first_seen)
 *   battery   (battery_id PK, device_id FK, label?, resistance, capacity,
 *              discharge_current)
 *   telemetry (telemetry_id PK, voltage, resistance, capacity, adv_count,
 *              uptime_s, mode, discharge_current, battery_id FK, recorded_at)
 *
 * Telemetry rows are append-only: the store offers no update or delete.
 *
 * ============================================================================
 */

#ifndef BTLM_STORAGE_HPP
#define BTLM_STORAGE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <sqlite3.h>

namespace btlm {

// ============================================================================
// RECORDS
// ============================================================================

struct Device {
    int64_t device_id = 0;             // assigned by storage
    std::string device_uuid;           // external identifier
    std::optional<std::string> mac_address;
    std::optional<std::string> name;
    int64_t first_seen = 0;            // unix seconds
};

struct Battery {
    int64_t battery_id = 0;
    int64_t device_id = 0;
    std::optional<std::string> label;
    int32_t resistance = 0;
    int32_t capacity = 0;
    int32_t discharge_current = 0;

    // Display name: the label, or the stringified id when unset.
    std::string display_label() const {
        return label.has_value() ? *label : std::to_string(battery_id);
    }
};

struct TelemetryRecord {
    int64_t telemetry_id = 0;
    int32_t voltage = 0;
    int32_t resistance = 0;
    int32_t capacity = 0;
    int64_t adv_count = 0;
    double uptime_s = 0.0;
    int32_t mode = 0;
    int32_t discharge_current = 0;
    int64_t battery_id = 0;
    int64_t recorded_at = 0;
};

class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

// ============================================================================
// STORE CONTRACT
// ============================================================================

class ITelemetryStore {
public:
    virtual ~ITelemetryStore() = default;

    /* ----- device ----- */
    virtual std::vector<Device> list_devices() = 0;
    virtual std::optional<Device> get_device(int64_t device_id) = 0;
    virtual std::optional<Device> get_device_by_external_id(const std::string& device_uuid) = 0;
    virtual std::optional<Device> get_device_by_mac(const std::string& mac) = 0;
    virtual int64_t insert_device(const Device& device) = 0;
    virtual void update_device(const Device& device) = 0;
    virtual int set_mac_address_by_device_id(int64_t device_id, const std::string& mac) = 0;

    /* ----- battery ----- */
    virtual std::vector<Battery> list_batteries() = 0;
    virtual std::optional<Battery> get_battery(int64_t battery_id) = 0;
    virtual std::vector<Battery> get_batteries_by_device_id(int64_t device_id) = 0;
    virtual std::vector<Battery> get_batteries_by_label(const std::string& label) = 0;
    virtual int64_t insert_battery(const Battery& battery) = 0;
    virtual void update_battery(const Battery& battery) = 0;
    virtual int set_label_by_battery_id(int64_t battery_id, const std::string& label) = 0;

    /* ----- telemetry ----- */
    virtual std::vector<TelemetryRecord> list_telemetry() = 0;
    virtual std::optional<TelemetryRecord> get_telemetry(int64_t telemetry_id) = 0;
    virtual std::vector<TelemetryRecord> get_telemetry_by_battery_id(int64_t battery_id) = 0;
    virtual int64_t insert_telemetry(const TelemetryRecord& record) = 0;
};

// ============================================================================
// SQLITE BACKEND
// ============================================================================

namespace detail {

struct SqliteCloser {
    void operator()(sqlite3* db) const { sqlite3_close(db); }
};

struct StatementFinalizer {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

// Prepared statement with positional binding (1-based, in call order).
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
            throw StorageError(std::string("prepare failed: ") + sqlite3_errmsg(db));
        }
        stmt_.reset(raw);
    }

    Statement& bind(int64_t value) {
        check(sqlite3_bind_int64(stmt_.get(), ++index_, value));
        return *this;
    }

    Statement& bind(double value) {
        check(sqlite3_bind_double(stmt_.get(), ++index_, value));
        return *this;
    }

    Statement& bind(const std::string& value) {
        check(sqlite3_bind_text(stmt_.get(), ++index_, value.c_str(),
                                static_cast<int>(value.size()), SQLITE_TRANSIENT));
        return *this;
    }

    Statement& bind(const std::optional<std::string>& value) {
        if (value.has_value()) return bind(*value);
        check(sqlite3_bind_null(stmt_.get(), ++index_));
        return *this;
    }

    // true while a row is available
    bool step() {
        int rc = sqlite3_step(stmt_.get());
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StorageError(std::string("step failed: ") + sqlite3_errmsg(db_));
    }

    void run() {
        while (step()) {}
    }

    int64_t column_int64(int col) const { return sqlite3_column_int64(stmt_.get(), col); }
    int32_t column_int(int col) const { return sqlite3_column_int(stmt_.get(), col); }
    double column_double(int col) const { return sqlite3_column_double(stmt_.get(), col); }

    std::optional<std::string> column_text(int col) const {
        if (sqlite3_column_type(stmt_.get(), col) == SQLITE_NULL) return std::nullopt;
        const unsigned char* text = sqlite3_column_text(stmt_.get(), col);
        int len = sqlite3_column_bytes(stmt_.get(), col);
        return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(len));
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StorageError(std::string("bind failed: ") + sqlite3_errmsg(db_));
        }
    }

    sqlite3* db_;
    std::unique_ptr<sqlite3_stmt, StatementFinalizer> stmt_;
    int index_ = 0;
};

} // namespace detail

#define BTLM_DEVICE_SELECT \
    "SELECT device_id, device_uuid, mac_address, name, first_seen FROM device"
#define BTLM_BATTERY_SELECT \
    "SELECT battery_id, device_id, label, resistance, capacity, discharge_current FROM battery"
#define BTLM_TELEMETRY_SELECT \
    "SELECT telemetry_id, voltage, resistance, capacity, adv_count, uptime_s, mode, " \
    "discharge_current, battery_id, recorded_at FROM telemetry"

class SqliteTelemetryStore final : public ITelemetryStore {
public:
    // ":memory:" opens a private in-memory database.
    explicit SqliteTelemetryStore(const std::string& path = "telemetry.db") : path_(path) {
        sqlite3* raw = nullptr;
        int rc = sqlite3_open(path.c_str(), &raw);
        db_.reset(raw);
        if (rc != SQLITE_OK) {
            std::string msg = raw ? sqlite3_errmsg(raw) : "out of memory";
            throw StorageError("cannot open database '" + path + "': " + msg);
        }
        sqlite3_busy_timeout(db_.get(), 2000);
        ensure_schema();
    }

    const std::string& path() const { return path_; }

    /* ===================== DEVICE ===================== */

    std::vector<Device> list_devices() override {
        detail::Statement st(db_.get(), BTLM_DEVICE_SELECT " ORDER BY device_id;");
        return collect_devices(st);
    }

    std::optional<Device> get_device(int64_t device_id) override {
        detail::Statement st(db_.get(), BTLM_DEVICE_SELECT " WHERE device_id = ?;");
        st.bind(device_id);
        return first(collect_devices(st));
    }

    std::optional<Device> get_device_by_external_id(const std::string& device_uuid) override {
        detail::Statement st(db_.get(), BTLM_DEVICE_SELECT " WHERE device_uuid = ?;");
        st.bind(device_uuid);
        return first(collect_devices(st));
    }

    std::optional<Device> get_device_by_mac(const std::string& mac) override {
        detail::Statement st(db_.get(), BTLM_DEVICE_SELECT " WHERE mac_address = ?;");
        st.bind(mac);
        return first(collect_devices(st));
    }

    int64_t insert_device(const Device& device) override {
        detail::Statement st(db_.get(),
            "INSERT INTO device (device_uuid, mac_address, name, first_seen) "
            "VALUES (?, ?, ?, ?);");
        st.bind(device.device_uuid).bind(device.mac_address).bind(device.name)
          .bind(device.first_seen);
        st.run();
        return sqlite3_last_insert_rowid(db_.get());
    }

    void update_device(const Device& device) override {
        detail::Statement st(db_.get(),
            "UPDATE device SET device_uuid = ?, mac_address = ?, name = ?, first_seen = ? "
            "WHERE device_id = ?;");
        st.bind(device.device_uuid).bind(device.mac_address).bind(device.name)
          .bind(device.first_seen).bind(device.device_id);
        st.run();
    }

    int set_mac_address_by_device_id(int64_t device_id, const std::string& mac) override {
        detail::Statement st(db_.get(), "UPDATE device SET mac_address = ? WHERE device_id = ?;");
        st.bind(mac).bind(device_id);
        st.run();
        return sqlite3_changes(db_.get());
    }

    /* ===================== BATTERY ===================== */

    std::vector<Battery> list_batteries() override {
        detail::Statement st(db_.get(), BTLM_BATTERY_SELECT " ORDER BY battery_id;");
        return collect_batteries(st);
    }

    std::optional<Battery> get_battery(int64_t battery_id) override {
        detail::Statement st(db_.get(), BTLM_BATTERY_SELECT " WHERE battery_id = ?;");
        st.bind(battery_id);
        return first(collect_batteries(st));
    }

    std::vector<Battery> get_batteries_by_device_id(int64_t device_id) override {
        detail::Statement st(db_.get(), BTLM_BATTERY_SELECT " WHERE device_id = ? ORDER BY battery_id;");
        st.bind(device_id);
        return collect_batteries(st);
    }

    std::vector<Battery> get_batteries_by_label(const std::string& label) override {
        detail::Statement st(db_.get(), BTLM_BATTERY_SELECT " WHERE label = ? ORDER BY battery_id;");
        st.bind(label);
        return collect_batteries(st);
    }

    int64_t insert_battery(const Battery& battery) override {
        detail::Statement st(db_.get(),
            "INSERT INTO battery (device_id, label, resistance, capacity, discharge_current) "
            "VALUES (?, ?, ?, ?, ?);");
        st.bind(battery.device_id).bind(battery.label)
          .bind(static_cast<int64_t>(battery.resistance))
          .bind(static_cast<int64_t>(battery.capacity))
          .bind(static_cast<int64_t>(battery.discharge_current));
        st.run();
        return sqlite3_last_insert_rowid(db_.get());
    }

    void update_battery(const Battery& battery) override {
        detail::Statement st(db_.get(),
            "UPDATE battery SET device_id = ?, label = ?, resistance = ?, capacity = ?, "
            "discharge_current = ? WHERE battery_id = ?;");
        st.bind(battery.device_id).bind(battery.label)
          .bind(static_cast<int64_t>(battery.resistance))
          .bind(static_cast<int64_t>(battery.capacity))
          .bind(static_cast<int64_t>(battery.discharge_current))
          .bind(battery.battery_id);
        st.run();
    }

    int set_label_by_battery_id(int64_t battery_id, const std::string& label) override {
        detail::Statement st(db_.get(), "UPDATE battery SET label = ? WHERE battery_id = ?;");
        st.bind(label).bind(battery_id);
        st.run();
        return sqlite3_changes(db_.get());
    }

    /* ===================== TELEMETRY ===================== */

    std::vector<TelemetryRecord> list_telemetry() override {
        detail::Statement st(db_.get(), BTLM_TELEMETRY_SELECT " ORDER BY telemetry_id;");
        return collect_telemetry(st);
    }

    std::optional<TelemetryRecord> get_telemetry(int64_t telemetry_id) override {
        detail::Statement st(db_.get(), BTLM_TELEMETRY_SELECT " WHERE telemetry_id = ?;");
        st.bind(telemetry_id);
        return first(collect_telemetry(st));
    }

    std::vector<TelemetryRecord> get_telemetry_by_battery_id(int64_t battery_id) override {
        detail::Statement st(db_.get(),
            BTLM_TELEMETRY_SELECT " WHERE battery_id = ? ORDER BY telemetry_id;");
        st.bind(battery_id);
        return collect_telemetry(st);
    }

    int64_t insert_telemetry(const TelemetryRecord& r) override {
        detail::Statement st(db_.get(),
            "INSERT INTO telemetry (voltage, resistance, capacity, adv_count, uptime_s, mode, "
            "discharge_current, battery_id, recorded_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);");
        st.bind(static_cast<int64_t>(r.voltage))
          .bind(static_cast<int64_t>(r.resistance))
          .bind(static_cast<int64_t>(r.capacity))
          .bind(r.adv_count)
          .bind(r.uptime_s)
          .bind(static_cast<int64_t>(r.mode))
          .bind(static_cast<int64_t>(r.discharge_current))
          .bind(r.battery_id)
          .bind(r.recorded_at);
        st.run();
        return sqlite3_last_insert_rowid(db_.get());
    }

private:
    static constexpr const char* SCHEMA = R"SQL(
        PRAGMA foreign_keys = ON;

        CREATE TABLE IF NOT EXISTS device (
            device_id   INTEGER PRIMARY KEY,
            device_uuid TEXT    NOT NULL UNIQUE,
            mac_address TEXT,
            name        TEXT,
            first_seen  INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS battery (
            battery_id        INTEGER PRIMARY KEY,
            device_id         INTEGER NOT NULL,
            label             TEXT(256),
            resistance        INTEGER NOT NULL DEFAULT 0,
            capacity          INTEGER NOT NULL DEFAULT 0,
            discharge_current INTEGER NOT NULL DEFAULT 0,
            FOREIGN KEY(device_id) REFERENCES device(device_id)
                ON DELETE CASCADE
        );

        CREATE TABLE IF NOT EXISTS telemetry (
            telemetry_id      INTEGER PRIMARY KEY AUTOINCREMENT,
            voltage           INTEGER NOT NULL,
            resistance        INTEGER NOT NULL,
            capacity          INTEGER NOT NULL,
            adv_count         INTEGER NOT NULL,
            uptime_s          REAL    NOT NULL,
            mode              INTEGER NOT NULL,
            discharge_current INTEGER NOT NULL,
            battery_id        INTEGER NOT NULL,
            recorded_at       INTEGER NOT NULL,
            FOREIGN KEY(battery_id) REFERENCES battery(battery_id)
                ON DELETE CASCADE
        );
    )SQL";

    void ensure_schema() {
        char* err = nullptr;
        if (sqlite3_exec(db_.get(), SCHEMA, nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : "unknown error";
            sqlite3_free(err);
            throw StorageError("schema creation failed: " + msg);
        }
    }

    template <typename T>
    static std::optional<T> first(std::vector<T> rows) {
        if (rows.empty()) return std::nullopt;
        return std::move(rows.front());
    }

    static std::vector<Device> collect_devices(detail::Statement& st) {
        std::vector<Device> out;
        while (st.step()) {
            Device d;
            d.device_id = st.column_int64(0);
            d.device_uuid = st.column_text(1).value_or("");
            d.mac_address = st.column_text(2);
            d.name = st.column_text(3);
            d.first_seen = st.column_int64(4);
            out.push_back(std::move(d));
        }
        return out;
    }

    static std::vector<Battery> collect_batteries(detail::Statement& st) {
        std::vector<Battery> out;
        while (st.step()) {
            Battery b;
            b.battery_id = st.column_int64(0);
            b.device_id = st.column_int64(1);
            b.label = st.column_text(2);
            b.resistance = st.column_int(3);
            b.capacity = st.column_int(4);
            b.discharge_current = st.column_int(5);
            out.push_back(std::move(b));
        }
        return out;
    }

    static std::vector<TelemetryRecord> collect_telemetry(detail::Statement& st) {
        std::vector<TelemetryRecord> out;
        while (st.step()) {
            TelemetryRecord r;
            r.telemetry_id = st.column_int64(0);
            r.voltage = st.column_int(1);
            r.resistance = st.column_int(2);
            r.capacity = st.column_int(3);
            r.adv_count = st.column_int64(4);
            r.uptime_s = st.column_double(5);
            r.mode = st.column_int(6);
            r.discharge_current = st.column_int(7);
            r.battery_id = st.column_int64(8);
            r.recorded_at = st.column_int64(9);
            out.push_back(r);
        }
        return out;
    }

    std::string path_;
    std::unique_ptr<sqlite3, detail::SqliteCloser> db_;
};

#undef BTLM_DEVICE_SELECT
#undef BTLM_BATTERY_SELECT
#undef BTLM_TELEMETRY_SELECT

} // namespace btlm

#endif // BTLM_STORAGE_HPP
