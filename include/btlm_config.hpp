#ifndef BTLM_CONFIG_HPP
#define BTLM_CONFIG_HPP

#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace btlm {

/* ================= VERSION ================= */

constexpr int BTLM_VERSION_MAJOR = 1;
constexpr int BTLM_VERSION_MINOR = 0;
constexpr int BTLM_VERSION_PATCH = 0;

inline std::string get_version_string() {
    return std::to_string(BTLM_VERSION_MAJOR) + "." +
           std::to_string(BTLM_VERSION_MINOR) + "." +
           std::to_string(BTLM_VERSION_PATCH);
}

/* ================= CONFIG ================= */

constexpr const char* DEFAULT_SECRET_KEY = "secretKey";
constexpr const char* SECRET_KEY_ENV = "BTLM_SECRET_KEY";

struct MonitorConfig {
    std::string db_path = "telemetry.db";
    std::string secret_key = DEFAULT_SECRET_KEY;
    std::string device_name = "ESP32 TLM Beacon";

    int hci_device = 0;
    std::string replay_path;          // non-empty: replay a capture instead of scanning
    int scan_poll_ms = 200;

    int render_interval_ms = 50;
    int flash_duration_ms = 2000;

    std::string log_file = "btlm_monitor.log";
    size_t log_capacity = 200;
    bool verbose = false;             // DEBUG records to the log file

    bool validate() const {
        if (db_path.empty()) return false;
        if (secret_key.empty()) return false;
        if (device_name.empty()) return false;
        if (hci_device < 0) return false;
        if (scan_poll_ms <= 0 || scan_poll_ms > 10000) return false;
        if (render_interval_ms < 10 || render_interval_ms > 1000) return false;
        if (flash_duration_ms < 0) return false;
        if (log_capacity == 0) return false;
        return true;
    }

    bool uses_default_secret() const { return secret_key == DEFAULT_SECRET_KEY; }

    std::chrono::milliseconds render_interval() const {
        return std::chrono::milliseconds(render_interval_ms);
    }

    std::chrono::milliseconds flash_duration() const {
        return std::chrono::milliseconds(flash_duration_ms);
    }
};

inline std::string monitor_usage(const char* program) {
    return std::string("Usage: ") + program + " [options]\n"
        "  --db PATH          SQLite database (default telemetry.db)\n"
        "  --secret KEY       HMAC secret (default: $" + SECRET_KEY_ENV + " or built-in)\n"
        "  --name NAME        advertised beacon name (default \"ESP32 TLM Beacon\")\n"
        "  --hci N            HCI adapter index (default 0)\n"
        "  --replay FILE      replay a capture file instead of scanning\n"
        "  --log-file PATH    log file (default btlm_monitor.log)\n"
        "  --render-ms N      render interval in ms (default 50)\n"
        "  --verbose          write DEBUG records to the log file\n"
        "  --help             show this text\n";
}

namespace detail {

inline int parse_int_arg(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return parsed;
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + flag + ": '" + value + "'");
    }
}

} // namespace detail

// Throws std::invalid_argument on unknown flags, missing values or a config
// that fails validate(). Sets `help` when --help was given.
inline MonitorConfig parse_monitor_args(int argc, const char* const* argv, bool& help) {
    MonitorConfig config;
    help = false;

    if (const char* env_secret = std::getenv(SECRET_KEY_ENV)) {
        if (*env_secret != '\0') config.secret_key = env_secret;
    }

    for (int i = 1; i < argc; ++i) {
        const std::string flag = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + flag);
            return argv[++i];
        };

        if (flag == "--help" || flag == "-h") {
            help = true;
        } else if (flag == "--db") {
            config.db_path = value();
        } else if (flag == "--secret") {
            config.secret_key = value();
        } else if (flag == "--name") {
            config.device_name = value();
        } else if (flag == "--hci") {
            config.hci_device = detail::parse_int_arg(flag, value());
        } else if (flag == "--replay") {
            config.replay_path = value();
        } else if (flag == "--log-file") {
            config.log_file = value();
        } else if (flag == "--render-ms") {
            config.render_interval_ms = detail::parse_int_arg(flag, value());
        } else if (flag == "--verbose") {
            config.verbose = true;
        } else {
            throw std::invalid_argument("Unknown option: " + flag);
        }
    }

    if (!config.validate()) {
        throw std::invalid_argument("Invalid MonitorConfig parameters");
    }
    return config;
}

} // namespace btlm

#endif // BTLM_CONFIG_HPP
