#ifndef BTLM_INTERFACES_HPP
#define BTLM_INTERFACES_HPP

#include <cstdint>
#include <ctime>
#include <functional>
#include <string>
#include <vector>

namespace btlm {

/*
 * ============================================================================
 * PLATFORM ABSTRACTION INTERFACES
 * ============================================================================
 * These interfaces decouple the telemetry pipeline from:
 *  - The Bluetooth stack (raw HCI, capture replay, test fixtures)
 *  - The wall clock
 *
 * NO LOGIC. CONTRACTS ONLY.
 * ============================================================================
 */

/* ================= TIME SOURCE ================= */

class IClock {
public:
    virtual ~IClock() = default;
    virtual int64_t now_unix() const = 0;   // seconds since epoch
};

class SystemClock final : public IClock {
public:
    int64_t now_unix() const override {
        return static_cast<int64_t>(std::time(nullptr));
    }
};

/* ================= ADVERTISEMENTS ================= */

// One service-data field of an advertisement. The key is the 128-bit UUID
// string form, lowercase, e.g. "0000feaa-0000-1000-8000-00805f9b34fb".
struct ServiceDataEntry {
    std::string uuid;
    std::vector<uint8_t> data;
};

struct AdvertisedDevice {
    std::string address;   // "AA:BB:CC:DD:EE:FF"
    std::string name;      // empty when not yet known
    int rssi = 0;
};

struct AdvertisementData {
    std::string local_name;
    std::vector<ServiceDataEntry> service_data;
    int rssi = 0;
};

using DetectionCallback =
    std::function<void(const AdvertisedDevice&, const AdvertisementData&)>;

/* ================= ADVERTISEMENT SOURCE ================= */

class IAdvertisementSource {
public:
    virtual ~IAdvertisementSource() = default;

    virtual void start() = 0;
    virtual void stop() = 0;   // must be safe to call twice

    // Deliver pending advertisements to the callback, waiting at most
    // timeout_ms for the first one. Returns false once the source is
    // exhausted and will never deliver again.
    virtual bool poll(const DetectionCallback& callback, int timeout_ms) = 0;
};

/*
 * Scoped scanner acquisition: start() on construction, stop() on every exit
 * path out of the owning scope.
 */
class ScanSession {
public:
    explicit ScanSession(IAdvertisementSource& source) : source_(source) {
        source_.start();
    }

    ~ScanSession() {
        source_.stop();
    }

    ScanSession(const ScanSession&) = delete;
    ScanSession& operator=(const ScanSession&) = delete;

    bool poll(const DetectionCallback& callback, int timeout_ms) {
        return source_.poll(callback, timeout_ms);
    }

private:
    IAdvertisementSource& source_;
};

} // namespace btlm

#endif // BTLM_INTERFACES_HPP
