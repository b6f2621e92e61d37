#pragma once
/*
 * ============================================================================
 * BTLM HCI Scanner – Linux BlueZ advertisement source
 * ============================================================================
 *
 * PURPOSE:
 *   Bridges a Linux Bluetooth controller (BlueZ raw HCI device) to the
 *   IAdvertisementSource contract used by the telemetry pipeline.
 *
 * DESIGN GOALS:
 *   - Active LE scanning, duplicates NOT filtered by the controller (every
 *     retransmission reaches the extractor, which does its own dedup).
 *   - Names from scan responses are merged into later reports of the same
 *     address.
 *   - The socket filter in place before start() is restored by stop().
 *
 * REQUIREMENTS:
 *   libbluetooth, CAP_NET_RAW (or root) and an adapter that is up
 *   (`hciconfig hci0 up`).
 *
 * Thread model:
 *   start()/poll()/stop() are called from the scan context only.
 *
 * ============================================================================
 */

#include "btlm_hci_report.hpp"
#include "btlm_interfaces.hpp"
#include "btlm_log.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <map>
#include <stdexcept>
#include <string>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <bluetooth/bluetooth.h>
#include <bluetooth/hci.h>
#include <bluetooth/hci_lib.h>

namespace btlm {

class ScanError : public std::runtime_error {
public:
    explicit ScanError(const std::string& what) : std::runtime_error(what) {}
};

/* ============================================================================
 * HciAdvertisementScanner
 * ============================================================================
 */

class HciAdvertisementScanner final : public IAdvertisementSource {
public:
    HciAdvertisementScanner(int hci_device, Logger& logger)
        : hci_device_(hci_device), logger_(logger) {}

    ~HciAdvertisementScanner() override {
        stop();
    }

    HciAdvertisementScanner(const HciAdvertisementScanner&) = delete;
    HciAdvertisementScanner& operator=(const HciAdvertisementScanner&) = delete;

    void start() override {
        if (dd_ >= 0) return;

        dd_ = hci_open_dev(hci_device_);
        if (dd_ < 0) {
            throw ScanError("Cannot open hci" + std::to_string(hci_device_) + ": " +
                            std::strerror(errno));
        }

        try {
            // A previous process may have left scanning enabled.
            if (hci_le_set_scan_enable(dd_, 0x00, FILTER_DUPLICATES, COMMAND_TIMEOUT_MS) < 0) {
                logger_.debug("No LE scan to disable on hci" + std::to_string(hci_device_));
            }

            if (hci_le_set_scan_parameters(dd_, SCAN_TYPE_ACTIVE, htobs(SCAN_INTERVAL),
                                           htobs(SCAN_WINDOW), LE_PUBLIC_ADDRESS,
                                           SCAN_FILTER_ACCEPT_ALL, COMMAND_TIMEOUT_MS) < 0) {
                throw ScanError(std::string("Set scan parameters failed: ") + std::strerror(errno));
            }

            socklen_t olen = sizeof(saved_filter_);
            if (::getsockopt(dd_, SOL_HCI, HCI_FILTER, &saved_filter_, &olen) < 0) {
                throw ScanError(std::string("HCI filter save failed: ") + std::strerror(errno));
            }

            hci_filter filter;
            hci_filter_clear(&filter);
            hci_filter_set_ptype(HCI_EVENT_PKT, &filter);
            hci_filter_set_event(EVT_LE_META_EVENT, &filter);
            if (::setsockopt(dd_, SOL_HCI, HCI_FILTER, &filter, sizeof(filter)) < 0) {
                throw ScanError(std::string("HCI filter set failed: ") + std::strerror(errno));
            }
            filter_saved_ = true;

            if (hci_le_set_scan_enable(dd_, 0x01, FILTER_DUPLICATES, COMMAND_TIMEOUT_MS) < 0) {
                throw ScanError(std::string("Enable scan failed: ") + std::strerror(errno));
            }
        } catch (const ScanError&) {
            release();
            throw;
        }

        logger_.info("LE scan started on hci" + std::to_string(hci_device_));
    }

    void stop() override {
        if (dd_ < 0) return;
        if (hci_le_set_scan_enable(dd_, 0x00, FILTER_DUPLICATES, COMMAND_TIMEOUT_MS) < 0) {
            logger_.warning(std::string("Disabling LE scan failed: ") + std::strerror(errno));
        }
        release();
        logger_.info("LE scan stopped on hci" + std::to_string(hci_device_));
    }

    bool poll(const DetectionCallback& callback, int timeout_ms) override {
        if (dd_ < 0) throw ScanError("HCI scanner not started");

        int wait_ms = timeout_ms;
        for (int packets = 0; packets < MAX_PACKETS_PER_POLL; ++packets) {
            uint8_t buf[HCI_MAX_EVENT_SIZE];
            ssize_t n = read_packet(buf, sizeof(buf), wait_ms);
            if (n <= 0) break;
            wait_ms = 0;
            handle_packet(buf, static_cast<size_t>(n), callback);
        }
        return true;
    }

    int hci_device() const { return hci_device_; }

private:
    static constexpr int MAX_PACKETS_PER_POLL = 64;
    static constexpr int COMMAND_TIMEOUT_MS = 1000;

    static constexpr uint8_t SCAN_TYPE_ACTIVE = 0x01;
    static constexpr uint16_t SCAN_INTERVAL = 0x0010;  // 10 ms
    static constexpr uint16_t SCAN_WINDOW = 0x0010;
    static constexpr uint8_t SCAN_FILTER_ACCEPT_ALL = 0x00;
    static constexpr uint8_t FILTER_DUPLICATES = 0x00;

    void release() {
        if (filter_saved_) {
            ::setsockopt(dd_, SOL_HCI, HCI_FILTER, &saved_filter_, sizeof(saved_filter_));
            filter_saved_ = false;
        }
        hci_close_dev(dd_);
        dd_ = -1;
    }

    // 0 on timeout or EINTR; errors throw.
    ssize_t read_packet(uint8_t* buf, size_t cap, int timeout_ms) {
        pollfd pfd{};
        pfd.fd = dd_;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, timeout_ms);
        if (rc < 0) {
            if (errno == EINTR) return 0;
            throw ScanError(std::string("poll on HCI socket failed: ") + std::strerror(errno));
        }
        if (rc == 0) return 0;
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            throw ScanError("HCI socket closed by the kernel (adapter down?)");
        }

        ssize_t n = ::read(dd_, buf, cap);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) return 0;
            throw ScanError(std::string("read on HCI socket failed: ") + std::strerror(errno));
        }
        if (n == 0) throw ScanError("HCI socket closed");
        return n;
    }

    // Packet layout: packet type, event code, parameter length, parameters.
    void handle_packet(const uint8_t* buf, size_t n, const DetectionCallback& callback) {
        if (n < 1 + HCI_EVENT_HDR_SIZE + 1) return;
        if (buf[0] != HCI_EVENT_PKT || buf[1] != EVT_LE_META_EVENT) return;

        const size_t plen = buf[2];
        if (1 + HCI_EVENT_HDR_SIZE + plen > n) return;

        for (auto& report : hci::parse_advertising_report(buf + 1 + HCI_EVENT_HDR_SIZE, plen)) {
            if (!report.data.local_name.empty()) {
                names_[report.address] = report.data.local_name;
            }

            AdvertisedDevice device;
            device.address = report.address;
            device.rssi = report.data.rssi;
            auto name = names_.find(report.address);
            if (name != names_.end()) device.name = name->second;

            callback(device, report.data);
        }
    }

    int hci_device_;
    Logger& logger_;
    int dd_ = -1;
    hci_filter saved_filter_{};
    bool filter_saved_ = false;
    std::map<std::string, std::string> names_;
};

} // namespace btlm
