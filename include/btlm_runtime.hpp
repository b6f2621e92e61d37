/*
 * ============================================================================
 * BTLM TELEMETRY HUB
 * ============================================================================
 *
 * Concurrency boundary between the scan context and the terminal.
 *
 *   scan context ──submit_telemetry──┐
 *                                    ├──> EventQueue ──> consumer thread
 *   render thread ──submit_rename────┘                    (repository, table)
 *
 * The consumer thread is the only place that touches the repository caches
 * and the table model. The render thread only reads immutable snapshots from
 * the ViewChannel.
 *
 * USAGE:
 *   TelemetryHub hub(controller, logger);
 *   hub.start();
 *   hub.submit_telemetry(snapshot, address);   // from the scan loop
 *   hub.submit_rename(address, "Main pack");   // from the UI
 *   hub.stop();                                // drains pending events
 *
 * ============================================================================
 */

#ifndef BTLM_RUNTIME_HPP
#define BTLM_RUNTIME_HPP

#include "btlm_controller.hpp"
#include "btlm_extractor.hpp"
#include "btlm_frame.hpp"
#include "btlm_log.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>

namespace btlm {

// ============================================================================
// EVENTS
// ============================================================================

struct TelemetryEvent {
    TelemetrySnapshot snapshot;
    std::string external_id;
};

struct RenameEvent {
    std::string external_id;
    std::string label;
};

using HubEvent = std::variant<TelemetryEvent, RenameEvent>;

// ============================================================================
// EVENT QUEUE
// ============================================================================

template <typename T>
class EventQueue {
public:
    // false once the queue is closed
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    // Blocks until an item is available. Returns false when the queue is
    // closed and drained.
    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) return false;
        out = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};

// ============================================================================
// HUB
// ============================================================================

class TelemetryHub {
public:
    TelemetryHub(DisplayController& controller, Logger& logger)
        : controller_(controller), logger_(logger) {}

    ~TelemetryHub() {
        shutdown();
    }

    TelemetryHub(const TelemetryHub&) = delete;
    TelemetryHub& operator=(const TelemetryHub&) = delete;

    bool start() {
        if (running_.load()) {
            return false;  // Already running
        }
        running_.store(true);
        consumer_ = std::thread(&TelemetryHub::consume_loop, this);
        return true;
    }

    // Closes the queue, lets the consumer drain it and joins. A contract
    // violation caught on the consumer thread is rethrown here, once.
    void stop() {
        shutdown();
        if (fault_) {
            std::exception_ptr fault = fault_;
            fault_ = nullptr;
            std::rethrow_exception(fault);
        }
    }

    // Scan-context entry. Throws ScanCancelled once the hub has stopped so
    // the scan loop unwinds.
    void submit_telemetry(const TelemetrySnapshot& snapshot, const std::string& external_id) {
        if (!queue_.push(TelemetryEvent{snapshot, external_id})) {
            throw ScanCancelled();
        }
    }

    // UI entry. Returns false once the hub has stopped.
    bool submit_rename(const std::string& external_id, const std::string& label) {
        return queue_.push(RenameEvent{external_id, label});
    }

    TelemetrySink telemetry_sink() {
        return [this](const TelemetrySnapshot& snapshot, const std::string& address) {
            submit_telemetry(snapshot, address);
        };
    }

    bool is_running() const { return running_.load(); }
    // Set when the consumer stopped on a contract violation; the queue is
    // closed and stop() will rethrow it.
    bool faulted() const { return faulted_.load(); }
    uint64_t processed() const { return processed_.load(); }
    uint64_t failed() const { return failed_.load(); }
    size_t pending() const { return queue_.size(); }

private:
    void consume_loop() {
        HubEvent event;
        while (queue_.pop(event)) {
            try {
                dispatch(event);
            } catch (const std::logic_error& e) {
                // Contract violation: stop consuming and hand it to stop().
                logger_.error(std::string("Telemetry hub halted: ") + e.what());
                fault_ = std::current_exception();
                faulted_.store(true);
                queue_.close();
                return;
            } catch (const std::exception& e) {
                failed_.fetch_add(1);
                logger_.error(std::string("Event handling failed: ") + e.what());
            }
            processed_.fetch_add(1);
        }
        logger_.debug("Telemetry hub drained");
    }

    void shutdown() {
        queue_.close();
        if (consumer_.joinable()) {
            consumer_.join();
        }
        running_.store(false);
    }

    void dispatch(const HubEvent& event) {
        if (const auto* telemetry = std::get_if<TelemetryEvent>(&event)) {
            if (!controller_.handle_telemetry(telemetry->snapshot, telemetry->external_id)) {
                failed_.fetch_add(1);
            }
        } else if (const auto* rename = std::get_if<RenameEvent>(&event)) {
            controller_.handle_label_change(rename->external_id, rename->label);
        }
    }

    DisplayController& controller_;
    Logger& logger_;

    EventQueue<HubEvent> queue_;
    std::thread consumer_;
    std::atomic<bool> running_{false};
    std::atomic<bool> faulted_{false};
    std::exception_ptr fault_;  // written by the consumer, read after join
    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace btlm

#endif // BTLM_RUNTIME_HPP
