/*
 * ============================================================================
 * BTLM TERMINAL VIEW
 * ============================================================================
 *
 * Full-screen ncurses front end for the monitor:
 *
 *   Table screen   one row per battery (label order)
 *   Log screen     newest log lines, scrollable
 *
 * Keys:
 *   l / t          switch to Log / Table
 *   j k, arrows    scroll the log by one line
 *   PgUp / PgDn    scroll the log by one page
 *   c              rename a battery
 *   q              quit
 *
 * The view runs on its own render thread. The terminal is acquired inside
 * that thread and released on every way out of it, including exceptions.
 * Rows are read from the ViewChannel only; renames leave the view through
 * the rename callback.
 *
 * ncurses itself is confined to btlm_curses_view.cpp.
 * ============================================================================
 */

#ifndef BTLM_CURSES_VIEW_HPP
#define BTLM_CURSES_VIEW_HPP

#include "btlm_log.hpp"
#include "btlm_view.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace btlm {

struct ViewOptions {
    std::chrono::milliseconds render_interval{50};
    std::chrono::milliseconds flash_duration{2000};

    bool validate() const {
        if (render_interval.count() <= 0) return false;
        if (flash_duration.count() < 0) return false;
        return true;
    }
};

class CursesView {
public:
    // Returns false when the rename could not be handed on.
    using RenameCallback =
        std::function<bool(const std::string& external_id, const std::string& label)>;

    CursesView(ViewChannel& channel, const MemoryLogSink& log_lines, Logger& logger,
               ViewOptions options = ViewOptions());
    ~CursesView();

    CursesView(const CursesView&) = delete;
    CursesView& operator=(const CursesView&) = delete;

    // Must be set before start().
    void set_rename_callback(RenameCallback callback);

    bool start();
    void stop();

    bool is_running() const { return running_.load(); }

    // Set when the user pressed q, or when the render thread failed.
    bool quit_requested() const { return quit_requested_.load(); }

    std::string last_error() const;

private:
    using Clock = std::chrono::steady_clock;

    void render_loop();
    bool handle_key(int ch);
    void run_rename_flow();
    std::string prompt(const std::string& text);
    void render(Clock::time_point now);
    void render_table(int top, int rows, int cols);
    void render_log(int top, int rows, int cols);

    ViewChannel& channel_;
    const MemoryLogSink& log_lines_;
    Logger& logger_;
    ViewOptions options_;
    RenameCallback rename_callback_;

    // Render thread only
    ScreenState state_;

    std::thread render_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> quit_requested_{false};

    mutable std::mutex error_mutex_;
    std::string last_error_;
};

} // namespace btlm

#endif // BTLM_CURSES_VIEW_HPP
