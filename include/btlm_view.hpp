#ifndef BTLM_VIEW_HPP
#define BTLM_VIEW_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace btlm {

// ============================================================================
// DISPLAY ROW
// ============================================================================

struct DisplayRow {
    int64_t battery_id = 0;
    std::string external_id;
    std::string label;
    int32_t capacity = 0;
    int32_t resistance = 0;
    int32_t voltage_mv = 0;
    int32_t discharge_current = 0;
    int64_t adv_count = 0;
    double uptime_s = 0.0;
    int32_t mode = 0;
    std::string mode_name;
};

using RowSnapshot = std::vector<DisplayRow>;

// ============================================================================
// VIEW CHANNEL
// ============================================================================
//
// Hand-off point between the consumer task (publishes) and the render thread
// (reads). Published snapshots are immutable; the dirty flag tells the render
// loop a repaint is due.
//
class ViewChannel {
public:
    ViewChannel() : latest_(std::make_shared<const RowSnapshot>()) {}

    void publish(RowSnapshot rows) {
        auto snapshot = std::make_shared<const RowSnapshot>(std::move(rows));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            latest_ = std::move(snapshot);
        }
        mark_dirty();
    }

    std::shared_ptr<const RowSnapshot> latest() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return latest_;
    }

    void mark_dirty() { dirty_.store(true, std::memory_order_release); }

    // Returns the flag and clears it.
    bool consume_dirty() { return dirty_.exchange(false, std::memory_order_acq_rel); }

    bool dirty() const { return dirty_.load(std::memory_order_acquire); }

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const RowSnapshot> latest_;
    std::atomic<bool> dirty_{false};
};

// ============================================================================
// TABLE MODEL
// ============================================================================
//
// One row per battery, keyed by the stable battery id. Display order comes
// from the label, so a rename never moves map keys.
//
class TableModel {
public:
    explicit TableModel(ViewChannel& channel) : channel_(channel) {}

    void update_row(const DisplayRow& row) {
        rows_[row.battery_id] = row;
        publish();
    }

    bool rename(int64_t battery_id, const std::string& label) {
        auto it = rows_.find(battery_id);
        if (it == rows_.end()) return false;
        it->second.label = label;
        publish();
        return true;
    }

    std::optional<DisplayRow> find(int64_t battery_id) const {
        auto it = rows_.find(battery_id);
        if (it == rows_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<DisplayRow> find_by_label(const std::string& label) const {
        for (const auto& entry : rows_) {
            if (entry.second.label == label) return entry.second;
        }
        return std::nullopt;
    }

    std::optional<DisplayRow> find_by_external_id(const std::string& external_id) const {
        for (const auto& entry : rows_) {
            if (entry.second.external_id == external_id) return entry.second;
        }
        return std::nullopt;
    }

    size_t size() const { return rows_.size(); }

    // Rows ordered by label, ties broken by battery id.
    RowSnapshot sorted_rows() const {
        RowSnapshot out;
        out.reserve(rows_.size());
        for (const auto& entry : rows_) out.push_back(entry.second);
        std::stable_sort(out.begin(), out.end(), [](const DisplayRow& a, const DisplayRow& b) {
            return a.label < b.label;
        });
        return out;
    }

private:
    void publish() { channel_.publish(sorted_rows()); }

    ViewChannel& channel_;
    std::map<int64_t, DisplayRow> rows_;
};

// ============================================================================
// SCREEN STATE MACHINE
// ============================================================================

enum class ScreenMode { Table, Log };

// Terminal-independent key classes; the curses layer maps raw codes to these.
enum class InputKey {
    None,
    ShowLog,
    ShowTable,
    ScrollUp,
    ScrollDown,
    PageUp,
    PageDown,
    Rename,
    Quit,
    Resize
};

enum class ScreenAction {
    None,
    Redraw,
    BeginRename,
    Quit
};

inline InputKey classify_char(int ch) {
    switch (ch) {
        case 'l': case 'L': return InputKey::ShowLog;
        case 't': case 'T': return InputKey::ShowTable;
        case 'j': return InputKey::ScrollUp;
        case 'k': return InputKey::ScrollDown;
        case 'c': case 'C': return InputKey::Rename;
        case 'q': case 'Q': return InputKey::Quit;
        default: return InputKey::None;
    }
}

class ScreenState {
public:
    using Clock = std::chrono::steady_clock;

    ScreenMode mode() const { return mode_; }
    size_t log_scroll() const { return log_scroll_; }

    static size_t max_scroll(size_t total_lines, size_t visible_lines) {
        return total_lines > visible_lines ? total_lines - visible_lines : 0;
    }

    ScreenAction handle(InputKey key, size_t total_lines, size_t visible_lines) {
        switch (key) {
            case InputKey::ShowLog:
                mode_ = ScreenMode::Log;
                log_scroll_ = 0;
                return ScreenAction::Redraw;
            case InputKey::ShowTable:
                mode_ = ScreenMode::Table;
                return ScreenAction::Redraw;
            case InputKey::ScrollUp:
                return scroll_by(-1, total_lines, visible_lines);
            case InputKey::ScrollDown:
                return scroll_by(1, total_lines, visible_lines);
            case InputKey::PageUp:
                return scroll_by(-static_cast<long>(visible_lines), total_lines, visible_lines);
            case InputKey::PageDown:
                return scroll_by(static_cast<long>(visible_lines), total_lines, visible_lines);
            case InputKey::Rename:
                return ScreenAction::BeginRename;
            case InputKey::Quit:
                return ScreenAction::Quit;
            case InputKey::Resize:
                return ScreenAction::Redraw;
            case InputKey::None:
                break;
        }
        return ScreenAction::None;
    }

    /* ----- flash messages ----- */

    void flash(const std::string& message, Clock::time_point now,
               std::chrono::milliseconds duration) {
        flash_message_ = message;
        flash_until_ = now + duration;
    }

    // Empty once the message has expired.
    std::string active_flash(Clock::time_point now) const {
        if (flash_message_.empty() || now >= flash_until_) return std::string();
        return flash_message_;
    }

    bool flash_expired(Clock::time_point now) const {
        return !flash_message_.empty() && now >= flash_until_;
    }

    void clear_flash() { flash_message_.clear(); }

private:
    ScreenAction scroll_by(long delta, size_t total_lines, size_t visible_lines) {
        if (mode_ != ScreenMode::Log) return ScreenAction::None;
        long target = static_cast<long>(log_scroll_) + delta;
        long upper = static_cast<long>(max_scroll(total_lines, visible_lines));
        target = std::clamp(target, 0L, upper);
        if (static_cast<size_t>(target) == log_scroll_) return ScreenAction::None;
        log_scroll_ = static_cast<size_t>(target);
        return ScreenAction::Redraw;
    }

    ScreenMode mode_ = ScreenMode::Table;
    size_t log_scroll_ = 0;
    std::string flash_message_;
    Clock::time_point flash_until_{};
};

// ============================================================================
// RENAME TARGET
// ============================================================================

enum class RenameTargetStatus { Found, NotNumeric, NotFound };

struct RenameTarget {
    RenameTargetStatus status = RenameTargetStatus::NotFound;
    std::optional<DisplayRow> row;
};

// The target must be numeric. It matches a row by label first, then by
// battery id (labels default to the stringified id).
inline RenameTarget resolve_rename_target(const std::string& input, const RowSnapshot& rows) {
    RenameTarget result;
    if (input.empty() || !std::all_of(input.begin(), input.end(),
                                      [](char c) { return c >= '0' && c <= '9'; })) {
        result.status = RenameTargetStatus::NotNumeric;
        return result;
    }

    for (const auto& row : rows) {
        if (row.label == input) {
            result.status = RenameTargetStatus::Found;
            result.row = row;
            return result;
        }
    }

    const int64_t id = std::strtoll(input.c_str(), nullptr, 10);
    for (const auto& row : rows) {
        if (row.battery_id == id) {
            result.status = RenameTargetStatus::Found;
            result.row = row;
            return result;
        }
    }

    result.status = RenameTargetStatus::NotFound;
    return result;
}

// ============================================================================
// SCREEN LAYOUT & PROMPT INPUT
// ============================================================================

// Title, flash and footer rows are reserved; the log body gets the rest.
constexpr int RESERVED_SCREEN_ROWS = 3;

inline size_t log_page_rows(int terminal_rows) {
    return static_cast<size_t>(std::max(terminal_rows - RESERVED_SCREEN_ROWS, 1));
}

// Line buffer behind the rename prompt. Printable ASCII only.
class PromptBuffer {
public:
    explicit PromptBuffer(size_t max_length) : max_length_(max_length) {}

    bool push(int ch) {
        if (ch < 0x20 || ch > 0x7E || text_.size() >= max_length_) return false;
        text_.push_back(static_cast<char>(ch));
        return true;
    }

    bool erase() {
        if (text_.empty()) return false;
        text_.pop_back();
        return true;
    }

    const std::string& text() const { return text_; }

    std::string trimmed() const {
        const size_t begin = text_.find_first_not_of(' ');
        if (begin == std::string::npos) return std::string();
        const size_t end = text_.find_last_not_of(' ');
        return text_.substr(begin, end - begin + 1);
    }

private:
    size_t max_length_;
    std::string text_;
};

} // namespace btlm

#endif // BTLM_VIEW_HPP
