#include "btlm_curses_view.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

// Function forms only: curses' function-like macros (clear, erase, move...)
// collide with ordinary C++ identifiers.
#define NCURSES_NOMACROS
#include <ncurses.h>

namespace btlm {

namespace {

constexpr short PAIR_HEADER = 1;
constexpr short PAIR_WARNING = 2;

constexpr int COLUMN_WIDTH = 12;
constexpr int LABEL_WIDTH = 14;
constexpr int PROMPT_MAX = 64;
constexpr int PROMPT_POLL_MS = 100;
constexpr int KEY_ESCAPE = 27;

const char* const TABLE_COLUMNS[] = {
    "battery", "capacity", "resistance", "voltage (mV)",
    "discharge", "adv_count", "uptime_s", "mode"
};

const char* const TABLE_FOOTER = "l: log  c: rename  q: quit";
const char* const LOG_FOOTER = "t: table  j/k: scroll  PgUp/PgDn: page  c: rename  q: quit";

/*
 * Scoped terminal acquisition. Owns the SCREEN for the lifetime of the
 * render thread and restores cooked mode in its destructor.
 */
class TerminalSession {
public:
    TerminalSession() {
        screen_ = newterm(nullptr, stdout, stdin);
        if (screen_ == nullptr) {
            throw std::runtime_error("Cannot initialise terminal (is TERM set?)");
        }
        set_term(screen_);

        cbreak();
        noecho();
        keypad(stdscr, TRUE);
        nodelay(stdscr, TRUE);
        curs_set(0);

        if (has_colors()) {
            start_color();
            use_default_colors();
            init_pair(PAIR_HEADER, COLOR_WHITE, COLOR_BLUE);
            init_pair(PAIR_WARNING, COLOR_YELLOW, -1);
            colors_ = true;
        }
    }

    ~TerminalSession() {
        endwin();
        delscreen(screen_);
    }

    TerminalSession(const TerminalSession&) = delete;
    TerminalSession& operator=(const TerminalSession&) = delete;

    bool colors() const { return colors_; }

private:
    SCREEN* screen_ = nullptr;
    bool colors_ = false;
};

InputKey translate_key(int ch) {
    switch (ch) {
        case KEY_UP:     return InputKey::ScrollUp;
        case KEY_DOWN:   return InputKey::ScrollDown;
        case KEY_PPAGE:  return InputKey::PageUp;
        case KEY_NPAGE:  return InputKey::PageDown;
        case KEY_RESIZE: return InputKey::Resize;
        default:         return classify_char(ch);
    }
}

void put_line(int y, int x, const std::string& text, int cols) {
    if (x >= cols) return;
    mvwaddnstr(stdscr, y, x, text.c_str(), cols - x);
}

std::string pad(const std::string& text, int width) {
    if (static_cast<int>(text.size()) >= width) return text.substr(0, width);
    return text + std::string(width - text.size(), ' ');
}

std::string format_uptime(double seconds) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << seconds;
    return out.str();
}

} // namespace

// ============================================================================
// LIFECYCLE
// ============================================================================

CursesView::CursesView(ViewChannel& channel, const MemoryLogSink& log_lines, Logger& logger,
                       ViewOptions options)
    : channel_(channel), log_lines_(log_lines), logger_(logger), options_(options) {
    if (!options_.validate()) {
        throw std::invalid_argument("Invalid ViewOptions parameters");
    }
}

CursesView::~CursesView() {
    stop();
}

void CursesView::set_rename_callback(RenameCallback callback) {
    rename_callback_ = std::move(callback);
}

bool CursesView::start() {
    if (running_.load()) {
        return false;  // Already running
    }
    running_.store(true);
    quit_requested_.store(false);
    render_thread_ = std::thread(&CursesView::render_loop, this);
    return true;
}

void CursesView::stop() {
    running_.store(false);
    if (render_thread_.joinable()) {
        render_thread_.join();
    }
}

std::string CursesView::last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

// ============================================================================
// RENDER LOOP
// ============================================================================

void CursesView::render_loop() {
    try {
        TerminalSession session;
        uint64_t seen_log_sequence = log_lines_.sequence();
        bool force_redraw = true;

        while (running_.load()) {
            for (int ch = wgetch(stdscr); ch != ERR; ch = wgetch(stdscr)) {
                if (handle_key(ch)) force_redraw = true;
                if (!running_.load() || quit_requested_.load()) break;
            }
            if (quit_requested_.load()) break;

            const auto now = Clock::now();
            bool redraw = channel_.consume_dirty() || force_redraw;

            const uint64_t log_sequence = log_lines_.sequence();
            if (log_sequence != seen_log_sequence) {
                seen_log_sequence = log_sequence;
                if (state_.mode() == ScreenMode::Log) redraw = true;
            }

            if (state_.flash_expired(now)) {
                state_.clear_flash();
                redraw = true;
            }

            if (redraw) {
                render(now);
                force_redraw = false;
            }

            std::this_thread::sleep_for(options_.render_interval);
        }
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            last_error_ = e.what();
        }
        logger_.error(std::string("Terminal view stopped: ") + e.what());
    }

    quit_requested_.store(true);
    running_.store(false);
}

// Returns true when the screen needs a repaint.
bool CursesView::handle_key(int ch) {
    const size_t total = log_lines_.size();
    const size_t page = log_page_rows(getmaxy(stdscr));
    switch (state_.handle(translate_key(ch), total, page)) {
        case ScreenAction::Redraw:
            return true;
        case ScreenAction::BeginRename:
            run_rename_flow();
            return true;
        case ScreenAction::Quit:
            quit_requested_.store(true);
            return false;
        case ScreenAction::None:
            break;
    }
    return false;
}

// ============================================================================
// RENAME FLOW
// ============================================================================

void CursesView::run_rename_flow() {
    const std::string target = prompt("Battery to rename (label or id): ");
    if (target.empty()) return;

    const auto rows = channel_.latest();
    const RenameTarget resolved = resolve_rename_target(target, *rows);

    if (resolved.status == RenameTargetStatus::NotNumeric) {
        state_.flash("Battery label must be numeric: '" + target + "'", Clock::now(),
                     options_.flash_duration);
        return;
    }
    if (resolved.status == RenameTargetStatus::NotFound) {
        state_.flash("Battery '" + target + "' not found", Clock::now(),
                     options_.flash_duration);
        return;
    }

    const DisplayRow& row = *resolved.row;
    const std::string label = prompt("New label for battery " + row.label + ": ");
    if (label.empty()) {
        state_.flash("Rename cancelled", Clock::now(), options_.flash_duration);
        return;
    }

    if (!rename_callback_ || !rename_callback_(row.external_id, label)) {
        state_.flash("Rename not applied: monitor is shutting down", Clock::now(),
                     options_.flash_duration);
        return;
    }

    state_.flash("Battery " + row.label + " renamed to '" + label + "'", Clock::now(),
                 options_.flash_duration);
    channel_.mark_dirty();
}

// Line input on the bottom row. Keys are polled so that stop() is honoured
// while the prompt is open; Escape or a stop returns an empty string.
std::string CursesView::prompt(const std::string& text) {
    const int rows = getmaxy(stdscr);
    const int cols = getmaxx(stdscr);
    const int input_x = std::min(static_cast<int>(text.size()), cols - 1);

    PromptBuffer buffer(PROMPT_MAX);
    curs_set(1);
    wtimeout(stdscr, PROMPT_POLL_MS);

    bool submitted = false;
    while (running_.load()) {
        wmove(stdscr, rows - 1, 0);
        wclrtoeol(stdscr);
        put_line(rows - 1, 0, text, cols);
        put_line(rows - 1, input_x, buffer.text(), cols);
        wrefresh(stdscr);

        const int ch = wgetch(stdscr);
        if (ch == ERR) continue;
        if (ch == '\n' || ch == '\r' || ch == KEY_ENTER) {
            submitted = true;
            break;
        }
        if (ch == KEY_ESCAPE) break;
        if (ch == KEY_BACKSPACE || ch == 127 || ch == 8) {
            buffer.erase();
            continue;
        }
        buffer.push(ch);
    }

    curs_set(0);
    nodelay(stdscr, TRUE);

    return submitted ? buffer.trimmed() : std::string();
}

// ============================================================================
// DRAWING
// ============================================================================

void CursesView::render(Clock::time_point now) {
    const int rows = getmaxy(stdscr);
    const int cols = getmaxx(stdscr);

    werase(stdscr);
    if (rows < 4 || cols < 20) {
        put_line(0, 0, "Terminal too small", cols);
        wrefresh(stdscr);
        return;
    }

    // Body spans rows [1, rows - 2); row 0 is the title, the last two rows
    // hold the flash message and the footer.
    const int body_top = 1;
    const int body_rows = rows - RESERVED_SCREEN_ROWS;

    const bool log_mode = state_.mode() == ScreenMode::Log;
    const std::string title = log_mode ? " BTLM monitor - log" : " BTLM monitor - batteries";
    if (has_colors()) wattron(stdscr, COLOR_PAIR(PAIR_HEADER) | A_BOLD);
    put_line(0, 0, pad(title, cols), cols);
    if (has_colors()) wattroff(stdscr, COLOR_PAIR(PAIR_HEADER) | A_BOLD);

    if (log_mode) {
        render_log(body_top, body_rows, cols);
    } else {
        render_table(body_top, body_rows, cols);
    }

    const std::string flash = state_.active_flash(now);
    if (!flash.empty()) {
        if (has_colors()) wattron(stdscr, COLOR_PAIR(PAIR_WARNING) | A_BOLD);
        put_line(rows - 2, 0, flash, cols);
        if (has_colors()) wattroff(stdscr, COLOR_PAIR(PAIR_WARNING) | A_BOLD);
    }

    wattron(stdscr, A_DIM);
    put_line(rows - 1, 0, log_mode ? LOG_FOOTER : TABLE_FOOTER, cols);
    wattroff(stdscr, A_DIM);

    wrefresh(stdscr);
}

void CursesView::render_table(int top, int rows, int cols) {
    std::string header = pad(TABLE_COLUMNS[0], LABEL_WIDTH);
    for (size_t i = 1; i < sizeof(TABLE_COLUMNS) / sizeof(TABLE_COLUMNS[0]); ++i) {
        header += " " + pad(TABLE_COLUMNS[i], COLUMN_WIDTH);
    }
    wattron(stdscr, A_BOLD);
    put_line(top, 0, header, cols);
    wattroff(stdscr, A_BOLD);
    mvwhline(stdscr, top + 1, 0, ACS_HLINE, cols);

    const auto snapshot = channel_.latest();
    if (snapshot->empty()) {
        put_line(top + 2, 0, "Waiting for telemetry...", cols);
        return;
    }

    int y = top + 2;
    for (const auto& row : *snapshot) {
        if (y >= top + rows) break;
        std::string line = pad(row.label, LABEL_WIDTH);
        line += " " + pad(std::to_string(row.capacity), COLUMN_WIDTH);
        line += " " + pad(std::to_string(row.resistance), COLUMN_WIDTH);
        line += " " + pad(std::to_string(row.voltage_mv), COLUMN_WIDTH);
        line += " " + pad(std::to_string(row.discharge_current), COLUMN_WIDTH);
        line += " " + pad(std::to_string(row.adv_count), COLUMN_WIDTH);
        line += " " + pad(format_uptime(row.uptime_s), COLUMN_WIDTH);
        line += " " + pad(row.mode_name, COLUMN_WIDTH);
        put_line(y++, 0, line, cols);
    }
}

void CursesView::render_log(int top, int rows, int cols) {
    const size_t visible = static_cast<size_t>(std::max(rows, 1));

    const std::vector<std::string> lines = log_lines_.lines();
    if (lines.empty()) {
        put_line(top, 0, "(no log records yet)", cols);
        return;
    }

    // The scroll offset is the index of the first visible line, oldest first.
    const size_t max_scroll = ScreenState::max_scroll(lines.size(), visible);
    const size_t begin = std::min(state_.log_scroll(), max_scroll);
    const size_t end = std::min(begin + visible, lines.size());

    int y = top;
    for (size_t i = begin; i < end; ++i) {
        put_line(y++, 0, lines[i], cols);
    }
}

} // namespace btlm
