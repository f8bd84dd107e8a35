#include "terminal.hpp"
#include <csignal>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <curses.h>
#include "status_text.hpp"

namespace {

volatile std::sig_atomic_t quit_requested = 0;

void request_quit(int) {
    quit_requested = 1;
}

const short ALIVE_PAIR = 1;
const short DEAD_PAIR = 2;
const int ESCAPE_KEY = 27;

// xterm any-event tracking: motion is reported while a button is held.
const char* MOTION_TRACKING_ON = "\033[?1003h";
const char* MOTION_TRACKING_OFF = "\033[?1003l";

}

Terminal::Terminal(const LifeConfig& config, const char* term_type, std::FILE* out, std::FILE* in)
    : config(config), out(out) {
    session_screen = newterm(term_type, out, in);
    if (session_screen == nullptr)
        throw std::runtime_error("failed to initialise the terminal screen");
    set_term(session_screen);
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    curs_set(0);
    set_escdelay(25);

    if (has_colors()) {
        if (start_color() == ERR) {
            endwin();
            delscreen(session_screen);
            throw std::runtime_error("terminal reports colour support but start_color failed");
        }
        init_pair(ALIVE_PAIR, COLOR_BLACK, COLOR_WHITE);
        init_pair(DEAD_PAIR, COLOR_WHITE, COLOR_BLACK);
        colour = true;
    }

    mmask_t wanted = BUTTON1_PRESSED | BUTTON1_RELEASED | REPORT_MOUSE_POSITION;
    if (mousemask(wanted, nullptr) != 0) {
        mouse = true;
        mouseinterval(0);
        std::fprintf(out, "%s", MOTION_TRACKING_ON);
        std::fflush(out);
    }

    quit_requested = 0;
    previous_sigint = std::signal(SIGINT, request_quit);
    previous_sigterm = std::signal(SIGTERM, request_quit);
}

Terminal::~Terminal() {
    if (previous_sigint != SIG_ERR)
        std::signal(SIGINT, previous_sigint);
    if (previous_sigterm != SIG_ERR)
        std::signal(SIGTERM, previous_sigterm);

    if (mouse) {
        std::fprintf(out, "%s", MOTION_TRACKING_OFF);
        std::fflush(out);
    }
    endwin();
    delscreen(session_screen);
}

std::vector<InputEvent> Terminal::poll_events() {
    std::vector<InputEvent> events;
    int ch;
    while ((ch = getch()) != ERR) {
        if (ch == 'q' || ch == ESCAPE_KEY) {
            events.push_back({EventType::quit});
        } else if (ch == KEY_MOUSE) {
            MEVENT mouse_event;
            if (getmouse(&mouse_event) != OK) continue;
            InputEvent event{EventType::mouse_move};
            event.x = mouse_event.x;
            event.y = mouse_event.y;
            if (mouse_event.bstate & BUTTON1_PRESSED)
                event.type = EventType::mouse_press;
            else if (mouse_event.bstate & BUTTON1_RELEASED)
                event.type = EventType::mouse_release;
            events.push_back(event);
        } else if (ch != KEY_RESIZE) {
            InputEvent event{EventType::key_down};
            event.key = key_for_char(ch);
            events.push_back(event);
        }
    }
    if (quit_requested)
        events.push_back({EventType::quit});
    return events;
}

void Terminal::draw_cell(int x, int y, bool alive) {
    attr_t attrs = colour ? COLOR_PAIR(alive ? ALIVE_PAIR : DEAD_PAIR) : (alive ? A_REVERSE : A_NORMAL);
    attron(attrs);
    for (int row = 0; row < config.cell.rows; row++)
        for (int col = 0; col < config.cell.cols; col++)
            mvaddch(y * config.cell.rows + row, x * config.cell.cols + col, ' ');
    attroff(attrs);
}

void Terminal::draw_text(int x, int y, const std::string& text) {
    if (y >= LINES || x >= COLS) return;
    attr_t attrs = colour ? COLOR_PAIR(DEAD_PAIR) : A_NORMAL;
    attron(attrs);
    mvaddnstr(y, x, text.c_str(), COLS - x);
    attroff(attrs);
}

void Terminal::draw(const Grid& grid, const SessionConfig& session) {
    erase();
    for (int x = 0; x < grid.width(); x++)
        for (int y = 0; y < grid.height(); y++)
            draw_cell(x, y, grid.is_alive(x, y));

    TextPlacement placement = text_placement(config, COLS, LINES);
    draw_text(placement.x, placement.status_y, status_line(session, grid));
    draw_text(placement.x, placement.legend_y, LEGEND_TEXT);
    refresh();
}
