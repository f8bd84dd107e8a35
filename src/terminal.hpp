#pragma once
/*
Terminal: owns the curses session for the lifetime of the program. The
constructor sets up the screen and colours and throws std::runtime_error if
that fails. Mouse reporting is optional: without it the keyboard controls still
work. The destructor always restores the terminal and the SIGINT/SIGTERM
handlers that were in place before, including when the frame loop unwinds
with an exception.

One terminal character cell is one unit of the drawing surface.
*/

#include <cstdio>
#include <string>
#include <vector>
#include "config.hpp"
#include "grid.hpp"
#include "input.hpp"
#include "session.hpp"

struct screen;

class Terminal {
private:
    using SignalHandler = void (*)(int);

    LifeConfig config;
    std::FILE* out;
    screen* session_screen = nullptr;
    bool colour = false;
    bool mouse = false;
    SignalHandler previous_sigint = nullptr;
    SignalHandler previous_sigterm = nullptr;

    void draw_cell(int x, int y, bool alive);
    void draw_text(int x, int y, const std::string& text);

public:
    // term_type of nullptr means $TERM.
    explicit Terminal(const LifeConfig& config, const char* term_type = nullptr,
                      std::FILE* out = stdout, std::FILE* in = stdin);
    ~Terminal();

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    bool has_mouse() const { return mouse; }
    bool has_colour() const { return colour; }

    // Everything that arrived since the last call, in order. Never blocks.
    std::vector<InputEvent> poll_events();

    void draw(const Grid& grid, const SessionConfig& session);
};
