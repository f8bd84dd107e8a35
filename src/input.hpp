#pragma once
/*
Input dispatch. The terminal front end turns raw curses input into a queue of
InputEvents once per frame; everything below is independent of curses so the
frame loop's reactions can be tested directly.
*/

#include <vector>
#include "config.hpp"
#include "grid.hpp"
#include "session.hpp"

enum class Key {
    pause,       // SPACE
    faster,      // '='
    slower,      // '-'
    spawn,       // 's'
    other
};

enum class EventType {
    quit,
    key_down,
    mouse_press,    // primary button went down at (x, y)
    mouse_release,  // primary button went up at (x, y)
    mouse_move      // cursor moved to (x, y)
};

struct InputEvent {
    EventType type;
    Key key = Key::other;
    int x = 0;  // surface coordinates (terminal column / row)
    int y = 0;
};

// Last known state of the primary mouse button and cursor.
struct MouseState {
    bool held = false;
    bool pressed = false;  // a press arrived since the last apply_mouse()
    int x = 0;
    int y = 0;
};

Key key_for_char(int ch);

// Apply one discrete event. Returns false for a quit event.
bool process_event(const InputEvent& event, SessionConfig& session, Grid& grid, MouseState& mouse);

// Drain a frame's event queue. Returns false if any event asked to quit;
// events after the quit are not applied.
bool process_events(const std::vector<InputEvent>& events, SessionConfig& session, Grid& grid,
                    MouseState& mouse);

// Map a surface position to a grid cell by integer division by the cell size.
CellOffset surface_to_cell(int x, int y, CellGeometry cell);

// Runs once per frame: while the button is held, flip the cell under the
// cursor. Fires every frame the button stays down, so a held button on a
// single cell makes it flicker. A press and release inside one frame still
// toggles once. Returns true if a cell was toggled.
bool apply_mouse(MouseState& mouse, Grid& grid, CellGeometry cell);

struct FrameResult {
    bool keep_running;
    bool advanced;  // a generation was computed this frame
};

// Everything a frame does before drawing: apply the queued events, then the
// mouse, then advance the grid unless paused.
FrameResult step_frame(const std::vector<InputEvent>& events, SessionConfig& session, Grid& grid,
                       MouseState& mouse, CellGeometry cell);
