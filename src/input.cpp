#include "input.hpp"

Key key_for_char(int ch) {
    switch (ch) {
        case ' ': return Key::pause;
        case '=': return Key::faster;
        case '-': return Key::slower;
        case 's':
        case 'S': return Key::spawn;
        default: return Key::other;
    }
}

bool process_event(const InputEvent& event, SessionConfig& session, Grid& grid, MouseState& mouse) {
    switch (event.type) {
        case EventType::quit:
            return false;
        case EventType::key_down:
            switch (event.key) {
                case Key::pause: session.toggle_pause(); break;
                case Key::faster: session.speed_up(); break;
                case Key::slower: session.speed_down(); break;
                case Key::spawn: session.toggle_spawning(grid); break;
                case Key::other: break;
            }
            break;
        case EventType::mouse_press:
            mouse.held = true;
            mouse.pressed = true;
            mouse.x = event.x;
            mouse.y = event.y;
            break;
        case EventType::mouse_release:
            mouse.held = false;
            mouse.x = event.x;
            mouse.y = event.y;
            break;
        case EventType::mouse_move:
            mouse.x = event.x;
            mouse.y = event.y;
            break;
    }
    return true;
}

bool process_events(const std::vector<InputEvent>& events, SessionConfig& session, Grid& grid,
                    MouseState& mouse) {
    for (const auto& event : events) {
        if (!process_event(event, session, grid, mouse))
            return false;
    }
    return true;
}

CellOffset surface_to_cell(int x, int y, CellGeometry cell) {
    // Negative positions must not round toward zero into column/row 0.
    int gx = x < 0 ? -1 : x / cell.cols;
    int gy = y < 0 ? -1 : y / cell.rows;
    return {gx, gy};
}

bool apply_mouse(MouseState& mouse, Grid& grid, CellGeometry cell) {
    bool active = mouse.held || mouse.pressed;
    mouse.pressed = false;
    if (!active) return false;
    auto [gx, gy] = surface_to_cell(mouse.x, mouse.y, cell);
    return grid.toggle(gx, gy);
}

FrameResult step_frame(const std::vector<InputEvent>& events, SessionConfig& session, Grid& grid,
                       MouseState& mouse, CellGeometry cell) {
    if (!process_events(events, session, grid, mouse))
        return {false, false};
    apply_mouse(mouse, grid, cell);
    if (session.paused)
        return {true, false};
    grid.update();
    return {true, true};
}
