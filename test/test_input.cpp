#include <cassert>
#include <iostream>
#include <vector>
#include "../src/input.hpp"

const CellGeometry CELL = CellGeometry();  // 2 columns x 1 row

InputEvent key(Key k) {
    InputEvent event{EventType::key_down};
    event.key = k;
    return event;
}

InputEvent mouse_event(EventType type, int x, int y) {
    InputEvent event{type};
    event.x = x;
    event.y = y;
    return event;
}

void test_key_mapping() {
    assert(key_for_char(' ') == Key::pause);
    assert(key_for_char('=') == Key::faster);
    assert(key_for_char('-') == Key::slower);
    assert(key_for_char('s') == Key::spawn);
    // Shift or caps lock must not disable the spawn key.
    assert(key_for_char('S') == Key::spawn);
    assert(key_for_char('q') == Key::other);
    assert(key_for_char('x') == Key::other);
    std::cout << "PASSED: test_key_mapping\n";
}

void test_keys_drive_session() {
    Grid grid(5, 5);
    SessionConfig session;
    MouseState mouse;
    bool keep = process_events({key(Key::pause), key(Key::faster), key(Key::spawn), key(Key::other)},
                               session, grid, mouse);
    assert(keep);
    assert(session.running());
    assert(session.speed == 15);
    assert(grid.spawning);
    std::cout << "PASSED: test_keys_drive_session\n";
}

void test_quit_stops_processing() {
    Grid grid(5, 5);
    SessionConfig session;
    MouseState mouse;
    bool keep = process_events({key(Key::faster), InputEvent{EventType::quit}, key(Key::faster)},
                               session, grid, mouse);
    assert(!keep);
    assert(session.speed == 15);
    std::cout << "PASSED: test_quit_stops_processing\n";
}

void test_surface_to_cell() {
    assert(surface_to_cell(0, 0, CELL) == std::make_pair(0, 0));
    assert(surface_to_cell(1, 0, CELL) == std::make_pair(0, 0));
    assert(surface_to_cell(2, 3, CELL) == std::make_pair(1, 3));
    assert(surface_to_cell(199, 99, CELL) == std::make_pair(99, 99));
    assert(surface_to_cell(-1, 4, CELL).first == -1);
    CellGeometry square{8, 8};
    assert(surface_to_cell(17, 63, square) == std::make_pair(2, 7));
    std::cout << "PASSED: test_surface_to_cell\n";
}

void test_held_button_flickers() {
    Grid grid(5, 5);
    SessionConfig session;
    MouseState mouse;
    process_events({mouse_event(EventType::mouse_press, 4, 2)}, session, grid, mouse);

    assert(apply_mouse(mouse, grid, CELL));
    assert(grid.is_alive(2, 2));
    assert(apply_mouse(mouse, grid, CELL));
    assert(!grid.is_alive(2, 2));
    assert(apply_mouse(mouse, grid, CELL));
    assert(grid.is_alive(2, 2));

    process_events({mouse_event(EventType::mouse_release, 4, 2)}, session, grid, mouse);
    assert(!apply_mouse(mouse, grid, CELL));
    assert(grid.is_alive(2, 2));
    std::cout << "PASSED: test_held_button_flickers\n";
}

void test_drag_follows_cursor() {
    Grid grid(5, 5);
    SessionConfig session;
    MouseState mouse;
    process_events({mouse_event(EventType::mouse_press, 0, 0)}, session, grid, mouse);
    apply_mouse(mouse, grid, CELL);
    process_events({mouse_event(EventType::mouse_move, 2, 1)}, session, grid, mouse);
    apply_mouse(mouse, grid, CELL);
    process_events({mouse_event(EventType::mouse_move, 4, 2)}, session, grid, mouse);
    apply_mouse(mouse, grid, CELL);
    assert(grid.is_alive(0, 0));
    assert(grid.is_alive(1, 1));
    assert(grid.is_alive(2, 2));
    assert(grid.alive_count() == 3);

    // Moving without the button does nothing.
    process_events({mouse_event(EventType::mouse_release, 4, 2), mouse_event(EventType::mouse_move, 6, 3)},
                   session, grid, mouse);
    assert(!apply_mouse(mouse, grid, CELL));
    assert(grid.alive_count() == 3);
    std::cout << "PASSED: test_drag_follows_cursor\n";
}

void test_click_within_one_frame() {
    Grid grid(5, 5);
    SessionConfig session;
    MouseState mouse;
    process_events({mouse_event(EventType::mouse_press, 6, 1), mouse_event(EventType::mouse_release, 6, 1)},
                   session, grid, mouse);
    assert(apply_mouse(mouse, grid, CELL));
    assert(grid.is_alive(3, 1));
    assert(!apply_mouse(mouse, grid, CELL));
    assert(grid.is_alive(3, 1));
    std::cout << "PASSED: test_click_within_one_frame\n";
}

void test_click_outside_grid() {
    Grid grid(5, 5);
    SessionConfig session;
    MouseState mouse;
    process_events({mouse_event(EventType::mouse_press, 10, 0)}, session, grid, mouse);
    assert(!apply_mouse(mouse, grid, CELL));
    process_events({mouse_event(EventType::mouse_move, 0, 5)}, session, grid, mouse);
    assert(!apply_mouse(mouse, grid, CELL));
    assert(grid.alive_count() == 0);
    std::cout << "PASSED: test_click_outside_grid\n";
}

// A cell toggled on while paused stays on until the simulation runs.
void test_paused_frames_keep_toggled_cell() {
    Grid grid(5, 5);
    SessionConfig session;
    MouseState mouse;
    assert(session.paused);

    FrameResult frame = step_frame({mouse_event(EventType::mouse_press, 4, 2),
                                    mouse_event(EventType::mouse_release, 4, 2)},
                                   session, grid, mouse, CELL);
    assert(frame.keep_running);
    assert(!frame.advanced);
    for (int i = 0; i < 50; i++) {
        frame = step_frame({}, session, grid, mouse, CELL);
        assert(!frame.advanced);
        assert(grid.is_alive(2, 2));
    }

    // Unpausing lets the lone cell die.
    frame = step_frame({key(Key::pause)}, session, grid, mouse, CELL);
    assert(frame.advanced);
    assert(grid.alive_count() == 0);
    std::cout << "PASSED: test_paused_frames_keep_toggled_cell\n";
}

void test_quit_frame() {
    Grid grid(5, 5);
    SessionConfig session;
    session.toggle_pause();
    MouseState mouse;
    FrameResult frame = step_frame({InputEvent{EventType::quit}}, session, grid, mouse, CELL);
    assert(!frame.keep_running);
    assert(!frame.advanced);
    std::cout << "PASSED: test_quit_frame\n";
}

int main() {
    test_key_mapping();
    test_keys_drive_session();
    test_quit_stops_processing();
    test_surface_to_cell();
    test_held_button_flickers();
    test_drag_follows_cursor();
    test_click_within_one_frame();
    test_click_outside_grid();
    test_paused_frames_keep_toggled_cell();
    test_quit_frame();

    std::cout << "\nAll input tests passed!\n";
    return 0;
}
