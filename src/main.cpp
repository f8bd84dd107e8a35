#include <exception>
#include <iostream>
#include <random>
#include "config.hpp"
#include "grid.hpp"
#include "input.hpp"
#include "profiling.hpp"
#include "session.hpp"
#include "terminal.hpp"

/*
Frame loop: poll input, apply the mouse, advance a generation unless paused,
draw, then sleep to hold the frame rate at the current speed.
*/
void run(const LifeConfig& config, RunStats& stats, int& final_alive) {
    SpawnSettings spawn;
    spawn.max_threshold = config.spawn_threshold_ceiling;
    spawn.seed = std::random_device{}();

    Grid grid(config.grid_width, config.grid_height, spawn);
    SessionConfig session(config);
    MouseState mouse;
    FrameClock clock;

    Terminal terminal(config);
    while (true) {
        FrameResult frame = step_frame(terminal.poll_events(), session, grid, mouse, config.cell);
        if (!frame.keep_running) break;
        if (frame.advanced) stats.generations++;

        terminal.draw(grid, session);
        clock.tick(session.speed);
    }
    final_alive = grid.alive_count();
}

int main() {
    RunStats stats;
    int final_alive = 0;
    try {
        run(DEFAULT_CONFIG, stats, final_alive);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    stats.report(std::cout, final_alive);
    return 0;
}
