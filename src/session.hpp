#pragma once
/*
SessionConfig: the run parameters the player changes while the program is
running (pause state, speed, spawn latch). Owned by the frame loop and passed
to whatever needs it.

States: Paused <-> Running, toggled only by the pause key. Initial state comes
from LifeConfig::start_paused.
*/

#include <algorithm>
#include "config.hpp"
#include "grid.hpp"

// Two-state latch driving Grid::spawning. Starts in `armed`: the next toggle
// turns spawning on.
enum class SpawnLatch {
    armed,
    engaged
};

struct SessionConfig {
    bool paused;
    int speed;
    SpawnLatch latch = SpawnLatch::armed;

    int speed_step;
    int min_speed;
    int max_speed;

    explicit SessionConfig(const LifeConfig& config = DEFAULT_CONFIG)
        : paused(config.start_paused),
          speed(std::clamp(config.initial_speed, config.min_speed, config.max_speed)),
          speed_step(config.speed_step),
          min_speed(config.min_speed),
          max_speed(config.max_speed) {}

    bool running() const { return !paused; }

    void toggle_pause() { paused = !paused; }

    void speed_up() { speed = std::min(speed + speed_step, max_speed); }

    void speed_down() { speed = std::max(speed - speed_step, min_speed); }

    void toggle_spawning(Grid& grid) {
        if (latch == SpawnLatch::engaged) {
            grid.spawning = false;
            latch = SpawnLatch::armed;
        } else {
            grid.spawning = true;
            latch = SpawnLatch::engaged;
        }
    }
};
