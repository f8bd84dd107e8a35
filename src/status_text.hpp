#pragma once
/*
Text overlaid on the grid: a status line (run state, alive count, speed,
spawning) and a key-binding legend, each at a fixed offset derived from the
grid's surface size.
*/

#include <algorithm>
#include <string>
#include "config.hpp"
#include "grid.hpp"
#include "session.hpp"

const std::string LEGEND_TEXT =
    "Pause/Play: SPACE | Randomly Spawn Cells: s | Faster: = | Slower: - | Left Click: Toggle Cell";

inline std::string status_line(const SessionConfig& session, const Grid& grid) {
    return std::string("Game State: ") + (session.paused ? "Paused" : "Running") +
           " | Alive: " + std::to_string(grid.alive_count()) +
           " | Simulation Speed: " + std::to_string(session.speed) +
           " | Spawning: " + (grid.spawning ? "True" : "False");
}

struct TextPlacement {
    int x;
    int status_y;
    int legend_y;
};

// Both lines start 70 cell widths left of the surface's right edge (clamped to
// the left edge). The status line sits at the top, the legend on the last row.
// visible_cols/visible_rows bound the placement to the part of the surface the
// display can actually show, so both lines stay on screen in a small terminal.
inline TextPlacement text_placement(const LifeConfig& config, int visible_cols, int visible_rows) {
    int cols = std::min(config.surface_width(), visible_cols);
    int rows = std::min(config.surface_height(), visible_rows);
    int legend_width = static_cast<int>(LEGEND_TEXT.size());

    TextPlacement placement;
    placement.x = std::max(0, config.surface_width() - 70 * config.cell.cols);
    placement.x = std::max(0, std::min(placement.x, cols - legend_width));
    placement.status_y = 0;
    placement.legend_y = std::max(0, rows - 1);
    return placement;
}

inline TextPlacement text_placement(const LifeConfig& config) {
    return text_placement(config, config.surface_width(), config.surface_height());
}
