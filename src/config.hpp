#pragma once
/*
Fixed startup parameters. There are no flags, environment variables or config
files: everything the program needs is a default here.
*/

// Size of one grid cell on the display surface, in character cells.
struct CellGeometry {
    int cols = 2;
    int rows = 1;
};

struct LifeConfig {
    int grid_width = 100;
    int grid_height = 100;
    CellGeometry cell;

    int initial_speed = 10;  // generations (and frames) per second
    int speed_step = 5;
    int min_speed = 5;
    int max_speed = 120;

    int spawn_threshold_ceiling = 1000;
    bool start_paused = true;

    int surface_width() const { return grid_width * cell.cols; }
    int surface_height() const { return grid_height * cell.rows; }
};

const LifeConfig DEFAULT_CONFIG = LifeConfig();
