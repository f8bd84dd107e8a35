#pragma once
/*
Grid: a fixed-size, bounded (no wraparound) Game of Life board.

Cells are stored in a flat buffer indexed by x + y * width. update() reads a
read-only snapshot of the current generation and writes a freshly allocated
buffer, so no cell ever observes a partial update from the same tick.

Spawning: when enabled, dead cells may come alive at random. The chance of a
spawn is 1 / spawn_threshold, and each successful spawn raises the threshold,
so spawns get rarer as the scan goes on and stop for the rest of the scan once
the threshold reaches SpawnSettings::max_threshold. The threshold restarts at 1
every generation.
*/

#include <cstdint>
#include <ostream>
#include <random>
#include <utility>
#include <vector>

using CellOffset = std::pair<int, int>;

// Where a successful spawn draw writes the revived cell.
enum class SpawnTarget {
    next_generation,  // alive in the generation being produced
    snapshot          // alive in the scan's working copy of the old generation only
};

struct SpawnSettings {
    SpawnTarget target = SpawnTarget::next_generation;
    int max_threshold = 1000;
    std::uint32_t seed = 5489u;
};

// Number of live cells among the 8 Moore neighbours of (x, y).
// Positions outside [0, width) x [0, height) count as dead.
int count_neighbors(const std::vector<bool>& cells, int width, int height, int x, int y);

// Standard B3/S23 transition for a single cell.
inline bool next_state(bool alive, int neighbors) {
    if (alive)
        return neighbors == 2 || neighbors == 3;
    return neighbors == 3;
}

class Grid {
private:
    int w;
    int h;
    std::vector<bool> cells;
    int alive = 0;
    SpawnSettings spawn_settings;
    std::mt19937 rng;
    int threshold = 1;

    int index(int x, int y) const { return x + y * w; }
    bool spawn_draw();
    int recount() const;

public:
    bool spawning = false;

    Grid(int width, int height, SpawnSettings settings = SpawnSettings());

    int width() const { return w; }
    int height() const { return h; }
    int alive_count() const { return alive; }
    // Threshold reached by the most recent update().
    int spawn_threshold() const { return threshold; }
    const SpawnSettings& settings() const { return spawn_settings; }

    bool in_bounds(int x, int y) const {
        return x >= 0 && x < w && y >= 0 && y < h;
    }

    // No bounds check; use at() when the position may be off-grid.
    bool is_alive(int x, int y) const { return cells[index(x, y)]; }
    bool at(int x, int y) const;

    int count_neighbors(int x, int y) const {
        return ::count_neighbors(cells, w, h, x, y);
    }

    void set_alive(int x, int y, bool state);

    // Flip the cell at (x, y). Returns false (and does nothing) when off-grid.
    bool toggle(int x, int y);

    void stamp(const std::vector<CellOffset>& pattern, int x, int y);
    void clear();

    // Advance one generation.
    void update();

    void print(std::ostream& out) const;
};
