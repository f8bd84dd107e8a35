#include "grid.hpp"
#include <stdexcept>
#include <string>

int count_neighbors(const std::vector<bool>& cells, int width, int height, int x, int y) {
    int live_neighbors = 0;
    for (int dy = -1; dy <= 1; dy++) {
        for (int dx = -1; dx <= 1; dx++) {
            if (dx == 0 && dy == 0) continue;
            int nx = x + dx;
            int ny = y + dy;
            if (nx < 0 || nx >= width || ny < 0 || ny >= height) continue;
            if (cells[nx + ny * width]) live_neighbors++;
        }
    }
    return live_neighbors;
}

Grid::Grid(int width, int height, SpawnSettings settings)
    : w(width), h(height), spawn_settings(settings), rng(settings.seed) {
    if (width < 0 || height < 0)
        throw std::invalid_argument("grid dimensions must be non-negative, got " +
                                    std::to_string(width) + "x" + std::to_string(height));
    if (settings.max_threshold < 1)
        throw std::invalid_argument("spawn threshold ceiling must be at least 1");
    cells.assign(static_cast<size_t>(w) * h, false);
}

bool Grid::at(int x, int y) const {
    if (!in_bounds(x, y))
        throw std::out_of_range("cell (" + std::to_string(x) + ", " + std::to_string(y) +
                                ") is outside the grid");
    return cells[index(x, y)];
}

void Grid::set_alive(int x, int y, bool state) {
    if (!in_bounds(x, y)) return;
    int i = index(x, y);
    if (cells[i] == state) return;
    cells[i] = state;
    alive += state ? 1 : -1;
}

bool Grid::toggle(int x, int y) {
    if (!in_bounds(x, y)) return false;
    set_alive(x, y, !cells[index(x, y)]);
    return true;
}

void Grid::stamp(const std::vector<CellOffset>& pattern, int x, int y) {
    for (const auto& [dx, dy] : pattern) {
        if (in_bounds(x + dx, y + dy))
            cells[index(x + dx, y + dy)] = true;
    }
    alive = recount();
}

void Grid::clear() {
    cells.assign(cells.size(), false);
    alive = 0;
}

int Grid::recount() const {
    int n = 0;
    for (bool c : cells)
        if (c) n++;
    return n;
}

bool Grid::spawn_draw() {
    std::uniform_int_distribution<int> roll(1, threshold);
    return roll(rng) == 1;
}

void Grid::update() {
    std::vector<bool> next(cells.size(), false);
    threshold = 1;

    // In snapshot mode spawned cells land in a working copy of the old
    // generation, which later cells in the same scan read.
    std::vector<bool> scan;
    bool spawn_into_scan = spawning && spawn_settings.target == SpawnTarget::snapshot;
    if (spawn_into_scan) scan = cells;
    const std::vector<bool>& current = spawn_into_scan ? scan : cells;

    int new_alive = 0;
    for (int x = 0; x < w; x++) {
        for (int y = 0; y < h; y++) {
            int i = index(x, y);
            bool was_alive = current[i];
            bool state = next_state(was_alive, ::count_neighbors(current, w, h, x, y));
            if (!was_alive && spawning && threshold < spawn_settings.max_threshold && spawn_draw()) {
                threshold++;
                if (spawn_into_scan)
                    scan[i] = true;
                else
                    state = true;
            }
            next[i] = state;
            if (state) new_alive++;
        }
    }
    cells.swap(next);
    alive = new_alive;
}

void Grid::print(std::ostream& out) const {
    out << "Grid " << w << "x" << h << ", " << alive << " alive:\n";
    for (int y = 0; y < h; y++) {
        for (int x = 0; x < w; x++)
            out << (cells[index(x, y)] ? 'o' : '.');
        out << "\n";
    }
}
