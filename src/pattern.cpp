#include "pattern.hpp"
#include <algorithm>
#include <stdexcept>

std::vector<CellOffset> parse_rle(const std::string& rle) {
    std::vector<CellOffset> on_cells;
    int x = 0;
    int y = 0;
    int count = 0;
    size_t i = 0;
    bool line_start = true;
    while (i < rle.size()) {
        char c = rle[i];
        if (line_start && (c == 'x' || c == '#')) { // skip header and comments.
            while (i < rle.size() && rle[i] != '\n') i++;
            i++;
            continue;
        }
        line_start = false;
        if (c >= '0' && c <= '9') {
            count = count * 10 + (c - '0');
        } else {
            if (count == 0) count = 1;
            if (c == 'b') {
                x += count;
            } else if (c == 'o') {
                for (int j = 0; j < count; j++) {
                    on_cells.emplace_back(x, y);
                    x += 1;
                }
            } else if (c == '$') {
                y += count;
                x = 0;
            } else if (c == '!') {
                break;
            } else if (c == '\n') {
                line_start = true;
            } else if (c != ' ' && c != '\r' && c != '\t') {
                throw std::invalid_argument(std::string("unexpected character '") + c +
                                            "' in RLE pattern at offset " + std::to_string(i));
            }
            count = 0;
        }
        i++;
    }
    return on_cells;
}

std::pair<int, int> pattern_extent(const std::vector<CellOffset>& pattern) {
    int max_x = -1;
    int max_y = -1;
    for (const auto& [x, y] : pattern) {
        max_x = std::max(max_x, x);
        max_y = std::max(max_y, y);
    }
    return {max_x + 1, max_y + 1};
}
