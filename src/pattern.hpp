#pragma once
/*
RLE pattern decoding. Turns the usual run-length encoded Life notation
("bo$2bo$3o!") into live-cell offsets relative to the pattern's top-left
corner, ready to be stamped onto a Grid.
*/

#include <string>
#include <vector>
#include "grid.hpp"

std::vector<CellOffset> parse_rle(const std::string& rle);

// Smallest width/height that contains every offset.
std::pair<int, int> pattern_extent(const std::vector<CellOffset>& pattern);
