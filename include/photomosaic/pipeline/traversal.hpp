#pragma once

#include "photomosaic/core/types.hpp"

#include <random>
#include <vector>

namespace photomosaic::pipeline {

/**
 * Fill order for the grid: every cell exactly once, sorted by
 *   |x - x_count/2| * y_bias + |y - y_count/2|
 * (integer midpoints), ties kept in column-major enumeration order (x outer,
 * y inner). The first shuffle_first entries are then shuffled with rng; the
 * rest keep their order.
 *
 * y_bias is normally the tile ratio, so that on a grid of wide tiles the
 * order approximates physical distance from the centre.
 */
std::vector<GridCoord> coords_from_middle(int x_count, int y_count, double y_bias,
                                          int shuffle_first, std::mt19937& rng);

} // namespace photomosaic::pipeline
