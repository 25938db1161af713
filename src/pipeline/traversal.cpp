#include "photomosaic/pipeline/traversal.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace photomosaic::pipeline {

std::vector<GridCoord> coords_from_middle(int x_count, int y_count, double y_bias,
                                          int shuffle_first, std::mt19937& rng) {
    std::vector<GridCoord> coords;
    if (x_count <= 0 || y_count <= 0) return coords;

    coords.reserve(static_cast<std::size_t>(x_count) * static_cast<std::size_t>(y_count));
    for (int x = 0; x < x_count; ++x) {
        for (int y = 0; y < y_count; ++y) {
            coords.push_back(GridCoord{x, y});
        }
    }

    const int x_mid = x_count / 2;
    const int y_mid = y_count / 2;
    auto key = [&](const GridCoord& c) {
        return std::abs(c.x - x_mid) * y_bias + std::abs(c.y - y_mid);
    };
    std::stable_sort(coords.begin(), coords.end(),
                     [&](const GridCoord& a, const GridCoord& b) { return key(a) < key(b); });

    const std::size_t n_shuffle =
        std::min(coords.size(), static_cast<std::size_t>(std::max(0, shuffle_first)));
    if (n_shuffle > 1) {
        std::shuffle(coords.begin(), coords.begin() + static_cast<std::ptrdiff_t>(n_shuffle), rng);
    }
    return coords;
}

} // namespace photomosaic::pipeline
