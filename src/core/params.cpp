#include "photomosaic/core/params.hpp"
#include "photomosaic/core/errors.hpp"

#include <cmath>
#include <sstream>

namespace photomosaic {

MosaicParams::MosaicParams(double tile_ratio, int tile_width, int match_width,
                           double enlargement, ColorMode color_mode, bool rotate)
    : tile_ratio_(tile_ratio),
      tile_width_(tile_width),
      tile_height_(0),
      match_width_(match_width),
      match_height_(0),
      enlargement_(enlargement),
      color_mode_(color_mode),
      rotate_(rotate) {
    if (!std::isfinite(tile_ratio) || tile_ratio <= 0.0) {
        throw ConfigError("tile_ratio must be > 0");
    }
    if (tile_width < 1) {
        throw ConfigError("tile_width must be >= 1");
    }
    if (match_width < 1) {
        throw ConfigError("match_width must be >= 1");
    }
    if (!std::isfinite(enlargement) || enlargement <= 0.0) {
        throw ConfigError("enlargement must be > 0");
    }

    tile_height_ = static_cast<int>(std::floor(static_cast<double>(tile_width) / tile_ratio));
    if (tile_height_ < 1) {
        std::ostringstream oss;
        oss << "tile_width " << tile_width << " / tile_ratio " << tile_ratio
            << " gives a tile height below 1 px";
        throw ConfigError(oss.str());
    }

    match_height_ = static_cast<int>(std::lround(static_cast<double>(match_width) / tile_ratio));
    if (match_height_ < 1) {
        std::ostringstream oss;
        oss << "match_width " << match_width << " / tile_ratio " << tile_ratio
            << " gives a match height below 1 px";
        throw ConfigError(oss.str());
    }
}

} // namespace photomosaic
