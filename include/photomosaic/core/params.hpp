#pragma once

#include "types.hpp"

#include <opencv2/core.hpp>

namespace photomosaic {

/**
 * Immutable geometry and matching parameters for one mosaic.
 *
 * tile_ratio is width / height. tile_height is floor(tile_width / tile_ratio)
 * and match_height is round(match_width / tile_ratio); both tiles and source
 * blocks are compared at match_size.
 */
class MosaicParams {
public:
    MosaicParams(double tile_ratio, int tile_width, int match_width,
                 double enlargement, ColorMode color_mode, bool rotate);

    double tile_ratio() const { return tile_ratio_; }
    int tile_width() const { return tile_width_; }
    int tile_height() const { return tile_height_; }
    cv::Size tile_size() const { return cv::Size(tile_width_, tile_height_); }

    int match_width() const { return match_width_; }
    int match_height() const { return match_height_; }
    cv::Size match_size() const { return cv::Size(match_width_, match_height_); }

    double enlargement() const { return enlargement_; }
    ColorMode color_mode() const { return color_mode_; }
    bool rotate() const { return rotate_; }

    int channels() const { return color_mode_ == ColorMode::RGB ? 3 : 1; }
    int sample_length() const { return match_width_ * match_height_ * channels(); }

private:
    double tile_ratio_;
    int tile_width_;
    int tile_height_;
    int match_width_;
    int match_height_;
    double enlargement_;
    ColorMode color_mode_;
    bool rotate_;
};

} // namespace photomosaic
