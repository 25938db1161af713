#pragma once

#include "photomosaic/core/params.hpp"
#include "photomosaic/core/types.hpp"

#include <opencv2/core.hpp>

namespace photomosaic::pipeline {

/**
 * The enlarged source image, cropped symmetrically to a whole number of
 * tiles and converted to the mosaic color mode.
 */
class SourceCanvas {
public:
    // Throws ConfigError if the enlarged image is smaller than one tile.
    static SourceCanvas build(const cv::Mat& image, const MosaicParams& params);

    const cv::Mat& image() const { return image_; }
    const MosaicParams& params() const { return params_; }

    int x_tile_count() const { return x_tile_count_; }
    int y_tile_count() const { return y_tile_count_; }
    int cell_count() const { return x_tile_count_ * y_tile_count_; }

    Box cell_box(const GridCoord& c) const;

    // Cell pixels downsampled (area filter) to the comparison resolution.
    RowVectorXf block_sample(const Box& box) const;

private:
    SourceCanvas(const MosaicParams& params, cv::Mat image);

    MosaicParams params_;
    cv::Mat image_;
    int x_tile_count_ = 0;
    int y_tile_count_ = 0;
};

} // namespace photomosaic::pipeline
