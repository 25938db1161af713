#pragma once

#include "photomosaic/core/types.hpp"
#include "photomosaic/pipeline/source_canvas.hpp"

#include <opencv2/core.hpp>

namespace photomosaic::pipeline {

// Output raster. Starts as a copy of the source canvas so unfilled cells keep
// the enlarged source pixels.
class MosaicCanvas {
public:
    explicit MosaicCanvas(const SourceCanvas& source);

    // Throws SizeMismatchError unless tile is exactly box-sized, of the canvas
    // pixel type and inside the canvas.
    void place_tile(const cv::Mat& tile, const Box& box);

    // Encodes and writes the current raster; may be called repeatedly.
    void save(const fs::path& path) const;

    const cv::Mat& image() const { return image_; }
    int tiles_placed() const { return tiles_placed_; }

private:
    cv::Mat image_;
    int tiles_placed_ = 0;
};

} // namespace photomosaic::pipeline
