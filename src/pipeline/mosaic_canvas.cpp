#include "photomosaic/pipeline/mosaic_canvas.hpp"
#include "photomosaic/core/errors.hpp"
#include "photomosaic/io/image_io.hpp"

#include <sstream>

namespace photomosaic::pipeline {

MosaicCanvas::MosaicCanvas(const SourceCanvas& source)
    : image_(source.image().clone()) {}

void MosaicCanvas::place_tile(const cv::Mat& tile, const Box& box) {
    if (tile.cols != box.width() || tile.rows != box.height()) {
        std::ostringstream oss;
        oss << "tile is " << tile.cols << "x" << tile.rows << ", cell ("
            << box.left << "," << box.top << "," << box.right << "," << box.bottom
            << ") is " << box.width() << "x" << box.height();
        throw SizeMismatchError(oss.str());
    }
    if (tile.type() != image_.type()) {
        throw SizeMismatchError("tile pixel type does not match the canvas");
    }
    if (box.left < 0 || box.top < 0 || box.right > image_.cols || box.bottom > image_.rows) {
        throw SizeMismatchError("cell box lies outside the canvas");
    }

    tile.copyTo(image_(box.to_rect()));
    ++tiles_placed_;
}

void MosaicCanvas::save(const fs::path& path) const {
    io::write_image(path, image_);
}

} // namespace photomosaic::pipeline
