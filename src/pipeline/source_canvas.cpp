#include "photomosaic/pipeline/source_canvas.hpp"
#include "photomosaic/core/errors.hpp"
#include "photomosaic/image/processing.hpp"

#include <opencv2/imgproc.hpp>

#include <limits>
#include <sstream>
#include <utility>

namespace photomosaic::pipeline {

SourceCanvas::SourceCanvas(const MosaicParams& params, cv::Mat image)
    : params_(params),
      image_(std::move(image)),
      x_tile_count_(image_.cols / params_.tile_width()),
      y_tile_count_(image_.rows / params_.tile_height()) {}

SourceCanvas SourceCanvas::build(const cv::Mat& image, const MosaicParams& params) {
    if (image.empty()) {
        throw IOError("source image has no pixels");
    }

    const double w_scaled = image.cols * params.enlargement();
    const double h_scaled = image.rows * params.enlargement();
    constexpr double kMaxSide = static_cast<double>(std::numeric_limits<int>::max());
    if (w_scaled >= kMaxSide || h_scaled >= kMaxSide) {
        std::ostringstream oss;
        oss << "enlargement " << params.enlargement() << " makes the source "
            << w_scaled << "x" << h_scaled << ", too large for an image";
        throw ConfigError(oss.str());
    }
    const int w = static_cast<int>(w_scaled);
    const int h = static_cast<int>(h_scaled);
    if (w < params.tile_width() || h < params.tile_height()) {
        std::ostringstream oss;
        oss << "enlarged source " << w << "x" << h << " is smaller than one tile ("
            << params.tile_width() << "x" << params.tile_height() << ")";
        throw ConfigError(oss.str());
    }

    cv::Mat large = image::resize_to(image, cv::Size(w, h));

    // Crop to a whole number of tiles; the odd pixel of a remainder goes to
    // the right / bottom edge.
    const int w_rem = w % params.tile_width();
    const int h_rem = h % params.tile_height();
    if (w_rem != 0 || h_rem != 0) {
        cv::Rect keep(w_rem / 2, h_rem / 2, w - w_rem, h - h_rem);
        large = large(keep).clone();
    }

    return SourceCanvas(params, image::convert_color_mode(large, params.color_mode()));
}

Box SourceCanvas::cell_box(const GridCoord& c) const {
    const int tw = params_.tile_width();
    const int th = params_.tile_height();
    return Box{c.x * tw, c.y * th, (c.x + 1) * tw, (c.y + 1) * th};
}

RowVectorXf SourceCanvas::block_sample(const Box& box) const {
    if (box.left < 0 || box.top < 0 || box.right > image_.cols || box.bottom > image_.rows ||
        box.width() <= 0 || box.height() <= 0) {
        throw SizeMismatchError("cell box lies outside the source canvas");
    }
    return image::match_sample(image_(box.to_rect()), params_, cv::INTER_AREA);
}

} // namespace photomosaic::pipeline
