#pragma once

#include "photomosaic/core/params.hpp"
#include "photomosaic/core/types.hpp"

#include <opencv2/core.hpp>
#include <optional>

namespace photomosaic::image {

// Largest box of aspect target_aspect (width / height) inside a width x height
// image, centered on centerpoint (image center by default) and clamped so it
// stays inside the image.
Box aspect_crop_box(int width, int height, double target_aspect,
                    std::optional<cv::Point> centerpoint = std::nullopt);

cv::Mat aspect_crop(const cv::Mat& img, double target_aspect,
                    std::optional<cv::Point> centerpoint = std::nullopt);

// 8-bit BGR for RGB, 8-bit single channel for GRAYSCALE. Accepts 1/3/4
// channel input of any depth.
cv::Mat convert_color_mode(const cv::Mat& img, ColorMode mode);

// Counter-clockwise rotation by quarter_turns * 90 degrees.
cv::Mat rotate_quarter_turns(const cv::Mat& img, int quarter_turns);

// Area filter when shrinking, cubic when enlarging.
cv::Mat resize_to(const cv::Mat& img, cv::Size size);

// Downsample to params.match_size() and flatten into a float row vector
// (row-major pixels, interleaved channels).
RowVectorXf match_sample(const cv::Mat& img, const MosaicParams& params, int interpolation);

} // namespace photomosaic::image
