#pragma once

#include "photomosaic/core/types.hpp"

#include <opencv2/core.hpp>

namespace photomosaic::io {

bool is_image_path(const fs::path& path);

// Decodes any depth / channel layout OpenCV understands. Throws IOError.
cv::Mat read_image(const fs::path& path);

// Creates parent directories, overwrites an existing file. Throws IOError.
void write_image(const fs::path& path, const cv::Mat& img);

} // namespace photomosaic::io
