#pragma once

#include "photomosaic/core/types.hpp"

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace photomosaic::pool {

struct PreprocessEntry {
    fs::path source;
    fs::path target;
    cv::Size original_size;
    cv::Size output_size;
    bool ok = false;
    std::string error;
};

// Size with roughly target_pixel_count pixels and the same aspect ratio
// (dimensions truncated, never below 1 px).
cv::Size size_for_pixel_budget(cv::Size size, long long target_pixel_count);

// Resizes every matching image in input_dir to the pixel budget and writes it
// under the same file name into output_dir. Unreadable files are reported in
// the result and skipped.
std::vector<PreprocessEntry> preprocess_directory(const fs::path& input_dir,
                                                  const fs::path& output_dir,
                                                  long long target_pixel_count,
                                                  const std::string& patterns,
                                                  int workers = 1);

} // namespace photomosaic::pool
