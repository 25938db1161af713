#include "photomosaic/pool/preprocess.hpp"
#include "photomosaic/core/errors.hpp"
#include "photomosaic/core/parallel.hpp"
#include "photomosaic/core/utils.hpp"
#include "photomosaic/image/processing.hpp"
#include "photomosaic/io/image_io.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace photomosaic::pool {

cv::Size size_for_pixel_budget(cv::Size size, long long target_pixel_count) {
    if (size.width < 1 || size.height < 1) {
        throw SizeMismatchError("cannot rescale an empty image");
    }
    if (target_pixel_count < 1) {
        throw ConfigError("target pixel count must be >= 1");
    }
    const double current = static_cast<double>(size.width) * static_cast<double>(size.height);
    const double factor = std::sqrt(static_cast<double>(target_pixel_count) / current);
    const double w = size.width * factor;
    const double h = size.height * factor;
    if (w >= static_cast<double>(std::numeric_limits<int>::max()) ||
        h >= static_cast<double>(std::numeric_limits<int>::max())) {
        throw ConfigError("target pixel count " + std::to_string(target_pixel_count) +
                          " is too large for a " + std::to_string(size.width) + "x" +
                          std::to_string(size.height) + " image");
    }
    return cv::Size(std::max(1, static_cast<int>(w)), std::max(1, static_cast<int>(h)));
}

std::vector<PreprocessEntry> preprocess_directory(const fs::path& input_dir,
                                                  const fs::path& output_dir,
                                                  long long target_pixel_count,
                                                  const std::string& patterns,
                                                  int workers) {
    if (!fs::is_directory(input_dir)) {
        throw IOError("Input directory not found: " + input_dir.string());
    }

    const auto paths = core::discover_images(input_dir, patterns);
    std::vector<PreprocessEntry> report(paths.size());

    core::parallel_for_index(paths.size(), workers, [&](std::size_t i) {
        PreprocessEntry& e = report[i];
        e.source = paths[i];
        e.target = output_dir / paths[i].filename();
        try {
            cv::Mat img = io::read_image(e.source);
            e.original_size = img.size();
            e.output_size = size_for_pixel_budget(img.size(), target_pixel_count);
            io::write_image(e.target, image::resize_to(img, e.output_size));
            e.ok = true;
        } catch (const PhotomosaicError& ex) {
            e.ok = false;
            e.error = ex.what();
        }
    });

    return report;
}

} // namespace photomosaic::pool
