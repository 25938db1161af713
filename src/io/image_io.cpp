#include "photomosaic/io/image_io.hpp"
#include "photomosaic/core/errors.hpp"
#include "photomosaic/core/utils.hpp"

#include <opencv2/imgcodecs.hpp>

#include <array>

namespace photomosaic::io {

bool is_image_path(const fs::path& path) {
    static const std::array<const char*, 8> kExtensions = {
        ".jpg", ".jpeg", ".png", ".bmp", ".tif", ".tiff", ".webp", ".ppm"};
    const std::string ext = core::to_lower(path.extension().string());
    for (const char* e : kExtensions) {
        if (ext == e) return true;
    }
    return false;
}

cv::Mat read_image(const fs::path& path) {
    if (!fs::exists(path)) {
        throw IOError("Image not found: " + path.string());
    }
    cv::Mat img;
    try {
        img = cv::imread(path.string(), cv::IMREAD_ANYDEPTH | cv::IMREAD_ANYCOLOR);
    } catch (const cv::Exception& e) {
        throw IOError("Cannot decode " + path.string() + ": " + e.what());
    }
    if (img.empty()) {
        throw IOError("Cannot decode image: " + path.string());
    }
    return img;
}

void write_image(const fs::path& path, const cv::Mat& img) {
    if (img.empty()) {
        throw IOError("Refusing to write an empty image: " + path.string());
    }
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw IOError("Cannot create directory " + path.parent_path().string() +
                          ": " + ec.message());
        }
    }

    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), img);
    } catch (const cv::Exception& e) {
        throw IOError("Cannot encode " + path.string() + ": " + e.what());
    }
    if (!ok) {
        throw IOError("Cannot write image: " + path.string());
    }
}

} // namespace photomosaic::io
