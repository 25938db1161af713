#include "photomosaic/image/processing.hpp"
#include "photomosaic/core/errors.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <string>

namespace photomosaic::image {

Box aspect_crop_box(int width, int height, double target_aspect,
                    std::optional<cv::Point> centerpoint) {
    if (width < 1 || height < 1) {
        throw SizeMismatchError("cannot crop an empty image");
    }
    if (!(target_aspect > 0.0)) {
        throw ConfigError("target aspect must be > 0");
    }

    const cv::Point center = centerpoint.value_or(cv::Point(width / 2, height / 2));
    const double aspect = static_cast<double>(width) / static_cast<double>(height);

    Box box{0, 0, width, height};
    if (aspect > target_aspect) {
        // Crop the left and right edges
        int extent = std::max(1, static_cast<int>(target_aspect * height));
        extent = std::min(extent, width);
        int left = std::clamp(center.x - extent / 2, 0, width - extent);
        box.left = left;
        box.right = left + extent;
    } else {
        // Crop the top and bottom
        int extent = std::max(1, static_cast<int>(width / target_aspect));
        extent = std::min(extent, height);
        int top = std::clamp(center.y - extent / 2, 0, height - extent);
        box.top = top;
        box.bottom = top + extent;
    }
    return box;
}

cv::Mat aspect_crop(const cv::Mat& img, double target_aspect,
                    std::optional<cv::Point> centerpoint) {
    Box box = aspect_crop_box(img.cols, img.rows, target_aspect, centerpoint);
    return img(box.to_rect()).clone();
}

cv::Mat convert_color_mode(const cv::Mat& img, ColorMode mode) {
    if (img.empty()) {
        throw IOError("cannot convert an empty image");
    }

    cv::Mat src8;
    switch (img.depth()) {
        case CV_8U:
            src8 = img;
            break;
        case CV_16U:
            img.convertTo(src8, CV_8U, 1.0 / 257.0);
            break;
        case CV_32F:
        case CV_64F:
            // float rasters are expected in [0, 1]
            img.convertTo(src8, CV_8U, 255.0);
            break;
        default:
            img.convertTo(src8, CV_8U);
            break;
    }

    cv::Mat out;
    const int ch = src8.channels();
    if (mode == ColorMode::RGB) {
        if (ch == 1) cv::cvtColor(src8, out, cv::COLOR_GRAY2BGR);
        else if (ch == 3) out = src8.clone();
        else if (ch == 4) cv::cvtColor(src8, out, cv::COLOR_BGRA2BGR);
    } else {
        if (ch == 1) out = src8.clone();
        else if (ch == 3) cv::cvtColor(src8, out, cv::COLOR_BGR2GRAY);
        else if (ch == 4) cv::cvtColor(src8, out, cv::COLOR_BGRA2GRAY);
    }
    if (out.empty()) {
        throw IOError("unsupported channel count: " + std::to_string(ch));
    }
    return out;
}

cv::Mat rotate_quarter_turns(const cv::Mat& img, int quarter_turns) {
    const int k = ((quarter_turns % 4) + 4) % 4;
    cv::Mat out;
    switch (k) {
        case 1: cv::rotate(img, out, cv::ROTATE_90_COUNTERCLOCKWISE); break;
        case 2: cv::rotate(img, out, cv::ROTATE_180); break;
        case 3: cv::rotate(img, out, cv::ROTATE_90_CLOCKWISE); break;
        default: out = img.clone(); break;
    }
    return out;
}

cv::Mat resize_to(const cv::Mat& img, cv::Size size) {
    if (img.size() == size) {
        return img.clone();
    }
    const bool shrinking = size.width <= img.cols && size.height <= img.rows;
    cv::Mat out;
    cv::resize(img, out, size, 0.0, 0.0, shrinking ? cv::INTER_AREA : cv::INTER_CUBIC);
    return out;
}

RowVectorXf match_sample(const cv::Mat& img, const MosaicParams& params, int interpolation) {
    if (img.empty()) {
        throw SizeMismatchError("cannot sample an empty block");
    }
    if (img.channels() != params.channels()) {
        throw SizeMismatchError("block has " + std::to_string(img.channels()) +
                                " channels, expected " + std::to_string(params.channels()));
    }

    cv::Mat small;
    if (img.size() == params.match_size()) {
        small = img;
    } else {
        cv::resize(img, small, params.match_size(), 0.0, 0.0, interpolation);
    }

    cv::Mat f32;
    small.convertTo(f32, CV_32F);
    if (!f32.isContinuous()) {
        f32 = f32.clone();
    }

    const int n = params.sample_length();
    return Eigen::Map<const RowVectorXf>(f32.ptr<float>(), n);
}

} // namespace photomosaic::image
