#include "photomosaic/pipeline/build_instructions.hpp"
#include "photomosaic/core/errors.hpp"
#include "photomosaic/core/utils.hpp"
#include "photomosaic/io/image_io.hpp"

#include <opencv2/imgproc.hpp>

namespace photomosaic::pipeline {

void BuildInstructions::add(const std::string& label, const Box& box) {
    entries_.push_back(InstructionEntry{label, box});
}

nlohmann::json BuildInstructions::to_json() const {
    nlohmann::json cells = nlohmann::json::array();
    for (const auto& e : entries_) {
        cells.push_back({
            {"label", e.label},
            {"box", {e.box.left, e.box.top, e.box.right, e.box.bottom}}
        });
    }
    return {{"count", entries_.size()}, {"cells", cells}};
}

void BuildInstructions::save_json(const fs::path& path) const {
    core::write_text(path, to_json().dump(2) + "\n");
}

cv::Mat BuildInstructions::render(cv::Size canvas_size, double font_scale) const {
    if (canvas_size.width < 1 || canvas_size.height < 1) {
        throw SizeMismatchError("instruction sheet needs a non-empty canvas");
    }

    cv::Mat sheet(canvas_size, CV_8UC3, cv::Scalar(255, 255, 255));
    const cv::Scalar grid_color(0, 0, 255);
    const cv::Scalar text_color(0, 0, 0);
    const int font = cv::FONT_HERSHEY_SIMPLEX;

    for (const auto& e : entries_) {
        cv::rectangle(sheet, cv::Point(e.box.left, e.box.top),
                      cv::Point(e.box.right - 1, e.box.bottom - 1), grid_color, 1);
    }

    for (const auto& e : entries_) {
        int baseline = 0;
        cv::Size text = cv::getTextSize(e.label, font, font_scale, 1, &baseline);
        cv::Point origin(e.box.left + (e.box.width() - text.width) / 2,
                         e.box.top + (e.box.height() + text.height) / 2);
        cv::putText(sheet, e.label, origin, font, font_scale, text_color, 1, cv::LINE_AA);
    }
    return sheet;
}

void BuildInstructions::save_diagram(const fs::path& path, cv::Size canvas_size,
                                     double font_scale) const {
    io::write_image(path, render(canvas_size, font_scale));
}

} // namespace photomosaic::pipeline
