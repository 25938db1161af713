#pragma once

#include "photomosaic/core/types.hpp"

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace photomosaic::pipeline {

struct InstructionEntry {
    std::string label;
    Box box;
};

// Layout sheet for building the mosaic by hand: which tile goes into which
// cell, in assignment order.
class BuildInstructions {
public:
    void add(const std::string& label, const Box& box);

    const std::vector<InstructionEntry>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }

    nlohmann::json to_json() const;
    void save_json(const fs::path& path) const;

    // White sheet of canvas_size with red cell outlines and centred labels.
    cv::Mat render(cv::Size canvas_size, double font_scale) const;
    void save_diagram(const fs::path& path, cv::Size canvas_size, double font_scale) const;

private:
    std::vector<InstructionEntry> entries_;
};

} // namespace photomosaic::pipeline
