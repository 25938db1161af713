#pragma once

#include <Eigen/Dense>
#include <opencv2/core.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace photomosaic {

namespace fs = std::filesystem;

// Comparison arrays: one row per tile, one column per sample value.
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using RowVectorXf = Eigen::Matrix<float, 1, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXf = Eigen::VectorXf;

// Color mode enumeration
enum class ColorMode {
    RGB,
    GRAYSCALE
};

std::string color_mode_to_string(ColorMode mode);

// Accepts RGB, GRAYSCALE and the aliases L, GRAY, GREY. Throws ConfigError otherwise.
ColorMode string_to_color_mode(const std::string& s);

// Half-open pixel rectangle [left, right) x [top, bottom).
struct Box {
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;

    int width() const { return right - left; }
    int height() const { return bottom - top; }
    cv::Rect to_rect() const { return cv::Rect(left, top, width(), height()); }

    bool operator==(const Box& o) const {
        return left == o.left && top == o.top && right == o.right && bottom == o.bottom;
    }
    bool operator!=(const Box& o) const { return !(*this == o); }
};

// Grid cell coordinate (column, row)
struct GridCoord {
    int x = 0;
    int y = 0;

    bool operator==(const GridCoord& o) const { return x == o.x && y == o.y; }
    bool operator!=(const GridCoord& o) const { return !(*this == o); }
};

// Pipeline phase enumeration (event reporting only)
enum class Phase {
    SOURCE = 0,
    TILE_POOL = 1,
    RANKING = 2,
    ASSIGNMENT = 3,
    COMPOSE = 4,
    INSTRUCTIONS = 5,
    DONE = 6
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::SOURCE: return "SOURCE";
        case Phase::TILE_POOL: return "TILE_POOL";
        case Phase::RANKING: return "RANKING";
        case Phase::ASSIGNMENT: return "ASSIGNMENT";
        case Phase::COMPOSE: return "COMPOSE";
        case Phase::INSTRUCTIONS: return "INSTRUCTIONS";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace photomosaic
