#pragma once

#include "photomosaic/core/params.hpp"

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace photomosaic::config {

namespace fs = std::filesystem;

struct MosaicConfig {
  double tile_ratio = 1920.0 / 800.0; // width / height
  int tile_width = 75;
  int match_width = 20;
  double enlargement = 8.0;
  std::string color_mode = "RGB"; // RGB | GRAYSCALE
  bool rotate = false;
};

struct AssignmentConfig {
  bool reuse = true;
  int shuffle_first = 30;
  unsigned int seed = 0; // 0 = nondeterministic
};

struct TilesConfig {
  std::string dir;
  std::string pattern = "*.jpg;*.jpeg;*.png;*.bmp;*.tif;*.tiff;*.webp";
};

struct OutputConfig {
  std::string dir = "results";
  bool write_instructions = true;
  std::string instructions_dir = "instructions";
  bool instructions_json = true;
  double label_font_scale = 0.35;
};

struct PreprocessConfig {
  long long target_pixel_count = 500000;
};

struct RuntimeConfig {
  int parallel_workers = 4; // 0 = hardware concurrency
  int parallel_jobs = 1;
};

struct Config {
  MosaicConfig mosaic;
  AssignmentConfig assignment;
  TilesConfig tiles;
  OutputConfig output;
  PreprocessConfig preprocess;
  RuntimeConfig runtime;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  // Builds the immutable per-mosaic parameter set. Throws ConfigError.
  MosaicParams mosaic_params() const;

  // parallel_workers with 0 resolved to the hardware thread count.
  int resolved_workers() const;
};

} // namespace photomosaic::config
