#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace photomosaic::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
// patterns is a ';'-separated list of globs, e.g. "*.jpg;*.png"
std::vector<fs::path> discover_images(const fs::path& input_dir, const std::string& patterns);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Last 4 characters of the file stem (up to the first '.').
std::string tile_label_from_path(const fs::path& path);

// String utilities
std::string to_lower(const std::string& s);
std::vector<std::string> split(const std::string& str, char delimiter);

// Glob pattern matching
bool glob_match(const std::string& pattern, const std::string& str);

} // namespace photomosaic::core
