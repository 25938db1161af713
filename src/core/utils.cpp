#include "photomosaic/core/utils.hpp"
#include "photomosaic/core/errors.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <regex>
#include <sstream>

namespace photomosaic::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf;
    localtime_r(&now, &tm_buf);

    // YYYYMMDD_HHMMSS_ plus 8 random hex digits
    std::random_device rd;
    std::uniform_int_distribution<std::uint32_t> dis;

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_'
        << std::hex << std::setfill('0') << std::setw(8) << dis(rd);
    return oss.str();
}

std::vector<fs::path> discover_images(const fs::path& input_dir, const std::string& patterns) {
    std::vector<fs::path> images;

    if (!fs::exists(input_dir) || !fs::is_directory(input_dir)) {
        return images;
    }

    std::vector<std::string> globs;
    for (const auto& p : split(patterns, ';')) {
        if (!p.empty()) globs.push_back(p);
    }
    if (globs.empty()) globs.push_back("*");

    for (const auto& entry : fs::directory_iterator(input_dir)) {
        if (!entry.is_regular_file()) continue;
        std::string filename = entry.path().filename().string();
        for (const auto& g : globs) {
            if (glob_match(g, filename)) {
                images.push_back(entry.path());
                break;
            }
        }
    }

    std::sort(images.begin(), images.end());
    return images;
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void write_text(const fs::path& path, const std::string& text) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
    if (!file) {
        throw IOError("Cannot write file: " + path.string());
    }
}

std::string tile_label_from_path(const fs::path& path) {
    std::string name = path.filename().string();
    std::string stem = name.substr(0, name.find('.'));
    if (stem.size() <= 4) return stem;
    return stem.substr(stem.size() - 4);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

bool glob_match(const std::string& pattern, const std::string& str) {
    std::string regex_pattern;
    for (char c : pattern) {
        switch (c) {
            case '*': regex_pattern += ".*"; break;
            case '?': regex_pattern += "."; break;
            case '.': case '+': case '(': case ')': case '^': case '$':
            case '|': case '{': case '}': case '\\':
                regex_pattern += '\\';
                regex_pattern += c;
                break;
            default: regex_pattern += c; break;
        }
    }

    std::regex re(regex_pattern, std::regex::icase);
    return std::regex_match(str, re);
}

} // namespace photomosaic::core
