#include "photomosaic/config/configuration.hpp"
#include "photomosaic/core/errors.hpp"

#include <cmath>
#include <fstream>
#include <thread>

namespace photomosaic::config {

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["mosaic"]) {
            auto m = node["mosaic"];
            if (m["tile_ratio"]) cfg.mosaic.tile_ratio = m["tile_ratio"].as<double>();
            if (m["tile_width"]) cfg.mosaic.tile_width = m["tile_width"].as<int>();
            if (m["match_width"]) cfg.mosaic.match_width = m["match_width"].as<int>();
            if (m["enlargement"]) cfg.mosaic.enlargement = m["enlargement"].as<double>();
            if (m["color_mode"]) cfg.mosaic.color_mode = m["color_mode"].as<std::string>();
            if (m["rotate"]) cfg.mosaic.rotate = m["rotate"].as<bool>();
        }

        if (node["assignment"]) {
            auto a = node["assignment"];
            if (a["reuse"]) cfg.assignment.reuse = a["reuse"].as<bool>();
            if (a["shuffle_first"]) cfg.assignment.shuffle_first = a["shuffle_first"].as<int>();
            if (a["seed"]) cfg.assignment.seed = a["seed"].as<unsigned int>();
        }

        if (node["tiles"]) {
            auto t = node["tiles"];
            if (t["dir"]) cfg.tiles.dir = t["dir"].as<std::string>();
            if (t["pattern"]) cfg.tiles.pattern = t["pattern"].as<std::string>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["dir"]) cfg.output.dir = o["dir"].as<std::string>();
            if (o["write_instructions"]) cfg.output.write_instructions = o["write_instructions"].as<bool>();
            if (o["instructions_dir"]) cfg.output.instructions_dir = o["instructions_dir"].as<std::string>();
            if (o["instructions_json"]) cfg.output.instructions_json = o["instructions_json"].as<bool>();
            if (o["label_font_scale"]) cfg.output.label_font_scale = o["label_font_scale"].as<double>();
        }

        if (node["preprocess"]) {
            auto p = node["preprocess"];
            if (p["target_pixel_count"]) {
                cfg.preprocess.target_pixel_count = p["target_pixel_count"].as<long long>();
            }
        }

        if (node["runtime"]) {
            auto r = node["runtime"];
            if (r["parallel_workers"]) cfg.runtime.parallel_workers = r["parallel_workers"].as<int>();
            if (r["parallel_jobs"]) cfg.runtime.parallel_jobs = r["parallel_jobs"].as<int>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value in config: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node << "\n";
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["mosaic"]["tile_ratio"] = mosaic.tile_ratio;
    node["mosaic"]["tile_width"] = mosaic.tile_width;
    node["mosaic"]["match_width"] = mosaic.match_width;
    node["mosaic"]["enlargement"] = mosaic.enlargement;
    node["mosaic"]["color_mode"] = mosaic.color_mode;
    node["mosaic"]["rotate"] = mosaic.rotate;

    node["assignment"]["reuse"] = assignment.reuse;
    node["assignment"]["shuffle_first"] = assignment.shuffle_first;
    node["assignment"]["seed"] = assignment.seed;

    node["tiles"]["dir"] = tiles.dir;
    node["tiles"]["pattern"] = tiles.pattern;

    node["output"]["dir"] = output.dir;
    node["output"]["write_instructions"] = output.write_instructions;
    node["output"]["instructions_dir"] = output.instructions_dir;
    node["output"]["instructions_json"] = output.instructions_json;
    node["output"]["label_font_scale"] = output.label_font_scale;

    node["preprocess"]["target_pixel_count"] = preprocess.target_pixel_count;

    node["runtime"]["parallel_workers"] = runtime.parallel_workers;
    node["runtime"]["parallel_jobs"] = runtime.parallel_jobs;

    return node;
}

void Config::validate() const {
    if (!(mosaic.tile_ratio > 0.0) || !std::isfinite(mosaic.tile_ratio)) {
        throw ValidationError("mosaic.tile_ratio must be > 0");
    }
    if (mosaic.tile_width < 1) {
        throw ValidationError("mosaic.tile_width must be >= 1");
    }
    if (mosaic.match_width < 1) {
        throw ValidationError("mosaic.match_width must be >= 1");
    }
    if (!(mosaic.enlargement > 0.0) || !std::isfinite(mosaic.enlargement)) {
        throw ValidationError("mosaic.enlargement must be > 0");
    }
    try {
        string_to_color_mode(mosaic.color_mode);
    } catch (const ConfigError&) {
        throw ValidationError("mosaic.color_mode must be 'RGB' or 'GRAYSCALE'");
    }
    if (mosaic.tile_width / mosaic.tile_ratio < 1.0) {
        throw ValidationError("mosaic.tile_width / mosaic.tile_ratio must be >= 1 (tile height)");
    }

    if (assignment.shuffle_first < 0) {
        throw ValidationError("assignment.shuffle_first must be >= 0");
    }

    if (tiles.pattern.empty()) {
        throw ValidationError("tiles.pattern must not be empty");
    }

    if (output.label_font_scale <= 0.0) {
        throw ValidationError("output.label_font_scale must be > 0");
    }

    if (preprocess.target_pixel_count < 1) {
        throw ValidationError("preprocess.target_pixel_count must be >= 1");
    }

    if (runtime.parallel_workers < 0) {
        throw ValidationError("runtime.parallel_workers must be >= 0");
    }
    if (runtime.parallel_jobs < 1) {
        throw ValidationError("runtime.parallel_jobs must be >= 1");
    }
}

MosaicParams Config::mosaic_params() const {
    return MosaicParams(mosaic.tile_ratio, mosaic.tile_width, mosaic.match_width,
                        mosaic.enlargement, string_to_color_mode(mosaic.color_mode),
                        mosaic.rotate);
}

int Config::resolved_workers() const {
    if (runtime.parallel_workers > 0) return runtime.parallel_workers;
    unsigned int hw = std::thread::hardware_concurrency();
    return hw > 0 ? static_cast<int>(hw) : 1;
}

} // namespace photomosaic::config
