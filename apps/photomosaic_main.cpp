#include "photomosaic/config/configuration.hpp"
#include "photomosaic/core/cancellation.hpp"
#include "photomosaic/core/errors.hpp"
#include "photomosaic/core/events.hpp"
#include "photomosaic/core/utils.hpp"
#include "photomosaic/pipeline/batch.hpp"
#include "photomosaic/pipeline/mosaic_job.hpp"
#include "photomosaic/pool/preprocess.hpp"
#include "photomosaic/pool/tile_pool.hpp"

#include <CLI/CLI.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

using namespace photomosaic;

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailure = 2;

struct CommonOptions {
  std::string config_path;
  std::string tiles_dir;
  std::string log_path;
};

struct RunOptions {
  CommonOptions common;
  std::string source;
  std::string output;
  int reuse = 0; // >0 --reuse, <0 --no-reuse, 0 from config
  bool rotate = false;
  long long seed = -1;
};

struct BatchOptions {
  CommonOptions common;
  std::string source_dir;
  std::string output_dir;
  int jobs = 0;
};

struct PreprocessOptions {
  std::string config_path;
  std::string input_dir;
  std::string output_dir;
  long long pixels = 0;
};

config::Config load_config(const std::string &path) {
  if (path.empty()) {
    return config::Config{};
  }
  return config::Config::load(path);
}

// Opens the optional JSON-lines mirror of the event stream.
std::unique_ptr<std::ofstream> open_log(const std::string &path) {
  if (path.empty()) {
    return nullptr;
  }
  fs::path p(path);
  if (p.has_parent_path()) {
    fs::create_directories(p.parent_path());
  }
  auto file = std::make_unique<std::ofstream>(p, std::ios::out | std::ios::app);
  if (!file->is_open()) {
    throw IOError("Cannot open log file: " + path);
  }
  return file;
}

pool::TilePool build_pool(const config::Config &cfg, const std::string &run_id,
                          core::EventEmitter &events) {
  if (cfg.tiles.dir.empty()) {
    throw ConfigError("no tile directory (tiles.dir or --tiles-dir)");
  }
  const fs::path tiles_dir(cfg.tiles.dir);
  if (!fs::is_directory(tiles_dir)) {
    throw IOError("Tile directory not found: " + tiles_dir.string());
  }

  const auto paths = core::discover_images(tiles_dir, cfg.tiles.pattern);
  events.phase_start(run_id, Phase::TILE_POOL,
                     {{"tiles_dir", tiles_dir.string()}, {"files", paths.size()}});
  try {
    auto tiles = pool::TilePool::from_paths(paths, cfg.mosaic_params(), cfg.resolved_workers());
    events.phase_end(run_id, Phase::TILE_POOL, "ok",
                     {{"tiles", tiles.size()}, {"groups", tiles.group_count()}});
    return tiles;
  } catch (const std::exception &e) {
    events.phase_end(run_id, Phase::TILE_POOL, "error", {{"error", e.what()}});
    throw;
  }
}

int run_command(const RunOptions &opt, core::CancellationToken &cancel) {
  config::Config cfg;
  try {
    cfg = load_config(opt.common.config_path);
    if (!opt.common.tiles_dir.empty()) cfg.tiles.dir = opt.common.tiles_dir;
    if (opt.reuse > 0) cfg.assignment.reuse = true;
    if (opt.reuse < 0) cfg.assignment.reuse = false;
    if (opt.rotate) cfg.mosaic.rotate = true;
    if (opt.seed >= 0) cfg.assignment.seed = static_cast<unsigned int>(opt.seed);
    cfg.validate();
  } catch (const PhotomosaicError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitUsage;
  }

  const std::string run_id = core::get_run_id();
  std::unique_ptr<std::ofstream> log_file;
  try {
    log_file = open_log(opt.common.log_path);
  } catch (const IOError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitUsage;
  }
  core::EventEmitter events(std::cout, log_file.get());

  try {
    const pool::TilePool tiles = build_pool(cfg, run_id, events);
    std::cerr << "[POOL] " << tiles.size() << " tiles in " << tiles.group_count()
              << " groups" << std::endl;

    const auto request = pipeline::make_request(cfg, opt.source, opt.output, run_id,
                                                cfg.resolved_workers());
    const auto summary = pipeline::create_mosaic(request, tiles, events, &cancel);

    std::cerr << "[MOSAIC] " << summary.filled << "/" << summary.cells_total
              << " cells filled (" << pipeline::assignment_status_to_string(summary.status)
              << "), written to " << summary.output_path.string() << std::endl;
    return kExitOk;
  } catch (const ConfigError &e) {
    events.error(run_id, e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitUsage;
  } catch (const std::exception &e) {
    events.error(run_id, e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitFailure;
  }
}

int batch_command(const BatchOptions &opt, core::CancellationToken &cancel) {
  config::Config cfg;
  try {
    cfg = load_config(opt.common.config_path);
    if (!opt.common.tiles_dir.empty()) cfg.tiles.dir = opt.common.tiles_dir;
    if (opt.jobs > 0) cfg.runtime.parallel_jobs = opt.jobs;
    cfg.validate();
  } catch (const PhotomosaicError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitUsage;
  }

  const std::string batch_id = core::get_run_id();
  std::unique_ptr<std::ofstream> log_file;
  try {
    log_file = open_log(opt.common.log_path);
  } catch (const IOError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitUsage;
  }
  core::EventEmitter events(std::cout, log_file.get());

  try {
    const fs::path source_dir(opt.source_dir);
    if (!fs::is_directory(source_dir)) {
      throw IOError("Source directory not found: " + source_dir.string());
    }
    const auto sources = core::discover_images(source_dir, cfg.tiles.pattern);
    if (sources.empty()) {
      std::cerr << "Error: no images in " << source_dir.string() << std::endl;
      return kExitUsage;
    }

    const pool::TilePool tiles = build_pool(cfg, batch_id, events);
    std::cerr << "[POOL] " << tiles.size() << " tiles in " << tiles.group_count()
              << " groups" << std::endl;

    const fs::path output_dir = opt.output_dir.empty() ? fs::path(cfg.output.dir)
                                                       : fs::path(opt.output_dir);
    const auto results =
        pipeline::run_batch(sources, output_dir, tiles, cfg, events, batch_id, &cancel);

    const bool any_failed = std::any_of(results.begin(), results.end(),
                                        [](const pipeline::BatchJobResult &r) {
                                          return !r.ok && !r.skipped;
                                        });
    return any_failed ? kExitFailure : kExitOk;
  } catch (const ConfigError &e) {
    events.error(batch_id, e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitUsage;
  } catch (const std::exception &e) {
    events.error(batch_id, e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitFailure;
  }
}

int preprocess_command(const PreprocessOptions &opt) {
  config::Config cfg;
  try {
    cfg = load_config(opt.config_path);
    if (opt.pixels > 0) cfg.preprocess.target_pixel_count = opt.pixels;
    cfg.validate();
  } catch (const PhotomosaicError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitUsage;
  }

  const std::string run_id = core::get_run_id();
  try {
    const auto report = pool::preprocess_directory(opt.input_dir, opt.output_dir,
                                                   cfg.preprocess.target_pixel_count,
                                                   cfg.tiles.pattern, cfg.resolved_workers());
    int ok = 0;
    for (const auto &e : report) {
      core::json data = {{"source", e.source.string()}, {"ok", e.ok}};
      if (e.ok) {
        ++ok;
        data["target"] = e.target.string();
        data["original_size"] = {e.original_size.width, e.original_size.height};
        data["output_size"] = {e.output_size.width, e.output_size.height};
      } else {
        data["error"] = e.error;
      }
      core::emit_event("preprocess_file", run_id, data, std::cout);
    }
    core::emit_event("preprocess_end", run_id,
                     {{"files", report.size()}, {"ok", ok},
                      {"failed", static_cast<int>(report.size()) - ok}},
                     std::cout);
    return (report.empty() || ok > 0) ? kExitOk : kExitFailure;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitFailure;
  }
}

int config_command(const std::string &write_defaults) {
  try {
    config::Config{}.save(write_defaults);
  } catch (const PhotomosaicError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitFailure;
  }
  std::cout << "Wrote default config to " << write_defaults << std::endl;
  return kExitOk;
}

} // namespace

int main(int argc, char *argv[]) {
  static core::CancellationToken cancel;
  core::install_interrupt_handler(cancel);

  CLI::App app{"photomosaic - tile matching and assignment"};
  app.require_subcommand(1);

  RunOptions run_opt;
  BatchOptions batch_opt;
  PreprocessOptions pre_opt;
  std::string write_defaults;

  auto run_cmd = app.add_subcommand("run", "Build one mosaic");
  run_cmd->add_option("--source", run_opt.source, "Source image")->required();
  run_cmd->add_option("--output", run_opt.output, "Output image")->required();
  run_cmd->add_option("--config", run_opt.common.config_path, "Path to config.yaml");
  run_cmd->add_option("--tiles-dir", run_opt.common.tiles_dir, "Tile image directory");
  run_cmd->add_flag("--reuse,!--no-reuse", run_opt.reuse,
                    "Allow a tile in several cells (default from config)");
  run_cmd->add_flag("--rotate", run_opt.rotate, "Add 90/180/270 degree tile variants");
  run_cmd->add_option("--seed", run_opt.seed, "Shuffle seed (0 = random)");
  run_cmd->add_option("--log", run_opt.common.log_path, "Mirror events into this file");

  auto batch_cmd = app.add_subcommand("batch", "Build one mosaic per image in a directory");
  batch_cmd->add_option("--source-dir", batch_opt.source_dir, "Source image directory")
      ->required();
  batch_cmd->add_option("--output-dir", batch_opt.output_dir,
                        "Output directory (default output.dir)");
  batch_cmd->add_option("--config", batch_opt.common.config_path, "Path to config.yaml");
  batch_cmd->add_option("--tiles-dir", batch_opt.common.tiles_dir, "Tile image directory");
  batch_cmd->add_option("--jobs", batch_opt.jobs, "Concurrent mosaics (default from config)");
  batch_cmd->add_option("--log", batch_opt.common.log_path, "Mirror events into this file");

  auto pre_cmd = app.add_subcommand("preprocess", "Resize tile images to a pixel budget");
  pre_cmd->add_option("--input-dir", pre_opt.input_dir, "Original tile images")->required();
  pre_cmd->add_option("--output-dir", pre_opt.output_dir, "Resized copies")->required();
  pre_cmd->add_option("--pixels", pre_opt.pixels,
                      "Target pixel count (default preprocess.target_pixel_count)");
  pre_cmd->add_option("--config", pre_opt.config_path, "Path to config.yaml");

  auto config_cmd = app.add_subcommand("config", "Configuration helpers");
  config_cmd->add_option("--write-defaults", write_defaults, "Write the default config here")
      ->required();

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e) == 0 ? kExitOk : kExitUsage;
  }

  if (run_cmd->parsed()) {
    return run_command(run_opt, cancel);
  }
  if (batch_cmd->parsed()) {
    return batch_command(batch_opt, cancel);
  }
  if (pre_cmd->parsed()) {
    return preprocess_command(pre_opt);
  }
  if (config_cmd->parsed()) {
    return config_command(write_defaults);
  }

  std::cerr << app.help() << std::endl;
  return kExitUsage;
}
