#include "photomosaic/config/configuration.hpp"
#include "photomosaic/core/errors.hpp"
#include "photomosaic/core/utils.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>

using photomosaic::ConfigError;
using photomosaic::ValidationError;
using photomosaic::config::Config;
namespace fs = std::filesystem;

TEST_CASE("config_defaults_validate") {
  Config cfg;
  REQUIRE_NOTHROW(cfg.validate());
  REQUIRE(cfg.mosaic.tile_ratio == Catch::Approx(2.4));
  REQUIRE(cfg.mosaic.tile_width == 75);
  REQUIRE(cfg.assignment.reuse);
  REQUIRE(cfg.assignment.shuffle_first == 30);

  auto p = cfg.mosaic_params();
  REQUIRE(p.tile_size() == cv::Size(75, 31));
  REQUIRE(p.color_mode() == photomosaic::ColorMode::RGB);
}

TEST_CASE("config_from_yaml_overrides_only_given_keys") {
  YAML::Node node = YAML::Load(
      "mosaic:\n"
      "  tile_width: 50\n"
      "  tile_ratio: 1.0\n"
      "  color_mode: grayscale\n"
      "  rotate: true\n"
      "assignment:\n"
      "  reuse: false\n"
      "  seed: 17\n"
      "runtime:\n"
      "  parallel_jobs: 8\n");
  Config cfg = Config::from_yaml(node);

  REQUIRE(cfg.mosaic.tile_width == 50);
  REQUIRE(cfg.mosaic.match_width == 20);
  REQUIRE_FALSE(cfg.assignment.reuse);
  REQUIRE(cfg.assignment.seed == 17u);
  REQUIRE(cfg.runtime.parallel_jobs == 8);
  REQUIRE(cfg.runtime.parallel_workers == 4);
  REQUIRE(cfg.output.dir == "results");
  REQUIRE_NOTHROW(cfg.validate());

  auto p = cfg.mosaic_params();
  REQUIRE(p.tile_size() == cv::Size(50, 50));
  REQUIRE(p.color_mode() == photomosaic::ColorMode::GRAYSCALE);
  REQUIRE(p.rotate());
}

TEST_CASE("config_bad_value_type_is_config_error") {
  YAML::Node node = YAML::Load("mosaic:\n  tile_width: wide\n");
  REQUIRE_THROWS_AS(Config::from_yaml(node), ConfigError);
}

TEST_CASE("config_validate_names_the_offending_key") {
  Config cfg;
  cfg.mosaic.tile_width = 0;
  try {
    cfg.validate();
    FAIL("expected ValidationError");
  } catch (const ValidationError &e) {
    REQUIRE(std::string(e.what()).find("mosaic.tile_width") != std::string::npos);
  }

  Config color;
  color.mosaic.color_mode = "sepia";
  REQUIRE_THROWS_AS(color.validate(), ValidationError);

  Config jobs;
  jobs.runtime.parallel_jobs = 0;
  REQUIRE_THROWS_AS(jobs.validate(), ValidationError);

  Config flat;
  flat.mosaic.tile_width = 2;
  flat.mosaic.tile_ratio = 4.0;
  REQUIRE_THROWS_AS(flat.validate(), ValidationError);

  Config shuffle;
  shuffle.assignment.shuffle_first = -1;
  REQUIRE_THROWS_AS(shuffle.validate(), ValidationError);
}

TEST_CASE("config_resolved_workers_uses_hardware_for_zero") {
  Config cfg;
  cfg.runtime.parallel_workers = 3;
  REQUIRE(cfg.resolved_workers() == 3);
  cfg.runtime.parallel_workers = 0;
  REQUIRE(cfg.resolved_workers() >= 1);
}

TEST_CASE("config_save_and_load") {
  const fs::path dir = fs::temp_directory_path() / "photomosaic_test_config";
  fs::remove_all(dir);
  fs::create_directories(dir);

  Config cfg;
  cfg.tiles.dir = "/data/wood";
  cfg.mosaic.enlargement = 2.5;
  cfg.output.label_font_scale = 0.5;
  cfg.save(dir / "config.yaml");

  Config loaded = Config::load(dir / "config.yaml");
  REQUIRE(loaded.tiles.dir == "/data/wood");
  REQUIRE(loaded.tiles.pattern == cfg.tiles.pattern);
  REQUIRE(loaded.mosaic.enlargement == Catch::Approx(2.5));
  REQUIRE(loaded.output.label_font_scale == Catch::Approx(0.5));
  REQUIRE(loaded.preprocess.target_pixel_count == 500000);

  photomosaic::core::write_text(dir / "broken.yaml", "mosaic: [unclosed\n");
  REQUIRE_THROWS_AS(Config::load(dir / "broken.yaml"), ConfigError);
  REQUIRE_THROWS_AS(Config::load(dir / "missing.yaml"), ConfigError);

  fs::remove_all(dir);
}
