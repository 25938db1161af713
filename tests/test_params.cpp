#include "photomosaic/core/errors.hpp"
#include "photomosaic/core/params.hpp"
#include "photomosaic/core/types.hpp"

#include <catch2/catch_test_macros.hpp>

#include <limits>

using photomosaic::ColorMode;
using photomosaic::ConfigError;
using photomosaic::MosaicParams;

TEST_CASE("tile_width_10_ratio_1_gives_10x10_tiles") {
  MosaicParams p(1.0, 10, 5, 2.0, ColorMode::RGB, false);

  REQUIRE(p.tile_height() == 10);
  REQUIRE(p.tile_size() == cv::Size(10, 10));
  REQUIRE(p.match_size() == cv::Size(5, 5));
  REQUIRE(p.channels() == 3);
  REQUIRE(p.sample_length() == 75);
}

TEST_CASE("tile_height_is_floored_and_match_height_rounded") {
  // 75 / 2.4 = 31.25, 20 / 2.4 = 8.33
  MosaicParams wide(1920.0 / 800.0, 75, 20, 8.0, ColorMode::GRAYSCALE, true);
  REQUIRE(wide.tile_size() == cv::Size(75, 31));
  REQUIRE(wide.match_size() == cv::Size(20, 8));
  REQUIRE(wide.channels() == 1);
  REQUIRE(wide.sample_length() == 160);
  REQUIRE(wide.rotate());

  // 10 / 0.8 = 12.5 -> 12, 3 / 0.8 = 3.75 -> 4
  MosaicParams tall(0.8, 10, 3, 1.0, ColorMode::RGB, false);
  REQUIRE(tall.tile_size() == cv::Size(10, 12));
  REQUIRE(tall.match_size() == cv::Size(3, 4));
}

TEST_CASE("invalid_mosaic_params_are_rejected") {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();

  REQUIRE_THROWS_AS(MosaicParams(1.0, 0, 5, 1.0, ColorMode::RGB, false), ConfigError);
  REQUIRE_THROWS_AS(MosaicParams(0.0, 10, 5, 1.0, ColorMode::RGB, false), ConfigError);
  REQUIRE_THROWS_AS(MosaicParams(-1.5, 10, 5, 1.0, ColorMode::RGB, false), ConfigError);
  REQUIRE_THROWS_AS(MosaicParams(nan, 10, 5, 1.0, ColorMode::RGB, false), ConfigError);
  REQUIRE_THROWS_AS(MosaicParams(1.0, 10, 0, 1.0, ColorMode::RGB, false), ConfigError);
  REQUIRE_THROWS_AS(MosaicParams(1.0, 10, 5, 0.0, ColorMode::RGB, false), ConfigError);
  REQUIRE_THROWS_AS(MosaicParams(1.0, 10, 5, inf, ColorMode::RGB, false), ConfigError);
  // tile height would be 0
  REQUIRE_THROWS_AS(MosaicParams(2.0, 1, 5, 1.0, ColorMode::RGB, false), ConfigError);
  // match height would be 0
  REQUIRE_THROWS_AS(MosaicParams(5.0, 50, 2, 1.0, ColorMode::RGB, false), ConfigError);
}

TEST_CASE("config_error_message_has_category_prefix") {
  try {
    MosaicParams(1.0, 0, 5, 1.0, ColorMode::RGB, false);
    FAIL("expected ConfigError");
  } catch (const ConfigError &e) {
    REQUIRE(std::string(e.what()).rfind("Config error: ", 0) == 0);
  }
}

TEST_CASE("color_mode_parsing_accepts_aliases") {
  using photomosaic::string_to_color_mode;

  REQUIRE(string_to_color_mode("RGB") == ColorMode::RGB);
  REQUIRE(string_to_color_mode("  rgb ") == ColorMode::RGB);
  REQUIRE(string_to_color_mode("GRAYSCALE") == ColorMode::GRAYSCALE);
  REQUIRE(string_to_color_mode("l") == ColorMode::GRAYSCALE);
  REQUIRE(string_to_color_mode("Gray") == ColorMode::GRAYSCALE);
  REQUIRE(string_to_color_mode("grey") == ColorMode::GRAYSCALE);
  REQUIRE_THROWS_AS(string_to_color_mode("CMYK"), ConfigError);
  REQUIRE_THROWS_AS(string_to_color_mode(""), ConfigError);

  REQUIRE(photomosaic::color_mode_to_string(ColorMode::GRAYSCALE) == "GRAYSCALE");
}
