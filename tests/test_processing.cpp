#include "photomosaic/core/errors.hpp"
#include "photomosaic/image/processing.hpp"
#include "photomosaic/io/image_io.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using photomosaic::Box;
using photomosaic::ColorMode;
using photomosaic::MosaicParams;
namespace image = photomosaic::image;

TEST_CASE("aspect_crop_wide_image_to_square_crops_left_and_right") {
  Box box = image::aspect_crop_box(100, 50, 1.0);
  REQUIRE(box == Box{25, 0, 75, 50});

  cv::Mat img(50, 100, CV_8UC3, cv::Scalar(1, 2, 3));
  cv::Mat cropped = image::aspect_crop(img, 1.0);
  REQUIRE(cropped.cols == 50);
  REQUIRE(cropped.rows == 50);
}

TEST_CASE("aspect_crop_tall_image_crops_top_and_bottom") {
  REQUIRE(image::aspect_crop_box(50, 100, 1.0) == Box{0, 25, 50, 75});
  // 2:1 target inside a 100x100 image -> 100x50 band
  REQUIRE(image::aspect_crop_box(100, 100, 2.0) == Box{0, 25, 100, 75});
}

TEST_CASE("aspect_crop_matching_aspect_keeps_whole_image") {
  REQUIRE(image::aspect_crop_box(80, 40, 2.0) == Box{0, 0, 80, 40});
}

TEST_CASE("aspect_crop_centerpoint_is_clamped_inside_image") {
  REQUIRE(image::aspect_crop_box(100, 50, 1.0, cv::Point(90, 25)) == Box{50, 0, 100, 50});
  REQUIRE(image::aspect_crop_box(100, 50, 1.0, cv::Point(0, 25)) == Box{0, 0, 50, 50});
  REQUIRE(image::aspect_crop_box(100, 50, 1.0, cv::Point(40, 25)) == Box{15, 0, 65, 50});
}

TEST_CASE("aspect_crop_rejects_bad_input") {
  REQUIRE_THROWS_AS(image::aspect_crop_box(0, 10, 1.0), photomosaic::SizeMismatchError);
  REQUIRE_THROWS_AS(image::aspect_crop_box(10, 10, 0.0), photomosaic::ConfigError);
}

TEST_CASE("convert_color_mode_normalizes_depth_and_channels") {
  cv::Mat gray(4, 4, CV_8UC1, cv::Scalar(77));
  cv::Mat bgr = image::convert_color_mode(gray, ColorMode::RGB);
  REQUIRE(bgr.type() == CV_8UC3);
  REQUIRE(bgr.at<cv::Vec3b>(0, 0) == cv::Vec3b(77, 77, 77));

  cv::Mat bgra(4, 4, CV_8UC4, cv::Scalar(10, 20, 30, 255));
  cv::Mat no_alpha = image::convert_color_mode(bgra, ColorMode::RGB);
  REQUIRE(no_alpha.type() == CV_8UC3);
  REQUIRE(no_alpha.at<cv::Vec3b>(2, 2) == cv::Vec3b(10, 20, 30));

  cv::Mat deep(4, 4, CV_16UC3, cv::Scalar(65535, 0, 65535));
  cv::Mat shallow = image::convert_color_mode(deep, ColorMode::RGB);
  REQUIRE(shallow.type() == CV_8UC3);
  REQUIRE(shallow.at<cv::Vec3b>(1, 1) == cv::Vec3b(255, 0, 255));

  cv::Mat unit(4, 4, CV_32FC1, cv::Scalar(1.0));
  cv::Mat from_float = image::convert_color_mode(unit, ColorMode::GRAYSCALE);
  REQUIRE(from_float.type() == CV_8UC1);
  REQUIRE(from_float.at<uchar>(3, 3) == 255);

  cv::Mat white(4, 4, CV_8UC3, cv::Scalar(255, 255, 255));
  cv::Mat white_gray = image::convert_color_mode(white, ColorMode::GRAYSCALE);
  REQUIRE(white_gray.type() == CV_8UC1);
  REQUIRE(white_gray.at<uchar>(0, 0) == 255);

  REQUIRE_THROWS_AS(image::convert_color_mode(cv::Mat(), ColorMode::RGB), photomosaic::IOError);
}

TEST_CASE("rotate_quarter_turns_is_counter_clockwise") {
  cv::Mat img(2, 3, CV_8UC1, cv::Scalar(0));
  img.at<uchar>(0, 2) = 255; // top-right

  cv::Mat r1 = image::rotate_quarter_turns(img, 1);
  REQUIRE(r1.rows == 3);
  REQUIRE(r1.cols == 2);
  REQUIRE(r1.at<uchar>(0, 0) == 255); // top-right -> top-left

  cv::Mat r2 = image::rotate_quarter_turns(img, 2);
  REQUIRE(r2.size() == img.size());
  REQUIRE(r2.at<uchar>(1, 0) == 255); // top-right -> bottom-left

  cv::Mat r3 = image::rotate_quarter_turns(img, 3);
  cv::Mat r_neg = image::rotate_quarter_turns(img, -1);
  REQUIRE(r3.at<uchar>(2, 1) == 255); // top-right -> bottom-right
  REQUIRE(cv::countNonZero(r3 != r_neg) == 0);

  cv::Mat r4 = image::rotate_quarter_turns(img, 4);
  REQUIRE(cv::countNonZero(r4 != img) == 0);
}

TEST_CASE("resize_to_produces_requested_size") {
  cv::Mat img(40, 60, CV_8UC3, cv::Scalar(5, 6, 7));
  REQUIRE(image::resize_to(img, cv::Size(30, 20)).size() == cv::Size(30, 20));
  REQUIRE(image::resize_to(img, cv::Size(120, 80)).size() == cv::Size(120, 80));
  cv::Mat same = image::resize_to(img, img.size());
  REQUIRE(same.data != img.data);
}

TEST_CASE("match_sample_flattens_interleaved_channels") {
  MosaicParams params(1.0, 8, 4, 1.0, ColorMode::RGB, false);
  cv::Mat block(8, 8, CV_8UC3, cv::Scalar(10, 20, 30));

  auto sample = image::match_sample(block, params, cv::INTER_AREA);
  REQUIRE(sample.size() == params.sample_length());
  REQUIRE(sample(0) == Catch::Approx(10.0f));
  REQUIRE(sample(1) == Catch::Approx(20.0f));
  REQUIRE(sample(2) == Catch::Approx(30.0f));
  REQUIRE(sample(sample.size() - 1) == Catch::Approx(30.0f));
}

TEST_CASE("match_sample_rejects_wrong_channel_count") {
  MosaicParams params(1.0, 8, 4, 1.0, ColorMode::GRAYSCALE, false);
  cv::Mat block(8, 8, CV_8UC3, cv::Scalar(10, 20, 30));
  REQUIRE_THROWS_AS(image::match_sample(block, params, cv::INTER_AREA),
                    photomosaic::SizeMismatchError);
}

TEST_CASE("is_image_path_checks_extension_case_insensitively") {
  using photomosaic::io::is_image_path;
  REQUIRE(is_image_path("a/b/photo.JPG"));
  REQUIRE(is_image_path("tile.webp"));
  REQUIRE_FALSE(is_image_path("notes.txt"));
  REQUIRE_FALSE(is_image_path("noext"));
}
