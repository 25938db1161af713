#include "photomosaic/core/events.hpp"
#include "photomosaic/core/parallel.hpp"
#include "photomosaic/core/utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace core = photomosaic::core;
namespace fs = std::filesystem;

TEST_CASE("glob_match_is_case_insensitive") {
  REQUIRE(core::glob_match("*.jpg", "photo.JPG"));
  REQUIRE(core::glob_match("*.JPG", "photo.jpg"));
  REQUIRE(core::glob_match("tile?.png", "tile7.png"));
  REQUIRE_FALSE(core::glob_match("tile?.png", "tile77.png"));
  REQUIRE_FALSE(core::glob_match("*.png", "photo.jpg"));
  REQUIRE(core::glob_match("a+b.png", "a+b.png"));
  REQUIRE_FALSE(core::glob_match("a+b.png", "aab.png"));
}

TEST_CASE("tile_label_is_last_four_characters_of_stem") {
  REQUIRE(core::tile_label_from_path("wood/IMG_20230101_1234.jpg") == "1234");
  REQUIRE(core::tile_label_from_path("plank_0042.edited.png") == "0042");
  REQUIRE(core::tile_label_from_path("abc.tar.gz") == "abc");
  REQUIRE(core::tile_label_from_path("/tmp/oak7") == "oak7");
}

TEST_CASE("string_helpers") {
  REQUIRE(core::to_lower("RGB") == "rgb");
  REQUIRE(core::to_lower("Photo.JPG") == "photo.jpg");

  const auto parts = core::split("*.jpg;*.png;", ';');
  REQUIRE(parts == std::vector<std::string>{"*.jpg", "*.png"});
}

TEST_CASE("discover_images_filters_and_sorts") {
  const fs::path dir = fs::temp_directory_path() / "photomosaic_test_discover";
  fs::remove_all(dir);
  core::write_text(dir / "b.jpg", "x");
  core::write_text(dir / "a.PNG", "x");
  core::write_text(dir / "notes.txt", "x");
  fs::create_directories(dir / "c.jpg");

  const auto found = core::discover_images(dir, "*.jpg;*.png");
  REQUIRE(found.size() == 2);
  REQUIRE(found[0].filename() == "a.PNG");
  REQUIRE(found[1].filename() == "b.jpg");

  REQUIRE(core::discover_images(dir / "missing", "*.jpg").empty());
  fs::remove_all(dir);
}

TEST_CASE("read_text_missing_file_throws") {
  REQUIRE_THROWS_AS(core::read_text(fs::temp_directory_path() / "photomosaic_no_such_file"),
                    photomosaic::IOError);
}

TEST_CASE("parallel_for_index_visits_every_index_once") {
  std::vector<std::atomic<int>> hits(257);
  core::parallel_for_index(hits.size(), 4, [&](std::size_t i) { hits[i].fetch_add(1); });
  for (const auto &h : hits) {
    REQUIRE(h.load() == 1);
  }

  int inline_count = 0;
  core::parallel_for_index(10, 1, [&](std::size_t) { ++inline_count; });
  REQUIRE(inline_count == 10);
}

TEST_CASE("parallel_for_index_rethrows_worker_exception") {
  REQUIRE_THROWS_AS(core::parallel_for_index(64, 4,
                                             [](std::size_t i) {
                                               if (i == 13) throw std::runtime_error("boom");
                                             }),
                    std::runtime_error);
}

TEST_CASE("event_emitter_writes_one_json_object_per_line") {
  std::ostringstream out;
  core::EventEmitter events(out);
  events.run_start("r1", {{"source", "a.png"}});
  events.phase_progress("r1", photomosaic::Phase::RANKING, 5, 10);
  events.phase_end("r1", photomosaic::Phase::RANKING, "ok", {{"ranked", 10}});
  events.warning("r1", "careful");
  events.run_end("r1", true, "completed");

  std::istringstream in(out.str());
  std::vector<core::json> lines;
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(core::json::parse(line));
  }

  REQUIRE(lines.size() == 5);
  REQUIRE(lines[0]["type"] == "run_start");
  REQUIRE(lines[0]["run_id"] == "r1");
  REQUIRE(lines[0]["source"] == "a.png");
  REQUIRE(lines[0].contains("ts"));
  REQUIRE(lines[1]["phase_name"] == "RANKING");
  REQUIRE(lines[1]["current"] == 5);
  REQUIRE(lines[2]["ranked"] == 10);
  REQUIRE(lines[3]["message"] == "careful");
  REQUIRE(lines[4]["success"] == true);
}

TEST_CASE("emit_event_merges_payload") {
  std::ostringstream out;
  core::emit_event("preprocess_end", "r2", {{"files", 3}}, out);
  auto j = core::json::parse(out.str());
  REQUIRE(j["type"] == "preprocess_end");
  REQUIRE(j["files"] == 3);
}

TEST_CASE("run_id_and_timestamp_format") {
  const std::string ts = core::get_iso_timestamp();
  REQUIRE(ts.size() == 24);
  REQUIRE(ts.back() == 'Z');

  const std::string id = core::get_run_id();
  REQUIRE(id.size() == 24); // YYYYMMDD_HHMMSS_ + 8 hex
  REQUIRE(id != core::get_run_id());
}
