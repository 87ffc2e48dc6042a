#include "diffmap/config/configuration.hpp"
#include "diffmap/core/errors.hpp"
#include "diffmap/core/events.hpp"
#include "diffmap/diff/diff.hpp"
#include "diffmap/image/pixel_ops.hpp"
#include "diffmap/render/programs.hpp"
#include "raster_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

using diffmap::Box;
using diffmap::DiffStatus;
using diffmap::Rgba;
using diffmap::config::Config;
using diffmap::diff::DiffResult;
namespace fx = diffmap::testing;

namespace {

std::vector<nlohmann::json> parse_lines(const std::string& text) {
  std::vector<nlohmann::json> out;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) out.push_back(nlohmann::json::parse(line));
  }
  return out;
}

} // namespace

TEST_CASE("diff_identical_black_images") {
  cv::Mat black = fx::solid(4, 4, fx::kBlack);
  DiffResult r = diffmap::diff::diff({black, black}, Config{});

  REQUIRE(r.status == DiffStatus::IDENTICAL);
  REQUIRE(r.counts.all == 16);
  REQUIRE(r.counts.diff == 0);
  REQUIRE(r.counts.identical.background == 16);
  REQUIRE(r.regions.empty());
  REQUIRE(r.percent.diff_compared == 0.0);
  REQUIRE_FALSE(r.rendered);
  REQUIRE(r.outputs.empty());
}

TEST_CASE("diff_single_flip_is_different_with_one_region") {
  cv::Mat original = fx::stripes(4, 4);
  cv::Mat changed = fx::with_pixel(original, 1, 1, fx::kWhite);
  DiffResult r = diffmap::diff::diff({original, changed}, Config{});

  REQUIRE(r.status == DiffStatus::DIFFERENT);
  REQUIRE(r.counts.diff == 1);
  REQUIRE(r.regions.size() == 1);
  REQUIRE(r.regions[0] == Box{0, 0, 3, 3});
  REQUIRE(r.counts.group == 16);
  REQUIRE(r.percent.diff == 6.25);
  REQUIRE(r.percent.diff_compared == 6.25);

  REQUIRE(r.rendered);
  REQUIRE(r.outputs.count("groups") == 1);
  const cv::Mat& groups = r.outputs.at("groups");
  REQUIRE(groups.cols == 4);
  REQUIRE(groups.rows == 4);
  REQUIRE(diffmap::image::pixel_at(groups, 1, 1) == Rgba{255, 0, 0, 255});
}

TEST_CASE("diff_single_flip_with_small_padding") {
  cv::Mat original = fx::stripes(4, 4);
  cv::Mat changed = fx::with_pixel(original, 1, 1, fx::kWhite);
  Config cfg;
  cfg.group.padding_size = 1;
  DiffResult r = diffmap::diff::diff({original, changed}, cfg);
  REQUIRE(r.regions.size() == 1);
  REQUIRE(r.regions[0] == Box{0, 0, 2, 2});
  REQUIRE(r.flags.at(1, 1).different);
}

TEST_CASE("diff_inverted_stripes_is_mismatch") {
  DiffResult r = diffmap::diff::diff({fx::stripes(4, 4), fx::stripes(4, 4, true)}, Config{});
  REQUIRE(r.status == DiffStatus::MISMATCH);
  REQUIRE(r.counts.diff == 16);
  REQUIRE(r.percent.diff == 100.0);
}

TEST_CASE("diff_mismatch_threshold_is_configurable") {
  cv::Mat original = fx::stripes(4, 4);
  cv::Mat changed = fx::with_pixel(original, 1, 1, fx::kWhite);
  Config cfg;
  cfg.status.mismatch_min_percent = 5.0;
  REQUIRE(diffmap::diff::diff({original, changed}, cfg).status == DiffStatus::MISMATCH);
}

TEST_CASE("diff_similar_when_only_small_changes") {
  cv::Mat a = fx::solid(3, 3, fx::grey(100));
  cv::Mat b = fx::solid(3, 3, fx::grey(120));
  DiffResult r = diffmap::diff::diff({a, b}, Config{});
  REQUIRE(r.status == DiffStatus::SIMILAR);
  REQUIRE(r.counts.similar.all == 9);
}

TEST_CASE("diff_render_when_status_all_renders_identical") {
  cv::Mat black = fx::solid(2, 2, fx::kBlack);
  Config cfg;
  cfg.output.render_when_status = {"all"};
  cfg.output.names = {"flagsSimilarity"};
  DiffResult r = diffmap::diff::diff({black, black}, cfg);
  REQUIRE(r.rendered);
  REQUIRE(diffmap::image::pixel_at(r.outputs.at("flagsSimilarity"), 0, 0) == Rgba{0, 0, 0, 255});
}

TEST_CASE("diff_accepts_rgba_inputs") {
  cv::Mat a = diffmap::image::create_bitmap(2, 2, true);
  cv::Mat b = diffmap::image::create_bitmap(2, 2, true);
  DiffResult r = diffmap::diff::diff({a, b}, Config{});
  REQUIRE(r.status == DiffStatus::IDENTICAL);
}

TEST_CASE("diff_rejects_invalid_inputs") {
  cv::Mat a = fx::solid(4, 4, fx::kBlack);
  REQUIRE_THROWS_AS(diffmap::diff::diff({a}, Config{}), diffmap::InvalidInputError);
  REQUIRE_THROWS_AS(diffmap::diff::diff({a, fx::solid(4, 3, fx::kBlack)}, Config{}),
                    diffmap::InvalidInputError);
  REQUIRE_THROWS_AS(diffmap::diff::diff({a, diffmap::image::create_values(4, 4)}, Config{}),
                    diffmap::UnsupportedOperandError);
}

TEST_CASE("diff_unknown_output_fails_render") {
  cv::Mat original = fx::stripes(4, 4);
  cv::Mat changed = fx::with_pixel(original, 1, 1, fx::kWhite);
  Config cfg;
  cfg.output.names = {"nope"};
  REQUIRE_THROWS_AS(diffmap::diff::diff({original, changed}, cfg), diffmap::UnknownProgramError);
}

TEST_CASE("diff_rejects_invalid_config") {
  cv::Mat a = fx::solid(4, 4, fx::kBlack);
  Config cfg;
  cfg.group.padding_size = -1;
  REQUIRE_THROWS_AS(diffmap::diff::diff({a, a}, cfg), diffmap::ValidationError);
}

TEST_CASE("diff_changed_seed_is_the_second_image") {
  cv::Mat original = fx::stripes(4, 4);
  cv::Mat changed = fx::with_pixel(original, 1, 1, fx::kWhite);
  cv::Mat third = fx::solid(4, 4, fx::grey(77));

  diffmap::render::ProgramCatalog catalog = diffmap::render::default_catalog();
  catalog["changedSeed"] = diffmap::render::RenderProgram{
      {}, {"changed"},
      [](const diffmap::render::RasterMap& maps, const diffmap::render::RenderOptions&) {
        return maps.at("changed");
      }};

  Config cfg;
  cfg.output.names = {"changedSeed", "changedFaded"};
  DiffResult r = diffmap::diff::diff({original, changed, third}, cfg, catalog);

  REQUIRE(r.rendered);
  const cv::Mat& seed = r.outputs.at("changedSeed");
  REQUIRE(diffmap::image::pixel_at(seed, 1, 1) == fx::kWhite);
  REQUIRE(diffmap::image::pixel_at(seed, 0, 0) == diffmap::image::pixel_at(changed, 0, 0));
  REQUIRE(diffmap::image::pixel_at(seed, 0, 0) != fx::grey(77));

  cv::Mat expected = diffmap::image::greyscale(changed, 0.5);
  const cv::Mat& faded = r.outputs.at("changedFaded");
  REQUIRE(cv::norm(faded, expected, cv::NORM_INF) == 0.0);
}

TEST_CASE("diff_uses_custom_catalog") {
  int calls = 0;
  diffmap::render::ProgramCatalog catalog;
  catalog["mine"] = diffmap::render::RenderProgram{
      {}, {"original", "changed"},
      [&calls](const diffmap::render::RasterMap& maps, const diffmap::render::RenderOptions&) {
        ++calls;
        return maps.at("changed");
      }};

  Config cfg;
  cfg.output.names = {"mine"};
  cv::Mat original = fx::stripes(4, 4);
  cv::Mat changed = fx::with_pixel(original, 1, 1, fx::kWhite);
  DiffResult r = diffmap::diff::diff({original, changed}, cfg, catalog);
  REQUIRE(calls == 1);
  REQUIRE(diffmap::image::pixel_at(r.outputs.at("mine"), 1, 1) == fx::kWhite);
}

TEST_CASE("diff_emits_phase_events") {
  std::ostringstream sink;
  diffmap::core::EventEmitter events(sink, "run-test");
  cv::Mat black = fx::solid(2, 2, fx::kBlack);
  diffmap::diff::diff({black, black}, Config{}, &events);

  auto lines = parse_lines(sink.str());
  REQUIRE_FALSE(lines.empty());
  std::vector<std::string> phases;
  bool warned = false;
  for (const auto& ev : lines) {
    REQUIRE(ev["run_id"] == "run-test");
    if (ev["type"] == "phase_start") phases.push_back(ev["phase_name"].get<std::string>());
    if (ev["type"] == "warning") warned = true;
  }
  REQUIRE(phases == std::vector<std::string>{"VALIDATE", "CONVERT", "CLASSIFY", "GROUP",
                                             "RENDER", "DONE"});
  REQUIRE(warned);
  REQUIRE(lines.back()["status"] == "identical");
}

TEST_CASE("diff_emits_error_event_on_failure") {
  std::ostringstream sink;
  diffmap::core::EventEmitter events(sink, "run-err");
  cv::Mat a = fx::solid(2, 2, fx::kBlack);
  REQUIRE_THROWS(diffmap::diff::diff({a}, Config{}, &events));
  auto lines = parse_lines(sink.str());
  REQUIRE(lines.back()["type"] == "error");
  long errors = 0;
  for (const auto& ev : lines) {
    if (ev["type"] == "error") ++errors;
  }
  REQUIRE(errors == 1);
}

TEST_CASE("determine_status_rules") {
  diffmap::diff::PixelCounts c;
  c.all = 100;
  REQUIRE(diffmap::diff::determine_status(c, 50.0) == DiffStatus::IDENTICAL);
  c.similar.all = 1;
  REQUIRE(diffmap::diff::determine_status(c, 50.0) == DiffStatus::SIMILAR);
  c.diff = 49;
  REQUIRE(diffmap::diff::determine_status(c, 50.0) == DiffStatus::DIFFERENT);
  c.diff = 50;
  REQUIRE(diffmap::diff::determine_status(c, 50.0) == DiffStatus::MISMATCH);
}
