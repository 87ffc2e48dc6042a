#include "diffmap/core/errors.hpp"
#include "diffmap/image/pixel_ops.hpp"
#include "raster_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

using diffmap::Rgba;
using namespace diffmap::image;
namespace fx = diffmap::testing;

TEST_CASE("flatten_opaque_pixel_is_unchanged") {
  Rgba p{10, 20, 30, 255};
  REQUIRE(flatten(p) == p);
}

TEST_CASE("flatten_composites_onto_white") {
  REQUIRE(flatten(Rgba{0, 0, 0, 128}) == Rgba{127, 127, 127, 255});
  REQUIRE(flatten(Rgba{0, 0, 0, 0}) == Rgba{255, 255, 255, 255});
}

TEST_CASE("brightness_fades_toward_white") {
  REQUIRE(brightness(fx::kWhite) == 255);
  REQUIRE(brightness(fx::kBlack) == 0);
  REQUIRE(brightness(fx::kBlack, 0.5) == 128);
  REQUIRE(brightness(fx::kBlack, 0.0) == 255);
  REQUIRE(brightness(Rgba{0, 0, 0, 0}) == 255);
}

TEST_CASE("blend_alpha_shortcuts") {
  Rgba original{10, 20, 30, 255};
  REQUIRE(blend(original, Rgba{200, 0, 0, 0}) == original);
  REQUIRE(blend(original, Rgba{200, 0, 0, 255}) == Rgba{200, 0, 0, 255});
}

TEST_CASE("blend_add_mode_interpolates_by_alpha") {
  Rgba out = blend(fx::kWhite, Rgba{255, 0, 0, 128}, BlendMode::ADD);
  REQUIRE(out == Rgba{255, 127, 127, 255});
}

TEST_CASE("blend_max_mode_respects_channel_subset") {
  BlendChannels only_red;
  only_red.g = false;
  only_red.b = false;
  Rgba out = blend(Rgba{10, 10, 10, 255}, Rgba{200, 200, 200, 100}, BlendMode::MAX, only_red);
  REQUIRE(out == Rgba{200, 10, 10, 255});
}

TEST_CASE("blend_mode_names_round_trip") {
  REQUIRE(string_to_blend_mode("Average") == BlendMode::AVERAGE);
  REQUIRE(blend_mode_to_string(BlendMode::MAX) == "max");
  REQUIRE_FALSE(string_to_blend_mode("multiply").has_value());
}

TEST_CASE("palette_match_kinds") {
  REQUIRE(PaletteMatch::any_of({1, 5}).matches(5));
  REQUIRE_FALSE(PaletteMatch::any_of({1, 5}).matches(4));
  REQUIRE(PaletteMatch::masked(0x30, 0x20).matches(0xA7));
  REQUIRE_FALSE(PaletteMatch::masked(0x30, 0x20).matches(0x30));
  REQUIRE(PaletteMatch::range(10, 20).matches(20));
  REQUIRE_FALSE(PaletteMatch::range(10, 20).matches(21));
  REQUIRE(PaletteMatch::all().matches(0));
}

TEST_CASE("render_values_first_match_wins_and_unmatched_stays_transparent") {
  cv::Mat values = create_values(3, 1);
  values.at<uint8_t>(0, 0) = 1;
  values.at<uint8_t>(0, 1) = 3;
  values.at<uint8_t>(0, 2) = 8;

  PaletteEntry odd;
  odd.match.push_back(PaletteMatch::masked(0x01, 0x01));
  odd.color = Rgba{255, 0, 0, 255};
  PaletteEntry three;
  three.match.push_back(PaletteMatch::any_of({3}));
  three.color = Rgba{0, 255, 0, 255};

  cv::Mat out = render_values(values, Palette{odd, three});
  REQUIRE(raster_kind(out) == RasterKind::RGBA);
  REQUIRE(pixel_at(out, 0, 0) == Rgba{255, 0, 0, 255});
  REQUIRE(pixel_at(out, 1, 0) == Rgba{255, 0, 0, 255});
  REQUIRE(pixel_at(out, 2, 0) == Rgba{0, 0, 0, 0});
}

TEST_CASE("render_values_default_gradient") {
  cv::Mat values = create_values(2, 1);
  values.at<uint8_t>(0, 0) = 0;
  values.at<uint8_t>(0, 1) = 128;
  cv::Mat out = render_values(values);
  REQUIRE(pixel_at(out, 0, 0) == Rgba{0, 0, 0, 255});
  REQUIRE(pixel_at(out, 1, 0) == Rgba{128, 128, 128, 255});
}

TEST_CASE("greyscale_fades_black_to_mid_grey") {
  cv::Mat out = greyscale(fx::solid(2, 2, fx::kBlack), 0.5);
  REQUIRE(raster_kind(out) == RasterKind::RGBA);
  REQUIRE(pixel_at(out, 1, 1) == Rgba{128, 128, 128, 255});
}

TEST_CASE("blend_rasters_rejects_size_mismatch_and_value_maps") {
  cv::Mat a = fx::solid(2, 2, fx::kBlack);
  cv::Mat b = fx::solid(3, 2, fx::kWhite);
  REQUIRE_THROWS_AS(blend(a, b), diffmap::InvalidInputError);
  REQUIRE_THROWS_AS(blend(a, create_values(2, 2)), diffmap::UnsupportedOperandError);
}

TEST_CASE("flatten_raster_drops_alpha") {
  cv::Mat rgba = create_bitmap(1, 1, true);
  set_pixel(rgba, 0, 0, Rgba{0, 0, 0, 0});
  cv::Mat out = flatten(rgba);
  REQUIRE(raster_kind(out) == RasterKind::RGB);
  REQUIRE(pixel_at(out, 0, 0) == fx::kWhite);
}
