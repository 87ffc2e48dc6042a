#include "diffmap/core/errors.hpp"
#include "diffmap/image/raster.hpp"
#include "diffmap/io/image_io.hpp"
#include "raster_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <opencv2/imgcodecs.hpp>

using diffmap::Rgba;
using diffmap::image::pixel_at;
using diffmap::image::RasterKind;
using diffmap::image::raster_kind;
using diffmap::io::read_image;
using diffmap::io::write_image;
namespace fs = std::filesystem;

namespace {

fs::path scratch_dir() {
  fs::path dir = fs::temp_directory_path() / "diffmap_image_io";
  fs::create_directories(dir);
  return dir;
}

} // namespace

TEST_CASE("image_io_rgb_png_keeps_channel_order") {
  cv::Mat rgb = diffmap::testing::solid(3, 2, Rgba{10, 20, 30, 255});
  diffmap::image::set_pixel(rgb, 2, 1, Rgba{250, 0, 5, 255});

  const fs::path path = scratch_dir() / "rgb.png";
  write_image(path, rgb);

  // On disk the file is BGR, as OpenCV stores it
  cv::Mat raw = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
  REQUIRE(raw.at<cv::Vec3b>(0, 0) == cv::Vec3b(30, 20, 10));

  cv::Mat back = read_image(path);
  REQUIRE(raster_kind(back) == RasterKind::RGB);
  REQUIRE(back.cols == 3);
  REQUIRE(back.rows == 2);
  REQUIRE(pixel_at(back, 0, 0) == Rgba{10, 20, 30, 255});
  REQUIRE(pixel_at(back, 2, 1) == Rgba{250, 0, 5, 255});
  fs::remove(path);
}

TEST_CASE("image_io_rgba_png_keeps_alpha") {
  cv::Mat rgba = diffmap::image::create_bitmap(2, 2, true);
  diffmap::image::set_pixel(rgba, 0, 0, Rgba{1, 2, 3, 128});
  diffmap::image::set_pixel(rgba, 1, 1, Rgba{200, 100, 50, 255});

  const fs::path path = scratch_dir() / "rgba.png";
  write_image(path, rgba);
  cv::Mat back = read_image(path);

  REQUIRE(raster_kind(back) == RasterKind::RGBA);
  REQUIRE(pixel_at(back, 0, 0) == Rgba{1, 2, 3, 128});
  REQUIRE(pixel_at(back, 1, 1) == Rgba{200, 100, 50, 255});
  fs::remove(path);
}

TEST_CASE("image_io_value_map_reads_back_as_grey_rgb") {
  cv::Mat values = diffmap::image::create_values(2, 1);
  values.at<uchar>(0, 1) = 200;

  const fs::path path = scratch_dir() / "values.png";
  write_image(path, values);
  cv::Mat back = read_image(path);

  REQUIRE(raster_kind(back) == RasterKind::RGB);
  REQUIRE(pixel_at(back, 0, 0) == Rgba{0, 0, 0, 255});
  REQUIRE(pixel_at(back, 1, 0) == Rgba{200, 200, 200, 255});
  fs::remove(path);
}

TEST_CASE("image_io_sixteen_bit_is_scaled_to_eight_bit") {
  cv::Mat deep(1, 1, CV_16UC3, cv::Scalar(30 * 257, 20 * 257, 10 * 257));
  const fs::path path = scratch_dir() / "deep.png";
  REQUIRE(cv::imwrite(path.string(), deep));

  cv::Mat back = read_image(path);
  REQUIRE(back.depth() == CV_8U);
  REQUIRE(pixel_at(back, 0, 0) == Rgba{10, 20, 30, 255});
  fs::remove(path);
}

TEST_CASE("image_io_write_creates_parent_directories") {
  const fs::path dir = scratch_dir() / "nested" / "deeper";
  fs::remove_all(scratch_dir() / "nested");
  write_image(dir / "out.png", diffmap::testing::solid(1, 1, diffmap::testing::kWhite));
  REQUIRE(fs::exists(dir / "out.png"));
  fs::remove_all(scratch_dir() / "nested");
}

TEST_CASE("image_io_failures_raise_io_error") {
  REQUIRE_THROWS_AS(read_image(scratch_dir() / "missing.png"), diffmap::IOError);

  const fs::path garbage = scratch_dir() / "garbage.png";
  {
    std::ofstream out(garbage);
    out << "not an image";
  }
  REQUIRE_THROWS_AS(read_image(garbage), diffmap::IOError);
  fs::remove(garbage);

  cv::Mat floats(2, 2, CV_32FC1, cv::Scalar(0.5));
  REQUIRE_THROWS_AS(write_image(scratch_dir() / "floats.png", floats), diffmap::IOError);
}

TEST_CASE("image_io_recognises_image_extensions") {
  REQUIRE(diffmap::io::is_image_path("a/b/C.PNG"));
  REQUIRE(diffmap::io::is_image_path("x.jpeg"));
  REQUIRE_FALSE(diffmap::io::is_image_path("config.yaml"));
}
