#pragma once

#include "diffmap/core/types.hpp"
#include "diffmap/image/raster.hpp"

#include <opencv2/core.hpp>

namespace diffmap::testing {

inline const Rgba kBlack{0, 0, 0, 255};
inline const Rgba kWhite{255, 255, 255, 255};

inline Rgba grey(int v) { return {v, v, v, 255}; }

inline cv::Mat solid(int w, int h, const Rgba& c) {
  cv::Mat m = image::create_bitmap(w, h, false);
  image::for_each_pixel(w, h, [&](int x, int y) {
    image::set_pixel(m, x, y, c);
    return false;
  });
  return m;
}

// Vertical one-pixel stripes; column 0 is white unless inverted.
inline cv::Mat stripes(int w, int h, bool inverted = false) {
  cv::Mat m = image::create_bitmap(w, h, false);
  image::for_each_pixel(w, h, [&](int x, int y) {
    const bool white = (x % 2 == 0) != inverted;
    image::set_pixel(m, x, y, white ? kWhite : kBlack);
    return false;
  });
  return m;
}

inline cv::Mat with_pixel(const cv::Mat& src, int x, int y, const Rgba& c) {
  cv::Mat m = src.clone();
  image::set_pixel(m, x, y, c);
  return m;
}

} // namespace diffmap::testing
