#pragma once

#include "diffmap/core/types.hpp"

#include <opencv2/core.hpp>

namespace diffmap::color {

// RGB -> YIQ (NTSC luminance/chrominance). Alpha is ignored.
Yiq yiq_of(const Rgba& pixel);

// YIQ -> RGB, alpha set to opaque, channels clamped to [0,255]
Rgba rgba_of(const Yiq& pixel);

// Perceptual colour difference between two pixels.
// Zero when identical; negative when `to` is darker than `from`.
double color_distance(const Yiq& from, const Yiq& to);

double abs_color_distance(const Yiq& from, const Yiq& to);

// Luminance-only difference (from.y - to.y)
double contrast(const Yiq& from, const Yiq& to);

// Convert an RGB or RGBA raster into three YIQ planes.
YiqImage to_yiq(const cv::Mat& image);

} // namespace diffmap::color
