#pragma once

#include "diffmap/core/types.hpp"
#include <opencv2/core.hpp>

namespace diffmap::io {

bool is_image_path(const fs::path& path);

// Decode an image file into an RGB (CV_8UC3) or RGBA (CV_8UC4) raster.
// Greyscale files are expanded to RGB; 16-bit files are scaled to 8-bit.
cv::Mat read_image(const fs::path& path);

// Encode an RGB/RGBA raster or a value map; format follows the extension.
void write_image(const fs::path& path, const cv::Mat& raster);

} // namespace diffmap::io
