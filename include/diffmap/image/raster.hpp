#pragma once

#include "diffmap/core/types.hpp"

#include <opencv2/core.hpp>
#include <string>

namespace diffmap::image {

// Rasters are plain cv::Mat; the kind is derived from the Mat type.
//   VALUES: CV_8UC1 value map (flags, brightness)
//   RGB:    CV_8UC3, channel order R,G,B
//   RGBA:   CV_8UC4, channel order R,G,B,A
enum class RasterKind {
    VALUES,
    RGB,
    RGBA,
    UNSUPPORTED
};

RasterKind raster_kind(const cv::Mat& mat);
std::string raster_kind_to_string(RasterKind kind);

// Throw UnsupportedOperandError unless the raster is RGB or RGBA.
void require_bitmap(const cv::Mat& mat, const std::string& context);

// Throw UnsupportedOperandError unless the raster is a value map.
void require_values(const cv::Mat& mat, const std::string& context);

cv::Mat create_bitmap(int width, int height, bool with_alpha);
cv::Mat create_values(int width, int height);

// RGB pixels are returned with a = 255.
Rgba pixel_at(const cv::Mat& mat, int x, int y);
void set_pixel(cv::Mat& mat, int x, int y, const Rgba& color);

inline int value_at(const cv::Mat& mat, int x, int y) {
    return mat.at<uint8_t>(y, x);
}

inline bool same_size(const cv::Mat& a, const cv::Mat& b) {
    return a.cols == b.cols && a.rows == b.rows;
}

// Row-major visit of every pixel. fn(x, y) returns true to stop early.
template <typename Fn>
void for_each_pixel(int width, int height, Fn&& fn) {
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            if (fn(x, y)) {
                return;
            }
        }
    }
}

// Visit the up-to-4 diagonal neighbours of (x, y) that lie inside the image,
// in row-major order. fn(nx, ny) returns true to stop early.
template <typename Fn>
void for_each_diagonal_neighbor(int x, int y, int width, int height, Fn&& fn) {
    for (int ny = y - 1; ny <= y + 1; ny += 2) {
        if (ny < 0 || ny >= height) continue;
        for (int nx = x - 1; nx <= x + 1; nx += 2) {
            if (nx < 0 || nx >= width) continue;
            if (fn(nx, ny)) {
                return;
            }
        }
    }
}

} // namespace diffmap::image
