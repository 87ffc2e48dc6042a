#include "diffmap/color/yiq.hpp"
#include "diffmap/image/raster.hpp"

#include <algorithm>
#include <cmath>

namespace diffmap::color {

namespace {

// Weighted YIQ distance; black vs white comes out at ~238
constexpr double kWeightY = 0.5053;
constexpr double kWeightI = 0.299;
constexpr double kWeightQ = 0.1957;
constexpr double kDistanceScale = 138.09803921568627;

int clamp_channel(double v) {
    return static_cast<int>(std::round(std::min(255.0, std::max(0.0, v))));
}

} // namespace

Yiq yiq_of(const Rgba& p) {
    Yiq out;
    out.y = 0.29889531 * p.r + 0.58662247 * p.g + 0.11448223 * p.b;
    out.i = 0.59597799 * p.r - 0.27417610 * p.g - 0.32180189 * p.b;
    out.q = 0.21147017 * p.r - 0.52261711 * p.g + 0.31114694 * p.b;
    return out;
}

Rgba rgba_of(const Yiq& p) {
    Rgba out;
    out.r = clamp_channel(p.y + 0.95629572 * p.i + 0.62102416 * p.q);
    out.g = clamp_channel(p.y - 0.27212210 * p.i - 0.64738053 * p.q);
    out.b = clamp_channel(p.y - 1.10797103 * p.i + 1.70461523 * p.q);
    out.a = 255;
    return out;
}

double color_distance(const Yiq& from, const Yiq& to) {
    const double dy = from.y - to.y;
    const double di = from.i - to.i;
    const double dq = from.q - to.q;
    if (dy == 0.0 && di == 0.0 && dq == 0.0) {
        return 0.0;
    }
    double d = (kWeightY * dy * dy + kWeightI * di * di + kWeightQ * dq * dq) / kDistanceScale;
    if (from.y > to.y) {
        d = -d;
    }
    return d;
}

double abs_color_distance(const Yiq& from, const Yiq& to) {
    return std::fabs(color_distance(from, to));
}

double contrast(const Yiq& from, const Yiq& to) {
    return from.y - to.y;
}

YiqImage to_yiq(const cv::Mat& image) {
    image::require_bitmap(image, "to_yiq");

    const int h = image.rows;
    const int w = image.cols;
    YiqImage out;
    out.Y.resize(h, w);
    out.I.resize(h, w);
    out.Q.resize(h, w);

    image::for_each_pixel(w, h, [&](int x, int y) {
        const Yiq p = yiq_of(image::pixel_at(image, x, y));
        out.Y(y, x) = static_cast<float>(p.y);
        out.I(y, x) = static_cast<float>(p.i);
        out.Q(y, x) = static_cast<float>(p.q);
        return false;
    });
    return out;
}

} // namespace diffmap::color
