#include "diffmap/image/pixel_ops.hpp"
#include "diffmap/color/yiq.hpp"
#include "diffmap/core/errors.hpp"
#include "diffmap/core/utils.hpp"
#include "diffmap/image/raster.hpp"

#include <algorithm>
#include <cmath>

namespace diffmap::image {

namespace {

struct RgbF {
    double r;
    double g;
    double b;
};

RgbF flatten_f(const Rgba& p, double alpha_ratio) {
    if (p.a == 255) {
        return {double(p.r), double(p.g), double(p.b)};
    }
    const double af = p.a / 255.0 * alpha_ratio;
    return {255.0 + (p.r - 255.0) * af,
            255.0 + (p.g - 255.0) * af,
            255.0 + (p.b - 255.0) * af};
}

int to_channel(double v) {
    return static_cast<int>(std::max(0.0, std::min(255.0, std::round(v))));
}

} // namespace

Rgba flatten(const Rgba& pixel, double alpha_ratio) {
    if (pixel.a == 255) {
        return pixel;
    }
    const RgbF f = flatten_f(pixel, alpha_ratio);
    return {to_channel(f.r), to_channel(f.g), to_channel(f.b), 255};
}

int brightness(const Rgba& pixel, double alpha_ratio) {
    const double luminance = color::yiq_of(pixel).y;
    const double alpha = pixel.a / 255.0 * alpha_ratio;
    return to_channel(255.0 + (luminance - 255.0) * alpha);
}

std::string blend_mode_to_string(BlendMode mode) {
    switch (mode) {
        case BlendMode::ADD: return "add";
        case BlendMode::AVERAGE: return "average";
        case BlendMode::MAX: return "max";
        default: return "unknown";
    }
}

std::optional<BlendMode> string_to_blend_mode(const std::string& s) {
    const std::string norm = core::to_lower(s);
    if (norm == "add") return BlendMode::ADD;
    if (norm == "average") return BlendMode::AVERAGE;
    if (norm == "max") return BlendMode::MAX;
    return std::nullopt;
}

Rgba blend(const Rgba& original, const Rgba& added, BlendMode mode, BlendChannels channels) {
    if (added.a == 0) {
        return original;
    }
    if (added.a == 255) {
        return added;
    }

    const double ratio = added.a / 255.0;
    const RgbF o = flatten_f(original, 1.0);
    RgbF out = o;

    auto mix = [&](double ov, double nv) {
        switch (mode) {
            case BlendMode::ADD: return ov + (nv - ov) * ratio;
            // Kept as historically defined; not a true average.
            case BlendMode::AVERAGE: return (ov / ratio + nv * ratio) / 2.0;
            case BlendMode::MAX: return std::max(ov, nv);
        }
        return ov;
    };

    if (channels.r) out.r = mix(o.r, added.r);
    if (channels.g) out.g = mix(o.g, added.g);
    if (channels.b) out.b = mix(o.b, added.b);

    return {to_channel(out.r), to_channel(out.g), to_channel(out.b), 255};
}

PaletteMatch PaletteMatch::any_of(std::vector<int> values) {
    PaletteMatch m;
    m.kind = Kind::VALUES;
    m.values = std::move(values);
    return m;
}

PaletteMatch PaletteMatch::masked(int mask, int value) {
    PaletteMatch m;
    m.kind = Kind::MASK;
    m.mask = mask;
    m.value = value;
    return m;
}

PaletteMatch PaletteMatch::range(int low, int high) {
    PaletteMatch m;
    m.kind = Kind::RANGE;
    m.low = low;
    m.high = high;
    return m;
}

PaletteMatch PaletteMatch::all() {
    return PaletteMatch{};
}

bool PaletteMatch::matches(int v) const {
    switch (kind) {
        case Kind::VALUES:
            return std::find(values.begin(), values.end(), v) != values.end();
        case Kind::MASK:
            return (v & mask) == value;
        case Kind::RANGE:
            return v >= low && v <= high;
        case Kind::ALL:
        default:
            return true;
    }
}

bool PaletteEntry::matches(int v) const {
    if (match.empty()) {
        return true;
    }
    return std::any_of(match.begin(), match.end(),
                       [v](const PaletteMatch& m) { return m.matches(v); });
}

Rgba PaletteEntry::color_for(int v) const {
    if (!gradient) {
        return color;
    }
    const Rgba& f = gradient->from;
    const Rgba& t = gradient->to;
    auto lerp = [v](int a, int b) {
        return to_channel(a + (b - a) / 255.0 * v);
    };
    return {lerp(f.r, t.r), lerp(f.g, t.g), lerp(f.b, t.b), lerp(f.a, t.a)};
}

Palette default_palette() {
    PaletteEntry entry;
    entry.gradient = Gradient{{0, 0, 0, 255}, {255, 255, 255, 255}};
    return {entry};
}

cv::Mat flatten(const cv::Mat& image, double alpha_ratio) {
    require_bitmap(image, "flatten");
    cv::Mat out = create_bitmap(image.cols, image.rows, false);
    for_each_pixel(image.cols, image.rows, [&](int x, int y) {
        set_pixel(out, x, y, flatten(pixel_at(image, x, y), alpha_ratio));
        return false;
    });
    return out;
}

cv::Mat brightness(const cv::Mat& image, double alpha_ratio) {
    require_bitmap(image, "brightness");
    cv::Mat out = create_values(image.cols, image.rows);
    for_each_pixel(image.cols, image.rows, [&](int x, int y) {
        out.at<uint8_t>(y, x) = static_cast<uint8_t>(brightness(pixel_at(image, x, y), alpha_ratio));
        return false;
    });
    return out;
}

cv::Mat greyscale(const cv::Mat& image, double fade) {
    return render_values(brightness(image, 1.0 - fade));
}

cv::Mat blend(const cv::Mat& original, const cv::Mat& added, BlendMode mode,
              BlendChannels channels) {
    require_bitmap(original, "blend");
    require_bitmap(added, "blend");
    if (!same_size(original, added)) {
        throw InvalidInputError("blend operands differ in size (" +
                                std::to_string(original.cols) + "x" + std::to_string(original.rows) +
                                " vs " + std::to_string(added.cols) + "x" +
                                std::to_string(added.rows) + ")");
    }
    cv::Mat out = create_bitmap(original.cols, original.rows, false);
    for_each_pixel(original.cols, original.rows, [&](int x, int y) {
        set_pixel(out, x, y, blend(pixel_at(original, x, y), pixel_at(added, x, y), mode, channels));
        return false;
    });
    return out;
}

cv::Mat render_values(const cv::Mat& values, const Palette& palette) {
    require_values(values, "render_values");
    cv::Mat out = create_bitmap(values.cols, values.rows, true);
    for_each_pixel(values.cols, values.rows, [&](int x, int y) {
        const int v = value_at(values, x, y);
        for (const auto& entry : palette) {
            if (entry.matches(v)) {
                set_pixel(out, x, y, entry.color_for(v));
                break;
            }
        }
        return false;
    });
    return out;
}

} // namespace diffmap::image
