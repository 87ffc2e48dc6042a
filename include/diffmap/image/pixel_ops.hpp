#pragma once

#include "diffmap/core/types.hpp"

#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

namespace diffmap::image {

// ---------------------------------------------------------------------------
// Per-pixel transforms
// ---------------------------------------------------------------------------

// Composite onto white. alpha_ratio < 1 lightens further.
Rgba flatten(const Rgba& pixel, double alpha_ratio = 1.0);

// Luminance faded toward white by (alpha / 255) * alpha_ratio, 0..255.
int brightness(const Rgba& pixel, double alpha_ratio = 1.0);

enum class BlendMode {
    ADD,
    AVERAGE,
    MAX
};

std::string blend_mode_to_string(BlendMode mode);
std::optional<BlendMode> string_to_blend_mode(const std::string& s);

struct BlendChannels {
    bool r = true;
    bool g = true;
    bool b = true;
};

// Blend `added` over `original`. Fully transparent `added` keeps the original,
// fully opaque `added` replaces it. Result is opaque.
Rgba blend(const Rgba& original, const Rgba& added,
           BlendMode mode = BlendMode::AVERAGE, BlendChannels channels = {});

// ---------------------------------------------------------------------------
// Palette rendering of value maps
// ---------------------------------------------------------------------------

struct PaletteMatch {
    enum class Kind { VALUES, MASK, RANGE, ALL };

    Kind kind = Kind::ALL;
    std::vector<int> values;
    int mask = 0;
    int value = 0;
    int low = 0;
    int high = 255;

    static PaletteMatch any_of(std::vector<int> values);
    static PaletteMatch masked(int mask, int value);
    static PaletteMatch range(int low, int high);
    static PaletteMatch all();

    bool matches(int v) const;
};

struct Gradient {
    Rgba from;
    Rgba to;
};

// One palette instruction. An empty match list matches every value.
// With a gradient the colour is interpolated linearly over 0..255.
struct PaletteEntry {
    std::vector<PaletteMatch> match;
    Rgba color{0, 0, 0, 255};
    std::optional<Gradient> gradient;

    bool matches(int v) const;
    Rgba color_for(int v) const;
};

using Palette = std::vector<PaletteEntry>;

// Single black-to-white gradient
Palette default_palette();

// ---------------------------------------------------------------------------
// Whole-raster transforms
// ---------------------------------------------------------------------------

// RGB/RGBA -> RGB
cv::Mat flatten(const cv::Mat& image, double alpha_ratio = 1.0);

// RGB/RGBA -> value map
cv::Mat brightness(const cv::Mat& image, double alpha_ratio = 1.0);

// RGB/RGBA -> RGBA greyscale; fade 0 keeps full contrast, 1 is white.
cv::Mat greyscale(const cv::Mat& image, double fade = 0.0);

// RGB/RGBA x RGB/RGBA -> RGB. Sizes must match.
cv::Mat blend(const cv::Mat& original, const cv::Mat& added,
              BlendMode mode = BlendMode::AVERAGE, BlendChannels channels = {});

// Value map -> RGBA. First matching entry wins; unmatched pixels stay
// transparent black.
cv::Mat render_values(const cv::Mat& values, const Palette& palette = default_palette());

} // namespace diffmap::image
