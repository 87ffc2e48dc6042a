#include "diffmap/diff/flag_map.hpp"
#include "diffmap/image/raster.hpp"

namespace diffmap::diff {

uint8_t PixelFlags::encode() const {
    uint8_t packed = 0;
    if (different) {
        packed |= flag_bits::DIFF_DIFFERENT.value;
    }
    switch (group) {
        case GroupMark::FILL: packed |= flag_bits::GROUP_FILL.value; break;
        case GroupMark::BORDER: packed |= flag_bits::GROUP_BORDER.value; break;
        default: break;
    }
    switch (similarity) {
        case Similarity::SIMILAR: packed |= flag_bits::SIMILAR.value; break;
        case Similarity::CHANGED: packed |= flag_bits::CHANGED.value; break;
        default: break;
    }
    switch (significance) {
        case Significance::FOREGROUND: packed |= flag_bits::FOREGROUND.value; break;
        case Significance::ANTIALIAS: packed |= flag_bits::ANTIALIAS.value; break;
        default: break;
    }
    return packed;
}

PixelFlags PixelFlags::decode(uint8_t packed) {
    using namespace flag_bits;
    PixelFlags f;
    f.different = has(packed, DIFF_DIFFERENT);

    if (has(packed, GROUP_BORDER)) f.group = GroupMark::BORDER;
    else if (has(packed, GROUP_FILL)) f.group = GroupMark::FILL;

    if (has(packed, CHANGED)) f.similarity = Similarity::CHANGED;
    else if (has(packed, SIMILAR)) f.similarity = Similarity::SIMILAR;

    if (has(packed, FOREGROUND)) f.significance = Significance::FOREGROUND;
    else if (has(packed, ANTIALIAS)) f.significance = Significance::ANTIALIAS;
    return f;
}

FlagMap::FlagMap(int width, int height)
    : width_(width), height_(height),
      pixels_(static_cast<size_t>(width) * static_cast<size_t>(height)) {}

void FlagMap::mark_group(int x, int y, GroupMark mark) {
    PixelFlags& f = at(x, y);
    if (static_cast<int>(mark) > static_cast<int>(f.group)) {
        f.group = mark;
    }
}

cv::Mat FlagMap::encode() const {
    cv::Mat out = image::create_values(width_, height_);
    image::for_each_pixel(width_, height_, [&](int x, int y) {
        out.at<uint8_t>(y, x) = at(x, y).encode();
        return false;
    });
    return out;
}

FlagMap FlagMap::decode(const cv::Mat& packed) {
    image::require_values(packed, "FlagMap::decode");
    FlagMap map(packed.cols, packed.rows);
    image::for_each_pixel(packed.cols, packed.rows, [&](int x, int y) {
        map.at(x, y) = PixelFlags::decode(packed.at<uint8_t>(y, x));
        return false;
    });
    return map;
}

} // namespace diffmap::diff
