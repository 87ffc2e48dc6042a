#pragma once

#include "diffmap/core/types.hpp"

#include <cstdint>
#include <opencv2/core.hpp>
#include <vector>

namespace diffmap::diff {

// Packed flag layout of the encoded value map. Fields are disjoint; always
// mask before comparing.
namespace flag_bits {

struct Field {
    uint8_t mask;
    uint8_t value;
};

constexpr Field DIFF_SAME{0x01, 0x00};
constexpr Field DIFF_DIFFERENT{0x01, 0x01};

constexpr Field GROUP_NONE{0x06, 0x00};
constexpr Field GROUP_FILL{0x06, 0x02};
constexpr Field GROUP_BORDER{0x06, 0x06};

constexpr Field IDENTICAL{0x30, 0x00};
constexpr Field SIMILAR{0x30, 0x20};
constexpr Field CHANGED{0x30, 0x30};

constexpr Field BACKGROUND{0xC0, 0x00};
constexpr Field FOREGROUND{0xC0, 0x40};
constexpr Field ANTIALIAS{0xC0, 0x80};

inline bool has(uint8_t packed, const Field& f) {
    return (packed & f.mask) == f.value;
}

} // namespace flag_bits

struct PixelFlags {
    Similarity similarity = Similarity::IDENTICAL;
    Significance significance = Significance::BACKGROUND;
    bool different = false;
    GroupMark group = GroupMark::NONE;

    uint8_t encode() const;
    static PixelFlags decode(uint8_t packed);

    bool operator==(const PixelFlags& o) const {
        return similarity == o.similarity && significance == o.significance &&
               different == o.different && group == o.group;
    }
};

/**
 * Per-pixel classification state of one diff run.
 * The classifier fills similarity/significance/different; the grouper only
 * raises group marks.
 */
class FlagMap {
public:
    FlagMap() = default;
    FlagMap(int width, int height);

    int width() const { return width_; }
    int height() const { return height_; }
    bool empty() const { return pixels_.empty(); }

    PixelFlags& at(int x, int y) { return pixels_[index(x, y)]; }
    const PixelFlags& at(int x, int y) const { return pixels_[index(x, y)]; }

    // Raise the group mark; a lower mark never replaces a higher one.
    void mark_group(int x, int y, GroupMark mark);

    // Packed CV_8UC1 value map for rendering
    cv::Mat encode() const;
    static FlagMap decode(const cv::Mat& packed);

private:
    size_t index(int x, int y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x);
    }

    int width_ = 0;
    int height_ = 0;
    std::vector<PixelFlags> pixels_;
};

} // namespace diffmap::diff
