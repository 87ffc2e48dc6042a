#include "diffmap/diff/grouper.hpp"
#include "diffmap/core/errors.hpp"
#include "diffmap/image/box.hpp"
#include "diffmap/image/raster.hpp"

#include <algorithm>
#include <string>

namespace diffmap::diff {

namespace {

// Regions are addressed by index into a flat arena while the scan runs.
std::vector<Box> collect_regions(const FlagMap& flags, int gap) {
    std::vector<Box> arena;
    image::for_each_pixel(flags.width(), flags.height(), [&](int x, int y) {
        if (!flags.at(x, y).different) {
            return false;
        }
        for (size_t i = 0; i < arena.size(); ++i) {
            Box& r = arena[i];
            const Box reach{r.left - gap, r.top - gap, r.right + gap, r.bottom + gap};
            if (image::box_contains_point(reach, {x, y})) {
                r = image::box_union(r, Box{x, y, x, y});
                return false;
            }
        }
        arena.push_back(Box{x, y, x, y});
        return false;
    });
    return arena;
}

std::vector<Box> merge_overlapping(const std::vector<Box>& regions) {
    std::vector<Box> merged;
    merged.reserve(regions.size());
    for (const Box& r : regions) {
        bool absorbed = false;
        for (Box& m : merged) {
            if (image::box_intersect(r, m)) {
                m = image::box_union(m, r);
                absorbed = true;
                break;
            }
        }
        if (!absorbed) {
            merged.push_back(r);
        }
    }
    return merged;
}

void paint_region(FlagMap& flags, const Box& r, int border) {
    for (int y = r.top; y <= r.bottom; ++y) {
        for (int x = r.left; x <= r.right; ++x) {
            const bool on_border = y < r.top + border || y > r.bottom - border ||
                                   x < r.left + border || x > r.right - border;
            flags.mark_group(x, y, on_border ? GroupMark::BORDER : GroupMark::FILL);
        }
    }
}

void require_non_negative(int value, const std::string& name) {
    if (value < 0) {
        throw ValidationError("group." + name + " must be >= 0, got " + std::to_string(value));
    }
}

} // namespace

GroupResult group(FlagMap& flags, const GroupOptions& options) {
    require_non_negative(options.merge_max_gap_size, "merge_max_gap_size");
    require_non_negative(options.border_size, "border_size");
    require_non_negative(options.padding_size, "padding_size");

    // Nothing reaches further than the image extent; keeps box arithmetic in int range.
    const int extent = std::max(flags.width(), flags.height());
    const int gap = std::min(options.merge_max_gap_size, extent);
    const int border = std::min(options.border_size, extent);

    std::vector<Box> regions = collect_regions(flags, gap);

    for (Box& r : regions) {
        r = image::fit_box(flags.width(), flags.height(), r, options.padding_size);
    }

    GroupResult result;
    result.regions = merge_overlapping(regions);

    for (const Box& r : result.regions) {
        result.group_pixels += image::box_area(r);
        paint_region(flags, r, border);
    }
    return result;
}

} // namespace diffmap::diff
