#pragma once

#include "diffmap/core/types.hpp"
#include "diffmap/diff/flag_map.hpp"

#include <vector>

namespace diffmap::diff {

struct GroupOptions {
    int merge_max_gap_size = 80;
    int border_size = 15;
    int padding_size = 80;
};

struct GroupResult {
    std::vector<Box> regions;  // discovery order, after padding and merge
    long group_pixels = 0;     // sum of region areas
};

// Cluster `different` pixels into padded, merged boxes and paint group marks
// (border/fill) into `flags`. Overlapping regions are not re-merged after the
// single merge pass, so `group_pixels` may count a pixel more than once.
// Throws ValidationError for negative sizes.
GroupResult group(FlagMap& flags, const GroupOptions& options);

} // namespace diffmap::diff
