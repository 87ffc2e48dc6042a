#pragma once

#include "diffmap/core/types.hpp"

namespace diffmap::image {

Box abs_box(const RelBox& box);

// Grow `box` by `grow` on every side and clamp it to a width x height image.
// A negative grow is treated as 0; the box never shrinks.
Box fit_box(int width, int height, const Box& box, int grow = 0);

bool box_contains_point(const Box& box, const Point& p);

// True if the boxes share at least one pixel (inclusive edges).
bool box_intersect(const Box& a, const Box& b);

// Smallest box covering both
Box box_union(const Box& a, const Box& b);

inline long box_area(const Box& box) {
    return static_cast<long>(box.right - box.left + 1) *
           static_cast<long>(box.bottom - box.top + 1);
}

} // namespace diffmap::image
