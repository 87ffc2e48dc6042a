#include "diffmap/image/box.hpp"

#include <algorithm>

namespace diffmap::image {

namespace {

struct Corners {
    Point top_left;
    Point top_right;
    Point bottom_left;
    Point bottom_right;
};

Corners corners_of(const Box& b) {
    return {{b.left, b.top}, {b.right, b.top}, {b.left, b.bottom}, {b.right, b.bottom}};
}

bool any_corner_in(const Box& box, const Corners& c) {
    return box_contains_point(box, c.top_left) || box_contains_point(box, c.top_right) ||
           box_contains_point(box, c.bottom_left) || box_contains_point(box, c.bottom_right);
}

// Vertical edge p1-p2 against horizontal edge q1-q2 (or the reverse).
bool edges_cross(const Point& p1, const Point& p2, const Point& q1, const Point& q2) {
    if (p1.x == p2.x && q1.y == q2.y) {
        return q1.x <= p1.x && q2.x >= p2.x && q1.y >= p1.y && q1.y <= p2.y;
    }
    if (p1.y == p2.y && q1.x == q2.x) {
        return p1.x <= q1.x && p2.x >= q2.x && p1.y >= q1.y && p1.y <= q2.y;
    }
    return false;
}

// A cross-shaped overlap has no corner inside the other box, only crossing edges.
bool any_edges_cross(const Corners& a, const Corners& b) {
    return edges_cross(a.top_left, a.bottom_left, b.top_left, b.top_right) ||
           edges_cross(a.top_left, a.bottom_left, b.bottom_left, b.bottom_right) ||
           edges_cross(a.top_right, a.bottom_right, b.top_left, b.top_right) ||
           edges_cross(a.top_right, a.bottom_right, b.bottom_left, b.bottom_right) ||
           edges_cross(b.top_left, b.bottom_left, a.top_left, a.top_right) ||
           edges_cross(b.top_left, b.bottom_left, a.bottom_left, a.bottom_right) ||
           edges_cross(b.top_right, b.bottom_right, a.top_left, a.top_right) ||
           edges_cross(b.top_right, b.bottom_right, a.bottom_left, a.bottom_right);
}

} // namespace

Box abs_box(const RelBox& box) {
    return {box.left, box.top, box.left + box.width - 1, box.top + box.height - 1};
}

Box fit_box(int width, int height, const Box& box, int grow) {
    // long arithmetic so a huge grow saturates at the image edge
    const long g = std::max(grow, 0);
    return {static_cast<int>(std::max(0L, box.left - g)),
            static_cast<int>(std::max(0L, box.top - g)),
            static_cast<int>(std::min(static_cast<long>(width) - 1, box.right + g)),
            static_cast<int>(std::min(static_cast<long>(height) - 1, box.bottom + g))};
}

bool box_contains_point(const Box& box, const Point& p) {
    return p.x >= box.left && p.x <= box.right && p.y >= box.top && p.y <= box.bottom;
}

bool box_intersect(const Box& a, const Box& b) {
    const Corners ca = corners_of(a);
    const Corners cb = corners_of(b);
    return any_corner_in(b, ca) || any_corner_in(a, cb) || any_edges_cross(ca, cb);
}

Box box_union(const Box& a, const Box& b) {
    return {std::min(a.left, b.left), std::min(a.top, b.top),
            std::max(a.right, b.right), std::max(a.bottom, b.bottom)};
}

} // namespace diffmap::image
