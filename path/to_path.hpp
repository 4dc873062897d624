#ifndef KEYSHAPE_PATH_TO_PATH_HPP
#define KEYSHAPE_PATH_TO_PATH_HPP

#include "path.hpp"
#include "path_builder.hpp"
#include <geometry/ellipse.hpp>
#include <geometry/rect.hpp>
#include <geometry/round_rect.hpp>

namespace keyshape {

// Conversion of primitive shapes to paths. All closed shapes start at their
// left edge and are traced clockwise in a y-down space. tolerance is passed on
// to the arc converter.

template <typename U>
Path<U> to_path(const Rect<U>& rect, float tolerance = DEFAULT_TOLERANCE) {
    PathBuilder<U> builder(tolerance);
    builder.abs_move(rect.min);
    builder.abs_horiz_line(rect.max.length_x());
    builder.abs_vert_line(rect.max.length_y());
    builder.abs_horiz_line(rect.min.length_x());
    builder.close();
    return builder.build();
}

template <typename U>
Path<U> to_path(const RoundRect<U>& rect, float tolerance = DEFAULT_TOLERANCE) {
    const Vector<U>& r = rect.radii();

    PathBuilder<U> builder(tolerance);
    builder.abs_move(rect.min() + Vector<U>(0.0f, r.y));
    builder.rel_arc(r, Angle::zero(), false, true, r.neg_y());
    builder.abs_horiz_line(Length<U>(rect.max().x - r.x));
    builder.rel_arc(r, Angle::zero(), false, true, r);
    builder.abs_vert_line(Length<U>(rect.max().y - r.y));
    builder.rel_arc(r, Angle::zero(), false, true, r.neg_x());
    builder.abs_horiz_line(Length<U>(rect.min().x + r.x));
    builder.rel_arc(r, Angle::zero(), false, true, -r);
    builder.close();
    return builder.build();
}

// Two half-ellipse arcs, four cubics in total
template <typename U>
Path<U> to_path(const Ellipse<U>& ellipse, float tolerance = DEFAULT_TOLERANCE) {
    const Vector<U>& r = ellipse.radii;

    PathBuilder<U> builder(tolerance);
    builder.abs_move(ellipse.center - Vector<U>(r.x, 0.0f));
    builder.rel_arc(r, Angle::zero(), false, true, Vector<U>(2.0f * r.x, 0.0f));
    builder.rel_arc(r, Angle::zero(), false, true, Vector<U>(-2.0f * r.x, 0.0f));
    builder.close();
    return builder.build();
}

template <typename U>
Path<U> to_path(const Circle<U>& circle, float tolerance = DEFAULT_TOLERANCE) {
    return to_path(circle.to_ellipse(), tolerance);
}

// Open path from the arc's start to its end
template <typename U>
Path<U> to_path(const EllipticalArc<U>& arc, float tolerance = DEFAULT_TOLERANCE) {
    PathBuilder<U> builder(tolerance);
    builder.abs_move(arc.start);
    builder.abs_arc(arc.radii, arc.x_rotation, arc.large_arc, arc.sweep, arc.end);
    return builder.build();
}

}  // namespace keyshape

#endif // KEYSHAPE_PATH_TO_PATH_HPP
