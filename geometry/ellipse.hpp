#ifndef KEYSHAPE_GEOMETRY_ELLIPSE_HPP
#define KEYSHAPE_GEOMETRY_ELLIPSE_HPP

#include "rect.hpp"
#include <math/angle.hpp>
#include <math/vec2.hpp>

namespace keyshape {

// Axis-aligned ellipse
template <typename U>
struct Ellipse {
    Point<U> center;
    Vector<U> radii;

    constexpr Ellipse() = default;
    constexpr Ellipse(const Point<U>& center_, const Vector<U>& radii_)
        : center(center_), radii(radii_) {}

    static constexpr Ellipse from_circle(const Point<U>& center, Length<U> radius) {
        return {center, Vector<U>(radius, radius)};
    }

    constexpr float width() const { return 2.0f * radii.x; }
    constexpr float height() const { return 2.0f * radii.y; }

    constexpr Rect<U> bounds() const {
        return Rect<U>::from_center_and_size(center, radii * 2.0f);
    }
};

template <typename U>
struct Circle {
    Point<U> center;
    Length<U> radius;

    constexpr Circle() = default;
    constexpr Circle(const Point<U>& center_, Length<U> radius_)
        : center(center_), radius(radius_) {}

    constexpr Length<U> diameter() const { return radius * 2.0f; }
    constexpr Ellipse<U> to_ellipse() const { return Ellipse<U>::from_circle(center, radius); }
};

// SVG-style elliptical arc between two absolute points
template <typename U>
struct EllipticalArc {
    Point<U> start;
    Point<U> end;
    Vector<U> radii;
    Angle x_rotation;
    bool large_arc = false;
    bool sweep = false;
};

}  // namespace keyshape

#endif // KEYSHAPE_GEOMETRY_ELLIPSE_HPP
