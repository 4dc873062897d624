#ifndef KEYSHAPE_PATH_ARC_TO_BEZIER_HPP
#define KEYSHAPE_PATH_ARC_TO_BEZIER_HPP

#include <math/angle.hpp>
#include <math/vec2.hpp>
#include <math/unit.hpp>
#include <vector>

namespace keyshape {

// Degeneracy threshold used when the caller does not supply one
constexpr float DEFAULT_TOLERANCE = 1e-4f;

// Control points and end point of one cubic Bezier, each a displacement from
// the pen position at the start of that segment
template <typename U>
struct BezierTriple {
    Vector<U> ctrl1;
    Vector<U> ctrl2;
    Vector<U> end;
};

namespace detail {

template <typename To, typename From>
constexpr Vector<To> retag(const Vector<From>& v) {
    return {v.x, v.y};
}

// Unit-independent implementation of arc_to_bezier
std::vector<BezierTriple<Unitless>> arc_to_bezier_unitless(
    Vector<Unitless> radii, Angle x_rotation, bool large_arc, bool sweep,
    Vector<Unitless> d, float tolerance);

// Centre of the ellipse relative to the arc start, assuming zero x-axis rotation
// and radii already large enough to reach d
Vector<Unitless> arc_center(Vector<Unitless> radii, bool large_arc, bool sweep,
                            Vector<Unitless> d);

// Single cubic approximating the arc of the axis-aligned ellipse with the given
// radii from angle phi0 through dphi (|dphi| <= 90 degrees)
BezierTriple<Unitless> arc_segment(Vector<Unitless> radii, Angle phi0, Angle dphi);

}  // namespace detail

// Convert an SVG-style elliptical arc into 0 to 4 cubic Beziers.
//
// Parameters:
//   radii: Ellipse radii (sign is ignored; scaled up if too small to reach d)
//   x_rotation: Rotation of the ellipse's x-axis
//   large_arc: Take the arc spanning more than 180 degrees
//   sweep: Take the arc in the direction of increasing angle
//   d: Displacement from the current pen position to the arc end point
//   tolerance: Displacements or radii at or below this are degenerate
//
// Returns: An empty list if |d| <= tolerance, a single straight-line segment if
// either radius is <= tolerance, otherwise 1-4 segments each spanning at most
// 90 degrees, in traversal order.
template <typename U>
std::vector<BezierTriple<U>> arc_to_bezier(const Vector<U>& radii, Angle x_rotation,
                                           bool large_arc, bool sweep, const Vector<U>& d,
                                           float tolerance = DEFAULT_TOLERANCE) {
    auto segments = detail::arc_to_bezier_unitless(
        detail::retag<Unitless>(radii), x_rotation, large_arc, sweep,
        detail::retag<Unitless>(d), tolerance);

    std::vector<BezierTriple<U>> result;
    result.reserve(segments.size());
    for (const auto& seg : segments) {
        result.push_back({detail::retag<U>(seg.ctrl1),
                          detail::retag<U>(seg.ctrl2),
                          detail::retag<U>(seg.end)});
    }
    return result;
}

}  // namespace keyshape

#endif // KEYSHAPE_PATH_ARC_TO_BEZIER_HPP
