#ifndef KEYSHAPE_GEOMETRY_HPP
#define KEYSHAPE_GEOMETRY_HPP

// Geometry kernel public API
// Unit-typed vectors and transforms, primitive shapes and paths

#include "unit.hpp"
#include "angle.hpp"
#include "vec2.hpp"
#include "transform.hpp"
#include "rect.hpp"
#include "round_rect.hpp"
#include "ellipse.hpp"
#include "path_segment.hpp"
#include "path.hpp"
#include "path_builder.hpp"
#include "arc_to_bezier.hpp"
#include "to_path.hpp"

namespace keyshape {

// Usage:
//   PathBuilder<Dot> builder;
//   builder.abs_move(Point<Dot>(0.0f, 500.0f));
//   builder.rel_arc(Vector<Dot>(500.0f, 500.0f), Angle::zero(), false, true,
//                   Vector<Dot>(500.0f, -500.0f));
//   builder.close();
//   Path<Dot> path = builder.build();
//
//   // Primitive shapes
//   RoundRect<Dot> rect(Point<Dot>(0.0f, 0.0f), Point<Dot>(1000.0f, 1000.0f),
//                       Vector<Dot>(65.0f, 65.0f));
//   Path<Dot> outline = to_path(rect);

} // namespace keyshape

#endif // KEYSHAPE_GEOMETRY_HPP
