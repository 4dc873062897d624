#ifndef KEYSHAPE_PATH_PATH_SEGMENT_HPP
#define KEYSHAPE_PATH_PATH_SEGMENT_HPP

#include <math/vec2.hpp>
#include <math/transform.hpp>
#include <math/unit.hpp>
#include <type_traits>
#include <variant>

namespace keyshape {
namespace segment {

// Start a new subpath at an absolute point
template <typename U>
struct Move {
    Point<U> point;

    bool operator==(const Move&) const = default;
};

// All remaining displacements are relative to the pen position at the time the
// segment was appended
template <typename U>
struct Line {
    Vector<U> end;

    bool operator==(const Line&) const = default;
};

template <typename U>
struct CubicBezier {
    Vector<U> ctrl1;
    Vector<U> ctrl2;
    Vector<U> end;

    bool operator==(const CubicBezier&) const = default;
};

template <typename U>
struct QuadraticBezier {
    Vector<U> ctrl;
    Vector<U> end;

    bool operator==(const QuadraticBezier&) const = default;
};

// Return to the start of the current subpath
struct Close {
    bool operator==(const Close&) const = default;
};

}  // namespace segment

template <typename U>
using PathSegment = std::variant<
    segment::Move<U>, segment::Line<U>,
    segment::CubicBezier<U>, segment::QuadraticBezier<U>,
    segment::Close
>;

// Pen position after the segment, given the pen and subpath start before it
template <typename U>
Point<U> advance_pen(const PathSegment<U>& seg, const Point<U>& pen, const Point<U>& start) {
    return std::visit([&](auto&& arg) -> Point<U> {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, segment::Move<U>>) return arg.point;
        else if constexpr (std::is_same_v<T, segment::Line<U>>) return pen + arg.end;
        else if constexpr (std::is_same_v<T, segment::CubicBezier<U>>) return pen + arg.end;
        else if constexpr (std::is_same_v<T, segment::QuadraticBezier<U>>) return pen + arg.end;
        else return start;
    }, seg);
}

// Apply an affine map: Move points get the full transform, displacements only
// the linear part. Works for Scale, Translate, Rotate and Transform alike
template <typename U, typename Xform>
PathSegment<U> transform_segment(const PathSegment<U>& seg, const Xform& xform) {
    return std::visit([&](auto&& arg) -> PathSegment<U> {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, segment::Move<U>>) {
            return segment::Move<U>{xform.apply(arg.point)};
        } else if constexpr (std::is_same_v<T, segment::Line<U>>) {
            return segment::Line<U>{xform.apply(arg.end)};
        } else if constexpr (std::is_same_v<T, segment::CubicBezier<U>>) {
            return segment::CubicBezier<U>{
                xform.apply(arg.ctrl1), xform.apply(arg.ctrl2), xform.apply(arg.end)};
        } else if constexpr (std::is_same_v<T, segment::QuadraticBezier<U>>) {
            return segment::QuadraticBezier<U>{xform.apply(arg.ctrl), xform.apply(arg.end)};
        } else {
            return segment::Close{};
        }
    }, seg);
}

template <typename From, typename To>
PathSegment<To> convert(const PathSegment<From>& seg, Conversion<From, To> conversion) {
    return std::visit([&](auto&& arg) -> PathSegment<To> {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, segment::Move<From>>) {
            return segment::Move<To>{convert(arg.point, conversion)};
        } else if constexpr (std::is_same_v<T, segment::Line<From>>) {
            return segment::Line<To>{convert(arg.end, conversion)};
        } else if constexpr (std::is_same_v<T, segment::CubicBezier<From>>) {
            return segment::CubicBezier<To>{convert(arg.ctrl1, conversion),
                                            convert(arg.ctrl2, conversion),
                                            convert(arg.end, conversion)};
        } else if constexpr (std::is_same_v<T, segment::QuadraticBezier<From>>) {
            return segment::QuadraticBezier<To>{convert(arg.ctrl, conversion),
                                                convert(arg.end, conversion)};
        } else {
            return segment::Close{};
        }
    }, seg);
}

template <typename U>
bool is_close(const PathSegment<U>& a, const PathSegment<U>& b,
              float rel_tol = approx::REL_TOL, float abs_tol = approx::ABS_TOL) {
    if (a.index() != b.index()) {
        return false;
    }
    return std::visit([&](auto&& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const T& rhs = std::get<T>(b);
        if constexpr (std::is_same_v<T, segment::Move<U>>) {
            return is_close(lhs.point, rhs.point, rel_tol, abs_tol);
        } else if constexpr (std::is_same_v<T, segment::Line<U>>) {
            return is_close(lhs.end, rhs.end, rel_tol, abs_tol);
        } else if constexpr (std::is_same_v<T, segment::CubicBezier<U>>) {
            return is_close(lhs.ctrl1, rhs.ctrl1, rel_tol, abs_tol) &&
                   is_close(lhs.ctrl2, rhs.ctrl2, rel_tol, abs_tol) &&
                   is_close(lhs.end, rhs.end, rel_tol, abs_tol);
        } else if constexpr (std::is_same_v<T, segment::QuadraticBezier<U>>) {
            return is_close(lhs.ctrl, rhs.ctrl, rel_tol, abs_tol) &&
                   is_close(lhs.end, rhs.end, rel_tol, abs_tol);
        } else {
            return true;
        }
    }, a);
}

}  // namespace keyshape

#endif // KEYSHAPE_PATH_PATH_SEGMENT_HPP
