#ifndef KEYSHAPE_GEOMETRY_RECT_HPP
#define KEYSHAPE_GEOMETRY_RECT_HPP

#include <math/vec2.hpp>
#include <math/unit.hpp>
#include <common/approx.hpp>

namespace keyshape {

// Axis-aligned rectangle
template <typename U>
struct Rect {
    Point<U> min;
    Point<U> max;

    constexpr Rect() = default;

    // Takes the corners as given; use from_points if they may be swapped
    constexpr Rect(const Point<U>& min_, const Point<U>& max_) : min(min_), max(max_) {}

    // Zero-size rectangle at the origin
    static constexpr Rect empty() { return {}; }

    static constexpr Rect from_points(const Point<U>& a, const Point<U>& b) {
        return {a.min(b), a.max(b)};
    }

    static constexpr Rect from_origin_and_size(const Point<U>& origin, const Vector<U>& size) {
        return from_points(origin, origin + size);
    }

    static constexpr Rect from_center_and_size(const Point<U>& center, const Vector<U>& size) {
        Vector<U> half = size / 2.0f;
        return from_points(center - half, center + half);
    }

    constexpr Vector<U> size() const { return max - min; }
    constexpr float width() const { return max.x - min.x; }
    constexpr float height() const { return max.y - min.y; }
    constexpr Point<U> center() const { return min.lerp(max, 0.5f); }

    // Smallest rectangle containing both
    constexpr Rect union_with(const Rect& other) const {
        return {min.min(other.min), max.max(other.max)};
    }

    // Smallest rectangle containing this and the point
    constexpr Rect including(const Point<U>& p) const {
        return {min.min(p), max.max(p)};
    }

    constexpr bool contains(const Point<U>& p) const {
        return p.x >= min.x && p.x <= max.x && p.y >= min.y && p.y <= max.y;
    }

    constexpr Rect translated(const Vector<U>& offset) const {
        return {min + offset, max + offset};
    }

    constexpr Rect lerp(const Rect& other, float t) const {
        return {min.lerp(other.min, t), max.lerp(other.max, t)};
    }

    constexpr bool operator==(const Rect& other) const {
        return min == other.min && max == other.max;
    }

    constexpr bool operator!=(const Rect& other) const {
        return !(*this == other);
    }
};

template <typename From, typename To>
constexpr Rect<To> convert(const Rect<From>& rect, Conversion<From, To> conversion) {
    return {convert(rect.min, conversion), convert(rect.max, conversion)};
}

template <typename U>
bool is_close(const Rect<U>& a, const Rect<U>& b,
              float rel_tol = approx::REL_TOL, float abs_tol = approx::ABS_TOL) {
    return is_close(a.min, b.min, rel_tol, abs_tol) && is_close(a.max, b.max, rel_tol, abs_tol);
}

}  // namespace keyshape

#endif // KEYSHAPE_GEOMETRY_RECT_HPP
