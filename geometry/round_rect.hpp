#ifndef KEYSHAPE_GEOMETRY_ROUND_RECT_HPP
#define KEYSHAPE_GEOMETRY_ROUND_RECT_HPP

#include "rect.hpp"
#include <math/vec2.hpp>
#include <algorithm>

namespace keyshape {

// Rectangle with one pair of (possibly elliptical) corner radii shared by all
// four corners. Radii are clamped once, here, so that opposite corners never
// overlap: 0 <= radii.x <= width / 2 and 0 <= radii.y <= height / 2.
template <typename U>
class RoundRect {
public:
    constexpr RoundRect() = default;

    constexpr RoundRect(const Point<U>& min, const Point<U>& max, const Vector<U>& radii)
        : rect_(Rect<U>::from_points(min, max)), radii_(clamp_radii(rect_, radii)) {}

    constexpr RoundRect(const Rect<U>& rect, const Vector<U>& radii)
        : RoundRect(rect.min, rect.max, radii) {}

    static constexpr RoundRect from_origin_size_and_radii(
        const Point<U>& origin, const Vector<U>& size, const Vector<U>& radii) {
        return RoundRect(Rect<U>::from_origin_and_size(origin, size), radii);
    }

    static constexpr RoundRect from_center_size_and_radii(
        const Point<U>& center, const Vector<U>& size, const Vector<U>& radii) {
        return RoundRect(Rect<U>::from_center_and_size(center, size), radii);
    }

    constexpr const Point<U>& min() const { return rect_.min; }
    constexpr const Point<U>& max() const { return rect_.max; }
    constexpr const Rect<U>& rect() const { return rect_; }
    constexpr const Vector<U>& radii() const { return radii_; }

    constexpr Vector<U> size() const { return rect_.size(); }
    constexpr float width() const { return rect_.width(); }
    constexpr float height() const { return rect_.height(); }
    constexpr Point<U> center() const { return rect_.center(); }

    // Same radii, corners moved
    constexpr RoundRect with_corners(const Point<U>& min, const Point<U>& max) const {
        return RoundRect(min, max, radii_);
    }

    constexpr RoundRect translated(const Vector<U>& offset) const {
        return RoundRect(rect_.translated(offset), radii_);
    }

    // Interpolates corners and radii independently
    constexpr RoundRect lerp(const RoundRect& other, float t) const {
        return RoundRect(rect_.min.lerp(other.rect_.min, t),
                         rect_.max.lerp(other.rect_.max, t),
                         radii_.lerp(other.radii_, t));
    }

    constexpr bool operator==(const RoundRect& other) const {
        return rect_ == other.rect_ && radii_ == other.radii_;
    }

private:
    static constexpr Vector<U> clamp_radii(const Rect<U>& rect, const Vector<U>& radii) {
        return {std::clamp(radii.x, 0.0f, rect.width() / 2.0f),
                std::clamp(radii.y, 0.0f, rect.height() / 2.0f)};
    }

    Rect<U> rect_;
    Vector<U> radii_;
};

template <typename From, typename To>
constexpr RoundRect<To> convert(const RoundRect<From>& rect, Conversion<From, To> conversion) {
    return RoundRect<To>(convert(rect.rect(), conversion), convert(rect.radii(), conversion));
}

template <typename U>
bool is_close(const RoundRect<U>& a, const RoundRect<U>& b,
              float rel_tol = approx::REL_TOL, float abs_tol = approx::ABS_TOL) {
    return is_close(a.rect(), b.rect(), rel_tol, abs_tol) &&
           is_close(a.radii(), b.radii(), rel_tol, abs_tol);
}

}  // namespace keyshape

#endif // KEYSHAPE_GEOMETRY_ROUND_RECT_HPP
