#ifndef KEYSHAPE_MATH_TRANSFORM_HPP
#define KEYSHAPE_MATH_TRANSFORM_HPP

#include "angle.hpp"
#include "vec2.hpp"
#include <common/approx.hpp>

namespace keyshape {

template <typename U>
struct Transform;

// Non-uniform scale about the origin. Unitless: it never changes a value's space
struct Scale {
    float x = 1.0f;
    float y = 1.0f;

    constexpr Scale() = default;
    constexpr Scale(float x_, float y_) : x(x_), y(y_) {}

    static constexpr Scale uniform(float s) { return {s, s}; }

    template <typename U>
    constexpr Vector<U> apply(const Vector<U>& v) const { return {v.x * x, v.y * y}; }

    template <typename U>
    constexpr Point<U> apply(const Point<U>& p) const { return {p.x * x, p.y * y}; }

    template <typename U>
    constexpr Transform<U> to_transform() const;
};

template <typename U>
struct Translate {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Translate() = default;
    constexpr Translate(float x_, float y_) : x(x_), y(y_) {}
    constexpr Translate(Length<U> x_, Length<U> y_) : x(x_.value), y(y_.value) {}
    constexpr explicit Translate(const Vector<U>& v) : x(v.x), y(v.y) {}

    constexpr Vector<U> to_vector() const { return {x, y}; }

    // Translation does not move displacements
    constexpr Vector<U> apply(const Vector<U>& v) const { return v; }
    constexpr Point<U> apply(const Point<U>& p) const { return {p.x + x, p.y + y}; }

    constexpr Transform<U> to_transform() const;
};

// Rotation about the origin
struct Rotate {
    Angle angle;

    constexpr Rotate() = default;
    constexpr explicit Rotate(Angle a) : angle(a) {}

    template <typename U>
    Vector<U> apply(const Vector<U>& v) const { return v.rotate(angle); }

    template <typename U>
    Point<U> apply(const Point<U>& p) const {
        Vector<U> v = p.to_vector().rotate(angle);
        return {v.x, v.y};
    }

    template <typename U>
    Transform<U> to_transform() const;
};

// 2x3 affine matrix:
//   x' = x * a_xx + y * a_xy + t_x
//   y' = x * a_yx + y * a_yy + t_y
template <typename U>
struct Transform {
    float a_xx = 1.0f;
    float a_xy = 0.0f;
    float a_yx = 0.0f;
    float a_yy = 1.0f;
    float t_x = 0.0f;
    float t_y = 0.0f;

    constexpr Transform() = default;
    constexpr Transform(float xx, float xy, float yx, float yy, float tx, float ty)
        : a_xx(xx), a_xy(xy), a_yx(yx), a_yy(yy), t_x(tx), t_y(ty) {}

    static constexpr Transform identity() { return {}; }

    constexpr Point<U> apply(const Point<U>& p) const {
        return {p.x * a_xx + p.y * a_xy + t_x,
                p.x * a_yx + p.y * a_yy + t_y};
    }

    // Vectors are displacements, so the translation part is ignored
    constexpr Vector<U> apply(const Vector<U>& v) const {
        return {v.x * a_xx + v.y * a_xy,
                v.x * a_yx + v.y * a_yy};
    }

    // Apply this transform, then next
    constexpr Transform then(const Transform& next) const {
        return {
            next.a_xx * a_xx + next.a_xy * a_yx,
            next.a_xx * a_xy + next.a_xy * a_yy,
            next.a_yx * a_xx + next.a_yy * a_yx,
            next.a_yx * a_xy + next.a_yy * a_yy,
            next.a_xx * t_x + next.a_xy * t_y + next.t_x,
            next.a_yx * t_x + next.a_yy * t_y + next.t_y
        };
    }

    constexpr float determinant() const {
        return a_xx * a_yy - a_xy * a_yx;
    }

    constexpr bool operator==(const Transform& other) const = default;
};

template <typename U>
constexpr Transform<U> Scale::to_transform() const {
    return {x, 0.0f, 0.0f, y, 0.0f, 0.0f};
}

template <typename U>
constexpr Transform<U> Translate<U>::to_transform() const {
    return {1.0f, 0.0f, 0.0f, 1.0f, x, y};
}

template <typename U>
Transform<U> Rotate::to_transform() const {
    auto [sin, cos] = angle.sin_cos();
    return {cos, -sin, sin, cos, 0.0f, 0.0f};
}

template <typename U>
bool is_close(const Transform<U>& a, const Transform<U>& b,
              float rel_tol = approx::REL_TOL, float abs_tol = approx::ABS_TOL) {
    return approx::is_close(a.a_xx, b.a_xx, rel_tol, abs_tol) &&
           approx::is_close(a.a_xy, b.a_xy, rel_tol, abs_tol) &&
           approx::is_close(a.a_yx, b.a_yx, rel_tol, abs_tol) &&
           approx::is_close(a.a_yy, b.a_yy, rel_tol, abs_tol) &&
           approx::is_close(a.t_x, b.t_x, rel_tol, abs_tol) &&
           approx::is_close(a.t_y, b.t_y, rel_tol, abs_tol);
}

}  // namespace keyshape

#endif // KEYSHAPE_MATH_TRANSFORM_HPP
