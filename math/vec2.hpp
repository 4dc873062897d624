#ifndef KEYSHAPE_MATH_VEC2_HPP
#define KEYSHAPE_MATH_VEC2_HPP

#include "angle.hpp"
#include "unit.hpp"
#include <common/approx.hpp>
#include <algorithm>
#include <cmath>

namespace keyshape {

// A displacement in unit space U
template <typename U>
struct Vector {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vector() = default;
    constexpr Vector(float x_, float y_) : x(x_), y(y_) {}
    constexpr Vector(Length<U> x_, Length<U> y_) : x(x_.value), y(y_.value) {}

    static constexpr Vector zero() { return {0.0f, 0.0f}; }
    static constexpr Vector splat(float v) { return {v, v}; }

    // Arithmetic operators
    constexpr Vector operator+(const Vector& other) const {
        return {x + other.x, y + other.y};
    }

    constexpr Vector operator-(const Vector& other) const {
        return {x - other.x, y - other.y};
    }

    constexpr Vector operator*(float scalar) const {
        return {x * scalar, y * scalar};
    }

    constexpr Vector operator/(float scalar) const {
        return {x / scalar, y / scalar};
    }

    constexpr Vector operator-() const {
        return {-x, -y};
    }

    // Compound assignment
    constexpr Vector& operator+=(const Vector& other) {
        x += other.x; y += other.y;
        return *this;
    }

    constexpr Vector& operator-=(const Vector& other) {
        x -= other.x; y -= other.y;
        return *this;
    }

    constexpr Vector& operator*=(float scalar) {
        x *= scalar; y *= scalar;
        return *this;
    }

    constexpr Vector& operator/=(float scalar) {
        x /= scalar; y /= scalar;
        return *this;
    }

    constexpr Vector component_mul(const Vector& other) const {
        return {x * other.x, y * other.y};
    }

    constexpr Vector component_div(const Vector& other) const {
        return {x / other.x, y / other.y};
    }

    constexpr Vector min(const Vector& other) const {
        return {std::min(x, other.x), std::min(y, other.y)};
    }

    constexpr Vector max(const Vector& other) const {
        return {std::max(x, other.x), std::max(y, other.y)};
    }

    constexpr Vector lerp(const Vector& other, float t) const {
        return *this + (other - *this) * t;
    }

    constexpr float dot(const Vector& other) const {
        return x * other.x + y * other.y;
    }

    constexpr float length_squared() const {
        return x * x + y * y;
    }

    float length() const {
        return std::sqrt(length_squared());
    }

    // Componentwise absolute value
    Vector abs() const {
        return {std::abs(x), std::abs(y)};
    }

    Vector rotate(Angle angle) const {
        auto [sin, cos] = angle.sin_cos();
        return {x * cos - y * sin, x * sin + y * cos};
    }

    constexpr Vector neg_x() const { return {-x, y}; }
    constexpr Vector neg_y() const { return {x, -y}; }
    constexpr Vector swap_xy() const { return {y, x}; }

    constexpr Length<U> length_x() const { return Length<U>(x); }
    constexpr Length<U> length_y() const { return Length<U>(y); }

    // Comparison (exact)
    constexpr bool operator==(const Vector& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Vector& other) const {
        return !(*this == other);
    }
};

// A position in unit space U
template <typename U>
struct Point {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Point() = default;
    constexpr Point(float x_, float y_) : x(x_), y(y_) {}
    constexpr Point(Length<U> x_, Length<U> y_) : x(x_.value), y(y_.value) {}

    static constexpr Point origin() { return {0.0f, 0.0f}; }
    static constexpr Point splat(float v) { return {v, v}; }

    constexpr Point operator+(const Vector<U>& v) const {
        return {x + v.x, y + v.y};
    }

    constexpr Point operator-(const Vector<U>& v) const {
        return {x - v.x, y - v.y};
    }

    constexpr Vector<U> operator-(const Point& other) const {
        return {x - other.x, y - other.y};
    }

    constexpr Point& operator+=(const Vector<U>& v) {
        x += v.x; y += v.y;
        return *this;
    }

    constexpr Point& operator-=(const Vector<U>& v) {
        x -= v.x; y -= v.y;
        return *this;
    }

    constexpr Point min(const Point& other) const {
        return {std::min(x, other.x), std::min(y, other.y)};
    }

    constexpr Point max(const Point& other) const {
        return {std::max(x, other.x), std::max(y, other.y)};
    }

    constexpr Point lerp(const Point& other, float t) const {
        return *this + (other - *this) * t;
    }

    constexpr Vector<U> to_vector() const { return {x, y}; }

    constexpr Length<U> length_x() const { return Length<U>(x); }
    constexpr Length<U> length_y() const { return Length<U>(y); }

    constexpr bool operator==(const Point& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Point& other) const {
        return !(*this == other);
    }
};

// Scalar * Vector
template <typename U>
constexpr Vector<U> operator*(float scalar, const Vector<U>& v) {
    return v * scalar;
}

template <typename From, typename To>
constexpr Vector<To> convert(const Vector<From>& v, Conversion<From, To> conversion) {
    return {v.x * conversion.get(), v.y * conversion.get()};
}

template <typename From, typename To>
constexpr Point<To> convert(const Point<From>& p, Conversion<From, To> conversion) {
    return {p.x * conversion.get(), p.y * conversion.get()};
}

// Tolerant comparison
template <typename U>
bool is_close(const Vector<U>& a, const Vector<U>& b,
              float rel_tol = approx::REL_TOL, float abs_tol = approx::ABS_TOL) {
    return approx::is_close(a.x, b.x, rel_tol, abs_tol) &&
           approx::is_close(a.y, b.y, rel_tol, abs_tol);
}

template <typename U>
bool is_close(const Point<U>& a, const Point<U>& b,
              float rel_tol = approx::REL_TOL, float abs_tol = approx::ABS_TOL) {
    return approx::is_close(a.x, b.x, rel_tol, abs_tol) &&
           approx::is_close(a.y, b.y, rel_tol, abs_tol);
}

}  // namespace keyshape

#endif // KEYSHAPE_MATH_VEC2_HPP
