#ifndef KEYSHAPE_MATH_ANGLE_HPP
#define KEYSHAPE_MATH_ANGLE_HPP

#include <cmath>
#include <compare>
#include <numbers>
#include <utility>

namespace keyshape {

// An angle, stored in radians
struct Angle {
    float rad = 0.0f;

    constexpr Angle() = default;

    static constexpr Angle radians(float radians) { return Angle(radians); }
    static constexpr Angle degrees(float degrees) {
        return Angle(degrees * std::numbers::pi_v<float> / 180.0f);
    }

    static constexpr Angle zero() { return Angle(0.0f); }
    static constexpr Angle pi() { return Angle(std::numbers::pi_v<float>); }
    static constexpr Angle two_pi() { return Angle(2.0f * std::numbers::pi_v<float>); }
    static constexpr Angle frac_pi_2() { return Angle(std::numbers::pi_v<float> / 2.0f); }

    constexpr float to_radians() const { return rad; }
    constexpr float to_degrees() const { return rad * 180.0f / std::numbers::pi_v<float>; }

    // Normalized to [0, 2pi)
    Angle positive() const {
        constexpr float tau = 2.0f * std::numbers::pi_v<float>;
        float r = std::fmod(rad, tau);
        if (r < 0.0f) {
            r += tau;
        }
        // fmod of a tiny negative value can round up to exactly tau
        if (r >= tau) {
            r -= tau;
        }
        return Angle(r);
    }

    // Normalized to (-pi, pi]
    Angle signed_angle() const {
        constexpr float pi_f = std::numbers::pi_v<float>;
        float r = positive().rad;
        if (r > pi_f) {
            r -= 2.0f * pi_f;
        }
        return Angle(r);
    }

    float sin() const { return std::sin(rad); }
    float cos() const { return std::cos(rad); }
    float tan() const { return std::tan(rad); }
    std::pair<float, float> sin_cos() const { return {std::sin(rad), std::cos(rad)}; }

    static Angle asin(float value) { return Angle(std::asin(value)); }
    static Angle acos(float value) { return Angle(std::acos(value)); }
    static Angle atan(float value) { return Angle(std::atan(value)); }
    static Angle atan2(float y, float x) { return Angle(std::atan2(y, x)); }

    constexpr Angle operator+(Angle other) const { return Angle(rad + other.rad); }
    constexpr Angle operator-(Angle other) const { return Angle(rad - other.rad); }
    constexpr Angle operator*(float scalar) const { return Angle(rad * scalar); }
    constexpr Angle operator/(float scalar) const { return Angle(rad / scalar); }
    constexpr float operator/(Angle other) const { return rad / other.rad; }
    constexpr Angle operator-() const { return Angle(-rad); }

    constexpr Angle& operator+=(Angle other) { rad += other.rad; return *this; }
    constexpr Angle& operator-=(Angle other) { rad -= other.rad; return *this; }
    constexpr Angle& operator*=(float scalar) { rad *= scalar; return *this; }
    constexpr Angle& operator/=(float scalar) { rad /= scalar; return *this; }

    constexpr auto operator<=>(const Angle&) const = default;

    Angle abs() const { return Angle(std::abs(rad)); }

private:
    constexpr explicit Angle(float radians) : rad(radians) {}
};

constexpr Angle operator*(float scalar, Angle angle) {
    return angle * scalar;
}

}  // namespace keyshape

#endif // KEYSHAPE_MATH_ANGLE_HPP
