#ifndef KEYSHAPE_MATH_UNIT_HPP
#define KEYSHAPE_MATH_UNIT_HPP

#include <cmath>
#include <compare>

namespace keyshape {

// Measurement spaces. These are only ever used as template tags; a value in one
// space cannot be combined with a value in another without a Conversion.

// Keyboard unit, usually 19.05 mm or 0.75 in
struct KeyUnit {};

// Drawing unit, 1000 per keyboard unit
struct Dot {};

struct Mm {};

struct Inch {};

// Font design unit; the scale to other spaces depends on the font's units-per-em
struct FontUnit {};

// Used where the unit genuinely does not matter (pure arc math, tests)
struct Unitless {};

// Scalar length tagged with a unit
template <typename U>
struct Length {
    float value = 0.0f;

    constexpr Length() = default;
    constexpr explicit Length(float v) : value(v) {}

    constexpr float get() const { return value; }

    constexpr Length operator+(Length other) const { return Length(value + other.value); }
    constexpr Length operator-(Length other) const { return Length(value - other.value); }
    constexpr Length operator*(float scalar) const { return Length(value * scalar); }
    constexpr Length operator/(float scalar) const { return Length(value / scalar); }
    constexpr float operator/(Length other) const { return value / other.value; }
    constexpr Length operator-() const { return Length(-value); }

    constexpr Length& operator+=(Length other) { value += other.value; return *this; }
    constexpr Length& operator-=(Length other) { value -= other.value; return *this; }
    constexpr Length& operator*=(float scalar) { value *= scalar; return *this; }
    constexpr Length& operator/=(float scalar) { value /= scalar; return *this; }

    constexpr auto operator<=>(const Length&) const = default;

    Length abs() const { return Length(std::abs(value)); }
    constexpr Length min(Length other) const { return value < other.value ? *this : other; }
    constexpr Length max(Length other) const { return value > other.value ? *this : other; }

    constexpr Length lerp(Length other, float t) const {
        return *this + (other - *this) * t;
    }
};

template <typename U>
constexpr Length<U> operator*(float scalar, Length<U> length) {
    return length * scalar;
}

// Linear conversion factor between two measurement spaces
template <typename From, typename To>
struct Conversion {
    float factor = 1.0f;

    constexpr Conversion() = default;
    constexpr explicit Conversion(float f) : factor(f) {}

    constexpr float get() const { return factor; }

    constexpr Conversion<To, From> inverse() const {
        return Conversion<To, From>(1.0f / factor);
    }

    // Apply this conversion, then next
    template <typename Next>
    constexpr Conversion<From, Next> then(Conversion<To, Next> next) const {
        return Conversion<From, Next>(factor * next.factor);
    }

    constexpr Length<To> convert(Length<From> length) const {
        return Length<To>(length.value * factor);
    }
};

constexpr Conversion<KeyUnit, Dot> DOT_PER_UNIT{1000.0f};
constexpr Conversion<KeyUnit, Mm> MM_PER_UNIT{19.05f};
constexpr Conversion<KeyUnit, Inch> INCH_PER_UNIT{0.75f};

constexpr Conversion<Mm, Dot> DOT_PER_MM = MM_PER_UNIT.inverse().then(DOT_PER_UNIT);
constexpr Conversion<Inch, Dot> DOT_PER_INCH = INCH_PER_UNIT.inverse().then(DOT_PER_UNIT);

// Font units to drawing units for a font with the given units-per-em, where the
// em square is scaled to em_size drawing units
template <typename To>
constexpr Conversion<FontUnit, To> font_units(float units_per_em, Length<To> em_size) {
    return Conversion<FontUnit, To>(em_size.value / units_per_em);
}

template <typename From, typename To>
constexpr Length<To> convert(Length<From> length, Conversion<From, To> conversion) {
    return conversion.convert(length);
}

}  // namespace keyshape

#endif // KEYSHAPE_MATH_UNIT_HPP
