#ifndef KEYSHAPE_PROFILE_PROFILE_HPP
#define KEYSHAPE_PROFILE_PROFILE_HPP

#include <geometry/rect.hpp>
#include <geometry/round_rect.hpp>
#include <key/key_shape.hpp>
#include <math/unit.hpp>
#include <math/vec2.hpp>

namespace keyshape {

// Dish shape of the key top
enum class ProfileType {
    Cylindrical,
    Spherical,
    Flat
};

inline const char* profile_type_name(ProfileType type) {
    switch (type) {
        case ProfileType::Cylindrical: return "cylindrical";
        case ProfileType::Spherical: return "spherical";
        case ProfileType::Flat: return "flat";
    }
    return "unknown";
}

// Top surface of a 1x1 key, centred on the key then moved down by y_offset
struct TopSurface {
    Vector<Dot> size{660.0f, 735.0f};
    Length<Dot> radius{65.0f};
    Length<Dot> y_offset{-77.5f};

    Rect<Dot> rect() const;
    RoundRect<Dot> round_rect() const;
};

// Footprint of a 1x1 key, centred on the key
struct BottomSurface {
    Vector<Dot> size{950.0f, 950.0f};
    Length<Dot> radius{65.0f};

    Rect<Dot> rect() const;
    RoundRect<Dot> round_rect() const;
};

struct ScoopProps {
    Length<Mm> depth{2.0f};
};

struct BarProps {
    Vector<Mm> size{3.81f, 0.51f};  // 0.15in x 0.02in
    Length<Mm> y_offset{6.35f};     // 0.25in
};

struct BumpProps {
    Length<Mm> diameter{0.51f};  // 0.02in
    Length<Mm> y_offset{0.0f};
};

struct HomingProps {
    HomingKind default_kind = HomingKind::Bar;
    ScoopProps scoop;
    BarProps bar;
    BumpProps bump;
};

// Everything the outline generator needs, expressed in unit space U
template <typename U>
struct ProfileGeometry {
    RoundRect<U> top;     // 1x1 top template
    RoundRect<U> bottom;  // 1x1 bottom template
    Conversion<KeyUnit, U> unit;

    Vector<U> bar_size;
    Length<U> bar_y_offset;
    Length<U> bump_diameter;
    Length<U> bump_y_offset;

    HomingKind default_homing = HomingKind::Bar;

    // Template grown on its max corner by (size - 1x1) key units
    RoundRect<U> top_with_size(const Vector<KeyUnit>& size) const {
        return grow(top, size);
    }

    RoundRect<U> bottom_with_size(const Vector<KeyUnit>& size) const {
        return grow(bottom, size);
    }

    Length<U> key_units(float value) const {
        return unit.convert(Length<KeyUnit>(value));
    }

private:
    RoundRect<U> grow(const RoundRect<U>& rect, const Vector<KeyUnit>& size) const {
        Vector<U> dmax = convert(size - Vector<KeyUnit>::splat(1.0f), unit);
        return rect.with_corners(rect.min(), rect.max() + dmax);
    }
};

// Geometric part of a keycap profile. Surfaces are held in drawing units,
// homing features in millimetres.
struct Profile {
    ProfileType type = ProfileType::Cylindrical;
    float depth = 1.0f;  // mm, approximately OEM
    BottomSurface bottom;
    TopSurface top;
    HomingProps homing;

    // Dish depth in mm; always zero for flat profiles
    float surface_depth() const;

    RoundRect<Dot> top_rect() const { return top.round_rect(); }
    RoundRect<Dot> bottom_rect() const { return bottom.round_rect(); }

    RoundRect<Dot> top_with_size(const Vector<KeyUnit>& size) const;
    RoundRect<Dot> bottom_with_size(const Vector<KeyUnit>& size) const;

    // Throws std::runtime_error naming the first field that is negative or
    // not finite
    void validate() const;

    ProfileGeometry<Dot> geometry() const;

    // Geometry in another unit space, given the conversion from drawing units
    template <typename U>
    ProfileGeometry<U> geometry(Conversion<Dot, U> conversion) const {
        ProfileGeometry<Dot> dots = geometry();
        Conversion<Mm, U> mm = DOT_PER_MM.then(conversion);

        ProfileGeometry<U> result;
        result.top = convert(dots.top, conversion);
        result.bottom = convert(dots.bottom, conversion);
        result.unit = DOT_PER_UNIT.then(conversion);
        result.bar_size = convert(homing.bar.size, mm);
        result.bar_y_offset = convert(homing.bar.y_offset, mm);
        result.bump_diameter = convert(homing.bump.diameter, mm);
        result.bump_y_offset = convert(homing.bump.y_offset, mm);
        result.default_homing = homing.default_kind;
        return result;
    }
};

}  // namespace keyshape

#endif // KEYSHAPE_PROFILE_PROFILE_HPP
