#ifndef KEYSHAPE_KEY_KEY_OUTLINE_HPP
#define KEYSHAPE_KEY_KEY_OUTLINE_HPP

#include "key_shape.hpp"
#include <geometry/ellipse.hpp>
#include <geometry/rect.hpp>
#include <geometry/round_rect.hpp>
#include <path/path.hpp>
#include <path/path_builder.hpp>
#include <path/to_path.hpp>
#include <profile/profile.hpp>
#include <array>
#include <type_traits>
#include <variant>
#include <vector>

namespace keyshape {

// Which part of a key a path draws
enum class KeyFeature {
    Bottom,
    Top,
    Step,
    Homing
};

inline const char* key_feature_name(KeyFeature feature) {
    switch (feature) {
        case KeyFeature::Bottom: return "bottom";
        case KeyFeature::Top: return "top";
        case KeyFeature::Step: return "step";
        case KeyFeature::Homing: return "homing";
    }
    return "unknown";
}

template <typename U>
struct FeaturePath {
    KeyFeature feature;
    Path<U> path;
};

namespace key_outline {

namespace detail {

// The ISO enter outline is the union of a 1.5x1 rect on the top row and a
// 1.25x2 rect shifted right by 0.25u. It is traced clockwise as a table of
// edges and corners.
enum class IsoRect { Wide, Tall };

enum class IsoSide { MinX, MaxX, MaxY };

struct IsoStep {
    enum Kind { HorizEdge, VertEdge, Corner };

    Kind kind;

    // Edges: run to the given side of a rect, stopping inset corner radii
    // short of it (negative insets stop inside the rect)
    IsoRect rect = IsoRect::Wide;
    IsoSide side = IsoSide::MinX;
    float inset = 0.0f;

    // Corners: quarter arc with this displacement in radii
    float dx = 0.0f;
    float dy = 0.0f;
    bool sweep = true;  // false for the concave inner corner
};

constexpr std::array<IsoStep, 11> ISO_TRACE = {{
    {IsoStep::Corner, IsoRect::Wide, IsoSide::MinX, 0.0f, 1.0f, -1.0f, true},
    {IsoStep::HorizEdge, IsoRect::Wide, IsoSide::MaxX, -1.0f},
    {IsoStep::Corner, IsoRect::Wide, IsoSide::MinX, 0.0f, 1.0f, 1.0f, true},
    {IsoStep::VertEdge, IsoRect::Tall, IsoSide::MaxY, -1.0f},
    {IsoStep::Corner, IsoRect::Wide, IsoSide::MinX, 0.0f, -1.0f, 1.0f, true},
    {IsoStep::HorizEdge, IsoRect::Tall, IsoSide::MinX, 1.0f},
    {IsoStep::Corner, IsoRect::Wide, IsoSide::MinX, 0.0f, -1.0f, -1.0f, true},
    {IsoStep::VertEdge, IsoRect::Wide, IsoSide::MaxY, 1.0f},
    {IsoStep::Corner, IsoRect::Wide, IsoSide::MinX, 0.0f, -1.0f, -1.0f, false},
    {IsoStep::HorizEdge, IsoRect::Wide, IsoSide::MinX, 1.0f},
    {IsoStep::Corner, IsoRect::Wide, IsoSide::MinX, 0.0f, -1.0f, -1.0f, true},
}};

template <typename U>
Rect<U> rect_with_size(const Rect<U>& rect, const Vector<KeyUnit>& size,
                       Conversion<KeyUnit, U> unit) {
    return Rect<U>(rect.min, rect.max + convert(size - Vector<KeyUnit>::splat(1.0f), unit));
}

template <typename U>
float side_value(const Rect<U>& rect, IsoSide side) {
    switch (side) {
        case IsoSide::MinX: return rect.min.x;
        case IsoSide::MaxX: return rect.max.x;
        case IsoSide::MaxY: return rect.max.y;
    }
    return 0.0f;
}

}  // namespace detail

// Normal key of the given size
template <typename U>
Path<U> top(const ProfileGeometry<U>& profile, const Vector<KeyUnit>& size,
            float tolerance = DEFAULT_TOLERANCE) {
    return to_path(profile.top_with_size(size), tolerance);
}

template <typename U>
Path<U> bottom(const ProfileGeometry<U>& profile, const Vector<KeyUnit>& size,
               float tolerance = DEFAULT_TOLERANCE) {
    return to_path(profile.bottom_with_size(size), tolerance);
}

// ISO enter outline from a 1x1 top or bottom template
template <typename U>
Path<U> iso(const RoundRect<U>& rect_template, Conversion<KeyUnit, U> unit,
            float tolerance = DEFAULT_TOLERANCE) {
    const Rect<U> wide = detail::rect_with_size(rect_template.rect(), {1.5f, 1.0f}, unit);
    const Rect<U> tall = detail::rect_with_size(rect_template.rect(), {1.25f, 2.0f}, unit)
        .translated(Vector<U>(unit.convert(Length<KeyUnit>(0.25f)), Length<U>(0.0f)));
    const Vector<U> r = rect_template.radii();

    PathBuilder<U> builder(tolerance);
    builder.abs_move(wide.min + Vector<U>(0.0f, r.y));

    for (const auto& step : detail::ISO_TRACE) {
        const Rect<U>& rect = step.rect == detail::IsoRect::Wide ? wide : tall;
        switch (step.kind) {
            case detail::IsoStep::HorizEdge:
                builder.abs_horiz_line(
                    Length<U>(detail::side_value(rect, step.side) + step.inset * r.x));
                break;
            case detail::IsoStep::VertEdge:
                builder.abs_vert_line(
                    Length<U>(detail::side_value(rect, step.side) + step.inset * r.y));
                break;
            case detail::IsoStep::Corner:
                builder.rel_arc(r, Angle::zero(), false, step.sweep,
                                Vector<U>(step.dx * r.x, step.dy * r.y));
                break;
        }
    }

    builder.close();
    return builder.build();
}

template <typename U>
Path<U> iso_top(const ProfileGeometry<U>& profile, float tolerance = DEFAULT_TOLERANCE) {
    return iso(profile.top, profile.unit, tolerance);
}

template <typename U>
Path<U> iso_bottom(const ProfileGeometry<U>& profile, float tolerance = DEFAULT_TOLERANCE) {
    return iso(profile.bottom, profile.unit, tolerance);
}

// Flared step on the right of a stepped caps-lock key. Drawn from a rect
// halfway between the top and bottom templates, spanning 1.25u to 1.75u
// measured from that rect's left edge
template <typename U>
Path<U> step(const ProfileGeometry<U>& profile, float tolerance = DEFAULT_TOLERANCE) {
    const RoundRect<U> mid = profile.top.lerp(profile.bottom, 0.5f);
    const Vector<U> r = mid.radii();
    const Rect<U> rect = Rect<U>::from_origin_and_size(
        Point<U>(profile.key_units(1.25f).value - mid.min().x, mid.min().y),
        Vector<U>(profile.key_units(0.5f), Length<U>(mid.height())));

    PathBuilder<U> builder(tolerance);
    builder.abs_move(rect.min + Vector<U>(0.0f, r.y));
    builder.rel_arc(r, Angle::zero(), false, false, -r);
    builder.abs_horiz_line(Length<U>(rect.max.x - r.x));
    builder.rel_arc(r, Angle::zero(), false, true, r);
    builder.abs_vert_line(Length<U>(rect.max.y - r.y));
    builder.rel_arc(r, Angle::zero(), false, true, r.neg_x());
    builder.abs_horiz_line(Length<U>(rect.min.x - r.x));
    builder.rel_arc(r, Angle::zero(), false, false, r.neg_y());
    builder.close();
    return builder.build();
}

template <typename U>
Path<U> homing_bar(const ProfileGeometry<U>& profile, float tolerance = DEFAULT_TOLERANCE) {
    Point<U> center = profile.top.center() + Vector<U>(Length<U>(0.0f), profile.bar_y_offset);
    return to_path(Rect<U>::from_center_and_size(center, profile.bar_size), tolerance);
}

template <typename U>
Path<U> homing_bump(const ProfileGeometry<U>& profile, float tolerance = DEFAULT_TOLERANCE) {
    Point<U> center = profile.top.center() + Vector<U>(Length<U>(0.0f), profile.bump_y_offset);
    return to_path(Circle<U>(center, profile.bump_diameter / 2.0f), tolerance);
}

// All paths for a key, bottom first
template <typename U>
std::vector<FeaturePath<U>> outline(const ProfileGeometry<U>& profile, const Shape& key_shape,
                                    float tolerance = DEFAULT_TOLERANCE) {
    std::vector<FeaturePath<U>> result;

    std::visit([&](auto&& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, shape::Normal>) {
            result.push_back({KeyFeature::Bottom, bottom(profile, arg.size, tolerance)});
            result.push_back({KeyFeature::Top, top(profile, arg.size, tolerance)});
        } else if constexpr (std::is_same_v<T, shape::SteppedCaps>) {
            result.push_back({KeyFeature::Bottom, bottom(profile, {1.75f, 1.0f}, tolerance)});
            result.push_back({KeyFeature::Top, top(profile, {1.25f, 1.0f}, tolerance)});
            result.push_back({KeyFeature::Step, step(profile, tolerance)});
        } else if constexpr (std::is_same_v<T, shape::IsoHorizontal> ||
                             std::is_same_v<T, shape::IsoVertical>) {
            result.push_back({KeyFeature::Bottom, iso_bottom(profile, tolerance)});
            result.push_back({KeyFeature::Top, iso_top(profile, tolerance)});
        } else if constexpr (std::is_same_v<T, shape::Homing>) {
            const Vector<KeyUnit> unit_size(1.0f, 1.0f);
            result.push_back({KeyFeature::Bottom, bottom(profile, unit_size, tolerance)});
            result.push_back({KeyFeature::Top, top(profile, unit_size, tolerance)});

            switch (arg.kind.value_or(profile.default_homing)) {
                case HomingKind::Scoop:
                    break;
                case HomingKind::Bar:
                    result.push_back({KeyFeature::Homing, homing_bar(profile, tolerance)});
                    break;
                case HomingKind::Bump:
                    result.push_back({KeyFeature::Homing, homing_bump(profile, tolerance)});
                    break;
            }
        }
    }, key_shape);

    return result;
}

}  // namespace key_outline
}  // namespace keyshape

#endif // KEYSHAPE_KEY_KEY_OUTLINE_HPP
