#include "profile.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace keyshape {

namespace {

const Point<Dot> KEY_CENTER = convert(Point<KeyUnit>(0.5f, 0.5f), DOT_PER_UNIT);

void check_length(float value, const std::string& field) {
    if (!std::isfinite(value) || value < 0.0f) {
        throw std::runtime_error("Invalid profile: " + field +
                                 " must be a non-negative number, got " + std::to_string(value));
    }
}

void check_offset(float value, const std::string& field) {
    if (!std::isfinite(value)) {
        throw std::runtime_error("Invalid profile: " + field + " must be finite");
    }
}

}  // namespace

Rect<Dot> TopSurface::rect() const {
    return Rect<Dot>::from_center_and_size(KEY_CENTER + Vector<Dot>(0.0f, y_offset.value), size);
}

RoundRect<Dot> TopSurface::round_rect() const {
    return RoundRect<Dot>(rect(), Vector<Dot>(radius, radius));
}

Rect<Dot> BottomSurface::rect() const {
    return Rect<Dot>::from_center_and_size(KEY_CENTER, size);
}

RoundRect<Dot> BottomSurface::round_rect() const {
    return RoundRect<Dot>(rect(), Vector<Dot>(radius, radius));
}

float Profile::surface_depth() const {
    return type == ProfileType::Flat ? 0.0f : depth;
}

RoundRect<Dot> Profile::top_with_size(const Vector<KeyUnit>& size) const {
    return geometry().top_with_size(size);
}

RoundRect<Dot> Profile::bottom_with_size(const Vector<KeyUnit>& size) const {
    return geometry().bottom_with_size(size);
}

void Profile::validate() const {
    if (type != ProfileType::Flat) {
        check_length(depth, "depth");
    }

    check_length(bottom.size.x, "bottom.width");
    check_length(bottom.size.y, "bottom.height");
    check_length(bottom.radius.value, "bottom.radius");

    check_length(top.size.x, "top.width");
    check_length(top.size.y, "top.height");
    check_length(top.radius.value, "top.radius");
    check_offset(top.y_offset.value, "top.y-offset");

    check_length(homing.scoop.depth.value, "homing.scoop.depth");
    check_length(homing.bar.size.x, "homing.bar.width");
    check_length(homing.bar.size.y, "homing.bar.height");
    check_offset(homing.bar.y_offset.value, "homing.bar.y-offset");
    check_length(homing.bump.diameter.value, "homing.bump.diameter");
    check_offset(homing.bump.y_offset.value, "homing.bump.y-offset");
}

ProfileGeometry<Dot> Profile::geometry() const {
    ProfileGeometry<Dot> result;
    result.top = top.round_rect();
    result.bottom = bottom.round_rect();
    result.unit = DOT_PER_UNIT;
    result.bar_size = convert(homing.bar.size, DOT_PER_MM);
    result.bar_y_offset = convert(homing.bar.y_offset, DOT_PER_MM);
    result.bump_diameter = convert(homing.bump.diameter, DOT_PER_MM);
    result.bump_y_offset = convert(homing.bump.y_offset, DOT_PER_MM);
    result.default_homing = homing.default_kind;
    return result;
}

}  // namespace keyshape
