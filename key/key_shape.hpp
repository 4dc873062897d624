#ifndef KEYSHAPE_KEY_KEY_SHAPE_HPP
#define KEYSHAPE_KEY_KEY_SHAPE_HPP

#include <math/unit.hpp>
#include <math/vec2.hpp>
#include <optional>
#include <string>
#include <variant>

namespace keyshape {

// Tactile feature on a homing key
enum class HomingKind {
    Scoop,  // deeper dish, baked into the top surface
    Bar,
    Bump
};

inline const char* homing_kind_name(HomingKind kind) {
    switch (kind) {
        case HomingKind::Scoop: return "scoop";
        case HomingKind::Bar: return "bar";
        case HomingKind::Bump: return "bump";
    }
    return "unknown";
}

namespace shape {

// Regular rectangular key, size in key units (1x1, 2.25x1, ...)
struct Normal {
    Vector<KeyUnit> size{1.0f, 1.0f};
};

// 1.75u caps-lock key with a 1.25u top
struct SteppedCaps {};

// ISO enter drawn in a horizontal or vertical layout; both share one outline
struct IsoHorizontal {};
struct IsoVertical {};

// 1x1 key with a homing feature. No kind means the profile's default
struct Homing {
    std::optional<HomingKind> kind;
};

}  // namespace shape

using Shape = std::variant<
    shape::Normal,
    shape::SteppedCaps,
    shape::IsoHorizontal,
    shape::IsoVertical,
    shape::Homing
>;

}  // namespace keyshape

#endif // KEYSHAPE_KEY_KEY_SHAPE_HPP
