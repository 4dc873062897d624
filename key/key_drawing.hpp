#ifndef KEYSHAPE_KEY_KEY_DRAWING_HPP
#define KEYSHAPE_KEY_KEY_DRAWING_HPP

#include "key_outline.hpp"
#include "key_shape.hpp"
#include <path/path.hpp>
#include <profile/profile.hpp>
#include <optional>
#include <vector>

namespace keyshape {

// Linear RGB, each channel in [0, 1]
struct Rgb {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;

    bool operator==(const Rgb& other) const = default;
};

struct Outline {
    Rgb color;
    Length<Dot> width;
};

// Colours applied to every path of a key
struct KeyStyle {
    Rgb fill{0.8f, 0.8f, 0.8f};
    Rgb outline{0.7f, 0.7f, 0.7f};
    Length<Dot> outline_width{10.0f};
    float tolerance = DEFAULT_TOLERANCE;
};

struct KeyPath {
    KeyFeature feature;
    Path<Dot> path;
    std::optional<Rgb> fill;
    std::optional<Outline> outline;
};

// Drawable paths for one key, bottom first
struct KeyDrawing {
    Point<KeyUnit> origin;
    std::vector<KeyPath> paths;

    static KeyDrawing build(const Shape& shape, const Profile& profile,
                            const KeyStyle& style = {},
                            const Point<KeyUnit>& origin = Point<KeyUnit>::origin());

    // Union of all path bounds; empty rect if there are no paths
    Rect<Dot> bounds() const;
};

}  // namespace keyshape

#endif // KEYSHAPE_KEY_KEY_DRAWING_HPP
