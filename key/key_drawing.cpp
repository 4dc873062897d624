#include "key_drawing.hpp"
#include <common/logging.hpp>
#include <utility>

namespace keyshape {

KeyDrawing KeyDrawing::build(const Shape& shape, const Profile& profile,
                             const KeyStyle& style, const Point<KeyUnit>& origin) {
    auto features = key_outline::outline(profile.geometry(), shape, style.tolerance);

    KeyDrawing drawing;
    drawing.origin = origin;
    drawing.paths.reserve(features.size());

    for (auto& feature : features) {
        drawing.paths.push_back(KeyPath{
            feature.feature,
            std::move(feature.path),
            style.fill,
            Outline{style.outline, style.outline_width}
        });
    }

    logging::get_logger("key")->debug("Built key drawing with {} paths", drawing.paths.size());
    return drawing;
}

Rect<Dot> KeyDrawing::bounds() const {
    if (paths.empty()) {
        return Rect<Dot>::empty();
    }

    Rect<Dot> result = paths.front().path.bounds();
    for (const auto& key_path : paths) {
        result = result.union_with(key_path.path.bounds());
    }
    return result;
}

}  // namespace keyshape
