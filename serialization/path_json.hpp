#ifndef KEYSHAPE_SERIALIZATION_PATH_JSON_HPP
#define KEYSHAPE_SERIALIZATION_PATH_JSON_HPP

#include <nlohmann/json.hpp>
#include <geometry/rect.hpp>
#include <math/vec2.hpp>
#include <path/path.hpp>
#include <path/path_segment.hpp>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace keyshape {

// Point and Vector serialization, as [x, y]
template <typename U>
void to_json(nlohmann::json& j, const Point<U>& p) {
    j = nlohmann::json::array({p.x, p.y});
}

template <typename U>
void from_json(const nlohmann::json& j, Point<U>& p) {
    p.x = j.at(0).get<float>();
    p.y = j.at(1).get<float>();
}

template <typename U>
void to_json(nlohmann::json& j, const Vector<U>& v) {
    j = nlohmann::json::array({v.x, v.y});
}

template <typename U>
void from_json(const nlohmann::json& j, Vector<U>& v) {
    v.x = j.at(0).get<float>();
    v.y = j.at(1).get<float>();
}

// Rect serialization, as [min, max]
template <typename U>
void to_json(nlohmann::json& j, const Rect<U>& rect) {
    j = nlohmann::json::array({rect.min, rect.max});
}

template <typename U>
void from_json(const nlohmann::json& j, Rect<U>& rect) {
    rect.min = j.at(0).get<Point<U>>();
    rect.max = j.at(1).get<Point<U>>();
}

namespace json {

template <typename U>
nlohmann::json segment_to_json(const PathSegment<U>& seg) {
    return std::visit([](auto&& arg) -> nlohmann::json {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, segment::Move<U>>) {
            return {{"type", "move"}, {"point", arg.point}};
        } else if constexpr (std::is_same_v<T, segment::Line<U>>) {
            return {{"type", "line"}, {"end", arg.end}};
        } else if constexpr (std::is_same_v<T, segment::CubicBezier<U>>) {
            return {{"type", "cubic"}, {"ctrl1", arg.ctrl1}, {"ctrl2", arg.ctrl2},
                    {"end", arg.end}};
        } else if constexpr (std::is_same_v<T, segment::QuadraticBezier<U>>) {
            return {{"type", "quadratic"}, {"ctrl", arg.ctrl}, {"end", arg.end}};
        } else {
            return {{"type", "close"}};
        }
    }, seg);
}

template <typename U>
PathSegment<U> segment_from_json(const nlohmann::json& j) {
    std::string type = j.at("type").get<std::string>();
    if (type == "move") {
        return segment::Move<U>{j.at("point").get<Point<U>>()};
    } else if (type == "line") {
        return segment::Line<U>{j.at("end").get<Vector<U>>()};
    } else if (type == "cubic") {
        return segment::CubicBezier<U>{j.at("ctrl1").get<Vector<U>>(),
                                       j.at("ctrl2").get<Vector<U>>(),
                                       j.at("end").get<Vector<U>>()};
    } else if (type == "quadratic") {
        return segment::QuadraticBezier<U>{j.at("ctrl").get<Vector<U>>(),
                                           j.at("end").get<Vector<U>>()};
    } else if (type == "close") {
        return segment::Close{};
    }
    throw std::runtime_error("Unknown path segment type: " + type);
}

template <typename U>
nlohmann::json path_to_json(const Path<U>& path) {
    nlohmann::json segments = nlohmann::json::array();
    for (const auto& seg : path) {
        segments.push_back(segment_to_json(seg));
    }
    return {{"bounds", path.bounds()}, {"segments", segments}};
}

// Bounds are taken from the file, not recomputed
template <typename U>
Path<U> path_from_json(const nlohmann::json& j) {
    std::vector<PathSegment<U>> segments;
    for (const auto& seg : j.at("segments")) {
        segments.push_back(segment_from_json<U>(seg));
    }
    return Path<U>(std::move(segments), j.at("bounds").get<Rect<U>>());
}

}  // namespace json
}  // namespace keyshape

#endif // KEYSHAPE_SERIALIZATION_PATH_JSON_HPP
