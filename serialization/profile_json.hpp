#ifndef KEYSHAPE_SERIALIZATION_PROFILE_JSON_HPP
#define KEYSHAPE_SERIALIZATION_PROFILE_JSON_HPP

#include "json_serialization.hpp"
#include <nlohmann/json.hpp>
#include <common/logging.hpp>
#include <profile/profile.hpp>
#include <key/key_shape.hpp>
#include <stdexcept>
#include <string>

namespace keyshape {

// Profile files give every length in millimetres. Surfaces are converted to
// drawing units on load and back on save.

inline ProfileType parse_profile_type(const std::string& name) {
    if (name == "cylindrical") return ProfileType::Cylindrical;
    if (name == "spherical") return ProfileType::Spherical;
    if (name == "flat") return ProfileType::Flat;
    throw std::runtime_error("Unknown profile type: " + name);
}

// Accepts the common alternative names for each kind
inline HomingKind parse_homing_kind(const std::string& name) {
    if (name == "scoop" || name == "deep-dish" || name == "dish") return HomingKind::Scoop;
    if (name == "bar" || name == "line") return HomingKind::Bar;
    if (name == "bump" || name == "nub" || name == "dot" || name == "nipple") return HomingKind::Bump;
    throw std::runtime_error("Unknown homing type: " + name);
}

namespace detail {

inline float dot_to_mm(float dots) {
    return convert(Length<Dot>(dots), DOT_PER_MM.inverse()).value;
}

inline float mm_to_dot(float mm) {
    return convert(Length<Mm>(mm), DOT_PER_MM).value;
}

}  // namespace detail

// TopSurface serialization
inline void to_json(nlohmann::json& j, const TopSurface& top) {
    j = {
        {"width", detail::dot_to_mm(top.size.x)},
        {"height", detail::dot_to_mm(top.size.y)},
        {"radius", detail::dot_to_mm(top.radius.value)},
        {"y-offset", detail::dot_to_mm(top.y_offset.value)}
    };
}

inline void from_json(const nlohmann::json& j, TopSurface& top) {
    TopSurface defaults;
    top.size.x = detail::mm_to_dot(j.value("width", detail::dot_to_mm(defaults.size.x)));
    top.size.y = detail::mm_to_dot(j.value("height", detail::dot_to_mm(defaults.size.y)));
    top.radius.value = detail::mm_to_dot(j.value("radius", detail::dot_to_mm(defaults.radius.value)));
    top.y_offset.value = detail::mm_to_dot(
        j.value("y-offset", detail::dot_to_mm(defaults.y_offset.value)));
}

// BottomSurface serialization
inline void to_json(nlohmann::json& j, const BottomSurface& bottom) {
    j = {
        {"width", detail::dot_to_mm(bottom.size.x)},
        {"height", detail::dot_to_mm(bottom.size.y)},
        {"radius", detail::dot_to_mm(bottom.radius.value)}
    };
}

inline void from_json(const nlohmann::json& j, BottomSurface& bottom) {
    BottomSurface defaults;
    bottom.size.x = detail::mm_to_dot(j.value("width", detail::dot_to_mm(defaults.size.x)));
    bottom.size.y = detail::mm_to_dot(j.value("height", detail::dot_to_mm(defaults.size.y)));
    bottom.radius.value = detail::mm_to_dot(
        j.value("radius", detail::dot_to_mm(defaults.radius.value)));
}

// HomingProps serialization
inline void to_json(nlohmann::json& j, const HomingProps& homing) {
    j = {
        {"default", homing_kind_name(homing.default_kind)},
        {"scoop", {{"depth", homing.scoop.depth.value}}},
        {"bar", {
            {"width", homing.bar.size.x},
            {"height", homing.bar.size.y},
            {"y-offset", homing.bar.y_offset.value}
        }},
        {"bump", {
            {"diameter", homing.bump.diameter.value},
            {"y-offset", homing.bump.y_offset.value}
        }}
    };
}

inline void from_json(const nlohmann::json& j, HomingProps& homing) {
    HomingProps defaults;
    homing.default_kind = j.contains("default")
        ? parse_homing_kind(j["default"].get<std::string>())
        : defaults.default_kind;

    homing.scoop = defaults.scoop;
    if (j.contains("scoop")) {
        const auto& scoop = j["scoop"];
        homing.scoop.depth.value = scoop.value("depth", defaults.scoop.depth.value);
    }

    homing.bar = defaults.bar;
    if (j.contains("bar")) {
        const auto& bar = j["bar"];
        homing.bar.size.x = bar.value("width", defaults.bar.size.x);
        homing.bar.size.y = bar.value("height", defaults.bar.size.y);
        homing.bar.y_offset.value = bar.value("y-offset", defaults.bar.y_offset.value);
    }

    homing.bump = defaults.bump;
    if (j.contains("bump")) {
        const auto& bump = j["bump"];
        homing.bump.diameter.value = bump.value("diameter", defaults.bump.diameter.value);
        homing.bump.y_offset.value = bump.value("y-offset", defaults.bump.y_offset.value);
    }
}

// Profile serialization
inline void to_json(nlohmann::json& j, const Profile& profile) {
    j = {
        {"type", profile_type_name(profile.type)},
        {"depth", profile.depth},
        {"bottom", profile.bottom},
        {"top", profile.top},
        {"homing", profile.homing}
    };
}

inline void from_json(const nlohmann::json& j, Profile& profile) {
    Profile defaults;
    profile.type = j.contains("type")
        ? parse_profile_type(j["type"].get<std::string>())
        : defaults.type;
    profile.depth = j.value("depth", defaults.depth);
    profile.bottom = j.contains("bottom") ? j["bottom"].get<BottomSurface>() : defaults.bottom;
    profile.top = j.contains("top") ? j["top"].get<TopSurface>() : defaults.top;
    profile.homing = j.contains("homing") ? j["homing"].get<HomingProps>() : defaults.homing;
}

namespace json {

// Read and validate a profile. source names the input in error messages
inline Profile profile_from_json(const nlohmann::json& j, const std::string& source) {
    Profile profile;
    try {
        profile = j.get<Profile>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid profile in " + source + ": " + e.what());
    }
    profile.validate();
    return profile;
}

inline Profile parse_profile(const std::string& text, const std::string& source) {
    return profile_from_json(parse_json(text, source), source);
}

inline Profile load_profile(const std::string& path) {
    logging::get_logger("profile")->debug("Loading profile from {}", path);
    return profile_from_json(read_json_file(path), path);
}

}  // namespace json
}  // namespace keyshape

#endif // KEYSHAPE_SERIALIZATION_PROFILE_JSON_HPP
