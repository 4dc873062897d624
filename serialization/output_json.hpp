#ifndef KEYSHAPE_SERIALIZATION_OUTPUT_JSON_HPP
#define KEYSHAPE_SERIALIZATION_OUTPUT_JSON_HPP

#include "path_json.hpp"
#include "profile_json.hpp"
#include <nlohmann/json.hpp>
#include <key/key_drawing.hpp>
#include <profile/profile.hpp>
#include <chrono>
#include <cstddef>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace keyshape {

inline void to_json(nlohmann::json& j, const Rgb& color) {
    j = nlohmann::json::array({color.r, color.g, color.b});
}

namespace json {

constexpr const char* OUTPUT_FORMAT = "keyshape";
constexpr const char* OUTPUT_VERSION = "0.1.0";

struct OutlineStats {
    size_t path_count = 0;
    size_t segment_count = 0;
    Rect<Dot> bounds;
};

inline OutlineStats outline_stats(const KeyDrawing& drawing) {
    OutlineStats stats;
    stats.path_count = drawing.paths.size();
    for (const auto& key_path : drawing.paths) {
        stats.segment_count += key_path.path.size();
    }
    stats.bounds = drawing.bounds();
    return stats;
}

inline void to_json(nlohmann::json& j, const OutlineStats& stats) {
    j = nlohmann::json{
        {"paths", stats.path_count},
        {"segments", stats.segment_count},
        {"bounds", stats.bounds}
    };
}

// Derived 1x1 templates, in dots
struct ProfileStats {
    Rect<Dot> top;
    Rect<Dot> bottom;
    float surface_depth = 0.0f;
};

inline ProfileStats profile_stats(const Profile& profile) {
    ProfileGeometry<Dot> geometry = profile.geometry();
    return {geometry.top.rect(), geometry.bottom.rect(), profile.surface_depth()};
}

inline void to_json(nlohmann::json& j, const ProfileStats& stats) {
    j = nlohmann::json{
        {"top", stats.top},
        {"bottom", stats.bottom},
        {"surface_depth", stats.surface_depth}
    };
}

// Key paths converted to the output unit U, bottom first
template <typename U>
nlohmann::json drawing_to_json(const KeyDrawing& drawing, Conversion<Dot, U> conversion) {
    nlohmann::json paths = nlohmann::json::array();
    for (const auto& key_path : drawing.paths) {
        nlohmann::json j;
        j["feature"] = key_feature_name(key_path.feature);
        j["path"] = path_to_json(convert(key_path.path, conversion));
        if (key_path.fill) {
            j["fill"] = *key_path.fill;
        }
        if (key_path.outline) {
            j["outline"] = {
                {"color", key_path.outline->color},
                {"width", convert(key_path.outline->width, conversion).value}
            };
        }
        paths.push_back(j);
    }
    return {
        {"bounds", convert(drawing.bounds(), conversion)},
        {"paths", paths}
    };
}

// UTC time as 2024-01-31T12:00:00Z
inline std::string utc_timestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&now), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Document printed or written by each command. The profile in effect is
// always embedded so an outline can be regenerated from its own output
struct OutputDocument {
    std::string command;
    std::string profile_source;  // empty for the built-in profile
    std::string generated_at;
    Profile profile;
    nlohmann::json stats;
    nlohmann::json data;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["format"] = OUTPUT_FORMAT;
        j["version"] = OUTPUT_VERSION;
        j["command"] = command;
        if (!generated_at.empty()) j["generated_at"] = generated_at;
        j["profile"] = {
            {"source", profile_source.empty() ? "built-in" : profile_source},
            {"values", profile}
        };
        if (!stats.is_null()) j["stats"] = stats;
        j["data"] = data;
        return j;
    }
};

inline OutputDocument outline_document(const KeyDrawing& drawing, const Profile& profile,
                                       const std::string& profile_source) {
    OutputDocument doc;
    doc.command = "outline";
    doc.profile_source = profile_source;
    doc.profile = profile;
    doc.stats = outline_stats(drawing);
    return doc;
}

inline OutputDocument profile_document(const Profile& profile,
                                       const std::string& profile_source) {
    OutputDocument doc;
    doc.command = "profile";
    doc.profile_source = profile_source;
    doc.profile = profile;
    doc.stats = profile_stats(profile);
    doc.data = profile;
    return doc;
}

}  // namespace json
}  // namespace keyshape

#endif // KEYSHAPE_SERIALIZATION_OUTPUT_JSON_HPP
