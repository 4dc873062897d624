#ifndef KEYSHAPE_CLI_COMMON_HPP
#define KEYSHAPE_CLI_COMMON_HPP

#include <key/key_shape.hpp>
#include <math/vec2.hpp>
#include <cmath>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace keyshape::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;  // first positional argument
    std::string output_path;
    std::optional<std::string> config_path;
    std::optional<std::string> unit;
    std::optional<float> tolerance;
    bool verbose = false;
};

inline float parse_float(const std::string& text, const std::string& what) {
    size_t consumed = 0;
    float value = 0.0f;
    try {
        value = std::stof(text, &consumed);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid " + what + ": " + text);
    }
    if (consumed != text.size() || !std::isfinite(value)) {
        throw std::runtime_error("Invalid " + what + ": " + text);
    }
    return value;
}

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    auto require_value = [&](const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(flag + " requires an argument");
        }
        i += 2;
        return argv[i - 1];
    };

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = require_value("-o/--output");
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = require_value("-c/--config");
        } else if (arg == "-u" || arg == "--unit") {
            ctx.unit = require_value("-u/--unit");
        } else if (arg == "-t" || arg == "--tolerance") {
            ctx.tolerance = parse_float(require_value("-t/--tolerance"), "tolerance");
        } else if (arg == "-h" || arg == "--help") {
            // Handled by caller
            ++i;
        } else if (arg[0] != '-') {
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return {ctx, i};
}

// Key shape from its command-line name: 1u, 2.25u, 2.25x1, stepped, iso-h,
// iso-v, homing, homing-bar, homing-bump or homing-scoop
inline Shape parse_shape(const std::string& name) {
    if (name == "stepped") return shape::SteppedCaps{};
    if (name == "iso-h") return shape::IsoHorizontal{};
    if (name == "iso-v") return shape::IsoVertical{};
    if (name == "homing") return shape::Homing{};
    if (name == "homing-scoop") return shape::Homing{HomingKind::Scoop};
    if (name == "homing-bar") return shape::Homing{HomingKind::Bar};
    if (name == "homing-bump") return shape::Homing{HomingKind::Bump};

    Vector<KeyUnit> size(1.0f, 1.0f);
    size_t x_pos = name.find('x');
    if (x_pos != std::string::npos) {
        size.x = parse_float(name.substr(0, x_pos), "key shape");
        size.y = parse_float(name.substr(x_pos + 1), "key shape");
    } else if (!name.empty() && name.back() == 'u') {
        size.x = parse_float(name.substr(0, name.size() - 1), "key shape");
    } else {
        throw std::runtime_error("Invalid key shape: " + name);
    }

    if (!(size.x >= 1.0f && size.y >= 1.0f)) {
        throw std::runtime_error("Invalid key shape: " + name + " (sizes start at 1u)");
    }
    return shape::Normal{size};
}

// Command function declarations
int command_outline(int argc, char** argv);
int command_profile(int argc, char** argv);

}  // namespace keyshape::cli

#endif // KEYSHAPE_CLI_COMMON_HPP
