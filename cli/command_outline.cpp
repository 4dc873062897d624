#include "cli_common.hpp"
#include <key/key_drawing.hpp>
#include <path/path.hpp>
#include <profile/profile.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/output_json.hpp>
#include <serialization/profile_json.hpp>
#include <common/logging.hpp>
#include <iostream>

namespace keyshape::cli {

int command_outline(int argc, char** argv) {
    auto log = keyshape::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty()) {
            std::cerr << "Usage: keyshape outline <shape> [-c profile.json] [-o out.json]"
                      << " [--unit dot|mm|in] [--tolerance T] [-v]\n";
            std::cerr << "Shapes: 1u, <w>u, <w>x<h>, stepped, iso-h, iso-v, homing,"
                      << " homing-bar, homing-bump, homing-scoop\n";
            return 1;
        }

        if (ctx.verbose) {
            keyshape::logging::set_level(spdlog::level::debug);
        }

        Profile profile;
        if (ctx.config_path) {
            log->info("Loading profile from: {}", *ctx.config_path);
            profile = json::load_profile(*ctx.config_path);
        }

        Shape shape = parse_shape(ctx.input_path);

        KeyStyle style;
        if (ctx.tolerance) {
            if (!(*ctx.tolerance > 0.0f)) {
                throw std::runtime_error("Tolerance must be positive");
            }
            style.tolerance = *ctx.tolerance;
        }

        KeyDrawing drawing = KeyDrawing::build(shape, profile, style);
        log->debug("Generated {} paths for {}", drawing.paths.size(), ctx.input_path);

        std::string unit = ctx.unit.value_or("dot");
        nlohmann::json output;
        if (unit == "dot") {
            output = json::drawing_to_json(drawing, Conversion<Dot, Dot>(1.0f));
        } else if (unit == "mm") {
            output = json::drawing_to_json(drawing, DOT_PER_MM.inverse());
        } else if (unit == "in") {
            output = json::drawing_to_json(drawing, DOT_PER_INCH.inverse());
        } else {
            throw std::runtime_error("Unknown unit: " + unit + " (expected dot, mm or in)");
        }
        output["shape"] = ctx.input_path;
        output["unit"] = unit;

        json::OutputDocument doc =
            json::outline_document(drawing, profile, ctx.config_path.value_or(""));
        doc.generated_at = json::utc_timestamp();
        doc.data = output;

        if (ctx.output_path.empty()) {
            std::cout << doc.to_json().dump(2) << "\n";
        } else {
            json::write_json_file(ctx.output_path, doc.to_json());
            log->info("Wrote outline to {}", ctx.output_path);
            std::cerr << "Wrote " << ctx.output_path << " ("
                      << drawing.paths.size() << " paths)\n";
        }

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace keyshape::cli
