#include "cli_common.hpp"
#include <profile/profile.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/output_json.hpp>
#include <serialization/profile_json.hpp>
#include <common/logging.hpp>
#include <iostream>

namespace keyshape::cli {

int command_profile(int argc, char** argv) {
    auto log = keyshape::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.verbose) {
            keyshape::logging::set_level(spdlog::level::debug);
        }

        Profile profile;
        if (ctx.config_path) {
            log->info("Loading profile from: {}", *ctx.config_path);
            profile = json::load_profile(*ctx.config_path);
        } else {
            log->debug("No profile given, using the built-in default");
        }

        json::OutputDocument doc = json::profile_document(profile, ctx.config_path.value_or(""));
        doc.generated_at = json::utc_timestamp();

        if (ctx.output_path.empty()) {
            std::cout << doc.to_json().dump(2) << "\n";
        } else {
            json::write_json_file(ctx.output_path, doc.to_json());
            log->info("Wrote profile to {}", ctx.output_path);
            std::cerr << "Wrote " << ctx.output_path << "\n";
        }

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace keyshape::cli
