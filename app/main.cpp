#include <iostream>
#include <string>

#include "cli_common.hpp"
#include "logging.hpp"

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Generates keycap outlines as JSON paths.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  outline <shape>   Outline paths for one key\n";
    std::cerr << "  profile           Print the effective profile\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -c, --config      Profile JSON file (lengths in mm)\n";
    std::cerr << "  -o, --output      Output file (defaults to stdout)\n";
    std::cerr << "  -u, --unit        Output unit: dot, mm or in (default dot)\n";
    std::cerr << "  -t, --tolerance   Arc conversion tolerance in dots\n";
    std::cerr << "  -v, --verbose     Debug logging\n";
    std::cerr << "  -h, --help        Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Shapes:\n";
    std::cerr << "  1u, 2.25u, 2x1, stepped, iso-h, iso-v,\n";
    std::cerr << "  homing, homing-bar, homing-bump, homing-scoop\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  KEYSHAPE_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    if (command == "outline") {
        return keyshape::cli::command_outline(argc, argv);
    } else if (command == "profile") {
        return keyshape::cli::command_profile(argc, argv);
    }

    keyshape::logging::get_logger()->error("Unknown command: {}", command);
    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
