#include <iostream>
#include <string>

#include <cli/cli_common.hpp>
#include <common/logging.hpp>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Replays a track editing script and writes the resulting geometry.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  geometry <script.json> -o <out.json> [-c <config.json>] [-v]\n";
    std::cerr << "              Centreline samples, rails, supports and crossties\n";
    std::cerr << "  ride <script.json> -o <out.json> [--frames N] [-c <config.json>]\n";
    std::cerr << "              Rider poses sampled along the track\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  COASTERPATH_LOG_LEVEL - Set log level (trace, debug, info, warn, error)\n";
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

    if (command == "geometry") {
        return coasterpath::cli::command_geometry(argc, argv);
    } else if (command == "ride") {
        return coasterpath::cli::command_ride(argc, argv);
    }

    coasterpath::logging::get_logger()->error("Unknown command: {}", command);
    print_usage(argv[0]);
    return 1;
}
