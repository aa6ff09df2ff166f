#ifndef COASTERPATH_CLI_COMMON_HPP
#define COASTERPATH_CLI_COMMON_HPP

#include <track/track_config.hpp>
#include <track/track_state.hpp>
#include <string>
#include <optional>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace coasterpath::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    bool verbose = false;
    int frames = 100;   // ride only
};

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 < argc) {
                ctx.output_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-o/--output requires an argument");
            }
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                ctx.config_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-c/--config requires an argument");
            }
        } else if (arg == "--frames") {
            if (i + 1 < argc) {
                ctx.frames = std::stoi(argv[++i]);
                ++i;
            } else {
                throw std::runtime_error("--frames requires an argument");
            }
            if (ctx.frames < 1) {
                throw std::runtime_error("--frames must be at least 1");
            }
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

// Defaults, overridden section by section by the -c file
TrackConfig load_config(const CommandContext& ctx);

// Read a command script and fold it over an empty track
TrackState load_track(const CommandContext& ctx, const TrackConfig& config);

// Command function declarations
int command_geometry(int argc, char** argv);
int command_ride(int argc, char** argv);

}  // namespace coasterpath::cli

#endif // COASTERPATH_CLI_COMMON_HPP
