#include "cli_common.hpp"
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <serialization/track_json.hpp>
#include <common/logging.hpp>

namespace coasterpath::cli {

TrackConfig load_config(const CommandContext& ctx) {
    auto log = coasterpath::logging::get_logger();

    if (!ctx.config_path.has_value()) {
        return TrackConfig{};
    }

    TrackConfig config = json::read_json_file(ctx.config_path.value()).get<TrackConfig>();
    log->info("Loaded configuration from: {}", ctx.config_path.value());
    return config;
}

TrackState load_track(const CommandContext& ctx, const TrackConfig& config) {
    auto log = coasterpath::logging::get_logger();

    std::vector<TrackCommand> commands = command_script_from_json(
        json::read_json_file(ctx.input_path));
    log->debug("Parsed {} commands from {}", commands.size(), ctx.input_path);

    return replay(commands, config);
}

}  // namespace coasterpath::cli
