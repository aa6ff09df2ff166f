#include "cli_common.hpp"
#include <geometry/track_curve.hpp>
#include <geometry/ride_sampler.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <serialization/geometry_json.hpp>
#include <common/logging.hpp>

namespace coasterpath::cli {

int command_ride(int argc, char** argv) {
    auto log = coasterpath::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty() || ctx.output_path.empty()) {
            std::cerr << "Usage: coasterpath ride <script.json> -o <ride.json> [--frames N] [-c <config.json>]\n";
            return 1;
        }
        if (ctx.verbose) {
            log->set_level(spdlog::level::debug);
        }

        log->info("Sampling ride from: {}", ctx.input_path);

        TrackConfig config = load_config(ctx);
        TrackState state = load_track(ctx, config);

        std::optional<TrackCurve> curve = get_track_curve(state.points, state.is_looped, config.curve);
        if (!curve) {
            log->error("Track needs at least 2 points to ride, has {}", state.points.size());
            std::cerr << "Error: track needs at least 2 points\n";
            return 1;
        }

        std::vector<RideFrame> frames = ride_frames(*curve, ctx.frames,
                                                    config.rails.min_normal_length);

        json::SerializedData data;
        data.step = "ride_frames";
        data.timestamp = json::get_timestamp();
        data.source_file = ctx.input_path;
        data.config = config;
        data.data = {
            {"closed", curve->closed()},
            {"ride_speed", state.ride_speed},
            {"frames", frames}
        };
        data.stats = {
            {"point_count", state.points.size()},
            {"frame_count", frames.size()},
            {"arc_length", curve->arc_length()}
        };

        json::write_serialized(ctx.output_path, data);

        log->info("Wrote ride frames to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " ("
                  << frames.size() << " frames)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace coasterpath::cli
