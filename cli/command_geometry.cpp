#include "cli_common.hpp"
#include <geometry/track_geometry.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <serialization/track_json.hpp>
#include <serialization/geometry_json.hpp>
#include <common/logging.hpp>

namespace coasterpath::cli {

int command_geometry(int argc, char** argv) {
    auto log = coasterpath::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty() || ctx.output_path.empty()) {
            std::cerr << "Usage: coasterpath geometry <script.json> -o <geometry.json> [-c <config.json>] [-v]\n";
            std::cerr << "Options:\n";
            std::cerr << "  -c, --config <file>   Loop, curve and rail configuration\n";
            std::cerr << "  -v, --verbose         Debug logging\n";
            return 1;
        }
        if (ctx.verbose) {
            log->set_level(spdlog::level::debug);
        }

        log->info("Building track geometry from: {}", ctx.input_path);

        TrackConfig config = load_config(ctx);
        TrackState state = load_track(ctx, config);

        json::SerializedData data;
        data.step = "track_geometry";
        data.timestamp = json::get_timestamp();
        data.source_file = ctx.input_path;
        data.config = config;

        std::optional<TrackGeometry> geometry = TrackGeometry::from_state(state, config);
        if (!geometry) {
            // Fewer than two points: still write the track, just no geometry
            log->warn("Track has {} points, no geometry produced", state.points.size());
            data.data = {
                {"track", track_state_to_json(state)},
                {"geometry", nullptr}
            };
            data.stats = {{"point_count", state.points.size()}};
            json::write_serialized(ctx.output_path, data);
            std::cerr << "Wrote " << ctx.output_path << " (no geometry)\n";
            return 0;
        }

        data.data = {
            {"track", track_state_to_json(state)},
            {"geometry", track_geometry_to_json(*geometry)}
        };
        data.stats = {
            {"point_count", state.points.size()},
            {"sample_count", geometry->samples().size()},
            {"arc_length", geometry->arc_length()},
            {"support_count", geometry->rails().supports.size()},
            {"crosstie_count", geometry->rails().crossties.size()},
            {"max_curvature", geometry->curve().max_curvature()}
        };

        json::write_serialized(ctx.output_path, data);

        log->info("Wrote track geometry to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " ("
                  << state.points.size() << " points, "
                  << geometry->samples().size() << " samples, "
                  << "arc length: " << geometry->arc_length() << ")\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace coasterpath::cli
