#ifndef COASTERPATH_TRACK_TRACK_STATE_HPP
#define COASTERPATH_TRACK_TRACK_STATE_HPP

#include <track/waypoint_sequence.hpp>
#include <track/track_config.hpp>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace coasterpath {

enum class CoasterMode {
    Build,
    Ride,
    Preview
};

// Everything the editor and the ride share. A plain value: every
// transition below takes a state and returns the next one.
struct TrackState {
    WaypointSequence points;
    std::optional<PointId> selected_point;
    CoasterMode mode = CoasterMode::Build;
    float ride_progress = 0.0f;     // [0, 1], written by the playback driver
    bool is_riding = false;
    float ride_speed = 1.0f;
    bool is_looped = false;         // Curve wraps from the last point to the first
};

// Command types namespace
namespace command {

struct AddPoint { Vec3 position; };
struct UpdatePoint { PointId id; Vec3 position; };
struct UpdateTilt { PointId id; float tilt = 0.0f; };
struct RemovePoint { PointId id; };
struct CreateLoop { PointId id; };
struct SelectPoint { std::optional<PointId> id; };
struct ClearTrack {};
struct SetLooped { bool looped = false; };
struct SetMode { CoasterMode mode = CoasterMode::Build; };
struct StartRide {};
struct StopRide {};
struct SetRideProgress { float progress = 0.0f; };
struct SetRideSpeed { float speed = 1.0f; };

}  // namespace command

using TrackCommand = std::variant<
    command::AddPoint, command::UpdatePoint, command::UpdateTilt,
    command::RemovePoint, command::CreateLoop, command::SelectPoint,
    command::ClearTrack, command::SetLooped, command::SetMode,
    command::StartRide, command::StopRide,
    command::SetRideProgress, command::SetRideSpeed
>;

// Name used in logs and command scripts ("add", "loop", ...)
std::string_view command_name(const TrackCommand& cmd);

// === Transitions ===
// Unknown ids leave the state unchanged.

TrackState add_track_point(TrackState state, const Vec3& position);
TrackState update_track_point(TrackState state, const PointId& id, const Vec3& position);
TrackState update_track_point_tilt(TrackState state, const PointId& id, float tilt);

// Also clears the selection when it pointed at `id`
TrackState remove_track_point(TrackState state, const PointId& id);

// Splices a loop in at `id`; a selection replaced by the splice is cleared
TrackState create_loop_at_point(TrackState state, const PointId& id, const LoopConfig& config);

TrackState select_point(TrackState state, const std::optional<PointId>& id);

// Empties the track, clears the selection and resets playback
TrackState clear_track(TrackState state);

TrackState set_looped(TrackState state, bool looped);
TrackState set_mode(TrackState state, CoasterMode mode);

// Needs at least two points; otherwise the state is returned unchanged
TrackState start_ride(TrackState state);
TrackState stop_ride(TrackState state);

TrackState set_ride_progress(TrackState state, float progress);
TrackState set_ride_speed(TrackState state, float speed);

TrackState apply(TrackState state, const TrackCommand& cmd, const TrackConfig& config);

// Apply commands in order, starting from `initial`
TrackState replay(const std::vector<TrackCommand>& commands,
                  const TrackConfig& config,
                  TrackState initial = TrackState{});

}  // namespace coasterpath

#endif // COASTERPATH_TRACK_TRACK_STATE_HPP
