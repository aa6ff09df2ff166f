#include "track_state.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <type_traits>

namespace coasterpath {

std::string_view command_name(const TrackCommand& cmd) {
    return std::visit([](const auto& c) -> std::string_view {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, command::AddPoint>) {
            return "add";
        } else if constexpr (std::is_same_v<T, command::UpdatePoint>) {
            return "update";
        } else if constexpr (std::is_same_v<T, command::UpdateTilt>) {
            return "tilt";
        } else if constexpr (std::is_same_v<T, command::RemovePoint>) {
            return "remove";
        } else if constexpr (std::is_same_v<T, command::CreateLoop>) {
            return "loop";
        } else if constexpr (std::is_same_v<T, command::SelectPoint>) {
            return "select";
        } else if constexpr (std::is_same_v<T, command::ClearTrack>) {
            return "clear";
        } else if constexpr (std::is_same_v<T, command::SetLooped>) {
            return "set_looped";
        } else if constexpr (std::is_same_v<T, command::SetMode>) {
            return "set_mode";
        } else if constexpr (std::is_same_v<T, command::StartRide>) {
            return "start_ride";
        } else if constexpr (std::is_same_v<T, command::StopRide>) {
            return "stop_ride";
        } else if constexpr (std::is_same_v<T, command::SetRideProgress>) {
            return "ride_progress";
        } else {
            static_assert(std::is_same_v<T, command::SetRideSpeed>);
            return "ride_speed";
        }
    }, cmd);
}

TrackState add_track_point(TrackState state, const Vec3& position) {
    state.points.add(position);
    return state;
}

TrackState update_track_point(TrackState state, const PointId& id, const Vec3& position) {
    state.points.update(id, position);
    return state;
}

TrackState update_track_point_tilt(TrackState state, const PointId& id, float tilt) {
    state.points.update_tilt(id, tilt);
    return state;
}

TrackState remove_track_point(TrackState state, const PointId& id) {
    if (state.points.remove(id) && state.selected_point == id) {
        state.selected_point.reset();
    }
    return state;
}

TrackState create_loop_at_point(TrackState state, const PointId& id, const LoopConfig& config) {
    LoopSynthesis synthesis = synthesize_loop(state.points, id, config);
    if (!synthesis.applied()) {
        return state;
    }

    state.points = std::move(synthesis.sequence);

    // The skip window may have replaced the selected point
    if (state.selected_point && !state.points.find_index(*state.selected_point)) {
        state.selected_point.reset();
    }
    return state;
}

TrackState select_point(TrackState state, const std::optional<PointId>& id) {
    if (id && !state.points.find_index(*id)) {
        logging::get_logger()->trace("select: unknown point {}", *id);
        return state;
    }
    state.selected_point = id;
    return state;
}

TrackState clear_track(TrackState state) {
    state.points.clear();
    state.selected_point.reset();
    state.ride_progress = 0.0f;
    state.is_riding = false;
    return state;
}

TrackState set_looped(TrackState state, bool looped) {
    state.is_looped = looped;
    return state;
}

TrackState set_mode(TrackState state, CoasterMode mode) {
    state.mode = mode;
    return state;
}

TrackState start_ride(TrackState state) {
    if (state.points.size() < 2) {
        logging::get_logger()->debug("start_ride: need at least 2 points, have {}",
                                     state.points.size());
        return state;
    }
    state.mode = CoasterMode::Ride;
    state.is_riding = true;
    state.ride_progress = 0.0f;
    return state;
}

TrackState stop_ride(TrackState state) {
    state.mode = CoasterMode::Build;
    state.is_riding = false;
    state.ride_progress = 0.0f;
    return state;
}

TrackState set_ride_progress(TrackState state, float progress) {
    state.ride_progress = std::clamp(progress, 0.0f, 1.0f);
    return state;
}

TrackState set_ride_speed(TrackState state, float speed) {
    state.ride_speed = std::max(speed, 0.0f);
    return state;
}

TrackState apply(TrackState state, const TrackCommand& cmd, const TrackConfig& config) {
    logging::get_logger()->trace("apply: {}", command_name(cmd));

    return std::visit([&](const auto& c) -> TrackState {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, command::AddPoint>) {
            return add_track_point(std::move(state), c.position);
        } else if constexpr (std::is_same_v<T, command::UpdatePoint>) {
            return update_track_point(std::move(state), c.id, c.position);
        } else if constexpr (std::is_same_v<T, command::UpdateTilt>) {
            return update_track_point_tilt(std::move(state), c.id, c.tilt);
        } else if constexpr (std::is_same_v<T, command::RemovePoint>) {
            return remove_track_point(std::move(state), c.id);
        } else if constexpr (std::is_same_v<T, command::CreateLoop>) {
            return create_loop_at_point(std::move(state), c.id, config.loop);
        } else if constexpr (std::is_same_v<T, command::SelectPoint>) {
            return select_point(std::move(state), c.id);
        } else if constexpr (std::is_same_v<T, command::ClearTrack>) {
            return clear_track(std::move(state));
        } else if constexpr (std::is_same_v<T, command::SetLooped>) {
            return set_looped(std::move(state), c.looped);
        } else if constexpr (std::is_same_v<T, command::SetMode>) {
            return set_mode(std::move(state), c.mode);
        } else if constexpr (std::is_same_v<T, command::StartRide>) {
            return start_ride(std::move(state));
        } else if constexpr (std::is_same_v<T, command::StopRide>) {
            return stop_ride(std::move(state));
        } else if constexpr (std::is_same_v<T, command::SetRideProgress>) {
            return set_ride_progress(std::move(state), c.progress);
        } else {
            static_assert(std::is_same_v<T, command::SetRideSpeed>);
            return set_ride_speed(std::move(state), c.speed);
        }
    }, cmd);
}

TrackState replay(const std::vector<TrackCommand>& commands,
                  const TrackConfig& config,
                  TrackState initial) {
    TrackState state = std::move(initial);
    for (const auto& cmd : commands) {
        state = apply(std::move(state), cmd, config);
    }
    logging::get_logger()->debug("replay: {} commands, {} points", commands.size(),
                                 state.points.size());
    return state;
}

}  // namespace coasterpath
