#ifndef COASTERPATH_SERIALIZATION_TRACK_JSON_HPP
#define COASTERPATH_SERIALIZATION_TRACK_JSON_HPP

#include <nlohmann/json.hpp>
#include <track/track_state.hpp>
#include "config_json.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace coasterpath {

NLOHMANN_JSON_SERIALIZE_ENUM(CoasterMode, {
    {CoasterMode::Build, "build"},
    {CoasterMode::Ride, "ride"},
    {CoasterMode::Preview, "preview"},
})

// LoopFrame serialization (output only)
inline void to_json(nlohmann::json& j, const LoopFrame& frame) {
    j = {
        {"entry_pos", frame.entry_pos},
        {"forward", frame.forward},
        {"up", frame.up},
        {"right", frame.right},
        {"radius", frame.radius},
        {"theta", frame.theta}
    };
}

// TrackPoint serialization
inline void to_json(nlohmann::json& j, const TrackPoint& point) {
    j = {
        {"id", point.id},
        {"position", point.position},
        {"tilt", point.tilt}
    };
    if (point.loop_meta) {
        j["loop"] = *point.loop_meta;
    }
}

inline nlohmann::json waypoints_to_json(const WaypointSequence& points) {
    nlohmann::json j;
    j["last_issued_id"] = points.last_issued_id();
    j["points"] = points.points();
    return j;
}

inline nlohmann::json track_state_to_json(const TrackState& state) {
    nlohmann::json j;
    j["mode"] = state.mode;
    j["selected_point"] = state.selected_point ? nlohmann::json(*state.selected_point)
                                               : nlohmann::json(nullptr);
    j["ride_progress"] = state.ride_progress;
    j["is_riding"] = state.is_riding;
    j["ride_speed"] = state.ride_speed;
    j["is_looped"] = state.is_looped;
    j["waypoints"] = waypoints_to_json(state.points);
    return j;
}

// TrackCommand parsing: {"op": <command name>, ...fields}
inline TrackCommand track_command_from_json(const nlohmann::json& j) {
    std::string op = j.at("op").get<std::string>();

    if (op == "add") {
        return command::AddPoint{j.at("position").get<Vec3>()};
    } else if (op == "update") {
        return command::UpdatePoint{j.at("id").get<PointId>(), j.at("position").get<Vec3>()};
    } else if (op == "tilt") {
        return command::UpdateTilt{j.at("id").get<PointId>(), j.at("tilt").get<float>()};
    } else if (op == "remove") {
        return command::RemovePoint{j.at("id").get<PointId>()};
    } else if (op == "loop") {
        return command::CreateLoop{j.at("id").get<PointId>()};
    } else if (op == "select") {
        command::SelectPoint select;
        if (j.contains("id") && !j["id"].is_null()) {
            select.id = j["id"].get<PointId>();
        }
        return select;
    } else if (op == "clear") {
        return command::ClearTrack{};
    } else if (op == "set_looped") {
        return command::SetLooped{j.at("looped").get<bool>()};
    } else if (op == "set_mode") {
        return command::SetMode{j.at("mode").get<CoasterMode>()};
    } else if (op == "start_ride") {
        return command::StartRide{};
    } else if (op == "stop_ride") {
        return command::StopRide{};
    } else if (op == "ride_progress") {
        return command::SetRideProgress{j.at("progress").get<float>()};
    } else if (op == "ride_speed") {
        return command::SetRideSpeed{j.at("speed").get<float>()};
    }

    throw std::runtime_error("Unknown track command: " + op);
}

// A command script is either {"commands": [...]} or a bare array
inline std::vector<TrackCommand> command_script_from_json(const nlohmann::json& j) {
    const nlohmann::json& list = j.is_array() ? j : j.at("commands");
    if (!list.is_array()) {
        throw std::runtime_error("Command script must contain an array of commands");
    }

    std::vector<TrackCommand> commands;
    commands.reserve(list.size());
    for (const auto& entry : list) {
        commands.push_back(track_command_from_json(entry));
    }
    return commands;
}

}  // namespace coasterpath

#endif // COASTERPATH_SERIALIZATION_TRACK_JSON_HPP
