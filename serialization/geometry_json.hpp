#ifndef COASTERPATH_SERIALIZATION_GEOMETRY_JSON_HPP
#define COASTERPATH_SERIALIZATION_GEOMETRY_JSON_HPP

#include <nlohmann/json.hpp>
#include <geometry/track_geometry.hpp>
#include <geometry/ride_sampler.hpp>
#include "config_json.hpp"

namespace coasterpath {

// Renderer-facing output only; nothing here is read back.

inline void to_json(nlohmann::json& j, const CurveSample& sample) {
    j = {
        {"t", sample.t},
        {"position", sample.position},
        {"tangent", sample.tangent}
    };
}

inline void to_json(nlohmann::json& j, const SupportPillar& pillar) {
    j = {
        {"base", pillar.base},
        {"top", pillar.top},
        {"center", pillar.center()},
        {"height", pillar.height},
        {"top_radius", pillar.top_radius},
        {"base_radius", pillar.base_radius}
    };
}

inline void to_json(nlohmann::json& j, const Crosstie& tie) {
    j = {
        {"center", tie.center},
        {"yaw", tie.yaw},
        {"width", tie.width}
    };
}

inline void to_json(nlohmann::json& j, const RailGeometry& rails) {
    j = {
        {"left_rail", rails.left_rail},
        {"right_rail", rails.right_rail},
        {"supports", rails.supports},
        {"crossties", rails.crossties}
    };
}

inline void to_json(nlohmann::json& j, const RideFrame& frame) {
    j = {
        {"progress", frame.progress},
        {"position", frame.position},
        {"tangent", frame.tangent},
        {"normal", frame.normal},
        {"up", frame.up},
        {"yaw", frame.yaw}
    };
}

inline nlohmann::json track_geometry_to_json(const TrackGeometry& geometry) {
    auto [min_pt, max_pt] = geometry.bounding_box();

    nlohmann::json j;
    j["closed"] = geometry.curve().closed();
    j["centerline"] = geometry.samples();
    j["rails"] = geometry.rails();
    j["bounds"] = {{"min", min_pt}, {"max", max_pt}};
    return j;
}

}  // namespace coasterpath

#endif // COASTERPATH_SERIALIZATION_GEOMETRY_JSON_HPP
