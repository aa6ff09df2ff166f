#ifndef COASTERPATH_SERIALIZATION_CONFIG_JSON_HPP
#define COASTERPATH_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec3.hpp>
#include <track/track_config.hpp>
#include <stdexcept>
#include <string>

namespace coasterpath {

// Vec3 serialization
inline void to_json(nlohmann::json& j, const Vec3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

inline void from_json(const nlohmann::json& j, Vec3& v) {
    if (!j.is_array() || j.size() != 3) {
        throw std::runtime_error("Vec3 must be an array of 3 numbers");
    }
    v.x = j[0].get<float>();
    v.y = j[1].get<float>();
    v.z = j[2].get<float>();
}

NLOHMANN_JSON_SERIALIZE_ENUM(LoopMode, {
    {LoopMode::Transition, "transition"},
    {LoopMode::Blend, "blend"},
    {LoopMode::SimpleArc, "simple_arc"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(CurveType, {
    {CurveType::CatmullRom, "catmullrom"},
    {CurveType::Centripetal, "centripetal"},
    {CurveType::Chordal, "chordal"},
})

// LoopConfig serialization
inline void to_json(nlohmann::json& j, const LoopConfig& config) {
    j = {
        {"mode", config.mode},
        {"radius", config.radius},
        {"body_points", config.body_points},
        {"lateral_separation", config.lateral_separation},
        {"entry_offset_factor", config.entry_offset_factor},
        {"exit_forward_separation", config.exit_forward_separation},
        {"exit_lateral_separation", config.exit_lateral_separation},
        {"max_skip", config.max_skip},
        {"blend_start", config.blend_start},
        {"arc_radius", config.arc_radius},
        {"arc_points", config.arc_points},
        {"min_direction_length", config.min_direction_length}
    };
}

inline void from_json(const nlohmann::json& j, LoopConfig& config) {
    const LoopConfig defaults;
    config.mode = j.value("mode", defaults.mode);
    config.radius = j.value("radius", defaults.radius);
    config.body_points = j.value("body_points", defaults.body_points);
    config.lateral_separation = j.value("lateral_separation", defaults.lateral_separation);
    config.entry_offset_factor = j.value("entry_offset_factor", defaults.entry_offset_factor);
    config.exit_forward_separation = j.value("exit_forward_separation", defaults.exit_forward_separation);
    config.exit_lateral_separation = j.value("exit_lateral_separation", defaults.exit_lateral_separation);
    config.max_skip = j.value("max_skip", defaults.max_skip);
    config.blend_start = j.value("blend_start", defaults.blend_start);
    config.arc_radius = j.value("arc_radius", defaults.arc_radius);
    config.arc_points = j.value("arc_points", defaults.arc_points);
    config.min_direction_length = j.value("min_direction_length", defaults.min_direction_length);

    if (config.radius <= 0.0f) {
        throw std::runtime_error("loop.radius must be positive");
    }
    if (config.body_points < 4) {
        throw std::runtime_error("loop.body_points must be at least 4");
    }
    if (config.max_skip < 0) {
        throw std::runtime_error("loop.max_skip must not be negative");
    }
    if (config.blend_start <= 0.0f || config.blend_start >= 1.0f) {
        throw std::runtime_error("loop.blend_start must be inside (0, 1)");
    }
    if (config.arc_points < 2) {
        throw std::runtime_error("loop.arc_points must be at least 2");
    }
}

// CurveConfig serialization
inline void to_json(nlohmann::json& j, const CurveConfig& config) {
    j = {
        {"type", config.type},
        {"tension", config.tension},
        {"samples_per_point", config.samples_per_point},
        {"min_samples", config.min_samples}
    };
}

inline void from_json(const nlohmann::json& j, CurveConfig& config) {
    const CurveConfig defaults;
    config.type = j.value("type", defaults.type);
    config.tension = j.value("tension", defaults.tension);
    config.samples_per_point = j.value("samples_per_point", defaults.samples_per_point);
    config.min_samples = j.value("min_samples", defaults.min_samples);

    if (config.samples_per_point < 1 || config.min_samples < 1) {
        throw std::runtime_error("curve sample counts must be positive");
    }
}

// RailConfig serialization
inline void to_json(nlohmann::json& j, const RailConfig& config) {
    j = {
        {"rail_offset", config.rail_offset},
        {"ground_level", config.ground_level},
        {"ground_threshold", config.ground_threshold},
        {"supports_per_point", config.supports_per_point},
        {"max_supports", config.max_supports},
        {"support_top_radius", config.support_top_radius},
        {"support_base_radius", config.support_base_radius},
        {"crosstie_interval", config.crosstie_interval},
        {"crosstie_drop", config.crosstie_drop},
        {"crosstie_width", config.crosstie_width},
        {"min_normal_length", config.min_normal_length}
    };
}

inline void from_json(const nlohmann::json& j, RailConfig& config) {
    const RailConfig defaults;
    config.rail_offset = j.value("rail_offset", defaults.rail_offset);
    config.ground_level = j.value("ground_level", defaults.ground_level);
    config.ground_threshold = j.value("ground_threshold", defaults.ground_threshold);
    config.supports_per_point = j.value("supports_per_point", defaults.supports_per_point);
    config.max_supports = j.value("max_supports", defaults.max_supports);
    config.support_top_radius = j.value("support_top_radius", defaults.support_top_radius);
    config.support_base_radius = j.value("support_base_radius", defaults.support_base_radius);
    config.crosstie_interval = j.value("crosstie_interval", defaults.crosstie_interval);
    config.crosstie_drop = j.value("crosstie_drop", defaults.crosstie_drop);
    config.crosstie_width = j.value("crosstie_width", defaults.crosstie_width);
    config.min_normal_length = j.value("min_normal_length", defaults.min_normal_length);

    if (config.rail_offset < 0.0f) {
        throw std::runtime_error("rails.rail_offset must not be negative");
    }
}

// TrackConfig serialization (every section optional)
inline void to_json(nlohmann::json& j, const TrackConfig& config) {
    j = {
        {"loop", config.loop},
        {"curve", config.curve},
        {"rails", config.rails}
    };
}

inline void from_json(const nlohmann::json& j, TrackConfig& config) {
    config = TrackConfig{};
    if (j.contains("loop")) {
        config.loop = j["loop"].get<LoopConfig>();
    }
    if (j.contains("curve")) {
        config.curve = j["curve"].get<CurveConfig>();
    }
    if (j.contains("rails")) {
        config.rails = j["rails"].get<RailConfig>();
    }
}

}  // namespace coasterpath

#endif // COASTERPATH_SERIALIZATION_CONFIG_JSON_HPP
