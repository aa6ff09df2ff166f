#ifndef COASTERPATH_GEOMETRY_RAIL_PROJECTOR_HPP
#define COASTERPATH_GEOMETRY_RAIL_PROJECTOR_HPP

#include <math/vec3.hpp>
#include "track_curve.hpp"
#include <vector>

namespace coasterpath {

struct RailConfig {
    float rail_offset = 0.3f;          // Half gauge: rail distance from the centreline

    // Supports
    float ground_level = 0.0f;
    float ground_threshold = 0.5f;     // Samples at or below this height get no support
    int supports_per_point = 2;
    int max_supports = 20;
    float support_top_radius = 0.1f;
    float support_base_radius = 0.15f;

    // Crossties
    int crosstie_interval = 5;         // Every n-th rail sample, 0 disables
    float crosstie_drop = 0.1f;        // Below the centreline
    float crosstie_width = 1.2f;

    // Horizontal tangents shorter than this reuse the previous normal
    float min_normal_length = 0.1f;

    // Sample stride between support candidates
    int support_interval(size_t sample_intervals, size_t point_count) const;
};

// Vertical pillar from the ground up to the track
struct SupportPillar {
    Vec3 base;
    Vec3 top;
    float height = 0.0f;
    float top_radius = 0.0f;
    float base_radius = 0.0f;

    Vec3 center() const { return lerp(base, top, 0.5f); }
};

// Sleeper across both rails
struct Crosstie {
    Vec3 center;
    float yaw = 0.0f;   // Rotation about +Y, atan2(tangent.x, tangent.z)
    float width = 0.0f;
};

struct RailGeometry {
    std::vector<Vec3> left_rail;
    std::vector<Vec3> right_rail;
    std::vector<Vec3> normals;          // Horizontal, one per sample
    std::vector<SupportPillar> supports;
    std::vector<Crosstie> crossties;
};

// Level (horizontal) normal for a tangent: normalize(-t.z, 0, t.x).
// Falls back to `fallback` when the tangent is (nearly) vertical.
Vec3 rail_normal(const Vec3& tangent, const Vec3& fallback, float min_length);

// Rails, supports and crossties from curve samples of a track built
// from `point_count` waypoints
RailGeometry project_rails(const std::vector<CurveSample>& samples,
                           size_t point_count,
                           const RailConfig& config = RailConfig{});

// Same, sampling the curve at its configured resolution
RailGeometry project_rails(const TrackCurve& curve, const RailConfig& config = RailConfig{});

}  // namespace coasterpath

#endif // COASTERPATH_GEOMETRY_RAIL_PROJECTOR_HPP
