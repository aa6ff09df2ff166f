#ifndef COASTERPATH_GEOMETRY_RIDE_SAMPLER_HPP
#define COASTERPATH_GEOMETRY_RIDE_SAMPLER_HPP

#include <math/vec3.hpp>
#include "track_curve.hpp"
#include <vector>

namespace coasterpath {

// Rider pose at one playback position. The playback driver owns timing
// and only hands in the progress value.
struct RideFrame {
    float progress = 0.0f;
    Vec3 position;
    Vec3 tangent;
    Vec3 normal;        // Level, same rule as the rails
    Vec3 up;            // normal x tangent
    float yaw = 0.0f;   // atan2(tangent.x, tangent.z)
};

// Pose at progress in [0, 1] (clamped)
RideFrame ride_frame(const TrackCurve& curve, float progress,
                     const Vec3& fallback_normal = vec3::unit_z(),
                     float min_normal_length = 0.1f);

// frame_count + 1 poses at progress i / frame_count. Normals are carried
// over vertical stretches instead of snapping to the fallback.
std::vector<RideFrame> ride_frames(const TrackCurve& curve, int frame_count,
                                   float min_normal_length = 0.1f);

}  // namespace coasterpath

#endif // COASTERPATH_GEOMETRY_RIDE_SAMPLER_HPP
