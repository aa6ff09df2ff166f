#include "ride_sampler.hpp"
#include "rail_projector.hpp"
#include <algorithm>
#include <cmath>

namespace coasterpath {

RideFrame ride_frame(const TrackCurve& curve, float progress,
                     const Vec3& fallback_normal,
                     float min_normal_length) {
    RideFrame frame;
    frame.progress = std::clamp(progress, 0.0f, 1.0f);
    frame.position = curve.position_at(frame.progress);
    frame.tangent = curve.tangent_at(frame.progress);
    frame.normal = rail_normal(frame.tangent, fallback_normal, min_normal_length);
    frame.up = frame.normal.cross(frame.tangent).normalized_or(vec3::world_up(), 1e-6f);
    frame.yaw = std::atan2(frame.tangent.x, frame.tangent.z);
    return frame;
}

std::vector<RideFrame> ride_frames(const TrackCurve& curve, int frame_count,
                                   float min_normal_length) {
    frame_count = std::max(frame_count, 1);

    std::vector<RideFrame> frames;
    frames.reserve(static_cast<size_t>(frame_count) + 1);

    Vec3 normal = vec3::unit_z();
    for (int i = 0; i <= frame_count; ++i) {
        float progress = static_cast<float>(i) / static_cast<float>(frame_count);
        frames.push_back(ride_frame(curve, progress, normal, min_normal_length));
        normal = frames.back().normal;
    }
    return frames;
}

}  // namespace coasterpath
