#ifndef COASTERPATH_TRACK_TRACK_POINT_HPP
#define COASTERPATH_TRACK_TRACK_POINT_HPP

#include <math/vec3.hpp>
#include <optional>
#include <string>

namespace coasterpath {

// Opaque, stable point identifier ("point-<n>")
using PointId = std::string;

// Frame a loop point was generated in. Kept on the point so later passes
// (banking, rider orientation) can recover the loop geometry.
struct LoopFrame {
    Vec3 entry_pos;     // Anchor position the loop starts from
    Vec3 forward;       // Horizontal travel direction at the anchor
    Vec3 up;            // World up at generation time
    Vec3 right;         // forward x up
    float radius = 0.0f;
    float theta = 0.0f; // Angle around the loop, [0, 2*pi)
};

struct TrackPoint {
    PointId id;
    Vec3 position;
    float tilt = 0.0f;  // Banking angle; not a curve input
    std::optional<LoopFrame> loop_meta;

    bool is_loop_point() const { return loop_meta.has_value(); }
};

}  // namespace coasterpath

#endif // COASTERPATH_TRACK_TRACK_POINT_HPP
