#ifndef COASTERPATH_GEOMETRY_LOOP_SYNTHESIZER_HPP
#define COASTERPATH_GEOMETRY_LOOP_SYNTHESIZER_HPP

#include <math/vec3.hpp>
#include <track/waypoint_sequence.hpp>
#include <optional>
#include <vector>

namespace coasterpath {

// How a loop is spliced into the existing track
enum class LoopMode {
    // Approach points, full loop body, then a two-stage exit that rejoins
    // a legacy point further down the track with a matching tangent
    Transition,
    // Loop body inserted right after the anchor; its last quarter is eased
    // laterally toward the next legacy point. No points are replaced.
    Blend,
    // Vertical arc between the anchor and the next point, both kept
    SimpleArc
};

struct LoopConfig {
    LoopMode mode = LoopMode::Transition;

    // Loop body
    float radius = 4.0f;
    int body_points = 20;
    float lateral_separation = 1.5f;   // Sideways drift from entry to exit

    // Approach: entry anchor sits this many radii before the anchor
    float entry_offset_factor = 0.3f;

    // Exit offset point, relative to the loop exit
    float exit_forward_separation = 2.0f;
    float exit_lateral_separation = 0.5f;

    // Legacy points replaced after the anchor (at most)
    int max_skip = 3;

    // Blend mode: fraction of the loop after which the lateral pull starts
    float blend_start = 0.75f;

    // SimpleArc mode
    float arc_radius = 8.0f;
    int arc_points = 12;

    // Directions shorter than this fall back to world +X
    float min_direction_length = 0.1f;
};

// Orthonormal frame at a loop anchor
struct LocalFrame {
    Vec3 forward = vec3::unit_x();
    Vec3 up = vec3::world_up();
    Vec3 right = vec3::unit_z();

    // Frame whose forward is the horizontal part of `direction`
    // (world +X when that is shorter than min_length)
    static LocalFrame from_direction(const Vec3& direction, float min_length);
};

// Frame at `anchor_index`, looking from the previous point into the anchor
LocalFrame compute_local_frame(const WaypointSequence& points,
                               size_t anchor_index,
                               float min_direction_length);

// Lateral offset (along `right`) of the loop body at t in [0, 1].
// `blend_target` is only used by LoopMode::Blend.
float loop_lateral_offset(float t, const LoopConfig& config, float blend_target = 0.0f);

// Loop body position at t in [0, 1] (theta = 2*pi*t)
Vec3 loop_body_point(const LocalFrame& frame, const Vec3& entry, float t,
                     const LoopConfig& config, float blend_target = 0.0f);

// Unit tangent of the loop body at t in [0, 1]
Vec3 loop_body_tangent(const LocalFrame& frame, float t,
                       const LoopConfig& config, float blend_target = 0.0f);

// What a loop insertion did to the sequence
struct LoopSplice {
    size_t anchor_index = 0;    // Anchor index in the original sequence
    size_t skip_count = 0;      // Legacy points replaced after the anchor
    size_t approach_count = 0;
    size_t body_count = 0;
    size_t exit_count = 0;

    // First loop body point in the resulting sequence
    size_t body_begin() const { return anchor_index + approach_count + 1; }

    // Net number of points added
    size_t added_count() const {
        return approach_count + body_count + exit_count - skip_count;
    }
};

struct LoopSynthesis {
    WaypointSequence sequence;
    std::optional<LoopSplice> splice;   // Empty when nothing was inserted

    bool applied() const { return splice.has_value(); }
};

// Insert a loop at the point `anchor_id`. Unknown ids (and anchors a mode
// cannot handle) return the input sequence unchanged.
LoopSynthesis synthesize_loop(const WaypointSequence& points,
                              const PointId& anchor_id,
                              const LoopConfig& config = LoopConfig{});

}  // namespace coasterpath

#endif // COASTERPATH_GEOMETRY_LOOP_SYNTHESIZER_HPP
