#include "loop_synthesizer.hpp"
#include <math/hermite.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>

namespace coasterpath {

namespace {

constexpr float TWO_PI = 2.0f * std::numbers::pi_v<float>;

// Derivative of loop_lateral_offset with respect to t
float loop_lateral_rate(float t, const LoopConfig& config, float blend_target) {
    const float sep = config.lateral_separation;

    if (config.mode != LoopMode::Blend) {
        return sep * 6.0f * t * (1.0f - t);
    }

    const float start = config.blend_start;
    if (t <= start) {
        return sep / start;
    }
    float u = (t - start) / (1.0f - start);
    return (blend_target - sep) * 6.0f * u * (1.0f - u) / (1.0f - start);
}

LoopFrame make_loop_frame(const LocalFrame& frame, const Vec3& entry,
                          float radius, float theta) {
    return LoopFrame{entry, frame.forward, frame.up, frame.right, radius, theta};
}

// Direction leaving point `index` along the sequence, or `fallback` at the tail
Vec3 outgoing_direction(const WaypointSequence& points, size_t index,
                        const Vec3& fallback, float min_length) {
    if (index + 1 >= points.size()) {
        return fallback;
    }
    Vec3 d = points[index + 1].position - points[index].position;
    return d.normalized_or(fallback, min_length);
}

// Number of approach points for a predecessor `progress` units behind the entry anchor
size_t approach_point_count(float progress, const LoopConfig& config) {
    if (progress <= config.min_direction_length) {
        return 0;
    }
    return (progress < config.radius) ? 1 : 2;
}

std::vector<TrackPoint> build_approach(WaypointSequence& out,
                                       const WaypointSequence& points,
                                       size_t anchor_index,
                                       const LocalFrame& frame,
                                       const LoopConfig& config) {
    if (anchor_index == 0) {
        return {};
    }

    const Vec3 anchor = points[anchor_index].position;
    const Vec3 pred = points[anchor_index - 1].position;
    const Vec3 entry_anchor = anchor - frame.forward * (config.entry_offset_factor * config.radius);

    size_t count = approach_point_count((entry_anchor - pred).dot(frame.forward), config);
    if (count == 0) {
        return {};
    }

    Vec3 toward_anchor = (anchor - pred).normalized_or(frame.forward, config.min_direction_length);
    Vec3 pred_tangent = toward_anchor;
    if (anchor_index >= 2) {
        pred_tangent = (pred - points[anchor_index - 2].position)
                           .normalized_or(toward_anchor, config.min_direction_length);
    }

    auto span = HermiteSpan::with_chord_scale(pred, pred_tangent, entry_anchor, frame.forward);
    std::vector<float> params = (count == 2) ? std::vector<float>{0.5f, 1.0f}
                                             : std::vector<float>{1.0f};

    std::vector<TrackPoint> approach;
    for (const Vec3& p : sample_hermite(span, params)) {
        approach.push_back(out.create_point(p));
    }
    return approach;
}

std::vector<TrackPoint> build_body(WaypointSequence& out,
                                   const Vec3& entry,
                                   const LocalFrame& frame,
                                   const LoopConfig& config,
                                   float blend_target) {
    const int n = config.body_points;
    std::vector<TrackPoint> body;
    body.reserve(static_cast<size_t>(n));

    for (int k = 1; k <= n; ++k) {
        float t = static_cast<float>(k) / static_cast<float>(n);
        float theta = TWO_PI * static_cast<float>(k % n) / static_cast<float>(n);
        body.push_back(out.create_point(
            loop_body_point(frame, entry, t, config, blend_target),
            make_loop_frame(frame, entry, config.radius, theta)));
    }
    return body;
}

// Stage 1 runs from the loop exit to an offset point that keeps the exit
// track clear of the entry track; stage 2 joins the downstream target.
std::vector<TrackPoint> build_exit(WaypointSequence& out,
                                   const WaypointSequence& points,
                                   size_t anchor_index,
                                   std::optional<size_t> target_index,
                                   const Vec3& loop_exit,
                                   const LocalFrame& frame,
                                   const LoopConfig& config) {
    const Vec3 offset_point = loop_exit +
                              frame.forward * config.exit_forward_separation +
                              frame.right * config.exit_lateral_separation;

    std::vector<TrackPoint> exit;
    if (!target_index) {
        exit.push_back(out.create_point(offset_point));
        return exit;
    }

    auto stage1 = HermiteSpan::with_chord_scale(loop_exit, frame.forward,
                                                offset_point, frame.forward);
    for (const Vec3& p : sample_hermite(stage1, {0.5f, 1.0f})) {
        exit.push_back(out.create_point(p));
    }

    const Vec3 anchor = points[anchor_index].position;
    const Vec3 target = points[*target_index].position;
    Vec3 arrival = (target - anchor).normalized_or(frame.forward, config.min_direction_length);
    Vec3 target_tangent = outgoing_direction(points, *target_index, arrival,
                                             config.min_direction_length);

    auto stage2 = HermiteSpan::with_chord_scale(offset_point, frame.forward,
                                                target, target_tangent);
    for (const Vec3& p : sample_hermite(stage2, {1.0f / 3.0f, 2.0f / 3.0f})) {
        exit.push_back(out.create_point(p));
    }
    return exit;
}

LoopSynthesis synthesize_transition(const WaypointSequence& points, size_t i,
                                    const LoopConfig& config) {
    const size_t n = points.size();
    const TrackPoint& anchor = points[i];
    const LocalFrame frame = compute_local_frame(points, i, config.min_direction_length);

    const size_t following = n - 1 - i;
    const size_t body_count = static_cast<size_t>(config.body_points);
    size_t skip = 0;
    std::optional<size_t> target;
    if (following >= 1) {
        skip = std::min({following - 1,
                         static_cast<size_t>(std::max(config.max_skip, 0)),
                         body_count});
        target = i + skip + 1;
    }

    LoopSynthesis result{points, std::nullopt};
    WaypointSequence& out = result.sequence;

    auto approach = build_approach(out, points, i, frame, config);
    auto body = build_body(out, anchor.position, frame, config, 0.0f);
    auto exit = build_exit(out, points, i, target, body.back().position, frame, config);

    LoopSplice splice;
    splice.anchor_index = i;
    splice.skip_count = skip;
    splice.approach_count = approach.size();
    splice.body_count = body.size();
    splice.exit_count = exit.size();

    std::vector<TrackPoint> inserted;
    inserted.reserve(approach.size() + 1 + body.size() + exit.size());
    inserted.insert(inserted.end(), approach.begin(), approach.end());
    inserted.push_back(anchor);
    inserted.insert(inserted.end(), body.begin(), body.end());
    inserted.insert(inserted.end(), exit.begin(), exit.end());

    // The anchor itself is part of the replaced window and re-inserted
    out.splice(i, 1 + skip, std::move(inserted));
    result.splice = splice;
    return result;
}

LoopSynthesis synthesize_blend(const WaypointSequence& points, size_t i,
                               const LoopConfig& config) {
    auto log = logging::get_logger();
    if (i + 1 >= points.size()) {
        log->debug("createLoop: blend mode needs a point after {}", points[i].id);
        return {points, std::nullopt};
    }

    const Vec3 entry = points[i].position;
    const LocalFrame frame = compute_local_frame(points, i, config.min_direction_length);
    const float blend_target = (points[i + 1].position - entry).dot(frame.right);

    LoopSynthesis result{points, std::nullopt};
    auto body = build_body(result.sequence, entry, frame, config, blend_target);

    LoopSplice splice;
    splice.anchor_index = i;
    splice.body_count = body.size();

    result.sequence.splice(i + 1, 0, std::move(body));
    result.splice = splice;
    return result;
}

LoopSynthesis synthesize_simple_arc(const WaypointSequence& points, size_t i,
                                    const LoopConfig& config) {
    auto log = logging::get_logger();
    if (i + 1 >= points.size()) {
        log->debug("createLoop: simple arc needs a point after {}", points[i].id);
        return {points, std::nullopt};
    }

    const Vec3 entry = points[i].position;
    const Vec3 exit = points[i + 1].position;
    const LocalFrame frame = LocalFrame::from_direction(exit - entry, config.min_direction_length);

    const float center_y = std::min(entry.y, exit.y) + config.arc_radius;
    const int n = config.arc_points;

    LoopSynthesis result{points, std::nullopt};
    std::vector<TrackPoint> arc;

    // Angle runs from -pi/2 (entry side) over the top to 3pi/2
    for (int k = 1; k < n; ++k) {
        float t = static_cast<float>(k) / static_cast<float>(n);
        float angle = -0.5f * std::numbers::pi_v<float> + t * TWO_PI;

        float forward_t = (std::sin(angle) + 1.0f) * 0.5f;
        Vec3 p = lerp(entry, exit, forward_t);
        p.y = center_y + std::cos(angle) * config.arc_radius;

        arc.push_back(result.sequence.create_point(
            p, make_loop_frame(frame, entry, config.arc_radius, t * TWO_PI)));
    }

    LoopSplice splice;
    splice.anchor_index = i;
    splice.body_count = arc.size();

    result.sequence.splice(i + 1, 0, std::move(arc));
    result.splice = splice;
    return result;
}

}  // namespace

LocalFrame LocalFrame::from_direction(const Vec3& direction, float min_length) {
    LocalFrame frame;
    frame.forward = direction.horizontal().normalized_or(vec3::unit_x(), min_length);
    frame.up = vec3::world_up();
    frame.right = frame.forward.cross(frame.up).normalized();
    return frame;
}

LocalFrame compute_local_frame(const WaypointSequence& points,
                               size_t anchor_index,
                               float min_direction_length) {
    if (anchor_index == 0 || anchor_index >= points.size()) {
        return LocalFrame::from_direction(vec3::unit_x(), min_direction_length);
    }
    Vec3 incoming = points[anchor_index].position - points[anchor_index - 1].position;
    return LocalFrame::from_direction(incoming, min_direction_length);
}

float loop_lateral_offset(float t, const LoopConfig& config, float blend_target) {
    const float sep = config.lateral_separation;

    if (config.mode != LoopMode::Blend) {
        // Eased so the body leaves and rejoins exactly along forward
        return sep * smoothstep(t);
    }

    const float start = config.blend_start;
    if (t <= start) {
        return sep * t / start;
    }
    float w = smoothstep((t - start) / (1.0f - start));
    return sep + (blend_target - sep) * w;
}

Vec3 loop_body_point(const LocalFrame& frame, const Vec3& entry, float t,
                     const LoopConfig& config, float blend_target) {
    const float theta = t * TWO_PI;
    const float r = config.radius;
    return entry +
           frame.forward * (std::sin(theta) * r) +
           frame.up * ((1.0f - std::cos(theta)) * r) +
           frame.right * loop_lateral_offset(t, config, blend_target);
}

Vec3 loop_body_tangent(const LocalFrame& frame, float t,
                       const LoopConfig& config, float blend_target) {
    const float theta = t * TWO_PI;
    const float r = config.radius;
    Vec3 d = frame.forward * (std::cos(theta) * r * TWO_PI) +
             frame.up * (std::sin(theta) * r * TWO_PI) +
             frame.right * loop_lateral_rate(t, config, blend_target);
    return d.normalized_or(frame.forward, 1e-6f);
}

LoopSynthesis synthesize_loop(const WaypointSequence& points,
                              const PointId& anchor_id,
                              const LoopConfig& config) {
    auto log = logging::get_logger();

    auto index = points.find_index(anchor_id);
    if (!index) {
        log->debug("createLoop: unknown point {}, track unchanged", anchor_id);
        return {points, std::nullopt};
    }

    // Same limits as a loaded configuration file
    if (config.radius <= 0.0f || config.body_points < 4 || config.arc_points < 2 ||
        config.blend_start <= 0.0f || config.blend_start >= 1.0f) {
        log->warn("createLoop: invalid loop configuration, track unchanged");
        return {points, std::nullopt};
    }

    LoopSynthesis result;
    switch (config.mode) {
        case LoopMode::Transition:
            result = synthesize_transition(points, *index, config);
            break;
        case LoopMode::Blend:
            result = synthesize_blend(points, *index, config);
            break;
        case LoopMode::SimpleArc:
            result = synthesize_simple_arc(points, *index, config);
            break;
    }

    if (result.splice) {
        const auto& s = *result.splice;
        log->debug("createLoop: anchor {} (index {}): {} approach, {} body, {} exit, {} skipped",
                   anchor_id, s.anchor_index, s.approach_count, s.body_count,
                   s.exit_count, s.skip_count);
    }
    return result;
}

}  // namespace coasterpath
