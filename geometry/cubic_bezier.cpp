#include "cubic_bezier.hpp"
#include <algorithm>
#include <cmath>

namespace coasterpath {

CubicBezier::CubicBezier(const Vec3& p0, const Vec3& p1, const Vec3& p2, const Vec3& p3)
    : control_points{p0, p1, p2, p3} {}

Vec3 CubicBezier::evaluate(float t) const {
    float u = 1.0f - t;
    float tt = t * t;
    float uu = u * u;
    float ttt = tt * t;
    float uuu = uu * u;

    return control_points[0] * uuu +
           control_points[1] * (3.0f * uu * t) +
           control_points[2] * (3.0f * u * tt) +
           control_points[3] * ttt;
}

Vec3 CubicBezier::derivative(float t) const {
    float u = 1.0f - t;
    float uu = u * u;
    float tt = t * t;

    Vec3 d0 = control_points[1] - control_points[0];
    Vec3 d1 = control_points[2] - control_points[1];
    Vec3 d2 = control_points[3] - control_points[2];

    return d0 * (3.0f * uu) + d1 * (6.0f * u * t) + d2 * (3.0f * tt);
}

Vec3 CubicBezier::second_derivative(float t) const {
    float u = 1.0f - t;

    Vec3 d0 = control_points[1] - control_points[0];
    Vec3 d1 = control_points[2] - control_points[1];
    Vec3 d2 = control_points[3] - control_points[2];

    Vec3 dd0 = d1 - d0;
    Vec3 dd1 = d2 - d1;

    return dd0 * (6.0f * u) + dd1 * (6.0f * t);
}

float CubicBezier::curvature(float t) const {
    Vec3 d1 = derivative(t);
    Vec3 d2 = second_derivative(t);

    Vec3 cross = d1.cross(d2);
    float d1_len = d1.length();

    if (d1_len < 1e-8f) {
        return 0.0f;
    }

    return cross.length() / (d1_len * d1_len * d1_len);
}

float CubicBezier::max_curvature(int samples) const {
    float max_k = 0.0f;
    for (int i = 0; i <= samples; ++i) {
        float t = static_cast<float>(i) / static_cast<float>(samples);
        max_k = std::max(max_k, curvature(t));
    }
    return max_k;
}

float CubicBezier::arc_length(int samples) const {
    float length = 0.0f;
    Vec3 prev = control_points[0];

    for (int i = 1; i <= samples; ++i) {
        float t = static_cast<float>(i) / static_cast<float>(samples);
        Vec3 curr = evaluate(t);
        length += (curr - prev).length();
        prev = curr;
    }
    return length;
}

CubicBezier CubicBezier::from_hermite(const Vec3& p0, const Vec3& tangent0,
                                      const Vec3& p1, const Vec3& tangent1) {
    // P1 = P0 + T0/3
    // P2 = P3 - T1/3
    Vec3 c1 = p0 + tangent0 / 3.0f;
    Vec3 c2 = p1 - tangent1 / 3.0f;
    return CubicBezier(p0, c1, c2, p1);
}

// BezierSpline implementation

void BezierSpline::add_segment(const CubicBezier& segment) {
    segments_.push_back(segment);
}

std::pair<size_t, float> BezierSpline::locate(float t) const {
    t = std::clamp(t, 0.0f, static_cast<float>(segments_.size()));

    size_t segment_index = static_cast<size_t>(t);
    if (segment_index >= segments_.size()) {
        segment_index = segments_.size() - 1;
    }

    return {segment_index, t - static_cast<float>(segment_index)};
}

Vec3 BezierSpline::evaluate(float t) const {
    if (segments_.empty()) {
        return vec3::zero();
    }

    auto [segment_index, local_t] = locate(t);
    return segments_[segment_index].evaluate(local_t);
}

Vec3 BezierSpline::derivative(float t) const {
    if (segments_.empty()) {
        return vec3::zero();
    }

    auto [segment_index, local_t] = locate(t);
    return segments_[segment_index].derivative(local_t);
}

float BezierSpline::total_arc_length(int samples_per_segment) const {
    float total = 0.0f;
    for (const auto& seg : segments_) {
        total += seg.arc_length(samples_per_segment);
    }
    return total;
}

float BezierSpline::max_curvature(int samples_per_segment) const {
    float max_k = 0.0f;
    for (const auto& seg : segments_) {
        max_k = std::max(max_k, seg.max_curvature(samples_per_segment));
    }
    return max_k;
}

}  // namespace coasterpath
