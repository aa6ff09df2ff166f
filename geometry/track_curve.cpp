#include "track_curve.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>

namespace coasterpath {

namespace {

// Span parameter interval for the non-uniform forms
float knot_interval(const Vec3& a, const Vec3& b, float exponent) {
    return std::pow((b - a).length_squared(), exponent);
}

// Hermite tangents for the span p1 -> p2, scaled to the span's [0, 1] parameter
std::pair<Vec3, Vec3> span_tangents(const Vec3& p0, const Vec3& p1,
                                    const Vec3& p2, const Vec3& p3,
                                    const CurveConfig& config) {
    if (config.type == CurveType::CatmullRom) {
        return {(p2 - p0) * config.tension, (p3 - p1) * config.tension};
    }

    float exponent = (config.type == CurveType::Chordal) ? 0.5f : 0.25f;
    float dt0 = knot_interval(p0, p1, exponent);
    float dt1 = knot_interval(p1, p2, exponent);
    float dt2 = knot_interval(p2, p3, exponent);

    // Coincident points would divide by zero
    if (dt1 < 1e-4f) dt1 = 1.0f;
    if (dt0 < 1e-4f) dt0 = dt1;
    if (dt2 < 1e-4f) dt2 = dt1;

    Vec3 m1 = (p1 - p0) / dt0 - (p2 - p0) / (dt0 + dt1) + (p2 - p1) / dt1;
    Vec3 m2 = (p2 - p1) / dt1 - (p3 - p1) / (dt1 + dt2) + (p3 - p2) / dt2;

    return {m1 * dt1, m2 * dt1};
}

}  // namespace

int CurveConfig::sample_count(size_t point_count) const {
    int scaled = samples_per_point * static_cast<int>(point_count);
    return std::max({scaled, min_samples, 1});
}

TrackCurve::TrackCurve(BezierSpline spline, size_t point_count, bool closed, const CurveConfig& config)
    : spline_(std::move(spline))
    , point_count_(point_count)
    , closed_(closed)
    , config_(config) {}

std::optional<TrackCurve> TrackCurve::build(const std::vector<Vec3>& points,
                                            bool closed,
                                            const CurveConfig& config) {
    auto log = logging::get_logger();

    const size_t n = points.size();
    if (n < 2) {
        log->trace("TrackCurve: {} point(s), no curve", n);
        return std::nullopt;
    }

    // Open curves get phantom end points mirrored through the first/last point
    const Vec3 before_first = points[0] * 2.0f - points[1];
    const Vec3 after_last = points[n - 1] * 2.0f - points[n - 2];

    const size_t span_count = closed ? n : n - 1;
    BezierSpline spline;

    for (size_t i = 0; i < span_count; ++i) {
        const Vec3& p1 = points[i];
        const Vec3& p2 = points[(i + 1) % n];

        Vec3 p0;
        Vec3 p3;
        if (closed) {
            p0 = points[(i + n - 1) % n];
            p3 = points[(i + 2) % n];
        } else {
            p0 = (i > 0) ? points[i - 1] : before_first;
            p3 = (i + 2 < n) ? points[i + 2] : after_last;
        }

        auto [m1, m2] = span_tangents(p0, p1, p2, p3, config);
        spline.add_segment(CubicBezier::from_hermite(p1, m1, p2, m2));
    }

    log->debug("TrackCurve: built {} spans through {} points ({})",
               span_count, n, closed ? "closed" : "open");

    return TrackCurve(std::move(spline), n, closed, config);
}

Vec3 TrackCurve::position_at(float t) const {
    t = std::clamp(t, 0.0f, 1.0f);
    return spline_.evaluate(t * static_cast<float>(spline_.segment_count()));
}

Vec3 TrackCurve::tangent_at(float t) const {
    t = std::clamp(t, 0.0f, 1.0f);
    float global_t = t * static_cast<float>(spline_.segment_count());

    Vec3 d = spline_.derivative(global_t);
    if (d.length() > 1e-6f) {
        return d.normalized();
    }

    // Stationary point (duplicate waypoints): fall back to the span chord
    size_t index = std::min(static_cast<size_t>(global_t), spline_.segment_count() - 1);
    const CubicBezier& span = spline_.segments()[index];
    return (span.end() - span.start()).normalized_or(vec3::unit_x(), 1e-6f);
}

std::vector<CurveSample> TrackCurve::sample(int count) const {
    count = std::max(count, 1);

    std::vector<CurveSample> samples;
    samples.reserve(static_cast<size_t>(count) + 1);

    for (int i = 0; i <= count; ++i) {
        float t = static_cast<float>(i) / static_cast<float>(count);
        samples.push_back(CurveSample{t, position_at(t), tangent_at(t)});
    }

    return samples;
}

std::optional<TrackCurve> get_track_curve(const WaypointSequence& points,
                                          bool closed,
                                          const CurveConfig& config) {
    return TrackCurve::build(points.positions(), closed, config);
}

}  // namespace coasterpath
