#ifndef COASTERPATH_GEOMETRY_TRACK_CURVE_HPP
#define COASTERPATH_GEOMETRY_TRACK_CURVE_HPP

#include <math/vec3.hpp>
#include "cubic_bezier.hpp"
#include <track/waypoint_sequence.hpp>
#include <optional>
#include <vector>

namespace coasterpath {

// Catmull-Rom flavours. CatmullRom is the uniform form weighted by
// `tension`; Centripetal and Chordal parameterize each span by
// |p_i+1 - p_i|^0.5 and |p_i+1 - p_i| respectively.
enum class CurveType {
    CatmullRom,
    Centripetal,
    Chordal
};

struct CurveConfig {
    CurveType type = CurveType::CatmullRom;
    float tension = 0.5f;
    int samples_per_point = 20;
    int min_samples = 100;

    // Render/traversal resolution for a track of `point_count` points
    int sample_count(size_t point_count) const;
};

// One sample along the curve
struct CurveSample {
    float t = 0.0f;     // Uniform curve parameter in [0, 1]
    Vec3 position;
    Vec3 tangent;       // Unit length
};

// Interpolating spline through every waypoint position, in order.
// The parameter t in [0, 1] is spread uniformly over the spans
// (each span gets 1/span_count), not over arc length.
class TrackCurve {
public:
    // Returns nullopt for fewer than two points
    static std::optional<TrackCurve> build(const std::vector<Vec3>& points,
                                           bool closed,
                                           const CurveConfig& config = CurveConfig{});

    Vec3 position_at(float t) const;
    Vec3 tangent_at(float t) const;

    // count + 1 samples at t = i / count
    std::vector<CurveSample> sample(int count) const;

    // Samples at the configured resolution
    std::vector<CurveSample> sample() const { return sample(default_sample_count()); }

    int default_sample_count() const { return config_.sample_count(point_count_); }

    size_t point_count() const { return point_count_; }
    size_t span_count() const { return spline_.segment_count(); }
    bool closed() const { return closed_; }
    const BezierSpline& spline() const { return spline_; }
    const CurveConfig& config() const { return config_; }

    float arc_length(int samples_per_span = 20) const {
        return spline_.total_arc_length(samples_per_span);
    }

    float max_curvature(int samples_per_span = 10) const {
        return spline_.max_curvature(samples_per_span);
    }

private:
    TrackCurve(BezierSpline spline, size_t point_count, bool closed, const CurveConfig& config);

    BezierSpline spline_;
    size_t point_count_ = 0;
    bool closed_ = false;
    CurveConfig config_;
};

// Curve through the positions of a waypoint sequence
std::optional<TrackCurve> get_track_curve(const WaypointSequence& points,
                                          bool closed,
                                          const CurveConfig& config = CurveConfig{});

}  // namespace coasterpath

#endif // COASTERPATH_GEOMETRY_TRACK_CURVE_HPP
