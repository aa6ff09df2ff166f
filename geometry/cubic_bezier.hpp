#ifndef COASTERPATH_GEOMETRY_CUBIC_BEZIER_HPP
#define COASTERPATH_GEOMETRY_CUBIC_BEZIER_HPP

#include <math/vec3.hpp>
#include <array>
#include <utility>
#include <vector>

namespace coasterpath {

// A single cubic Bezier curve segment
struct CubicBezier {
    std::array<Vec3, 4> control_points;

    // Constructors
    CubicBezier() = default;
    CubicBezier(const Vec3& p0, const Vec3& p1, const Vec3& p2, const Vec3& p3);

    // Evaluate position at parameter t in [0, 1]
    Vec3 evaluate(float t) const;

    // First derivative at parameter t
    Vec3 derivative(float t) const;

    // Second derivative at parameter t
    Vec3 second_derivative(float t) const;

    // Curvature at parameter t
    float curvature(float t) const;

    // Maximum curvature across the curve (sampled)
    float max_curvature(int samples = 10) const;

    // Approximate arc length (chord sum)
    float arc_length(int samples = 20) const;

    // Create from Hermite data (positions and full-magnitude tangents at endpoints)
    static CubicBezier from_hermite(const Vec3& p0, const Vec3& tangent0,
                                    const Vec3& p1, const Vec3& tangent1);

    // Access control points by name
    const Vec3& start() const { return control_points[0]; }
    const Vec3& end() const { return control_points[3]; }
};

// A spline composed of multiple Bezier segments
class BezierSpline {
public:
    BezierSpline() = default;

    void add_segment(const CubicBezier& segment);

    const std::vector<CubicBezier>& segments() const { return segments_; }
    size_t segment_count() const { return segments_.size(); }

    // Evaluate position at global parameter t in [0, segment_count]
    Vec3 evaluate(float t) const;

    // Raw derivative at global parameter t (per unit of local segment parameter)
    Vec3 derivative(float t) const;

    // Total arc length
    float total_arc_length(int samples_per_segment = 20) const;

    // Maximum curvature across all segments
    float max_curvature(int samples_per_segment = 10) const;

private:
    // Segment index and local parameter for a global parameter
    std::pair<size_t, float> locate(float t) const;

    std::vector<CubicBezier> segments_;
};

}  // namespace coasterpath

#endif // COASTERPATH_GEOMETRY_CUBIC_BEZIER_HPP
