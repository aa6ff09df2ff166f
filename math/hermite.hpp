#ifndef COASTERPATH_MATH_HERMITE_HPP
#define COASTERPATH_MATH_HERMITE_HPP

#include <math/vec3.hpp>
#include <vector>

namespace coasterpath {

// Endpoint data for one cubic Hermite span.
// Tangents are directions; their magnitude is supplied by `tangent_scale`
// so callers can keep unit tangents and pick the span-dependent length.
struct HermiteSpan {
    Vec3 p0;
    Vec3 t0;
    Vec3 p1;
    Vec3 t1;
    float tangent_scale = 1.0f;

    // Usual heuristic: half the chord length keeps curvature proportional to span
    static HermiteSpan with_chord_scale(const Vec3& p0, const Vec3& t0,
                                        const Vec3& p1, const Vec3& t1) {
        return HermiteSpan{p0, t0, p1, t1, 0.5f * p0.distance_to(p1)};
    }
};

// Cubic Hermite interpolation at s in [0, 1]
inline Vec3 hermite(const Vec3& p0, const Vec3& t0,
                    const Vec3& p1, const Vec3& t1,
                    float s, float tangent_scale) {
    float s2 = s * s;
    float s3 = s2 * s;

    float h00 = 2.0f * s3 - 3.0f * s2 + 1.0f;
    float h10 = s3 - 2.0f * s2 + s;
    float h01 = -2.0f * s3 + 3.0f * s2;
    float h11 = s3 - s2;

    return p0 * h00 + t0 * (h10 * tangent_scale) +
           p1 * h01 + t1 * (h11 * tangent_scale);
}

// Derivative with respect to s
inline Vec3 hermite_derivative(const Vec3& p0, const Vec3& t0,
                               const Vec3& p1, const Vec3& t1,
                               float s, float tangent_scale) {
    float s2 = s * s;

    float d00 = 6.0f * s2 - 6.0f * s;
    float d10 = 3.0f * s2 - 4.0f * s + 1.0f;
    float d01 = -6.0f * s2 + 6.0f * s;
    float d11 = 3.0f * s2 - 2.0f * s;

    return p0 * d00 + t0 * (d10 * tangent_scale) +
           p1 * d01 + t1 * (d11 * tangent_scale);
}

inline Vec3 hermite(const HermiteSpan& span, float s) {
    return hermite(span.p0, span.t0, span.p1, span.t1, s, span.tangent_scale);
}

inline Vec3 hermite_derivative(const HermiteSpan& span, float s) {
    return hermite_derivative(span.p0, span.t0, span.p1, span.t1, s, span.tangent_scale);
}

// Sample a span at the given parameters (endpoints are only included
// when the caller asks for s = 0 or s = 1)
inline std::vector<Vec3> sample_hermite(const HermiteSpan& span,
                                        const std::vector<float>& params) {
    std::vector<Vec3> points;
    points.reserve(params.size());
    for (float s : params) {
        points.push_back(hermite(span, s));
    }
    return points;
}

// Smoothstep easing 3t^2 - 2t^3, zero slope at both ends
constexpr float smoothstep(float t) {
    return t * t * (3.0f - 2.0f * t);
}

}  // namespace coasterpath

#endif // COASTERPATH_MATH_HERMITE_HPP
