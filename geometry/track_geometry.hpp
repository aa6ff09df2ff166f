#ifndef COASTERPATH_GEOMETRY_TRACK_GEOMETRY_HPP
#define COASTERPATH_GEOMETRY_TRACK_GEOMETRY_HPP

#include "track_curve.hpp"
#include "rail_projector.hpp"
#include <track/track_state.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace coasterpath {

// Everything the renderer needs for one track: the curve, its samples
// and the rail/support layout derived from them. Rebuilt from scratch
// whenever the waypoints change.
class TrackGeometry {
public:
    // Nothing to draw for fewer than two waypoints
    static std::optional<TrackGeometry> from_state(const TrackState& state,
                                                   const TrackConfig& config);

    static std::optional<TrackGeometry> from_points(const WaypointSequence& points,
                                                    bool closed,
                                                    const TrackConfig& config);

    const TrackCurve& curve() const { return curve_; }
    const std::vector<CurveSample>& samples() const { return samples_; }
    const RailGeometry& rails() const { return rails_; }

    float arc_length() const { return arc_length_; }

    // Axis-aligned bounds of the centreline samples
    std::pair<Vec3, Vec3> bounding_box() const;

private:
    TrackGeometry(TrackCurve curve, std::vector<CurveSample> samples, RailGeometry rails);

    TrackCurve curve_;
    std::vector<CurveSample> samples_;
    RailGeometry rails_;
    float arc_length_ = 0.0f;
};

}  // namespace coasterpath

#endif // COASTERPATH_GEOMETRY_TRACK_GEOMETRY_HPP
