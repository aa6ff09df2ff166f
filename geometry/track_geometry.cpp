#include "track_geometry.hpp"
#include <common/logging.hpp>
#include <algorithm>

namespace coasterpath {

TrackGeometry::TrackGeometry(TrackCurve curve, std::vector<CurveSample> samples, RailGeometry rails)
    : curve_(std::move(curve))
    , samples_(std::move(samples))
    , rails_(std::move(rails))
    , arc_length_(curve_.arc_length()) {}

std::optional<TrackGeometry> TrackGeometry::from_state(const TrackState& state,
                                                       const TrackConfig& config) {
    return from_points(state.points, state.is_looped, config);
}

std::optional<TrackGeometry> TrackGeometry::from_points(const WaypointSequence& points,
                                                        bool closed,
                                                        const TrackConfig& config) {
    auto log = logging::get_logger();

    auto curve = get_track_curve(points, closed, config.curve);
    if (!curve) {
        log->debug("TrackGeometry: {} point(s), nothing to build", points.size());
        return std::nullopt;
    }

    auto samples = curve->sample();
    auto rails = project_rails(samples, curve->point_count(), config.rails);

    log->debug("TrackGeometry: {} samples over {} spans", samples.size(), curve->span_count());
    return TrackGeometry(std::move(*curve), std::move(samples), std::move(rails));
}

std::pair<Vec3, Vec3> TrackGeometry::bounding_box() const {
    if (samples_.empty()) {
        return {vec3::zero(), vec3::zero()};
    }

    Vec3 min_pt = samples_[0].position;
    Vec3 max_pt = samples_[0].position;

    for (const auto& s : samples_) {
        min_pt.x = std::min(min_pt.x, s.position.x);
        min_pt.y = std::min(min_pt.y, s.position.y);
        min_pt.z = std::min(min_pt.z, s.position.z);
        max_pt.x = std::max(max_pt.x, s.position.x);
        max_pt.y = std::max(max_pt.y, s.position.y);
        max_pt.z = std::max(max_pt.z, s.position.z);
    }

    return {min_pt, max_pt};
}

}  // namespace coasterpath
