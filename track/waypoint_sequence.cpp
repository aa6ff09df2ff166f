#include "waypoint_sequence.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <iterator>

namespace coasterpath {

PointId WaypointSequence::add(const Vec3& position) {
    points_.push_back(create_point(position));
    return points_.back().id;
}

bool WaypointSequence::update(const PointId& id, const Vec3& position) {
    auto it = find(id);
    if (it == points_.end()) {
        logging::get_logger()->trace("update: unknown point {}", id);
        return false;
    }
    it->position = position;
    return true;
}

bool WaypointSequence::update_tilt(const PointId& id, float tilt) {
    auto it = find(id);
    if (it == points_.end()) {
        logging::get_logger()->trace("update_tilt: unknown point {}", id);
        return false;
    }
    it->tilt = tilt;
    return true;
}

bool WaypointSequence::remove(const PointId& id) {
    auto it = find(id);
    if (it == points_.end()) {
        logging::get_logger()->trace("remove: unknown point {}", id);
        return false;
    }
    points_.erase(it);
    return true;
}

void WaypointSequence::clear() {
    points_.clear();
}

TrackPoint WaypointSequence::create_point(const Vec3& position,
                                          std::optional<LoopFrame> loop_meta) {
    TrackPoint point;
    point.id = id_generator_.next();
    point.position = position;
    point.loop_meta = std::move(loop_meta);
    return point;
}

void WaypointSequence::splice(size_t first, size_t erase_count, std::vector<TrackPoint> inserted) {
    first = std::min(first, points_.size());
    erase_count = std::min(erase_count, points_.size() - first);

    auto begin = points_.begin() + static_cast<std::ptrdiff_t>(first);
    auto pos = points_.erase(begin, begin + static_cast<std::ptrdiff_t>(erase_count));
    points_.insert(pos,
                   std::make_move_iterator(inserted.begin()),
                   std::make_move_iterator(inserted.end()));
}

std::optional<size_t> WaypointSequence::find_index(const PointId& id) const {
    auto it = std::find_if(points_.begin(), points_.end(),
                           [&id](const TrackPoint& p) { return p.id == id; });
    if (it == points_.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(points_.begin(), it));
}

const TrackPoint* WaypointSequence::get(const PointId& id) const {
    auto index = find_index(id);
    if (!index) {
        return nullptr;
    }
    return &points_[*index];
}

std::vector<Vec3> WaypointSequence::positions() const {
    std::vector<Vec3> result;
    result.reserve(points_.size());
    for (const auto& p : points_) {
        result.push_back(p.position);
    }
    return result;
}

std::vector<PointId> WaypointSequence::ids() const {
    std::vector<PointId> result;
    result.reserve(points_.size());
    for (const auto& p : points_) {
        result.push_back(p.id);
    }
    return result;
}

std::vector<TrackPoint>::iterator WaypointSequence::find(const PointId& id) {
    return std::find_if(points_.begin(), points_.end(),
                        [&id](const TrackPoint& p) { return p.id == id; });
}

}  // namespace coasterpath
