#ifndef COASTERPATH_TRACK_WAYPOINT_SEQUENCE_HPP
#define COASTERPATH_TRACK_WAYPOINT_SEQUENCE_HPP

#include <track/track_point.hpp>
#include <track/point_id_generator.hpp>
#include <optional>
#include <vector>

namespace coasterpath {

// Ordered list of track points. Index order is traversal order and the
// only adjacency information; ids are unique for the lifetime of the
// sequence. Copies carry their id counter, so a copied sequence keeps
// issuing ids that do not collide with the original's history.
class WaypointSequence {
public:
    WaypointSequence() = default;

    // Append a point at the tail, returns its id
    PointId add(const Vec3& position);

    // Unknown ids are ignored; the return value tells whether anything changed
    bool update(const PointId& id, const Vec3& position);
    bool update_tilt(const PointId& id, float tilt);
    bool remove(const PointId& id);

    // Drops every point; the id counter keeps running
    void clear();

    // Create a point with a fresh id without inserting it
    TrackPoint create_point(const Vec3& position,
                            std::optional<LoopFrame> loop_meta = std::nullopt);

    // Replace points [first, first + erase_count) with `inserted`
    void splice(size_t first, size_t erase_count, std::vector<TrackPoint> inserted);

    std::optional<size_t> find_index(const PointId& id) const;
    const TrackPoint* get(const PointId& id) const;

    const TrackPoint& operator[](size_t index) const { return points_[index]; }
    const TrackPoint& front() const { return points_.front(); }
    const TrackPoint& back() const { return points_.back(); }

    const std::vector<TrackPoint>& points() const { return points_; }
    size_t size() const { return points_.size(); }
    bool empty() const { return points_.empty(); }

    // Positions in traversal order (the only curve input)
    std::vector<Vec3> positions() const;

    std::vector<PointId> ids() const;

    uint64_t last_issued_id() const { return id_generator_.last_issued(); }

private:
    std::vector<TrackPoint>::iterator find(const PointId& id);

    std::vector<TrackPoint> points_;
    PointIdGenerator id_generator_;
};

}  // namespace coasterpath

#endif // COASTERPATH_TRACK_WAYPOINT_SEQUENCE_HPP
