#ifndef COASTERPATH_TRACK_POINT_ID_GENERATOR_HPP
#define COASTERPATH_TRACK_POINT_ID_GENERATOR_HPP

#include <track/track_point.hpp>
#include <cstdint>
#include <string>

namespace coasterpath {

// Monotonic id source owned by a waypoint sequence.
// Ids are never reused, even after the points they named are removed.
class PointIdGenerator {
public:
    PointIdGenerator() = default;

    PointId next() {
        return format(++last_issued_);
    }

    uint64_t last_issued() const { return last_issued_; }

    static PointId format(uint64_t counter) {
        return "point-" + std::to_string(counter);
    }

private:
    uint64_t last_issued_ = 0;
};

}  // namespace coasterpath

#endif // COASTERPATH_TRACK_POINT_ID_GENERATOR_HPP
