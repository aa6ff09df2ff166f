#ifndef COASTERPATH_TRACK_TRACK_CONFIG_HPP
#define COASTERPATH_TRACK_TRACK_CONFIG_HPP

#include <geometry/loop_synthesizer.hpp>
#include <geometry/track_curve.hpp>
#include <geometry/rail_projector.hpp>

namespace coasterpath {

// Every tunable used between the waypoint list and the renderer
struct TrackConfig {
    LoopConfig loop;
    CurveConfig curve;
    RailConfig rails;
};

}  // namespace coasterpath

#endif // COASTERPATH_TRACK_TRACK_CONFIG_HPP
