#include <gtest/gtest.h>
#include <track/track_state.hpp>
#include "test_helpers.hpp"

using namespace coasterpath;

namespace {

TrackState state_with_points(size_t n) {
    TrackState state;
    state.points = test::straight_track(n);
    return state;
}

}  // namespace

TEST(TrackStateTest, DefaultState) {
    TrackState state;
    EXPECT_TRUE(state.points.empty());
    EXPECT_FALSE(state.selected_point.has_value());
    EXPECT_EQ(state.mode, CoasterMode::Build);
    EXPECT_FLOAT_EQ(state.ride_progress, 0.0f);
    EXPECT_FALSE(state.is_riding);
    EXPECT_FLOAT_EQ(state.ride_speed, 1.0f);
    EXPECT_FALSE(state.is_looped);
}

TEST(TrackStateTest, TransitionsDoNotTouchInput) {
    TrackState before = state_with_points(2);
    TrackState after = add_track_point(before, Vec3(10.0f, 0.0f, 0.0f));
    EXPECT_EQ(before.points.size(), 2u);
    EXPECT_EQ(after.points.size(), 3u);
}

TEST(TrackStateTest, RemoveSelectedClearsSelection) {
    TrackState state = state_with_points(3);
    state = select_point(std::move(state), PointId("point-2"));
    ASSERT_EQ(state.selected_point, "point-2");

    state = remove_track_point(std::move(state), "point-2");
    EXPECT_FALSE(state.selected_point.has_value());
    EXPECT_EQ(state.points.size(), 2u);
}

TEST(TrackStateTest, RemoveOtherKeepsSelection) {
    TrackState state = state_with_points(3);
    state = select_point(std::move(state), PointId("point-1"));
    state = remove_track_point(std::move(state), "point-3");
    EXPECT_EQ(state.selected_point, "point-1");
}

TEST(TrackStateTest, SelectUnknownIsNoOp) {
    TrackState state = state_with_points(2);
    state = select_point(std::move(state), PointId("point-1"));
    state = select_point(std::move(state), PointId("point-42"));
    EXPECT_EQ(state.selected_point, "point-1");

    state = select_point(std::move(state), std::nullopt);
    EXPECT_FALSE(state.selected_point.has_value());
}

TEST(TrackStateTest, SelectCommandNeverLeavesDanglingSelection) {
    TrackConfig config;
    TrackState state = state_with_points(2);
    state = apply(std::move(state), command::SelectPoint{PointId("point-2")}, config);
    state = apply(std::move(state), command::SelectPoint{PointId("point-7")}, config);
    EXPECT_EQ(state.selected_point, "point-2");

    TrackState empty;
    empty = apply(std::move(empty), command::SelectPoint{PointId("point-1")}, config);
    EXPECT_FALSE(empty.selected_point.has_value());
}

TEST(TrackStateTest, ClearResetsTrackAndPlayback) {
    TrackState state = state_with_points(3);
    state = select_point(std::move(state), PointId("point-1"));
    state = start_ride(std::move(state));
    state = set_ride_progress(std::move(state), 0.4f);

    state = clear_track(std::move(state));
    EXPECT_TRUE(state.points.empty());
    EXPECT_FALSE(state.selected_point.has_value());
    EXPECT_FLOAT_EQ(state.ride_progress, 0.0f);
    EXPECT_FALSE(state.is_riding);

    // Ids keep counting after a clear
    state = add_track_point(std::move(state), Vec3(0.0f, 0.0f, 0.0f));
    EXPECT_EQ(state.points.front().id, "point-4");
}

TEST(TrackStateTest, StartRideNeedsTwoPoints) {
    TrackState state = state_with_points(1);
    state = start_ride(std::move(state));
    EXPECT_FALSE(state.is_riding);
    EXPECT_EQ(state.mode, CoasterMode::Build);

    state = add_track_point(std::move(state), Vec3(5.0f, 0.0f, 0.0f));
    state = start_ride(std::move(state));
    EXPECT_TRUE(state.is_riding);
    EXPECT_EQ(state.mode, CoasterMode::Ride);
    EXPECT_FLOAT_EQ(state.ride_progress, 0.0f);
}

TEST(TrackStateTest, StopRideReturnsToBuild) {
    TrackState state = start_ride(state_with_points(2));
    state = set_ride_progress(std::move(state), 0.7f);
    state = stop_ride(std::move(state));
    EXPECT_FALSE(state.is_riding);
    EXPECT_EQ(state.mode, CoasterMode::Build);
    EXPECT_FLOAT_EQ(state.ride_progress, 0.0f);
}

TEST(TrackStateTest, RideProgressAndSpeedAreClamped) {
    TrackState state;
    state = set_ride_progress(std::move(state), 1.5f);
    EXPECT_FLOAT_EQ(state.ride_progress, 1.0f);
    state = set_ride_progress(std::move(state), -0.5f);
    EXPECT_FLOAT_EQ(state.ride_progress, 0.0f);

    state = set_ride_speed(std::move(state), -2.0f);
    EXPECT_FLOAT_EQ(state.ride_speed, 0.0f);
    state = set_ride_speed(std::move(state), 2.5f);
    EXPECT_FLOAT_EQ(state.ride_speed, 2.5f);
}

TEST(TrackStateTest, CreateLoopGrowsTrack) {
    TrackState state = state_with_points(3);
    state = create_loop_at_point(std::move(state), "point-2", LoopConfig{});
    EXPECT_EQ(state.points.size(), 28u);

    state = create_loop_at_point(std::move(state), "point-999", LoopConfig{});
    EXPECT_EQ(state.points.size(), 28u);
}

TEST(TrackStateTest, CreateLoopDropsReplacedSelection) {
    // Anchor point-2 with three followers skips point-3 and point-4
    TrackState state = state_with_points(5);
    state = select_point(std::move(state), PointId("point-3"));
    state = create_loop_at_point(std::move(state), "point-2", LoopConfig{});
    EXPECT_FALSE(state.selected_point.has_value());
    EXPECT_FALSE(state.points.find_index("point-3").has_value());
    EXPECT_TRUE(state.points.find_index("point-5").has_value());
}

TEST(TrackStateTest, ApplyDispatchesCommands) {
    TrackConfig config;
    std::vector<TrackCommand> script{
        command::AddPoint{Vec3(0.0f, 0.0f, 0.0f)},
        command::AddPoint{Vec3(5.0f, 0.0f, 0.0f)},
        command::AddPoint{Vec3(10.0f, 0.0f, 0.0f)},
        command::UpdatePoint{"point-3", Vec3(10.0f, 2.0f, 0.0f)},
        command::UpdateTilt{"point-1", 0.1f},
        command::SetLooped{true},
        command::SetMode{CoasterMode::Preview},
        command::SelectPoint{PointId("point-2")},
        command::SetRideSpeed{3.0f},
    };

    TrackState state = replay(script, config);
    EXPECT_EQ(state.points.size(), 3u);
    EXPECT_EQ(state.points[2].position, Vec3(10.0f, 2.0f, 0.0f));
    EXPECT_FLOAT_EQ(state.points[0].tilt, 0.1f);
    EXPECT_TRUE(state.is_looped);
    EXPECT_EQ(state.mode, CoasterMode::Preview);
    EXPECT_EQ(state.selected_point, "point-2");
    EXPECT_FLOAT_EQ(state.ride_speed, 3.0f);

    state = apply(std::move(state), command::CreateLoop{"point-2"}, config);
    EXPECT_EQ(state.points.size(), 28u);

    state = apply(std::move(state), command::StartRide{}, config);
    state = apply(std::move(state), command::SetRideProgress{0.5f}, config);
    EXPECT_TRUE(state.is_riding);
    EXPECT_FLOAT_EQ(state.ride_progress, 0.5f);

    state = apply(std::move(state), command::StopRide{}, config);
    state = apply(std::move(state), command::RemovePoint{"point-1"}, config);
    state = apply(std::move(state), command::ClearTrack{}, config);
    EXPECT_TRUE(state.points.empty());
}

TEST(TrackStateTest, CommandNames) {
    EXPECT_EQ(command_name(command::AddPoint{}), "add");
    EXPECT_EQ(command_name(command::CreateLoop{"point-1"}), "loop");
    EXPECT_EQ(command_name(command::SetRideSpeed{}), "ride_speed");
}
