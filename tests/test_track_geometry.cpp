#include <gtest/gtest.h>
#include <geometry/track_geometry.hpp>
#include <geometry/ride_sampler.hpp>
#include "test_helpers.hpp"
#include <numbers>

using namespace coasterpath;
using coasterpath::test::expect_vec3_near;

// ============================================
// TrackGeometry Tests
// ============================================

TEST(TrackGeometryTest, NothingForSinglePoint) {
    TrackState state;
    state.points = test::straight_track(1);
    EXPECT_FALSE(TrackGeometry::from_state(state, TrackConfig{}).has_value());
}

TEST(TrackGeometryTest, StraightTrack) {
    TrackState state;
    state.points = test::straight_track(3, 5.0f, 1.0f);

    auto geometry = TrackGeometry::from_state(state, TrackConfig{});
    ASSERT_TRUE(geometry.has_value());
    EXPECT_EQ(geometry->samples().size(), 101u);
    EXPECT_EQ(geometry->rails().left_rail.size(), geometry->samples().size());
    EXPECT_NEAR(geometry->arc_length(), 10.0f, 0.01f);
    EXPECT_FALSE(geometry->curve().closed());

    auto [min_pt, max_pt] = geometry->bounding_box();
    expect_vec3_near(min_pt, Vec3(0.0f, 1.0f, 0.0f), 1e-3f);
    expect_vec3_near(max_pt, Vec3(10.0f, 1.0f, 0.0f), 1e-3f);
}

TEST(TrackGeometryTest, LoopedStateClosesCurve) {
    TrackState state;
    state.points = test::track_from({
        Vec3(0.0f, 2.0f, 0.0f), Vec3(10.0f, 2.0f, 0.0f), Vec3(10.0f, 2.0f, 10.0f),
    });
    state.is_looped = true;

    auto geometry = TrackGeometry::from_state(state, TrackConfig{});
    ASSERT_TRUE(geometry.has_value());
    EXPECT_TRUE(geometry->curve().closed());
    EXPECT_EQ(geometry->curve().span_count(), 3u);
    expect_vec3_near(geometry->samples().back().position, Vec3(0.0f, 2.0f, 0.0f), 1e-3f);
}

TEST(TrackGeometryTest, LoopTrackReachesLoopHeight) {
    TrackConfig config;
    TrackState state;
    state.points = test::straight_track(3);
    state = create_loop_at_point(std::move(state), "point-2", config.loop);

    auto geometry = TrackGeometry::from_state(state, config);
    ASSERT_TRUE(geometry.has_value());
    auto [min_pt, max_pt] = geometry->bounding_box();
    EXPECT_GT(max_pt.y, 7.5f);
    EXPECT_FALSE(geometry->rails().supports.empty());
}

// ============================================
// Ride sampling Tests
// ============================================

TEST(RideSamplerTest, FrameOnStraightTrack) {
    auto curve = get_track_curve(test::straight_track(3), false);
    ASSERT_TRUE(curve.has_value());

    RideFrame frame = ride_frame(*curve, 0.5f);
    expect_vec3_near(frame.position, Vec3(5.0f, 0.0f, 0.0f));
    expect_vec3_near(frame.tangent, vec3::unit_x());
    expect_vec3_near(frame.normal, vec3::unit_z());
    expect_vec3_near(frame.up, vec3::world_up());
    EXPECT_NEAR(frame.yaw, std::numbers::pi_v<float> / 2.0f, 1e-4f);
}

TEST(RideSamplerTest, ProgressIsClamped) {
    auto curve = get_track_curve(test::straight_track(2), false);
    ASSERT_TRUE(curve.has_value());
    EXPECT_FLOAT_EQ(ride_frame(*curve, 3.0f).progress, 1.0f);
    EXPECT_FLOAT_EQ(ride_frame(*curve, -1.0f).progress, 0.0f);
}

TEST(RideSamplerTest, FramesCoverWholeTrack) {
    auto curve = get_track_curve(test::straight_track(4), false);
    ASSERT_TRUE(curve.has_value());

    auto frames = ride_frames(*curve, 10);
    ASSERT_EQ(frames.size(), 11u);
    expect_vec3_near(frames.front().position, Vec3(0.0f, 0.0f, 0.0f));
    expect_vec3_near(frames.back().position, Vec3(15.0f, 0.0f, 0.0f));
    for (const auto& frame : frames) {
        EXPECT_NEAR(frame.up.length(), 1.0f, 1e-4f);
    }
}
