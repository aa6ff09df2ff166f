#include <gtest/gtest.h>
#include <geometry/rail_projector.hpp>
#include "test_helpers.hpp"
#include <numbers>

using namespace coasterpath;
using coasterpath::test::expect_vec3_near;

TEST(RailNormalTest, LevelPerpendicular) {
    expect_vec3_near(rail_normal(vec3::unit_x(), vec3::unit_z(), 0.1f), vec3::unit_z());
    expect_vec3_near(rail_normal(vec3::unit_z(), vec3::unit_z(), 0.1f), Vec3(-1.0f, 0.0f, 0.0f));

    // Climbing does not tilt the normal
    Vec3 n = rail_normal(Vec3(0.6f, 0.8f, 0.0f), vec3::unit_z(), 0.1f);
    expect_vec3_near(n, vec3::unit_z());
}

TEST(RailNormalTest, VerticalTangentReusesFallback) {
    Vec3 fallback(-1.0f, 0.0f, 0.0f);
    expect_vec3_near(rail_normal(vec3::unit_y(), fallback, 0.1f), fallback);
}

TEST(RailProjectorTest, StraightTrackRails) {
    auto curve = get_track_curve(test::straight_track(3), false);
    ASSERT_TRUE(curve.has_value());

    RailGeometry rails = project_rails(*curve);
    ASSERT_EQ(rails.left_rail.size(), 101u);
    ASSERT_EQ(rails.right_rail.size(), 101u);
    ASSERT_EQ(rails.normals.size(), 101u);

    for (size_t i = 0; i < rails.left_rail.size(); ++i) {
        EXPECT_NEAR(rails.left_rail[i].z, 0.3f, 1e-4f);
        EXPECT_NEAR(rails.right_rail[i].z, -0.3f, 1e-4f);
        EXPECT_NEAR(rails.left_rail[i].y, 0.0f, 1e-4f);
        EXPECT_NEAR(rails.right_rail[i].y, 0.0f, 1e-4f);
    }
}

TEST(RailProjectorTest, NoSupportsAtGroundLevel) {
    auto curve = get_track_curve(test::straight_track(3), false);
    ASSERT_TRUE(curve.has_value());
    EXPECT_TRUE(project_rails(*curve).supports.empty());
}

TEST(RailProjectorTest, SupportsUnderRaisedTrack) {
    auto curve = get_track_curve(test::straight_track(3, 5.0f, 2.0f), false);
    ASSERT_TRUE(curve.has_value());

    RailGeometry rails = project_rails(*curve);
    // 100 intervals over min(3 * 2, 20) slots: every 16th sample
    ASSERT_EQ(rails.supports.size(), 7u);

    for (const auto& pillar : rails.supports) {
        EXPECT_NEAR(pillar.height, 2.0f, 1e-4f);
        EXPECT_FLOAT_EQ(pillar.base.y, 0.0f);
        EXPECT_FLOAT_EQ(pillar.base.x, pillar.top.x);
        EXPECT_FLOAT_EQ(pillar.base.z, pillar.top.z);
        EXPECT_NEAR(pillar.center().y, 1.0f, 1e-4f);
        EXPECT_FLOAT_EQ(pillar.top_radius, 0.1f);
        EXPECT_FLOAT_EQ(pillar.base_radius, 0.15f);
    }
}

TEST(RailProjectorTest, SupportsSkipLowSamples) {
    // Samples at or below the threshold never get a pillar
    std::vector<CurveSample> samples;
    for (int i = 0; i <= 10; ++i) {
        float y = (i % 2 == 0) ? 0.5f : 3.0f;
        samples.push_back(CurveSample{i / 10.0f, Vec3(static_cast<float>(i), y, 0.0f),
                                      vec3::unit_x()});
    }

    RailConfig config;
    config.supports_per_point = 10;
    RailGeometry rails = project_rails(samples, 2, config);
    ASSERT_EQ(rails.supports.size(), 5u);
    for (const auto& pillar : rails.supports) {
        EXPECT_GT(pillar.top.y, 0.5f);
    }
}

TEST(RailProjectorTest, SupportIntervalCapped) {
    RailConfig config;
    EXPECT_EQ(config.support_interval(100, 3), 16);
    EXPECT_EQ(config.support_interval(400, 50), 20);
    EXPECT_EQ(config.support_interval(3, 10), 1);

    config.max_supports = 0;
    EXPECT_EQ(config.support_interval(100, 3), 0);
}

TEST(RailProjectorTest, Crossties) {
    auto curve = get_track_curve(test::straight_track(3), false);
    ASSERT_TRUE(curve.has_value());

    RailGeometry rails = project_rails(*curve);
    ASSERT_EQ(rails.crossties.size(), 21u);
    for (const auto& tie : rails.crossties) {
        EXPECT_NEAR(tie.yaw, std::numbers::pi_v<float> / 2.0f, 1e-4f);
        EXPECT_NEAR(tie.center.y, -0.1f, 1e-4f);
        EXPECT_FLOAT_EQ(tie.width, 1.2f);
    }

    RailConfig config;
    config.crosstie_interval = 0;
    EXPECT_TRUE(project_rails(*curve, config).crossties.empty());
}

TEST(RailProjectorTest, VerticalStretchCarriesNormal) {
    std::vector<CurveSample> samples{
        {0.0f, Vec3(0.0f, 0.0f, 0.0f), vec3::unit_z()},
        {0.5f, Vec3(0.0f, 1.0f, 0.0f), vec3::unit_y()},
        {1.0f, Vec3(0.0f, 2.0f, 0.0f), vec3::unit_y()},
    };
    RailGeometry rails = project_rails(samples, 2);
    expect_vec3_near(rails.normals[1], Vec3(-1.0f, 0.0f, 0.0f));
    expect_vec3_near(rails.normals[2], Vec3(-1.0f, 0.0f, 0.0f));
}

TEST(RailProjectorTest, EmptySamples) {
    RailGeometry rails = project_rails(std::vector<CurveSample>{}, 0);
    EXPECT_TRUE(rails.left_rail.empty());
    EXPECT_TRUE(rails.supports.empty());
}
