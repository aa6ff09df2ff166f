#include <gtest/gtest.h>
#include <math/hermite.hpp>
#include "test_helpers.hpp"

using namespace coasterpath;
using coasterpath::test::expect_vec3_near;

TEST(HermiteTest, Endpoints) {
    Vec3 p0(1.0f, 2.0f, 3.0f);
    Vec3 p1(4.0f, -1.0f, 0.0f);
    Vec3 t0 = vec3::unit_y();
    Vec3 t1 = vec3::unit_z();

    expect_vec3_near(hermite(p0, t0, p1, t1, 0.0f, 2.0f), p0);
    expect_vec3_near(hermite(p0, t0, p1, t1, 1.0f, 2.0f), p1);
}

TEST(HermiteTest, EndTangentsAreScaled) {
    Vec3 p0(0.0f, 0.0f, 0.0f);
    Vec3 p1(4.0f, 0.0f, 0.0f);
    Vec3 t0 = vec3::unit_y();
    Vec3 t1 = vec3::unit_x();

    expect_vec3_near(hermite_derivative(p0, t0, p1, t1, 0.0f, 3.0f), Vec3(0.0f, 3.0f, 0.0f));
    expect_vec3_near(hermite_derivative(p0, t0, p1, t1, 1.0f, 3.0f), Vec3(3.0f, 0.0f, 0.0f));
}

TEST(HermiteTest, StraightLineWithChordTangents) {
    // Tangent magnitude equal to the chord gives uniform parameterization
    Vec3 p0(0.0f, 0.0f, 0.0f);
    Vec3 p1(6.0f, 0.0f, 0.0f);
    Vec3 mid = hermite(p0, vec3::unit_x(), p1, vec3::unit_x(), 0.5f, 6.0f);
    expect_vec3_near(mid, Vec3(3.0f, 0.0f, 0.0f));
}

TEST(HermiteTest, ChordScaleIsHalfTheChord) {
    auto span = HermiteSpan::with_chord_scale(Vec3(0.0f, 0.0f, 0.0f), vec3::unit_x(),
                                              Vec3(3.0f, 4.0f, 0.0f), vec3::unit_x());
    EXPECT_FLOAT_EQ(span.tangent_scale, 2.5f);
}

TEST(HermiteTest, SampleAtRequestedParameters) {
    auto span = HermiteSpan::with_chord_scale(Vec3(0.0f, 0.0f, 0.0f), vec3::unit_x(),
                                              Vec3(2.0f, 0.0f, 0.0f), vec3::unit_x());
    auto points = sample_hermite(span, {0.5f, 1.0f});
    ASSERT_EQ(points.size(), 2u);
    expect_vec3_near(points[1], Vec3(2.0f, 0.0f, 0.0f));
    EXPECT_GT(points[0].x, 0.0f);
    EXPECT_LT(points[0].x, 2.0f);
}

TEST(HermiteTest, Smoothstep) {
    EXPECT_FLOAT_EQ(smoothstep(0.0f), 0.0f);
    EXPECT_FLOAT_EQ(smoothstep(0.5f), 0.5f);
    EXPECT_FLOAT_EQ(smoothstep(1.0f), 1.0f);
    static_assert(smoothstep(1.0f) == 1.0f);
}
