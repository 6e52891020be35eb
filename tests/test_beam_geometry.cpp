#include <gtest/gtest.h>

#include "geometry/beam_geometry.h"

using namespace DoseProfile;

namespace {

BeamGeometry beamAt(double gantry)
{
    BeamGeometry beam;
    beam.isocenter = cv::Vec3d(0.0, 0.0, 0.0);
    beam.gantryAngle = gantry;
    beam.ssd = 1010.0;
    beam.sad = 1000.0;
    return beam;
}

} // namespace

TEST(BeamGeometryTest, ZeroPointAtGantryZero) {
    const auto zero = beamAt(0.0).deriveZeroPoint();
    ASSERT_TRUE(zero.has_value());
    EXPECT_NEAR((*zero)[0], 0.0, 1e-12);
    EXPECT_NEAR((*zero)[1], 10.0, 1e-12);
    EXPECT_NEAR((*zero)[2], 0.0, 1e-12);
}

TEST(BeamGeometryTest, ZeroPointAtGantry180) {
    const auto zero = beamAt(180.0).deriveZeroPoint();
    ASSERT_TRUE(zero.has_value());
    EXPECT_NEAR((*zero)[0], 0.0, 1e-9);
    EXPECT_NEAR((*zero)[1], -10.0, 1e-9);
    EXPECT_NEAR((*zero)[2], 0.0, 1e-12);
}

TEST(BeamGeometryTest, ZeroPointAtGantry90KeepsIsocenterZ) {
    BeamGeometry beam = beamAt(90.0);
    beam.isocenter = cv::Vec3d(5.0, -3.0, 42.0);
    const auto zero = beam.deriveZeroPoint();
    ASSERT_TRUE(zero.has_value());
    EXPECT_NEAR((*zero)[0], -5.0, 1e-9);
    EXPECT_NEAR((*zero)[1], -3.0, 1e-9);
    EXPECT_DOUBLE_EQ((*zero)[2], 42.0);
}

TEST(BeamGeometryTest, UnavailableWhenAnyParameterMissing) {
    BeamGeometry noSsd = beamAt(0.0);
    noSsd.ssd.reset();
    EXPECT_FALSE(noSsd.isComplete());
    EXPECT_FALSE(noSsd.deriveZeroPoint().has_value());

    BeamGeometry noSad = beamAt(0.0);
    noSad.sad.reset();
    EXPECT_FALSE(noSad.deriveZeroPoint().has_value());

    BeamGeometry noIso = beamAt(0.0);
    noIso.isocenter.reset();
    EXPECT_FALSE(noIso.deriveZeroPoint().has_value());

    EXPECT_FALSE(BeamGeometry().deriveZeroPoint().has_value());
}
