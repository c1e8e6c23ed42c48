#include <gtest/gtest.h>
#include <projection/projection.hpp>
#include <common/errors.hpp>
#include <cmath>

using namespace widepath;

TEST(NationalGridProjector, CentralLondon) {
    NationalGridProjector projector;
    LatLon wgs = projector.project(530000.0, 180000.0);
    EXPECT_NEAR(wgs.lat, 51.504, 0.001);
    EXPECT_NEAR(wgs.lon, -0.128, 0.001);
}

TEST(NationalGridProjector, OrdnanceSurveyWorkedExampleNearOsgb36) {
    // E 651409.903, N 313177.270 is 52 39' 27.2531" N, 1 43' 4.5177" E on OSGB36;
    // the WGS84 position differs from it by at most ~120 m.
    NationalGridProjector projector;
    LatLon wgs = projector.project(651409.903, 313177.270);
    EXPECT_NEAR(wgs.lat, 52.0 + 39.0 / 60.0 + 27.2531 / 3600.0, 0.002);
    EXPECT_NEAR(wgs.lon, 1.0 + 43.0 / 60.0 + 4.5177 / 3600.0, 0.003);
}

TEST(NationalGridProjector, OutsideGridIsError) {
    NationalGridProjector projector;
    EXPECT_THROW(projector.project(530000.0, 1e13), ProjectionError);
    EXPECT_THROW(projector.project(-5000.0, 180000.0), ProjectionError);
    EXPECT_THROW(projector.project(530000.0, std::nan("")), ProjectionError);
}

TEST(LinearGridProjector, DocumentedFormula) {
    LinearGridProjector projector;
    LatLon origin = projector.project(400000.0, -100000.0);
    EXPECT_DOUBLE_EQ(origin.lat, 49.0);
    EXPECT_DOUBLE_EQ(origin.lon, -2.0);

    LatLon london = projector.project(530000.0, 180000.0);
    EXPECT_DOUBLE_EQ(london.lat, 49.0 + 280000.0 / 111320.0);
    EXPECT_DOUBLE_EQ(london.lon, -2.0 + 130000.0 / (111320.0 * 0.68));
}

TEST(ProjectionMode, FactoryAndNames) {
    EXPECT_EQ(projection_mode_from_string("precise"), ProjectionMode::Precise);
    EXPECT_EQ(projection_mode_from_string("approximate"), ProjectionMode::Approximate);
    EXPECT_THROW(projection_mode_from_string("mercator"), ConfigError);

    EXPECT_STREQ(make_projector(ProjectionMode::Precise)->name(), "precise");
    EXPECT_STREQ(make_projector(ProjectionMode::Approximate)->name(), "approximate");
    EXPECT_STREQ(to_string(ProjectionMode::Approximate), "approximate");
}
