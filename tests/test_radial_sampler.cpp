#include <gtest/gtest.h>
#include "sampler/radial_sampler.hpp"
#include "numerics/geodesy.hpp"
#include <cmath>
#include <stdexcept>

using namespace Cradial;

namespace {

double plane(double lon, double lat) { return 0.5 * lon - 2.0 * lat + 7.0; }

// 1-degree global-ish grid: lon [-180, 180], lat [-80, 80]
void make_plane_field(GeoField& field, uint_t ntime = 0) {
    std::vector<double> lons = make_steps(-180.0, 180.5, 1.0);
    std::vector<double> lats = make_steps(-80.0, 80.5, 1.0);
    field.set_axes(lons, lats);
    if (ntime == 0) {
        field.set_shape({static_cast<uint_t>(lons.size()), static_cast<uint_t>(lats.size())});
    } else {
        field.set_shape({static_cast<uint_t>(lons.size()), static_cast<uint_t>(lats.size()), ntime});
    }
    for (size_t i = 0; i < lons.size(); ++i) {
        for (size_t j = 0; j < lats.size(); ++j) {
            for (size_t k = 0; k < field.get_ntime(); ++k) {
                field.set_value(i, j, k, plane(lons[i], lats[j]) + 10.0 * static_cast<double>(k));
            }
        }
    }
}

} // namespace

TEST(RadialSamplerTest, WebStartingAtCenterHasNoExtraOrigin) {
    RadialSampler sampler({0.0, 100.0}, {0.0, 90.0, 180.0, 270.0});
    EXPECT_EQ(sampler.get_points_per_web(), 8u);

    GeoPoint center(45.0, -120.0);
    RadialWeb web = sampler.build_web(center);
    ASSERT_EQ(web.size(), 8u);
    EXPECT_FALSE(web.has_origin);
    for (size_t p = 0; p < 4; ++p) {
        EXPECT_DOUBLE_EQ(web.points[p].lat, center.lat);
        EXPECT_DOUBLE_EQ(web.points[p].lon, center.lon);
    }
    // Ring-major: the second ring follows the first
    EXPECT_DOUBLE_EQ(web.ring_km[4], 100.0);
    EXPECT_DOUBLE_EQ(web.bearing_deg[5], 90.0);
    EXPECT_GT(web.points[4].lat, center.lat);
    EXPECT_GT(web.points[5].lon, center.lon);
}

TEST(RadialSamplerTest, OriginPrependedWhenFirstRingIsOffCenter) {
    RadialSampler sampler({100.0, 200.0}, {0.0, 120.0, 240.0});
    EXPECT_EQ(sampler.get_points_per_web(), 7u);

    GeoPoint center(-30.0, 150.0);
    RadialWeb web = sampler.build_web(center);
    ASSERT_EQ(web.size(), 7u);
    EXPECT_TRUE(web.has_origin);
    EXPECT_DOUBLE_EQ(web.points[0].lat, center.lat);
    EXPECT_DOUBLE_EQ(web.points[0].lon, center.lon);
    EXPECT_DOUBLE_EQ(web.ring_km[0], 0.0);
    for (size_t p = 1; p < web.size(); ++p) {
        EXPECT_NEAR(geodesy::geodesic_distance_km(center, web.points[p]), web.ring_km[p], 1e-5);
    }
}

TEST(RadialSamplerTest, PreconditionsThrow) {
    GeoField field;
    make_plane_field(field);

    RadialSampler negative({-10.0, 100.0}, {0.0});
    EXPECT_THROW(negative.sample(field, 0.0, 0.0), std::invalid_argument);
    EXPECT_THROW(negative.build_web(GeoPoint(0.0, 0.0)), std::invalid_argument);

    RadialSampler no_bearings({0.0, 100.0}, {});
    EXPECT_THROW(no_bearings.sample(field, 0.0, 0.0), std::invalid_argument);

    RadialSampler unset;
    EXPECT_THROW(unset.sample(field, 0.0, 0.0), std::invalid_argument);

    EXPECT_THROW(RadialSampler({NaN}, {0.0}), std::invalid_argument);
}

TEST(RadialSamplerTest, SingleCenterMatchesFieldAtSampleCoordinates) {
    GeoField field;
    make_plane_field(field);

    RadialSampler sampler(make_steps(0.0, 1001.0, 250.0), make_steps(0.0, 360.0, 45.0));
    sampler.set_return_coordinates(true);
    RadialSample result = sampler.sample(field, 40.0, -100.0);

    ASSERT_EQ(result.n_points, 5u * 8u);
    EXPECT_EQ(result.n_times, 1u);
    EXPECT_EQ(result.ndim, 2u);
    ASSERT_EQ(result.lats.size(), result.n_points);
    ASSERT_EQ(result.lons.size(), result.n_points);
    for (size_t p = 0; p < result.n_points; ++p) {
        EXPECT_NEAR(result.value(p), plane(result.lons[p], result.lats[p]), 1e-9);
    }
    EXPECT_NEAR(result.value(0), plane(-100.0, 40.0), 1e-12);
}

TEST(RadialSamplerTest, CoordinatesOnlyWhenRequested) {
    GeoField field;
    make_plane_field(field);
    RadialSampler sampler({0.0, 50.0}, {0.0, 180.0});
    RadialSample result = sampler.sample(field, 0.0, 0.0);
    EXPECT_TRUE(result.lats.empty());
    EXPECT_TRUE(result.lons.empty());
    EXPECT_EQ(result.values.size(), 4u);
}

TEST(RadialSamplerTest, ThreeDimensionalFieldGivesPointsByTime) {
    GeoField field;
    make_plane_field(field, 4);

    RadialSampler sampler({50.0, 150.0}, {0.0, 90.0, 180.0, 270.0});
    RadialSample result = sampler.sample(field, 10.0, 20.0);
    EXPECT_EQ(result.ndim, 3u);
    ASSERT_EQ(result.n_points, 9u);
    ASSERT_EQ(result.n_times, 4u);
    ASSERT_EQ(result.values.size(), 36u);
    for (size_t p = 0; p < result.n_points; ++p) {
        for (size_t k = 1; k < result.n_times; ++k) {
            EXPECT_NEAR(result.value(p, k) - result.value(p, 0), 10.0 * static_cast<double>(k), 1e-9);
        }
    }
    EXPECT_THROW(result.value(9, 0), std::out_of_range);
}

TEST(RadialSamplerTest, NearestMethodReturnsNodeValues) {
    GeoField field;
    make_plane_field(field);
    RadialSampler sampler({0.0, 300.0}, {45.0});
    sampler.set_method(InterpMethod::NEAREST);
    RadialSample result = sampler.sample(field, 10.0, 10.0);
    for (double v : result.values) {
        // Node values of the plane are multiples of 0.5
        EXPECT_DOUBLE_EQ(std::fmod(v * 2.0, 1.0), 0.0);
    }
}

TEST(RadialSamplerTest, OutOfBoundsFollowsBoundsSetting) {
    GeoField field;
    make_plane_field(field);
    RadialSampler sampler({0.0, 500.0}, {0.0, 180.0});

    // 500 km north of 78N leaves the grid
    EXPECT_THROW(sampler.sample(field, 78.0, 0.0), std::out_of_range);

    sampler.set_bounds_error(false);
    sampler.set_fill_value(-1.0);
    RadialSample result = sampler.sample(field, 78.0, 0.0);
    EXPECT_DOUBLE_EQ(result.value(2), -1.0);
    EXPECT_NE(result.value(3), -1.0);
}

TEST(RadialSamplerTest, LongitudeWrapsOntoZeroTo360Grid) {
    std::vector<double> lons = make_steps(0.0, 360.0, 5.0);
    std::vector<double> lats = make_steps(-60.0, 60.5, 5.0);
    GeoField field;
    field.set_axes(lons, lats);
    field.set_shape({static_cast<uint_t>(lons.size()), static_cast<uint_t>(lats.size())});
    for (size_t i = 0; i < lons.size(); ++i) {
        for (size_t j = 0; j < lats.size(); ++j) {
            field.set_value(i, j, 0, lons[i] + lats[j]);
        }
    }

    RadialSampler sampler({0.0, 200.0}, {90.0, 270.0});
    sampler.set_return_coordinates(true);
    RadialSample result = sampler.sample(field, 0.0, -170.0);
    EXPECT_NEAR(result.value(0), 190.0, 1e-9);
    EXPECT_LT(result.lons[0], 0.0); // reported coordinates stay in [-180, 180)
    EXPECT_NEAR(result.value(2), result.lons[2] + 360.0 + result.lats[2], 1e-9);

    sampler.set_wrap_longitude(false);
    EXPECT_THROW(sampler.sample(field, 0.0, -170.0), std::out_of_range);
}

TEST(RadialSamplerTest, MultiCenterShapeAndValues) {
    GeoField field;
    make_plane_field(field);

    RadialSampler sampler({100.0, 200.0}, {0.0, 90.0, 180.0, 270.0});
    std::vector<double> lats = {10.0, 20.0, 30.0};
    std::vector<double> lons = {-50.0, 60.0};
    MultiCenterSample multi = sampler.sample(field, lats, lons);

    ASSERT_EQ(multi.n_points, 9u);
    ASSERT_EQ(multi.values.size(), 2u * 3u * 9u);
    ASSERT_EQ(multi.ring_km.size(), 9u);
    for (size_t i = 0; i < lons.size(); ++i) {
        for (size_t j = 0; j < lats.size(); ++j) {
            RadialSample single = sampler.sample(field, lats[j], lons[i]);
            // Each web starts at its own center
            EXPECT_NEAR(multi.value(i, j, 0), plane(lons[i], lats[j]), 1e-12);
            for (size_t p = 0; p < multi.n_points; ++p) {
                EXPECT_DOUBLE_EQ(multi.value(i, j, p), single.value(p));
            }
        }
    }
}

TEST(RadialSamplerTest, MultiCenterPreconditions) {
    GeoField field3d;
    make_plane_field(field3d, 2);
    RadialSampler sampler({0.0, 100.0}, {0.0});
    EXPECT_THROW(sampler.sample(field3d, std::vector<double>{0.0, 1.0}, std::vector<double>{0.0}),
                 std::invalid_argument);

    GeoField field2d;
    make_plane_field(field2d);
    sampler.set_return_coordinates(true);
    EXPECT_THROW(sampler.sample(field2d, std::vector<double>{0.0, 1.0}, std::vector<double>{0.0}),
                 std::invalid_argument);

    sampler.set_return_coordinates(false);
    EXPECT_THROW(sampler.sample(field2d, std::vector<double>{}, std::vector<double>{0.0}),
                 std::invalid_argument);
}
