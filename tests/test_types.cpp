#include <gtest/gtest.h>
#include "core/radial_types.hpp"
#include <stdexcept>

using namespace Cradial;

TEST(TypesTest, EnumStringsRoundTrip) {
    EXPECT_EQ(interp_method_from_string("LINEAR"), InterpMethod::LINEAR);
    EXPECT_EQ(interp_method_from_string(to_string(InterpMethod::NEAREST)), InterpMethod::NEAREST);
    EXPECT_EQ(distance_model_from_string("Great_Circle"), DistanceModel::GREAT_CIRCLE);
    EXPECT_EQ(to_string(DistanceModel::GEODESIC), "geodesic");
    EXPECT_THROW(interp_method_from_string("cubic"), std::invalid_argument);
    EXPECT_THROW(distance_model_from_string("vincenty"), std::invalid_argument);
}

TEST(TypesTest, MakeStepsIsHalfOpen) {
    std::vector<double> rings = make_steps(0.0, 1501.0, 100.0);
    ASSERT_EQ(rings.size(), 16u);
    EXPECT_DOUBLE_EQ(rings.front(), 0.0);
    EXPECT_DOUBLE_EQ(rings.back(), 1500.0);

    std::vector<double> bearings = make_steps(0.0, 360.0, 10.0);
    ASSERT_EQ(bearings.size(), 36u);
    EXPECT_DOUBLE_EQ(bearings.back(), 350.0);
}

TEST(TypesTest, MakeStepsEdgeCases) {
    EXPECT_TRUE(make_steps(5.0, 5.0, 1.0).empty());
    EXPECT_TRUE(make_steps(5.0, 0.0, 1.0).empty());
    EXPECT_EQ(make_steps(3.0, 0.0, -1.0).size(), 3u);
    EXPECT_THROW(make_steps(0.0, 1.0, 0.0), std::invalid_argument);
}
