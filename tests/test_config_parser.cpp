#include <gtest/gtest.h>
#include "../app/config_parser.hpp"
#include <sstream>
#include <cmath>
#include <stdexcept>

using cradial::app::Config;
using cradial::app::ConfigParser;
using cradial::app::FieldFormat;

namespace {

Config parse_text(const std::string& text) {
    std::istringstream input(text);
    ConfigParser parser;
    return parser.parse(input, "test.ini");
}

const char* MINIMAL_CONFIG =
    "[Field]\n"
    "file_path = data/t2m.crg\n"
    "[Center]\n"
    "lat = 45.5\n"
    "lon = -122.6\n"
    "[Web]\n"
    "radius_stop = 1501\n"
    "radius_step = 100\n"
    "degree_step = 10\n"
    "[Output]\n"
    "file_path = out.csv\n";

} // namespace

TEST(ConfigParserTest, MinimalConfigUsesDefaults) {
    Config config = parse_text(MINIMAL_CONFIG);
    EXPECT_EQ(config.field_path, "data/t2m.crg");
    EXPECT_EQ(config.field_format, FieldFormat::AUTO);
    ASSERT_EQ(config.center_lats.size(), 1u);
    EXPECT_DOUBLE_EQ(config.center_lats[0], 45.5);
    EXPECT_DOUBLE_EQ(config.center_lons[0], -122.6);
    ASSERT_EQ(config.radius_steps.size(), 16u);
    EXPECT_DOUBLE_EQ(config.radius_steps.back(), 1500.0);
    EXPECT_EQ(config.degree_steps.size(), 36u);
    EXPECT_EQ(config.method, Cradial::InterpMethod::LINEAR);
    EXPECT_EQ(config.distance_model, Cradial::DistanceModel::GEODESIC);
    EXPECT_TRUE(config.bounds_error);
    EXPECT_TRUE(std::isnan(config.fill_value));
    EXPECT_TRUE(config.wrap_longitude);
    EXPECT_FALSE(config.write_coordinates);
    EXPECT_FALSE(config.is_multi_center());
}

TEST(ConfigParserTest, ExplicitListsAndOptions) {
    Config config = parse_text(
        "# radial sampling of a reanalysis field\n"
        "[Field]\n"
        "file_path = grid.txt\n"
        "format = TEXT\n"
        "[Center]\n"
        "lat = 30, 40, 50   ; three latitudes\n"
        "lon = -100\n"
        "[Web]\n"
        "radius_steps = 100, 200,300\n"
        "degree_steps = 0,90,180,270\n"
        "[Interpolation]\n"
        "method = nearest\n"
        "distance_model = great_circle\n"
        "bounds_error = no\n"
        "fill_value = -999\n"
        "wrap_longitude = off\n"
        "[Output]\n"
        "file_path = multi.csv\n");
    EXPECT_EQ(config.field_format, FieldFormat::TEXT);
    EXPECT_EQ(config.center_lats, (std::vector<double>{30.0, 40.0, 50.0}));
    EXPECT_TRUE(config.is_multi_center());
    EXPECT_EQ(config.radius_steps, (std::vector<double>{100.0, 200.0, 300.0}));
    EXPECT_EQ(config.degree_steps.size(), 4u);
    EXPECT_EQ(config.method, Cradial::InterpMethod::NEAREST);
    EXPECT_EQ(config.distance_model, Cradial::DistanceModel::GREAT_CIRCLE);
    EXPECT_FALSE(config.bounds_error);
    EXPECT_DOUBLE_EQ(config.fill_value, -999.0);
    EXPECT_FALSE(config.wrap_longitude);
}

TEST(ConfigParserTest, HashInsidePathIsNotAComment) {
    std::string text = MINIMAL_CONFIG;
    text.replace(text.find("data/t2m.crg"), 12, "runs/a#1;b.crg # trailing note");
    Config config = parse_text(text);
    EXPECT_EQ(config.field_path, "runs/a#1;b.crg");

    std::string tab_comment = MINIMAL_CONFIG;
    tab_comment.replace(tab_comment.find("out.csv"), 7, "out.csv\t; csv");
    EXPECT_EQ(parse_text(tab_comment).output_path, "out.csv");
}

TEST(ConfigParserTest, MissingRequiredKeysThrow) {
    EXPECT_THROW(parse_text("[Field]\nfile_path = a\n"), std::runtime_error);

    std::string no_degrees = MINIMAL_CONFIG;
    no_degrees.replace(no_degrees.find("degree_step = 10\n"), 17, "");
    EXPECT_THROW(parse_text(no_degrees), std::runtime_error);
}

TEST(ConfigParserTest, SyntaxErrorsThrow) {
    EXPECT_THROW(parse_text("key = value\n"), std::runtime_error);
    EXPECT_THROW(parse_text("[]\n"), std::runtime_error);
    EXPECT_THROW(parse_text("[Field]\nfile_path\n"), std::runtime_error);
}

TEST(ConfigParserTest, InvalidValuesThrow) {
    std::string bad_list = MINIMAL_CONFIG;
    bad_list.replace(bad_list.find("lat = 45.5"), 10, "lat = 45.5,,46");
    EXPECT_THROW(parse_text(bad_list), std::runtime_error);

    std::string bad_bool = std::string(MINIMAL_CONFIG) + "[Interpolation]\nbounds_error = maybe\n";
    EXPECT_THROW(parse_text(bad_bool), std::runtime_error);

    std::string bad_method = std::string(MINIMAL_CONFIG) + "[Interpolation]\nmethod = cubic\n";
    EXPECT_THROW(parse_text(bad_method), std::invalid_argument);

    std::string coords_multi = MINIMAL_CONFIG;
    coords_multi.replace(coords_multi.find("lon = -122.6"), 12, "lon = -122.6, -120");
    coords_multi += "[Output]\nwrite_coordinates = true\n";
    EXPECT_THROW(parse_text(coords_multi), std::runtime_error);
}

TEST(ConfigParserTest, MissingFileThrows) {
    ConfigParser parser;
    EXPECT_THROW(parser.parse("/nonexistent/cradial.ini"), std::runtime_error);
}
