#include <gtest/gtest.h>
#include "../app/run_app.hpp"
#include "io/field_serializer.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace Cradial;

namespace {

class RunAppTest : public ::testing::Test {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        dir = std::filesystem::temp_directory_path() / "cradial_run_app_test";
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }

    // value = lon - 2 * lat on a 1 degree grid
    std::string write_plane_field() const {
        GeoField field;
        std::vector<double> lons, lats;
        for (int lon = -130; lon <= -70; ++lon) lons.push_back(lon);
        for (int lat = 20; lat <= 60; ++lat) lats.push_back(lat);
        field.set_axes(lons, lats);
        field.set_shape({static_cast<uint_t>(lons.size()), static_cast<uint_t>(lats.size())});
        for (size_t i = 0; i < lons.size(); ++i) {
            for (size_t j = 0; j < lats.size(); ++j) {
                field.set_value(i, j, 0, lons[i] - 2.0 * lats[j]);
            }
        }
        std::string path = (dir / "plane.crg").string();
        io::BinaryFieldSerializer serializer;
        serializer.save_field(field, path);
        return path;
    }

    std::string write_config(const std::string& text) const {
        std::string path = (dir / "run.ini").string();
        std::ofstream out(path);
        out << text;
        return path;
    }

    static std::vector<std::string> read_lines(const std::string& path) {
        std::ifstream in(path);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line)) lines.push_back(line);
        return lines;
    }
};

} // namespace

TEST_F(RunAppTest, SingleCenterWritesCsv) {
    std::string field_path = write_plane_field();
    std::string output_path = (dir / "single.csv").string();
    std::string config_path = write_config(
        "[Field]\nfile_path = " + field_path + "\n"
        "[Center]\nlat = 40\nlon = -100\n"
        "[Web]\nradius_steps = 0, 100, 200\ndegree_steps = 0, 90, 180, 270\n"
        "[Output]\nfile_path = " + output_path + "\nwrite_coordinates = true\n");

    EXPECT_EQ(cradial::app::run(config_path), 0);

    std::vector<std::string> lines = read_lines(output_path);
    ASSERT_EQ(lines.size(), 13u);
    EXPECT_EQ(lines[0], "point,ring_km,bearing_deg,lat,lon,value");
    EXPECT_EQ(lines[1], "0,0,0,40,-100,-180");
}

TEST_F(RunAppTest, MultiCenterWritesCsv) {
    std::string field_path = write_plane_field();
    std::string output_path = (dir / "multi.csv").string();
    std::string config_path = write_config(
        "[Field]\nfile_path = " + field_path + "\nformat = binary\n"
        "[Center]\nlat = 35, 45\nlon = -110, -90\n"
        "[Web]\nradius_steps = 50\ndegree_steps = 0, 180\n"
        "[Output]\nfile_path = " + output_path + "\n");

    EXPECT_EQ(cradial::app::run(config_path), 0);

    // 4 centers x (origin + 2 points) plus the header
    std::vector<std::string> lines = read_lines(output_path);
    ASSERT_EQ(lines.size(), 13u);
    EXPECT_EQ(lines[0], "center_lat,center_lon,point,ring_km,bearing_deg,value");
    EXPECT_EQ(lines[1], "35,-110,0,0,0,-180");
}

TEST_F(RunAppTest, FailuresReturnOne) {
    EXPECT_EQ(cradial::app::run((dir / "missing.ini").string()), 1);

    std::string output_path = (dir / "never.csv").string();
    std::string missing_field = write_config(
        "[Field]\nfile_path = " + (dir / "missing.crg").string() + "\n"
        "[Center]\nlat = 40\nlon = -100\n"
        "[Web]\nradius_steps = 0\ndegree_steps = 0\n"
        "[Output]\nfile_path = " + output_path + "\n");
    EXPECT_EQ(cradial::app::run(missing_field), 1);

    std::string field_path = write_plane_field();
    std::string outside = write_config(
        "[Field]\nfile_path = " + field_path + "\n"
        "[Center]\nlat = 59\nlon = -100\n"
        "[Web]\nradius_steps = 0, 500\ndegree_steps = 0\n"
        "[Output]\nfile_path = " + output_path + "\n");
    EXPECT_EQ(cradial::app::run(outside), 1);
    EXPECT_FALSE(std::filesystem::exists(output_path));

    EXPECT_EQ(cradial::app::run(write_config("[Field]\n")), 1);
}
