#ifndef CRADIAL_TEXT_GRID_LOADER_HPP
#define CRADIAL_TEXT_GRID_LOADER_HPP

#include "../src/fields/geo_field.hpp"
#include <string>
#include <istream>
#include <memory>

namespace cradial {
namespace app {

// Whitespace separated text grid:
//   nlon nlat [ntime]
//   lon_0 ... lon_{nlon-1}
//   lat_0 ... lat_{nlat-1}
//   one line per (lon, lat) node, lon-major, holding ntime values (1 for 2D)
// '#' starts a comment line; blank lines are ignored.
class TextGridLoader {
public:
    TextGridLoader() = default;

    std::unique_ptr<Cradial::GeoField> load(const std::string& file_path);
    std::unique_ptr<Cradial::GeoField> load(std::istream& input, const std::string& source_name);

private:
    bool read_next_significant_line(std::istream& input, std::string& line, int& current_line_num);
    std::vector<double> read_numbers(std::istream& input, size_t expected, const std::string& what,
                                     const std::string& source_name, int& line_num);
};

} // namespace app
} // namespace cradial

#endif // CRADIAL_TEXT_GRID_LOADER_HPP
