#include "text_grid_loader.hpp"
#include "config_parser.hpp" // For trim_string
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <algorithm>
#include <limits>

namespace cradial {
namespace app {

bool TextGridLoader::read_next_significant_line(std::istream& input, std::string& line, int& current_line_num) {
    while (std::getline(input, line)) {
        current_line_num++;
        line = trim_string(line);
        if (!line.empty() && line[0] != '#') {
            return true;
        }
    }
    return false;
}

std::vector<double> TextGridLoader::read_numbers(std::istream& input, size_t expected, const std::string& what,
                                                 const std::string& source_name, int& line_num) {
    std::string line;
    if (!read_next_significant_line(input, line, line_num)) {
        throw std::runtime_error("Premature end of text grid " + source_name + ": expected " + what + ".");
    }
    std::istringstream data_ss(line);
    std::vector<double> values;
    values.reserve(expected);
    for (size_t n = 0; n < expected; ++n) {
        std::string token;
        bool parsed = false;
        double val = 0.0;
        if (data_ss >> token) {
            // stod also accepts nan and inf for missing or unbounded values
            try {
                size_t consumed = 0;
                val = std::stod(token, &consumed);
                parsed = (consumed == token.size());
            } catch (const std::invalid_argument&) {
                parsed = false;
            } catch (const std::out_of_range&) {
                parsed = false;
            }
        }
        if (!parsed) {
            throw std::runtime_error("Failed to read value " + std::to_string(n) + " of " + what +
                                     " from text grid " + source_name + " at line " + std::to_string(line_num) + ".");
        }
        values.push_back(val);
    }
    std::string extra;
    if (data_ss >> extra) {
        throw std::runtime_error("Extra data on line " + std::to_string(line_num) + " of text grid " + source_name +
                                 ": expected " + std::to_string(expected) + " values for " + what + ".");
    }
    return values;
}

std::unique_ptr<Cradial::GeoField> TextGridLoader::load(const std::string& file_path) {
    std::ifstream infile(file_path);
    if (!infile.is_open()) {
        throw std::runtime_error("Failed to open text grid file: " + file_path);
    }
    return load(infile, file_path);
}

std::unique_ptr<Cradial::GeoField> TextGridLoader::load(std::istream& input, const std::string& source_name) {
    std::string line;
    int line_num = 0;

    if (!read_next_significant_line(input, line, line_num)) {
        throw std::runtime_error("Text grid " + source_name + " is empty.");
    }
    std::istringstream header_ss(line);
    std::vector<long long> dims;
    long long dim;
    while (header_ss >> dim) {
        dims.push_back(dim);
    }
    if (!header_ss.eof() || dims.size() < 2 || dims.size() > 3) {
        throw std::runtime_error("Failed to parse header (nlon nlat [ntime]) from text grid " + source_name +
                                 " at line " + std::to_string(line_num) + ".");
    }
    for (long long d : dims) {
        if (d <= 0) {
            throw std::runtime_error("Non-positive dimension in header of text grid " + source_name +
                                     " at line " + std::to_string(line_num) + ".");
        }
        if (static_cast<unsigned long long>(d) > std::numeric_limits<Cradial::uint_t>::max()) {
            throw std::runtime_error("Dimension " + std::to_string(d) + " too large in header of text grid " +
                                     source_name + " at line " + std::to_string(line_num) + ".");
        }
    }

    std::vector<Cradial::uint_t> shape;
    for (long long d : dims) shape.push_back(static_cast<Cradial::uint_t>(d));
    const size_t nlon = shape[0];
    const size_t nlat = shape[1];
    const size_t ntime = (shape.size() == 3) ? shape[2] : 1;

    std::vector<double> lons = read_numbers(input, nlon, "longitudes", source_name, line_num);
    std::vector<double> lats = read_numbers(input, nlat, "latitudes", source_name, line_num);

    auto field = std::make_unique<Cradial::GeoField>();
    try {
        field->set_axes(lons, lats);
        field->set_shape(shape);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid grid in text grid " + source_name + ": " + e.what());
    }

    std::vector<double>& values = field->get_values_raw_mut();
    for (size_t i = 0; i < nlon; ++i) {
        for (size_t j = 0; j < nlat; ++j) {
            std::string what = "node (" + std::to_string(i) + "," + std::to_string(j) + ")";
            std::vector<double> node_values = read_numbers(input, ntime, what, source_name, line_num);
            std::copy(node_values.begin(), node_values.end(), values.begin() + field->get_flat_index(i, j));
        }
    }

    if (read_next_significant_line(input, line, line_num)) {
        std::cerr << "TextGridLoader Warning: Extra data found at the end of " << source_name
                  << " starting at line " << line_num << ": '" << line << "'" << std::endl;
    }
    return field;
}

} // namespace app
} // namespace cradial
