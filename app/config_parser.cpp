#include "config_parser.hpp"
#include <fstream>
#include <cctype>

namespace cradial {
namespace app {

namespace {

// '#' or ';' opens a comment only at the start of the value or after whitespace,
// so paths such as "runs/a#1.crg" survive.
std::string strip_inline_comment(const std::string& value) {
    for (size_t pos = 0; pos < value.size(); ++pos) {
        if ((value[pos] == '#' || value[pos] == ';') &&
            (pos == 0 || std::isspace(static_cast<unsigned char>(value[pos - 1])))) {
            return value.substr(0, pos);
        }
    }
    return value;
}

} // namespace

FieldFormat field_format_from_string(const std::string& s_in) {
    std::string s = s_in;
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    if (s == "auto") return FieldFormat::AUTO;
    if (s == "binary") return FieldFormat::BINARY;
    if (s == "text") return FieldFormat::TEXT;
    throw std::invalid_argument("Unknown field format string: " + s_in);
}

bool ConfigParser::has_key(const std::string& section, const std::string& key) const {
    auto sec_it = sections.find(section);
    return sec_it != sections.end() && sec_it->second.count(key) > 0;
}

Config ConfigParser::parse(const std::string& filename) {
    std::ifstream infile(filename);
    if (!infile.is_open()) {
        throw std::runtime_error("Failed to open config file: " + filename);
    }
    return parse(infile, filename);
}

Config ConfigParser::parse(std::istream& input, const std::string& source_name) {
    sections.clear();

    std::string line;
    std::string current_section;
    int line_number = 0;

    while (std::getline(input, line)) {
        line_number++;
        line = trim_string(line);

        if (line.empty() || line[0] == '#' || line[0] == ';') { // Skip empty lines and comments
            continue;
        }

        if (line[0] == '[' && line.back() == ']') { // Section header
            current_section = trim_string(line.substr(1, line.length() - 2));
            if (current_section.empty()) {
                throw std::runtime_error("Syntax error in config file " + source_name + " at line " + std::to_string(line_number) + ": Empty section name.");
            }
            sections[current_section]; // Create section if not exists
        } else if (!current_section.empty()) { // Key-value pair
            size_t delimiter_pos = line.find('=');
            if (delimiter_pos != std::string::npos) {
                std::string key = trim_string(line.substr(0, delimiter_pos));
                std::string value = line.substr(delimiter_pos + 1);
                value = trim_string(strip_inline_comment(value));
                if (key.empty()) {
                    throw std::runtime_error("Syntax error in config file " + source_name + " at line " + std::to_string(line_number) + ": Empty key name in section [" + current_section + "].");
                }
                sections[current_section][key] = value;
            } else {
                 throw std::runtime_error("Syntax error in config file " + source_name + " at line " + std::to_string(line_number) + ": Missing '=' in key-value pair in section [" + current_section + "].");
            }
        } else {
             throw std::runtime_error("Syntax error in config file " + source_name + " at line " + std::to_string(line_number) + ": Key-value pair outside of any section.");
        }
    }

    // Populate Config struct
    Config config;
    config.field_path = get_required_value<std::string>("Field", "file_path");
    config.field_format = field_format_from_string(get_value<std::string>("Field", "format", "auto"));

    config.center_lats = get_required_value<std::vector<double>>("Center", "lat");
    config.center_lons = get_required_value<std::vector<double>>("Center", "lon");

    if (has_key("Web", "radius_steps")) {
        config.radius_steps = get_required_value<std::vector<double>>("Web", "radius_steps");
    } else {
        double start = get_value<double>("Web", "radius_start", 0.0);
        double stop = get_required_value<double>("Web", "radius_stop");
        double step = get_required_value<double>("Web", "radius_step");
        config.radius_steps = Cradial::make_steps(start, stop, step);
    }
    if (config.radius_steps.empty()) {
        throw std::runtime_error("Section [Web] defines no radius steps.");
    }

    if (has_key("Web", "degree_steps")) {
        config.degree_steps = get_required_value<std::vector<double>>("Web", "degree_steps");
    } else if (has_key("Web", "degree_step")) {
        config.degree_steps = Cradial::make_steps(0.0, 360.0, get_required_value<double>("Web", "degree_step"));
    } else {
        throw std::runtime_error("Required key 'degree_steps' or 'degree_step' missing in section [Web]");
    }
    if (config.degree_steps.empty()) {
        throw std::runtime_error("Section [Web] defines no degree steps.");
    }

    config.method = Cradial::interp_method_from_string(get_value<std::string>("Interpolation", "method", "linear"));
    config.distance_model = Cradial::distance_model_from_string(get_value<std::string>("Interpolation", "distance_model", "geodesic"));
    config.bounds_error = get_value<bool>("Interpolation", "bounds_error", true);
    config.fill_value = get_value<double>("Interpolation", "fill_value", Cradial::NaN);
    config.wrap_longitude = get_value<bool>("Interpolation", "wrap_longitude", true);

    config.output_path = get_required_value<std::string>("Output", "file_path");
    config.write_coordinates = get_value<bool>("Output", "write_coordinates", false);
    if (config.write_coordinates && config.is_multi_center()) {
        throw std::runtime_error("[Output] write_coordinates is only supported for a single center.");
    }

    return config;
}

} // namespace app
} // namespace cradial
