#ifndef CRADIAL_CONFIG_PARSER_HPP
#define CRADIAL_CONFIG_PARSER_HPP

#include "../src/core/radial_types.hpp"
#include <string>
#include <map>
#include <vector>
#include <istream>
#include <stdexcept> // For std::runtime_error, std::invalid_argument
#include <algorithm> // For trim

namespace cradial {
namespace app {

// Helper to trim whitespace from a string
inline std::string trim_string(const std::string& str) {
    const std::string whitespace = " \t\n\r\f\v";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) return ""; // Empty or all whitespace
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

enum class FieldFormat {
    AUTO,   // by file extension
    BINARY,
    TEXT
};

FieldFormat field_format_from_string(const std::string& s);

struct Config {
    // Input field
    std::string field_path;
    FieldFormat field_format;

    // Centers (more than one lat or lon selects multi-center sampling)
    std::vector<double> center_lats;
    std::vector<double> center_lons;

    // Web layout
    std::vector<double> radius_steps;
    std::vector<double> degree_steps;

    // Interpolation
    Cradial::InterpMethod method;
    Cradial::DistanceModel distance_model;
    bool bounds_error;
    double fill_value;
    bool wrap_longitude;

    // Output
    std::string output_path;
    bool write_coordinates;

    Config() : field_format(FieldFormat::AUTO),
               method(Cradial::InterpMethod::LINEAR),
               distance_model(Cradial::DistanceModel::GEODESIC),
               bounds_error(true), fill_value(Cradial::NaN), wrap_longitude(true),
               write_coordinates(false) {}

    bool is_multi_center() const { return center_lats.size() > 1 || center_lons.size() > 1; }
};

class ConfigParser {
public:
    ConfigParser() = default;

    Config parse(const std::string& filename);
    // `source_name` only labels error messages.
    Config parse(std::istream& input, const std::string& source_name);

private:
    // Store parsed values temporarily before populating Config struct
    std::map<std::string, std::map<std::string, std::string>> sections;

    bool has_key(const std::string& section, const std::string& key) const;

    template<typename T>
    T get_value(const std::string& section, const std::string& key, const T& default_value) const;

    template<typename T>
    T get_required_value(const std::string& section, const std::string& key) const;
};


// Template specializations for get_value and get_required_value
template<>
inline std::string ConfigParser::get_value<std::string>(const std::string& section, const std::string& key, const std::string& default_value) const {
    auto sec_it = sections.find(section);
    if (sec_it != sections.end()) {
        auto key_it = sec_it->second.find(key);
        if (key_it != sec_it->second.end()) {
            return key_it->second;
        }
    }
    return default_value;
}

template<>
inline double ConfigParser::get_value<double>(const std::string& section, const std::string& key, const double& default_value) const {
    auto sec_it = sections.find(section);
    if (sec_it != sections.end()) {
        auto key_it = sec_it->second.find(key);
        if (key_it != sec_it->second.end()) {
            try {
                size_t consumed = 0;
                double value = std::stod(key_it->second, &consumed);
                if (consumed != key_it->second.size()) {
                    throw std::invalid_argument("trailing characters");
                }
                return value;
            } catch (const std::invalid_argument&) {
                throw std::runtime_error("Invalid double value for " + section + "/" + key + ": " + key_it->second);
            } catch (const std::out_of_range&) {
                 throw std::runtime_error("Double value out of range for " + section + "/" + key + ": " + key_it->second);
            }
        }
    }
    return default_value;
}

template<>
inline bool ConfigParser::get_value<bool>(const std::string& section, const std::string& key, const bool& default_value) const {
    auto sec_it = sections.find(section);
    if (sec_it != sections.end()) {
        auto key_it = sec_it->second.find(key);
        if (key_it != sec_it->second.end()) {
            std::string s = key_it->second;
            std::transform(s.begin(), s.end(), s.begin(), ::tolower);
            if (s == "true" || s == "yes" || s == "on" || s == "1") return true;
            if (s == "false" || s == "no" || s == "off" || s == "0") return false;
            throw std::runtime_error("Invalid boolean value for " + section + "/" + key + ": " + key_it->second);
        }
    }
    return default_value;
}

// Comma separated list of doubles
template<>
inline std::vector<double> ConfigParser::get_value<std::vector<double>>(const std::string& section, const std::string& key, const std::vector<double>& default_value) const {
    auto sec_it = sections.find(section);
    if (sec_it == sections.end()) return default_value;
    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_value;

    std::vector<double> values;
    const std::string& raw = key_it->second;
    size_t start = 0;
    while (start <= raw.size()) {
        size_t comma = raw.find(',', start);
        std::string item = trim_string(raw.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (item.empty()) {
            throw std::runtime_error("Empty list item for " + section + "/" + key + ": " + raw);
        }
        try {
            size_t consumed = 0;
            values.push_back(std::stod(item, &consumed));
            if (consumed != item.size()) {
                throw std::invalid_argument("trailing characters");
            }
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid list value for " + section + "/" + key + ": " + item);
        }
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return values;
}


template<typename T>
T ConfigParser::get_required_value(const std::string& section, const std::string& key) const {
    auto sec_it = sections.find(section);
    if (sec_it == sections.end()) {
        throw std::runtime_error("Required section missing in config file: [" + section + "]");
    }
    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) {
        throw std::runtime_error("Required key '" + key + "' missing in section [" + section + "]");
    }
    // Use get_value with a dummy default to leverage its conversion and error handling
    return get_value<T>(section, key, T{}); // T{} is default constructor for T
}


} // namespace app
} // namespace cradial
#endif // CRADIAL_CONFIG_PARSER_HPP
