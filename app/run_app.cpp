#include "run_app.hpp"
#include "config_parser.hpp"
#include "text_grid_loader.hpp"
#include "../src/fields/geo_field.hpp"
#include "../src/sampler/radial_sampler.hpp"
#include "../src/io/field_serializer.hpp"
#include "../src/io/sample_writer.hpp"
#include "../src/io/filecheck.h"
#include "../src/core/radial_types.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <stdexcept>
#include <iomanip>
#include <cmath>
#include <algorithm>

namespace {

// Prints the first rings of a single-center result for a quick visual check
void print_sample_head(const Cradial::RadialSample& sample, size_t max_rows = 8) {
    std::cout << "--- Radial sample (first " << std::min(max_rows, sample.n_points) << " of "
              << sample.n_points << " points, time slice 0) ---" << std::endl;
    for (size_t p = 0; p < std::min(max_rows, sample.n_points); ++p) {
        double val = sample.value(p, 0);
        std::cout << std::setw(4) << p
                  << std::fixed << std::setprecision(1)
                  << std::setw(9) << sample.ring_km[p] << " km"
                  << std::setw(7) << sample.bearing_deg[p] << " deg ";
        if (std::isnan(val)) {
            std::cout << std::setw(10) << "nan";
        } else {
            std::cout << std::setprecision(3) << std::setw(10) << val;
        }
        std::cout << std::endl;
    }
    std::cout << std::defaultfloat;
}

std::unique_ptr<Cradial::GeoField> load_field(const cradial::app::Config& config) {
    cradial::app::FieldFormat format = config.field_format;
    if (format == cradial::app::FieldFormat::AUTO) {
        format = Cradial::io::has_extension(config.field_path, ".crg") ? cradial::app::FieldFormat::BINARY
                                                                        : cradial::app::FieldFormat::TEXT;
    }
    if (format == cradial::app::FieldFormat::BINARY) {
        Cradial::io::BinaryFieldSerializer serializer;
        return serializer.load_field(config.field_path);
    }
    cradial::app::TextGridLoader loader;
    return loader.load(config.field_path);
}

} // namespace

namespace cradial {
namespace app {

int run(const std::string& config_file_path) {
    if (!Cradial::io::file_exists(config_file_path)) {
        std::cerr << "Config file does not exist: " << config_file_path << std::endl;
        return 1;
    }

    cradial::app::Config config;
    try {
        cradial::app::ConfigParser config_parser;
        config = config_parser.parse(config_file_path);
        std::cout << "Config file '" << config_file_path << "' parsed successfully." << std::endl;
        std::cout << "  Field: " << config.field_path << std::endl;
        std::cout << "  Centers: " << config.center_lats.size() << " lat x " << config.center_lons.size() << " lon" << std::endl;
        std::cout << "  Web: " << config.radius_steps.size() << " rings x " << config.degree_steps.size() << " bearings"
                  << ", method=" << Cradial::to_string(config.method)
                  << ", distance=" << Cradial::to_string(config.distance_model) << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config file: " << e.what() << std::endl;
        return 1;
    }

    // --- 1. Load the gridded field ---
    std::unique_ptr<Cradial::GeoField> field;
    try {
        if (!Cradial::io::file_exists(config.field_path)) {
            std::cerr << "Field file does not exist: " << config.field_path << std::endl;
            return 1;
        }
        field = load_field(config);
        const auto& lon_range = field->get_lon_range();
        const auto& lat_range = field->get_lat_range();
        std::cout << "Field '" << config.field_path << "' loaded: " << field->ndim() << "D, "
                  << field->get_nlon() << " lon [" << lon_range[0] << ", " << lon_range[1] << "] x "
                  << field->get_nlat() << " lat [" << lat_range[0] << ", " << lat_range[1] << "]";
        if (field->ndim() == 3) {
            std::cout << " x " << field->get_ntime() << " time";
        }
        std::cout << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error loading field: " << e.what() << std::endl;
        return 1;
    }

    // --- 2. Configure the sampler ---
    Cradial::RadialSampler sampler;
    try {
        sampler.set_radius_steps(config.radius_steps);
        sampler.set_degree_steps(config.degree_steps);
        sampler.set_method(config.method);
        sampler.set_distance_model(config.distance_model);
        sampler.set_bounds_error(config.bounds_error);
        sampler.set_fill_value(config.fill_value);
        sampler.set_wrap_longitude(config.wrap_longitude);
        sampler.set_return_coordinates(config.write_coordinates);
        std::cout << "Sampler configured: " << sampler.get_points_per_web() << " points per web." << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error configuring sampler: " << e.what() << std::endl;
        return 1;
    }

    // --- 3. Sample and write ---
    try {
        Cradial::io::CsvSampleWriter writer;
        if (config.is_multi_center()) {
            Cradial::MultiCenterSample result = sampler.sample(*field, config.center_lats, config.center_lons);
            std::cout << "Sampled " << result.center_lons.size() * result.center_lats.size() << " centers." << std::endl;
            writer.save(result, config.output_path);
        } else {
            Cradial::RadialSample result = sampler.sample(*field, config.center_lats[0], config.center_lons[0]);
            print_sample_head(result);
            writer.save(result, config.output_path);
        }
        std::cout << "Radial samples written to: " << config.output_path << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error during radial sampling: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "--- Cradial Application Finished ---" << std::endl;
    return 0;
}

} // namespace app
} // namespace cradial
