#include "sample_writer.hpp"
#include <fstream>
#include <iomanip>
#include <cmath>
#include <stdexcept>

namespace Cradial {
namespace io {

CsvSampleWriter::CsvSampleWriter(int precision) : m_precision(precision) {
    if (precision <= 0) {
        throw std::invalid_argument("CSV precision must be positive.");
    }
}

void CsvSampleWriter::write_number(std::ostream& out, real_t value) const {
    if (std::isfinite(value)) {
        out << std::setprecision(m_precision) << value;
    } else if (std::isinf(value)) {
        out << (value > 0 ? "inf" : "-inf");
    } else {
        out << "nan";
    }
}

void CsvSampleWriter::write(std::ostream& out, const RadialSample& sample) const {
    const bool with_coords = !sample.lats.empty();

    out << "point,ring_km,bearing_deg";
    if (with_coords) out << ",lat,lon";
    if (sample.ndim == 2) {
        out << ",value";
    } else {
        for (size_t k = 0; k < sample.n_times; ++k) out << ",t" << k;
    }
    out << "\n";

    for (size_t p = 0; p < sample.n_points; ++p) {
        out << p << ",";
        write_number(out, sample.ring_km[p]);
        out << ",";
        write_number(out, sample.bearing_deg[p]);
        if (with_coords) {
            out << ",";
            write_number(out, sample.lats[p]);
            out << ",";
            write_number(out, sample.lons[p]);
        }
        for (size_t k = 0; k < sample.n_times; ++k) {
            out << ",";
            write_number(out, sample.value(p, k));
        }
        out << "\n";
    }
}

void CsvSampleWriter::write(std::ostream& out, const MultiCenterSample& sample) const {
    out << "center_lat,center_lon,point,ring_km,bearing_deg,value\n";
    for (size_t i = 0; i < sample.center_lons.size(); ++i) {
        for (size_t j = 0; j < sample.center_lats.size(); ++j) {
            for (size_t p = 0; p < sample.n_points; ++p) {
                write_number(out, sample.center_lats[j]);
                out << ",";
                write_number(out, sample.center_lons[i]);
                out << "," << p << ",";
                write_number(out, sample.ring_km[p]);
                out << ",";
                write_number(out, sample.bearing_deg[p]);
                out << ",";
                write_number(out, sample.value(i, j, p));
                out << "\n";
            }
        }
    }
}

void CsvSampleWriter::save(const RadialSample& sample, const std::string& path) const {
    std::ofstream outfile(path, std::ios::trunc);
    if (!outfile.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    write(outfile, sample);
    if (!outfile.good()) {
        throw std::runtime_error("Error occurred during writing to file: " + path);
    }
}

void CsvSampleWriter::save(const MultiCenterSample& sample, const std::string& path) const {
    std::ofstream outfile(path, std::ios::trunc);
    if (!outfile.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    write(outfile, sample);
    if (!outfile.good()) {
        throw std::runtime_error("Error occurred during writing to file: " + path);
    }
}

} // namespace io
} // namespace Cradial
