#include "geo_field.hpp"
#include "numerics/interpolation.hpp"
#include "utils/math_utils.hpp"
#include <algorithm> // For std::fill, std::minmax
#include <stdexcept>

namespace Cradial {

GeoField::GeoField()
    : m_ntime(1),
      m_ndim(2),
      m_lon_direction(0),
      m_lat_direction(0),
      m_lon_range({NaN, NaN}),
      m_lat_range({NaN, NaN}) {}

void GeoField::set_axes(const std::vector<real_t>& lons, const std::vector<real_t>& lats) {
    if (lons.empty() || lats.empty()) {
        throw std::invalid_argument("Longitude and latitude axes must not be empty.");
    }
    if (utils::monotonic_direction(lons) == 0) {
        throw std::invalid_argument("Longitude axis must be strictly ascending or descending.");
    }
    if (utils::monotonic_direction(lats) == 0) {
        throw std::invalid_argument("Latitude axis must be strictly ascending or descending.");
    }
    m_lons = lons;
    m_lats = lats;
    update_derived_properties();
    m_values.assign(get_total_nodes(), NaN);
}

void GeoField::set_shape(const std::vector<uint_t>& shape) {
    if (shape.size() < 2 || shape.size() > 3) {
        throw std::invalid_argument("Input array must be 2D or 3D");
    }
    if (std::any_of(shape.begin(), shape.end(), [](uint_t n){ return n == 0; })) {
        throw std::invalid_argument("Field dimensions cannot be zero.");
    }
    if (shape[0] != m_lons.size() || shape[1] != m_lats.size()) {
        throw std::invalid_argument("Field shape (" + std::to_string(shape[0]) + ", " + std::to_string(shape[1]) +
                                    ") does not match axes (" + std::to_string(m_lons.size()) + ", " +
                                    std::to_string(m_lats.size()) + "). Set the axes first.");
    }
    m_ndim = shape.size();
    m_ntime = (m_ndim == 3) ? shape[2] : 1;
    m_values.assign(get_total_nodes(), NaN);
}

const std::vector<real_t>& GeoField::get_lons() const { return m_lons; }
const std::vector<real_t>& GeoField::get_lats() const { return m_lats; }

std::vector<uint_t> GeoField::get_shape() const {
    std::vector<uint_t> shape = {get_nlon(), get_nlat()};
    if (m_ndim == 3) shape.push_back(m_ntime);
    return shape;
}

uint_t GeoField::get_nlon() const { return static_cast<uint_t>(m_lons.size()); }
uint_t GeoField::get_nlat() const { return static_cast<uint_t>(m_lats.size()); }
uint_t GeoField::get_ntime() const { return m_ntime; }
size_t GeoField::ndim() const { return m_ndim; }
int GeoField::get_lon_direction() const { return m_lon_direction; }
int GeoField::get_lat_direction() const { return m_lat_direction; }
const std::array<real_t, 2>& GeoField::get_lon_range() const { return m_lon_range; }
const std::array<real_t, 2>& GeoField::get_lat_range() const { return m_lat_range; }

bool GeoField::contains(const GeoPoint& point) const {
    if (m_lons.empty()) return false;
    return point.lon >= m_lon_range[0] && point.lon <= m_lon_range[1] &&
           point.lat >= m_lat_range[0] && point.lat <= m_lat_range[1];
}

void GeoField::update_derived_properties() {
    m_lon_direction = utils::monotonic_direction(m_lons);
    m_lat_direction = utils::monotonic_direction(m_lats);
    auto lon_mm = std::minmax_element(m_lons.begin(), m_lons.end());
    auto lat_mm = std::minmax_element(m_lats.begin(), m_lats.end());
    m_lon_range = {*lon_mm.first, *lon_mm.second};
    m_lat_range = {*lat_mm.first, *lat_mm.second};
}

// --- Value Access ---
size_t GeoField::get_flat_index(size_t i_lon, size_t j_lat, size_t k_time) const {
    if (i_lon >= m_lons.size() || j_lat >= m_lats.size() || k_time >= m_ntime) {
        throw std::out_of_range("Field index out of grid bounds.");
    }
    return (i_lon * m_lats.size() + j_lat) * m_ntime + k_time;
}

size_t GeoField::get_total_nodes() const {
    return m_lons.size() * m_lats.size() * static_cast<size_t>(m_ntime);
}

real_t GeoField::get_value(size_t i_lon, size_t j_lat, size_t k_time) const {
    return m_values[get_flat_index(i_lon, j_lat, k_time)];
}

void GeoField::set_value(size_t i_lon, size_t j_lat, size_t k_time, real_t value) {
    m_values[get_flat_index(i_lon, j_lat, k_time)] = value;
}

const std::vector<real_t>& GeoField::get_values_raw() const { return m_values; }
std::vector<real_t>& GeoField::get_values_raw_mut() { return m_values; }

void GeoField::set_all_values(const std::vector<real_t>& all_vals) {
    if (all_vals.size() != get_total_nodes()) {
        throw std::invalid_argument("Size of input vector (" + std::to_string(all_vals.size()) +
                                    ") does not match field dimensions (" + std::to_string(get_total_nodes()) + ").");
    }
    m_values = all_vals;
}

void GeoField::fill(real_t fill_value) {
    std::fill(m_values.begin(), m_values.end(), fill_value);
}

// --- Interpolation ---
std::vector<real_t> GeoField::interpolate(const GeoPoint& point, const InterpOptions& options) const {
    return interpolation::regular_grid(*this, std::vector<GeoPoint>{point}, options);
}

std::vector<real_t> GeoField::interpolate_many(const std::vector<GeoPoint>& points,
                                               const InterpOptions& options) const {
    return interpolation::regular_grid(*this, points, options);
}

} // namespace Cradial
