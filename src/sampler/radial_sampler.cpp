#include "radial_sampler.hpp"
#include "numerics/geodesy.hpp"
#include <cmath>
#include <stdexcept>
#include <iostream>

namespace Cradial {

real_t RadialSample::value(size_t point, size_t time) const {
    if (point >= n_points || time >= n_times) {
        throw std::out_of_range("RadialSample index out of range.");
    }
    return values[point * n_times + time];
}

real_t MultiCenterSample::value(size_t i_lon, size_t j_lat, size_t point) const {
    if (i_lon >= center_lons.size() || j_lat >= center_lats.size() || point >= n_points) {
        throw std::out_of_range("MultiCenterSample index out of range.");
    }
    return values[(i_lon * center_lats.size() + j_lat) * n_points + point];
}

// --- RadialSampler Implementation ---
RadialSampler::RadialSampler()
    : m_method(InterpMethod::LINEAR),
      m_distance_model(DistanceModel::GEODESIC),
      m_bounds_error(true),
      m_fill_value(NaN),
      m_wrap_longitude(true),
      m_return_coordinates(false) {}

RadialSampler::RadialSampler(const std::vector<real_t>& radius_steps, const std::vector<real_t>& degree_steps)
    : RadialSampler() {
    set_radius_steps(radius_steps);
    set_degree_steps(degree_steps);
}

void RadialSampler::set_radius_steps(const std::vector<real_t>& radius_steps_km) {
    for (real_t km : radius_steps_km) {
        if (!std::isfinite(km)) {
            throw std::invalid_argument("Radius steps must be finite.");
        }
    }
    m_radius_steps = radius_steps_km;
}

void RadialSampler::set_degree_steps(const std::vector<real_t>& degree_steps) {
    for (real_t deg : degree_steps) {
        if (!std::isfinite(deg)) {
            throw std::invalid_argument("Degree steps must be finite.");
        }
    }
    m_degree_steps = degree_steps;
}

const std::vector<real_t>& RadialSampler::get_radius_steps() const { return m_radius_steps; }
const std::vector<real_t>& RadialSampler::get_degree_steps() const { return m_degree_steps; }

void RadialSampler::set_method(InterpMethod method) { m_method = method; }
void RadialSampler::set_distance_model(DistanceModel model) { m_distance_model = model; }
void RadialSampler::set_bounds_error(bool bounds_error) { m_bounds_error = bounds_error; }
void RadialSampler::set_fill_value(real_t fill_value) { m_fill_value = fill_value; }
void RadialSampler::set_wrap_longitude(bool wrap) { m_wrap_longitude = wrap; }
void RadialSampler::set_return_coordinates(bool return_coordinates) { m_return_coordinates = return_coordinates; }

InterpMethod RadialSampler::get_method() const { return m_method; }
DistanceModel RadialSampler::get_distance_model() const { return m_distance_model; }
bool RadialSampler::get_bounds_error() const { return m_bounds_error; }
real_t RadialSampler::get_fill_value() const { return m_fill_value; }
bool RadialSampler::get_wrap_longitude() const { return m_wrap_longitude; }
bool RadialSampler::get_return_coordinates() const { return m_return_coordinates; }

size_t RadialSampler::get_points_per_web() const {
    size_t n = m_radius_steps.size() * m_degree_steps.size();
    if (!m_radius_steps.empty() && m_radius_steps[0] != 0.0) {
        n += 1;
    }
    return n;
}

InterpOptions RadialSampler::interp_options() const {
    InterpOptions options;
    options.method = m_method;
    options.bounds_error = m_bounds_error;
    options.fill_value = m_fill_value;
    return options;
}

void RadialSampler::validate(const GeoField& field) const {
    if (field.ndim() < 2 || field.ndim() > 3) {
        throw std::invalid_argument("Input array must be 2D or 3D");
    }
    if (m_radius_steps.empty() || m_degree_steps.empty()) {
        throw std::invalid_argument("Radius steps and degree steps must not be empty.");
    }
    if (m_radius_steps[0] < 0.0) {
        throw std::invalid_argument("Starting radius must not be negative");
    }
}

RadialWeb RadialSampler::build_web(const GeoPoint& center) const {
    if (m_radius_steps.empty() || m_degree_steps.empty()) {
        throw std::invalid_argument("Radius steps and degree steps must not be empty.");
    }
    if (m_radius_steps[0] < 0.0) {
        throw std::invalid_argument("Starting radius must not be negative");
    }
    geodesy::validate_latitude(center.lat);

    RadialWeb web;
    web.center = center;
    size_t n_points = get_points_per_web();
    web.points.reserve(n_points);
    web.ring_km.reserve(n_points);
    web.bearing_deg.reserve(n_points);

    // A web whose first ring is off-center still samples the origin once
    if (m_radius_steps[0] != 0.0) {
        web.has_origin = true;
        web.points.push_back(GeoPoint(center.lat, geodesy::normalize_longitude(center.lon)));
        web.ring_km.push_back(0.0);
        web.bearing_deg.push_back(0.0);
    }

    for (real_t km : m_radius_steps) {
        for (real_t deg : m_degree_steps) {
            web.points.push_back(geodesy::destination(center, deg, km, m_distance_model));
            web.ring_km.push_back(km);
            web.bearing_deg.push_back(deg);
        }
    }
    return web;
}

std::vector<GeoPoint> RadialSampler::lookup_points(const GeoField& field,
                                                   const std::vector<GeoPoint>& web_points) const {
    std::vector<GeoPoint> points = web_points;
    if (!m_wrap_longitude) {
        return points;
    }
    const std::array<real_t, 2>& lon_range = field.get_lon_range();
    for (auto& pt : points) {
        if (pt.lon >= lon_range[0] && pt.lon <= lon_range[1]) {
            continue;
        }
        // Smallest 360-degree shift that reaches the western edge of the grid
        real_t shifted = pt.lon + 360.0 * std::ceil((lon_range[0] - pt.lon) / 360.0);
        if (shifted <= lon_range[1]) {
            pt.lon = shifted;
        }
    }
    return points;
}

RadialSample RadialSampler::sample(const GeoField& field, real_t center_lat, real_t center_lon) const {
    validate(field);

    RadialWeb web = build_web(GeoPoint(center_lat, center_lon));
    std::vector<GeoPoint> points = lookup_points(field, web.points);

    RadialSample result;
    result.n_points = web.size();
    result.n_times = field.get_ntime();
    result.ndim = field.ndim();
    result.ring_km = web.ring_km;
    result.bearing_deg = web.bearing_deg;
    result.values = field.interpolate_many(points, interp_options());

    if (!m_bounds_error) {
        size_t outside = 0;
        for (const auto& pt : points) {
            if (!field.contains(pt)) ++outside;
        }
        if (outside > 0) {
            std::cerr << "RadialSampler Warning: " << outside << " of " << points.size()
                      << " web points around (" << center_lat << ", " << center_lon
                      << ") fall outside the field and were set to the fill value." << std::endl;
        }
    }

    if (m_return_coordinates) {
        result.lats.reserve(web.size());
        result.lons.reserve(web.size());
        for (const auto& pt : web.points) {
            result.lats.push_back(pt.lat);
            result.lons.push_back(pt.lon);
        }
    }
    return result;
}

MultiCenterSample RadialSampler::sample(const GeoField& field,
                                        const std::vector<real_t>& center_lats,
                                        const std::vector<real_t>& center_lons) const {
    validate(field);
    if (field.ndim() != 2) {
        throw std::invalid_argument("Input array must be 2D if providing multiple (lat,lon) centers");
    }
    if (m_return_coordinates) {
        throw std::invalid_argument("Interpolated (lat,lon) coordinates only returned for one input (lat,lon) pair");
    }
    if (center_lats.empty() || center_lons.empty()) {
        throw std::invalid_argument("At least one center latitude and longitude is required.");
    }

    MultiCenterSample result;
    result.center_lats = center_lats;
    result.center_lons = center_lons;
    result.n_points = get_points_per_web();
    result.values.reserve(center_lons.size() * center_lats.size() * result.n_points);

    const InterpOptions options = interp_options();
    size_t outside = 0;
    for (real_t lon : center_lons) {
        for (real_t lat : center_lats) {
            RadialWeb web = build_web(GeoPoint(lat, lon));
            std::vector<GeoPoint> points = lookup_points(field, web.points);
            std::vector<real_t> values = field.interpolate_many(points, options);
            result.values.insert(result.values.end(), values.begin(), values.end());
            if (result.ring_km.empty()) {
                result.ring_km = web.ring_km;
                result.bearing_deg = web.bearing_deg;
            }
            if (!m_bounds_error) {
                for (const auto& pt : points) {
                    if (!field.contains(pt)) ++outside;
                }
            }
        }
    }
    if (outside > 0) {
        std::cerr << "RadialSampler Warning: " << outside << " web points over "
                  << center_lons.size() * center_lats.size()
                  << " centers fall outside the field and were set to the fill value." << std::endl;
    }
    return result;
}

} // namespace Cradial
