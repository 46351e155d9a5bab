#ifndef Cradial_RADIAL_SAMPLER_HPP
#define Cradial_RADIAL_SAMPLER_HPP

#include "../core/radial_types.hpp"
#include "../core/radial_constants.hpp"
#include "../fields/geo_field.hpp"
#include <vector>

namespace Cradial {

// Sample points of one spider web, in sampling order.
struct RadialWeb {
    GeoPoint center;
    std::vector<GeoPoint> points;
    std::vector<real_t> ring_km;      // distance of each point from the center
    std::vector<real_t> bearing_deg;  // bearing of each point, 0 for the origin
    bool has_origin = false;          // true if points[0] is the prepended center

    size_t size() const { return points.size(); }
};

// Result for a single center.
struct RadialSample {
    std::vector<real_t> values; // flattened [point][time]
    size_t n_points = 0;
    size_t n_times = 0;
    size_t ndim = 2;            // rank of the sampled field
    std::vector<real_t> ring_km;
    std::vector<real_t> bearing_deg;
    std::vector<real_t> lats;   // empty unless coordinates were requested
    std::vector<real_t> lons;

    real_t value(size_t point, size_t time = 0) const;
};

// Result for a set of centers (every center lon x center lat combination).
struct MultiCenterSample {
    std::vector<real_t> values; // flattened [i_center_lon][j_center_lat][point]
    std::vector<real_t> center_lats;
    std::vector<real_t> center_lons;
    std::vector<real_t> ring_km;      // per web point, shared by all centers
    std::vector<real_t> bearing_deg;
    size_t n_points = 0;

    real_t value(size_t i_lon, size_t j_lat, size_t point) const;
};

class RadialSampler {
public:
    RadialSampler();
    RadialSampler(const std::vector<real_t>& radius_steps, const std::vector<real_t>& degree_steps);

    // --- Web layout ---
    void set_radius_steps(const std::vector<real_t>& radius_steps_km);
    void set_degree_steps(const std::vector<real_t>& degree_steps);
    const std::vector<real_t>& get_radius_steps() const;
    const std::vector<real_t>& get_degree_steps() const;

    // --- Lookup behaviour ---
    void set_method(InterpMethod method);
    void set_distance_model(DistanceModel model);
    void set_bounds_error(bool bounds_error);
    void set_fill_value(real_t fill_value);
    void set_wrap_longitude(bool wrap);
    void set_return_coordinates(bool return_coordinates);

    InterpMethod get_method() const;
    DistanceModel get_distance_model() const;
    bool get_bounds_error() const;
    real_t get_fill_value() const;
    bool get_wrap_longitude() const;
    bool get_return_coordinates() const;

    // Points per web: rings x bearings, plus the origin when the first ring is not at 0 km.
    size_t get_points_per_web() const;

    RadialWeb build_web(const GeoPoint& center) const;

    // Single center. 2D field -> n_points values, 3D field -> n_points x ntime.
    RadialSample sample(const GeoField& field, real_t center_lat, real_t center_lon) const;

    // Multiple centers. Requires a 2D field and coordinates not requested.
    MultiCenterSample sample(const GeoField& field,
                             const std::vector<real_t>& center_lats,
                             const std::vector<real_t>& center_lons) const;

private:
    std::vector<real_t> m_radius_steps;
    std::vector<real_t> m_degree_steps;
    InterpMethod m_method;
    DistanceModel m_distance_model;
    bool m_bounds_error;
    real_t m_fill_value;
    bool m_wrap_longitude;
    bool m_return_coordinates;

    void validate(const GeoField& field) const;
    InterpOptions interp_options() const;

    // Web points moved onto the field's longitude convention where possible.
    std::vector<GeoPoint> lookup_points(const GeoField& field, const std::vector<GeoPoint>& web_points) const;
};

} // namespace Cradial

#endif // Cradial_RADIAL_SAMPLER_HPP
