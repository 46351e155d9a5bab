#ifndef Cradial_GEO_FIELD_HPP
#define Cradial_GEO_FIELD_HPP

#include "core/radial_types.hpp"
#include "core/radial_constants.hpp"
#include <vector>
#include <string>
#include <stdexcept> // For exceptions
#include <array>

namespace Cradial {

// Gridded geographic field on a rectilinear (lon, lat) grid with an optional
// trailing time axis. Values are stored flattened as [i_lon][j_lat][k_time];
// a 2D field keeps a single time slice.
class GeoField {
public:
    GeoField();
    ~GeoField() = default;

    GeoField(const GeoField&) = delete;
    GeoField& operator=(const GeoField&) = delete;
    GeoField(GeoField&&) = default;
    GeoField& operator=(GeoField&&) = default;

    // --- Grid definition ---
    // Axes must be non-empty and strictly monotonic (ascending or descending).
    // Setting the axes resets the values to NaN.
    void set_axes(const std::vector<real_t>& lons, const std::vector<real_t>& lats);

    // {nlon, nlat} or {nlon, nlat, ntime}; the first two entries must match the axes.
    void set_shape(const std::vector<uint_t>& shape);

    // --- Getters ---
    const std::vector<real_t>& get_lons() const;
    const std::vector<real_t>& get_lats() const;
    std::vector<uint_t> get_shape() const;
    uint_t get_nlon() const;
    uint_t get_nlat() const;
    uint_t get_ntime() const;
    size_t ndim() const;

    // +1 ascending, -1 descending
    int get_lon_direction() const;
    int get_lat_direction() const;

    // {min, max} regardless of axis direction
    const std::array<real_t, 2>& get_lon_range() const;
    const std::array<real_t, 2>& get_lat_range() const;
    bool contains(const GeoPoint& point) const;

    // --- Value Access ---
    real_t get_value(size_t i_lon, size_t j_lat, size_t k_time = 0) const;
    void set_value(size_t i_lon, size_t j_lat, size_t k_time, real_t value);

    const std::vector<real_t>& get_values_raw() const;
    std::vector<real_t>& get_values_raw_mut(); // size must not change

    void set_all_values(const std::vector<real_t>& all_vals);
    void fill(real_t fill_value);

    size_t get_flat_index(size_t i_lon, size_t j_lat, size_t k_time = 0) const;
    size_t get_total_nodes() const;

    // --- Interpolation ---
    // One value per time slice.
    std::vector<real_t> interpolate(const GeoPoint& point,
                                    const InterpOptions& options = InterpOptions()) const;
    // Flattened [point][time].
    std::vector<real_t> interpolate_many(const std::vector<GeoPoint>& points,
                                         const InterpOptions& options = InterpOptions()) const;

private:
    std::vector<real_t> m_lons;
    std::vector<real_t> m_lats;
    uint_t m_ntime;
    size_t m_ndim;
    std::vector<real_t> m_values;

    // --- Derived grid properties ---
    int m_lon_direction;
    int m_lat_direction;
    std::array<real_t, 2> m_lon_range;
    std::array<real_t, 2> m_lat_range;

    void update_derived_properties();
};

} // namespace Cradial

#endif // Cradial_GEO_FIELD_HPP
