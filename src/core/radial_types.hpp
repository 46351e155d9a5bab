#ifndef RADIAL_TYPES_HPP
#define RADIAL_TYPES_HPP

#include "radial_constants.hpp"
#include <array>
#include <vector>
#include <string>

namespace Cradial {

// Geographic point in degrees
struct GeoPoint {
    real_t lat = 0.0;
    real_t lon = 0.0;

    GeoPoint() = default;
    GeoPoint(real_t lat_deg, real_t lon_deg) : lat(lat_deg), lon(lon_deg) {}

    bool operator==(const GeoPoint& other) const {
        return lat == other.lat && lon == other.lon;
    }
    bool operator!=(const GeoPoint& other) const {
        return !(*this == other);
    }
};

// Interpolation scheme on the regular grid
enum class InterpMethod {
    LINEAR,
    NEAREST
};

// How destination points are computed from a center
enum class DistanceModel {
    GEODESIC,    // WGS-84 ellipsoid
    GREAT_CIRCLE // sphere of EARTH_RADIUS_KM
};

// Lookup options shared by fields and the sampler
struct InterpOptions {
    InterpMethod method = InterpMethod::LINEAR;
    bool bounds_error = true; // throw on out-of-bounds queries instead of filling
    real_t fill_value = NaN;
};

std::string to_string(InterpMethod m);
InterpMethod interp_method_from_string(const std::string& s);

std::string to_string(DistanceModel dm);
DistanceModel distance_model_from_string(const std::string& s);

// Half-open progression [start, stop) with the given step.
// Element count is ceil((stop - start) / step), empty if not positive.
std::vector<real_t> make_steps(real_t start, real_t stop, real_t step);

} // namespace Cradial

#endif // RADIAL_TYPES_HPP
