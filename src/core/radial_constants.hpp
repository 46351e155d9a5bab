#ifndef RADIAL_CONSTANTS_HPP
#define RADIAL_CONSTANTS_HPP

#include <cstddef> // For size_t
#include <cstdint> // For fixed-width integers
#include <limits>  // For std::numeric_limits

namespace Cradial {

// Basic data types
using real_t = double;
using uint_t = std::uint32_t;
using int_t = std::int32_t;

// Mathematical Constants
constexpr real_t PI = 3.14159265358979323846;
constexpr real_t TWO_PI = 2.0 * PI;
constexpr real_t INF = std::numeric_limits<real_t>::infinity();
constexpr real_t NaN = std::numeric_limits<real_t>::quiet_NaN();
constexpr real_t EPSILON = 1e-6;

// Physical Constants
constexpr real_t EARTH_RADIUS_KM = 6371.009; // mean radius, kilometers

// WGS-84 reference ellipsoid
constexpr real_t WGS84_A_KM = 6378.137;
constexpr real_t WGS84_F = 1.0 / 298.257223563;
constexpr real_t WGS84_B_KM = WGS84_A_KM * (1.0 - WGS84_F);

// Iteration limits for the ellipsoidal geodesic
constexpr int_t GEODESIC_MAX_ITERATIONS = 200;
constexpr real_t GEODESIC_TOLERANCE = 1e-12;

} // namespace Cradial

#endif // RADIAL_CONSTANTS_HPP
