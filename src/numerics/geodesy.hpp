#ifndef Cradial_GEODESY_HPP
#define Cradial_GEODESY_HPP

#include "core/radial_types.hpp"
#include "core/radial_constants.hpp"
#include <vector>

namespace Cradial {
namespace geodesy {

// --- Coordinate hygiene ---
// Longitudes are reported in [-180, 180). Latitudes must lie in [-90, 90].
real_t normalize_longitude(real_t lon_deg);
void validate_latitude(real_t lat_deg);

// --- Direct problem ---
// Point reached from `start` after `distance_km` along the initial bearing
// `bearing_deg` (degrees clockwise from north).
GeoPoint destination(const GeoPoint& start, real_t bearing_deg, real_t distance_km,
                     DistanceModel model = DistanceModel::GEODESIC);

// Vincenty's direct formula on the WGS-84 ellipsoid.
GeoPoint destination_geodesic(const GeoPoint& start, real_t bearing_deg, real_t distance_km);

// Spherical earth of radius EARTH_RADIUS_KM.
GeoPoint destination_great_circle(const GeoPoint& start, real_t bearing_deg, real_t distance_km);

// Ring-major batch: for each distance, for each bearing.
std::vector<GeoPoint> destinations(const GeoPoint& start,
                                   const std::vector<real_t>& distances_km,
                                   const std::vector<real_t>& bearings_deg,
                                   DistanceModel model = DistanceModel::GEODESIC);

// --- Inverse problem ---
real_t distance_km(const GeoPoint& a, const GeoPoint& b,
                   DistanceModel model = DistanceModel::GEODESIC);

// Vincenty's inverse formula. Throws std::runtime_error if the iteration does
// not converge (nearly antipodal points).
real_t geodesic_distance_km(const GeoPoint& a, const GeoPoint& b);

// Haversine distance on the sphere of radius EARTH_RADIUS_KM.
real_t great_circle_distance_km(const GeoPoint& a, const GeoPoint& b);

} // namespace geodesy
} // namespace Cradial

#endif // Cradial_GEODESY_HPP
