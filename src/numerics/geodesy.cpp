#include "geodesy.hpp"
#include "utils/math_utils.hpp"
#include <cmath>     // For sin, cos, atan2, sqrt
#include <stdexcept>
#include <string>

namespace Cradial {
namespace geodesy {

using utils::degrees_to_radians;
using utils::radians_to_degrees;
using utils::sq;

real_t normalize_longitude(real_t lon_deg) {
    return utils::wrap_angle(lon_deg, 180.0);
}

void validate_latitude(real_t lat_deg) {
    if (!std::isfinite(lat_deg) || lat_deg < -90.0 || lat_deg > 90.0) {
        throw std::invalid_argument("Latitude must be in the [-90; 90] range, got " + std::to_string(lat_deg));
    }
}

namespace {

// Reduced latitude terms (sin U, cos U) for a geodetic latitude in radians.
void reduced_latitude(real_t phi, real_t& sin_u, real_t& cos_u) {
    real_t tan_u = (1.0 - WGS84_F) * std::tan(phi);
    cos_u = 1.0 / std::sqrt(1.0 + tan_u * tan_u);
    sin_u = tan_u * cos_u;
}

real_t clamp_latitude(real_t lat_deg) {
    if (lat_deg > 90.0) return 90.0;
    if (lat_deg < -90.0) return -90.0;
    return lat_deg;
}

} // namespace

// --- Direct problem ---
GeoPoint destination(const GeoPoint& start, real_t bearing_deg, real_t distance_km, DistanceModel model) {
    switch (model) {
        case DistanceModel::GEODESIC: return destination_geodesic(start, bearing_deg, distance_km);
        case DistanceModel::GREAT_CIRCLE: return destination_great_circle(start, bearing_deg, distance_km);
    }
    throw std::invalid_argument("Unknown distance model.");
}

GeoPoint destination_geodesic(const GeoPoint& start, real_t bearing_deg, real_t distance_km) {
    validate_latitude(start.lat);
    if (!std::isfinite(bearing_deg) || !std::isfinite(distance_km)) {
        throw std::invalid_argument("Bearing and distance must be finite.");
    }
    if (distance_km == 0.0) {
        return GeoPoint(start.lat, normalize_longitude(start.lon));
    }

    const real_t a = WGS84_A_KM;
    const real_t b = WGS84_B_KM;
    const real_t f = WGS84_F;

    real_t alpha1 = degrees_to_radians(bearing_deg);
    real_t sin_alpha1 = std::sin(alpha1);
    real_t cos_alpha1 = std::cos(alpha1);

    real_t sin_u1, cos_u1;
    reduced_latitude(degrees_to_radians(start.lat), sin_u1, cos_u1);

    real_t sigma1 = std::atan2(sin_u1, cos_u1 * cos_alpha1);
    real_t sin_alpha = cos_u1 * sin_alpha1;
    real_t cos_sq_alpha = 1.0 - sin_alpha * sin_alpha;
    real_t u_sq = cos_sq_alpha * (a * a - b * b) / (b * b);
    real_t big_a = 1.0 + u_sq / 16384.0 * (4096.0 + u_sq * (-768.0 + u_sq * (320.0 - 175.0 * u_sq)));
    real_t big_b = u_sq / 1024.0 * (256.0 + u_sq * (-128.0 + u_sq * (74.0 - 47.0 * u_sq)));

    real_t sigma = distance_km / (b * big_a);
    real_t sigma_prev = 0.0;
    real_t cos_2sigma_m = 0.0, sin_sigma = 0.0, cos_sigma = 0.0;
    int_t iterations = 0;
    do {
        cos_2sigma_m = std::cos(2.0 * sigma1 + sigma);
        sin_sigma = std::sin(sigma);
        cos_sigma = std::cos(sigma);
        real_t delta_sigma = big_b * sin_sigma * (cos_2sigma_m + big_b / 4.0 *
            (cos_sigma * (-1.0 + 2.0 * sq(cos_2sigma_m)) -
             big_b / 6.0 * cos_2sigma_m * (-3.0 + 4.0 * sq(sin_sigma)) * (-3.0 + 4.0 * sq(cos_2sigma_m))));
        sigma_prev = sigma;
        sigma = distance_km / (b * big_a) + delta_sigma;
    } while (std::abs(sigma - sigma_prev) > GEODESIC_TOLERANCE && ++iterations < GEODESIC_MAX_ITERATIONS);

    // Direct problem always converges; refresh the trig terms for the final sigma.
    cos_2sigma_m = std::cos(2.0 * sigma1 + sigma);
    sin_sigma = std::sin(sigma);
    cos_sigma = std::cos(sigma);

    real_t tmp = sin_u1 * sin_sigma - cos_u1 * cos_sigma * cos_alpha1;
    real_t phi2 = std::atan2(sin_u1 * cos_sigma + cos_u1 * sin_sigma * cos_alpha1,
                             (1.0 - f) * std::sqrt(sin_alpha * sin_alpha + tmp * tmp));
    real_t lambda = std::atan2(sin_sigma * sin_alpha1,
                               cos_u1 * cos_sigma - sin_u1 * sin_sigma * cos_alpha1);
    real_t c = f / 16.0 * cos_sq_alpha * (4.0 + f * (4.0 - 3.0 * cos_sq_alpha));
    real_t big_l = lambda - (1.0 - c) * f * sin_alpha *
        (sigma + c * sin_sigma * (cos_2sigma_m + c * cos_sigma * (-1.0 + 2.0 * sq(cos_2sigma_m))));

    real_t lat2 = clamp_latitude(radians_to_degrees(phi2));
    real_t lon2 = normalize_longitude(start.lon + radians_to_degrees(big_l));
    return GeoPoint(lat2, lon2);
}

GeoPoint destination_great_circle(const GeoPoint& start, real_t bearing_deg, real_t distance_km) {
    validate_latitude(start.lat);
    if (!std::isfinite(bearing_deg) || !std::isfinite(distance_km)) {
        throw std::invalid_argument("Bearing and distance must be finite.");
    }
    if (distance_km == 0.0) {
        return GeoPoint(start.lat, normalize_longitude(start.lon));
    }

    real_t phi1 = degrees_to_radians(start.lat);
    real_t theta = degrees_to_radians(bearing_deg);
    real_t delta = distance_km / EARTH_RADIUS_KM; // angular distance

    real_t sin_phi2 = std::sin(phi1) * std::cos(delta) + std::cos(phi1) * std::sin(delta) * std::cos(theta);
    if (sin_phi2 > 1.0) sin_phi2 = 1.0;
    if (sin_phi2 < -1.0) sin_phi2 = -1.0;
    real_t phi2 = std::asin(sin_phi2);
    real_t dlambda = std::atan2(std::sin(theta) * std::sin(delta) * std::cos(phi1),
                                std::cos(delta) - std::sin(phi1) * sin_phi2);

    return GeoPoint(clamp_latitude(radians_to_degrees(phi2)),
                    normalize_longitude(start.lon + radians_to_degrees(dlambda)));
}

std::vector<GeoPoint> destinations(const GeoPoint& start,
                                   const std::vector<real_t>& distances_km,
                                   const std::vector<real_t>& bearings_deg,
                                   DistanceModel model) {
    std::vector<GeoPoint> points;
    points.reserve(distances_km.size() * bearings_deg.size());
    for (real_t km : distances_km) {
        for (real_t deg : bearings_deg) {
            points.push_back(destination(start, deg, km, model));
        }
    }
    return points;
}

// --- Inverse problem ---
real_t distance_km(const GeoPoint& a, const GeoPoint& b, DistanceModel model) {
    switch (model) {
        case DistanceModel::GEODESIC: return geodesic_distance_km(a, b);
        case DistanceModel::GREAT_CIRCLE: return great_circle_distance_km(a, b);
    }
    throw std::invalid_argument("Unknown distance model.");
}

real_t geodesic_distance_km(const GeoPoint& p1, const GeoPoint& p2) {
    validate_latitude(p1.lat);
    validate_latitude(p2.lat);

    const real_t a = WGS84_A_KM;
    const real_t b = WGS84_B_KM;
    const real_t f = WGS84_F;

    real_t big_l = degrees_to_radians(normalize_longitude(p2.lon - p1.lon));
    real_t sin_u1, cos_u1, sin_u2, cos_u2;
    reduced_latitude(degrees_to_radians(p1.lat), sin_u1, cos_u1);
    reduced_latitude(degrees_to_radians(p2.lat), sin_u2, cos_u2);

    real_t lambda = big_l;
    real_t lambda_prev = 0.0;
    real_t sin_sigma = 0.0, cos_sigma = 0.0, sigma = 0.0;
    real_t cos_sq_alpha = 0.0, cos_2sigma_m = 0.0;
    bool converged = false;

    for (int_t it = 0; it < GEODESIC_MAX_ITERATIONS; ++it) {
        real_t sin_lambda = std::sin(lambda);
        real_t cos_lambda = std::cos(lambda);
        sin_sigma = std::sqrt(sq(cos_u2 * sin_lambda) +
                              sq(cos_u1 * sin_u2 - sin_u1 * cos_u2 * cos_lambda));
        if (sin_sigma == 0.0) {
            return 0.0; // coincident points
        }
        cos_sigma = sin_u1 * sin_u2 + cos_u1 * cos_u2 * cos_lambda;
        sigma = std::atan2(sin_sigma, cos_sigma);
        real_t sin_alpha = cos_u1 * cos_u2 * sin_lambda / sin_sigma;
        cos_sq_alpha = 1.0 - sin_alpha * sin_alpha;
        // Equatorial line: cos_sq_alpha == 0
        cos_2sigma_m = (cos_sq_alpha != 0.0) ? cos_sigma - 2.0 * sin_u1 * sin_u2 / cos_sq_alpha : 0.0;
        real_t c = f / 16.0 * cos_sq_alpha * (4.0 + f * (4.0 - 3.0 * cos_sq_alpha));
        lambda_prev = lambda;
        lambda = big_l + (1.0 - c) * f * sin_alpha *
            (sigma + c * sin_sigma * (cos_2sigma_m + c * cos_sigma * (-1.0 + 2.0 * sq(cos_2sigma_m))));
        if (std::abs(lambda - lambda_prev) <= GEODESIC_TOLERANCE) {
            converged = true;
            break;
        }
    }
    if (!converged) {
        throw std::runtime_error("Inverse geodesic failed to converge (points nearly antipodal).");
    }

    real_t u_sq = cos_sq_alpha * (a * a - b * b) / (b * b);
    real_t big_a = 1.0 + u_sq / 16384.0 * (4096.0 + u_sq * (-768.0 + u_sq * (320.0 - 175.0 * u_sq)));
    real_t big_b = u_sq / 1024.0 * (256.0 + u_sq * (-128.0 + u_sq * (74.0 - 47.0 * u_sq)));
    real_t delta_sigma = big_b * sin_sigma * (cos_2sigma_m + big_b / 4.0 *
        (cos_sigma * (-1.0 + 2.0 * sq(cos_2sigma_m)) -
         big_b / 6.0 * cos_2sigma_m * (-3.0 + 4.0 * sq(sin_sigma)) * (-3.0 + 4.0 * sq(cos_2sigma_m))));

    return b * big_a * (sigma - delta_sigma);
}

real_t great_circle_distance_km(const GeoPoint& p1, const GeoPoint& p2) {
    validate_latitude(p1.lat);
    validate_latitude(p2.lat);
    real_t phi1 = degrees_to_radians(p1.lat);
    real_t phi2 = degrees_to_radians(p2.lat);
    real_t dphi = phi2 - phi1;
    real_t dlambda = degrees_to_radians(p2.lon - p1.lon);

    real_t h = sq(std::sin(dphi / 2.0)) + std::cos(phi1) * std::cos(phi2) * sq(std::sin(dlambda / 2.0));
    if (h > 1.0) h = 1.0;
    return 2.0 * EARTH_RADIUS_KM * std::asin(std::sqrt(h));
}

} // namespace geodesy
} // namespace Cradial
