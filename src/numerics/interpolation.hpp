#ifndef Cradial_INTERPOLATION_HPP
#define Cradial_INTERPOLATION_HPP

#include "../core/radial_types.hpp"
#include "../fields/geo_field.hpp" // Need GeoField for grid info
#include <vector>

namespace Cradial {
namespace interpolation {

// Position of a coordinate along one monotonic axis.
struct AxisLocation {
    size_t lower = 0;      // index of the lower node of the bracketing cell
    real_t weight = 0.0;   // fractional distance from `lower` toward `lower + 1`
    bool in_bounds = false;
};

// Brackets `x` on `axis` (strictly ascending if direction > 0, descending if < 0).
// A coordinate on the last node falls in the last cell.
AxisLocation locate(const std::vector<real_t>& axis, int direction, real_t x);

// Throws std::invalid_argument if the field cannot be used with `method`.
void check_grid(const GeoField& field, InterpMethod method);

// --- Per-point kernels ---
// Write one value per time slice into `out` (field.get_ntime() entries).
void bilinear(const GeoField& field, const AxisLocation& lon_loc, const AxisLocation& lat_loc, real_t* out);
void nearest(const GeoField& field, const AxisLocation& lon_loc, const AxisLocation& lat_loc, real_t* out);

// --- Regular grid lookup over the (lon, lat) plane ---
// Returns values flattened [point][time]. Out-of-bounds points either throw
// std::out_of_range (options.bounds_error) or get options.fill_value.
// NaN query coordinates yield NaN.
std::vector<real_t> regular_grid(const GeoField& field,
                                 const std::vector<GeoPoint>& points,
                                 const InterpOptions& options = InterpOptions());

} // namespace interpolation
} // namespace Cradial

#endif // Cradial_INTERPOLATION_HPP
