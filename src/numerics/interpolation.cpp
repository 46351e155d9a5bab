#include "interpolation.hpp"
#include <cmath> // For std::isnan
#include <algorithm> // For std::upper_bound
#include <functional> // For std::greater
#include <stdexcept>
#include <string>

namespace Cradial {
namespace interpolation {

AxisLocation locate(const std::vector<real_t>& axis, int direction, real_t x) {
    AxisLocation loc;
    const size_t n = axis.size();
    if (n == 0 || std::isnan(x)) {
        return loc;
    }
    if (n == 1) {
        loc.lower = 0;
        loc.weight = 0.0;
        loc.in_bounds = (x == axis[0]);
        return loc;
    }

    real_t lo = (direction > 0) ? axis.front() : axis.back();
    real_t hi = (direction > 0) ? axis.back() : axis.front();
    if (x < lo || x > hi) {
        return loc;
    }

    std::vector<real_t>::const_iterator it;
    if (direction > 0) {
        it = std::upper_bound(axis.begin(), axis.end(), x);
    } else {
        it = std::upper_bound(axis.begin(), axis.end(), x, std::greater<real_t>());
    }
    size_t i = static_cast<size_t>(it - axis.begin());
    i = (i == 0) ? 0 : i - 1;
    if (i > n - 2) i = n - 2;

    loc.lower = i;
    loc.weight = (x - axis[i]) / (axis[i + 1] - axis[i]);
    loc.in_bounds = true;
    return loc;
}

void check_grid(const GeoField& field, InterpMethod method) {
    if (field.get_total_nodes() == 0) {
        throw std::invalid_argument("Field grid must be configured before interpolation.");
    }
    if (method == InterpMethod::LINEAR) {
        const uint_t npts[2] = {field.get_nlon(), field.get_nlat()};
        for (int dim = 0; dim < 2; ++dim) {
            if (npts[dim] < 2) {
                throw std::invalid_argument("There are " + std::to_string(npts[dim]) + " points in dimension " +
                                            std::to_string(dim) + ", but method linear requires at least 2 points per dimension.");
            }
        }
    }
}

void bilinear(const GeoField& field, const AxisLocation& lon_loc, const AxisLocation& lat_loc, real_t* out) {
    const size_t i = lon_loc.lower;
    const size_t j = lat_loc.lower;
    const real_t tx = lon_loc.weight;
    const real_t ty = lat_loc.weight;
    const uint_t ntime = field.get_ntime();
    const std::vector<real_t>& values = field.get_values_raw();

    const size_t f00 = field.get_flat_index(i, j);
    const size_t f10 = field.get_flat_index(i + 1, j);
    const size_t f01 = field.get_flat_index(i, j + 1);
    const size_t f11 = field.get_flat_index(i + 1, j + 1);

    const real_t w00 = (1.0 - tx) * (1.0 - ty);
    const real_t w10 = tx * (1.0 - ty);
    const real_t w01 = (1.0 - tx) * ty;
    const real_t w11 = tx * ty;

    for (uint_t k = 0; k < ntime; ++k) {
        out[k] = values[f00 + k] * w00 + values[f10 + k] * w10 +
                 values[f01 + k] * w01 + values[f11 + k] * w11;
    }
}

void nearest(const GeoField& field, const AxisLocation& lon_loc, const AxisLocation& lat_loc, real_t* out) {
    // Ties go to the lower node
    const size_t i = (lon_loc.weight <= 0.5) ? lon_loc.lower : lon_loc.lower + 1;
    const size_t j = (lat_loc.weight <= 0.5) ? lat_loc.lower : lat_loc.lower + 1;
    const uint_t ntime = field.get_ntime();
    const std::vector<real_t>& values = field.get_values_raw();
    const size_t base = field.get_flat_index(i, j);
    for (uint_t k = 0; k < ntime; ++k) {
        out[k] = values[base + k];
    }
}

std::vector<real_t> regular_grid(const GeoField& field,
                                 const std::vector<GeoPoint>& points,
                                 const InterpOptions& options) {
    check_grid(field, options.method);

    const uint_t ntime = field.get_ntime();
    std::vector<real_t> result(points.size() * ntime, options.fill_value);
    std::vector<AxisLocation> lon_locs(points.size());
    std::vector<AxisLocation> lat_locs(points.size());

    // Bounds are checked for every point before any value is computed
    for (size_t p = 0; p < points.size(); ++p) {
        const GeoPoint& pt = points[p];
        lon_locs[p] = locate(field.get_lons(), field.get_lon_direction(), pt.lon);
        lat_locs[p] = locate(field.get_lats(), field.get_lat_direction(), pt.lat);
        if (!options.bounds_error || std::isnan(pt.lon) || std::isnan(pt.lat)) {
            continue;
        }
        if (!lon_locs[p].in_bounds) {
            throw std::out_of_range("One of the requested xi is out of bounds in dimension 0 (longitude " +
                                    std::to_string(pt.lon) + ").");
        }
        if (!lat_locs[p].in_bounds) {
            throw std::out_of_range("One of the requested xi is out of bounds in dimension 1 (latitude " +
                                    std::to_string(pt.lat) + ").");
        }
    }

    for (size_t p = 0; p < points.size(); ++p) {
        real_t* out = result.data() + p * ntime;
        if (std::isnan(points[p].lon) || std::isnan(points[p].lat)) {
            std::fill(out, out + ntime, NaN);
            continue;
        }
        if (!lon_locs[p].in_bounds || !lat_locs[p].in_bounds) {
            continue; // keeps fill_value
        }
        if (options.method == InterpMethod::NEAREST) {
            nearest(field, lon_locs[p], lat_locs[p], out);
        } else {
            bilinear(field, lon_locs[p], lat_locs[p], out);
        }
    }
    return result;
}

} // namespace interpolation
} // namespace Cradial
