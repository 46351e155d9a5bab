#ifndef MATH_UTILS_HPP
#define MATH_UTILS_HPP

#include "../core/radial_constants.hpp"
#include <cmath> // For std::fmod, std::abs
#include <vector>

namespace Cradial {
namespace utils {

inline real_t degrees_to_radians(real_t degrees) { return degrees * PI / 180.0; }
inline real_t radians_to_degrees(real_t radians) { return radians * 180.0 / PI; }

// Maps an angle into [-limit, limit).
inline real_t wrap_angle(real_t value, real_t limit) {
    real_t double_limit = 2.0 * limit;
    real_t modulo = std::fmod(value, double_limit);
    if (modulo == 0.0) modulo = 0.0; // drop the sign of -0.0
    if (modulo < -limit) return modulo + double_limit;
    if (modulo >= limit) return modulo - double_limit;
    return modulo;
}

// +1 for strictly ascending, -1 for strictly descending, 0 otherwise.
// A single element counts as ascending.
template<typename T>
int monotonic_direction(const std::vector<T>& vec) {
    if (vec.empty()) return 0;
    if (vec.size() == 1) return std::isfinite(vec[0]) ? 1 : 0;
    int direction = (vec[1] > vec[0]) ? 1 : ((vec[1] < vec[0]) ? -1 : 0);
    if (direction == 0) return 0;
    for (size_t i = 1; i < vec.size(); ++i) {
        if (!std::isfinite(vec[i]) || !std::isfinite(vec[i - 1])) return 0;
        if (direction > 0 && !(vec[i] > vec[i - 1])) return 0;
        if (direction < 0 && !(vec[i] < vec[i - 1])) return 0;
    }
    return direction;
}

// Square of x, used a lot by the geodesic series.
template<typename T>
inline T sq(T x) { return x * x; }

} // namespace utils
} // namespace Cradial

#endif // MATH_UTILS_HPP
