#include "radial_types.hpp"
#include <stdexcept>
#include <algorithm> // For std::transform
#include <cmath>

namespace Cradial {

namespace {
std::string lowercase(const std::string& s_in) {
    std::string s = s_in;
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}
} // namespace

std::string to_string(InterpMethod m) {
    switch (m) {
        case InterpMethod::LINEAR: return "linear";
        case InterpMethod::NEAREST: return "nearest";
        default: return "unknown";
    }
}

InterpMethod interp_method_from_string(const std::string& s_in) {
    std::string s = lowercase(s_in);
    if (s == "linear") return InterpMethod::LINEAR;
    if (s == "nearest") return InterpMethod::NEAREST;
    throw std::invalid_argument("Unknown interpolation method string: " + s_in);
}

std::string to_string(DistanceModel dm) {
    switch (dm) {
        case DistanceModel::GEODESIC: return "geodesic";
        case DistanceModel::GREAT_CIRCLE: return "great_circle";
        default: return "unknown";
    }
}

DistanceModel distance_model_from_string(const std::string& s_in) {
    std::string s = lowercase(s_in);
    if (s == "geodesic") return DistanceModel::GEODESIC;
    if (s == "great_circle" || s == "great-circle") return DistanceModel::GREAT_CIRCLE;
    throw std::invalid_argument("Unknown distance model string: " + s_in);
}

std::vector<real_t> make_steps(real_t start, real_t stop, real_t step) {
    if (step == 0.0 || !std::isfinite(step)) {
        throw std::invalid_argument("Step must be finite and non-zero.");
    }
    std::vector<real_t> steps;
    real_t count_f = std::ceil((stop - start) / step);
    if (!(count_f > 0.0)) {
        return steps;
    }
    size_t count = static_cast<size_t>(count_f);
    steps.reserve(count);
    for (size_t n = 0; n < count; ++n) {
        steps.push_back(start + static_cast<real_t>(n) * step);
    }
    return steps;
}

} // namespace Cradial
