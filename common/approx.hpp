#ifndef KEYSHAPE_COMMON_APPROX_HPP
#define KEYSHAPE_COMMON_APPROX_HPP

#include <algorithm>
#include <cmath>

namespace keyshape {
namespace approx {

// Default tolerances for single precision geometry
constexpr float REL_TOL = 1e-5f;
constexpr float ABS_TOL = 1e-5f;

// True if a and b are within abs_tol of each other, or within rel_tol
// of the larger magnitude
inline bool is_close(float a, float b, float rel_tol = REL_TOL, float abs_tol = ABS_TOL) {
    if (a == b) {
        return true;
    }
    float diff = std::abs(a - b);
    float scale = std::max(std::abs(a), std::abs(b));
    return diff <= std::max(abs_tol, rel_tol * scale);
}

inline bool is_zero(float value, float abs_tol = ABS_TOL) {
    return std::abs(value) <= abs_tol;
}

// a <= b, allowing a to exceed b by the tolerance
inline bool less_or_close(float a, float b, float rel_tol = REL_TOL, float abs_tol = ABS_TOL) {
    return a <= b || is_close(a, b, rel_tol, abs_tol);
}

}  // namespace approx
}  // namespace keyshape

#endif // KEYSHAPE_COMMON_APPROX_HPP
