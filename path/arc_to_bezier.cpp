#include "arc_to_bezier.hpp"
#include <common/approx.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>

namespace keyshape {
namespace detail {

namespace {

using Vec = Vector<Unitless>;

// Pick the sweep that matches the flags. atan2 gives dphi in (-2pi, 2pi); the
// wanted sweep is in [-pi, 0], [0, pi], [-2pi, -pi] or [pi, 2pi]. Boundary
// values (half circles) are compared with tolerance so that float noise on an
// exact 180 degree sweep does not add a full turn.
Angle adjust_sweep(Angle dphi, bool large_arc, bool sweep) {
    const float pi = Angle::pi().to_radians();
    const float rad = dphi.to_radians();

    if (large_arc && sweep) {
        if (rad < pi && !approx::is_close(rad, pi)) return dphi + Angle::two_pi();
    } else if (large_arc && !sweep) {
        if (rad > -pi && !approx::is_close(rad, -pi)) return dphi - Angle::two_pi();
    } else if (!large_arc && sweep) {
        if (rad < 0.0f && !approx::is_zero(rad)) return dphi + Angle::two_pi();
    } else {
        if (rad > 0.0f && !approx::is_zero(rad)) return dphi - Angle::two_pi();
    }
    return dphi;
}

bool sweep_in_quadrant(Angle dphi, bool large_arc, bool sweep) {
    const float pi = Angle::pi().to_radians();
    const float rad = dphi.to_radians();

    float lo = 0.0f;
    float hi = 0.0f;
    if (!large_arc && !sweep) {
        lo = -pi; hi = 0.0f;
    } else if (!large_arc && sweep) {
        lo = 0.0f; hi = pi;
    } else if (large_arc && !sweep) {
        lo = -2.0f * pi; hi = -pi;
    } else {
        lo = pi; hi = 2.0f * pi;
    }
    return approx::less_or_close(lo, rad) && approx::less_or_close(rad, hi);
}

}  // namespace

Vector<Unitless> arc_center(Vec r, bool large_arc, bool sweep, Vec d) {
    // Only half of d is used below
    Vec d_2 = d / 2.0f;

    float sign = (large_arc == sweep) ? 1.0f : -1.0f;

    float rx_dy = r.x * d_2.y;
    float ry_dx = r.y * d_2.x;
    float expr = rx_dy * rx_dy + ry_dx * ry_dx;
    float rxry = r.x * r.y;
    float v = (rxry * rxry - expr) / expr;

    // v is slightly negative when the radii were scaled to exactly reach d
    float co = (v <= 0.0f || approx::is_zero(v)) ? 0.0f : sign * std::sqrt(v);
    Vec c(r.x * d_2.y / r.y, -r.y * d_2.x / r.x);

    return c * co + d_2;
}

BezierTriple<Unitless> arc_segment(Vec r, Angle phi0, Angle dphi) {
    float a = (4.0f / 3.0f) * (dphi / 4.0f).tan();

    Vec d1(phi0.cos(), phi0.sin());
    Angle phi1 = phi0 + dphi;
    Vec d4(phi1.cos(), phi1.sin());

    Vec d2(d1.x - d1.y * a, d1.y + d1.x * a);
    Vec d3(d4.x + d4.y * a, d4.y - d4.x * a);

    return {
        (d2 - d1).component_mul(r),
        (d3 - d1).component_mul(r),
        (d4 - d1).component_mul(r)
    };
}

std::vector<BezierTriple<Unitless>> arc_to_bezier_unitless(
    Vec r, Angle x_rotation, bool large_arc, bool sweep, Vec d, float tolerance) {

    std::vector<BezierTriple<Unitless>> result;

    if (d.length() <= tolerance) {
        return result;
    }

    // Zero radius on either axis degenerates to a straight line
    r = r.abs();
    if (r.x <= tolerance || r.y <= tolerance) {
        result.push_back({d / 3.0f, d * (2.0f / 3.0f), d});
        return result;
    }

    // Work as if x_rotation were zero and re-rotate the result at the end
    d = d.rotate(-x_rotation);

    // Scale the radii up if they can't reach d, keeping their ratio
    float lambda = std::max(d.component_div(r * 2.0f).length(), 1.0f);
    r = r * lambda;

    Vec c = arc_center(r, large_arc, sweep, d);

    Vec start_r = (-c).component_div(r);
    Angle phi0 = Angle::atan2(start_r.y, start_r.x);

    Vec end_r = (d - c).component_div(r);
    Angle dphi = Angle::atan2(end_r.y, end_r.x) - phi0;
    dphi = adjust_sweep(dphi, large_arc, sweep);

    if (!sweep_in_quadrant(dphi, large_arc, sweep)) {
        logging::get_logger("path")->warn(
            "Arc sweep {:.6f} rad outside expected range (large_arc={}, sweep={})",
            dphi.to_radians(), large_arc, sweep);
    }

    // Subtract the tolerance so 90.0001 degrees doesn't become 2 segments
    float quarters = std::abs(dphi / Angle::frac_pi_2());
    int count = std::clamp(static_cast<int>(std::ceil(quarters - approx::ABS_TOL)), 1, 4);
    Angle step = dphi / static_cast<float>(count);

    result.reserve(count);
    for (int i = 0; i < count; ++i) {
        Angle seg_start = phi0 + step * static_cast<float>(i);
        BezierTriple<Unitless> seg = arc_segment(r, seg_start, step);
        result.push_back({seg.ctrl1.rotate(x_rotation),
                          seg.ctrl2.rotate(x_rotation),
                          seg.end.rotate(x_rotation)});
    }

    return result;
}

}  // namespace detail
}  // namespace keyshape
