/// @file src/singfun/restrict.cpp
/// @brief Restriction of a singular function to a subinterval.

#include "sfn/singfun.hpp"
#include "sfn/detect.hpp"
#include "sfn/log.hpp"

#include <fmt/core.h>

#include <cmath>
#include <stdexcept>

namespace sfn {

Singfun restrict(const Singfun& f, double a, double b, const SingfunConfig& cfg) {
    if (!(a >= -1.0 && b <= 1.0 && a < b)) {
        throw std::invalid_argument(fmt::format(
            "restrict needs -1 <= a < b <= 1, got [{:g}, {:g}]", a, b));
    }
    if (f.is_zero()) {
        return Singfun::zero();
    }
    if (a == -1.0 && b == 1.0) {
        return f;
    }

    const Exponents e{detect::snap_exponent(f.exponents().left,  cfg.exponent_tol),
                      detect::snap_exponent(f.exponents().right, cfg.exponent_tol)};
    const bool keep_left  = (a == -1.0);
    const bool keep_right = (b == 1.0);
    const double mid  = 0.5 * (a + b);
    const double half = 0.5 * (b - a);

    // With x = mid + half t: 1 + x = half (1 + t) when a = -1, and
    // 1 - x = half (1 - t) when b = 1.
    const double left_scale  = (keep_left  && e.left  != 0.0) ? std::pow(half, e.left)  : 1.0;
    const double right_scale = (keep_right && e.right != 0.0) ? std::pow(half, e.right) : 1.0;

    const smooth::Chebtech& s = f.smooth_part();
    auto residual = [&](double t) {
        const double x = mid + half * t;
        double v = s.evaluate(x) * left_scale * right_scale;
        if (!keep_left && e.left != 0.0) {
            v *= std::pow(1.0 + x, e.left);
        }
        if (!keep_right && e.right != 0.0) {
            v *= std::pow(1.0 - x, e.right);
        }
        return v;
    };

    const Exponents kept{keep_left ? e.left : 0.0, keep_right ? e.right : 0.0};
    log::debug(cfg, "restrict: [{:g}, {:g}], exponents ({:g}, {:g}) -> ({:g}, {:g})",
               a, b, e.left, e.right, kept.left, kept.right);
    return Singfun(smooth::Chebtech::make(residual, cfg), kept);
}

} // namespace sfn
