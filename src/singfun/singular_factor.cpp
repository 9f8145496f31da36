/// @file src/singfun/singular_factor.cpp
/// @brief (1+x)^a (1-x)^b with explicit endpoint limits.

#include "sfn/singfun.hpp"
#include "sfn/detect.hpp"

#include <cmath>
#include <limits>

namespace sfn {

namespace {

/// base^p for base ≥ 0, with 0^p resolved by the sign of p and p = 0
/// contributing exactly 1.
double endpoint_pow(double base, double p) noexcept {
    if (p == 0.0) {
        return 1.0;
    }
    if (base == 0.0) {
        return p > 0.0 ? 0.0 : std::numeric_limits<double>::infinity();
    }
    return std::pow(base, p);
}

} // anonymous namespace

double singular_factor(double x, const Exponents& e) noexcept {
    if (!(x >= -1.0 && x <= 1.0)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return endpoint_pow(1.0 + x, e.left) * endpoint_pow(1.0 - x, e.right);
}

double singular_factor(double x, const Exponents& e, double tol) noexcept {
    return singular_factor(x, Exponents{detect::snap_exponent(e.left, tol),
                                        detect::snap_exponent(e.right, tol)});
}

} // namespace sfn
