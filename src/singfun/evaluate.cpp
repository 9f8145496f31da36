/// @file src/singfun/evaluate.cpp
/// @brief Pointwise evaluation, roots and global extrema.

#include "sfn/singfun.hpp"
#include "sfn/detect.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace sfn {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

Exponents snapped(const Exponents& e, double tol) noexcept {
    return Exponents{detect::snap_exponent(e.left, tol),
                     detect::snap_exponent(e.right, tol)};
}

/// Limit of f at an endpoint from the smooth value there and the exponents.
double endpoint_value(double s_end, double end_exp, double other_exp) noexcept {
    if (!std::isfinite(s_end)) {
        return kNaN;
    }
    if (end_exp > 0.0) {
        return 0.0;
    }
    if (end_exp < 0.0) {
        if (s_end == 0.0) {
            return kNaN;
        }
        return std::copysign(std::numeric_limits<double>::infinity(), s_end);
    }
    // The other factor's base is 2 here.
    return s_end * std::pow(2.0, other_exp);
}

} // anonymous namespace

// ─── Evaluation ───────────────────────────────────────────────────────────────

double feval(const Singfun& f, double x, const SingfunConfig& cfg) {
    if (!(x >= -1.0 && x <= 1.0)) {
        return kNaN;
    }
    if (f.is_zero()) {
        return 0.0;
    }
    const Exponents e = snapped(f.exponents(), cfg.exponent_tol);
    const smooth::Chebtech& s = f.smooth_part();

    if (x == -1.0) {
        return endpoint_value(s.left_value(), e.left, e.right);
    }
    if (x == 1.0) {
        return endpoint_value(s.right_value(), e.right, e.left);
    }
    return s.evaluate(x) * singular_factor(x, e);
}

// ─── Roots ────────────────────────────────────────────────────────────────────

std::vector<double> roots(const Singfun& f, RootsOptions opts, const SingfunConfig& cfg) {
    std::vector<double> out;
    if (f.is_zero()) {
        return out;
    }
    const Exponents e = snapped(f.exponents(), cfg.exponent_tol);
    const double edge = 1.0 - constants::ROOT_MERGE_TOL;

    bool smooth_root_left  = false;
    bool smooth_root_right = false;
    for (double r : f.smooth_part().roots()) {
        if (r <= -edge) {
            smooth_root_left = true;
        } else if (r >= edge) {
            smooth_root_right = true;
        } else {
            out.push_back(r);
        }
    }

    // A root of s at an endpoint is a root of f only where the factor is 1
    // there; under a pole the limit is undetermined.
    if ((e.left > 0.0 && opts.include_endpoints) || (e.left == 0.0 && smooth_root_left)) {
        out.push_back(-1.0);
    }
    if ((e.right > 0.0 && opts.include_endpoints) || (e.right == 0.0 && smooth_root_right)) {
        out.push_back(1.0);
    }

    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end(),
                          [](double a, double b) {
                              return std::abs(a - b) < constants::ROOT_MERGE_TOL;
                          }),
              out.end());
    return out;
}

// ─── Extrema ──────────────────────────────────────────────────────────────────

std::pair<smooth::Extremum, smooth::Extremum>
minandmax(const Singfun& f, const SingfunConfig& cfg) {
    if (f.is_zero()) {
        return {smooth::Extremum{0.0, -1.0}, smooth::Extremum{0.0, -1.0}};
    }
    if (snapped(f.exponents(), cfg.exponent_tol).is_trivial()) {
        return f.smooth_part().minandmax();
    }

    // Critical points are interior roots of f′'s smooth part.
    std::vector<double> candidates{-1.0, 1.0};
    const Singfun df = diff(f, 1, cfg);
    if (!df.is_zero()) {
        for (double r : df.smooth_part().roots()) {
            if (r > -1.0 && r < 1.0) {
                candidates.push_back(r);
            }
        }
    }

    smooth::Extremum lo{kNaN, kNaN};
    smooth::Extremum hi{kNaN, kNaN};
    for (double x : candidates) {
        const double v = feval(f, x, cfg);
        if (std::isnan(v)) {
            continue;
        }
        if (std::isnan(lo.value) || v < lo.value) {
            lo = smooth::Extremum{v, x};
        }
        if (std::isnan(hi.value) || v > hi.value) {
            hi = smooth::Extremum{v, x};
        }
    }
    return {lo, hi};
}

smooth::Extremum min(const Singfun& f, const SingfunConfig& cfg) {
    return minandmax(f, cfg).first;
}

smooth::Extremum max(const Singfun& f, const SingfunConfig& cfg) {
    return minandmax(f, cfg).second;
}

} // namespace sfn
