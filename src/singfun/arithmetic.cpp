/// @file src/singfun/arithmetic.cpp
/// @brief Products, quotients and sums of singular functions.

#include "sfn/singfun.hpp"
#include "sfn/errors.hpp"
#include "sfn/log.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>

namespace sfn {

namespace {

/// Integer power n ≥ 0 by which `excess` must be absorbed, or throw.
int absorbable_power(double excess, double tol, const char* side,
                     const Exponents& p, const Exponents& q) {
    const double n = std::round(excess);
    if (std::abs(excess - n) >= tol || n < 0.0) {
        throw AdditionIncompatibleExponents(fmt::format(
            "({:g}, {:g}) + ({:g}, {:g}): {} excess {:g} is not a non-negative integer",
            p.left, p.right, q.left, q.right, side, excess));
    }
    return static_cast<int>(n);
}

/// Re-express f's smooth part over the exponents `common`.
smooth::Chebtech lift_to(const Singfun& f, const Exponents& common,
                         const Exponents& other, const SingfunConfig& cfg) {
    const Exponents& e = f.exponents();
    const int nl = absorbable_power(e.left - common.left, cfg.exponent_tol, "left", e, other);
    const int nr = absorbable_power(e.right - common.right, cfg.exponent_tol, "right", e, other);

    smooth::Chebtech s = f.smooth_part();
    if (nl > 0) {
        s = s * smooth::Chebtech::endpoint_power(Endpoint::Left, nl);
    }
    if (nr > 0) {
        s = s * smooth::Chebtech::endpoint_power(Endpoint::Right, nr);
    }
    return s;
}

} // anonymous namespace

// ─── Products and quotients ───────────────────────────────────────────────────

Singfun times(const Singfun& f, const Singfun& g) {
    if (f.is_zero() || g.is_zero()) {
        return Singfun::zero();
    }
    return Singfun(smooth::Chebtech::multiply(f.smooth_part(), g.smooth_part()),
                   f.exponents() + g.exponents());
}

Singfun times(const Singfun& f, double c) {
    if (c == 0.0 || f.is_zero()) {
        return Singfun::zero();
    }
    return Singfun(c * f.smooth_part(), f.exponents());
}

Singfun rdivide(const Singfun& f, const Singfun& g, const SingfunConfig& cfg) {
    if (g.is_zero()) {
        throw DivisionBySingularResidual("divisor is identically zero");
    }
    const auto g_roots = g.smooth_part().roots();
    if (!g_roots.empty()) {
        throw DivisionBySingularResidual(fmt::format(
            "divisor's smooth part vanishes at x = {:.17g}", g_roots.front()));
    }
    if (f.is_zero()) {
        return Singfun::zero();
    }
    return Singfun(smooth::Chebtech::divide(f.smooth_part(), g.smooth_part(), cfg),
                   f.exponents() - g.exponents());
}

// ─── Sums ─────────────────────────────────────────────────────────────────────

Singfun plus(const Singfun& f, const Singfun& g, const SingfunConfig& cfg) {
    if (f.is_zero()) {
        return g;
    }
    if (g.is_zero()) {
        return f;
    }

    if (same_exponents(f.exponents(), g.exponents(), cfg.exponent_tol)) {
        return Singfun(f.smooth_part() + g.smooth_part(), f.exponents());
    }

    const Exponents common{std::min(f.exponents().left, g.exponents().left),
                           std::min(f.exponents().right, g.exponents().right)};
    const smooth::Chebtech sf = lift_to(f, common, g.exponents(), cfg);
    const smooth::Chebtech sg = lift_to(g, common, f.exponents(), cfg);

    log::debug(cfg, "plus: ({:g}, {:g}) + ({:g}, {:g}) over ({:g}, {:g})",
               f.exponents().left, f.exponents().right,
               g.exponents().left, g.exponents().right,
               common.left, common.right);
    return Singfun(sf + sg, common);
}

Singfun plus(const Singfun& f, double c, const SingfunConfig& cfg) {
    if (c == 0.0) {
        return f;
    }
    return plus(f, Singfun(smooth::Chebtech::constant(c), Exponents{}), cfg);
}

Singfun minus(const Singfun& f, const Singfun& g, const SingfunConfig& cfg) {
    return plus(f, uminus(g), cfg);
}

Singfun uminus(const Singfun& f) {
    return Singfun(-f.smooth_part(), f.exponents());
}

Singfun uplus(const Singfun& f) {
    return f;
}

Singfun flip(const Singfun& f) {
    return Singfun(f.smooth_part().flip(),
                   Exponents{f.exponents().right, f.exponents().left});
}

} // namespace sfn
