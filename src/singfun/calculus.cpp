/// @file src/singfun/calculus.cpp
/// @brief Derivatives, antiderivatives and definite integrals.
///
/// Antiderivatives with a branch exponent e > -1 at x = -1 are written as
///
///   ∫_{-1}^{x} s(t)(1+t)^e dt = (1+x)^{e+1} u(x),
///   u(x) = 2^{-e-1} ∫_{-1}^{1} s(-1 + (1+x)(1+ξ)/2) (1+ξ)^e dξ,
///
/// where u is a polynomial of the same degree as s and the inner integral
/// is exact under Gauss–Jacobi quadrature. The right endpoint is handled by
/// reflection.

#include "sfn/singfun.hpp"
#include "sfn/detect.hpp"
#include "sfn/errors.hpp"
#include "sfn/log.hpp"
#include "sfn/quadrature.hpp"

#include <fmt/core.h>

#include <cmath>
#include <stdexcept>

namespace sfn {

namespace {

Exponents snapped(const Exponents& e, double tol) noexcept {
    return Exponents{detect::snap_exponent(e.left, tol),
                     detect::snap_exponent(e.right, tol)};
}

void require_integrable(const Exponents& e, const char* what) {
    if (e.left <= -1.0 || e.right <= -1.0) {
        throw DivergentAntiderivative(fmt::format(
            "{} of a function with exponents ({:g}, {:g}) diverges",
            what, e.left, e.right));
    }
}

bool is_positive_integer(double e) noexcept {
    return e > 0.0 && e == std::round(e);
}

// Gauss–Jacobi nodes needed to integrate s times the weight exactly.
std::size_t rule_size(const smooth::Chebtech& s) noexcept {
    return s.length() / 2 + 2;
}

/// u with ∫_{-1}^{x} s(t)(1+t)^e dt = (1+x)^{e+1} u(x).
smooth::Chebtech left_branch_antiderivative(const smooth::Chebtech& s, double e) {
    const auto rule = quadrature::gauss_jacobi(rule_size(s), 0.0, e);
    if (!rule) {
        throw DivergentAntiderivative(fmt::format(
            "no quadrature rule for exponent {:g}", e));
    }
    const double scale = std::pow(2.0, -e - 1.0);
    auto u = [&s, &rule, scale](double x) {
        return scale * rule->apply([&s, x](double xi) {
            return s.evaluate(-1.0 + 0.5 * (1.0 + x) * (1.0 + xi));
        });
    };
    return smooth::Chebtech::interpolate(u, s.length() + 1).simplify();
}

Singfun diff_once(const Singfun& f, const SingfunConfig& cfg) {
    if (f.is_zero()) {
        return Singfun::zero();
    }
    const Exponents e = snapped(f.exponents(), cfg.exponent_tol);
    const smooth::Chebtech& s = f.smooth_part();

    Singfun df(s.diff(), e);
    if (e.left != 0.0) {
        df = plus(df, Singfun(e.left * s, Exponents{e.left - 1.0, e.right}), cfg);
    }
    if (e.right != 0.0) {
        df = plus(df, Singfun(-e.right * s, Exponents{e.left, e.right - 1.0}), cfg);
    }
    return df;
}

} // anonymous namespace

// ─── Derivatives ──────────────────────────────────────────────────────────────

Singfun diff(const Singfun& f, int k, const SingfunConfig& cfg) {
    if (k < 0) {
        throw std::invalid_argument(fmt::format("derivative order must be >= 0, got {}", k));
    }
    Singfun result = f;
    for (int i = 0; i < k; ++i) {
        result = diff_once(result, cfg);
    }
    return result;
}

// ─── Antiderivatives ──────────────────────────────────────────────────────────

Singfun cumsum(const Singfun& f, const SingfunConfig& cfg) {
    if (f.is_zero()) {
        return Singfun::zero();
    }
    Exponents e = snapped(f.exponents(), cfg.exponent_tol);
    require_integrable(e, "antiderivative");

    // Positive integer exponents are polynomial factors of the smooth part.
    smooth::Chebtech s = f.smooth_part();
    if (is_positive_integer(e.left)) {
        s = s * smooth::Chebtech::endpoint_power(Endpoint::Left, static_cast<int>(e.left));
        e.left = 0.0;
    }
    if (is_positive_integer(e.right)) {
        s = s * smooth::Chebtech::endpoint_power(Endpoint::Right, static_cast<int>(e.right));
        e.right = 0.0;
    }

    if (e.is_trivial()) {
        return Singfun(s.cumsum(), Exponents{});
    }
    if (e.left != 0.0 && e.right != 0.0) {
        throw AdditionIncompatibleExponents(fmt::format(
            "antiderivative with branch exponents ({:g}, {:g}) at both ends "
            "is not a single singular function", e.left, e.right));
    }

    log::debug(cfg, "cumsum: branch exponents ({:g}, {:g})", e.left, e.right);
    if (e.right == 0.0) {
        return Singfun(left_branch_antiderivative(s, e.left),
                       Exponents{e.left + 1.0, 0.0});
    }
    // F(x) = -G(-x) with G the left-branch antiderivative of f(-x).
    const smooth::Chebtech u = left_branch_antiderivative(s.flip(), e.right);
    return Singfun(-u.flip(), Exponents{0.0, e.right + 1.0});
}

// ─── Definite integrals ───────────────────────────────────────────────────────

double sum(const Singfun& f, const SingfunConfig& cfg) {
    if (f.is_zero()) {
        return 0.0;
    }
    const Exponents e = snapped(f.exponents(), cfg.exponent_tol);
    require_integrable(e, "integral");

    const smooth::Chebtech& s = f.smooth_part();
    if (e.is_trivial()) {
        return s.sum();
    }
    const auto rule = quadrature::gauss_jacobi(rule_size(s), e.right, e.left);
    if (!rule) {
        throw DivergentAntiderivative(fmt::format(
            "no quadrature rule for exponents ({:g}, {:g})", e.left, e.right));
    }
    return rule->apply([&s](double x) { return s.evaluate(x); });
}

double inner_product(const Singfun& f, const Singfun& g, const SingfunConfig& cfg) {
    return sum(times(f, g), cfg);
}

} // namespace sfn
