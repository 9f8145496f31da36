/// @file src/singfun/singfun.cpp
/// @brief Singfun construction, predicates and comparison.

#include "sfn/singfun.hpp"
#include "sfn/detect.hpp"
#include "sfn/errors.hpp"
#include "sfn/log.hpp"

#include <fmt/core.h>

#include <cmath>

namespace sfn {

namespace {

void require_finite(const Exponents& e) {
    if (!std::isfinite(e.left) || !std::isfinite(e.right)) {
        throw InvalidExponents(fmt::format(
            "exponents must be finite reals, got ({}, {})", e.left, e.right));
    }
}

} // anonymous namespace

// ─── Construction ─────────────────────────────────────────────────────────────

Singfun::Singfun() = default;

Singfun::Singfun(const ScalarFunction& op, const SingfunConfig& cfg)
    : Singfun(op, SingTypes{}, cfg) {}

Singfun::Singfun(const ScalarFunction& op, SingTypes hints, const SingfunConfig& cfg) {
    if (!op) {
        throw InvalidOperator("operator is empty");
    }
    exponents_ = detect::find_exponents(op, hints, cfg);
    build_smooth_part(op, cfg);
}

Singfun::Singfun(const ScalarFunction& op, Exponents exponents, const SingfunConfig& cfg)
    : exponents_(exponents) {
    if (!op) {
        throw InvalidOperator("operator is empty");
    }
    require_finite(exponents_);
    build_smooth_part(op, cfg);
}

Singfun::Singfun(smooth::Chebtech smooth_part, Exponents exponents)
    : smooth_(std::move(smooth_part))
    , exponents_(exponents) {
    require_finite(exponents_);
    if (smooth_.is_zero()) {
        exponents_ = Exponents{};
    }
}

Singfun Singfun::zero() {
    return Singfun();
}

void Singfun::build_smooth_part(const ScalarFunction& op, const SingfunConfig& cfg) {
    if (exponents_.is_trivial()) {
        smooth_ = smooth::Chebtech::make(op, cfg);
    } else {
        const Exponents e = exponents_;
        smooth_ = smooth::Chebtech::make(
            [&op, e](double x) { return op(x) / singular_factor(x, e); }, cfg);
    }

    if (smooth_.is_zero()) {
        exponents_ = Exponents{};
    }
    log::debug(cfg, "constructed {}", to_string());
}

// ─── Evaluation shortcut ──────────────────────────────────────────────────────

double Singfun::operator()(double x) const {
    return feval(*this, x);
}

// ─── Predicates ───────────────────────────────────────────────────────────────

bool Singfun::is_zero() const noexcept {
    return smooth_.is_zero();
}

bool Singfun::is_finite(double tol) const noexcept {
    if (is_zero()) {
        return true;
    }
    return detect::snap_exponent(exponents_.left, tol) >= 0.0
        && detect::snap_exponent(exponents_.right, tol) >= 0.0
        && smooth_.is_finite();
}

bool Singfun::is_inf(double tol) const noexcept {
    if (is_zero()) {
        return false;
    }
    return detect::snap_exponent(exponents_.left, tol) < 0.0
        || detect::snap_exponent(exponents_.right, tol) < 0.0;
}

bool Singfun::is_nan() const noexcept {
    return smooth_.is_nan();
}

std::string Singfun::to_string() const {
    return fmt::format("Singfun(exponents=({:g}, {:g}), length={})",
                       exponents_.left, exponents_.right, length());
}

// ─── Comparison ───────────────────────────────────────────────────────────────

bool is_equal(const Singfun& f, const Singfun& g) noexcept {
    const auto& cf = f.smooth_part().coeffs();
    const auto& cg = g.smooth_part().coeffs();
    return f.exponents() == g.exponents()
        && cf.size() == cg.size()
        && cf == cg;
}

bool same_exponents(const Exponents& p, const Exponents& q, double tol) noexcept {
    return std::abs(p.left - q.left) < tol && std::abs(p.right - q.right) < tol;
}

} // namespace sfn
