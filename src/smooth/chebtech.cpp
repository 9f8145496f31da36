/// @file src/smooth/chebtech.cpp
/// @brief Chebtech construction, evaluation, calculus and algebra.

#include "sfn/chebtech.hpp"
#include "sfn/errors.hpp"
#include "sfn/log.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace sfn::smooth {

namespace {

/// Sample `op` at every entry of `x`; any non-finite value is an error.
Eigen::VectorXd sample(const ScalarFunction& op, const Eigen::VectorXd& x) {
    Eigen::VectorXd values(x.size());
    for (Eigen::Index j = 0; j < x.size(); ++j) {
        const double v = op(x(j));
        if (!std::isfinite(v)) {
            throw InvalidOperator(fmt::format(
                "operator returned {} at x = {:.17g}", v, x(j)));
        }
        values(j) = v;
    }
    return values;
}

/// Length of `c` once trailing entries with |c_k| ≤ tol·scale are removed.
/// Never less than one.
Eigen::Index chopped_length(const Coefficients& c, double tol, double scale) {
    Eigen::Index n = c.size();
    while (n > 1 && std::abs(c(n - 1)) <= tol * scale) {
        --n;
    }
    return n;
}

/// True if the trailing eighth (at least two) of `c` is negligible.
bool is_resolved(const Coefficients& c, double tol) {
    const double scale = c.cwiseAbs().maxCoeff();
    if (scale == 0.0) {
        return true;
    }
    const Eigen::Index tail = std::max<Eigen::Index>(2, c.size() / 8);
    return (c.tail(tail).cwiseAbs().array() <= tol * scale).all();
}

} // anonymous namespace

// ─── Free Functions ───────────────────────────────────────────────────────────

Eigen::VectorXd chebpts(std::size_t n) {
    Eigen::VectorXd x(static_cast<Eigen::Index>(n));
    const double nn = static_cast<double>(n);
    for (std::size_t j = 0; j < n; ++j) {
        // sin form of cos((j + ½)π / n): exactly antisymmetric about 0.
        const double m = nn - 2.0 * static_cast<double>(j) - 1.0;
        x(static_cast<Eigen::Index>(j)) = std::sin(constants::PI * m / (2.0 * nn));
    }
    return x;
}

Coefficients vals2coeffs(const Eigen::VectorXd& values) {
    const Eigen::Index n = values.size();
    Coefficients c = Coefficients::Zero(n);
    if (n == 0) {
        return c;
    }

    // c_k = (2/n) Σ_j f_j cos(kπ(2j+1) / 2n).  The angle index k(2j+1) is
    // reduced mod 4n so one cosine table serves every (k, j) pair.
    const Eigen::Index period = 4 * n;
    Eigen::VectorXd table(period);
    for (Eigen::Index m = 0; m < period; ++m) {
        table(m) = std::cos(constants::PI * static_cast<double>(m)
                            / (2.0 * static_cast<double>(n)));
    }

    for (Eigen::Index k = 0; k < n; ++k) {
        double acc = 0.0;
        for (Eigen::Index j = 0; j < n; ++j) {
            acc += values(j) * table((k * (2 * j + 1)) % period);
        }
        c(k) = 2.0 * acc / static_cast<double>(n);
    }
    c(0) *= 0.5;
    return c;
}

// ─── Construction ─────────────────────────────────────────────────────────────

Chebtech::Chebtech()
    : coeffs_(Coefficients::Zero(1)) {}

Chebtech::Chebtech(Coefficients coeffs)
    : coeffs_(std::move(coeffs)) {
    if (coeffs_.size() == 0) {
        coeffs_ = Coefficients::Zero(1);
    }
}

Chebtech Chebtech::make(const ScalarFunction& op, const SingfunConfig& cfg) {
    if (!op) {
        throw InvalidOperator("operator is empty");
    }

    const std::size_t max_n = std::max<std::size_t>(cfg.max_length, 2);
    std::size_t n = std::clamp<std::size_t>(cfg.min_length, 2, max_n);

    for (;;) {
        const Coefficients c = vals2coeffs(sample(op, chebpts(n)));
        if (is_resolved(c, cfg.smooth_tol)) {
            log::debug(cfg, "smooth part resolved on {} points", n);
            return Chebtech(c).simplify(cfg.smooth_tol);
        }
        if (n >= max_n) {
            log::warn(cfg, "smooth part not resolved on {} points; "
                           "keeping the truncated series", n);
            return Chebtech(c).simplify(cfg.smooth_tol);
        }
        n = std::min(2 * n, max_n);
    }
}

Chebtech Chebtech::interpolate(const ScalarFunction& op, std::size_t n) {
    if (!op) {
        throw InvalidOperator("operator is empty");
    }
    return Chebtech(vals2coeffs(sample(op, chebpts(std::max<std::size_t>(n, 1)))));
}

Chebtech Chebtech::constant(double c) {
    Coefficients coeffs(1);
    coeffs << c;
    return Chebtech(std::move(coeffs));
}

Chebtech Chebtech::endpoint_power(Endpoint end, int n) {
    if (n < 0) {
        throw std::invalid_argument("endpoint_power: negative power");
    }
    Coefficients linear(2);
    linear << 1.0, (end == Endpoint::Left ? 1.0 : -1.0);
    const Chebtech factor(std::move(linear));

    Chebtech result = constant(1.0);
    for (int i = 0; i < n; ++i) {
        result = multiply(result, factor);
    }
    return result;
}

// ─── Evaluation ───────────────────────────────────────────────────────────────

double Chebtech::evaluate(double x) const noexcept {
    // Clenshaw: b_k = c_k + 2x b_{k+1} − b_{k+2};  s(x) = c_0 + x b_1 − b_2
    double b1 = 0.0;
    double b2 = 0.0;
    for (Eigen::Index k = coeffs_.size() - 1; k >= 1; --k) {
        const double b0 = coeffs_(k) + 2.0 * x * b1 - b2;
        b2 = b1;
        b1 = b0;
    }
    return coeffs_(0) + x * b1 - b2;
}

Eigen::VectorXd Chebtech::evaluate(const Eigen::VectorXd& x) const {
    return x.unaryExpr([this](double xi) { return evaluate(xi); });
}

double Chebtech::left_value() const noexcept {
    double acc = 0.0;
    for (Eigen::Index k = 0; k < coeffs_.size(); ++k) {
        acc += (k % 2 == 0) ? coeffs_(k) : -coeffs_(k);
    }
    return acc;
}

double Chebtech::right_value() const noexcept {
    return coeffs_.sum();
}

// ─── Calculus ─────────────────────────────────────────────────────────────────

Chebtech Chebtech::diff() const {
    const Eigen::Index n = coeffs_.size();
    if (n == 1) {
        return Chebtech();
    }

    // d_{k-1} = d_{k+1} + 2k c_k, from the top down; then halve d_0.
    Coefficients d = Coefficients::Zero(n + 1);
    for (Eigen::Index k = n - 1; k >= 1; --k) {
        d(k - 1) = d(k + 1) + 2.0 * static_cast<double>(k) * coeffs_(k);
    }
    d(0) *= 0.5;
    return Chebtech(d.head(n - 1));
}

Chebtech Chebtech::cumsum() const {
    const Eigen::Index n = coeffs_.size();

    Coefficients c = Coefficients::Zero(n + 2);
    c.head(n) = coeffs_;

    // ∫T_0 = T_1,  ∫T_k = T_{k+1}/(2(k+1)) − T_{k-1}/(2(k-1))
    Coefficients b = Coefficients::Zero(n + 1);
    b(1) = c(0) - 0.5 * c(2);
    for (Eigen::Index k = 2; k <= n; ++k) {
        b(k) = (c(k - 1) - c(k + 1)) / (2.0 * static_cast<double>(k));
    }

    // Fix the constant so that the antiderivative vanishes at x = -1.
    double at_left = 0.0;
    for (Eigen::Index k = 1; k <= n; ++k) {
        at_left += (k % 2 == 0) ? b(k) : -b(k);
    }
    b(0) = -at_left;
    return Chebtech(std::move(b));
}

double Chebtech::sum() const noexcept {
    // ∫_{-1}^{1} T_k = 2 / (1 − k²) for even k, 0 for odd k.
    double acc = 0.0;
    for (Eigen::Index k = 0; k < coeffs_.size(); k += 2) {
        const double kk = static_cast<double>(k);
        acc += 2.0 * coeffs_(k) / (1.0 - kk * kk);
    }
    return acc;
}

// ─── Algebra ──────────────────────────────────────────────────────────────────

Chebtech Chebtech::multiply(const Chebtech& f, const Chebtech& g) {
    const Eigen::Index m = f.coeffs_.size();
    const Eigen::Index n = g.coeffs_.size();

    Coefficients c = Coefficients::Zero(m + n - 1);
    for (Eigen::Index i = 0; i < m; ++i) {
        const double fi = f.coeffs_(i);
        if (fi == 0.0) {
            continue;
        }
        for (Eigen::Index j = 0; j < n; ++j) {
            const double half = 0.5 * fi * g.coeffs_(j);
            c(i + j)            += half;
            c(std::abs(i - j))  += half;
        }
    }

    const double scale = f.vscale() * g.vscale();
    if (scale == 0.0) {
        return Chebtech();
    }
    return Chebtech(c.head(chopped_length(c, constants::ALGEBRA_CHOP_TOL, scale)));
}

Chebtech Chebtech::divide(const Chebtech& f, const Chebtech& g,
                          const SingfunConfig& cfg) {
    if (f.is_zero()) {
        return Chebtech();
    }
    return make([&f, &g](double x) { return f.evaluate(x) / g.evaluate(x); }, cfg);
}

Chebtech Chebtech::add(const Chebtech& f, const Chebtech& g) {
    const Eigen::Index n = std::max(f.coeffs_.size(), g.coeffs_.size());
    Coefficients c = Coefficients::Zero(n);
    c.head(f.coeffs_.size()) += f.coeffs_;
    c.head(g.coeffs_.size()) += g.coeffs_;

    // Cancellation is judged against the operands, not the result: f − f is
    // exactly zero and (f + g) − g does not keep rounding noise as signal.
    const double scale = std::max(f.vscale(), g.vscale());
    if (scale == 0.0 || c.cwiseAbs().maxCoeff() <= constants::ALGEBRA_CHOP_TOL * scale) {
        return Chebtech();
    }
    return Chebtech(c.head(chopped_length(c, constants::ALGEBRA_CHOP_TOL, scale)));
}

Chebtech Chebtech::operator-() const {
    return Chebtech(Coefficients(-coeffs_));
}

Chebtech operator*(double c, const Chebtech& f) {
    if (c == 0.0) {
        return Chebtech();
    }
    return Chebtech(Coefficients(c * f.coeffs_));
}

Chebtech Chebtech::flip() const {
    Coefficients c = coeffs_;
    for (Eigen::Index k = 1; k < c.size(); k += 2) {
        c(k) = -c(k);
    }
    return Chebtech(std::move(c));
}

Chebtech Chebtech::simplify(double tol) const {
    const double scale = vscale();
    if (scale == 0.0) {
        return Chebtech();
    }
    return Chebtech(Coefficients(coeffs_.head(chopped_length(coeffs_, tol, scale))));
}

// ─── Extrema ──────────────────────────────────────────────────────────────────

std::pair<Extremum, Extremum> Chebtech::minandmax() const {
    std::vector<double> candidates = diff().roots();
    candidates.push_back(-1.0);
    candidates.push_back(1.0);

    Extremum lo{evaluate(candidates.front()), candidates.front()};
    Extremum hi = lo;
    for (double x : candidates) {
        const double v = evaluate(x);
        if (v < lo.value) {
            lo = {v, x};
        }
        if (v > hi.value) {
            hi = {v, x};
        }
    }
    return {lo, hi};
}

Extremum Chebtech::min() const { return minandmax().first; }

Extremum Chebtech::max() const { return minandmax().second; }

// ─── Queries ──────────────────────────────────────────────────────────────────

std::size_t Chebtech::length() const noexcept {
    return static_cast<std::size_t>(coeffs_.size());
}

double Chebtech::vscale() const noexcept {
    return coeffs_.cwiseAbs().maxCoeff();
}

bool Chebtech::is_zero() const noexcept {
    return (coeffs_.array() == 0.0).all();
}

bool Chebtech::is_finite() const noexcept {
    return coeffs_.allFinite();
}

bool Chebtech::is_nan() const noexcept {
    return coeffs_.hasNaN();
}

std::string Chebtech::to_string() const {
    return fmt::format("Chebtech(length={}, vscale={:.4e})", length(), vscale());
}

} // namespace sfn::smooth
