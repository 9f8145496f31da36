#pragma once

/// @file include/sfn/chebtech.hpp
/// @brief Smooth engine: Chebyshev series approximants on [-1, 1].
///
/// # Module: Smooth Engine
///
/// ## Responsibility
/// Represents a smooth function s(x) = Σ c_k T_k(x) on [-1, 1] by its
/// Chebyshev coefficients and provides the operation set the singular layer
/// relies on: construction from a callable, evaluation, derivative,
/// antiderivative, definite integral, products, quotients, sums, roots and
/// extrema.
///
/// ## Construction
/// The adaptive constructor samples on Chebyshev points of the first kind,
///   x_j = cos((j + ½)π / n),  j = 0 … n-1,
/// which never include ±1, so a residual op(x) / (1+x)^a (1-x)^b is never
/// evaluated exactly at a singular endpoint. The grid doubles from
/// `cfg.min_length` until the trailing coefficients are negligible.
///
/// ## Guarantees
/// - Value semantics: every operation returns a new Chebtech
/// - A Chebtech always holds at least one coefficient
/// - Coefficients are real; `is_real()` is always true
///
/// ## NOT Responsible For
/// - Endpoint singularities (see singfun.hpp)
/// - Weighted integrals (see quadrature.hpp)

#include "sfn/config.hpp"
#include "sfn/types.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <string>
#include <vector>

namespace sfn::smooth {

/// A value and the point where it is attained.
struct Extremum {
    double value;
    double position;
};

/// Chebyshev series approximant of a smooth function on [-1, 1].
class Chebtech {
public:
    /// The zero function.
    Chebtech();

    /// Construct from Chebyshev coefficients (c_0 first). An empty vector
    /// becomes the zero function.
    explicit Chebtech(Coefficients coeffs);

    // ── Factories ────────────────────────────────────────────────────────────

    /// Adaptive construction from a callable.
    ///
    /// # Arguments
    /// * `op` : Smooth function, evaluated only strictly inside (-1, 1)
    /// * `cfg`: Uses `smooth_tol`, `min_length`, `max_length`, `warnings`
    ///
    /// # Throws
    /// `InvalidOperator` if `op` is empty or returns a non-finite value.
    static Chebtech make(const ScalarFunction& op,
                         const SingfunConfig& cfg = default_config());

    /// Interpolate `op` at exactly `n` first-kind Chebyshev points.
    ///
    /// # Throws
    /// `InvalidOperator` if `op` is empty or returns a non-finite value.
    static Chebtech interpolate(const ScalarFunction& op, std::size_t n);

    /// The constant function c.
    static Chebtech constant(double c);

    /// (1+x)^n for `Endpoint::Left`, (1-x)^n for `Endpoint::Right`, n ≥ 0.
    static Chebtech endpoint_power(Endpoint end, int n);

    // ── Evaluation ───────────────────────────────────────────────────────────

    /// Evaluate by Clenshaw's recurrence.
    [[nodiscard]] double evaluate(double x) const noexcept;

    /// Evaluate at each entry of `x`.
    [[nodiscard]] Eigen::VectorXd evaluate(const Eigen::VectorXd& x) const;

    /// Value at x = -1 (Σ (-1)^k c_k).
    [[nodiscard]] double left_value() const noexcept;

    /// Value at x = +1 (Σ c_k).
    [[nodiscard]] double right_value() const noexcept;

    // ── Calculus ─────────────────────────────────────────────────────────────

    /// First derivative.
    [[nodiscard]] Chebtech diff() const;

    /// Indefinite integral, normalised to vanish at x = -1.
    [[nodiscard]] Chebtech cumsum() const;

    /// Definite integral over [-1, 1].
    [[nodiscard]] double sum() const noexcept;

    // ── Algebra ──────────────────────────────────────────────────────────────

    /// Exact Chebyshev product, T_i T_j = (T_{i+j} + T_{|i-j|}) / 2.
    [[nodiscard]] static Chebtech multiply(const Chebtech& f, const Chebtech& g);

    /// Adaptive approximation of the pointwise quotient f / g.
    ///
    /// The caller is responsible for `g` being zero-free on [-1, 1].
    [[nodiscard]] static Chebtech divide(const Chebtech& f, const Chebtech& g,
                                         const SingfunConfig& cfg = default_config());

    /// Coefficientwise sum.
    [[nodiscard]] static Chebtech add(const Chebtech& f, const Chebtech& g);

    Chebtech operator+(const Chebtech& g) const { return add(*this, g); }
    Chebtech operator-(const Chebtech& g) const { return add(*this, -g); }
    Chebtech operator*(const Chebtech& g) const { return multiply(*this, g); }
    Chebtech operator-() const;

    /// Scalar multiple.
    friend Chebtech operator*(double c, const Chebtech& f);
    friend Chebtech operator*(const Chebtech& f, double c) { return c * f; }

    /// s(-x): c_k ↦ (-1)^k c_k.
    [[nodiscard]] Chebtech flip() const;

    /// Drop trailing coefficients smaller than `tol` relative to the largest.
    [[nodiscard]] Chebtech simplify(double tol = constants::DEFAULT_SMOOTH_TOL) const;

    // ── Roots & Extrema ──────────────────────────────────────────────────────

    /// Real roots in [-1, 1], ascending.
    ///
    /// Short series are solved through the eigenvalues of the colleague
    /// matrix; long series are split recursively first. The zero function
    /// has no isolated roots and returns an empty vector.
    ///
    /// # Throws
    /// `RootFindingFailed` if an eigenvalue solve does not converge.
    [[nodiscard]] std::vector<double> roots() const;

    /// Global minimum on [-1, 1].
    [[nodiscard]] Extremum min() const;

    /// Global maximum on [-1, 1].
    [[nodiscard]] Extremum max() const;

    /// {min(), max()} sharing one critical-point search.
    [[nodiscard]] std::pair<Extremum, Extremum> minandmax() const;

    // ── Queries ──────────────────────────────────────────────────────────────

    /// Number of coefficients.
    [[nodiscard]] std::size_t length() const noexcept;

    /// Largest coefficient magnitude (a cheap scale estimate).
    [[nodiscard]] double vscale() const noexcept;

    /// True if every coefficient is exactly zero.
    [[nodiscard]] bool is_zero() const noexcept;

    /// True if every coefficient is finite.
    [[nodiscard]] bool is_finite() const noexcept;

    /// True if any coefficient is NaN.
    [[nodiscard]] bool is_nan() const noexcept;

    /// Coefficients are real by construction.
    [[nodiscard]] bool is_real() const noexcept { return true; }

    /// Chebyshev coefficients, c_0 first.
    [[nodiscard]] const Coefficients& coeffs() const noexcept { return coeffs_; }

    /// One-line summary, e.g. "Chebtech(length=17, vscale=1.0000e+00)".
    [[nodiscard]] std::string to_string() const;

private:
    /// Roots of this series mapped from [-1, 1] onto [a, b].
    void roots_on(double a, double b, std::vector<double>& out) const;

    /// Roots of a short series from the colleague matrix.
    [[nodiscard]] std::vector<double> colleague_roots() const;

    Coefficients coeffs_;
};

/// First-kind Chebyshev points x_j = cos((j + ½)π / n), descending.
[[nodiscard]] Eigen::VectorXd chebpts(std::size_t n);

/// Chebyshev coefficients of the values sampled at `chebpts(values.size())`.
[[nodiscard]] Coefficients vals2coeffs(const Eigen::VectorXd& values);

} // namespace sfn::smooth
