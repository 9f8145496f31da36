#pragma once

/// @file include/sfn/singfun.hpp
/// @brief Singular functions on [-1, 1]: f(x) = s(x) (1+x)^a (1-x)^b.
///
/// # Module: Singular Function Value and Algebra Layer
///
/// ## Responsibility
/// `Singfun` bundles a smooth residual s (a `smooth::Chebtech`) with the
/// endpoint exponents (a, b). Construction detects the exponents (unless
/// they are supplied), divides the singular factor out of the operator and
/// approximates what is left. The free functions below implement arithmetic
/// and calculus by first resolving the exponents algebraically and then
/// delegating the numeric work to the smooth engine.
///
/// ## Closure rules
/// | operation | exponents                     | representable when                   |
/// |-----------|-------------------------------|--------------------------------------|
/// | f · g     | (a₁+a₂, b₁+b₂)                | always                               |
/// | f / g     | (a₁−a₂, b₁−b₂)                | s_g zero-free on [-1, 1]             |
/// | f ± g     | (min(a₁,a₂), min(b₁,b₂))      | every excess is a non-negative int   |
/// | f′        | shifted by −1 where non-zero  | always                               |
/// | ∫f        | shifted by +1                 | exponents > −1, branch at ≤ one end  |
///
/// ## Guarantees
/// - Values are immutable; every operation returns a fresh `Singfun`
/// - Failures are reported as the named exceptions of errors.hpp, never as
///   a silent lossy approximation
/// - Exponent decisions snap to integers within `cfg.exponent_tol`
///
/// # Example
/// ```cpp
/// // √(1-x)·cos(x): the detector finds (0, 0.5).
/// sfn::Singfun f([](double x) { return std::sqrt(1.0 - x) * std::cos(x); },
///                sfn::SingTypes{sfn::SingType::None, sfn::SingType::Branch});
/// auto df = sfn::diff(f);   // exponents (0, -0.5)
/// double v = sfn::feval(f, 0.25);
/// ```

#include "sfn/chebtech.hpp"
#include "sfn/config.hpp"
#include "sfn/types.hpp"

#include <Eigen/Dense>

#include <string>
#include <utility>
#include <vector>

namespace sfn {

// ─── Singular Factor ──────────────────────────────────────────────────────────

/// (1+x)^a (1-x)^b for x ∈ [-1, 1].
///
/// A zero exponent contributes exactly 1 (no power is taken). At an
/// endpoint the vanishing base gives 0 for a positive exponent and +∞ for a
/// negative one. Outside [-1, 1] the result is NaN: a negative base is never
/// raised to a real power.
[[nodiscard]] double singular_factor(double x, const Exponents& e) noexcept;

/// `singular_factor` with exponents snapped to integers / zero within `tol`.
[[nodiscard]] double singular_factor(double x, const Exponents& e, double tol) noexcept;

// ─── Singfun ──────────────────────────────────────────────────────────────────

/// An immutable singular function value.
class Singfun {
public:
    /// The zero function, exponents (0, 0).
    Singfun();

    /// Detect both exponents with the general (branch) search.
    ///
    /// # Throws
    /// `InvalidOperator`, `SingularityDetectionFailed`
    explicit Singfun(const ScalarFunction& op,
                     const SingfunConfig& cfg = default_config());

    /// Detect the exponents guided by per-endpoint type hints.
    ///
    /// # Throws
    /// `InvalidOperator`, `SingularityDetectionFailed`
    Singfun(const ScalarFunction& op, SingTypes hints,
            const SingfunConfig& cfg = default_config());

    /// Use the supplied exponents; no detection is run.
    ///
    /// # Throws
    /// `InvalidOperator`; `InvalidExponents` if either exponent is not finite.
    Singfun(const ScalarFunction& op, Exponents exponents,
            const SingfunConfig& cfg = default_config());

    /// Assemble from an already computed smooth part.
    ///
    /// # Throws
    /// `InvalidExponents` if either exponent is not finite.
    Singfun(smooth::Chebtech smooth_part, Exponents exponents);

    /// The canonical zero value.
    [[nodiscard]] static Singfun zero();

    // ── Accessors ────────────────────────────────────────────────────────────

    [[nodiscard]] const smooth::Chebtech& smooth_part() const noexcept { return smooth_; }
    [[nodiscard]] const Exponents& exponents() const noexcept { return exponents_; }

    /// Evaluate with the default configuration (see `feval`).
    [[nodiscard]] double operator()(double x) const;

    // ── Predicates ───────────────────────────────────────────────────────────

    /// True for the zero function.
    [[nodiscard]] bool is_zero() const noexcept;

    /// True if both exponents are ≥ 0 (within `tol`) and s is finite.
    [[nodiscard]] bool is_finite(double tol = constants::DEFAULT_EXPONENT_TOL) const noexcept;

    /// True if some exponent is < 0 (beyond `tol`) and f is not zero.
    [[nodiscard]] bool is_inf(double tol = constants::DEFAULT_EXPONENT_TOL) const noexcept;

    /// True if the smooth part carries a NaN.
    [[nodiscard]] bool is_nan() const noexcept;

    /// Always true: real exponents, real smooth part.
    [[nodiscard]] bool is_real() const noexcept { return smooth_.is_real(); }

    /// Length of the smooth part.
    [[nodiscard]] std::size_t length() const noexcept { return smooth_.length(); }

    /// e.g. "Singfun(exponents=(0, 0.5), length=14)".
    [[nodiscard]] std::string to_string() const;

private:
    /// Divide the factor out of `op` and approximate the residual.
    void build_smooth_part(const ScalarFunction& op, const SingfunConfig& cfg);

    smooth::Chebtech smooth_;
    Exponents        exponents_;
};

// ─── Arithmetic ───────────────────────────────────────────────────────────────

/// f · g: exponents add, smooth parts multiply. Always representable.
[[nodiscard]] Singfun times(const Singfun& f, const Singfun& g);

/// c · f.
[[nodiscard]] Singfun times(const Singfun& f, double c);

/// f / g: exponents subtract, smooth parts divide.
///
/// # Throws
/// `DivisionBySingularResidual` if g's smooth part vanishes anywhere on
/// [-1, 1] (including g ≡ 0).
[[nodiscard]] Singfun rdivide(const Singfun& f, const Singfun& g,
                              const SingfunConfig& cfg = default_config());

/// f + g over the common exponents (min(a₁,a₂), min(b₁,b₂)).
///
/// Each operand's excess over the common exponent is multiplied into its
/// smooth part as (1±x)^n, which is only smooth for an integer n ≥ 0.
///
/// # Throws
/// `AdditionIncompatibleExponents` if some excess is not a non-negative
/// integer within `cfg.exponent_tol`.
[[nodiscard]] Singfun plus(const Singfun& f, const Singfun& g,
                           const SingfunConfig& cfg = default_config());

/// f + c, with c a (0, 0) value.
[[nodiscard]] Singfun plus(const Singfun& f, double c,
                           const SingfunConfig& cfg = default_config());

/// f − g, i.e. plus(f, −g).
[[nodiscard]] Singfun minus(const Singfun& f, const Singfun& g,
                            const SingfunConfig& cfg = default_config());

/// −f.
[[nodiscard]] Singfun uminus(const Singfun& f);

/// +f.
[[nodiscard]] Singfun uplus(const Singfun& f);

/// f(−x): exponents swap, smooth part reflects.
[[nodiscard]] Singfun flip(const Singfun& f);

// ─── Calculus ─────────────────────────────────────────────────────────────────

/// k-th derivative by the factored product rule.
///
/// One step maps s(1+x)^a(1-x)^b to
///   s′(1+x)^a(1-x)^b + a s(1+x)^{a-1}(1-x)^b − b s(1+x)^a(1-x)^{b-1},
/// whose terms always add over (a−1, b−1) (or a / b where they are zero).
///
/// # Throws
/// `std::invalid_argument` if k < 0.
[[nodiscard]] Singfun diff(const Singfun& f, int k = 1,
                           const SingfunConfig& cfg = default_config());

/// An antiderivative F with F′ = f.
///
/// Non-negative integer exponents are first absorbed into the smooth part.
/// The remaining branch exponent e > −1, if any, becomes e + 1 and F
/// vanishes at that endpoint; with no branch exponent F(−1) = 0.
///
/// # Throws
/// `DivergentAntiderivative` if an exponent is ≤ −1;
/// `AdditionIncompatibleExponents` if both ends keep a branch exponent,
/// since F is then not a single singular function.
[[nodiscard]] Singfun cumsum(const Singfun& f,
                             const SingfunConfig& cfg = default_config());

/// ∫_{-1}^{1} f by Gauss–Jacobi quadrature on the exponent weight.
///
/// # Throws
/// `DivergentAntiderivative` if an exponent is ≤ −1.
[[nodiscard]] double sum(const Singfun& f,
                         const SingfunConfig& cfg = default_config());

/// ∫_{-1}^{1} f g.
[[nodiscard]] double inner_product(const Singfun& f, const Singfun& g,
                                   const SingfunConfig& cfg = default_config());

// ─── Restriction ──────────────────────────────────────────────────────────────

/// f on [a, b], mapped back onto [-1, 1] by x = (a+b)/2 + (b-a)/2 t.
///
/// An endpoint exponent survives only where the cut is at that endpoint
/// (a = −1 for the left one, b = 1 for the right one); elsewhere the factor
/// is smooth and is folded into the resampled smooth part.
///
/// # Throws
/// `std::invalid_argument` unless −1 ≤ a < b ≤ 1.
[[nodiscard]] Singfun restrict(const Singfun& f, double a, double b,
                               const SingfunConfig& cfg = default_config());

// ─── Evaluation, Roots, Extrema ───────────────────────────────────────────────

/// f(x) = s(x) (1+x)^a (1-x)^b.
///
/// At x = ±1: 0 for a positive exponent, ±∞ (sign of the smooth part) for a
/// negative one, the limiting value s(±1)·2^{other exponent} for a zero one;
/// NaN if the smooth part there is not finite or is zero under a pole.
/// NaN outside [-1, 1].
[[nodiscard]] double feval(const Singfun& f, double x,
                           const SingfunConfig& cfg = default_config());

/// Pointwise `feval`; the result has the shape of `x`.
template <typename Derived>
[[nodiscard]] typename Derived::PlainObject
feval(const Singfun& f, const Eigen::MatrixBase<Derived>& x,
      const SingfunConfig& cfg = default_config()) {
    return x.unaryExpr([&f, &cfg](double xi) { return feval(f, xi, cfg); }).eval();
}

/// Options for `roots`.
struct RootsOptions {
    /// Also report ±1 where the exponent is positive (f vanishes there).
    bool include_endpoints = true;
};

/// Roots of f in [-1, 1], ascending.
///
/// Interior roots are the roots of the smooth part (the factor does not
/// vanish inside the interval); endpoints are added per `opts`.
[[nodiscard]] std::vector<double> roots(const Singfun& f, RootsOptions opts = {},
                                        const SingfunConfig& cfg = default_config());

/// Global minimum (value, position). A pole contributes an infinite
/// candidate at its endpoint.
[[nodiscard]] smooth::Extremum min(const Singfun& f,
                                   const SingfunConfig& cfg = default_config());

/// Global maximum (value, position).
[[nodiscard]] smooth::Extremum max(const Singfun& f,
                                   const SingfunConfig& cfg = default_config());

/// {min, max} from one critical-point search.
[[nodiscard]] std::pair<smooth::Extremum, smooth::Extremum>
minandmax(const Singfun& f, const SingfunConfig& cfg = default_config());

// ─── Comparison ───────────────────────────────────────────────────────────────

/// True if the exponents and the smooth coefficients are identical.
[[nodiscard]] bool is_equal(const Singfun& f, const Singfun& g) noexcept;

/// True if the exponents agree within `tol` at both ends.
[[nodiscard]] bool same_exponents(const Exponents& p, const Exponents& q,
                                  double tol) noexcept;

// ─── Operators ────────────────────────────────────────────────────────────────

inline Singfun operator+(const Singfun& f, const Singfun& g) { return plus(f, g); }
inline Singfun operator-(const Singfun& f, const Singfun& g) { return minus(f, g); }
inline Singfun operator*(const Singfun& f, const Singfun& g) { return times(f, g); }
inline Singfun operator/(const Singfun& f, const Singfun& g) { return rdivide(f, g); }
inline Singfun operator*(const Singfun& f, double c) { return times(f, c); }
inline Singfun operator*(double c, const Singfun& f) { return times(f, c); }
inline Singfun operator+(const Singfun& f, double c) { return plus(f, c); }
inline Singfun operator+(double c, const Singfun& f) { return plus(f, c); }
inline Singfun operator-(const Singfun& f) { return uminus(f); }

} // namespace sfn
