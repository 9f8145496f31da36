#pragma once

#include <cstddef>

/// @file include/sfn/constants.hpp
/// @brief Numerical constants and default tolerances for the SFN library.
///
/// Every default member of `SingfunConfig` is drawn from here, so a change to
/// a default is made in exactly one place.

namespace sfn::constants {

// ─── Mathematical Constants ───────────────────────────────────────────────────

static constexpr double PI  = 3.14159265358979323846;
static constexpr double LN2 = 0.69314718055994530942;

// ─── Exponent Detection ───────────────────────────────────────────────────────

/// Two exponents closer than this are equal; an exponent this close to an
/// integer is that integer.
static constexpr double DEFAULT_EXPONENT_TOL = 1e-10;

/// Geometric ratio ρ of the sample distances δ_k = ρ^k from an endpoint.
/// 0.5 keeps every sample point 1 ∓ δ_k exactly representable.
static constexpr double DEFAULT_SAMPLE_RATIO = 0.5;

/// Number of geometric samples taken towards each endpoint.
/// With ρ = 0.5 the closest sample sits 2⁻⁴⁸ ≈ 3.6e-15 from the endpoint.
static constexpr int DEFAULT_MAX_SAMPLES = 48;

/// Consecutive estimates that must agree before an order is accepted.
static constexpr int DEFAULT_STABLE_STEPS = 3;

/// Largest pole or root order the integer search will report.
static constexpr int DEFAULT_MAX_POLE_ORDER = 20;

/// Number of samples in each log-log regression window of the branch search.
static constexpr int DEFAULT_REGRESSION_WINDOW = 4;

// ─── Smooth Engine ────────────────────────────────────────────────────────────

/// Relative size below which trailing Chebyshev coefficients are negligible.
static constexpr double DEFAULT_SMOOTH_TOL = 1e-13;

/// Relative size below which coefficients produced by exact algebra
/// (products, sums) are rounding noise.
static constexpr double ALGEBRA_CHOP_TOL = 1e-15;

/// First grid size tried by the adaptive constructor.
static constexpr std::size_t DEFAULT_MIN_LENGTH = 16;

/// Largest grid size tried by the adaptive constructor.
static constexpr std::size_t DEFAULT_MAX_LENGTH = 4096;

// ─── Root Finding ─────────────────────────────────────────────────────────────

/// Series longer than this are split before the colleague-matrix solve.
static constexpr std::size_t ROOTS_SUBDIVISION_LENGTH = 50;

/// Off-centre split point, chosen so that it is unlikely to be a root itself.
static constexpr double ROOTS_SPLIT_POINT = -0.004849834917525;

/// Eigenvalues with a larger imaginary part are not real roots.
static constexpr double ROOT_IMAG_TOL = 1e-8;

/// Real eigenvalues this far outside [-1, 1] are still clamped onto it.
static constexpr double ROOT_DOMAIN_TOL = 1e-10;

/// Roots closer than this are reported once.
static constexpr double ROOT_MERGE_TOL = 1e-10;

} // namespace sfn::constants
