#pragma once

/// @file include/sfn/config.hpp
/// @brief Tolerances and limits threaded through every SFN operation.
///
/// There is no mutable global state: each operation takes a
/// `const SingfunConfig&` defaulting to `default_config()`. Overriding a
/// member for one call never affects any other call.
///
/// # Example
/// ```cpp
/// sfn::SingfunConfig cfg = sfn::default_config();
/// cfg.exponent_tol = 1e-8;
/// cfg.verbose      = true;
/// sfn::Singfun f([](double x) { return 1.0 / std::sqrt(1.0 - x); }, cfg);
/// ```

#include "sfn/constants.hpp"

#include <cstddef>

namespace sfn {

/// Configuration for exponent detection, smooth-part construction and the
/// tolerance-based decisions of the algebra layer.
struct SingfunConfig {
    // ── Exponent detection ────────────────────────────────────────────────────

    /// Exponent equality / integer-snapping tolerance.
    double exponent_tol = constants::DEFAULT_EXPONENT_TOL;

    /// Ratio ρ ∈ (0, 1) of successive sample distances from an endpoint.
    double sample_ratio = constants::DEFAULT_SAMPLE_RATIO;

    /// Number of geometric samples per endpoint (bounds every search).
    int max_samples = constants::DEFAULT_MAX_SAMPLES;

    /// Consecutive agreeing estimates required to accept an order.
    int stable_steps = constants::DEFAULT_STABLE_STEPS;

    /// Largest |order| accepted by the integer (pole/root) search.
    int max_pole_order = constants::DEFAULT_MAX_POLE_ORDER;

    /// Samples per log-log regression window in the branch search.
    int regression_window = constants::DEFAULT_REGRESSION_WINDOW;

    // ── Smooth engine ─────────────────────────────────────────────────────────

    /// Relative chop tolerance for trailing Chebyshev coefficients.
    double smooth_tol = constants::DEFAULT_SMOOTH_TOL;

    /// Smallest sample grid tried by the adaptive constructor.
    std::size_t min_length = constants::DEFAULT_MIN_LENGTH;

    /// Largest sample grid tried by the adaptive constructor.
    std::size_t max_length = constants::DEFAULT_MAX_LENGTH;

    // ── Diagnostics ───────────────────────────────────────────────────────────

    /// If true, trace detection and construction decisions to stderr.
    bool verbose = false;

    /// If true, report non-converged smooth parts to stderr.
    bool warnings = true;
};

/// The process-wide default configuration.
///
/// Built once on first use and never modified afterwards; safe to read from
/// any thread.
const SingfunConfig& default_config() noexcept;

} // namespace sfn
