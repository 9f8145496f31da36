#pragma once

/// @file include/sfn/detect.hpp
/// @brief Exponent Detector: endpoint singularity orders from samples.
///
/// # Module: Exponent Detector
///
/// ## Responsibility
/// Estimates the real exponent e in f(x) ~ C δ^e, δ = distance to an
/// endpoint, by sampling f on the geometric sequence δ_k = ρ^k.
///
/// ## Integer (pole / root) search
/// Successive samples give
///   e_k = log(|f(δ_{k+1})| / |f(δ_k)|) / log(δ_{k+1} / δ_k),
/// whose error shrinks like δ_k for a smooth residual. One Richardson step,
///   r_k = (e_k − q e_{k-1}) / (1 − q),  q = δ_k / δ_{k-1},
/// removes that leading term. The order is accepted once `stable_steps`
/// consecutive r_k lie within `exponent_tol` of the same integer.
///
/// ## Fractional (branch) search
/// Used when no integer stabilises. A sliding window of `regression_window`
/// samples is fitted by least squares, log|f| = c + e log δ; the slope is
/// Richardson-corrected the same way and accepted once `stable_steps`
/// successive corrected slopes agree within `exponent_tol`.
///
/// ## Guarantees
/// - Every search is bounded by `max_samples` evaluations per endpoint
/// - `None` hints never evaluate the operator
/// - A search that does not stabilise is reported, never retried
///
/// ## NOT Responsible For
/// - Dividing the singular factor out (see singfun.hpp)

#include "sfn/config.hpp"
#include "sfn/types.hpp"

#include <optional>
#include <span>
#include <vector>

namespace sfn::detect {

/// One sample near an endpoint, in log-log coordinates.
struct EndpointSample {
    double log_distance;  ///< log δ
    double log_magnitude; ///< log |f(endpoint ∓ δ)|
};

/// Everything the searches need to know about one endpoint.
struct EndpointProbe {
    /// Run of finite, non-zero samples, closest to the endpoint last.
    std::vector<EndpointSample> samples;

    /// True if every sample evaluated to exactly zero.
    bool identically_zero = false;
};

/// Sample `op` at endpoint ∓ ρ^k, k = 1 … cfg.max_samples.
///
/// A zero or non-finite value met before the run is long enough for the
/// searches is an interior root or pole of `op`; the run restarts after it.
/// Once the run is long enough, such a value is taken as overflow of a pole
/// or underflow of a root and sampling stops.
[[nodiscard]] EndpointProbe probe_endpoint(const ScalarFunction& op, Endpoint end,
                                           const SingfunConfig& cfg);

/// Integer order from the Richardson-corrected ratio estimates.
///
/// # Returns
/// - `Some(n)` once stabilised (`find_exponent` applies cfg.max_pole_order)
/// - `None`    if no integer stabilises within the samples
[[nodiscard]] std::optional<int>
integer_order(std::span<const EndpointSample> samples, const SingfunConfig& cfg);

/// Real order from the sliding log-log regression.
///
/// # Returns
/// - `Some(e)`, snapped to an integer when within cfg.exponent_tol of one
/// - `None`    if the corrected slopes do not converge within the samples
[[nodiscard]] std::optional<double>
fractional_order(std::span<const EndpointSample> samples, const SingfunConfig& cfg);

/// Exponent at one endpoint under the given hint.
///
/// | hint   | search                              | accepted result |
/// |--------|-------------------------------------|-----------------|
/// | None   | none                                | 0               |
/// | Pole   | integer                             | n ≤ 0           |
/// | Root   | integer                             | n ≥ 0           |
/// | Branch | integer, then fractional            | any real        |
///
/// An operator that is identically zero near the endpoint has exponent 0.
///
/// # Throws
/// `SingularityDetectionFailed` if the search does not stabilise, the
/// result contradicts the hint, or its magnitude exceeds cfg.max_pole_order.
[[nodiscard]] double find_exponent(const ScalarFunction& op, Endpoint end,
                                   SingType hint, const SingfunConfig& cfg);

/// Exponents at both endpoints.
///
/// # Throws
/// `InvalidOperator` if `op` is empty; `SingularityDetectionFailed` as for
/// `find_exponent`.
[[nodiscard]] Exponents find_exponents(const ScalarFunction& op, SingTypes hints,
                                       const SingfunConfig& cfg = default_config());

/// Round `e` to the nearest integer if it is within `tol` of it.
[[nodiscard]] double snap_exponent(double e, double tol) noexcept;

} // namespace sfn::detect
