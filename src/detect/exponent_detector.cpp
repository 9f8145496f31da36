/// @file src/detect/exponent_detector.cpp
/// @brief Integer and fractional endpoint-order searches.

#include "sfn/detect.hpp"
#include "sfn/errors.hpp"
#include "sfn/log.hpp"

#include <fmt/core.h>

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>

namespace sfn::detect {

namespace {

const char* endpoint_name(Endpoint end) noexcept {
    return end == Endpoint::Left ? "left" : "right";
}

/// Richardson step for an estimate whose error scales with δ:
/// (e_k − q e_{k-1}) / (1 − q), q = δ_k / δ_{k-1}.
double richardson(double current, double previous, double log_q) {
    const double q = std::exp(log_q);
    return (current - q * previous) / (1.0 - q);
}

} // anonymous namespace

// ─── snap_exponent ────────────────────────────────────────────────────────────

double snap_exponent(double e, double tol) noexcept {
    const double n = std::round(e);
    // + 0.0 turns a snapped −0 into +0.
    return std::abs(e - n) < tol ? n + 0.0 : e;
}

// ─── probe_endpoint ───────────────────────────────────────────────────────────

EndpointProbe probe_endpoint(const ScalarFunction& op, Endpoint end,
                             const SingfunConfig& cfg) {
    EndpointProbe probe;
    bool all_zero  = true;
    bool truncated = false;
    int  evaluated = 0;

    // Enough samples for either search to decide.
    const std::size_t usable_run = static_cast<std::size_t>(
        std::max(3, std::max(2, cfg.regression_window) + cfg.stable_steps + 1));

    double step = 1.0;
    for (int k = 1; k <= cfg.max_samples; ++k) {
        step *= cfg.sample_ratio;
        const double x = (end == Endpoint::Left) ? -1.0 + step : 1.0 - step;
        // Use the distance actually represented by x, not the requested one.
        const double delta = (end == Endpoint::Left) ? x + 1.0 : 1.0 - x;
        if (delta <= 0.0) {
            break;
        }

        const double v = op(x);
        ++evaluated;
        if (v != 0.0) {
            all_zero = false;
        }
        if (truncated) {
            continue;
        }
        if (!std::isfinite(v) || v == 0.0) {
            // After a usable run this is overflow of a pole or underflow of a
            // root. Before one it is an interior zero or pole at x: restart
            // the run past it.
            if (probe.samples.size() >= usable_run) {
                truncated = true;
            } else {
                probe.samples.clear();
            }
            continue;
        }
        probe.samples.push_back({std::log(delta), std::log(std::abs(v))});
    }

    probe.identically_zero = all_zero && evaluated > 0;
    return probe;
}

// ─── integer_order ────────────────────────────────────────────────────────────

std::optional<int> integer_order(std::span<const EndpointSample> samples,
                                 const SingfunConfig& cfg) {
    if (samples.size() < 3) {
        return std::nullopt;
    }

    double previous = 0.0;
    int    run      = 0;
    long   last     = 0;

    for (std::size_t k = 0; k + 1 < samples.size(); ++k) {
        const double estimate =
            (samples[k + 1].log_magnitude - samples[k].log_magnitude)
          / (samples[k + 1].log_distance  - samples[k].log_distance);

        if (k == 0) {
            previous = estimate;
            continue;
        }

        const double r = richardson(estimate, previous,
                                    samples[k].log_distance - samples[k - 1].log_distance);
        previous = estimate;

        const long n = std::lround(r);
        if (std::abs(r - static_cast<double>(n)) < cfg.exponent_tol) {
            run  = (run > 0 && n == last) ? run + 1 : 1;
            last = n;
        } else {
            run = 0;
        }

        if (run >= cfg.stable_steps) {
            return static_cast<int>(n);
        }
    }
    return std::nullopt;
}

// ─── fractional_order ─────────────────────────────────────────────────────────

std::optional<double> fractional_order(std::span<const EndpointSample> samples,
                                       const SingfunConfig& cfg) {
    const auto window = static_cast<std::size_t>(std::max(2, cfg.regression_window));
    if (samples.size() < window + static_cast<std::size_t>(cfg.stable_steps) + 1) {
        return std::nullopt;
    }

    const auto w = static_cast<Eigen::Index>(window);
    Eigen::MatrixXd design(w, 2);
    Eigen::VectorXd rhs(w);

    double previous_slope = 0.0;
    double previous_r     = 0.0;
    bool   have_r         = false;
    int    run            = 0;

    for (std::size_t j = 0; j + window <= samples.size(); ++j) {
        // Centre the abscissae; the slope is unchanged and the fit better
        // conditioned.
        double mean = 0.0;
        for (std::size_t i = 0; i < window; ++i) {
            mean += samples[j + i].log_distance;
        }
        mean /= static_cast<double>(window);

        for (Eigen::Index i = 0; i < w; ++i) {
            const auto& s = samples[j + static_cast<std::size_t>(i)];
            design(i, 0) = 1.0;
            design(i, 1) = s.log_distance - mean;
            rhs(i)       = s.log_magnitude;
        }
        const double slope = design.colPivHouseholderQr().solve(rhs)(1);

        if (j > 0) {
            const double r = richardson(slope, previous_slope,
                                        samples[j].log_distance - samples[j - 1].log_distance);
            if (have_r) {
                run = (std::abs(r - previous_r) < cfg.exponent_tol) ? run + 1 : 0;
                if (run >= cfg.stable_steps) {
                    return snap_exponent(r, cfg.exponent_tol);
                }
            }
            previous_r = r;
            have_r     = true;
        }
        previous_slope = slope;
    }
    return std::nullopt;
}

// ─── find_exponent ────────────────────────────────────────────────────────────

double find_exponent(const ScalarFunction& op, Endpoint end, SingType hint,
                     const SingfunConfig& cfg) {
    if (hint == SingType::None) {
        return 0.0;
    }

    const EndpointProbe probe = probe_endpoint(op, end, cfg);
    if (probe.identically_zero) {
        log::debug(cfg, "{} endpoint: operator vanishes identically, exponent 0",
                   endpoint_name(end));
        return 0.0;
    }

    const auto fail = [&](const char* reason) {
        return SingularityDetectionFailed(fmt::format(
            "{} endpoint ({} hint): {} after {} usable samples",
            endpoint_name(end), to_string(hint), reason, probe.samples.size()));
    };

    const auto within_limit = [&](double e) {
        if (std::abs(e) > static_cast<double>(cfg.max_pole_order)) {
            throw fail("detected order exceeds max_pole_order");
        }
        return e;
    };

    const std::optional<int> n = integer_order(probe.samples, cfg);

    switch (hint) {
    case SingType::Pole:
    case SingType::Root: {
        if (!n) {
            throw fail("integer order did not stabilise");
        }
        if ((hint == SingType::Pole && *n > 0) || (hint == SingType::Root && *n < 0)) {
            throw fail("detected order contradicts the hint");
        }
        log::debug(cfg, "{} endpoint: integer order {}", endpoint_name(end), *n);
        return within_limit(static_cast<double>(*n));
    }
    case SingType::Branch: {
        if (n) {
            log::debug(cfg, "{} endpoint: integer order {}", endpoint_name(end), *n);
            return within_limit(static_cast<double>(*n));
        }
        const std::optional<double> e = fractional_order(probe.samples, cfg);
        if (!e) {
            throw fail("neither integer nor fractional order stabilised");
        }
        log::debug(cfg, "{} endpoint: fractional order {:.15g}", endpoint_name(end), *e);
        return within_limit(*e);
    }
    case SingType::None:
        break;
    }
    return 0.0;
}

// ─── find_exponents ───────────────────────────────────────────────────────────

Exponents find_exponents(const ScalarFunction& op, SingTypes hints,
                         const SingfunConfig& cfg) {
    if (!op) {
        throw InvalidOperator("operator is empty");
    }
    return {find_exponent(op, Endpoint::Left,  hints.left,  cfg),
            find_exponent(op, Endpoint::Right, hints.right, cfg)};
}

} // namespace sfn::detect
