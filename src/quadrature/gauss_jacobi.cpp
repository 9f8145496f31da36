/// @file src/quadrature/gauss_jacobi.cpp
/// @brief Golub–Welsch construction of Gauss–Jacobi rules.

#include "sfn/quadrature.hpp"
#include "sfn/constants.hpp"

#include <Eigen/Eigenvalues>

#include <cmath>

namespace sfn::quadrature {

namespace {

/// μ₀ = ∫_{-1}^{1} (1-x)^α (1+x)^β dx = 2^{α+β+1} Γ(α+1) Γ(β+1) / Γ(α+β+2)
double jacobi_moment(double alpha, double beta) {
    return std::exp((alpha + beta + 1.0) * constants::LN2
                    + std::lgamma(alpha + 1.0)
                    + std::lgamma(beta + 1.0)
                    - std::lgamma(alpha + beta + 2.0));
}

} // anonymous namespace

std::optional<QuadratureRule> gauss_jacobi(std::size_t n, double alpha, double beta) {
    if (n == 0 || !(alpha > -1.0) || !(beta > -1.0)) {
        return std::nullopt;
    }

    const double ab = alpha + beta;
    const double mu0 = jacobi_moment(alpha, beta);
    const auto size = static_cast<Eigen::Index>(n);

    // ── Jacobi matrix of the monic recurrence ────────────────────────────────
    Eigen::VectorXd diag(size);
    diag(0) = (beta - alpha) / (ab + 2.0);
    for (Eigen::Index k = 1; k < size; ++k) {
        const double kk = static_cast<double>(k);
        diag(k) = (beta * beta - alpha * alpha)
                / ((2.0 * kk + ab) * (2.0 * kk + ab + 2.0));
    }

    if (n == 1) {
        QuadratureRule rule;
        rule.nodes   = diag;
        rule.weights = Eigen::VectorXd::Constant(1, mu0);
        return rule;
    }

    Eigen::VectorXd sub(size - 1);
    // k = 1 is written with the (1 + α + β) factor cancelled, which keeps the
    // Chebyshev weight α = β = -½ well defined.
    sub(0) = std::sqrt(4.0 * (1.0 + alpha) * (1.0 + beta)
                       / ((2.0 + ab) * (2.0 + ab) * (3.0 + ab)));
    for (Eigen::Index k = 2; k < size; ++k) {
        const double kk = static_cast<double>(k);
        const double s  = 2.0 * kk + ab;
        sub(k - 1) = std::sqrt(4.0 * kk * (kk + alpha) * (kk + beta) * (kk + ab)
                               / (s * s * (s + 1.0) * (s - 1.0)));
    }

    // ── Golub–Welsch ─────────────────────────────────────────────────────────
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver;
    solver.computeFromTridiagonal(diag, sub, Eigen::ComputeEigenvectors);
    if (solver.info() != Eigen::Success) {
        return std::nullopt;
    }

    QuadratureRule rule;
    rule.nodes   = solver.eigenvalues();
    rule.weights = mu0 * solver.eigenvectors().row(0).transpose().array().square().matrix();
    return rule;
}

} // namespace sfn::quadrature
