#pragma once

/// @file include/sfn/quadrature.hpp
/// @brief Gauss–Jacobi quadrature for endpoint-weighted integrals.
///
/// # Module: Quadrature
///
/// ## Responsibility
/// Nodes and weights for
///   ∫_{-1}^{1} g(x) (1-x)^α (1+x)^β dx ≈ Σ_j w_j g(x_j),
/// exact when g is a polynomial of degree ≤ 2n-1. This is how integrals of
/// singular functions are evaluated without ever sampling the singular
/// factor itself.
///
/// ## Method
/// Golub–Welsch: the nodes are the eigenvalues of the symmetric tridiagonal
/// Jacobi matrix of the monic Jacobi recurrence, and w_j = μ₀ v_{0j}², where
/// v_j is the normalised eigenvector and μ₀ = ∫ (1-x)^α (1+x)^β dx.

#include <Eigen/Dense>

#include <cstddef>
#include <optional>

namespace sfn::quadrature {

/// Nodes (ascending) and matching weights.
struct QuadratureRule {
    Eigen::VectorXd nodes;
    Eigen::VectorXd weights;

    /// Σ_j w_j g(x_j).
    template <typename Fn>
    [[nodiscard]] double apply(Fn&& g) const {
        double acc = 0.0;
        for (Eigen::Index j = 0; j < nodes.size(); ++j) {
            acc += weights(j) * g(nodes(j));
        }
        return acc;
    }
};

/// n-point Gauss–Jacobi rule for the weight (1-x)^α (1+x)^β.
///
/// # Returns
/// - `Some(rule)` for n ≥ 1 and α, β > -1
/// - `None`       otherwise (the weight is not integrable), or if the
///                eigenvalue solve fails
[[nodiscard]] std::optional<QuadratureRule>
gauss_jacobi(std::size_t n, double alpha, double beta);

} // namespace sfn::quadrature
