/// @file src/smooth/chebtech_roots.cpp
/// @brief Real roots of a Chebyshev series on [-1, 1].
///
/// The roots of p(x) = Σ_{k=0}^{n} c_k T_k(x) are the eigenvalues of the
/// n×n colleague matrix, built from x T_0 = T_1 and
/// x T_k = ½ T_{k-1} + ½ T_{k+1}, with T_n eliminated through p(x) = 0.
/// Long series are first split at an off-centre point and re-interpolated on
/// each half, which shrinks the series and keeps the dense eigenproblem small.

#include "sfn/chebtech.hpp"
#include "sfn/constants.hpp"
#include "sfn/errors.hpp"

#include <fmt/core.h>

#include <Eigen/Eigenvalues>

#include <algorithm>
#include <cmath>
#include <tuple>

namespace sfn::smooth {

// ─── roots ────────────────────────────────────────────────────────────────────

std::vector<double> Chebtech::roots() const {
    if (is_zero()) {
        return {};
    }

    std::vector<double> out;
    simplify().roots_on(-1.0, 1.0, out);
    std::sort(out.begin(), out.end());

    // Merge roots found twice, e.g. on both sides of a split point.
    std::vector<double> merged;
    merged.reserve(out.size());
    for (double r : out) {
        if (merged.empty() || r - merged.back() > constants::ROOT_MERGE_TOL) {
            merged.push_back(r);
        }
    }
    return merged;
}

// ─── Private: recursive subdivision ───────────────────────────────────────────

void Chebtech::roots_on(double a, double b, std::vector<double>& out) const {
    const auto to_parent = [a, b](double t) { return a + 0.5 * (b - a) * (t + 1.0); };

    if (length() <= constants::ROOTS_SUBDIVISION_LENGTH) {
        for (double t : colleague_roots()) {
            out.push_back(to_parent(t));
        }
        return;
    }

    const double split = constants::ROOTS_SPLIT_POINT;
    const std::size_t n = length();

    // Re-interpolate each half on n points: exact for a degree n-1 series.
    const Chebtech lower = interpolate([this, split](double t) {
        return evaluate(-1.0 + 0.5 * (split + 1.0) * (t + 1.0));
    }, n).simplify();
    const Chebtech upper = interpolate([this, split](double t) {
        return evaluate(split + 0.5 * (1.0 - split) * (t + 1.0));
    }, n).simplify();

    // A half that did not shrink would recurse forever; solve it directly.
    for (const auto& [piece, lo, hi] : {std::tuple{&lower, -1.0, split},
                                        std::tuple{&upper, split, 1.0}}) {
        const double pa = to_parent(lo);
        const double pb = to_parent(hi);
        if (piece->is_zero()) {
            continue;
        }
        if (piece->length() >= n) {
            for (double t : piece->colleague_roots()) {
                out.push_back(pa + 0.5 * (pb - pa) * (t + 1.0));
            }
        } else {
            piece->roots_on(pa, pb, out);
        }
    }
}

// ─── Private: colleague matrix ────────────────────────────────────────────────

std::vector<double> Chebtech::colleague_roots() const {
    // Effective degree: ignore exact trailing zeros.
    Eigen::Index n = coeffs_.size() - 1;
    while (n > 0 && coeffs_(n) == 0.0) {
        --n;
    }

    std::vector<double> roots;
    const auto keep = [&roots](double x) {
        if (std::abs(x) <= 1.0 + constants::ROOT_DOMAIN_TOL) {
            roots.push_back(std::clamp(x, -1.0, 1.0));
        }
    };

    if (n == 0) {
        return roots;
    }
    if (n == 1) {
        keep(-coeffs_(0) / coeffs_(1));
        return roots;
    }

    Eigen::MatrixXd colleague = Eigen::MatrixXd::Zero(n, n);
    colleague(0, 1) = 1.0;
    for (Eigen::Index i = 1; i < n; ++i) {
        colleague(i, i - 1) = 0.5;
        if (i + 1 < n) {
            colleague(i, i + 1) = 0.5;
        }
    }
    // x T_{n-1} = ½ T_{n-2} + ½ T_n,  T_n = −Σ_{k<n} (c_k / c_n) T_k
    for (Eigen::Index k = 0; k < n; ++k) {
        colleague(n - 1, k) -= coeffs_(k) / (2.0 * coeffs_(n));
    }

    Eigen::EigenSolver<Eigen::MatrixXd> solver(colleague, /*computeEigenvectors=*/false);
    if (solver.info() != Eigen::Success) {
        throw RootFindingFailed(fmt::format(
            "colleague matrix eigenvalue solve did not converge (degree {})", n));
    }

    const auto& ev = solver.eigenvalues();
    for (Eigen::Index i = 0; i < ev.size(); ++i) {
        if (std::abs(ev(i).imag()) <= constants::ROOT_IMAG_TOL) {
            keep(ev(i).real());
        }
    }
    return roots;
}

} // namespace sfn::smooth
