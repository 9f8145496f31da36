#pragma once

/// @file include/sfn/types.hpp
/// @brief Shared value types for the SFN (singular function) library.
///
/// Defines the endpoint exponent pair, the singularity type hints consumed
/// by the detector and the scalar callable type every constructor accepts.

#include <Eigen/Dense>

#include <functional>
#include <string>
#include <string_view>

namespace sfn {

// ─── Callables ────────────────────────────────────────────────────────────────

/// A scalar real-valued function of one real variable, evaluated on (-1, 1).
using ScalarFunction = std::function<double(double)>;

/// Chebyshev coefficient storage.
using Coefficients = Eigen::VectorXd;

// ─── Exponents ────────────────────────────────────────────────────────────────

/// Endpoint exponents (a, b) of the factor (1+x)^a (1-x)^b.
///
/// Negative = pole, positive = root, non-integer = branch, zero = none.
struct Exponents {
    double left  = 0.0; ///< a, at x = -1
    double right = 0.0; ///< b, at x = +1

    /// Componentwise sum (exponents of a product).
    friend Exponents operator+(const Exponents& p, const Exponents& q) noexcept {
        return {p.left + q.left, p.right + q.right};
    }

    /// Componentwise difference (exponents of a quotient).
    friend Exponents operator-(const Exponents& p, const Exponents& q) noexcept {
        return {p.left - q.left, p.right - q.right};
    }

    /// Exact equality; use `same_exponents` for the tolerance-based test.
    friend bool operator==(const Exponents& p, const Exponents& q) noexcept {
        return p.left == q.left && p.right == q.right;
    }

    /// True if both exponents are exactly zero.
    [[nodiscard]] bool is_trivial() const noexcept {
        return left == 0.0 && right == 0.0;
    }
};

// ─── Endpoints ────────────────────────────────────────────────────────────────

/// One end of the interval [-1, 1].
enum class Endpoint {
    Left,  ///< x = -1
    Right, ///< x = +1
};

/// Exponent stored in `e` for endpoint `end`.
[[nodiscard]] inline double exponent_at(const Exponents& e, Endpoint end) noexcept {
    return end == Endpoint::Left ? e.left : e.right;
}

// ─── Singularity Type Hints ───────────────────────────────────────────────────

/// Detector hint for one endpoint.
enum class SingType {
    Pole,   ///< Integer order ≤ 0: pole (or none)
    Branch, ///< Any real order: the most general, fractional search
    Root,   ///< Integer order ≥ 0: root (or none)
    None,   ///< No singularity: exponent 0 without sampling
};

/// Hints for both endpoints. The default asks for the general search at
/// each end.
struct SingTypes {
    SingType left  = SingType::Branch;
    SingType right = SingType::Branch;
};

/// Parse one of "pole", "branch", "root", "none" (case-insensitive).
///
/// # Throws
/// `UnknownSingularityType` for any other string.
[[nodiscard]] SingType parse_sing_type(std::string_view name);

/// Parse a hint pair, e.g. `parse_sing_types("none", "branch")`.
[[nodiscard]] SingTypes parse_sing_types(std::string_view left,
                                         std::string_view right);

/// Human-readable name ("pole", "branch", "root", "none").
[[nodiscard]] std::string to_string(SingType type);

} // namespace sfn
