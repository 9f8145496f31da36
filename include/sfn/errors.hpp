#pragma once

/// @file include/sfn/errors.hpp
/// @brief Named failures raised by the SFN library.
///
/// Every failure is terminal for the call that raised it and is reported as
/// its own exception type, so callers can catch exactly the case they can
/// recover from (e.g. retry construction with different type hints after a
/// `SingularityDetectionFailed`). All types derive from `SingfunError`, which
/// derives from `std::runtime_error`.

#include <stdexcept>
#include <string>

namespace sfn {

/// Discriminator carried by every `SingfunError`.
enum class ErrorCode {
    InvalidOperator,
    InvalidExponents,
    UnknownSingularityType,
    SingularityDetectionFailed,
    AdditionIncompatibleExponents,
    DivisionBySingularResidual,
    DivergentAntiderivative,
    RootFindingFailed,
};

/// Name of an error code, e.g. "SingularityDetectionFailed".
[[nodiscard]] const char* to_string(ErrorCode code) noexcept;

/// Base class of every SFN failure.
class SingfunError : public std::runtime_error {
public:
    SingfunError(ErrorCode code, const std::string& what);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/// The operator is not a usable scalar callable (empty, or non-finite
/// inside the interval).
class InvalidOperator : public SingfunError {
public:
    explicit InvalidOperator(const std::string& what)
        : SingfunError(ErrorCode::InvalidOperator, what) {}
};

/// Exponents supplied to a constructor are not finite reals.
class InvalidExponents : public SingfunError {
public:
    explicit InvalidExponents(const std::string& what)
        : SingfunError(ErrorCode::InvalidExponents, what) {}
};

/// A type hint outside pole | branch | root | none.
class UnknownSingularityType : public SingfunError {
public:
    explicit UnknownSingularityType(const std::string& what)
        : SingfunError(ErrorCode::UnknownSingularityType, what) {}
};

/// Neither the integer nor the fractional search stabilised.
class SingularityDetectionFailed : public SingfunError {
public:
    explicit SingularityDetectionFailed(const std::string& what)
        : SingfunError(ErrorCode::SingularityDetectionFailed, what) {}
};

/// No common exponent pair absorbs both summands.
class AdditionIncompatibleExponents : public SingfunError {
public:
    explicit AdditionIncompatibleExponents(const std::string& what)
        : SingfunError(ErrorCode::AdditionIncompatibleExponents, what) {}
};

/// The divisor's smooth part vanishes somewhere on [-1, 1].
class DivisionBySingularResidual : public SingfunError {
public:
    explicit DivisionBySingularResidual(const std::string& what)
        : SingfunError(ErrorCode::DivisionBySingularResidual, what) {}
};

/// An endpoint exponent ≤ -1 makes the integral diverge.
class DivergentAntiderivative : public SingfunError {
public:
    explicit DivergentAntiderivative(const std::string& what)
        : SingfunError(ErrorCode::DivergentAntiderivative, what) {}
};

/// The colleague-matrix eigenvalue solve behind `roots` did not converge.
class RootFindingFailed : public SingfunError {
public:
    explicit RootFindingFailed(const std::string& what)
        : SingfunError(ErrorCode::RootFindingFailed, what) {}
};

} // namespace sfn
