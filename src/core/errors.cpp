/// @file src/core/errors.cpp
/// @brief SingfunError base and error-code names.

#include "sfn/errors.hpp"

namespace sfn {

SingfunError::SingfunError(ErrorCode code, const std::string& what)
    : std::runtime_error(std::string(to_string(code)) + ": " + what)
    , code_(code) {}

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
    case ErrorCode::InvalidOperator:               return "InvalidOperator";
    case ErrorCode::InvalidExponents:              return "InvalidExponents";
    case ErrorCode::UnknownSingularityType:        return "UnknownSingularityType";
    case ErrorCode::SingularityDetectionFailed:    return "SingularityDetectionFailed";
    case ErrorCode::AdditionIncompatibleExponents: return "AdditionIncompatibleExponents";
    case ErrorCode::DivisionBySingularResidual:    return "DivisionBySingularResidual";
    case ErrorCode::DivergentAntiderivative:       return "DivergentAntiderivative";
    case ErrorCode::RootFindingFailed:             return "RootFindingFailed";
    }
    return "Unknown";
}

} // namespace sfn
