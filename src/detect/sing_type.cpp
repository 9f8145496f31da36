/// @file src/detect/sing_type.cpp
/// @brief Parsing and naming of singularity type hints.

#include "sfn/types.hpp"
#include "sfn/errors.hpp"

#include <algorithm>
#include <cctype>

namespace sfn {

SingType parse_sing_type(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "pole")   return SingType::Pole;
    if (lower == "branch") return SingType::Branch;
    if (lower == "root")   return SingType::Root;
    if (lower == "none")   return SingType::None;

    throw UnknownSingularityType("unknown singularity type '" + std::string(name)
                                 + "' (expected pole, branch, root or none)");
}

SingTypes parse_sing_types(std::string_view left, std::string_view right) {
    return {parse_sing_type(left), parse_sing_type(right)};
}

std::string to_string(SingType type) {
    switch (type) {
    case SingType::Pole:   return "pole";
    case SingType::Branch: return "branch";
    case SingType::Root:   return "root";
    case SingType::None:   return "none";
    }
    return "unknown";
}

} // namespace sfn
