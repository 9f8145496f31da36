/// @file src/core/config.cpp
/// @brief The process-wide default configuration.

#include "sfn/config.hpp"

namespace sfn {

const SingfunConfig& default_config() noexcept {
    static const SingfunConfig instance{};
    return instance;
}

} // namespace sfn
