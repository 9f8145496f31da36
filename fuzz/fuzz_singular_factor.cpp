/**
 * @file  fuzz_singular_factor.cpp
 * @brief libFuzzer target for singular_factor and Singfun evaluation
 *
 * Build:
 *   cmake -DSFN_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_singular_factor
 *
 * Run for 60 seconds:
 *   ./fuzz_singular_factor -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. singular_factor is NaN outside [-1, 1] and never negative inside.
 *   2. A zero exponent pair gives exactly 1 on [-1, 1].
 *   3. feval of a constant-residual Singfun never throws, for any x.
 *   4. Non-finite exponents are rejected with InvalidExponents, never accepted.
 *
 * Fuzzer strategy:
 *   Bytes interpreted as:
 *     [1 double: x]
 *     [2 doubles: exponents (a, b)]
 */

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <cmath>

#include "sfn/errors.hpp"
#include "sfn/singfun.hpp"

using namespace sfn;

static constexpr size_t INPUT_BYTES = 3 * sizeof(double);

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < INPUT_BYTES) return 0;

    double raw[3];
    std::memcpy(raw, data, INPUT_BYTES);
    const double x = raw[0];
    const Exponents e{raw[1], raw[2]};

    const double v = singular_factor(x, e);
    if (!(x >= -1.0 && x <= 1.0)) {
        if (!std::isnan(v)) __builtin_trap();
    } else if (v < 0.0) {
        __builtin_trap();
    }
    if (x >= -1.0 && x <= 1.0 && singular_factor(x, Exponents{}) != 1.0) {
        __builtin_trap();
    }

    const bool finite = std::isfinite(e.left) && std::isfinite(e.right);
    try {
        const Singfun f(smooth::Chebtech::constant(1.0), e);
        if (!finite) __builtin_trap();
        (void)feval(f, x);
    } catch (const InvalidExponents&) {
        if (finite) __builtin_trap();
    }
    return 0;
}
