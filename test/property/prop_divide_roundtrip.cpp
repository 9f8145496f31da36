/**
 * @file  prop_divide_roundtrip.cpp
 * @brief Property: ∀ f, g with zero-free residual: (f·g)/g = f
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_divide_roundtrip
 *
 * Mathematical basis:
 *   Exponents add under · and subtract under /, so (f·g)/g carries f's
 *   exponents exactly. The smooth residual of g is c₀ + c₁x with |c₁| < c₀,
 *   which never vanishes on [-1, 1]; the quotient of smooth parts is then
 *   recovered to the adaptive tolerance.
 */

#include <rapidcheck.h>
#include <cmath>

#include "sfn/errors.hpp"
#include "sfn/singfun.hpp"

using namespace sfn;
using smooth::Chebtech;

namespace {

double bounded(double raw, double lim) { return std::tanh(raw) * lim; }

} // namespace

int main() {
    rc::check(
        "divide_roundtrip: (f*g)/g == f on interior points",
        [](double a1, double b1, double a2, double b2, double slope, double raw_x) {
            const Singfun f(Chebtech::make([](double x) { return std::exp(x); }),
                            Exponents{bounded(a1, 2.0), bounded(b1, 2.0)});

            Coefficients c(2);
            c << 2.0, bounded(slope, 1.9);
            const Singfun g(Chebtech(c), Exponents{bounded(a2, 2.0), bounded(b2, 2.0)});

            const Singfun q = rdivide(times(f, g), g);
            RC_ASSERT(std::abs(q.exponents().left  - f.exponents().left)  < 1e-14);
            RC_ASSERT(std::abs(q.exponents().right - f.exponents().right) < 1e-14);

            const double x = bounded(raw_x, 0.9);
            const double expected = feval(f, x);
            RC_ASSERT(std::abs(feval(q, x) - expected) <= 1e-11 * std::abs(expected));
        }
    );

    rc::check(
        "divide_roundtrip: a residual with an interior root is rejected",
        [](double raw_root) {
            const double r = bounded(raw_root, 0.95);
            Coefficients c(2);
            c << -r, 1.0;  // x - r
            const Singfun g(Chebtech(c), Exponents{0.5, 0.0});
            const Singfun f(Chebtech::constant(1.0), Exponents{});
            RC_ASSERT_THROWS_AS((void)rdivide(f, g), DivisionBySingularResidual);
        }
    );

    return 0;
}
