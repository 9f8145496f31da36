#include <gtest/gtest.h>
#include "sfn/singfun.hpp"
#include "sfn/errors.hpp"

#include <cmath>
#include <stdexcept>

using namespace sfn;
using smooth::Chebtech;

namespace {

Singfun power_of(double a, double b) {
    return Singfun(Chebtech::constant(1.0), Exponents{a, b});
}

Singfun smooth_times(ScalarFunction s, double a, double b) {
    return Singfun(Chebtech::make(s), Exponents{a, b});
}

} // namespace

// ─── diff ─────────────────────────────────────────────────────────────────────

TEST(Singfun_Diff, SquareRootAtRight) {
    const auto f = smooth_times([](double x) { return std::cos(x); }, 0.0, 0.5);
    const auto df = diff(f);
    EXPECT_EQ(df.exponents().left, 0.0);
    EXPECT_EQ(df.exponents().right, -0.5);
    for (double x : {-0.7, 0.0, 0.25, 0.9}) {
        const double expected = -std::cos(x) / (2.0 * std::sqrt(1.0 - x))
                              - std::sqrt(1.0 - x) * std::sin(x);
        EXPECT_NEAR(df(x), expected, 1e-11) << "x = " << x;
    }
}

TEST(Singfun_Diff, BothEndpointsShift) {
    const auto f = power_of(0.5, 0.5);  // √(1 − x²)
    const auto df = diff(f);
    EXPECT_EQ(df.exponents().left, -0.5);
    EXPECT_EQ(df.exponents().right, -0.5);
    const double x = 0.3;
    EXPECT_NEAR(df(x), -x / std::sqrt(1.0 - x * x), 1e-13);
}

TEST(Singfun_Diff, SecondDerivativeOfPole) {
    const auto f = power_of(-1.0, 0.0);  // 1 / (1 + x)
    const auto d2 = diff(f, 2);
    EXPECT_EQ(d2.exponents().left, -3.0);
    EXPECT_NEAR(d2(0.5), 2.0 / std::pow(1.5, 3), 1e-13);
}

TEST(Singfun_Diff, ZeroOrderIsIdentity) {
    const auto f = power_of(0.5, 0.0);
    EXPECT_TRUE(is_equal(diff(f, 0), f));
}

TEST(Singfun_Diff, NegativeOrderThrows) {
    EXPECT_THROW((void)diff(power_of(0.5, 0.0), -1), std::invalid_argument);
}

TEST(Singfun_Diff, ConstantIsZero) {
    const Singfun c(Chebtech::constant(4.0), Exponents{});
    EXPECT_TRUE(diff(c).is_zero());
}

// ─── cumsum ───────────────────────────────────────────────────────────────────

TEST(Singfun_Cumsum, InverseSquareRootAtLeft) {
    const auto F = cumsum(power_of(-0.5, 0.0));
    EXPECT_NEAR(F.exponents().left, 0.5, 1e-15);
    EXPECT_EQ(F.exponents().right, 0.0);
    for (double x : {-0.5, 0.0, 0.5})
        EXPECT_NEAR(F(x), 2.0 * std::sqrt(1.0 + x), 1e-13);
    EXPECT_EQ(F(-1.0), 0.0);
}

TEST(Singfun_Cumsum, SquareRootAtRightVanishesAtRight) {
    const auto F = cumsum(power_of(0.0, 0.5));
    EXPECT_EQ(F.exponents().left, 0.0);
    EXPECT_NEAR(F.exponents().right, 1.5, 1e-15);
    EXPECT_EQ(F(1.0), 0.0);
    EXPECT_NEAR(F(0.0), -2.0 / 3.0, 1e-13);
    // F(1) − F(−1) = ∫ √(1 − x) dx
    EXPECT_NEAR(F(1.0) - F(-1.0), sum(power_of(0.0, 0.5)), 1e-13);
}

TEST(Singfun_Cumsum, DiffRecoversIntegrand) {
    const auto f = smooth_times([](double x) { return std::exp(x); }, -0.5, 0.0);
    const auto back = diff(cumsum(f));
    EXPECT_NEAR(back.exponents().left, -0.5, 1e-15);
    for (double x : {-0.8, -0.1, 0.4, 0.95}) {
        const double expected = feval(f, x);
        EXPECT_NEAR(back(x), expected, 1e-11 * std::abs(expected)) << "x = " << x;
    }
}

TEST(Singfun_Cumsum, SmoothAntiderivative) {
    const auto f = smooth_times([](double x) { return std::cos(x); }, 0.0, 0.0);
    const auto F = cumsum(f);
    EXPECT_TRUE(F.exponents().is_trivial());
    EXPECT_NEAR(F(0.5), std::sin(0.5) - std::sin(-1.0), 1e-12);
}

TEST(Singfun_Cumsum, IntegerExponentIsAbsorbed) {
    const auto F = cumsum(power_of(2.0, 0.0));  // ∫ (1+t)² dt = (1+x)³ / 3
    EXPECT_TRUE(F.exponents().is_trivial());
    EXPECT_NEAR(F(0.0), 1.0 / 3.0, 1e-14);
}

TEST(Singfun_Cumsum, IntegerAndBranchExponents) {
    const auto f = power_of(-0.5, 1.0);  // (1 − x) / √(1 + x)
    const auto F = cumsum(f);
    EXPECT_NEAR(F.exponents().left, 0.5, 1e-15);
    EXPECT_EQ(F.exponents().right, 0.0);
    // ∫_{-1}^{x} (1−t)(1+t)^{-½} dt = 4√(1+x) − (2/3)(1+x)^{3/2}
    const double x = 0.2;
    const double expected = 4.0 * std::sqrt(1.0 + x) - (2.0 / 3.0) * std::pow(1.0 + x, 1.5);
    EXPECT_NEAR(F(x), expected, 1e-13);
}

TEST(Singfun_Cumsum, NonIntegrableExponentThrows) {
    EXPECT_THROW((void)cumsum(power_of(-1.5, 0.0)), DivergentAntiderivative);
    EXPECT_THROW((void)cumsum(power_of(0.0, -1.0)), DivergentAntiderivative);
}

TEST(Singfun_Cumsum, BranchAtBothEndsThrows) {
    EXPECT_THROW((void)cumsum(power_of(0.5, -0.5)), AdditionIncompatibleExponents);
}

TEST(Singfun_Cumsum, ZeroStaysZero) {
    EXPECT_TRUE(cumsum(Singfun()).is_zero());
}

// ─── sum / inner_product ──────────────────────────────────────────────────────

TEST(Singfun_Sum, ChebyshevWeight) {
    // ∫ (1 − x²)^{-½} dx = π
    EXPECT_NEAR(sum(power_of(-0.5, -0.5)), sfn::constants::PI, 1e-13);
}

TEST(Singfun_Sum, BranchTimesSmooth) {
    const auto f = smooth_times([](double x) { return x * x; }, 0.0, 0.5);
    // With u = 1 − x: ∫_0^2 (1 − u)² u^{½} du
    const double expected = std::pow(2.0, 1.5) * (2.0 / 3.0)
                          - std::pow(2.0, 2.5) * (4.0 / 5.0)
                          + std::pow(2.0, 3.5) * (2.0 / 7.0);
    EXPECT_NEAR(sum(f), expected, 1e-13);
}

TEST(Singfun_Sum, SmoothMatchesEngine) {
    const auto f = smooth_times([](double x) { return std::exp(x); }, 0.0, 0.0);
    EXPECT_NEAR(sum(f), std::exp(1.0) - std::exp(-1.0), 1e-12);
    EXPECT_EQ(sum(Singfun()), 0.0);
}

TEST(Singfun_Sum, NonIntegrableThrows) {
    EXPECT_THROW((void)sum(power_of(-1.0, 0.0)), DivergentAntiderivative);
}

TEST(Singfun_InnerProduct, ExponentsCancel) {
    EXPECT_NEAR(inner_product(power_of(-0.5, 0.0), power_of(0.5, 0.0)), 2.0, 1e-14);
}
