#include <gtest/gtest.h>
#include "sfn/singfun.hpp"

#include <cmath>
#include <limits>

using namespace sfn;
using smooth::Chebtech;

namespace {

Singfun smooth_times(ScalarFunction s, double a, double b) {
    return Singfun(Chebtech::make(s), Exponents{a, b});
}

} // namespace

// ─── feval ────────────────────────────────────────────────────────────────────

TEST(Singfun_Feval, Interior) {
    const auto f = smooth_times([](double x) { return std::exp(x); }, -0.5, 0.5);
    const double x = 0.1;
    EXPECT_NEAR(feval(f, x), std::exp(x) * std::sqrt((1.0 - x) / (1.0 + x)), 1e-12);
}

TEST(Singfun_Feval, PositiveExponentVanishesAtEndpoint) {
    const auto f = smooth_times([](double x) { return std::exp(x); }, 0.0, 0.5);
    EXPECT_EQ(feval(f, 1.0), 0.0);
}

TEST(Singfun_Feval, SimpleRootAndPoleAtLeft) {
    const Singfun root(Chebtech::constant(1.0), Exponents{1.0, 0.0});
    const Singfun pole(Chebtech::constant(1.0), Exponents{-1.0, 0.0});
    EXPECT_EQ(feval(root, -1.0), 0.0);
    EXPECT_TRUE(std::isinf(feval(pole, -1.0)));
}

TEST(Singfun_Feval, NegativeExponentIsSignedInfinity) {
    const auto f = smooth_times([](double x) { return std::exp(x); }, -0.5, 0.0);
    const auto g = smooth_times([](double x) { return -2.0 - x; }, 0.0, -1.0);
    EXPECT_EQ(feval(f, -1.0), std::numeric_limits<double>::infinity());
    EXPECT_EQ(feval(g, 1.0), -std::numeric_limits<double>::infinity());
}

TEST(Singfun_Feval, ZeroExponentEndpointIsLimit) {
    const auto f = smooth_times([](double x) { return std::exp(x); }, 0.0, 0.5);
    EXPECT_NEAR(feval(f, -1.0), std::exp(-1.0) * std::sqrt(2.0), 1e-12);
}

TEST(Singfun_Feval, PoleOverZeroResidualIsNaN) {
    Coefficients c(2);
    c << 1.0, 1.0;  // 1 + x, exactly zero at -1
    const Singfun f(Chebtech(c), Exponents{-0.5, 0.0});
    EXPECT_TRUE(std::isnan(feval(f, -1.0)));
}

TEST(Singfun_Feval, OutsideIntervalIsNaN) {
    const auto f = smooth_times([](double x) { return std::exp(x); }, 0.5, 0.0);
    EXPECT_TRUE(std::isnan(feval(f, 1.5)));
    EXPECT_TRUE(std::isnan(feval(f, -2.0)));
}

TEST(Singfun_Feval, VectorKeepsShape) {
    const auto f = smooth_times([](double x) { return std::cos(x); }, 0.0, 0.5);
    Eigen::VectorXd x(4);
    x << -1.0, -0.25, 0.5, 1.0;
    const Eigen::VectorXd y = feval(f, x);
    ASSERT_EQ(y.size(), 4);
    for (Eigen::Index j = 0; j < 4; ++j)
        EXPECT_EQ(y(j), feval(f, x(j)));
    EXPECT_EQ(y(3), 0.0);
}

// ─── roots ────────────────────────────────────────────────────────────────────

TEST(Singfun_Roots, InteriorAndEndpoint) {
    const auto f = smooth_times([](double x) { return x; }, 0.0, 0.5);
    const auto r = roots(f);
    ASSERT_EQ(r.size(), 2u);
    EXPECT_NEAR(r[0], 0.0, 1e-14);
    EXPECT_EQ(r[1], 1.0);
}

TEST(Singfun_Roots, EndpointsCanBeExcluded) {
    const auto f = smooth_times([](double x) { return x; }, 0.0, 0.5);
    const auto r = roots(f, RootsOptions{false});
    ASSERT_EQ(r.size(), 1u);
    EXPECT_NEAR(r[0], 0.0, 1e-14);
}

TEST(Singfun_Roots, PoleEndpointIsNotARoot) {
    const auto f = smooth_times([](double x) { return std::sin(4.0 * x); }, -0.5, 0.0);
    const auto r = roots(f);
    ASSERT_EQ(r.size(), 3u);
    EXPECT_NEAR(r[0], -std::acos(-1.0) / 4.0, 1e-12);
    EXPECT_NEAR(r[1], 0.0, 1e-12);
    EXPECT_NEAR(r[2],  std::acos(-1.0) / 4.0, 1e-12);
}

TEST(Singfun_Roots, ZeroFunctionHasNone) {
    EXPECT_TRUE(roots(Singfun()).empty());
}

// ─── Extrema ──────────────────────────────────────────────────────────────────

TEST(Singfun_Extrema, SemicircleMaximumAtCentre) {
    const Singfun f(Chebtech::constant(1.0), Exponents{0.5, 0.5});
    const auto [lo, hi] = minandmax(f);
    EXPECT_EQ(lo.value, 0.0);
    EXPECT_EQ(std::abs(lo.position), 1.0);
    EXPECT_NEAR(hi.value, 1.0, 1e-14);
    EXPECT_NEAR(hi.position, 0.0, 1e-12);
}

TEST(Singfun_Extrema, PoleGivesInfiniteMaximum) {
    const Singfun f(Chebtech::constant(1.0), Exponents{-0.5, 0.0});
    const auto hi = max(f);
    EXPECT_EQ(hi.value, std::numeric_limits<double>::infinity());
    EXPECT_EQ(hi.position, -1.0);
    const auto lo = min(f);
    EXPECT_NEAR(lo.value, std::sqrt(0.5), 1e-14);
    EXPECT_EQ(lo.position, 1.0);
}

TEST(Singfun_Extrema, SmoothDelegatesToEngine) {
    const auto f = smooth_times([](double x) { return x * x; }, 0.0, 0.0);
    EXPECT_NEAR(min(f).value, 0.0, 1e-14);
    EXPECT_NEAR(max(f).value, 1.0, 1e-14);
}

TEST(Singfun_Extrema, ZeroFunction) {
    const auto [lo, hi] = minandmax(Singfun());
    EXPECT_EQ(lo.value, 0.0);
    EXPECT_EQ(hi.value, 0.0);
}
