#include <gtest/gtest.h>
#include "sfn/detect.hpp"
#include "sfn/constants.hpp"
#include "sfn/errors.hpp"

#include <cmath>

using namespace sfn;
using namespace sfn::detect;

// Most operators below compute 1 ± x directly; the sample points
// ∓1 ± 2^-k make those factors exact. The interior-root cases put a zero
// exactly on one of those points.

// ─── snap_exponent ────────────────────────────────────────────────────────────

TEST(SnapExponent, RoundsWithinTolerance) {
    EXPECT_EQ(snap_exponent(2.0 + 1e-12, 1e-10), 2.0);
    EXPECT_EQ(snap_exponent(-1.0 - 1e-11, 1e-10), -1.0);
    EXPECT_EQ(snap_exponent(0.5, 1e-10), 0.5);
    EXPECT_FALSE(std::signbit(snap_exponent(-1e-13, 1e-10)));
}

// ─── Integer search ───────────────────────────────────────────────────────────

TEST(FindExponent_Pole, SimplePoleAtLeft) {
    auto op = [](double x) { return std::cos(x) / (1.0 + x); };
    EXPECT_EQ(find_exponent(op, Endpoint::Left, SingType::Pole, default_config()), -1.0);
}

TEST(FindExponent_Pole, DoublePoleAtRight) {
    auto op = [](double x) { return std::exp(x) / ((1.0 - x) * (1.0 - x)); };
    EXPECT_EQ(find_exponent(op, Endpoint::Right, SingType::Pole, default_config()), -2.0);
}

TEST(FindExponent_Root, DoubleRootAtRight) {
    auto op = [](double x) { return (1.0 - x) * (1.0 - x) * std::exp(x); };
    EXPECT_EQ(find_exponent(op, Endpoint::Right, SingType::Root, default_config()), 2.0);
}

TEST(FindExponent_Root, SmoothEndpointHasOrderZero) {
    auto op = [](double x) { return 2.0 + std::sin(x); };
    EXPECT_EQ(find_exponent(op, Endpoint::Left, SingType::Root, default_config()), 0.0);
}

TEST(FindExponent_Root, PoleContradictsRootHint) {
    auto op = [](double x) { return 1.0 / (1.0 + x); };
    EXPECT_THROW((void)find_exponent(op, Endpoint::Left, SingType::Root, default_config()),
                 SingularityDetectionFailed);
}

TEST(FindExponent_Pole, BranchPointDoesNotStabilise) {
    auto op = [](double x) { return std::sqrt(1.0 - x); };
    EXPECT_THROW((void)find_exponent(op, Endpoint::Right, SingType::Pole, default_config()),
                 SingularityDetectionFailed);
}

// ─── Fractional search ────────────────────────────────────────────────────────

TEST(FindExponent_Branch, SquareRootAtRight) {
    auto op = [](double x) { return std::sqrt(1.0 - x) * std::cos(x); };
    const double e = find_exponent(op, Endpoint::Right, SingType::Branch, default_config());
    EXPECT_NEAR(e, 0.5, default_config().exponent_tol);
}

TEST(FindExponent_Branch, NegativeQuarterAtLeft) {
    auto op = [](double x) { return std::exp(x) / std::pow(1.0 + x, 0.25); };
    const double e = find_exponent(op, Endpoint::Left, SingType::Branch, default_config());
    EXPECT_NEAR(e, -0.25, default_config().exponent_tol);
}

TEST(FindExponent_Branch, IntegerOrderIsFoundFirst) {
    auto op = [](double x) { return std::sin(x) / (1.0 - x); };
    EXPECT_EQ(find_exponent(op, Endpoint::Right, SingType::Branch, default_config()), -1.0);
}

// ─── Hints and degenerate operators ───────────────────────────────────────────

TEST(FindExponent_None, NeverEvaluatesOperator) {
    int calls = 0;
    auto op = [&calls](double x) { ++calls; return x; };
    EXPECT_EQ(find_exponent(op, Endpoint::Left, SingType::None, default_config()), 0.0);
    EXPECT_EQ(calls, 0);
}

TEST(FindExponent_Zero, IdenticallyZeroHasOrderZero) {
    auto op = [](double) { return 0.0; };
    EXPECT_EQ(find_exponent(op, Endpoint::Left, SingType::Branch, default_config()), 0.0);
    EXPECT_EQ(find_exponent(op, Endpoint::Right, SingType::Pole, default_config()), 0.0);
}

TEST(FindExponents, BothEndpoints) {
    auto op = [](double x) { return std::sqrt(1.0 - x) / (1.0 + x); };
    const Exponents e = find_exponents(op, SingTypes{SingType::Pole, SingType::Branch});
    EXPECT_EQ(e.left, -1.0);
    EXPECT_NEAR(e.right, 0.5, 1e-10);
}

TEST(FindExponents, EmptyOperatorThrows) {
    EXPECT_THROW((void)find_exponents(ScalarFunction{}, SingTypes{}), InvalidOperator);
}

TEST(FindExponent_Limits, OrderBeyondMaximumIsRejected) {
    SingfunConfig cfg = default_config();
    cfg.max_pole_order = 2;
    auto op = [](double x) { return 1.0 / std::pow(1.0 + x, 3); };
    EXPECT_THROW((void)find_exponent(op, Endpoint::Left, SingType::Pole, cfg),
                 SingularityDetectionFailed);
}

TEST(FindExponent_Limits, BranchSearchHonoursMaximum) {
    SingfunConfig cfg = default_config();
    cfg.max_pole_order = 2;
    auto cubic = [](double x) { return 1.0 / std::pow(1.0 + x, 3); };
    EXPECT_THROW((void)find_exponent(cubic, Endpoint::Left, SingType::Branch, cfg),
                 SingularityDetectionFailed);
    auto branch = [](double x) { return std::pow(1.0 - x, -2.5); };
    EXPECT_THROW((void)find_exponent(branch, Endpoint::Right, SingType::Branch, cfg),
                 SingularityDetectionFailed);
}

// ─── Interior roots on sample points ──────────────────────────────────────────

TEST(FindExponent_InteriorRoot, RootAtFirstLeftSample) {
    // x = -0.5 is the δ = 1/2 sample.
    auto op = [](double x) { return x + 0.5; };
    const Exponents e = find_exponents(op, SingTypes{});
    EXPECT_EQ(e.left, 0.0);
    EXPECT_EQ(e.right, 0.0);
}

TEST(FindExponent_InteriorRoot, RootAtSecondLeftSample) {
    auto op = [](double x) { return x + 0.75; };
    const Exponents e = find_exponents(op, SingTypes{});
    EXPECT_EQ(e.left, 0.0);
    EXPECT_EQ(e.right, 0.0);
}

TEST(FindExponent_InteriorRoot, BranchBeyondRootAtRightSample) {
    auto op = [](double x) { return std::sqrt(1.0 - x) * (x - 0.75); };
    const Exponents e = find_exponents(op, SingTypes{});
    EXPECT_EQ(e.left, 0.0);
    EXPECT_NEAR(e.right, 0.5, 1e-10);
}

TEST(FindExponent_InteriorRoot, PoleBeyondRootAtLeftSample) {
    auto op = [](double x) { return (x + 0.5) / (1.0 + x); };
    EXPECT_EQ(find_exponent(op, Endpoint::Left, SingType::Pole, default_config()), -1.0);
}

TEST(FindExponent_InteriorRoot, InteriorPoleOnSampleIsSkipped) {
    auto op = [](double x) { return 1.0 / (x + 0.5); };
    EXPECT_EQ(find_exponent(op, Endpoint::Left, SingType::Branch, default_config()), 0.0);
}

TEST(FindExponent_InexactRoot, SinePiXIsNotResolved) {
    // sin(π x) is evaluated with π rounded, so near ±1 it levels off at
    // about 1e-16 instead of vanishing like δ. The order estimates drift
    // away from 1 before their truncation error is below exponent_tol.
    auto op = [](double x) { return std::sin(sfn::constants::PI * x); };
    EXPECT_THROW((void)find_exponents(op, SingTypes{}), SingularityDetectionFailed);
}

// ─── Probe ────────────────────────────────────────────────────────────────────

TEST(ProbeEndpoint, StopsAtOverflow) {
    SingfunConfig cfg = default_config();
    auto op = [](double x) { return 1.0 / std::pow(1.0 + x, 40); };
    const auto probe = probe_endpoint(op, Endpoint::Left, cfg);
    EXPECT_FALSE(probe.identically_zero);
    // (2^k)^40 overflows once 40k > 1024.
    EXPECT_LT(probe.samples.size(), 26u);
    EXPECT_GT(probe.samples.size(), 20u);
}

TEST(ProbeEndpoint, RestartsAfterInteriorZero) {
    auto op = [](double x) { return x + 0.75; };
    const auto probe = probe_endpoint(op, Endpoint::Left, default_config());
    // δ = 1/2 is kept, δ = 1/4 hits the root, the run restarts at δ = 1/8.
    ASSERT_EQ(probe.samples.size(),
              static_cast<std::size_t>(default_config().max_samples - 2));
    EXPECT_DOUBLE_EQ(probe.samples.front().log_distance, std::log(0.125));
}

TEST(ProbeEndpoint, SamplesApproachEndpoint) {
    auto op = [](double x) { return 1.0 + x; };
    const auto probe = probe_endpoint(op, Endpoint::Left, default_config());
    ASSERT_GE(probe.samples.size(), 2u);
    EXPECT_LT(probe.samples.back().log_distance, probe.samples.front().log_distance);
}

// ─── Type hints ───────────────────────────────────────────────────────────────

TEST(SingTypeParse, CaseInsensitive) {
    EXPECT_EQ(parse_sing_type("pole"), SingType::Pole);
    EXPECT_EQ(parse_sing_type("ROOT"), SingType::Root);
    EXPECT_EQ(parse_sing_type("Branch"), SingType::Branch);
    EXPECT_EQ(parse_sing_type("none"), SingType::None);
}

TEST(SingTypeParse, UnknownNameThrows) {
    EXPECT_THROW((void)parse_sing_type("sort"), UnknownSingularityType);
    EXPECT_THROW((void)parse_sing_types("pole", ""), UnknownSingularityType);
}

TEST(SingTypeParse, PairAndNames) {
    const SingTypes t = parse_sing_types("none", "branch");
    EXPECT_EQ(t.left, SingType::None);
    EXPECT_EQ(t.right, SingType::Branch);
    EXPECT_EQ(to_string(SingType::Pole), "pole");
}
