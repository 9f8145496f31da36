/**
 * @file  bench/bench_singfun.cpp
 * @brief Google Benchmark suite for singular-function construction and
 *        the operations built on it.
 *
 * Benchmarks
 * ----------
 *   BM_Chebtech_Make           : adaptive smooth construction, sin(kx)
 *   BM_Chebtech_Roots          : colleague roots with subdivision
 *   BM_Detect_Branch           : fractional exponent search at one endpoint
 *   BM_Singfun_Construct       : detection + residual construction
 *   BM_Singfun_Feval           : vector evaluation
 *   BM_Singfun_Cumsum          : branch antiderivative by Gauss–Jacobi
 *   BM_GaussJacobi             : Golub–Welsch rule of growing size
 *
 * Build (CMake):
 *   cmake --build build --target bench_singfun
 *   ./build/bench_singfun --benchmark_format=json
 */

#include "benchmark/benchmark.h"

#include "sfn/chebtech.hpp"
#include "sfn/detect.hpp"
#include "sfn/quadrature.hpp"
#include "sfn/singfun.hpp"

#include <cmath>
#include <cstdint>

using namespace sfn;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static SingfunConfig quiet_config() {
    SingfunConfig cfg = default_config();
    cfg.warnings = false;
    return cfg;
}

static Eigen::VectorXd make_grid(std::size_t n) {
    return Eigen::VectorXd::LinSpaced(static_cast<Eigen::Index>(n), -1.0, 1.0);
}

// ── Smooth engine ──────────────────────────────────────────────────────────────

static void BM_Chebtech_Make(benchmark::State& state) {
    const double k = static_cast<double>(state.range(0));
    const SingfunConfig cfg = quiet_config();
    for (auto _ : state) {
        auto f = smooth::Chebtech::make([k](double x) { return std::sin(k * x); }, cfg);
        benchmark::DoNotOptimize(f);
    }
    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_Chebtech_Make)->RangeMultiplier(4)->Range(1, 256)->Unit(benchmark::kMicrosecond);

static void BM_Chebtech_Roots(benchmark::State& state) {
    const double k = static_cast<double>(state.range(0));
    const auto f = smooth::Chebtech::make([k](double x) { return std::sin(k * x); }, quiet_config());
    for (auto _ : state) {
        auto r = f.roots();
        benchmark::DoNotOptimize(r.data());
    }
    state.counters["length"] = static_cast<double>(f.length());
}
BENCHMARK(BM_Chebtech_Roots)->RangeMultiplier(4)->Range(4, 256)->Unit(benchmark::kMicrosecond);

// ── Detection and construction ─────────────────────────────────────────────────

static void BM_Detect_Branch(benchmark::State& state) {
    const SingfunConfig cfg = quiet_config();
    auto op = [](double x) { return std::sqrt(1.0 - x) * std::cos(x); };
    for (auto _ : state) {
        double e = detect::find_exponent(op, Endpoint::Right, SingType::Branch, cfg);
        benchmark::DoNotOptimize(e);
    }
}
BENCHMARK(BM_Detect_Branch)->Unit(benchmark::kMicrosecond);

static void BM_Singfun_Construct(benchmark::State& state) {
    const SingfunConfig cfg = quiet_config();
    auto op = [](double x) { return std::exp(x) * std::sqrt(1.0 - x) / (1.0 + x); };
    for (auto _ : state) {
        Singfun f(op, SingTypes{SingType::Pole, SingType::Branch}, cfg);
        benchmark::DoNotOptimize(f);
    }
}
BENCHMARK(BM_Singfun_Construct)->Unit(benchmark::kMicrosecond);

// ── Operations ─────────────────────────────────────────────────────────────────

static void BM_Singfun_Feval(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const Singfun f(smooth::Chebtech::make([](double x) { return std::cos(3.0 * x); }),
                    Exponents{-0.5, 0.5});
    const Eigen::VectorXd x = make_grid(n);
    for (auto _ : state) {
        Eigen::VectorXd y = feval(f, x);
        benchmark::DoNotOptimize(y.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Singfun_Feval)->RangeMultiplier(8)->Range(64, 32768)->Unit(benchmark::kMicrosecond);

static void BM_Singfun_Cumsum(benchmark::State& state) {
    const Singfun f(smooth::Chebtech::make([](double x) { return std::exp(x) * std::sin(5.0 * x); }),
                    Exponents{-0.5, 0.0});
    for (auto _ : state) {
        Singfun F = cumsum(f);
        benchmark::DoNotOptimize(F);
    }
    state.counters["length"] = static_cast<double>(f.length());
}
BENCHMARK(BM_Singfun_Cumsum)->Unit(benchmark::kMicrosecond);

static void BM_GaussJacobi(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        auto rule = quadrature::gauss_jacobi(n, 0.5, -0.5);
        benchmark::DoNotOptimize(rule);
    }
}
BENCHMARK(BM_GaussJacobi)->RangeMultiplier(2)->Range(4, 256)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
