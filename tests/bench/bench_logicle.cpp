#include <benchmark/benchmark.h>
#include <cmath>
#include <facsforge/transform.hpp>
#include <random>
#include <vector>

using namespace facsforge;

// --- Helpers ---

static const LogicleParams kParams{262144.0, 0.5, 4.5, 0.0};

// Compensated fluorescence: mostly positive, with a negative shoulder.
static std::vector<double> make_fluorescence(std::size_t n)
{
    std::mt19937 rng(42);
    std::lognormal_distribution<double> bright(7.0, 1.5);
    std::normal_distribution<double> dim(0.0, 150.0);
    std::vector<double> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = (i % 4 == 0) ? dim(rng) : bright(rng);
    return v;
}

// --- Parameter solve ---

static void BM_Logicle_Solve(benchmark::State& state)
{
    for (auto _ : state)
    {
        auto coef = solve_logicle(kParams);
        benchmark::DoNotOptimize(coef);
    }
}
BENCHMARK(BM_Logicle_Solve);

static void BM_Logicle_Solve_WideNegative(benchmark::State& state)
{
    const LogicleParams p{262144.0, 1.5, 4.5, 1.0};
    for (auto _ : state)
    {
        auto coef = solve_logicle(p);
        benchmark::DoNotOptimize(coef);
    }
}
BENCHMARK(BM_Logicle_Solve_WideNegative);

// --- Forward / inverse ---

static void BM_Logicle_ToDisplay(benchmark::State& state)
{
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto raw = make_fluorescence(n);
    const LogicleTransform lg(kParams);
    std::vector<double> out(n);
    for (auto _ : state)
    {
        for (std::size_t i = 0; i < n; ++i)
            out[i] = lg.to_display(raw[i]);
        benchmark::DoNotOptimize(out.data());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}
BENCHMARK(BM_Logicle_ToDisplay)->RangeMultiplier(10)->Range(1'000, 1'000'000);

static void BM_Logicle_ToRaw(benchmark::State& state)
{
    const std::size_t n = 100'000;
    const LogicleTransform lg(kParams);
    std::vector<double> display(n), out(n);
    for (std::size_t i = 0; i < n; ++i)
        display[i] = static_cast<double>(i) / static_cast<double>(n);
    for (auto _ : state)
    {
        for (std::size_t i = 0; i < n; ++i)
            out[i] = lg.to_raw(display[i]);
        benchmark::DoNotOptimize(out.data());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}
BENCHMARK(BM_Logicle_ToRaw);

// Values near zero take the Taylor path.
static void BM_Logicle_ToDisplay_NearZero(benchmark::State& state)
{
    const std::size_t n = 100'000;
    const LogicleTransform lg(kParams);
    std::vector<double> raw(n), out(n);
    for (std::size_t i = 0; i < n; ++i)
        raw[i] = std::sin(static_cast<double>(i) * 0.01) * 5.0;
    for (auto _ : state)
    {
        for (std::size_t i = 0; i < n; ++i)
            out[i] = lg.to_display(raw[i]);
        benchmark::DoNotOptimize(out.data());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}
BENCHMARK(BM_Logicle_ToDisplay_NearZero);
