/**
 * @file  bench/bench_posterior.cpp
 * @brief Google Benchmark suite for the Thermo batch evaluators.
 *
 * Benchmarks
 * ----------
 *   BM_Likelihood_Deterministic / Parallel
 *   BM_Posterior_Deterministic / Parallel    - likelihood + log-sum-exp
 *   BM_InformationGain_Deterministic / Parallel
 *   BM_MaterialRank_Parallel
 *
 * Build (CMake):
 *   cmake -DTHERMO_BUILD_BENCH=ON ..
 *   cmake --build build --target bench_posterior
 *   ./build/bench_posterior --benchmark_format=json
 *
 * Throughput units: items/second (hypotheses or samples processed).
 * Custom counter "Mhyp_per_sec" = throughput / 1e6.
 */

#include "benchmark/benchmark.h"

#include "thermo/bayes.hpp"
#include "thermo/information_gain.hpp"
#include "thermo/ranking.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

namespace {

/// N synthetic hypotheses with spread-out transport coefficients.
struct SyntheticBatch {
    std::vector<double> s, sigma, kappa, t, zt, unc, prior;

    explicit SyntheticBatch(std::size_t n)
        : s(n), sigma(n), kappa(n), t(n), zt(n), unc(n), prior(n, 1.0) {
        for (std::size_t i = 0; i < n; ++i) {
            const double f = static_cast<double>(i % 1000) / 1000.0;
            s[i]     = 5e-5 + 2.5e-4 * f;
            sigma[i] = 1e4 + 1e5 * f;
            kappa[i] = 0.3 + 2.0 * (1.0 - f);
            t[i]     = 300.0 + 900.0 * f;
            zt[i]    = 0.2 + 1.5 * f;
            unc[i]   = 0.05 + 0.1 * f;
        }
    }

    thermo::ObservationBatch view(double lambda) const {
        return thermo::ObservationBatch{
            .columns = thermo::TransportColumns{
                .seebeck                 = s,
                .electrical_conductivity = sigma,
                .thermal_conductivity    = kappa,
                .temperature             = t,
                .zt_observed             = zt,
                .zt_uncertainty          = unc,
            },
            .prior          = prior,
            .penalty_weight = lambda,
        };
    }
};

void set_throughput(benchmark::State& state, std::size_t n) {
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
    state.counters["Mhyp_per_sec"] = benchmark::Counter(
        static_cast<double>(state.iterations()) * static_cast<double>(n) / 1e6,
        benchmark::Counter::kIsRate);
}

} // anonymous namespace

// ── Likelihood ─────────────────────────────────────────────────────────────────

static void BM_Likelihood(benchmark::State& state, thermo::ExecutionMode mode) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const SyntheticBatch batch(n);
    const auto view = batch.view(1.0);
    for (auto _ : state) {
        auto r = thermo::bayes::LikelihoodEvaluator::evaluate(view.columns, 1.0, mode);
        benchmark::DoNotOptimize(r);
    }
    set_throughput(state, n);
}
BENCHMARK_CAPTURE(BM_Likelihood, Deterministic, thermo::ExecutionMode::Deterministic)
    ->RangeMultiplier(8)->Range(1 << 10, 1 << 22)->Unit(benchmark::kMicrosecond);
BENCHMARK_CAPTURE(BM_Likelihood, Parallel, thermo::ExecutionMode::Parallel)
    ->RangeMultiplier(8)->Range(1 << 10, 1 << 22)->Unit(benchmark::kMicrosecond);

// ── Posterior ──────────────────────────────────────────────────────────────────

static void BM_Posterior(benchmark::State& state, thermo::ExecutionMode mode) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const SyntheticBatch batch(n);
    const auto view = batch.view(1.0);
    for (auto _ : state) {
        auto r = thermo::bayes::PosteriorNormalizer::evaluate(view, mode);
        benchmark::DoNotOptimize(r);
    }
    set_throughput(state, n);
}
BENCHMARK_CAPTURE(BM_Posterior, Deterministic, thermo::ExecutionMode::Deterministic)
    ->RangeMultiplier(8)->Range(1 << 10, 1 << 22)->Unit(benchmark::kMicrosecond);
BENCHMARK_CAPTURE(BM_Posterior, Parallel, thermo::ExecutionMode::Parallel)
    ->RangeMultiplier(8)->Range(1 << 10, 1 << 22)->Unit(benchmark::kMicrosecond);

// ── Information gain ───────────────────────────────────────────────────────────

static void BM_InformationGain(benchmark::State& state, thermo::ExecutionMode mode) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    constexpr std::size_t SUBSET = 64;

    std::vector<double> values(n);
    for (std::size_t i = 0; i < n; ++i) {
        values[i] = 100.0 + static_cast<double>((i * 7919) % 1900);
    }
    std::vector<thermo::SubsetBounds> bounds;
    for (std::size_t start = 0; start < n; start += SUBSET) {
        bounds.push_back({start, std::min(start + SUBSET, n)});
    }

    const thermo::information::HistogramConfig cfg{};
    for (auto _ : state) {
        auto r = thermo::information::HistogramEntropyScorer::evaluate(values, bounds, cfg, mode);
        benchmark::DoNotOptimize(r);
    }
    set_throughput(state, n);
}
BENCHMARK_CAPTURE(BM_InformationGain, Deterministic, thermo::ExecutionMode::Deterministic)
    ->RangeMultiplier(8)->Range(1 << 10, 1 << 22)->Unit(benchmark::kMicrosecond);
BENCHMARK_CAPTURE(BM_InformationGain, Parallel, thermo::ExecutionMode::Parallel)
    ->RangeMultiplier(8)->Range(1 << 10, 1 << 22)->Unit(benchmark::kMicrosecond);

// ── Material rank ──────────────────────────────────────────────────────────────

static void BM_MaterialRank_Parallel(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    constexpr std::size_t PER_MATERIAL = 16;

    const std::vector<double> p(n, 1.0 / static_cast<double>(n));
    const std::vector<double> zt(n, 1.0);
    std::vector<double> c(n);
    for (std::size_t i = 0; i < n; ++i) c[i] = static_cast<double>(i % 200);

    std::vector<thermo::SubsetBounds> bounds;
    for (std::size_t start = 0; start < n; start += PER_MATERIAL) {
        bounds.push_back({start, std::min(start + PER_MATERIAL, n)});
    }

    const thermo::ranking::RankingConfig cfg{};
    for (auto _ : state) {
        auto r = thermo::ranking::MaterialRanker::evaluate(p, zt, c, bounds, cfg);
        benchmark::DoNotOptimize(r);
    }
    set_throughput(state, n);
}
BENCHMARK(BM_MaterialRank_Parallel)->RangeMultiplier(8)->Range(1 << 10, 1 << 20)
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
