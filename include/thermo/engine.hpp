#pragma once

/// @file include/thermo/engine.hpp
/// @brief Functional boundary of the Thermo evaluation core.
///
/// # Module: Engine
///
/// ## Responsibility
/// Expose the four batch operations behind one object that carries the
/// execution mode:
///
///   penalized_likelihood  transport columns, λ        → ℓ per hypothesis
///   posterior             ObservationBatch             → PosteriorResult
///   information_gain      values, bounds, histogram    → GapScore per subset
///   material_rank         p, zT, citations, bounds     → rank per material
///
/// ## Usage
/// ```cpp
/// Engine engine;
/// auto table = DataLoader::load_csv("measurements.csv");
/// if (table) {
///     auto post = engine.posterior(table->batch(1.0));
///     if (post) fmt::print("{}\n", post->probabilities[0]);
/// }
/// ```
///
/// ## Guarantees
/// - Stateless between calls: every operation is const
/// - Nothing throws; every failure is a typed `Error`
/// - With `verbose` set, each call reports its size, mode and worker count
///   to stderr, and failures are reported there too

#include "thermo/bayes.hpp"
#include "thermo/error.hpp"
#include "thermo/information_gain.hpp"
#include "thermo/ranking.hpp"
#include "thermo/types.hpp"

#include <span>
#include <vector>

namespace thermo::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

struct EngineConfig {
    /// Sequential or OpenMP fan-out.
    ExecutionMode mode = ExecutionMode::Parallel;

    /// If true, emit per-call diagnostics to stderr.
    bool verbose = false;
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    explicit Engine(EngineConfig config = EngineConfig{});

    /// Penalized Gaussian log-likelihood of every hypothesis.
    [[nodiscard]] Result<std::vector<double>>
    penalized_likelihood(const TransportColumns& columns,
                         double penalty_weight) const;

    /// Normalised posterior over the batch. All seven lengths are checked
    /// before anything is evaluated.
    [[nodiscard]] Result<PosteriorResult>
    posterior(const ObservationBatch& batch) const;

    /// Coverage score of every subset of `values`.
    [[nodiscard]] Result<std::vector<GapScore>>
    information_gain(std::span<const double> values,
                     std::span<const SubsetBounds> bounds,
                     const information::HistogramConfig& config) const;

    /// Citation-weighted, entropy-regularised rank of every material.
    [[nodiscard]] Result<std::vector<double>>
    material_rank(std::span<const double> posterior,
                  std::span<const double> figure_of_merit,
                  std::span<const double> citations,
                  std::span<const SubsetBounds> bounds,
                  const ranking::RankingConfig& config) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    void trace(const char* operation, std::size_t size) const;

    template <typename T>
    Result<T> report(const char* operation, Result<T> result) const;

    EngineConfig config_;
};

}  // namespace thermo::core
