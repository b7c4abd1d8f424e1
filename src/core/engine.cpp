/// @file src/core/engine.cpp
/// @brief Functional boundary: mode dispatch and verbose diagnostics.

#include "thermo/engine.hpp"
#include "thermo/parallel.hpp"

#include <fmt/format.h>

#include <utility>

namespace thermo::core {

namespace {

const char* mode_name(ExecutionMode mode) noexcept {
    return mode == ExecutionMode::Deterministic ? "deterministic" : "parallel";
}

} // anonymous namespace

// ─── Engine constructor ───────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(config)
{}

// ─── Diagnostics ──────────────────────────────────────────────────────────────

void Engine::trace(const char* operation, std::size_t size) const {
    if (!config_.verbose) return;
    fmt::print(stderr, "[thermo] {}: n={} mode={} workers={}\n",
               operation, size, mode_name(config_.mode),
               parallel::worker_count(config_.mode));
}

template <typename T>
Result<T> Engine::report(const char* operation, Result<T> result) const {
    if (config_.verbose && !result) {
        fmt::print(stderr, "[thermo] {} failed: {}\n",
                   operation, result.error().to_string());
    }
    return result;
}

// ─── Engine::penalized_likelihood ─────────────────────────────────────────────

Result<std::vector<double>>
Engine::penalized_likelihood(const TransportColumns& columns,
                             double penalty_weight) const {
    trace("penalized_likelihood", columns.seebeck.size());
    return report("penalized_likelihood",
                  bayes::LikelihoodEvaluator::evaluate(columns, penalty_weight,
                                                       config_.mode));
}

// ─── Engine::posterior ────────────────────────────────────────────────────────

Result<PosteriorResult>
Engine::posterior(const ObservationBatch& batch) const {
    trace("posterior", batch.size());
    return report("posterior",
                  bayes::PosteriorNormalizer::evaluate(batch, config_.mode));
}

// ─── Engine::information_gain ─────────────────────────────────────────────────

Result<std::vector<GapScore>>
Engine::information_gain(std::span<const double> values,
                         std::span<const SubsetBounds> bounds,
                         const information::HistogramConfig& config) const {
    trace("information_gain", bounds.size());
    return report("information_gain",
                  information::HistogramEntropyScorer::evaluate(
                      values, bounds, config, config_.mode));
}

// ─── Engine::material_rank ────────────────────────────────────────────────────

Result<std::vector<double>>
Engine::material_rank(std::span<const double> posterior,
                      std::span<const double> figure_of_merit,
                      std::span<const double> citations,
                      std::span<const SubsetBounds> bounds,
                      const ranking::RankingConfig& config) const {
    trace("material_rank", bounds.size());
    return report("material_rank",
                  ranking::MaterialRanker::evaluate(posterior, figure_of_merit,
                                                    citations, bounds, config,
                                                    config_.mode));
}

}  // namespace thermo::core
