#pragma once

/// @file include/thermo/bayes.hpp
/// @brief Penalized Gaussian likelihood and log-sum-exp posterior
///        normalization over a batch of thermoelectric hypotheses.
///
/// # Module: Bayesian Credibility
///
/// ## Responsibility
/// Turn a batch of transport hypotheses (S, σ, κ, T) with observed zT values
/// into a normalised posterior over the batch:
///
///   1. LikelihoodEvaluator - per index, independent of every other index:
///        zT_i   = S_i² σ_i T_i / κ_i
///        ℓ_i    = −½((zT_obs,i − zT_i)/σ_zT,i)² − ln σ_zT,i − ½ ln 2π
///                 − λ·max(0, L₀σ_iT_i − κ_i)²
///   2. PosteriorNormalizer - log-sum-exp normalisation:
///        u_i    = ℓ_i + ln prior_i
///        M      = max_i u_i
///        LSE    = M + ln Σ exp(u_i − M)
///        ln p_i = u_i − LSE,   p_i = exp(ln p_i)
///
/// ## Why Log-Sum-Exp
/// Log-likelihoods around −5000 underflow `exp` to exactly 0.0. Shifting by
/// the batch maximum keeps the largest term at exp(0) = 1, so the sum is in
/// [1, N] and its logarithm is always finite.
///
/// ## Failure Modes (all-or-nothing)
///   - DimensionMismatch    - any input length disagrees (checked first)
///   - ZeroProbabilitySpace - M is −∞ or NaN (no hypothesis has mass)
///   - NumericalInstability - LSE is not finite
///
/// ## Guarantees
/// - N = 0 returns two empty vectors, no error
/// - Σ p_i = 1 within 1e-12·√N; for N = 1, p_0 = 1 exactly
/// - Strict ordering of u_i is preserved in ln p_i
/// - No positivity validation of κ, σ, T or the priors: non-physical inputs
///   surface as −∞/NaN mass and are caught by the normaliser checks
///
/// ## NOT Responsible For
/// - Physical-bounds gating or unit conversion (upstream collaborators)

#include "thermo/error.hpp"
#include "thermo/types.hpp"

#include <span>
#include <vector>

namespace thermo::bayes {

// ─── LikelihoodEvaluator ──────────────────────────────────────────────────────

class LikelihoodEvaluator {
public:
    /// Penalized Gaussian log-likelihood of a single hypothesis.
    [[nodiscard]] static double
    log_likelihood(double seebeck,
                   double electrical_conductivity,
                   double thermal_conductivity,
                   double temperature,
                   double zt_observed,
                   double zt_uncertainty,
                   double penalty_weight) noexcept;

    /// Penalized log-likelihood for every index of the batch.
    ///
    /// # Errors
    /// DimensionMismatch(len S, offending len) if the six columns differ.
    [[nodiscard]] static Result<std::vector<double>>
    evaluate(const TransportColumns& columns,
             double penalty_weight,
             ExecutionMode mode = ExecutionMode::Parallel);
};

// ─── PosteriorNormalizer ──────────────────────────────────────────────────────

class PosteriorNormalizer {
public:
    /// Normalise log-likelihoods against priors with log-sum-exp.
    ///
    /// # Errors
    /// - DimensionMismatch if the two spans differ in length
    /// - ZeroProbabilitySpace if every u_i is −∞ or NaN
    /// - NumericalInstability if the LSE denominator is not finite
    [[nodiscard]] static Result<PosteriorResult>
    normalize(std::span<const double> log_likelihoods,
              std::span<const double> prior,
              ExecutionMode mode = ExecutionMode::Parallel);

    /// Full pipeline: length check on all seven columns, then
    /// LikelihoodEvaluator::evaluate, then normalize.
    [[nodiscard]] static Result<PosteriorResult>
    evaluate(const ObservationBatch& batch,
             ExecutionMode mode = ExecutionMode::Parallel);
};

} // namespace thermo::bayes
