/// @file src/bayes/posterior_normalizer.cpp
/// @brief Log-sum-exp posterior normalisation.

#include "thermo/bayes.hpp"
#include "thermo/parallel.hpp"

#include "../core/batch_checks.hpp"

#include <cmath>
#include <limits>

namespace thermo::bayes {

// ─── PosteriorNormalizer::normalize ──────────────────────────────────────────

Result<PosteriorResult>
PosteriorNormalizer::normalize(std::span<const double> log_likelihoods,
                               std::span<const double> prior,
                               ExecutionMode mode) {
    if (auto err = detail::check_equal_lengths({log_likelihoods.size(),
                                                prior.size()})) {
        return *err;
    }

    const std::size_t n = log_likelihoods.size();
    if (n == 0) {
        return PosteriorResult{};
    }

    // ── Step 1: unnormalised log-mass u_i = ℓ_i + ln prior_i ─────────────────
    std::vector<double> log_mass(n);
    parallel::for_each_index(mode, n, [&](std::size_t i) {
        log_mass[i] = log_likelihoods[i] + std::log(prior[i]);
    });

    // ── Step 2: shift by the batch maximum ───────────────────────────────────
    const double max_log_mass = parallel::reduce_max(mode, log_mass);
    if (std::isnan(max_log_mass) ||
        max_log_mass == -std::numeric_limits<double>::infinity()) {
        return Error::zero_probability_space();
    }

    const double shifted_sum = parallel::reduce_sum(mode, n, [&](std::size_t i) {
        return std::exp(log_mass[i] - max_log_mass);
    });
    const double log_sum_exp = max_log_mass + std::log(shifted_sum);
    if (!std::isfinite(log_sum_exp)) {
        return Error::numerical_instability();
    }

    // ── Step 3: ln p_i = u_i − LSE ───────────────────────────────────────────
    PosteriorResult result;
    result.probabilities.resize(n);
    result.log_posteriors.resize(n);

    parallel::for_each_index(mode, n, [&](std::size_t i) {
        const double log_post = log_mass[i] - log_sum_exp;
        result.log_posteriors[i] = log_post;
        result.probabilities[i]  = std::exp(log_post);
    });

    return result;
}

// ─── PosteriorNormalizer::evaluate ───────────────────────────────────────────

Result<PosteriorResult>
PosteriorNormalizer::evaluate(const ObservationBatch& batch, ExecutionMode mode) {
    const auto& c = batch.columns;
    if (auto err = detail::check_equal_lengths({
            c.seebeck.size(),
            c.electrical_conductivity.size(),
            c.thermal_conductivity.size(),
            c.temperature.size(),
            c.zt_observed.size(),
            c.zt_uncertainty.size(),
            batch.prior.size(),
        })) {
        return *err;
    }

    auto log_likelihoods =
        LikelihoodEvaluator::evaluate(c, batch.penalty_weight, mode);
    if (!log_likelihoods) {
        return log_likelihoods.error();
    }

    return normalize(*log_likelihoods, batch.prior, mode);
}

} // namespace thermo::bayes
