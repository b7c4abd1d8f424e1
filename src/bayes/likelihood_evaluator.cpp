/// @file src/bayes/likelihood_evaluator.cpp
/// @brief Penalized Gaussian log-likelihood over a hypothesis batch.

#include "thermo/bayes.hpp"
#include "thermo/constants.hpp"
#include "thermo/parallel.hpp"
#include "thermo/physics.hpp"

#include "../core/batch_checks.hpp"

#include <cmath>

namespace thermo::bayes {

// ─── LikelihoodEvaluator::log_likelihood ─────────────────────────────────────

double LikelihoodEvaluator::log_likelihood(double seebeck,
                                           double electrical_conductivity,
                                           double thermal_conductivity,
                                           double temperature,
                                           double zt_observed,
                                           double zt_uncertainty,
                                           double penalty_weight) noexcept {
    const double zt_model = physics::figure_of_merit(
        seebeck, electrical_conductivity, thermal_conductivity, temperature);

    const double residual = (zt_observed - zt_model) / zt_uncertainty;
    const double log_l = -0.5 * residual * residual
                         - std::log(zt_uncertainty)
                         - constants::HALF_LN_2PI;

    return log_l - physics::constraint_penalty(electrical_conductivity,
                                               thermal_conductivity,
                                               temperature,
                                               penalty_weight);
}

// ─── LikelihoodEvaluator::evaluate ───────────────────────────────────────────

Result<std::vector<double>>
LikelihoodEvaluator::evaluate(const TransportColumns& columns,
                              double penalty_weight,
                              ExecutionMode mode) {
    if (auto err = detail::check_columns(columns)) {
        return *err;
    }

    const std::size_t n = columns.seebeck.size();
    std::vector<double> out(n);

    parallel::for_each_index(mode, n, [&](std::size_t i) {
        out[i] = log_likelihood(columns.seebeck[i],
                                columns.electrical_conductivity[i],
                                columns.thermal_conductivity[i],
                                columns.temperature[i],
                                columns.zt_observed[i],
                                columns.zt_uncertainty[i],
                                penalty_weight);
    });

    return out;
}

} // namespace thermo::bayes
