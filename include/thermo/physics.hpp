#pragma once

/// @file include/thermo/physics.hpp
/// @brief Thermoelectric transport relations and the Wiedemann–Franz
///        constraint penalty.
///
/// # Module: Physics
///
/// ## Formulas
///   zT  = S² σ T / κ                       (figure of merit)
///   κₑ  = L σ T                            (electronic thermal conductivity)
///   Φ   = λ · max(0, κₑ − κ)²   with L = L₀ (Wiedemann–Franz penalty)
///
/// A material whose total thermal conductivity κ is below its electronic
/// contribution κₑ violates the Wiedemann–Franz lower bound; Φ measures how
/// badly.
///
/// ## Guarantees
/// - Pure, branch-light scalar functions, safe to call from any thread
/// - No input validation: κ = 0 yields an infinite zT, which propagates
/// - `constraint_penalty` is finite and ≥ 0 for finite inputs and λ ≥ 0,
///   and exactly 0 when κ ≥ κₑ

#include "thermo/constants.hpp"

namespace thermo::physics {

/// Dimensionless figure of merit S²σT/κ.
[[nodiscard]] double figure_of_merit(double seebeck,
                                     double electrical_conductivity,
                                     double thermal_conductivity,
                                     double temperature) noexcept;

/// Electronic contribution to thermal conductivity κₑ = L·σ·T.
[[nodiscard]] double electronic_thermal_conductivity(
        double electrical_conductivity,
        double temperature,
        double lorenz_number = constants::L0_SOMMERFELD) noexcept;

/// Quadratic Wiedemann–Franz violation penalty λ·max(0, L₀σT − κ)².
[[nodiscard]] double constraint_penalty(double electrical_conductivity,
                                        double thermal_conductivity,
                                        double temperature,
                                        double penalty_weight) noexcept;

} // namespace thermo::physics
