/// @file src/physics/constraint_penalty.cpp
/// @brief Figure of merit and Wiedemann–Franz penalty.

#include "thermo/physics.hpp"

namespace thermo::physics {

double figure_of_merit(double seebeck,
                       double electrical_conductivity,
                       double thermal_conductivity,
                       double temperature) noexcept {
    return (seebeck * seebeck * electrical_conductivity * temperature)
           / thermal_conductivity;
}

double electronic_thermal_conductivity(double electrical_conductivity,
                                       double temperature,
                                       double lorenz_number) noexcept {
    return lorenz_number * electrical_conductivity * temperature;
}

double constraint_penalty(double electrical_conductivity,
                          double thermal_conductivity,
                          double temperature,
                          double penalty_weight) noexcept {
    const double kappa_e =
        electronic_thermal_conductivity(electrical_conductivity, temperature);
    const double diff = kappa_e - thermal_conductivity;

    // Penalise only when κ falls below the electronic lower bound.
    const double violation = diff > 0.0 ? diff : 0.0;
    return penalty_weight * violation * violation;
}

} // namespace thermo::physics
