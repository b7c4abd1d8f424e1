/// @file tests/physics/test_constraint_penalty.cpp
/// @brief Figure of merit, electronic thermal conductivity and the
///        Wiedemann–Franz penalty.

#include "thermo/constants.hpp"
#include "thermo/physics.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace thermo;
using namespace thermo::physics;

static constexpr double EPS = 1e-12;

// ════════════════════════════════════════════════════════════════════════════
// FigureOfMerit
// ════════════════════════════════════════════════════════════════════════════

TEST(FigureOfMerit, KnownValue) {
    // (2e-4)² · 1e5 · 300 / 1.5 = 0.8
    EXPECT_NEAR(figure_of_merit(2e-4, 1e5, 1.5, 300.0), 0.8, EPS);
}

TEST(FigureOfMerit, ScalesInverselyWithKappa) {
    const double a = figure_of_merit(2e-4, 1e5, 1.0, 300.0);
    const double b = figure_of_merit(2e-4, 1e5, 2.0, 300.0);
    EXPECT_NEAR(a, 2.0 * b, EPS);
}

TEST(FigureOfMerit, ZeroKappaIsInfinite) {
    EXPECT_TRUE(std::isinf(figure_of_merit(2e-4, 1e5, 0.0, 300.0)));
}

// ════════════════════════════════════════════════════════════════════════════
// ElectronicThermalConductivity
// ════════════════════════════════════════════════════════════════════════════

TEST(ElectronicThermalConductivity, SommerfeldDefault) {
    // 2.44e-8 · 1e5 · 300 = 0.732
    EXPECT_NEAR(electronic_thermal_conductivity(1e5, 300.0), 0.732, EPS);
}

TEST(ElectronicThermalConductivity, CustomLorenzNumber) {
    EXPECT_NEAR(electronic_thermal_conductivity(1e5, 300.0, 1e-8), 0.3, EPS);
}

// ════════════════════════════════════════════════════════════════════════════
// ConstraintPenalty
// ════════════════════════════════════════════════════════════════════════════

TEST(ConstraintPenalty, CompliantIsExactlyZero) {
    // κ = 1.5 > κₑ = 0.732
    EXPECT_EQ(constraint_penalty(1e5, 1.5, 300.0, 100.0), 0.0);
}

TEST(ConstraintPenalty, BoundaryIsZero) {
    const double kappa_e = electronic_thermal_conductivity(1e5, 300.0);
    EXPECT_EQ(constraint_penalty(1e5, kappa_e, 300.0, 100.0), 0.0);
}

TEST(ConstraintPenalty, ViolationIsQuadratic) {
    // κₑ − κ = 0.732 − 0.5 = 0.232, Φ = 2 · 0.232²
    EXPECT_NEAR(constraint_penalty(1e5, 0.5, 300.0, 2.0), 2.0 * 0.232 * 0.232, EPS);
}

TEST(ConstraintPenalty, ZeroWeightDisablesPenalty) {
    EXPECT_EQ(constraint_penalty(1e5, 0.0, 300.0, 0.0), 0.0);
}

TEST(ConstraintPenalty, LinearInWeight) {
    const double one = constraint_penalty(1e5, 0.1, 300.0, 1.0);
    const double ten = constraint_penalty(1e5, 0.1, 300.0, 10.0);
    EXPECT_GT(one, 0.0);
    EXPECT_NEAR(ten, 10.0 * one, EPS);
}

TEST(ConstraintPenalty, GrowsAsKappaFalls) {
    double prev = 0.0;
    for (double kappa : {0.7, 0.5, 0.3, 0.1, 0.0}) {
        const double phi = constraint_penalty(1e5, kappa, 300.0, 1.0);
        EXPECT_GT(phi, prev) << "kappa=" << kappa;
        prev = phi;
    }
}

TEST(ConstraintPenalty, FiniteAndNonNegativeForFiniteInputs) {
    for (double sigma : {0.0, 1.0, 1e3, 1e6}) {
        for (double kappa : {0.0, 0.01, 1.0, 100.0}) {
            for (double t : {1.0, 300.0, 2000.0}) {
                const double phi = constraint_penalty(sigma, kappa, t, 5.0);
                EXPECT_TRUE(std::isfinite(phi));
                EXPECT_GE(phi, 0.0);
            }
        }
    }
}
