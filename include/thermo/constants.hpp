#pragma once

#include <cstddef>

/// @file include/thermo/constants.hpp
/// @brief Physical constants, numerical tolerances and configuration defaults
///        for the Thermo evaluation core.

namespace thermo::constants {

// ─── Wiedemann–Franz ──────────────────────────────────────────────────────────

/// Sommerfeld value of the Lorenz number (free-electron approximation).
/// Units: W·Ω·K⁻².
static constexpr double L0_SOMMERFELD = 2.44e-8;

// ─── Gaussian Likelihood ──────────────────────────────────────────────────────

/// 0.5 · ln(2π), the normalising term of the Gaussian log-density.
static constexpr double HALF_LN_2PI = 0.91893853320467274178;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Base tolerance on Σ posterior = 1. Scaled by √N for parallel reductions.
static constexpr double NORMALIZATION_TOLERANCE = 1e-12;

// ─── Defaults ─────────────────────────────────────────────────────────────────

/// Default Wiedemann–Franz penalty weight λ.
static constexpr double DEFAULT_PENALTY_WEIGHT = 1.0;

/// Default histogram bin count for temperature-coverage scoring.
static constexpr std::size_t DEFAULT_NUM_BINS = 10;

/// Largest accepted histogram bin count.
static constexpr std::size_t MAX_NUM_BINS = std::size_t{1} << 20;

/// Default temperature domain [min, max) in kelvin.
static constexpr double DEFAULT_DOMAIN_MIN = 100.0;
static constexpr double DEFAULT_DOMAIN_MAX = 2000.0;

/// Default weights of the gap score: total = γ₁·H + γ₂·D_KL.
static constexpr double DEFAULT_ENTROPY_WEIGHT    = 1.0;
static constexpr double DEFAULT_DIVERGENCE_WEIGHT = 1.0;

/// Default ranking weights: citation log-weight α, entropy regulariser β.
static constexpr double DEFAULT_CITATION_WEIGHT = 1.0;
static constexpr double DEFAULT_ENTROPY_PENALTY = 0.1;

} // namespace thermo::constants
