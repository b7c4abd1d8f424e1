#pragma once

/// @file include/thermo/types.hpp
/// @brief Shared value types for the Thermo evaluation core.
///
/// Every type here is transient: built per call, read-only once built, and
/// discarded when the call returns. Batch inputs are `std::span` views over
/// caller-owned memory so that subsets of one flat array are never copied.

#include <cstddef>
#include <span>
#include <vector>

namespace thermo {

// ─── Execution Mode ───────────────────────────────────────────────────────────

/// How a batch operation is scheduled.
///
/// - Deterministic: sequential, fixed reduction order, bit-reproducible.
/// - Parallel:      OpenMP fan-out over the hardware thread team; reduction
///                  order is unspecified, so sums may differ from the
///                  deterministic result within 1e-12·√N.
enum class ExecutionMode {
    Deterministic,
    Parallel,
};

// ─── Observation Inputs ───────────────────────────────────────────────────────

/// The six per-hypothesis transport columns consumed by the likelihood.
/// All spans must have equal length.
struct TransportColumns {
    std::span<const double> seebeck;                 ///< S [V/K]
    std::span<const double> electrical_conductivity; ///< σ [S/m]
    std::span<const double> thermal_conductivity;    ///< κ [W/(m·K)]
    std::span<const double> temperature;             ///< T [K]
    std::span<const double> zt_observed;             ///< observed zT
    std::span<const double> zt_uncertainty;          ///< 1σ uncertainty of zT
};

/// A complete posterior batch: transport columns, priors and the
/// Wiedemann–Franz penalty weight λ ≥ 0.
struct ObservationBatch {
    TransportColumns        columns;
    std::span<const double> prior;
    double                  penalty_weight = 0.0;

    /// Number of hypotheses (length of the Seebeck column).
    [[nodiscard]] std::size_t size() const noexcept {
        return columns.seebeck.size();
    }
};

// ─── Outputs ──────────────────────────────────────────────────────────────────

/// Normalised posterior, index-aligned with the input batch.
struct PosteriorResult {
    std::vector<double> probabilities;  ///< exp(log_posteriors[i]), Σ = 1
    std::vector<double> log_posteriors; ///< u[i] − LSE(u)
};

/// Half-open index range [start, end) into one shared flat array.
struct SubsetBounds {
    std::size_t start;
    std::size_t end;

    [[nodiscard]] std::size_t size() const noexcept { return end - start; }
    [[nodiscard]] bool empty() const noexcept { return start == end; }
};

/// Coverage score of one measurement subset.
struct GapScore {
    double entropy       = 0.0; ///< Shannon entropy H ≥ 0
    double kl_divergence = 0.0; ///< D_KL(P ‖ Uniform) ≥ 0
    double total_score   = 0.0; ///< γ₁·H + γ₂·D_KL

    bool operator==(const GapScore&) const = default;
};

} // namespace thermo
