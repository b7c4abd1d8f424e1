#pragma once

/// @file include/thermo/information_gain.hpp
/// @brief Histogram entropy and divergence-from-uniform coverage scoring.
///
/// # Module: Information Gain
///
/// ## Responsibility
/// Score how evenly each measurement subset covers a bounded domain
/// [min, max) split into K equal-width bins:
///
///   δ     = (max − min) / K
///   k(x)  = clamp(⌊(x − min)/δ⌋, 0, K − 1)
///   p_k   = count_k / N
///   H     = −Σ_{p_k > 0} p_k ln p_k
///   D_KL  = Σ_{p_k > 0} p_k ln(p_k · K)
///   total = γ₁·H + γ₂·D_KL
///
/// Bins with p_k = 0 are skipped outright: that is the exact value of the
/// 0·ln 0 limit, not an approximation of it.
///
/// ## Guarantees
/// - Out-of-domain samples are pinned to the nearest terminal bin, so the
///   bin counts always sum to N
/// - NaN samples land in bin 0
/// - Empty subsets score {0, 0, 0}
/// - A point mass scores H = 0 and D_KL = ln K
/// - Per-subset scoring is total: once the preconditions pass nothing fails
///
/// ## NOT Responsible For
/// - Outlier exclusion (every sample is counted)

#include "thermo/constants.hpp"
#include "thermo/error.hpp"
#include "thermo/types.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace thermo::information {

/// Binning domain and score weights.
struct HistogramConfig {
    double      domain_min        = constants::DEFAULT_DOMAIN_MIN;
    double      domain_max        = constants::DEFAULT_DOMAIN_MAX;
    std::size_t num_bins          = constants::DEFAULT_NUM_BINS;
    double      entropy_weight    = constants::DEFAULT_ENTROPY_WEIGHT;    ///< γ₁
    double      divergence_weight = constants::DEFAULT_DIVERGENCE_WEIGHT; ///< γ₂

    /// 0 < K ≤ MAX_NUM_BINS and max > min (false for NaN bounds as well).
    [[nodiscard]] bool is_valid() const noexcept {
        return num_bins > 0 && num_bins <= constants::MAX_NUM_BINS
            && domain_max > domain_min;
    }
};

// ─── HistogramEntropyScorer ───────────────────────────────────────────────────

class HistogramEntropyScorer {
public:
    /// Build a scorer for `config`.
    ///
    /// # Errors
    /// - NumericalInstability if `config.is_valid()` is false
    [[nodiscard]] static Result<HistogramEntropyScorer> create(const HistogramConfig& config);

    /// Score one subset.
    [[nodiscard]] GapScore score_subset(std::span<const double> samples) const;

    /// Bin index of a single sample, clamped into [0, K − 1].
    [[nodiscard]] std::size_t bin_index(double x) const noexcept;

    [[nodiscard]] const HistogramConfig& config() const noexcept { return config_; }

    /// Score every subset of `values`, output index-aligned with `bounds`.
    ///
    /// # Errors
    /// - NumericalInstability if K = 0, K > MAX_NUM_BINS or max ≤ min
    ///   (checked first)
    /// - DimensionMismatch(end, len values) for the first bound with
    ///   start > end or end > len
    [[nodiscard]] static Result<std::vector<GapScore>>
    evaluate(std::span<const double> values,
             std::span<const SubsetBounds> bounds,
             const HistogramConfig& config,
             ExecutionMode mode = ExecutionMode::Parallel);

private:
    explicit HistogramEntropyScorer(const HistogramConfig& config) noexcept;

    HistogramConfig config_;
    double          bin_width_;
};

} // namespace thermo::information
