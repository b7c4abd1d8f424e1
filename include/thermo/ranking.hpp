#pragma once

/// @file include/thermo/ranking.hpp
/// @brief Citation-weighted, entropy-regularised material ranking.
///
/// # Module: Ranking
///
/// ## Responsibility
/// Collapse each material's slice of (posterior p, figure of merit zT,
/// citation count c) into one scalar:
///
///   w_i  = 1 + α·ln(1 + c_i⁺),  c_i⁺ = c_i if c_i > 0, else 0
///   R    = Σ w_i p_i zT_i / Σ w_i          (0 when Σ w_i ≤ ε)
///   H    = −Σ_{p_i > ε} p_i ln p_i
///   rank = R − β·H
///
/// Materials are the same [start, end) partitions used by the information
/// gain scorer.
///
/// ## Guarantees
/// - Empty partitions rank 0
/// - Negative and NaN citation counts are treated as 0
/// - Output index-aligned with the bounds; failure is all-or-nothing

#include "thermo/constants.hpp"
#include "thermo/error.hpp"
#include "thermo/types.hpp"

#include <span>
#include <vector>

namespace thermo::ranking {

struct RankingConfig {
    double alpha = constants::DEFAULT_CITATION_WEIGHT; ///< citation log-weight
    double beta  = constants::DEFAULT_ENTROPY_PENALTY; ///< entropy regulariser
};

class MaterialRanker {
public:
    /// Shannon entropy of a slice, skipping p ≤ DBL_EPSILON.
    [[nodiscard]] static double entropy(std::span<const double> p) noexcept;

    /// Rank of one material slice. All three spans must be equal length.
    [[nodiscard]] static double rank_material(std::span<const double> posterior,
                                              std::span<const double> figure_of_merit,
                                              std::span<const double> citations,
                                              const RankingConfig& config) noexcept;

    /// Rank every partition.
    ///
    /// # Errors
    /// - DimensionMismatch(len p, offending len) if zT or c differ from p
    /// - DimensionMismatch(end, len p) for the first out-of-range bound
    [[nodiscard]] static Result<std::vector<double>>
    evaluate(std::span<const double> posterior,
             std::span<const double> figure_of_merit,
             std::span<const double> citations,
             std::span<const SubsetBounds> bounds,
             const RankingConfig& config,
             ExecutionMode mode = ExecutionMode::Parallel);
};

} // namespace thermo::ranking
