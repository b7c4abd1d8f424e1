/// @file src/ranking/material_ranker.cpp
/// @brief Material rank aggregation over posterior slices.

#include "thermo/ranking.hpp"
#include "thermo/parallel.hpp"

#include "../core/batch_checks.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <limits>

namespace thermo::ranking {

namespace {

using ConstArrayMap = Eigen::Map<const Eigen::ArrayXd>;

ConstArrayMap as_array(std::span<const double> s) noexcept {
    return ConstArrayMap(s.data(), static_cast<Eigen::Index>(s.size()));
}

} // anonymous namespace

// ─── entropy ──────────────────────────────────────────────────────────────────

double MaterialRanker::entropy(std::span<const double> p) noexcept {
    constexpr double eps = std::numeric_limits<double>::epsilon();
    double h = 0.0;
    for (double p_i : p) {
        if (p_i > eps) {
            h -= p_i * std::log(p_i);
        }
    }
    return h;
}

// ─── rank_material ────────────────────────────────────────────────────────────

double MaterialRanker::rank_material(std::span<const double> posterior,
                                     std::span<const double> figure_of_merit,
                                     std::span<const double> citations,
                                     const RankingConfig& config) noexcept {
    if (posterior.empty()) {
        return 0.0;
    }

    const auto p  = as_array(posterior);
    const auto zt = as_array(figure_of_merit);
    const auto c  = as_array(citations);

    // Negative and NaN citation counts weigh as zero.
    const Eigen::ArrayXd c_pos = (c > 0.0).select(c, 0.0);
    const Eigen::ArrayXd w     = 1.0 + config.alpha * c_pos.log1p();

    const double sum_w   = w.sum();
    const double sum_wpz = (w * p * zt).sum();
    const double r = sum_w > std::numeric_limits<double>::epsilon()
                   ? sum_wpz / sum_w
                   : 0.0;

    return r - config.beta * entropy(posterior);
}

// ─── evaluate ─────────────────────────────────────────────────────────────────

Result<std::vector<double>>
MaterialRanker::evaluate(std::span<const double> posterior,
                         std::span<const double> figure_of_merit,
                         std::span<const double> citations,
                         std::span<const SubsetBounds> bounds,
                         const RankingConfig& config,
                         ExecutionMode mode) {
    if (auto err = detail::check_equal_lengths({posterior.size(),
                                                figure_of_merit.size(),
                                                citations.size()})) {
        return *err;
    }
    if (auto err = detail::check_bounds(bounds, posterior.size())) {
        return *err;
    }

    std::vector<double> ranks(bounds.size());
    parallel::for_each_index(mode, bounds.size(), [&](std::size_t i) {
        const auto& b = bounds[i];
        ranks[i] = rank_material(posterior.subspan(b.start, b.size()),
                                 figure_of_merit.subspan(b.start, b.size()),
                                 citations.subspan(b.start, b.size()),
                                 config);
    });

    return ranks;
}

} // namespace thermo::ranking
