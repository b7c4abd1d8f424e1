/// @file src/information/histogram_entropy.cpp
/// @brief Per-subset histogram entropy and KL divergence from uniform.

#include "thermo/information_gain.hpp"
#include "thermo/parallel.hpp"

#include "../core/batch_checks.hpp"

#include <cmath>

namespace thermo::information {

// ─── Construction ─────────────────────────────────────────────────────────────

HistogramEntropyScorer::HistogramEntropyScorer(const HistogramConfig& config) noexcept
    : config_(config)
    , bin_width_((config.domain_max - config.domain_min)
                 / static_cast<double>(config.num_bins))
{}

Result<HistogramEntropyScorer> HistogramEntropyScorer::create(const HistogramConfig& config) {
    if (!config.is_valid()) {
        return Error::numerical_instability();
    }
    return HistogramEntropyScorer(config);
}

// ─── bin_index ────────────────────────────────────────────────────────────────

std::size_t HistogramEntropyScorer::bin_index(double x) const noexcept {
    const double raw  = std::floor((x - config_.domain_min) / bin_width_);
    const double last = static_cast<double>(config_.num_bins - 1);

    // !(raw >= 0) also catches NaN.
    if (!(raw >= 0.0)) return 0;
    if (raw >= last)   return config_.num_bins - 1;
    return static_cast<std::size_t>(raw);
}

// ─── score_subset ─────────────────────────────────────────────────────────────

GapScore HistogramEntropyScorer::score_subset(std::span<const double> samples) const {
    if (samples.empty()) {
        return GapScore{};
    }

    std::vector<std::size_t> counts(config_.num_bins, 0);
    for (double x : samples) {
        ++counts[bin_index(x)];
    }

    const double n       = static_cast<double>(samples.size());
    const double k       = static_cast<double>(config_.num_bins);
    double       entropy = 0.0;
    double       kl      = 0.0;

    for (std::size_t count : counts) {
        if (count == 0) continue;
        const double p = static_cast<double>(count) / n;
        entropy -= p * std::log(p);
        kl      += p * std::log(p * k);
    }

    return GapScore{
        .entropy       = entropy,
        .kl_divergence = kl,
        .total_score   = config_.entropy_weight * entropy
                       + config_.divergence_weight * kl,
    };
}

// ─── evaluate ─────────────────────────────────────────────────────────────────

Result<std::vector<GapScore>>
HistogramEntropyScorer::evaluate(std::span<const double> values,
                                 std::span<const SubsetBounds> bounds,
                                 const HistogramConfig& config,
                                 ExecutionMode mode) {
    auto scorer = create(config);
    if (!scorer) {
        return scorer.error();
    }
    if (auto err = detail::check_bounds(bounds, values.size())) {
        return *err;
    }

    std::vector<GapScore> scores(bounds.size());

    parallel::for_each_index(mode, bounds.size(), [&](std::size_t i) {
        const auto& b = bounds[i];
        scores[i] = scorer->score_subset(values.subspan(b.start, b.size()));
    });

    return scores;
}

} // namespace thermo::information
