/**
 * @file  prop_entropy_bounds.cpp
 * @brief Property: ∀ samples x and K ≥ 1 bins,
 *        0 ≤ H ≤ ln K,  D_KL ≥ 0,  H + D_KL = ln K.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_entropy_bounds
 *
 * Mathematical basis:
 *   D_KL(P ‖ U) = Σ p_k ln(p_k K) = ln K − H(P)
 *
 * Samples are drawn from a range wider than the domain so that the clamped
 * terminal bins are exercised on most runs.
 */

#include <rapidcheck.h>
#include <cmath>
#include <vector>

#include "thermo/information_gain.hpp"

using namespace thermo;
using namespace thermo::information;

int main() {
    bool ok = true;

    // ── Property 1: entropy/divergence bounds and identity ───────────────────
    ok = rc::check(
        "entropy: 0 <= H <= ln K, D_KL >= 0, H + D_KL == ln K",
        []() {
            const auto k = static_cast<std::size_t>(*rc::gen::inRange(1, 64));
            const auto raw = *rc::gen::nonEmpty(
                rc::gen::container<std::vector<int>>(rc::gen::inRange(-500, 2500)));
            std::vector<double> x(raw.begin(), raw.end());

            const auto scorer = HistogramEntropyScorer::create(HistogramConfig{
                .domain_min = 100.0,
                .domain_max = 2000.0,
                .num_bins   = k,
            });
            RC_ASSERT(scorer.has_value());
            const auto s = scorer->score_subset(x);
            const double ln_k = std::log(static_cast<double>(k));

            RC_ASSERT(s.entropy >= 0.0);
            RC_ASSERT(s.entropy <= ln_k + 1e-12);
            RC_ASSERT(s.kl_divergence >= -1e-12);
            RC_ASSERT(std::abs(s.entropy + s.kl_divergence - ln_k) < 1e-12);
        }
    ) && ok;

    // ── Property 2: every sample lands in a bin ──────────────────────────────
    ok = rc::check(
        "entropy: bin_index is always within [0, K)",
        [](double x) {
            const auto k = static_cast<std::size_t>(*rc::gen::inRange(1, 64));
            const auto scorer = HistogramEntropyScorer::create(HistogramConfig{
                .domain_min = -10.0,
                .domain_max = 10.0,
                .num_bins   = k,
            });
            RC_ASSERT(scorer.has_value());
            RC_ASSERT(scorer->bin_index(x) < k);
        }
    ) && ok;

    // ── Property 3: subset order does not change the score ───────────────────
    ok = rc::check(
        "entropy: score is invariant under permutation of the subset",
        []() {
            const auto raw = *rc::gen::container<std::vector<int>>(
                rc::gen::inRange(0, 2100));
            std::vector<double> x(raw.begin(), raw.end());
            std::vector<double> reversed(x.rbegin(), x.rend());

            const auto scorer = HistogramEntropyScorer::create(HistogramConfig{});
            RC_ASSERT(scorer.has_value());
            RC_ASSERT(scorer->score_subset(x) == scorer->score_subset(reversed));
        }
    ) && ok;

    return ok ? 0 : 1;
}
