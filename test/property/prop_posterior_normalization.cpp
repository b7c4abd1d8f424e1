/**
 * @file  prop_posterior_normalization.cpp
 * @brief Property: ∀ finite log-likelihoods ℓ and positive priors π,
 *        Σ posterior = 1 to 1e-12·√N and ordering of ℓ + ln π is kept.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_posterior_normalization
 *
 * Mathematical basis:
 *   ln p_i = u_i − LSE(u),  u_i = ℓ_i + ln π_i
 *   Σ exp(ln p_i) = Σ exp(u_i) / Σ exp(u_j) = 1
 *
 * ℓ is drawn from [−10⁴, 0] so most inputs underflow a naive exp; a failure
 * here means the max-shift was lost somewhere in the reduction. At that
 * spread exp(u_i − LSE) may round to 0, so property 1 only asks p ≥ 0.
 * Property 2 keeps the spread of u under 700 (exp(−700) is still a normal
 * double) and asks every posterior to lie in (0, 1].
 */

#include <rapidcheck.h>
#include <cmath>
#include <numeric>
#include <vector>

#include "thermo/bayes.hpp"

using namespace thermo;
using namespace thermo::bayes;

namespace {

std::vector<double> to_log_likelihoods(const std::vector<int>& raw) {
    std::vector<double> ll(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        ll[i] = static_cast<double>(raw[i]) * 1e-2;  // [−10⁴, 0]
    }
    return ll;
}

} // anonymous namespace

int main() {
    bool ok = true;

    // ── Property 1: probabilities sum to one ─────────────────────────────────
    ok = rc::check(
        "posterior: sum of probabilities == 1 to 1e-12*sqrt(N)",
        [](bool deterministic) {
            const auto raw = *rc::gen::nonEmpty(
                rc::gen::container<std::vector<int>>(rc::gen::inRange(-1'000'000, 1)));
            const auto ll = to_log_likelihoods(raw);
            const auto prior = *rc::gen::container<std::vector<int>>(
                raw.size(), rc::gen::inRange(1, 1000));
            std::vector<double> pi(prior.begin(), prior.end());

            const auto mode = deterministic ? ExecutionMode::Deterministic
                                            : ExecutionMode::Parallel;
            auto r = PosteriorNormalizer::normalize(ll, pi, mode);
            RC_ASSERT(r.has_value());

            const double s = std::accumulate(r->probabilities.begin(),
                                             r->probabilities.end(), 0.0);
            const double n = static_cast<double>(ll.size());
            RC_ASSERT(std::abs(s - 1.0) <= 1e-12 * std::sqrt(n) + 1e-15 * n);

            for (double p : r->probabilities) {
                RC_ASSERT(p >= 0.0);
                RC_ASSERT(p <= 1.0);
            }
        }
    ) && ok;

    // ── Property 2: bounded spread keeps every posterior in (0, 1] ──────────
    ok = rc::check(
        "posterior: 0 < p <= 1 when max(u) - min(u) < 700",
        [](bool deterministic) {
            // ℓ ∈ [−600, 0], ln π ∈ [0, ln 1000] → spread < 607.
            const auto raw = *rc::gen::nonEmpty(
                rc::gen::container<std::vector<int>>(rc::gen::inRange(-60'000, 1)));
            const auto ll = to_log_likelihoods(raw);
            const auto prior = *rc::gen::container<std::vector<int>>(
                raw.size(), rc::gen::inRange(1, 1001));
            std::vector<double> pi(prior.begin(), prior.end());

            const auto mode = deterministic ? ExecutionMode::Deterministic
                                            : ExecutionMode::Parallel;
            auto r = PosteriorNormalizer::normalize(ll, pi, mode);
            RC_ASSERT(r.has_value());
            for (double p : r->probabilities) {
                RC_ASSERT(p > 0.0);
                RC_ASSERT(p <= 1.0);
            }
        }
    ) && ok;

    // ── Property 3: strict ordering of u survives normalisation ──────────────
    ok = rc::check(
        "posterior: u_i < u_j implies ln p_i < ln p_j",
        []() {
            const auto raw = *rc::gen::container<std::vector<int>>(
                rc::gen::inRange(-1'000'000, 1));
            const auto ll = to_log_likelihoods(raw);
            const std::vector<double> pi(ll.size(), 1.0);

            auto r = PosteriorNormalizer::normalize(ll, pi);
            RC_ASSERT(r.has_value());
            for (std::size_t i = 0; i < ll.size(); ++i) {
                for (std::size_t j = 0; j < ll.size(); ++j) {
                    if (ll[i] < ll[j]) {
                        RC_ASSERT(r->log_posteriors[i] < r->log_posteriors[j]);
                    }
                }
            }
        }
    ) && ok;

    // ── Property 4: a common shift of ℓ leaves the posterior unchanged ───────
    ok = rc::check(
        "posterior: invariant under ell -> ell + c",
        []() {
            const auto raw = *rc::gen::nonEmpty(
                rc::gen::container<std::vector<int>>(rc::gen::inRange(-100'000, 1)));
            const double shift = static_cast<double>(*rc::gen::inRange(-5000, 5000));
            const auto ll = to_log_likelihoods(raw);
            std::vector<double> shifted(ll);
            for (auto& x : shifted) x += shift;
            const std::vector<double> pi(ll.size(), 1.0);

            auto a = PosteriorNormalizer::normalize(ll, pi, ExecutionMode::Deterministic);
            auto b = PosteriorNormalizer::normalize(shifted, pi, ExecutionMode::Deterministic);
            RC_ASSERT(a.has_value());
            RC_ASSERT(b.has_value());
            for (std::size_t i = 0; i < ll.size(); ++i) {
                RC_ASSERT(std::abs(a->probabilities[i] - b->probabilities[i]) < 1e-9);
            }
        }
    ) && ok;

    return ok ? 0 : 1;
}
