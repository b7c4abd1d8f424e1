#pragma once

/// @file include/thermo/parallel.hpp
/// @brief Fork-join helpers shared by every batch evaluator.
///
/// # Module: Parallel Execution
///
/// ## Responsibility
/// Run an index-based loop either sequentially (ExecutionMode::Deterministic)
/// or as an OpenMP `parallel for` over the process-wide thread team
/// (ExecutionMode::Parallel), and provide the two reductions the posterior
/// normalizer needs (max, sum).
///
/// ## Guarantees
/// - `for_each_index` calls `fn(i)` exactly once for every i in [0, n);
///   callers write only to slot i, so no locking is needed
/// - Static chunking: the only blocking point is the implicit barrier at the
///   end of the parallel region
/// - Deterministic mode fixes the reduction order (ascending index), so its
///   results are bit-reproducible
/// - `reduce_max` ignores NaN operands (std::fmax semantics) and is seeded
///   with −∞

#include "thermo/types.hpp"

#include <cmath>
#include <cstddef>
#include <limits>
#include <span>

namespace thermo::parallel {

/// Number of workers a Parallel-mode call fans out to: the size of the
/// OpenMP thread team (hardware concurrency unless OMP_NUM_THREADS is set).
/// Deterministic mode always runs on one worker.
[[nodiscard]] std::size_t worker_count(ExecutionMode mode) noexcept;

// ─── for_each_index ───────────────────────────────────────────────────────────

template <typename Fn>
void for_each_index(ExecutionMode mode, std::size_t n, Fn&& fn) {
    if (mode == ExecutionMode::Deterministic) {
        for (std::size_t i = 0; i < n; ++i) {
            fn(i);
        }
        return;
    }

    #pragma omp parallel for schedule(static)
    for (std::size_t i = 0; i < n; ++i) {
        fn(i);
    }
}

// ─── reduce_max ───────────────────────────────────────────────────────────────

[[nodiscard]] inline double reduce_max(ExecutionMode mode,
                                       std::span<const double> values) noexcept {
    double result = -std::numeric_limits<double>::infinity();
    const std::size_t n = values.size();

    if (mode == ExecutionMode::Deterministic) {
        for (std::size_t i = 0; i < n; ++i) {
            result = std::fmax(result, values[i]);
        }
        return result;
    }

    // Thread-local maxima merged once per thread.
    #pragma omp parallel
    {
        double local = -std::numeric_limits<double>::infinity();

        #pragma omp for schedule(static) nowait
        for (std::size_t i = 0; i < n; ++i) {
            local = std::fmax(local, values[i]);
        }

        #pragma omp critical
        {
            result = std::fmax(result, local);
        }
    }
    return result;
}

// ─── reduce_sum ───────────────────────────────────────────────────────────────

/// Σ term(i) for i in [0, n).
template <typename Term>
[[nodiscard]] double reduce_sum(ExecutionMode mode, std::size_t n, Term&& term) {
    double sum = 0.0;

    if (mode == ExecutionMode::Deterministic) {
        for (std::size_t i = 0; i < n; ++i) {
            sum += term(i);
        }
        return sum;
    }

    #pragma omp parallel for reduction(+:sum) schedule(static)
    for (std::size_t i = 0; i < n; ++i) {
        sum += term(i);
    }
    return sum;
}

} // namespace thermo::parallel
