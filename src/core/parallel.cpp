/// @file src/core/parallel.cpp
/// @brief Worker-count query for the OpenMP execution mode.

#include "thermo/parallel.hpp"

#include <algorithm>
#include <thread>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace thermo::parallel {

std::size_t worker_count(ExecutionMode mode) noexcept {
    if (mode == ExecutionMode::Deterministic) {
        return 1;
    }
#ifdef _OPENMP
    return static_cast<std::size_t>(std::max(1, omp_get_max_threads()));
#else
    return std::max(1u, std::thread::hardware_concurrency());
#endif
}

} // namespace thermo::parallel
