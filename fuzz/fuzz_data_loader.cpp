/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for DataLoader::parse_csv_string (end-to-end)
 *
 * Build:
 *   cmake -DTHERMO_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every loaded value is finite.
 *   3. Material bounds tile [0, N) contiguously, one range per material.
 *   4. The loaded table always passes the posterior length checks: any
 *      error is ZeroProbabilitySpace or NumericalInstability, never
 *      DimensionMismatch.
 *
 * Fuzzer strategy:
 *   Input is passed directly as a CSV string. The parser must handle binary
 *   garbage, "nan"/"inf" tokens, CR/LF mixes, empty tokens, extra columns
 *   and very long lines.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "thermo/bayes.hpp"
#include "thermo/data_loader.hpp"

using namespace thermo;
using namespace thermo::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);
    const auto table = DataLoader::parse_csv_string(input);

    for (double x : table.temperature()) assert(std::isfinite(x));
    for (double x : table.prior())       assert(std::isfinite(x));
    for (double x : table.citations())   assert(std::isfinite(x));

    const auto& bounds = table.material_bounds();
    assert(bounds.size() == table.materials().size());
    std::size_t expected_start = 0;
    for (const auto& b : bounds) {
        assert(b.start == expected_start);
        assert(b.end > b.start);
        expected_start = b.end;
    }
    assert(expected_start == table.size());

    const auto post = bayes::PosteriorNormalizer::evaluate(
        table.batch(1.0), ExecutionMode::Deterministic);
    if (!post.has_value()) {
        assert(post.error().kind != ErrorKind::DimensionMismatch);
    } else {
        assert(post->probabilities.size() == table.size());
    }

    return 0;
}
