/// @file src/core/error.cpp
/// @brief Error rendering for the Thermo core.

#include "thermo/error.hpp"

#include <fmt/format.h>

namespace thermo {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::DimensionMismatch:    return "DimensionMismatch";
        case ErrorKind::ZeroProbabilitySpace: return "ZeroProbabilitySpace";
        case ErrorKind::NumericalInstability: return "NumericalInstability";
    }
    return "Unknown";
}

std::string Error::to_string() const {
    switch (kind) {
        case ErrorKind::DimensionMismatch:
            return fmt::format(
                "Dimension mismatch: input arrays must have identical lengths "
                "(expected {}, found {})", expected, found);
        case ErrorKind::ZeroProbabilitySpace:
            return "Zero probability space: every hypothesis has zero "
                   "posterior mass, cannot normalize";
        case ErrorKind::NumericalInstability:
            return "Numerical instability: non-finite normalizer or invalid "
                   "domain configuration";
    }
    return thermo::to_string(kind);
}

} // namespace thermo
