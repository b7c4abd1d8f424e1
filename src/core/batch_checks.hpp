#pragma once
/// @file  src/core/batch_checks.hpp
/// @brief Eager structural checks shared by the batch evaluators.
///
/// Internal header: callers outside src/ go through the public API.
/// Both checks run before any computation so that a malformed call fails
/// as a whole and produces no partial output.

#include "thermo/error.hpp"
#include "thermo/types.hpp"

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <span>

namespace thermo::detail {

/// DimensionMismatch(first, offending) for the first length that differs
/// from the first one; nullopt when all agree (or the list is empty).
[[nodiscard]] inline std::optional<Error>
check_equal_lengths(std::initializer_list<std::size_t> lengths) noexcept {
    if (lengths.size() == 0) {
        return std::nullopt;
    }
    const std::size_t baseline = *lengths.begin();
    for (std::size_t len : lengths) {
        if (len != baseline) {
            return Error::dimension_mismatch(baseline, len);
        }
    }
    return std::nullopt;
}

/// DimensionMismatch(end, length) for the first bound with start > end or
/// end > length.
[[nodiscard]] inline std::optional<Error>
check_bounds(std::span<const SubsetBounds> bounds, std::size_t length) noexcept {
    for (const auto& b : bounds) {
        if (b.start > b.end || b.end > length) {
            return Error::dimension_mismatch(b.end, length);
        }
    }
    return std::nullopt;
}

/// Lengths of the six transport columns, Seebeck first.
[[nodiscard]] inline std::optional<Error>
check_columns(const TransportColumns& c) noexcept {
    return check_equal_lengths({
        c.seebeck.size(),
        c.electrical_conductivity.size(),
        c.thermal_conductivity.size(),
        c.temperature.size(),
        c.zt_observed.size(),
        c.zt_uncertainty.size(),
    });
}

} // namespace thermo::detail
